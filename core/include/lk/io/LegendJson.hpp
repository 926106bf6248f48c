#pragma once
#include "lk/legend/LegendConfig.hpp"
#include "lk/legend/LegendEntry.hpp"
#include "lk/legend/LegendLayout.hpp"
#include "lk/legend/LegendStatus.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace lk {

// Reads the members present in `obj` over the values already in `out`,
// then validates. BAD_JSON on wrong member types or unknown enum names,
// INVALID_CONFIG when validation fails. `out` is untouched on error.
LegendStatus parseLegendConfig(const rapidjson::Value& obj, LegendConfig& out);
LegendStatus parseLegendConfigText(const std::string& json, LegendConfig& out);

// Array of entry objects:
//   {"label": "Sales" | null, "form": "square", "color": 4294901760,
//    "formSize": 12, "formLineWidth": 2, "formLineDash": [4, 2]}
// A null or missing label makes a stacked entry. BAD_ENTRY names the index.
LegendStatus parseLegendEntries(const rapidjson::Value& arr, std::vector<LegendEntry>& out);
LegendStatus parseLegendEntriesText(const std::string& json, std::vector<LegendEntry>& out);

std::string serializeLegendConfig(const LegendConfig& config);
std::string serializeLayoutResult(const LayoutResult& result);

} // namespace lk
