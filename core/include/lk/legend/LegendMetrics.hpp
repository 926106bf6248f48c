#pragma once
#include "lk/legend/LegendEntry.hpp"
#include "lk/text/TextMeasurer.hpp"

#include <cstddef>

namespace lk {

// Entry's own form size if set and not NaN, else defaultSize; converted to
// pixels by density. A NaN default resolves to 0.
float resolvedFormSize(const LegendEntry& entry, float defaultSize, float density);

// Values that are NaN, infinite or negative count as 0.
float sanitizedLength(float v);

// Widest label + largest form + formToTextSpace. Stacked entries only feed
// the form maximum. formToTextSpace is in pixels.
float maxEntryWidth(const LegendEntry* entries, std::size_t count,
                    const TextMeasurer& measurer,
                    float defaultFormSize, float density, float formToTextSpace);

// Tallest label over labeled entries, 0 if there are none.
float maxEntryHeight(const LegendEntry* entries, std::size_t count,
                     const TextMeasurer& measurer);

} // namespace lk
