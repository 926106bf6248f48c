#include "lk/legend/LegendMetrics.hpp"

#include <algorithm>
#include <cmath>

namespace lk {

float sanitizedLength(float v) {
  return (!std::isfinite(v) || v < 0.0f) ? 0.0f : v;
}

float resolvedFormSize(const LegendEntry& entry, float defaultSize, float density) {
  float size = (entry.formSize && !std::isnan(*entry.formSize)) ? *entry.formSize : defaultSize;
  return sanitizedLength(size * density);
}

float maxEntryWidth(const LegendEntry* entries, std::size_t count,
                    const TextMeasurer& measurer,
                    float defaultFormSize, float density, float formToTextSpace) {
  float maxLabel = 0.0f;
  float maxForm = 0.0f;

  for (std::size_t i = 0; i < count; i++) {
    const LegendEntry& e = entries[i];
    maxForm = std::max(maxForm, resolvedFormSize(e, defaultFormSize, density));

    if (!e.label.isLabeled()) continue;
    maxLabel = std::max(maxLabel, sanitizedLength(measurer.measureWidth(e.label.text())));
  }

  return maxLabel + maxForm + formToTextSpace;
}

float maxEntryHeight(const LegendEntry* entries, std::size_t count,
                     const TextMeasurer& measurer) {
  float maxH = 0.0f;
  for (std::size_t i = 0; i < count; i++) {
    if (!entries[i].label.isLabeled()) continue;
    maxH = std::max(maxH, sanitizedLength(measurer.measureHeight(entries[i].label.text())));
  }
  return maxH;
}

} // namespace lk
