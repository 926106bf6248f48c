#pragma once
#include "lk/legend/LegendConfig.hpp"
#include "lk/legend/LegendEntry.hpp"
#include "lk/legend/LegendEntrySet.hpp"
#include "lk/legend/LegendStatus.hpp"
#include "lk/text/TextMeasurer.hpp"
#include "lk/viewport/Viewport.hpp"

#include <cstddef>
#include <vector>

namespace lk {

struct SizeF {
  float width{0};
  float height{0};

  bool operator==(const SizeF& o) const { return width == o.width && height == o.height; }
  bool operator!=(const SizeF& o) const { return !(*this == o); }
};

// Output of one layout pass, in pixels. The per-entry and per-line vectors
// are filled for horizontal orientation only.
struct LayoutResult {
  float neededWidth{0};    // includes xOffset
  float neededHeight{0};   // includes yOffset
  float maxLabelWidth{0};  // widest label + largest form + formToTextSpace
  float maxLabelHeight{0};

  std::vector<SizeF> labelSizes;      // one per entry, (0,0) for stacked
  std::vector<bool> labelBreakPoints; // true: entry starts a new line
  std::vector<SizeF> lineSizes;       // one per line

  LegendDirection direction{LegendDirection::LeftToRight};
};

// Computes the space a legend needs and how its entries flow into lines.
//
// Horizontal orientation groups each run of stacked entries with the
// labeled entry that follows it; a group is never split across lines. With
// word wrap enabled a line is closed when the next group does not fit in
// availableWidth() * maxSizePercent; a group wider than that gets a line of
// its own. Vertical orientation puts one labeled entry per row, with any
// stacked forms before it on the same row.
class LegendLayoutEngine {
public:
  LegendLayoutEngine() = default;

  // Rejects invalid configs and keeps the previous one.
  LegendStatus setConfig(const LegendConfig& config);
  const LegendConfig& config() const { return config_; }

  LayoutResult calculateDimensions(const std::vector<LegendEntry>& entries,
                                   const TextMeasurer& measurer,
                                   const WidthSource& width);

  // Lays out entrySet.snapshot().
  LayoutResult calculateDimensions(const LegendEntrySet& entrySet,
                                   const TextMeasurer& measurer,
                                   const WidthSource& width);

  // Throws std::invalid_argument if entries is null and count > 0.
  LayoutResult calculateDimensions(const LegendEntry* entries, std::size_t count,
                                   const TextMeasurer& measurer,
                                   const WidthSource& width);

  // Result of the most recent pass.
  const LayoutResult& lastResult() const { return last_; }

private:
  LegendConfig config_;
  LayoutResult last_;
};

} // namespace lk
