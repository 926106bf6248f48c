#pragma once
#include "lk/legend/LegendEntry.hpp"

#include <cstdint>
#include <vector>

namespace lk {

// The entries a legend shows: computed or custom main entries, followed by
// optional extra entries.
class LegendEntrySet {
public:
  // Automatically computed entries (e.g. one per data series).
  void setEntries(const std::vector<LegendEntry>& entries);
  const std::vector<LegendEntry>& entries() const { return entries_; }

  // Replaces the entries and marks the legend custom, so hosts stop
  // recomputing them from their data until resetCustom().
  void setCustom(const std::vector<LegendEntry>& entries);
  void resetCustom() { custom_ = false; }
  bool isCustom() const { return custom_; }

  void setExtra(const std::vector<LegendEntry>& entries);
  // Pairs up min(colors, labels) items. kColorSkip or 0 yields
  // LegendForm::None, kColorNone yields LegendForm::Empty. A stacked label
  // gives a stacked extra entry.
  void setExtra(const std::vector<std::uint32_t>& colors,
                const std::vector<LegendLabel>& labels);
  const std::vector<LegendEntry>& extraEntries() const { return extra_; }

  // Main entries followed by extras, copied.
  std::vector<LegendEntry> snapshot() const;
  std::size_t size() const { return entries_.size() + extra_.size(); }

private:
  std::vector<LegendEntry> entries_;
  std::vector<LegendEntry> extra_;
  bool custom_{false};
};

} // namespace lk
