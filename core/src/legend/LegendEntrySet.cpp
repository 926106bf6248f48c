#include "lk/legend/LegendEntrySet.hpp"

#include <algorithm>
#include <utility>

namespace lk {

void LegendEntrySet::setEntries(const std::vector<LegendEntry>& entries) {
  entries_ = entries;
}

void LegendEntrySet::setCustom(const std::vector<LegendEntry>& entries) {
  entries_ = entries;
  custom_ = true;
}

void LegendEntrySet::setExtra(const std::vector<LegendEntry>& entries) {
  extra_ = entries;
}

void LegendEntrySet::setExtra(const std::vector<std::uint32_t>& colors,
                              const std::vector<LegendLabel>& labels) {
  std::vector<LegendEntry> out;
  std::size_t n = std::min(colors.size(), labels.size());
  out.reserve(n);

  for (std::size_t i = 0; i < n; i++) {
    LegendEntry e(labels[i], LegendForm::Default, colors[i]);
    if (colors[i] == kColorSkip || colors[i] == 0)
      e.form = LegendForm::None;
    else if (colors[i] == kColorNone)
      e.form = LegendForm::Empty;
    out.push_back(std::move(e));
  }

  extra_ = std::move(out);
}

std::vector<LegendEntry> LegendEntrySet::snapshot() const {
  std::vector<LegendEntry> all;
  all.reserve(size());
  all.insert(all.end(), entries_.begin(), entries_.end());
  all.insert(all.end(), extra_.begin(), extra_.end());
  return all;
}

} // namespace lk
