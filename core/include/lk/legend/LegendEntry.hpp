#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lk {

enum class LegendForm : std::uint8_t {
  None,     // no form, no space reserved
  Empty,    // no form drawn, space reserved
  Default,  // use the legend's configured form
  Square,
  Circle,
  Line
};

// Text of an entry, or the marker for a stacked (unlabeled) form that
// groups with the next labeled entry.
class LegendLabel {
public:
  enum class Kind : std::uint8_t { Labeled, Stacked };

  static LegendLabel labeled(std::string text) {
    LegendLabel l;
    l.kind_ = Kind::Labeled;
    l.text_ = std::move(text);
    return l;
  }
  static LegendLabel stacked() { return LegendLabel{}; }

  Kind kind() const { return kind_; }
  bool isLabeled() const { return kind_ == Kind::Labeled; }
  bool isStacked() const { return kind_ == Kind::Stacked; }

  // Empty for stacked labels.
  const std::string& text() const { return text_; }

  bool operator==(const LegendLabel& o) const {
    return kind_ == o.kind_ && text_ == o.text_;
  }
  bool operator!=(const LegendLabel& o) const { return !(*this == o); }

private:
  Kind kind_{Kind::Stacked};
  std::string text_;
};

// ARGB colors with special meaning for LegendEntrySet::setExtra().
constexpr std::uint32_t kColorSkip = 0x00112233u;
constexpr std::uint32_t kColorNone = 0x00112234u;

struct LegendEntry {
  LegendLabel label;
  LegendForm form{LegendForm::Default};
  std::uint32_t formColor{kColorNone};   // ARGB

  // Unset means "use the legend's value". Units are dp (see LegendConfig).
  std::optional<float> formSize;
  std::optional<float> formLineWidth;
  std::vector<float> formLineDash;       // on/off intervals, renderer only

  LegendEntry() = default;
  LegendEntry(LegendLabel l, LegendForm f, std::uint32_t color = kColorNone)
    : label(std::move(l)), form(f), formColor(color) {}

  bool hasForm() const { return form != LegendForm::None; }
};

} // namespace lk
