#pragma once
#include <string>

namespace lk {

// Text metrics in pixels for the font the legend labels are drawn with.
class TextMeasurer {
public:
  virtual ~TextMeasurer() = default;

  virtual float measureWidth(const std::string& text) const = 0;
  virtual float measureHeight(const std::string& text) const = 0;

  // Distance between baselines of two consecutive lines, minus lineSpacing().
  virtual float lineHeight() const = 0;
  // Extra gap the font recommends between lines.
  virtual float lineSpacing() const = 0;
};

} // namespace lk
