#include "lk/text/FixedMeasurer.hpp"

namespace lk {

float FixedMeasurer::measureWidth(const std::string& text) const {
  return m_.advance * static_cast<float>(text.size());
}

float FixedMeasurer::measureHeight(const std::string& text) const {
  return text.empty() ? 0.0f : m_.textHeight;
}

} // namespace lk
