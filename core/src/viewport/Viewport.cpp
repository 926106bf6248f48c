#include "lk/viewport/Viewport.hpp"

#include <algorithm>

namespace lk {

Viewport::Viewport(float chartWidth, float chartHeight) {
  setChartDimensions(chartWidth, chartHeight);
}

void Viewport::setChartDimensions(float width, float height) {
  chartW_ = std::max(0.0f, width);
  chartH_ = std::max(0.0f, height);
}

void Viewport::setOffsets(const ContentOffsets& offsets) {
  offsets_ = offsets;
}

float Viewport::contentWidth() const {
  return std::max(0.0f, chartW_ - offsets_.left - offsets_.right);
}

float Viewport::contentHeight() const {
  return std::max(0.0f, chartH_ - offsets_.top - offsets_.bottom);
}

} // namespace lk
