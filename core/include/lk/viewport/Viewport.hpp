#pragma once

namespace lk {

// Width the legend may occupy, in pixels.
class WidthSource {
public:
  virtual ~WidthSource() = default;
  virtual float availableWidth() const = 0;
};

struct ContentOffsets {
  float left{0}, top{0}, right{0}, bottom{0};
};

// Chart area minus the offsets reserved around the content (axes etc.).
class Viewport : public WidthSource {
public:
  Viewport() = default;
  Viewport(float chartWidth, float chartHeight);

  void setChartDimensions(float width, float height);
  void setOffsets(const ContentOffsets& offsets);

  float contentWidth() const;
  float contentHeight() const;

  float availableWidth() const override { return contentWidth(); }

  float chartWidth() const { return chartW_; }
  float chartHeight() const { return chartH_; }
  const ContentOffsets& offsets() const { return offsets_; }

private:
  float chartW_{0};
  float chartH_{0};
  ContentOffsets offsets_;
};

} // namespace lk
