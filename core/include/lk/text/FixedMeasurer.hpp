#pragma once
#include "lk/text/TextMeasurer.hpp"

namespace lk {

struct FixedMetrics {
  float advance{6.0f};      // per byte
  float textHeight{10.0f};  // any non-empty text
  float lineHeight{12.0f};
  float lineSpacing{2.0f};
};

// Monospace measurer: every byte advances by the same amount.
class FixedMeasurer : public TextMeasurer {
public:
  FixedMeasurer() = default;
  explicit FixedMeasurer(const FixedMetrics& metrics) : m_(metrics) {}

  float measureWidth(const std::string& text) const override;
  float measureHeight(const std::string& text) const override;
  float lineHeight() const override { return m_.lineHeight; }
  float lineSpacing() const override { return m_.lineSpacing; }

  const FixedMetrics& metrics() const { return m_; }

private:
  FixedMetrics m_;
};

} // namespace lk
