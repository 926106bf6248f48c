#include "lk/legend/LegendLayout.hpp"
#include "lk/legend/LegendMetrics.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace lk {

namespace {

// Config lengths converted to pixels for one pass.
struct PassMetrics {
  float density;
  float defaultFormSize;
  float formToTextSpace;
  float xEntrySpace;
  float yEntrySpace;
  float stackSpace;
  float lineHeight;
  float lineSpacing;
};

PassMetrics makePassMetrics(const LegendConfig& c, const TextMeasurer& measurer) {
  PassMetrics pm;
  pm.density = c.density;
  pm.defaultFormSize = c.formSize;   // resolvedFormSize applies density
  pm.formToTextSpace = c.formToTextSpace * c.density;
  pm.xEntrySpace = c.xEntrySpace * c.density;
  pm.yEntrySpace = c.yEntrySpace * c.density;
  pm.stackSpace = c.stackSpace * c.density;
  pm.lineHeight = sanitizedLength(measurer.lineHeight());
  pm.lineSpacing = sanitizedLength(measurer.lineSpacing());
  return pm;
}

// -------------------- Vertical --------------------

void layoutVertical(const LegendEntry* entries, std::size_t count,
                    const PassMetrics& pm, const TextMeasurer& measurer,
                    LayoutResult& out) {
  float maxWidth = 0.0f, totalHeight = 0.0f, lineWidth = 0.0f;
  bool wasStacked = false;

  for (std::size_t i = 0; i < count; i++) {
    const LegendEntry& e = entries[i];
    bool hasForm = e.hasForm();
    float formSize = resolvedFormSize(e, pm.defaultFormSize, pm.density);

    if (!wasStacked) lineWidth = 0.0f;

    if (hasForm) {
      if (wasStacked) lineWidth += pm.stackSpace;
      lineWidth += formSize;
    }

    if (e.label.isLabeled()) {
      if (hasForm && !wasStacked) {
        lineWidth += pm.formToTextSpace;
      } else if (wasStacked) {
        // The label closes a row of stacked forms.
        maxWidth = std::max(maxWidth, lineWidth);
        totalHeight += pm.lineHeight + pm.yEntrySpace;
        lineWidth = 0.0f;
        wasStacked = false;
      }
      lineWidth += sanitizedLength(measurer.measureWidth(e.label.text()));
      if (i + 1 < count) totalHeight += pm.lineHeight + pm.yEntrySpace;
    } else {
      wasStacked = true;
      lineWidth += formSize + pm.stackSpace;
    }

    maxWidth = std::max(maxWidth, lineWidth);
  }

  out.neededWidth = maxWidth;
  out.neededHeight = totalHeight;
}

// -------------------- Horizontal --------------------

// Walks entries left to right. A group is a run of stacked entries plus the
// labeled entry closing it; groups are placed on lines whole.
class HorizontalFlow {
public:
  HorizontalFlow(const PassMetrics& pm, float contentWidth, bool wordWrap,
                 std::size_t count)
    : pm_(pm), contentWidth_(contentWidth), wordWrap_(wordWrap) {
    labelSizes_.reserve(count);
    breakPoints_.reserve(count);
  }

  void onEntry(std::size_t i, const LegendEntry& e, const TextMeasurer& measurer) {
    bool hasForm = e.hasForm();
    float formSize = resolvedFormSize(e, pm_.defaultFormSize, pm_.density);

    breakPoints_.push_back(false);
    requiredWidth_ = runOpen_ ? requiredWidth_ + pm_.stackSpace : 0.0f;

    if (e.label.isLabeled()) {
      SizeF size{sanitizedLength(measurer.measureWidth(e.label.text())),
                 sanitizedLength(measurer.measureHeight(e.label.text()))};
      labelSizes_.push_back(size);
      requiredWidth_ += (hasForm ? pm_.formToTextSpace + formSize : 0.0f) + size.width;
      closeGroup(i);
      runOpen_ = false;
    } else {
      labelSizes_.push_back(SizeF{});
      requiredWidth_ += hasForm ? formSize : 0.0f;
      if (!runOpen_) {
        runOpen_ = true;
        runStart_ = i;
      }
    }
  }

  void onSequenceEnd() {
    if (labelSizes_.empty()) return;
    // A trailing stacked run still forms a group of its own.
    if (runOpen_) {
      closeGroup(labelSizes_.size() - 1);
      runOpen_ = false;
    }
    pushLine();
  }

  void finish(LayoutResult& out) {
    std::size_t n = lineSizes_.size();
    out.neededWidth = maxLineWidth_;
    out.neededHeight = (n == 0) ? 0.0f
      : pm_.lineHeight * static_cast<float>(n)
        + (pm_.lineSpacing + pm_.yEntrySpace) * static_cast<float>(n - 1);
    out.labelSizes = std::move(labelSizes_);
    out.labelBreakPoints = std::move(breakPoints_);
    out.lineSizes = std::move(lineSizes_);
  }

private:
  void closeGroup(std::size_t i) {
    float spacing = (currentLineWidth_ == 0.0f) ? 0.0f : pm_.xEntrySpace;
    if (!wordWrap_ || currentLineWidth_ == 0.0f ||
        contentWidth_ - currentLineWidth_ >= spacing + requiredWidth_) {
      currentLineWidth_ += spacing + requiredWidth_;
    } else {
      pushLine();
      breakPoints_[runOpen_ ? runStart_ : i] = true;
      currentLineWidth_ = requiredWidth_;
    }
  }

  void pushLine() {
    lineSizes_.push_back(SizeF{currentLineWidth_, pm_.lineHeight});
    maxLineWidth_ = std::max(maxLineWidth_, currentLineWidth_);
  }

  const PassMetrics& pm_;
  float contentWidth_;
  bool wordWrap_;

  float maxLineWidth_{0};
  float currentLineWidth_{0};
  float requiredWidth_{0};
  bool runOpen_{false};
  std::size_t runStart_{0};

  std::vector<SizeF> labelSizes_;
  std::vector<bool> breakPoints_;
  std::vector<SizeF> lineSizes_;
};

} // namespace

// -------------------- LegendLayoutEngine --------------------

LegendStatus LegendLayoutEngine::setConfig(const LegendConfig& config) {
  LegendStatus s = validateLegendConfig(config);
  if (!s.ok) {
    std::fprintf(stderr, "LegendLayoutEngine: config rejected: %s\n",
                 s.err.message.c_str());
    return s;
  }
  config_ = config;
  return s;
}

LayoutResult LegendLayoutEngine::calculateDimensions(const std::vector<LegendEntry>& entries,
                                                     const TextMeasurer& measurer,
                                                     const WidthSource& width) {
  return calculateDimensions(entries.data(), entries.size(), measurer, width);
}

LayoutResult LegendLayoutEngine::calculateDimensions(const LegendEntrySet& entrySet,
                                                     const TextMeasurer& measurer,
                                                     const WidthSource& width) {
  const std::vector<LegendEntry> entries = entrySet.snapshot();
  return calculateDimensions(entries, measurer, width);
}

LayoutResult LegendLayoutEngine::calculateDimensions(const LegendEntry* entries, std::size_t count,
                                                     const TextMeasurer& measurer,
                                                     const WidthSource& width) {
  if (!entries && count > 0)
    throw std::invalid_argument("LegendLayoutEngine: null entries");

  const LegendConfig& c = config_;
  const PassMetrics pm = makePassMetrics(c, measurer);

  LayoutResult r;
  r.direction = c.direction;
  r.maxLabelWidth = maxEntryWidth(entries, count, measurer,
                                  c.formSize, c.density, pm.formToTextSpace);
  r.maxLabelHeight = maxEntryHeight(entries, count, measurer);

  if (c.orientation == LegendOrientation::Vertical) {
    layoutVertical(entries, count, pm, measurer, r);
  } else {
    float contentWidth = sanitizedLength(width.availableWidth()) * c.maxSizePercent;
    HorizontalFlow flow(pm, contentWidth, c.wordWrap, count);
    for (std::size_t i = 0; i < count; i++) flow.onEntry(i, entries[i], measurer);
    flow.onSequenceEnd();
    flow.finish(r);
  }

  r.neededWidth += c.xOffset * c.density;
  r.neededHeight += c.yOffset * c.density;

  last_ = r;
  return r;
}

} // namespace lk
