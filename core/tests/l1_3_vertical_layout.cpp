// L1.3 — Vertical legend layout (pure C++)
// Tests: one row per label, stacked rows, all-stacked lists, spacing, form None.

#include "lk/legend/LegendLayout.hpp"
#include "lk/text/FixedMeasurer.hpp"
#include "lk/viewport/Viewport.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static lk::LegendEntry labeled(const char* text, lk::LegendForm form = lk::LegendForm::Square) {
  return lk::LegendEntry(lk::LegendLabel::labeled(text), form);
}

static lk::LegendEntry stacked() {
  return lk::LegendEntry(lk::LegendLabel::stacked(), lk::LegendForm::Square);
}

int main() {
  // advance 10 per char, text height 12, line height 14, line spacing 2
  lk::FixedMetrics fm;
  fm.advance = 10.0f;
  fm.textHeight = 12.0f;
  fm.lineHeight = 14.0f;
  fm.lineSpacing = 2.0f;
  lk::FixedMeasurer measurer(fm);
  lk::Viewport viewport(300.0f, 200.0f);

  lk::LegendConfig cfg;
  cfg.orientation = lk::LegendOrientation::Vertical;

  // ---- Test 1: two stacked forms closed by a label form one row ----
  {
    lk::LegendLayoutEngine engine;
    requireTrue(engine.setConfig(cfg).ok, "config");

    std::vector<lk::LegendEntry> entries = {stacked(), stacked(), labeled("X")};
    auto r = engine.calculateDimensions(entries, measurer, viewport);

    // stacked: 8 + (8 + 3), then 3 + 8 + (8 + 3); closing form: 3 + 8
    requireClose(r.neededWidth, 52.0f + 5.0f, 1e-4f, "stacked row width + xOffset");
    requireClose(r.neededHeight, 14.0f + 3.0f, 1e-4f, "one row charged + yOffset");
    requireTrue(r.labelSizes.empty() && r.lineSizes.empty() && r.labelBreakPoints.empty(),
                "no horizontal metadata");
    std::printf("  Test 1 (stacked row): PASS\n");
  }

  // ---- Test 2: labeled rows ----
  {
    lk::LegendLayoutEngine engine;
    engine.setConfig(cfg);

    std::vector<lk::LegendEntry> entries = {labeled("A"), labeled("BBB")};
    auto r = engine.calculateDimensions(entries, measurer, viewport);

    // widest row: 8 + 5 + 30 = 43; height charged for every row but the last
    requireClose(r.neededWidth, 43.0f + 5.0f, 1e-4f, "widest row");
    requireClose(r.neededHeight, 14.0f + 3.0f, 1e-4f, "height");
    requireClose(r.maxLabelWidth, 30.0f + 8.0f + 5.0f, 1e-4f, "maxLabelWidth");
    requireClose(r.maxLabelHeight, 12.0f, 1e-4f, "maxLabelHeight");
    std::printf("  Test 2 (labeled rows): PASS\n");
  }

  // ---- Test 3: yEntrySpace adds to every charged row ----
  {
    lk::LegendConfig c = cfg;
    c.yEntrySpace = 4.0f;
    lk::LegendLayoutEngine engine;
    engine.setConfig(c);

    std::vector<lk::LegendEntry> entries = {stacked(), stacked(), labeled("X")};
    auto r = engine.calculateDimensions(entries, measurer, viewport);
    requireClose(r.neededHeight, 18.0f + 3.0f, 1e-4f, "lineHeight + yEntrySpace");

    std::vector<lk::LegendEntry> three = {labeled("A"), labeled("B"), labeled("C")};
    r = engine.calculateDimensions(three, measurer, viewport);
    requireClose(r.neededHeight, 2.0f * 18.0f + 3.0f, 1e-4f, "two charged rows");
    std::printf("  Test 3 (yEntrySpace): PASS\n");
  }

  // ---- Test 4: all-stacked list never adds height ----
  {
    lk::LegendLayoutEngine engine;
    engine.setConfig(cfg);

    std::vector<lk::LegendEntry> entries = {stacked(), stacked()};
    auto r = engine.calculateDimensions(entries, measurer, viewport);
    requireClose(r.neededHeight, 3.0f, 1e-4f, "only yOffset");
    requireClose(r.neededWidth, 41.0f + 5.0f, 1e-4f, "open stack width");
    std::printf("  Test 4 (all stacked): PASS\n");
  }

  // ---- Test 5: form None skips form and form-to-text space ----
  {
    lk::LegendLayoutEngine engine;
    engine.setConfig(cfg);

    std::vector<lk::LegendEntry> entries = {labeled("AB", lk::LegendForm::None)};
    auto r = engine.calculateDimensions(entries, measurer, viewport);
    requireClose(r.neededWidth, 20.0f + 5.0f, 1e-4f, "text only");
    requireClose(r.neededHeight, 3.0f, 1e-4f, "single row is not charged");

    std::vector<lk::LegendEntry> empty = {labeled("AB", lk::LegendForm::Empty)};
    r = engine.calculateDimensions(empty, measurer, viewport);
    requireClose(r.neededWidth, 33.0f + 5.0f, 1e-4f, "Empty form reserves space");
    std::printf("  Test 5 (form None/Empty): PASS\n");
  }

  // ---- Test 6: empty entry list ----
  {
    lk::LegendLayoutEngine engine;
    engine.setConfig(cfg);

    std::vector<lk::LegendEntry> none;
    auto r = engine.calculateDimensions(none, measurer, viewport);
    requireClose(r.neededWidth, 5.0f, 1e-6f, "xOffset only");
    requireClose(r.neededHeight, 3.0f, 1e-6f, "yOffset only");
    requireClose(r.maxLabelWidth, 5.0f, 1e-6f, "formToTextSpace only");
    std::printf("  Test 6 (empty): PASS\n");
  }

  std::printf("L1.3 vertical layout: ALL PASS\n");
  return 0;
}
