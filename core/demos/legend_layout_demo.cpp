// Legend layout demo
// Loads {"config": {...}, "entries": [...]} from a JSON file, lays the
// legend out against an available width and prints the result as JSON.
//
// usage: legend_layout_demo <legend.json> [available-width] [font.ttf]
// Without a font file labels are measured with FixedMeasurer.

#include "lk/io/LegendJson.hpp"
#include "lk/legend/LegendLayout.hpp"
#include "lk/text/FixedMeasurer.hpp"
#include "lk/text/FontMeasurer.hpp"
#include "lk/viewport/Viewport.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

static void requireOk(const lk::LegendStatus& s, const char* ctx) {
  if (!s.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, s.err.code.c_str(), s.err.message.c_str());
    std::exit(1);
  }
}

static bool readFile(const char* path, std::string& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::stringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <legend.json> [available-width] [font.ttf]\n", argv[0]);
    return 2;
  }

  std::string text;
  if (!readFile(argv[1], text)) {
    std::fprintf(stderr, "legend_layout_demo: cannot read %s\n", argv[1]);
    return 1;
  }

  rapidjson::Document doc;
  doc.Parse(text.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "legend_layout_demo: %s is not a JSON object\n", argv[1]);
    return 1;
  }

  lk::LegendConfig config;
  if (doc.HasMember("config"))
    requireOk(lk::parseLegendConfig(doc["config"], config), "config");

  std::vector<lk::LegendEntry> entries;
  if (doc.HasMember("entries"))
    requireOk(lk::parseLegendEntries(doc["entries"], entries), "entries");

  float width = (argc > 2) ? std::strtof(argv[2], nullptr) : 320.0f;
  lk::Viewport viewport(width, 240.0f);

  std::unique_ptr<lk::TextMeasurer> measurer;
  if (argc > 3) {
    auto font = std::make_unique<lk::FontMeasurer>();
    if (!font->loadFontFile(argv[3])) return 1;
    font->setPixelHeight(config.textSize * config.density);
    measurer = std::move(font);
  } else {
    measurer = std::make_unique<lk::FixedMeasurer>();
  }

  lk::LegendLayoutEngine engine;
  requireOk(engine.setConfig(config), "setConfig");
  auto result = engine.calculateDimensions(entries, *measurer, viewport);

  std::printf("%s\n", lk::serializeLayoutResult(result).c_str());
  return 0;
}
