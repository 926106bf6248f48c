#include "lk/text/FontMeasurer.hpp"

#include <algorithm>
#include <climits>
#include <cstdio>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace lk {

struct FontMeasurer::FontInfo {
  stbtt_fontinfo font;
};

FontMeasurer::FontMeasurer() = default;
FontMeasurer::~FontMeasurer() = default;

bool FontMeasurer::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  fontData_.assign(data, data + len);
  return initFont();
}

bool FontMeasurer::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "FontMeasurer: cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  fontData_.resize(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(fontData_.data()), sz);
  return initFont();
}

bool FontMeasurer::initFont() {
  fontLoaded_ = false;
  if (!info_) info_ = std::make_unique<FontInfo>();

  int offset = stbtt_GetFontOffsetForIndex(fontData_.data(), 0);
  if (offset < 0 || !stbtt_InitFont(&info_->font, fontData_.data(), offset)) {
    std::fprintf(stderr, "FontMeasurer: stbtt_InitFont failed\n");
    return false;
  }

  stbtt_GetFontVMetrics(&info_->font, &ascent_, &descent_, &lineGap_);
  fontLoaded_ = true;
  setPixelHeight(pixelHeight_);
  return true;
}

void FontMeasurer::setPixelHeight(float px) {
  pixelHeight_ = std::max(0.0f, px);
  scale_ = fontLoaded_ ? stbtt_ScaleForPixelHeight(&info_->font, pixelHeight_) : 0.0f;
}

float FontMeasurer::measureWidth(const std::string& text) const {
  if (!fontLoaded_) return 0.0f;

  int width = 0;
  int prev = 0;
  for (unsigned char ch : text) {
    int cp = static_cast<int>(ch);
    int advW = 0, lsb = 0;
    stbtt_GetCodepointHMetrics(&info_->font, cp, &advW, &lsb);
    if (prev) width += stbtt_GetCodepointKernAdvance(&info_->font, prev, cp);
    width += advW;
    prev = cp;
  }
  return static_cast<float>(width) * scale_;
}

float FontMeasurer::measureHeight(const std::string& text) const {
  if (!fontLoaded_) return 0.0f;

  // Union of the glyph boxes, like a text-bounds query.
  int minY = INT_MAX, maxY = INT_MIN;
  for (unsigned char ch : text) {
    int x0, y0, x1, y1;
    if (!stbtt_GetCodepointBox(&info_->font, ch, &x0, &y0, &x1, &y1)) continue;
    minY = std::min(minY, y0);
    maxY = std::max(maxY, y1);
  }
  if (minY > maxY) return 0.0f;
  return static_cast<float>(maxY - minY) * scale_;
}

float FontMeasurer::lineHeight() const {
  if (!fontLoaded_) return 0.0f;
  return static_cast<float>(ascent_ - descent_) * scale_;
}

float FontMeasurer::lineSpacing() const {
  if (!fontLoaded_) return 0.0f;
  return static_cast<float>(lineGap_) * scale_;
}

} // namespace lk
