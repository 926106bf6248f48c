#pragma once
#include "lk/text/TextMeasurer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lk {

// TextMeasurer over a TrueType/OpenType font, at a pixel height.
// Text is treated as one byte per codepoint (Latin-1), like the glyph
// atlas the charting renderer uses.
class FontMeasurer : public TextMeasurer {
public:
  FontMeasurer();
  ~FontMeasurer() override;

  FontMeasurer(const FontMeasurer&) = delete;
  FontMeasurer& operator=(const FontMeasurer&) = delete;

  // Load a TTF/OTF from memory.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file.
  bool loadFontFile(const std::string& path);

  bool isLoaded() const { return fontLoaded_; }

  // Font size in pixels (the height of ascent - descent).
  void setPixelHeight(float px);
  float pixelHeight() const { return pixelHeight_; }

  float measureWidth(const std::string& text) const override;
  float measureHeight(const std::string& text) const override;
  float lineHeight() const override;
  float lineSpacing() const override;

private:
  struct FontInfo;   // wraps stbtt_fontinfo

  bool initFont();

  std::vector<std::uint8_t> fontData_;
  std::unique_ptr<FontInfo> info_;
  bool fontLoaded_{false};

  float pixelHeight_{16.0f};
  float scale_{0};
  int ascent_{0}, descent_{0}, lineGap_{0};   // font units
};

} // namespace lk
