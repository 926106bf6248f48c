#pragma once
#include "lk/legend/LegendEntry.hpp"
#include "lk/legend/LegendStatus.hpp"

#include <string>

namespace lk {

enum class LegendOrientation : std::uint8_t { Horizontal, Vertical };
enum class LegendHorizontalAlignment : std::uint8_t { Left, Center, Right };
enum class LegendVerticalAlignment : std::uint8_t { Top, Center, Bottom };
enum class LegendDirection : std::uint8_t { LeftToRight, RightToLeft };

// Lengths are density-independent units; `density` converts them to
// pixels once per layout pass. Measured text and available width are
// already pixels.
struct LegendConfig {
  LegendOrientation orientation{LegendOrientation::Horizontal};
  bool wordWrap{false};
  float maxSizePercent{0.95f};   // (0, 1], fraction of available width

  float formSize{8.0f};
  float formToTextSpace{5.0f};
  float xEntrySpace{6.0f};       // between groups on a line
  float yEntrySpace{0.0f};       // between rows / lines
  float stackSpace{3.0f};        // between consecutive stacked forms
  float xOffset{5.0f};
  float yOffset{3.0f};
  float density{1.0f};           // pixels per unit

  // Renderer pass-through, never read by the layout engine.
  LegendHorizontalAlignment horizontalAlignment{LegendHorizontalAlignment::Left};
  LegendVerticalAlignment verticalAlignment{LegendVerticalAlignment::Bottom};
  LegendDirection direction{LegendDirection::LeftToRight};
  LegendForm form{LegendForm::Square};
  float formLineWidth{3.0f};
  float textSize{10.0f};
  bool drawInside{false};
  bool enabled{true};
};

// Returns INVALID_CONFIG for maxSizePercent outside (0,1], negative
// spacing/size/offset values, or a non-positive density.
LegendStatus validateLegendConfig(const LegendConfig& config);

// Name lookups shared by the JSON loader and the demo.
const char* orientationName(LegendOrientation o);
const char* formName(LegendForm f);
bool parseOrientation(const std::string& s, LegendOrientation& out);
bool parseForm(const std::string& s, LegendForm& out);
bool parseHorizontalAlignment(const std::string& s, LegendHorizontalAlignment& out);
bool parseVerticalAlignment(const std::string& s, LegendVerticalAlignment& out);
bool parseDirection(const std::string& s, LegendDirection& out);

} // namespace lk
