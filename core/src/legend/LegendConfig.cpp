#include "lk/legend/LegendConfig.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace lk {

static bool isNonNegative(float v) {
  return std::isfinite(v) && v >= 0.0f;
}

static LegendStatus invalid(const char* field, float value, const char* rule) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%s = %.9g: %s", field, static_cast<double>(value), rule);
  return legendFail("INVALID_CONFIG", buf);
}

LegendStatus validateLegendConfig(const LegendConfig& c) {
  if (!(c.maxSizePercent > 0.0f && c.maxSizePercent <= 1.0f))
    return invalid("maxSizePercent", c.maxSizePercent, "must be in (0, 1]");
  if (!(std::isfinite(c.density) && c.density > 0.0f))
    return invalid("density", c.density, "must be positive");

  struct Field { const char* name; float value; };
  const Field fields[] = {
    {"formSize", c.formSize},
    {"formToTextSpace", c.formToTextSpace},
    {"xEntrySpace", c.xEntrySpace},
    {"yEntrySpace", c.yEntrySpace},
    {"stackSpace", c.stackSpace},
    {"xOffset", c.xOffset},
    {"yOffset", c.yOffset},
    {"formLineWidth", c.formLineWidth},
    {"textSize", c.textSize},
  };
  for (const auto& f : fields) {
    if (!isNonNegative(f.value)) return invalid(f.name, f.value, "must be >= 0");
  }
  return {};
}

// -------------------- Names --------------------

const char* orientationName(LegendOrientation o) {
  return o == LegendOrientation::Vertical ? "vertical" : "horizontal";
}

const char* formName(LegendForm f) {
  switch (f) {
    case LegendForm::None:    return "none";
    case LegendForm::Empty:   return "empty";
    case LegendForm::Default: return "default";
    case LegendForm::Square:  return "square";
    case LegendForm::Circle:  return "circle";
    case LegendForm::Line:    return "line";
  }
  return "default";
}

bool parseOrientation(const std::string& s, LegendOrientation& out) {
  if (s == "horizontal") { out = LegendOrientation::Horizontal; return true; }
  if (s == "vertical")   { out = LegendOrientation::Vertical;   return true; }
  return false;
}

bool parseForm(const std::string& s, LegendForm& out) {
  if (s == "none")    { out = LegendForm::None;    return true; }
  if (s == "empty")   { out = LegendForm::Empty;   return true; }
  if (s == "default") { out = LegendForm::Default; return true; }
  if (s == "square")  { out = LegendForm::Square;  return true; }
  if (s == "circle")  { out = LegendForm::Circle;  return true; }
  if (s == "line")    { out = LegendForm::Line;    return true; }
  return false;
}

bool parseHorizontalAlignment(const std::string& s, LegendHorizontalAlignment& out) {
  if (s == "left")   { out = LegendHorizontalAlignment::Left;   return true; }
  if (s == "center") { out = LegendHorizontalAlignment::Center; return true; }
  if (s == "right")  { out = LegendHorizontalAlignment::Right;  return true; }
  return false;
}

bool parseVerticalAlignment(const std::string& s, LegendVerticalAlignment& out) {
  if (s == "top")    { out = LegendVerticalAlignment::Top;    return true; }
  if (s == "center") { out = LegendVerticalAlignment::Center; return true; }
  if (s == "bottom") { out = LegendVerticalAlignment::Bottom; return true; }
  return false;
}

bool parseDirection(const std::string& s, LegendDirection& out) {
  if (s == "ltr") { out = LegendDirection::LeftToRight; return true; }
  if (s == "rtl") { out = LegendDirection::RightToLeft; return true; }
  return false;
}

} // namespace lk
