#include "lk/io/LegendJson.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace lk {

// -------------------- Helpers --------------------

static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

static LegendStatus badType(const char* key, const char* expected) {
  return legendFail("BAD_JSON", std::string(key) + ": expected " + expected);
}

// True when d converts to float without overflowing.
static bool fitsFloat(double d) {
  return std::isfinite(d) && std::fabs(d) <= std::numeric_limits<float>::max();
}

static LegendStatus readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (!v->IsNumber()) return badType(key, "number");
  double d = v->GetDouble();
  if (!fitsFloat(d)) return legendFail("BAD_JSON", std::string(key) + ": out of range");
  out = static_cast<float>(d);
  return {};
}

static LegendStatus readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (!v->IsBool()) return badType(key, "bool");
  out = v->GetBool();
  return {};
}

// Reads a string member and maps it through `parse`.
template <typename Enum>
static LegendStatus readEnum(const rapidjson::Value& obj, const char* key, Enum& out,
                             bool (*parse)(const std::string&, Enum&)) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (!v->IsString()) return badType(key, "string");
  if (!parse(v->GetString(), out))
    return legendFail("BAD_JSON", std::string(key) + ": unknown value \"" + v->GetString() + "\"");
  return {};
}

static const char* horizontalAlignmentName(LegendHorizontalAlignment a) {
  switch (a) {
    case LegendHorizontalAlignment::Left:   return "left";
    case LegendHorizontalAlignment::Center: return "center";
    case LegendHorizontalAlignment::Right:  return "right";
  }
  return "left";
}

static const char* verticalAlignmentName(LegendVerticalAlignment a) {
  switch (a) {
    case LegendVerticalAlignment::Top:    return "top";
    case LegendVerticalAlignment::Center: return "center";
    case LegendVerticalAlignment::Bottom: return "bottom";
  }
  return "bottom";
}

static const char* directionName(LegendDirection d) {
  return d == LegendDirection::RightToLeft ? "rtl" : "ltr";
}

// -------------------- Config --------------------

LegendStatus parseLegendConfig(const rapidjson::Value& obj, LegendConfig& out) {
  if (!obj.IsObject()) return legendFail("BAD_JSON", "config: expected object");

  LegendConfig c = out;
  LegendStatus s;

  if (!(s = readEnum(obj, "orientation", c.orientation, parseOrientation)).ok) return s;
  if (!(s = readBool(obj, "wordWrap", c.wordWrap)).ok) return s;
  if (!(s = readFloat(obj, "maxSizePercent", c.maxSizePercent)).ok) return s;
  if (!(s = readFloat(obj, "formSize", c.formSize)).ok) return s;
  if (!(s = readFloat(obj, "formToTextSpace", c.formToTextSpace)).ok) return s;
  if (!(s = readFloat(obj, "xEntrySpace", c.xEntrySpace)).ok) return s;
  if (!(s = readFloat(obj, "yEntrySpace", c.yEntrySpace)).ok) return s;
  if (!(s = readFloat(obj, "stackSpace", c.stackSpace)).ok) return s;
  if (!(s = readFloat(obj, "xOffset", c.xOffset)).ok) return s;
  if (!(s = readFloat(obj, "yOffset", c.yOffset)).ok) return s;
  if (!(s = readFloat(obj, "density", c.density)).ok) return s;
  if (!(s = readEnum(obj, "horizontalAlignment", c.horizontalAlignment,
                     parseHorizontalAlignment)).ok) return s;
  if (!(s = readEnum(obj, "verticalAlignment", c.verticalAlignment,
                     parseVerticalAlignment)).ok) return s;
  if (!(s = readEnum(obj, "direction", c.direction, parseDirection)).ok) return s;
  if (!(s = readEnum(obj, "form", c.form, parseForm)).ok) return s;
  if (!(s = readFloat(obj, "formLineWidth", c.formLineWidth)).ok) return s;
  if (!(s = readFloat(obj, "textSize", c.textSize)).ok) return s;
  if (!(s = readBool(obj, "drawInside", c.drawInside)).ok) return s;
  if (!(s = readBool(obj, "enabled", c.enabled)).ok) return s;

  s = validateLegendConfig(c);
  if (!s.ok) return s;

  out = c;
  return s;
}

LegendStatus parseLegendConfigText(const std::string& json, LegendConfig& out) {
  rapidjson::Document d;
  d.Parse(json.c_str());
  if (d.HasParseError()) return legendFail("BAD_JSON", "config: invalid JSON");
  return parseLegendConfig(d, out);
}

std::string serializeLegendConfig(const LegendConfig& c) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("orientation");         w.String(orientationName(c.orientation));
  w.Key("wordWrap");            w.Bool(c.wordWrap);
  w.Key("maxSizePercent");      w.Double(c.maxSizePercent);
  w.Key("formSize");            w.Double(c.formSize);
  w.Key("formToTextSpace");     w.Double(c.formToTextSpace);
  w.Key("xEntrySpace");         w.Double(c.xEntrySpace);
  w.Key("yEntrySpace");         w.Double(c.yEntrySpace);
  w.Key("stackSpace");          w.Double(c.stackSpace);
  w.Key("xOffset");             w.Double(c.xOffset);
  w.Key("yOffset");             w.Double(c.yOffset);
  w.Key("density");             w.Double(c.density);
  w.Key("horizontalAlignment"); w.String(horizontalAlignmentName(c.horizontalAlignment));
  w.Key("verticalAlignment");   w.String(verticalAlignmentName(c.verticalAlignment));
  w.Key("direction");           w.String(directionName(c.direction));
  w.Key("form");                w.String(formName(c.form));
  w.Key("formLineWidth");       w.Double(c.formLineWidth);
  w.Key("textSize");            w.Double(c.textSize);
  w.Key("drawInside");          w.Bool(c.drawInside);
  w.Key("enabled");             w.Bool(c.enabled);
  w.EndObject();

  return sb.GetString();
}

// -------------------- Entries --------------------

static LegendStatus badEntry(std::size_t index, const std::string& what) {
  return legendFail("BAD_ENTRY", "entry " + std::to_string(index) + ": " + what);
}

// Reads a non-negative length member that fits a float.
static LegendStatus readEntryLength(const rapidjson::Value& v, std::size_t index,
                                    const char* key, float& out) {
  if (!v.IsNumber()) return badEntry(index, std::string(key) + " must be a number");
  double d = v.GetDouble();
  if (!fitsFloat(d) || d < 0.0)
    return badEntry(index, std::string(key) + " must be a non-negative float");
  out = static_cast<float>(d);
  return {};
}

static LegendStatus parseEntry(const rapidjson::Value& obj, std::size_t index, LegendEntry& e) {
  if (!obj.IsObject()) return badEntry(index, "expected object");

  const auto* label = getMember(obj, "label");
  if (!label || label->IsNull()) {
    e.label = LegendLabel::stacked();
  } else if (label->IsString()) {
    e.label = LegendLabel::labeled(label->GetString());
  } else {
    return badEntry(index, "label must be string or null");
  }

  if (const auto* v = getMember(obj, "form")) {
    if (!v->IsString() || !parseForm(v->GetString(), e.form))
      return badEntry(index, "unknown form");
  }

  if (const auto* v = getMember(obj, "color")) {
    if (!v->IsUint()) return badEntry(index, "color must be an ARGB integer");
    e.formColor = static_cast<std::uint32_t>(v->GetUint());
  }

  LegendStatus s;
  float length = 0.0f;

  if (const auto* v = getMember(obj, "formSize")) {
    if (!v->IsNull()) {
      if (!(s = readEntryLength(*v, index, "formSize", length)).ok) return s;
      e.formSize = length;
    }
  }

  if (const auto* v = getMember(obj, "formLineWidth")) {
    if (!v->IsNull()) {
      if (!(s = readEntryLength(*v, index, "formLineWidth", length)).ok) return s;
      e.formLineWidth = length;
    }
  }

  if (const auto* v = getMember(obj, "formLineDash")) {
    if (!v->IsArray()) return badEntry(index, "formLineDash must be an array");
    for (const auto& d : v->GetArray()) {
      if (!(s = readEntryLength(d, index, "formLineDash", length)).ok) return s;
      e.formLineDash.push_back(length);
    }
  }

  return {};
}

LegendStatus parseLegendEntries(const rapidjson::Value& arr, std::vector<LegendEntry>& out) {
  if (!arr.IsArray()) return legendFail("BAD_JSON", "entries: expected array");

  std::vector<LegendEntry> entries;
  entries.reserve(arr.Size());
  for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
    LegendEntry e;
    LegendStatus s = parseEntry(arr[i], i, e);
    if (!s.ok) return s;
    entries.push_back(std::move(e));
  }

  out = std::move(entries);
  return {};
}

LegendStatus parseLegendEntriesText(const std::string& json, std::vector<LegendEntry>& out) {
  rapidjson::Document d;
  d.Parse(json.c_str());
  if (d.HasParseError()) return legendFail("BAD_JSON", "entries: invalid JSON");
  return parseLegendEntries(d, out);
}

// -------------------- Result --------------------

static void writeSizes(rapidjson::Writer<rapidjson::StringBuffer>& w,
                       const std::vector<SizeF>& sizes) {
  w.StartArray();
  for (const auto& s : sizes) {
    w.StartArray();
    w.Double(s.width);
    w.Double(s.height);
    w.EndArray();
  }
  w.EndArray();
}

std::string serializeLayoutResult(const LayoutResult& r) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("neededWidth");    w.Double(r.neededWidth);
  w.Key("neededHeight");   w.Double(r.neededHeight);
  w.Key("maxLabelWidth");  w.Double(r.maxLabelWidth);
  w.Key("maxLabelHeight"); w.Double(r.maxLabelHeight);
  w.Key("direction");      w.String(directionName(r.direction));

  w.Key("labelSizes");
  writeSizes(w, r.labelSizes);

  w.Key("labelBreakPoints");
  w.StartArray();
  for (bool b : r.labelBreakPoints) w.Bool(b);
  w.EndArray();

  w.Key("lineSizes");
  writeSizes(w, r.lineSizes);
  w.EndObject();

  return sb.GetString();
}

} // namespace lk
