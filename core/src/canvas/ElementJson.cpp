#include "cf/canvas/ElementJson.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <utility>

namespace cf {

namespace {

const char* const kWeightNames[] = {
  "normal", "bold",
  "100", "200", "300", "400", "500", "600", "700", "800", "900"
};

void writeNumber(JsonWriter& w, double v) {
  // rapidjson refuses NaN/Inf and would leave the document unbalanced.
  if (std::isfinite(v)) w.Double(v);
  else w.Null();
}

bool readNumber(const rapidjson::Value& v, const char* key, double& out) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return true;
}

bool readString(const rapidjson::Value& v, const char* key, std::string& out) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsString()) return false;
  out.assign(it->value.GetString(), it->value.GetStringLength());
  return true;
}

bool readBool(const rapidjson::Value& v, const char* key, bool& out) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsBool()) return false;
  out = it->value.GetBool();
  return true;
}

bool readInt(const rapidjson::Value& v, const char* key, int& out) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd()) return false;
  if (it->value.IsInt()) { out = it->value.GetInt(); return true; }
  if (it->value.IsNumber()) {
    double d = std::round(it->value.GetDouble());
    if (!(d >= static_cast<double>(std::numeric_limits<int>::min()) &&
          d <= static_cast<double>(std::numeric_limits<int>::max()))) {
      return false;
    }
    out = static_cast<int>(d);
    return true;
  }
  return false;
}

// A present member that does not read as an int.
bool badInt(const rapidjson::Value& v, const char* key) {
  int tmp = 0;
  return v.HasMember(key) && !readInt(v, key, tmp);
}

void writeString(JsonWriter& w, const std::string& s) {
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

template <typename T>
void readOpt(const rapidjson::Value& v, const char* key, std::optional<T>& out,
             bool (*reader)(const rapidjson::Value&, const char*, T&)) {
  T tmp{};
  if (reader(v, key, tmp)) out = std::move(tmp);
}

} // anonymous namespace

const char* fontWeightName(FontWeight w) {
  auto i = static_cast<std::size_t>(w);
  return i < sizeof(kWeightNames) / sizeof(kWeightNames[0]) ? kWeightNames[i] : "normal";
}

const char* fontStyleName(FontStyle s) {
  return s == FontStyle::Italic ? "italic" : "normal";
}

const char* textAlignName(TextAlign a) {
  switch (a) {
    case TextAlign::Left: return "left";
    case TextAlign::Right: return "right";
    default: return "center";
  }
}

bool parseFontWeight(const std::string& s, FontWeight& out) {
  for (std::size_t i = 0; i < sizeof(kWeightNames) / sizeof(kWeightNames[0]); ++i) {
    if (s == kWeightNames[i]) {
      out = static_cast<FontWeight>(i);
      return true;
    }
  }
  return false;
}

bool parseFontStyle(const std::string& s, FontStyle& out) {
  if (s == "normal") { out = FontStyle::Normal; return true; }
  if (s == "italic") { out = FontStyle::Italic; return true; }
  return false;
}

bool parseTextAlign(const std::string& s, TextAlign& out) {
  if (s == "left") { out = TextAlign::Left; return true; }
  if (s == "center") { out = TextAlign::Center; return true; }
  if (s == "right") { out = TextAlign::Right; return true; }
  return false;
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

void writeElementJson(JsonWriter& w, const Element& el) {
  w.StartObject();
  w.Key("id");   writeString(w, el.id);
  w.Key("type"); w.String(elementKindName(kindOf(el)));

  if (const auto* a = assetContent(el)) {
    w.Key("assetId"); writeString(w, a->assetId);
  } else {
    const auto& t = *textContent(el);
    w.Key("text");       writeString(w, t.text);
    w.Key("fontSize");   writeNumber(w, t.fontSize);
    w.Key("fontFamily"); writeString(w, t.fontFamily);
    w.Key("fontWeight"); w.String(fontWeightName(t.fontWeight));
    w.Key("fontStyle");  w.String(fontStyleName(t.fontStyle));
    w.Key("color");      writeString(w, t.color);
    if (!t.backgroundColor.empty()) {
      w.Key("backgroundColor"); writeString(w, t.backgroundColor);
    }
    w.Key("textAlign");  w.String(textAlignName(t.textAlign));
  }

  w.Key("x");        writeNumber(w, el.x);
  w.Key("y");        writeNumber(w, el.y);
  w.Key("width");    writeNumber(w, el.width);
  w.Key("height");   writeNumber(w, el.height);
  w.Key("rotation"); writeNumber(w, el.rotation);
  w.Key("zIndex");   w.Int(el.zIndex);
  w.Key("opacity");  writeNumber(w, el.opacity);
  w.Key("locked");   w.Bool(el.locked);
  w.EndObject();
}

void writeElementsJson(JsonWriter& w, const ElementList& elements) {
  w.StartArray();
  for (const auto& el : elements) writeElementJson(w, el);
  w.EndArray();
}

void writePatchJson(JsonWriter& w, const ElementPatch& p) {
  w.StartObject();
  if (p.x)        { w.Key("x");        writeNumber(w, *p.x); }
  if (p.y)        { w.Key("y");        writeNumber(w, *p.y); }
  if (p.width)    { w.Key("width");    writeNumber(w, *p.width); }
  if (p.height)   { w.Key("height");   writeNumber(w, *p.height); }
  if (p.rotation) { w.Key("rotation"); writeNumber(w, *p.rotation); }
  if (p.zIndex)   { w.Key("zIndex");   w.Int(*p.zIndex); }
  if (p.opacity)  { w.Key("opacity");  writeNumber(w, *p.opacity); }
  if (p.locked)   { w.Key("locked");   w.Bool(*p.locked); }
  if (p.assetId)  { w.Key("assetId");  writeString(w, *p.assetId); }
  if (p.text)     { w.Key("text");     writeString(w, *p.text); }
  if (p.fontSize) { w.Key("fontSize"); writeNumber(w, *p.fontSize); }
  if (p.fontFamily) { w.Key("fontFamily"); writeString(w, *p.fontFamily); }
  if (p.fontWeight) { w.Key("fontWeight"); w.String(fontWeightName(*p.fontWeight)); }
  if (p.fontStyle)  { w.Key("fontStyle");  w.String(fontStyleName(*p.fontStyle)); }
  if (p.color)      { w.Key("color");      writeString(w, *p.color); }
  if (p.backgroundColor) { w.Key("backgroundColor"); writeString(w, *p.backgroundColor); }
  if (p.textAlign)  { w.Key("textAlign");  w.String(textAlignName(*p.textAlign)); }
  w.EndObject();
}

std::string elementsToJSON(const ElementList& elements) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("elements");
  writeElementsJson(w, elements);
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

bool readElementJson(const rapidjson::Value& v, Element& out) {
  if (!v.IsObject()) return false;

  Element el;
  if (!readString(v, "id", el.id)) return false;

  std::string type;
  if (!readString(v, "type", type)) return false;

  if (type == "asset") {
    AssetContent a;
    readString(v, "assetId", a.assetId);
    el.content = std::move(a);
  } else if (type == "text") {
    TextContent t;
    readString(v, "text", t.text);
    readNumber(v, "fontSize", t.fontSize);
    readString(v, "fontFamily", t.fontFamily);
    readString(v, "color", t.color);
    readString(v, "backgroundColor", t.backgroundColor);

    std::string s;
    if (readString(v, "fontWeight", s) && !parseFontWeight(s, t.fontWeight)) return false;
    if (readString(v, "fontStyle", s) && !parseFontStyle(s, t.fontStyle)) return false;
    if (readString(v, "textAlign", s) && !parseTextAlign(s, t.textAlign)) return false;
    el.content = std::move(t);
  } else {
    return false;
  }

  readNumber(v, "x", el.x);
  readNumber(v, "y", el.y);
  readNumber(v, "width", el.width);
  readNumber(v, "height", el.height);
  readNumber(v, "rotation", el.rotation);
  if (badInt(v, "zIndex")) return false;
  readInt(v, "zIndex", el.zIndex);
  readNumber(v, "opacity", el.opacity);
  readBool(v, "locked", el.locked);

  out = std::move(el);
  return true;
}

bool readElementsJson(const rapidjson::Value& arr, ElementList& out) {
  if (!arr.IsArray()) return false;
  ElementList loaded;
  loaded.reserve(arr.Size());
  for (const auto& v : arr.GetArray()) {
    Element el;
    if (!readElementJson(v, el)) return false;
    loaded.push_back(std::move(el));
  }
  out = std::move(loaded);
  return true;
}

bool readPatchJson(const rapidjson::Value& v, ElementPatch& out) {
  if (!v.IsObject()) return false;

  ElementPatch p;
  readOpt<double>(v, "x", p.x, readNumber);
  readOpt<double>(v, "y", p.y, readNumber);
  readOpt<double>(v, "width", p.width, readNumber);
  readOpt<double>(v, "height", p.height, readNumber);
  readOpt<double>(v, "rotation", p.rotation, readNumber);
  if (badInt(v, "zIndex")) return false;
  readOpt<int>(v, "zIndex", p.zIndex, readInt);
  readOpt<double>(v, "opacity", p.opacity, readNumber);
  readOpt<bool>(v, "locked", p.locked, readBool);
  readOpt<std::string>(v, "assetId", p.assetId, readString);
  readOpt<std::string>(v, "text", p.text, readString);
  readOpt<double>(v, "fontSize", p.fontSize, readNumber);
  readOpt<std::string>(v, "fontFamily", p.fontFamily, readString);
  readOpt<std::string>(v, "color", p.color, readString);
  readOpt<std::string>(v, "backgroundColor", p.backgroundColor, readString);

  std::string s;
  if (readString(v, "fontWeight", s)) {
    FontWeight fw;
    if (!parseFontWeight(s, fw)) return false;
    p.fontWeight = fw;
  }
  if (readString(v, "fontStyle", s)) {
    FontStyle fs;
    if (!parseFontStyle(s, fs)) return false;
    p.fontStyle = fs;
  }
  if (readString(v, "textAlign", s)) {
    TextAlign ta;
    if (!parseTextAlign(s, ta)) return false;
    p.textAlign = ta;
  }

  out = std::move(p);
  return true;
}

bool loadElementsJSON(const std::string& json, ElementList& out) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("elements")) return false;
  return readElementsJson(doc["elements"], out);
}

} // namespace cf
