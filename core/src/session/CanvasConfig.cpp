#include "cf/session/CanvasConfig.hpp"
#include "cf/text/FontLibrary.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdint>
#include <utility>

namespace cf {

std::string serializeCanvasConfig(const CanvasConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(config.version.c_str(), alloc), alloc);

  rapidjson::Value size(rapidjson::kObjectType);
  size.AddMember("width", config.canvasSize.width, alloc);
  size.AddMember("height", config.canvasSize.height, alloc);
  doc.AddMember("canvasSize", size, alloc);

  doc.AddMember("maxActions", static_cast<std::uint64_t>(config.maxActions), alloc);
  doc.AddMember("minVisibleExtent", config.minVisibleExtent, alloc);
  doc.AddMember("assetRoot",
                rapidjson::Value(config.assetRoot.c_str(), alloc), alloc);
  doc.AddMember("defaultFontFamily",
                rapidjson::Value(config.defaultFontFamily.c_str(), alloc), alloc);

  rapidjson::Value fonts(rapidjson::kArrayType);
  for (const auto& f : config.fonts) {
    rapidjson::Value face(rapidjson::kObjectType);
    face.AddMember("family", rapidjson::Value(f.family.c_str(), alloc), alloc);
    face.AddMember("bold", f.bold, alloc);
    face.AddMember("italic", f.italic, alloc);
    face.AddMember("path", rapidjson::Value(f.path.c_str(), alloc), alloc);
    fonts.PushBack(face, alloc);
  }
  doc.AddMember("fonts", fonts, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeCanvasConfig(const std::string& json, CanvasConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  CanvasConfig cfg = out;

  if (doc.HasMember("version") && doc["version"].IsString())
    cfg.version = doc["version"].GetString();

  if (doc.HasMember("canvasSize") && doc["canvasSize"].IsObject()) {
    const auto& s = doc["canvasSize"];
    if (s.HasMember("width") && s["width"].IsNumber())
      cfg.canvasSize.width = s["width"].GetDouble();
    if (s.HasMember("height") && s["height"].IsNumber())
      cfg.canvasSize.height = s["height"].GetDouble();
  }

  if (doc.HasMember("maxActions") && doc["maxActions"].IsUint64())
    cfg.maxActions = static_cast<std::size_t>(doc["maxActions"].GetUint64());

  if (doc.HasMember("minVisibleExtent") && doc["minVisibleExtent"].IsNumber())
    cfg.minVisibleExtent = doc["minVisibleExtent"].GetDouble();

  if (doc.HasMember("assetRoot") && doc["assetRoot"].IsString())
    cfg.assetRoot = doc["assetRoot"].GetString();

  if (doc.HasMember("defaultFontFamily") && doc["defaultFontFamily"].IsString())
    cfg.defaultFontFamily = doc["defaultFontFamily"].GetString();

  if (doc.HasMember("fonts")) {
    if (!doc["fonts"].IsArray()) return false;
    std::vector<FontFaceConfig> fonts;
    for (const auto& v : doc["fonts"].GetArray()) {
      if (!v.IsObject()) return false;
      if (!v.HasMember("family") || !v["family"].IsString()) return false;
      if (!v.HasMember("path") || !v["path"].IsString()) return false;
      FontFaceConfig f;
      f.family = v["family"].GetString();
      f.path = v["path"].GetString();
      if (v.HasMember("bold") && v["bold"].IsBool()) f.bold = v["bold"].GetBool();
      if (v.HasMember("italic") && v["italic"].IsBool()) f.italic = v["italic"].GetBool();
      fonts.push_back(std::move(f));
    }
    cfg.fonts = std::move(fonts);
  }

  out = std::move(cfg);
  return true;
}

ValidationRules validationRulesFor(const CanvasConfig& config) {
  ValidationRules rules;
  rules.bounds = config.canvasSize;
  rules.minVisibleExtent = config.minVisibleExtent;
  return rules;
}

bool loadFonts(const CanvasConfig& config, FontLibrary& library) {
  bool allLoaded = true;
  for (const auto& f : config.fonts) {
    if (!library.loadFontFile(f.family, f.bold, f.italic, f.path)) allLoaded = false;
  }
  if (!config.defaultFontFamily.empty()) {
    library.setDefaultFamily(config.defaultFontFamily);
  }
  return allLoaded;
}

} // namespace cf
