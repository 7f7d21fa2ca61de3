#include "cf/analysis/AssetUsage.hpp"
#include "cf/canvas/ElementJson.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <unordered_map>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace cf {

namespace {

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

const AssetId* referencedAsset(const Element& el) {
  const auto* a = assetContent(el);
  if (!a || a->assetId.empty()) return nullptr;
  return &a->assetId;
}

void writeDouble(JsonWriter& w, double v) {
  if (std::isfinite(v)) w.Double(v);
  else w.Null();
}

} // anonymous namespace

std::vector<AssetId> usedAssetIds(const ElementList& elements) {
  std::vector<AssetId> ids;
  for (const auto& el : elements) {
    const AssetId* id = referencedAsset(el);
    if (!id) continue;
    if (std::find(ids.begin(), ids.end(), *id) == ids.end()) ids.push_back(*id);
  }
  return ids;
}

std::vector<AssetUsageInfo> assetUsageInfo(const ElementList& elements) {
  std::vector<AssetUsageInfo> usage;
  std::unordered_map<AssetId, std::size_t> index;

  for (const auto& el : elements) {
    const AssetId* id = referencedAsset(el);
    if (!id) continue;

    auto it = index.find(*id);
    if (it == index.end()) {
      it = index.emplace(*id, usage.size()).first;
      AssetUsageInfo info;
      info.assetId = *id;
      usage.push_back(std::move(info));
    }

    auto& info = usage[it->second];
    info.count++;
    info.transformations.push_back(
        {el.x, el.y, el.width, el.height, el.rotation, el.opacity});
  }
  return usage;
}

CanvasAssetSummary canvasAssetSummary(const ElementList& elements,
                                      std::optional<std::string> ipKitId) {
  CanvasAssetSummary s;
  s.usedAssetIds = usedAssetIds(elements);
  s.assetUsageInfo = assetUsageInfo(elements);
  s.ipKitId = std::move(ipKitId);
  s.totalElements = elements.size();
  for (const auto& el : elements) {
    if (isAsset(el)) s.assetElements++;
    else s.textElements++;
  }
  return s;
}

ValidationResult validateCanvasComposition(const ElementList& elements,
                                           const std::string& ipKitId,
                                           const ValidationRules& rules) {
  ValidationResult r;
  r.summary = canvasAssetSummary(elements, ipKitId);

  if (elements.empty()) {
    r.errors.push_back("Canvas must contain at least one element");
    r.valid = false;
    return r;
  }

  std::size_t emptyText = 0, tiny = 0, outside = 0;
  for (const auto& el : elements) {
    if (const auto* t = textContent(el)) {
      if (isBlank(t->text)) emptyText++;
    }
    if (el.width < rules.minVisibleExtent || el.height < rules.minVisibleExtent) tiny++;
    if (el.x < 0 || el.y < 0 ||
        el.x + el.width > rules.bounds.width ||
        el.y + el.height > rules.bounds.height) {
      outside++;
    }
  }

  if (emptyText > 0)
    r.warnings.push_back(std::to_string(emptyText) + " text element(s) have no content");
  if (tiny > 0)
    r.warnings.push_back(std::to_string(tiny) +
                         " element(s) are very small and may not be visible");
  if (outside > 0)
    r.warnings.push_back(std::to_string(outside) +
                         " element(s) extend outside canvas bounds");

  r.valid = r.errors.empty();
  return r;
}

SubmissionMetadata generateSubmissionMetadata(const ElementList& elements,
                                              const std::string& ipKitId,
                                              CanvasSize canvasSize,
                                              const std::string& version) {
  SubmissionMetadata m;
  m.elements = elements;
  m.canvasSize = canvasSize;
  m.version = version;
  m.summary = canvasAssetSummary(elements, ipKitId);
  return m;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string serializeSubmissionMetadata(const SubmissionMetadata& meta) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();

  w.Key("canvasData");
  w.StartObject();
  w.Key("elements");
  writeElementsJson(w, meta.elements);
  w.Key("canvasSize");
  w.StartObject();
  w.Key("width");  writeDouble(w, meta.canvasSize.width);
  w.Key("height"); writeDouble(w, meta.canvasSize.height);
  w.EndObject();
  w.Key("version"); w.String(meta.version.c_str());
  w.EndObject();

  const auto& s = meta.summary;
  w.Key("assetMetadata");
  w.StartObject();
  w.Key("usedAssetIds");
  w.StartArray();
  for (const auto& id : s.usedAssetIds) w.String(id.c_str());
  w.EndArray();

  w.Key("assetUsageInfo");
  w.StartArray();
  for (const auto& info : s.assetUsageInfo) {
    w.StartObject();
    w.Key("assetId"); w.String(info.assetId.c_str());
    w.Key("count");   w.Uint64(info.count);
    w.Key("transformations");
    w.StartArray();
    for (const auto& t : info.transformations) {
      w.StartObject();
      w.Key("x");        writeDouble(w, t.x);
      w.Key("y");        writeDouble(w, t.y);
      w.Key("width");    writeDouble(w, t.width);
      w.Key("height");   writeDouble(w, t.height);
      w.Key("rotation"); writeDouble(w, t.rotation);
      w.Key("opacity");  writeDouble(w, t.opacity);
      w.EndObject();
    }
    w.EndArray();
    w.EndObject();
  }
  w.EndArray();

  if (s.ipKitId) {
    w.Key("ipKitId"); w.String(s.ipKitId->c_str());
  }

  w.Key("elementCounts");
  w.StartObject();
  w.Key("total");  w.Uint64(s.totalElements);
  w.Key("assets"); w.Uint64(s.assetElements);
  w.Key("text");   w.Uint64(s.textElements);
  w.EndObject();

  w.EndObject();
  w.EndObject();
  return sb.GetString();
}

bool parseSubmissionMetadata(const std::string& json, SubmissionMetadata& out) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  auto cd = doc.FindMember("canvasData");
  if (cd == doc.MemberEnd() || !cd->value.IsObject()) return false;
  const auto& canvas = cd->value;

  SubmissionMetadata m;
  auto els = canvas.FindMember("elements");
  if (els == canvas.MemberEnd() || !readElementsJson(els->value, m.elements))
    return false;

  auto size = canvas.FindMember("canvasSize");
  if (size != canvas.MemberEnd() && size->value.IsObject()) {
    const auto& sz = size->value;
    if (sz.HasMember("width") && sz["width"].IsNumber())
      m.canvasSize.width = sz["width"].GetDouble();
    if (sz.HasMember("height") && sz["height"].IsNumber())
      m.canvasSize.height = sz["height"].GetDouble();
  }

  if (canvas.HasMember("version") && canvas["version"].IsString())
    m.version = canvas["version"].GetString();

  std::optional<std::string> ipKitId;
  auto am = doc.FindMember("assetMetadata");
  if (am != doc.MemberEnd() && am->value.IsObject() &&
      am->value.HasMember("ipKitId") && am->value["ipKitId"].IsString()) {
    ipKitId = am->value["ipKitId"].GetString();
  }
  m.summary = canvasAssetSummary(m.elements, std::move(ipKitId));

  out = std::move(m);
  return true;
}

} // namespace cf
