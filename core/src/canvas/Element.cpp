#include "cf/canvas/Element.hpp"

#include <utility>

namespace cf {

bool ElementPatch::empty() const {
  return !x && !y && !width && !height && !rotation && !zIndex &&
         !opacity && !locked && !assetId && !text && !fontSize &&
         !fontFamily && !fontWeight && !fontStyle && !color &&
         !backgroundColor && !textAlign;
}

Element makeAssetElement(ElementId id, AssetId assetId,
                         double x, double y, double width, double height,
                         int zIndex) {
  Element el;
  el.id = std::move(id);
  el.x = x; el.y = y;
  el.width = width; el.height = height;
  el.zIndex = zIndex;
  el.content = AssetContent{std::move(assetId)};
  return el;
}

Element makeTextElement(ElementId id, std::string text,
                        double x, double y, double width, double height,
                        int zIndex) {
  Element el;
  el.id = std::move(id);
  el.x = x; el.y = y;
  el.width = width; el.height = height;
  el.zIndex = zIndex;
  TextContent tc;
  tc.text = std::move(text);
  el.content = std::move(tc);
  return el;
}

void applyPatch(Element& el, const ElementPatch& p) {
  if (p.x) el.x = *p.x;
  if (p.y) el.y = *p.y;
  if (p.width) el.width = *p.width;
  if (p.height) el.height = *p.height;
  if (p.rotation) el.rotation = *p.rotation;
  if (p.zIndex) el.zIndex = *p.zIndex;
  if (p.opacity) el.opacity = *p.opacity;
  if (p.locked) el.locked = *p.locked;

  if (auto* a = std::get_if<AssetContent>(&el.content)) {
    if (p.assetId) a->assetId = *p.assetId;
    return;
  }

  auto& t = std::get<TextContent>(el.content);
  if (p.text) t.text = *p.text;
  if (p.fontSize) t.fontSize = *p.fontSize;
  if (p.fontFamily) t.fontFamily = *p.fontFamily;
  if (p.fontWeight) t.fontWeight = *p.fontWeight;
  if (p.fontStyle) t.fontStyle = *p.fontStyle;
  if (p.color) t.color = *p.color;
  if (p.backgroundColor) t.backgroundColor = *p.backgroundColor;
  if (p.textAlign) t.textAlign = *p.textAlign;
}

ElementPatch snapshotPatch(const Element& el, const ElementPatch& mask) {
  ElementPatch s;
  if (mask.x) s.x = el.x;
  if (mask.y) s.y = el.y;
  if (mask.width) s.width = el.width;
  if (mask.height) s.height = el.height;
  if (mask.rotation) s.rotation = el.rotation;
  if (mask.zIndex) s.zIndex = el.zIndex;
  if (mask.opacity) s.opacity = el.opacity;
  if (mask.locked) s.locked = el.locked;

  if (const auto* a = assetContent(el)) {
    if (mask.assetId) s.assetId = a->assetId;
    return s;
  }

  const auto& t = std::get<TextContent>(el.content);
  if (mask.text) s.text = t.text;
  if (mask.fontSize) s.fontSize = t.fontSize;
  if (mask.fontFamily) s.fontFamily = t.fontFamily;
  if (mask.fontWeight) s.fontWeight = t.fontWeight;
  if (mask.fontStyle) s.fontStyle = t.fontStyle;
  if (mask.color) s.color = t.color;
  if (mask.backgroundColor) s.backgroundColor = t.backgroundColor;
  if (mask.textAlign) s.textAlign = t.textAlign;
  return s;
}

bool isBold(FontWeight w) {
  switch (w) {
    case FontWeight::Bold:
    case FontWeight::W600:
    case FontWeight::W700:
    case FontWeight::W800:
    case FontWeight::W900:
      return true;
    default:
      return false;
  }
}

const char* elementKindName(ElementKind k) {
  return k == ElementKind::Text ? "text" : "asset";
}

static bool sameText(const TextContent& a, const TextContent& b) {
  return a.text == b.text && a.fontSize == b.fontSize &&
         a.fontFamily == b.fontFamily && a.fontWeight == b.fontWeight &&
         a.fontStyle == b.fontStyle && a.color == b.color &&
         a.backgroundColor == b.backgroundColor && a.textAlign == b.textAlign;
}

bool operator==(const Element& a, const Element& b) {
  if (a.id != b.id || a.x != b.x || a.y != b.y || a.width != b.width ||
      a.height != b.height || a.rotation != b.rotation ||
      a.zIndex != b.zIndex || a.opacity != b.opacity || a.locked != b.locked)
    return false;
  if (kindOf(a) != kindOf(b)) return false;
  if (const auto* aa = assetContent(a))
    return aa->assetId == assetContent(b)->assetId;
  return sameText(*textContent(a), *textContent(b));
}

bool operator==(const ElementPatch& a, const ElementPatch& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height && a.rotation == b.rotation &&
         a.zIndex == b.zIndex && a.opacity == b.opacity &&
         a.locked == b.locked && a.assetId == b.assetId && a.text == b.text &&
         a.fontSize == b.fontSize && a.fontFamily == b.fontFamily &&
         a.fontWeight == b.fontWeight && a.fontStyle == b.fontStyle &&
         a.color == b.color && a.backgroundColor == b.backgroundColor &&
         a.textAlign == b.textAlign;
}

} // namespace cf
