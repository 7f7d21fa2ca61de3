#pragma once
#include "cf/ids/Id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cf {

// C1.1: Element model. One positioned, layered item of a composition.

enum class ElementKind : std::uint8_t {
  Asset = 1, // reference to an externally resolvable image
  Text = 2   // literal text block
};

enum class FontWeight : std::uint8_t {
  Normal = 0,
  Bold,
  W100, W200, W300, W400, W500, W600, W700, W800, W900
};

enum class FontStyle : std::uint8_t { Normal = 0, Italic };

enum class TextAlign : std::uint8_t { Left = 0, Center, Right };

struct AssetContent {
  AssetId assetId;
};

struct TextContent {
  std::string text;
  double fontSize{24};
  std::string fontFamily{"Arial, sans-serif"};
  FontWeight fontWeight{FontWeight::Normal};
  FontStyle fontStyle{FontStyle::Normal};
  std::string color{"#000000"};
  std::string backgroundColor; // empty = no fill
  TextAlign textAlign{TextAlign::Center};
};

struct Element {
  ElementId id;

  // Canvas-space geometry. width/height are not required to be positive here;
  // the analyzer reports degenerate sizes.
  double x{0}, y{0};
  double width{0}, height{0};
  double rotation{0}; // degrees, clockwise, pivot at the element center
  int zIndex{0};

  double opacity{1.0};
  bool locked{false}; // advisory only

  std::variant<AssetContent, TextContent> content;
};

using ElementList = std::vector<Element>;

inline constexpr double kDefaultCanvasWidth = 800.0;
inline constexpr double kDefaultCanvasHeight = 600.0;
inline constexpr const char* kCanvasFormatVersion = "1.0";

struct CanvasSize {
  double width{kDefaultCanvasWidth};
  double height{kDefaultCanvasHeight};
};

// Partial element state. Every present field replaces the element's field on
// merge; kind-specific fields are ignored on elements of the other kind.
// No kind field: kind is fixed at creation.
struct ElementPatch {
  std::optional<double> x, y;
  std::optional<double> width, height;
  std::optional<double> rotation;
  std::optional<int> zIndex;
  std::optional<double> opacity;
  std::optional<bool> locked;

  // Asset
  std::optional<AssetId> assetId;

  // Text
  std::optional<std::string> text;
  std::optional<double> fontSize;
  std::optional<std::string> fontFamily;
  std::optional<FontWeight> fontWeight;
  std::optional<FontStyle> fontStyle;
  std::optional<std::string> color;
  std::optional<std::string> backgroundColor;
  std::optional<TextAlign> textAlign;

  bool empty() const;
};

Element makeAssetElement(ElementId id, AssetId assetId,
                         double x, double y, double width, double height,
                         int zIndex = 0);

Element makeTextElement(ElementId id, std::string text,
                        double x, double y, double width, double height,
                        int zIndex = 0);

inline ElementKind kindOf(const Element& el) {
  return std::holds_alternative<TextContent>(el.content) ? ElementKind::Text
                                                         : ElementKind::Asset;
}
inline bool isAsset(const Element& el) { return kindOf(el) == ElementKind::Asset; }
inline bool isText(const Element& el) { return kindOf(el) == ElementKind::Text; }

// Kind-checked payload access; nullptr when the element is of the other kind.
inline const AssetContent* assetContent(const Element& el) {
  return std::get_if<AssetContent>(&el.content);
}
inline const TextContent* textContent(const Element& el) {
  return std::get_if<TextContent>(&el.content);
}

// Merge a patch onto an element in place.
void applyPatch(Element& el, const ElementPatch& patch);

// Current values of `el` for exactly the fields present in `mask`
// (kind-specific fields of the other kind are left out).
ElementPatch snapshotPatch(const Element& el, const ElementPatch& mask);

bool isBold(FontWeight w);

const char* elementKindName(ElementKind k);

bool operator==(const Element& a, const Element& b);
inline bool operator!=(const Element& a, const Element& b) { return !(a == b); }
bool operator==(const ElementPatch& a, const ElementPatch& b);
inline bool operator!=(const ElementPatch& a, const ElementPatch& b) { return !(a == b); }

} // namespace cf
