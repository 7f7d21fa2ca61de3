#pragma once
#include "cf/analysis/AssetUsage.hpp"
#include "cf/canvas/Element.hpp"
#include "cf/history/ActionHistory.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cf {

class FontLibrary;

// C5.1: Serializable engine configuration.

struct FontFaceConfig {
  std::string family;  // e.g. "DejaVu Sans"
  bool bold{false};
  bool italic{false};
  std::string path;    // TTF/OTF file
};

struct CanvasConfig {
  std::string version{kCanvasFormatVersion};
  CanvasSize canvasSize;
  std::size_t maxActions{kDefaultMaxActions};
  double minVisibleExtent{kDefaultMinVisibleExtent};

  std::string assetRoot;          // DirectoryAssetCatalog root; empty = none
  std::string defaultFontFamily;  // fallback when no listed family is loaded
  std::vector<FontFaceConfig> fonts;
};

// Serialize CanvasConfig to a JSON string.
std::string serializeCanvasConfig(const CanvasConfig& config);

// Deserialize a JSON string into CanvasConfig. Members that are absent or of
// the wrong type keep their current values. Returns false on error, leaving
// `out` untouched.
bool deserializeCanvasConfig(const std::string& json, CanvasConfig& out);

ValidationRules validationRulesFor(const CanvasConfig& config);

// Loads every configured face and applies the default family. Returns false
// if any face failed to load; the others are still loaded.
bool loadFonts(const CanvasConfig& config, FontLibrary& library);

} // namespace cf
