#pragma once
#include "cf/canvas/Element.hpp"
#include "cf/export/AssetSource.hpp"
#include "cf/export/ImageEncoding.hpp"
#include "cf/math/Affine2D.hpp"
#include "cf/raster/Bitmap.hpp"
#include "cf/text/FontLibrary.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cf {

// C4.4: Renders a composition to a bitmap and encodes it.

enum class ExportStage : std::uint8_t {
  Preparing = 1,
  Rendering,
  Generating,
  Complete,
  Error
};

const char* exportStageName(ExportStage stage);

struct ExportProgress {
  ExportStage stage{ExportStage::Preparing};
  double progress{0}; // 0..100
  std::string message;
};

using ProgressCallback = std::function<void(const ExportProgress&)>;

inline constexpr int kMaxExportDimension = 16384;

struct ExportOptions {
  ImageFormat format{ImageFormat::Png};
  double quality{0.9}; // JPEG only, 0..1
  double scale{1.0};   // multiplies both output dimensions

  // Unset: transparent for PNG, white for JPEG. JPEG output is always
  // flattened onto an opaque background.
  std::optional<std::string> backgroundColor;

  // Fetch and decode every distinct asset on a small worker pool before drawing.
  bool prefetchAssets{true};
};

struct RasterResult {
  bool ok{false};
  std::string error;
  Bitmap bitmap;
};

struct ExportResult {
  bool ok{false};
  std::string error;
  std::vector<std::uint8_t> encoded;
  int width{0};
  int height{0};
  ImageFormat format{ImageFormat::Png};
};

// Painter's order: ascending zIndex, ties in collection order.
std::vector<const Element*> renderOrder(const ElementList& elements);

// Canvas units -> output pixels for content of `el`:
// S(scale) * T(center) * R(rotation) * T(-center).
Affine2D elementTransform(const Element& el, double scale);

class CompositionExporter {
public:
  // `fonts` may be null; text is then drawn without glyphs.
  explicit CompositionExporter(AssetSource& assets, const FontLibrary* fonts = nullptr);

  // Reports Preparing and Rendering progress (or Error).
  RasterResult rasterize(const ElementList& elements, CanvasSize canvasSize,
                         const ExportOptions& options = {},
                         const ProgressCallback& onProgress = {});

  // rasterize + encode. Reports the full Preparing..Complete sequence, or
  // a single Error stage on failure (no partial output).
  ExportResult exportImage(const ElementList& elements, CanvasSize canvasSize,
                           const ExportOptions& options = {},
                           const ProgressCallback& onProgress = {});

private:
  struct DecodedAsset {
    bool ok{false};
    std::string error;
    Bitmap bitmap;
  };

  RasterResult render(const ElementList& elements, CanvasSize canvasSize,
                      const ExportOptions& options, const ProgressCallback& onProgress);
  DecodedAsset loadAsset(const AssetId& assetId);
  // Loads `ids` on at most kMaxPrefetchWorkers threads.
  void prefetch(const std::vector<AssetId>& ids,
                std::unordered_map<AssetId, DecodedAsset>& out);
  void drawAsset(Bitmap& dst, const Element& el, const Bitmap& image, double scale) const;
  // False (with `error`) when the font size cannot be rasterized.
  bool drawText(Bitmap& dst, const Element& el, const TextContent& text, double scale,
                std::string& error) const;

  AssetSource& assets_;
  const FontLibrary* fonts_;
};

} // namespace cf
