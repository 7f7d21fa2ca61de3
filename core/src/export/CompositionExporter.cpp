#include "cf/export/CompositionExporter.hpp"
#include "cf/raster/Color.hpp"
#include "cf/raster/ImageDecode.hpp"
#include "cf/raster/Painter.hpp"
#include "cf/text/TextLayout.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <exception>
#include <future>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace cf {

namespace {

void report(const ProgressCallback& cb, ExportStage stage, double progress,
            const std::string& message) {
  if (!cb) return;
  ExportProgress p;
  p.stage = stage;
  p.progress = progress;
  p.message = message;
  cb(p);
}

float effectiveOpacity(const Element& el) {
  if (!std::isfinite(el.opacity)) return 1.0f;
  return static_cast<float>(std::clamp(el.opacity, 0.0, 1.0));
}

// Synthetic italic slant (x shifts right above the baseline).
constexpr double kObliqueShear = -0.2;

// Upper bound on concurrent asset fetch/decode workers.
constexpr std::size_t kMaxPrefetchWorkers = 8;

void reportFailure(const ProgressCallback& cb, const std::string& message) {
  std::fprintf(stderr, "[CompositionExporter] export failed: %s\n", message.c_str());
  report(cb, ExportStage::Error, 0, message);
}

} // anonymous namespace

const char* exportStageName(ExportStage stage) {
  switch (stage) {
    case ExportStage::Preparing:  return "preparing";
    case ExportStage::Rendering:  return "rendering";
    case ExportStage::Generating: return "generating";
    case ExportStage::Complete:   return "complete";
    case ExportStage::Error:      return "error";
  }
  return "unknown";
}

std::vector<const Element*> renderOrder(const ElementList& elements) {
  std::vector<const Element*> order;
  order.reserve(elements.size());
  for (const auto& el : elements) order.push_back(&el);
  std::stable_sort(order.begin(), order.end(),
                   [](const Element* a, const Element* b) { return a->zIndex < b->zIndex; });
  return order;
}

Affine2D elementTransform(const Element& el, double scale) {
  double cx = el.x + el.width / 2.0;
  double cy = el.y + el.height / 2.0;
  return Affine2D::scale(scale, scale) *
         Affine2D::translate(cx, cy) *
         Affine2D::rotate(degreesToRadians(el.rotation)) *
         Affine2D::translate(-cx, -cy);
}

CompositionExporter::CompositionExporter(AssetSource& assets, const FontLibrary* fonts)
  : assets_(assets), fonts_(fonts) {}

CompositionExporter::DecodedAsset CompositionExporter::loadAsset(const AssetId& assetId) {
  DecodedAsset d;
  AssetFetch fetched = assets_.fetch(assetId);
  if (!fetched.ok) {
    d.error = fetched.error.empty() ? "Asset not found: " + assetId : fetched.error;
    return d;
  }
  std::string why;
  if (!decodeImage(fetched.bytes, d.bitmap, why)) {
    d.error = "Failed to load image for export: " + assetId + " (" + why + ")";
    return d;
  }
  d.ok = true;
  return d;
}

void CompositionExporter::drawAsset(Bitmap& dst, const Element& el,
                                    const Bitmap& image, double scale) const {
  if (image.empty() || !(el.width > 0) || !(el.height > 0)) return;
  Affine2D toDst = elementTransform(el, scale) *
                   Affine2D::translate(el.x, el.y) *
                   Affine2D::scale(el.width / image.width(), el.height / image.height());
  drawBitmap(dst, image, toDst, effectiveOpacity(el));
}

bool CompositionExporter::drawText(Bitmap& dst, const Element& el,
                                   const TextContent& text, double scale,
                                   std::string& error) const {
  const double pixelSize = text.fontSize * scale;
  if (!text.text.empty() && (std::isnan(pixelSize) || pixelSize > kMaxExportDimension)) {
    error = "Invalid font size for text element " + el.id;
    return false;
  }

  const Affine2D frame = elementTransform(el, scale);
  const float opacity = effectiveOpacity(el);

  Rgba8 bg = colorOr(text.backgroundColor, kTransparent);
  if (bg.a > 0) {
    fillRect(dst, el.width, el.height, frame * Affine2D::translate(el.x, el.y), bg, opacity);
  }

  if (text.text.empty() || !(pixelSize > 0)) return true;

  FontMatch font;
  if (fonts_) {
    font = fonts_->match(text.fontFamily, isBold(text.fontWeight),
                         text.fontStyle == FontStyle::Italic);
  }
  if (!font.face) {
    std::fprintf(stderr, "[CompositionExporter] no font for '%s', skipping glyphs of %s\n",
                 text.fontFamily.c_str(), el.id.c_str());
    return true;
  }

  // Glyphs are rasterized at output resolution; lines are laid out in
  // output pixels and mapped back to canvas units with 1/scale.
  TextLine line = layoutLine(*font.face, text.text, static_cast<float>(pixelSize));
  double lineWidth = line.width / scale;

  double originX = el.x;
  if (text.textAlign == TextAlign::Center) {
    originX = el.x + (el.width - lineWidth) / 2.0;
  } else if (text.textAlign == TextAlign::Right) {
    originX = el.x + el.width - lineWidth;
  }
  // Middle baseline: the em box is vertically centered in the element.
  double baseline = el.y + el.height / 2.0 +
                    (line.metrics.ascent + line.metrics.descent) / 2.0 / scale;

  Affine2D toLine = frame *
                    Affine2D::translate(originX, baseline) *
                    Affine2D::scale(1.0 / scale, 1.0 / scale);
  if (font.syntheticItalic) toLine = toLine * Affine2D::shearX(kObliqueShear);

  const Rgba8 color = colorOr(text.color, kBlack);
  for (const auto& g : line.glyphs) {
    const GlyphBitmap& gb = g.bitmap;
    if (gb.width <= 0 || gb.height <= 0) continue;
    double gx = g.penX + gb.offsetX;
    drawMask(dst, gb.coverage.data(), gb.width, gb.height,
             toLine * Affine2D::translate(gx, gb.offsetY), color, opacity);
    if (font.syntheticBold) {
      drawMask(dst, gb.coverage.data(), gb.width, gb.height,
               toLine * Affine2D::translate(gx + 1.0, gb.offsetY), color, opacity);
    }
  }
  return true;
}

void CompositionExporter::prefetch(const std::vector<AssetId>& ids,
                                   std::unordered_map<AssetId, DecodedAsset>& out) {
  if (ids.empty()) return;

  // Workers pull the next unclaimed id; each slot is written by one worker.
  std::vector<DecodedAsset> loaded(ids.size());
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t i = next++; i < ids.size(); i = next++) {
      try {
        loaded[i] = loadAsset(ids[i]);
      } catch (const std::exception& e) {
        loaded[i].error = "Failed to load image for export: " + ids[i] + " (" + e.what() + ")";
      }
    }
  };

  std::size_t workers = std::min<std::size_t>(ids.size(), kMaxPrefetchWorkers);
  std::vector<std::future<void>> pending;
  pending.reserve(workers);
  try {
    for (std::size_t w = 0; w < workers; w++) {
      pending.push_back(std::async(std::launch::async, worker));
    }
  } catch (const std::system_error& e) {
    std::fprintf(stderr, "[CompositionExporter] prefetch limited to %zu workers: %s\n",
                 pending.size(), e.what());
    if (pending.empty()) worker();
  }
  for (auto& f : pending) f.get();

  for (std::size_t i = 0; i < ids.size(); i++) out.emplace(ids[i], std::move(loaded[i]));
}

RasterResult CompositionExporter::rasterize(const ElementList& elements, CanvasSize canvasSize,
                                            const ExportOptions& options,
                                            const ProgressCallback& onProgress) {
  try {
    return render(elements, canvasSize, options, onProgress);
  } catch (const std::exception& e) {
    std::string message = std::string("Export failed: ") + e.what();
    reportFailure(onProgress, message);
    RasterResult r;
    r.error = message;
    return r;
  }
}

RasterResult CompositionExporter::render(const ElementList& elements, CanvasSize canvasSize,
                                         const ExportOptions& options,
                                         const ProgressCallback& onProgress) {
  RasterResult result;
  auto fail = [&](const std::string& message) {
    reportFailure(onProgress, message);
    RasterResult r;
    r.error = message;
    return r;
  };

  report(onProgress, ExportStage::Preparing, 10, "Preparing canvas...");

  const double scale = options.scale;
  if (!std::isfinite(scale) || scale <= 0) {
    return fail("Invalid export scale");
  }
  double fw = canvasSize.width * scale;
  double fh = canvasSize.height * scale;
  if (!std::isfinite(fw) || !std::isfinite(fh)) {
    return fail("Invalid canvas size");
  }
  long w = std::lround(fw);
  long h = std::lround(fh);
  if (w <= 0 || h <= 0 || w > kMaxExportDimension || h > kMaxExportDimension) {
    return fail("Invalid canvas size " + std::to_string(w) + "x" + std::to_string(h));
  }

  const bool jpeg = options.format == ImageFormat::Jpeg;
  const Rgba8 defaultBg = jpeg ? kWhite : kTransparent;
  Rgba8 bg = defaultBg;
  if (options.backgroundColor && !parseColor(*options.backgroundColor, bg)) {
    std::fprintf(stderr, "[CompositionExporter] unrecognized background '%s', using default\n",
                 options.backgroundColor->c_str());
    bg = defaultBg;
  }

  Bitmap canvas;
  if (jpeg) {
    canvas = Bitmap(static_cast<int>(w), static_cast<int>(h), kWhite);
    if (bg.a > 0) fillRect(canvas, static_cast<double>(w), static_cast<double>(h), Affine2D{}, bg, 1.0f);
  } else {
    canvas = Bitmap(static_cast<int>(w), static_cast<int>(h), bg);
  }

  report(onProgress, ExportStage::Rendering, 20, "Loading assets...");

  std::vector<const Element*> order = renderOrder(elements);

  std::unordered_map<AssetId, DecodedAsset> decoded;
  if (options.prefetchAssets) {
    std::vector<AssetId> ids;
    std::unordered_set<AssetId> seen;
    for (const Element* el : order) {
      const AssetContent* a = assetContent(*el);
      if (a && !a->assetId.empty() && seen.insert(a->assetId).second) ids.push_back(a->assetId);
    }
    prefetch(ids, decoded);
  }

  const std::size_t n = order.size();
  for (std::size_t i = 0; i < n; i++) {
    const Element& el = *order[i];
    report(onProgress, ExportStage::Rendering, 20.0 + 60.0 * static_cast<double>(i) / n,
           "Rendering element " + std::to_string(i + 1) + " of " + std::to_string(n) + "...");

    if (const AssetContent* a = assetContent(el)) {
      if (a->assetId.empty()) {
        return fail("Asset element " + el.id + " has no asset reference");
      }
      auto it = decoded.find(a->assetId);
      if (it == decoded.end()) {
        it = decoded.emplace(a->assetId, loadAsset(a->assetId)).first;
      }
      if (!it->second.ok) return fail(it->second.error);
      drawAsset(canvas, el, it->second.bitmap, scale);
    } else if (const TextContent* t = textContent(el)) {
      std::string error;
      if (!drawText(canvas, el, *t, scale, error)) return fail(error);
    }
  }

  result.ok = true;
  result.bitmap = std::move(canvas);
  return result;
}

ExportResult CompositionExporter::exportImage(const ElementList& elements, CanvasSize canvasSize,
                                              const ExportOptions& options,
                                              const ProgressCallback& onProgress) {
  ExportResult result;
  result.format = options.format;

  RasterResult raster = rasterize(elements, canvasSize, options, onProgress);
  if (!raster.ok) {
    result.error = raster.error;
    return result;
  }

  report(onProgress, ExportStage::Generating, 90, "Generating image...");

  std::vector<std::uint8_t> encoded;
  bool encodedOk = false;
  try {
    if (options.format == ImageFormat::Jpeg) {
      encodedOk = encodeJPEG(raster.bitmap, options.quality, encoded);
    } else {
      encoded = encodePNG(raster.bitmap);
      encodedOk = !encoded.empty();
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[CompositionExporter] encoder error: %s\n", e.what());
    encodedOk = false;
  }
  if (!encodedOk) {
    result.error = "Failed to generate image";
    reportFailure(onProgress, result.error);
    return result;
  }

  result.ok = true;
  result.encoded = std::move(encoded);
  result.width = raster.bitmap.width();
  result.height = raster.bitmap.height();
  report(onProgress, ExportStage::Complete, 100, "Export complete!");
  return result;
}

} // namespace cf
