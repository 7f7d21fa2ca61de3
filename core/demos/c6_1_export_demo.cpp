// C6.1 — Export Demo
// Loads a composition ({"elements":[...]}) and an optional engine config,
// validates it, then renders it to PNG or JPEG.
//
// Usage: c6_1_export_demo --composition comp.json [--config cfg.json]
//          [--assets dir] [--out file] [--title name] [--format png|jpeg]
//          [--scale 2] [--quality 0.9] [--ip-kit id]

#include "cf/analysis/AssetUsage.hpp"
#include "cf/canvas/ElementJson.hpp"
#include "cf/export/AssetSource.hpp"
#include "cf/export/CompositionExporter.hpp"
#include "cf/export/ImageEncoding.hpp"
#include "cf/session/CanvasConfig.hpp"
#include "cf/text/FontLibrary.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <string>

static bool readTextFile(const std::string& path, std::string& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char* argv[]) {
  // Parse args
  std::string compositionPath, configPath, assetDir, outPath, title, ipKitId;
  cf::ExportOptions opts;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;
    if (arg == "--composition" && hasValue) {
      compositionPath = argv[++i];
    } else if (arg == "--config" && hasValue) {
      configPath = argv[++i];
    } else if (arg == "--assets" && hasValue) {
      assetDir = argv[++i];
    } else if (arg == "--out" && hasValue) {
      outPath = argv[++i];
    } else if (arg == "--title" && hasValue) {
      title = argv[++i];
    } else if (arg == "--ip-kit" && hasValue) {
      ipKitId = argv[++i];
    } else if (arg == "--format" && hasValue) {
      std::string fmt = argv[++i];
      if (fmt == "jpeg" || fmt == "jpg") {
        opts.format = cf::ImageFormat::Jpeg;
      } else if (fmt != "png") {
        std::fprintf(stderr, "Unknown format '%s'\n", fmt.c_str());
        return 2;
      }
    } else if (arg == "--scale" && hasValue) {
      opts.scale = std::atof(argv[++i]);
    } else if (arg == "--quality" && hasValue) {
      opts.quality = std::atof(argv[++i]);
    } else {
      std::fprintf(stderr, "Unknown argument '%s'\n", arg.c_str());
      return 2;
    }
  }
  if (compositionPath.empty()) {
    std::fprintf(stderr, "Usage: %s --composition comp.json [--config cfg.json] "
                         "[--assets dir] [--out file] [--format png|jpeg]\n", argv[0]);
    return 2;
  }

  // 1. Config
  cf::CanvasConfig config;
  if (!configPath.empty()) {
    std::string text;
    if (!readTextFile(configPath, text) || !cf::deserializeCanvasConfig(text, config)) {
      std::fprintf(stderr, "Failed to load config %s\n", configPath.c_str());
      return 1;
    }
  }
  if (assetDir.empty()) assetDir = config.assetRoot;
  if (assetDir.empty()) assetDir = ".";

  // 2. Composition
  std::string compText;
  cf::ElementList elements;
  if (!readTextFile(compositionPath, compText) || !cf::loadElementsJSON(compText, elements)) {
    std::fprintf(stderr, "Failed to load composition %s\n", compositionPath.c_str());
    return 1;
  }

  // 3. Validate
  cf::ValidationResult vr =
      cf::validateCanvasComposition(elements, ipKitId, cf::validationRulesFor(config));
  for (const auto& w : vr.warnings) std::printf("warning: %s\n", w.c_str());
  for (const auto& e : vr.errors) std::fprintf(stderr, "error: %s\n", e.c_str());
  if (!vr.valid) return 1;
  std::printf("%zu elements (%zu assets, %zu text), %zu distinct assets\n",
              vr.summary.totalElements, vr.summary.assetElements,
              vr.summary.textElements, vr.summary.usedAssetIds.size());

  // 4. Fonts
  cf::FontLibrary fonts;
  if (!cf::loadFonts(config, fonts)) {
    std::printf("Some fonts failed to load\n");
  }

  // 5. Export
  cf::DirectoryAssetCatalog catalog(assetDir);
  cf::CompositionExporter exporter(catalog, &fonts);
  cf::ExportResult result = exporter.exportImage(
      elements, config.canvasSize, opts, [](const cf::ExportProgress& p) {
        std::printf("[%3.0f%%] %s: %s\n", p.progress, cf::exportStageName(p.stage),
                    p.message.c_str());
      });
  if (!result.ok) {
    std::fprintf(stderr, "Export failed: %s\n", result.error.c_str());
    return 1;
  }

  if (outPath.empty()) {
    outPath = cf::generateExportFilename(title, opts.format, std::time(nullptr));
  }
  if (!cf::writeFile(outPath, result.encoded)) {
    std::fprintf(stderr, "Failed to write %s\n", outPath.c_str());
    return 1;
  }
  std::printf("Wrote %s (%dx%d, %zu bytes)\n", outPath.c_str(),
              result.width, result.height, result.encoded.size());
  return 0;
}
