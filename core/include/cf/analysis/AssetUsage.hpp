#pragma once
#include "cf/canvas/Element.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cf {

// C3.1: Read-only asset usage aggregates and pre-submission validation.

inline constexpr double kDefaultMinVisibleExtent = 10.0;

struct AssetTransform {
  double x{0}, y{0};
  double width{0}, height{0};
  double rotation{0};
  double opacity{1.0};
};

struct AssetUsageInfo {
  AssetId assetId;
  std::size_t count{0};
  std::vector<AssetTransform> transformations; // one per referencing element
};

struct CanvasAssetSummary {
  std::vector<AssetId> usedAssetIds;
  std::vector<AssetUsageInfo> assetUsageInfo;
  std::optional<std::string> ipKitId; // catalog the assets were drawn from
  std::size_t totalElements{0};
  std::size_t assetElements{0};
  std::size_t textElements{0};
};

struct ValidationRules {
  CanvasSize bounds{kDefaultCanvasWidth, kDefaultCanvasHeight};
  double minVisibleExtent{kDefaultMinVisibleExtent};
};

struct ValidationResult {
  bool valid{false};
  std::vector<std::string> errors;   // block submission
  std::vector<std::string> warnings; // informational
  CanvasAssetSummary summary;
};

struct SubmissionMetadata {
  ElementList elements;
  CanvasSize canvasSize;
  std::string version{kCanvasFormatVersion};
  CanvasAssetSummary summary;
};

// Distinct asset ids in first-seen order. Asset elements with an empty
// assetId are ignored.
std::vector<AssetId> usedAssetIds(const ElementList& elements);

// One entry per distinct asset id, in first-seen order.
std::vector<AssetUsageInfo> assetUsageInfo(const ElementList& elements);

CanvasAssetSummary canvasAssetSummary(const ElementList& elements,
                                      std::optional<std::string> ipKitId = std::nullopt);

// Rules, in order:
//   1. no elements          -> error (nothing else is checked)
//   2. empty/blank text     -> warning
//   3. width/height < min   -> warning
//   4. outside the bounds   -> warning
ValidationResult validateCanvasComposition(const ElementList& elements,
                                           const std::string& ipKitId,
                                           const ValidationRules& rules = {});

SubmissionMetadata generateSubmissionMetadata(const ElementList& elements,
                                              const std::string& ipKitId,
                                              CanvasSize canvasSize = {},
                                              const std::string& version = kCanvasFormatVersion);

// {"canvasData":{"elements":[...],"canvasSize":{...},"version":"1.0"},
//  "assetMetadata":{"usedAssetIds":[...],"assetUsageInfo":[...],
//                   "ipKitId":"...","elementCounts":{"total","assets","text"}}}
std::string serializeSubmissionMetadata(const SubmissionMetadata& meta);

// Loads canvasData back into the element model. The asset metadata is
// derived data and is recomputed rather than read. Returns false on error.
bool parseSubmissionMetadata(const std::string& json, SubmissionMetadata& out);

} // namespace cf
