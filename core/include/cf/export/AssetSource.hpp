#pragma once
#include "cf/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cf {

struct AssetFetch {
  bool ok{false};
  std::vector<std::uint8_t> bytes; // encoded image (PNG, JPEG, ...)
  std::string error;               // set when !ok
};

// Resolves an asset reference to encoded image bytes. May block (disk,
// network). Implementations must tolerate concurrent fetch() calls: the
// exporter prefetches assets in parallel.
class AssetSource {
public:
  virtual ~AssetSource() = default;
  virtual AssetFetch fetch(const AssetId& assetId) = 0;
};

// In-memory catalog, e.g. assets already downloaded by the caller.
class MemoryAssetCatalog : public AssetSource {
public:
  void put(const AssetId& assetId, std::vector<std::uint8_t> bytes);
  void remove(const AssetId& assetId);
  bool contains(const AssetId& assetId) const;
  std::size_t size() const;

  AssetFetch fetch(const AssetId& assetId) override;

private:
  mutable std::mutex mtx_;
  std::unordered_map<AssetId, std::vector<std::uint8_t>> assets_;
};

// Assets stored as files under a root directory: "<root>/<assetId>", or the
// same with a .png/.jpg/.jpeg extension. Ids containing path separators or
// ".." are rejected.
class DirectoryAssetCatalog : public AssetSource {
public:
  explicit DirectoryAssetCatalog(std::string root);

  const std::string& root() const { return root_; }

  AssetFetch fetch(const AssetId& assetId) override;

private:
  std::string root_;
};

} // namespace cf
