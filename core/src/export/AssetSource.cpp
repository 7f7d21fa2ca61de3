#include "cf/export/AssetSource.hpp"

#include <cstdio>
#include <fstream>
#include <utility>

namespace cf {

// ---------------------------------------------------------------------------
// MemoryAssetCatalog
// ---------------------------------------------------------------------------

void MemoryAssetCatalog::put(const AssetId& assetId, std::vector<std::uint8_t> bytes) {
  std::lock_guard<std::mutex> lock(mtx_);
  assets_[assetId] = std::move(bytes);
}

void MemoryAssetCatalog::remove(const AssetId& assetId) {
  std::lock_guard<std::mutex> lock(mtx_);
  assets_.erase(assetId);
}

bool MemoryAssetCatalog::contains(const AssetId& assetId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return assets_.count(assetId) != 0;
}

std::size_t MemoryAssetCatalog::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return assets_.size();
}

AssetFetch MemoryAssetCatalog::fetch(const AssetId& assetId) {
  AssetFetch r;
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = assets_.find(assetId);
  if (it == assets_.end()) {
    r.error = "Asset not found: " + assetId;
    return r;
  }
  r.ok = true;
  r.bytes = it->second;
  return r;
}

// ---------------------------------------------------------------------------
// DirectoryAssetCatalog
// ---------------------------------------------------------------------------

namespace {

bool readWholeFile(const std::string& path, std::vector<std::uint8_t>& out) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) return false;
  auto sz = f.tellg();
  if (sz < 0) return false;
  std::vector<std::uint8_t> data(static_cast<std::size_t>(sz));
  f.seekg(0);
  if (sz > 0 && !f.read(reinterpret_cast<char*>(data.data()), sz)) return false;
  out = std::move(data);
  return true;
}

} // anonymous namespace

DirectoryAssetCatalog::DirectoryAssetCatalog(std::string root)
  : root_(std::move(root)) {
  if (!root_.empty() && root_.back() != '/') root_.push_back('/');
}

AssetFetch DirectoryAssetCatalog::fetch(const AssetId& assetId) {
  AssetFetch r;
  if (assetId.empty() || assetId.find('/') != std::string::npos ||
      assetId.find('\\') != std::string::npos ||
      assetId.find("..") != std::string::npos) {
    r.error = "Invalid asset id: " + assetId;
    return r;
  }

  static const char* const kSuffixes[] = {"", ".png", ".jpg", ".jpeg"};
  for (const char* suffix : kSuffixes) {
    std::string path = root_ + assetId + suffix;
    if (readWholeFile(path, r.bytes)) {
      r.ok = true;
      return r;
    }
  }

  std::fprintf(stderr, "[DirectoryAssetCatalog] no file for asset %s under %s\n",
               assetId.c_str(), root_.c_str());
  r.error = "Asset not found: " + assetId;
  return r;
}

} // namespace cf
