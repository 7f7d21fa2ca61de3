#pragma once
#include "cf/raster/Bitmap.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace cf {

// C4.3: Encoders for export output.

enum class ImageFormat : std::uint8_t {
  Png = 1, // lossless, keeps alpha
  Jpeg = 2 // lossy, no alpha channel
};

// RGBA PNG (color type 6) via stb_image_write. Empty result for an empty
// bitmap or when encoding fails.
std::vector<std::uint8_t> encodePNG(const Bitmap& bmp);

// Baseline JPEG. quality is 0.0..1.0 (mapped to 1..100). Alpha is dropped,
// so callers should flatten onto an opaque background first.
bool encodeJPEG(const Bitmap& bmp, double quality, std::vector<std::uint8_t>& out);

bool writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes);

const char* imageFormatExtension(ImageFormat format); // "png" / "jpeg"
const char* imageFormatMimeType(ImageFormat format);  // "image/png" / "image/jpeg"

// "<title>_<yyyymmddThhmmss>.<ext>" with every non-alphanumeric title
// character replaced by '_' and "canvas_export" for an empty title. UTC.
std::string generateExportFilename(const std::string& title, ImageFormat format,
                                   std::time_t when);

} // namespace cf
