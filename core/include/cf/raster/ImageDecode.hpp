#pragma once
#include "cf/raster/Bitmap.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cf {

// Decode an encoded image (PNG, JPEG, BMP, GIF first frame, TGA) to RGBA8.
// Returns false with a human-readable reason in `error` on failure.
bool decodeImage(const std::vector<std::uint8_t>& encoded, Bitmap& out, std::string& error);

} // namespace cf
