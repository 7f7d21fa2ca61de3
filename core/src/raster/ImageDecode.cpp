#include "cf/raster/ImageDecode.hpp"

#include <limits>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#define STBI_ONLY_TGA
#include <stb_image.h>

namespace cf {

bool decodeImage(const std::vector<std::uint8_t>& encoded, Bitmap& out, std::string& error) {
  if (encoded.empty()) {
    error = "empty image data";
    return false;
  }
  if (encoded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    error = "image data too large";
    return false;
  }

  int width = 0, height = 0, components = 0;
  unsigned char* decoded = stbi_load_from_memory(
      encoded.data(), static_cast<int>(encoded.size()),
      &width, &height, &components, 4);
  if (!decoded) {
    const char* reason = stbi_failure_reason();
    error = std::string("image decode failed: ") + (reason ? reason : "unknown");
    return false;
  }
  std::unique_ptr<unsigned char, void (*)(void*)> pixels(decoded, stbi_image_free);

  if (width <= 0 || height <= 0) {
    error = "image has no pixels";
    return false;
  }

  out = Bitmap::fromRgba(pixels.get(), width, height);
  return true;
}

} // namespace cf
