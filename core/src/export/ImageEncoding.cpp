#include "cf/export/ImageEncoding.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <utility>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO
#include <stb_image_write.h>

namespace cf {

namespace {

void appendToVector(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<std::uint8_t>*>(context);
  const auto* bytes = static_cast<const std::uint8_t*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// PNG
// ---------------------------------------------------------------------------

std::vector<std::uint8_t> encodePNG(const Bitmap& bmp) {
  std::vector<std::uint8_t> out;
  if (bmp.empty()) return out;

  const int stride = bmp.width() * 4;
  if (!stbi_write_png_to_func(appendToVector, &out, bmp.width(), bmp.height(),
                              4, bmp.data(), stride)) {
    std::fprintf(stderr, "[ImageEncoding] PNG encode failed for %dx%d bitmap\n",
                 bmp.width(), bmp.height());
    out.clear();
  }
  return out;
}

// ---------------------------------------------------------------------------
// JPEG
// ---------------------------------------------------------------------------

bool encodeJPEG(const Bitmap& bmp, double quality, std::vector<std::uint8_t>& out) {
  if (bmp.empty()) return false;

  std::vector<std::uint8_t> rgb;
  rgb.reserve(static_cast<std::size_t>(bmp.width()) * static_cast<std::size_t>(bmp.height()) * 3);
  const std::uint8_t* px = bmp.data();
  for (std::size_t i = 0; i + 3 < bmp.byteSize(); i += 4) {
    rgb.push_back(px[i + 0]);
    rgb.push_back(px[i + 1]);
    rgb.push_back(px[i + 2]);
  }

  if (!std::isfinite(quality)) quality = 0.9;
  int q = static_cast<int>(std::lround(std::clamp(quality, 0.0, 1.0) * 100.0));
  q = std::clamp(q, 1, 100);

  std::vector<std::uint8_t> encoded;
  if (!stbi_write_jpg_to_func(appendToVector, &encoded, bmp.width(), bmp.height(),
                              3, rgb.data(), q)) {
    return false;
  }
  out = std::move(encoded);
  return true;
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

bool writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;
  std::size_t written = bytes.empty() ? 0 : std::fwrite(bytes.data(), 1, bytes.size(), f);
  bool closed = std::fclose(f) == 0;
  return closed && written == bytes.size();
}

const char* imageFormatExtension(ImageFormat format) {
  return format == ImageFormat::Jpeg ? "jpeg" : "png";
}

const char* imageFormatMimeType(ImageFormat format) {
  return format == ImageFormat::Jpeg ? "image/jpeg" : "image/png";
}

std::string generateExportFilename(const std::string& title, ImageFormat format,
                                   std::time_t when) {
  std::string name;
  for (char c : title) {
    name.push_back(std::isalnum(static_cast<unsigned char>(c)) ? c : '_');
  }
  if (name.empty()) name = "canvas_export";

  char stamp[32] = {0};
  std::tm utc{};
  if (const std::tm* t = std::gmtime(&when)) utc = *t;
  std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &utc);

  return name + "_" + stamp + "." + imageFormatExtension(format);
}

} // namespace cf
