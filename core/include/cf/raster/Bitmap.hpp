#pragma once
#include "cf/raster/Color.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cf {

// Top-down RGBA8 pixel buffer, straight alpha, rows tightly packed.
class Bitmap {
public:
  Bitmap() = default;
  Bitmap(int width, int height, Rgba8 fill = kTransparent);

  int width() const { return width_; }
  int height() const { return height_; }
  bool empty() const { return width_ <= 0 || height_ <= 0; }

  const std::uint8_t* data() const { return pixels_.data(); }
  std::uint8_t* data() { return pixels_.data(); }
  std::size_t byteSize() const { return pixels_.size(); }

  // Out-of-range reads return transparent; out-of-range writes are ignored.
  Rgba8 pixel(int x, int y) const;
  void setPixel(int x, int y, Rgba8 c);

  void fill(Rgba8 c);

  // Source-over composite of `c` with its alpha scaled by `coverage` (0..1).
  void blendPixel(int x, int y, Rgba8 c, float coverage);

  // Copy of an existing RGBA8 buffer (width*height*4 bytes).
  static Bitmap fromRgba(const std::uint8_t* rgba, int width, int height);

private:
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> pixels_;
};

} // namespace cf
