#include "cf/raster/Bitmap.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace cf {

Bitmap::Bitmap(int width, int height, Rgba8 fill)
  : width_(std::max(width, 0)), height_(std::max(height, 0)) {
  pixels_.resize(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 4);
  this->fill(fill);
}

Rgba8 Bitmap::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return kTransparent;
  std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                     static_cast<std::size_t>(x)) * 4;
  return {pixels_[idx], pixels_[idx + 1], pixels_[idx + 2], pixels_[idx + 3]};
}

void Bitmap::setPixel(int x, int y, Rgba8 c) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                     static_cast<std::size_t>(x)) * 4;
  pixels_[idx + 0] = c.r;
  pixels_[idx + 1] = c.g;
  pixels_[idx + 2] = c.b;
  pixels_[idx + 3] = c.a;
}

void Bitmap::fill(Rgba8 c) {
  for (std::size_t i = 0; i + 3 < pixels_.size(); i += 4) {
    pixels_[i + 0] = c.r;
    pixels_[i + 1] = c.g;
    pixels_[i + 2] = c.b;
    pixels_[i + 3] = c.a;
  }
}

void Bitmap::blendPixel(int x, int y, Rgba8 c, float coverage) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;

  float sa = (static_cast<float>(c.a) / 255.0f) * std::clamp(coverage, 0.0f, 1.0f);
  if (sa <= 0.0f) return;

  std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                     static_cast<std::size_t>(x)) * 4;
  std::uint8_t* p = &pixels_[idx];

  float da = static_cast<float>(p[3]) / 255.0f;
  float outA = sa + da * (1.0f - sa);
  if (outA <= 0.0f) return;

  auto mix = [&](std::uint8_t src, std::uint8_t dst) {
    float v = (static_cast<float>(src) * sa +
               static_cast<float>(dst) * da * (1.0f - sa)) / outA;
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
  };

  p[0] = mix(c.r, p[0]);
  p[1] = mix(c.g, p[1]);
  p[2] = mix(c.b, p[2]);
  p[3] = static_cast<std::uint8_t>(std::lround(outA * 255.0f));
}

Bitmap Bitmap::fromRgba(const std::uint8_t* rgba, int width, int height) {
  Bitmap bmp(width, height);
  if (rgba && !bmp.pixels_.empty())
    std::memcpy(bmp.pixels_.data(), rgba, bmp.pixels_.size());
  return bmp;
}

} // namespace cf
