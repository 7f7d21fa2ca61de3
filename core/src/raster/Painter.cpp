#include "cf/raster/Painter.hpp"

#include <algorithm>
#include <cmath>

namespace cf {

namespace {

// Calls fn(px, py, sx, sy) for each destination pixel whose center maps
// inside the local rect (0,0)-(w,h); (sx, sy) is the local position.
template <typename Fn>
void scanTransformed(const Bitmap& dst, double w, double h,
                     const Affine2D& toDst, Fn&& fn) {
  if (dst.empty() || !(w > 0) || !(h > 0)) return;

  Affine2D inv;
  if (!toDst.invert(inv)) return;

  double xs[4], ys[4];
  toDst.apply(0, 0, xs[0], ys[0]);
  toDst.apply(w, 0, xs[1], ys[1]);
  toDst.apply(0, h, xs[2], ys[2]);
  toDst.apply(w, h, xs[3], ys[3]);

  for (int i = 0; i < 4; i++) {
    if (std::isnan(xs[i]) || std::isnan(ys[i])) return;
  }

  double minX = *std::min_element(xs, xs + 4);
  double maxX = *std::max_element(xs, xs + 4);
  double minY = *std::min_element(ys, ys + 4);
  double maxY = *std::max_element(ys, ys + 4);

  // Clip in double; geometry far outside the canvas does not fit an int.
  const double dw = dst.width(), dh = dst.height();
  int x0 = static_cast<int>(std::floor(std::clamp(minX, 0.0, dw)));
  int y0 = static_cast<int>(std::floor(std::clamp(minY, 0.0, dh)));
  int x1 = static_cast<int>(std::ceil(std::clamp(maxX, 0.0, dw)));
  int y1 = static_cast<int>(std::ceil(std::clamp(maxY, 0.0, dh)));

  for (int py = y0; py < y1; py++) {
    for (int px = x0; px < x1; px++) {
      double sx, sy;
      inv.apply(px + 0.5, py + 0.5, sx, sy);
      if (sx < 0.0 || sy < 0.0 || sx >= w || sy >= h) continue;
      fn(px, py, sx, sy);
    }
  }
}

// Bilinear lookup at texel-center coordinates, clamped to the edges.
struct BilinearTap {
  int x0, y0, x1, y1;
  float fx, fy;
};

BilinearTap bilinearTap(double sx, double sy, int w, int h) {
  double u = sx - 0.5, v = sy - 0.5;
  double fu = std::floor(u), fv = std::floor(v);
  BilinearTap t;
  t.fx = static_cast<float>(u - fu);
  t.fy = static_cast<float>(v - fv);
  int iu = static_cast<int>(fu), iv = static_cast<int>(fv);
  t.x0 = std::clamp(iu, 0, w - 1);
  t.x1 = std::clamp(iu + 1, 0, w - 1);
  t.y0 = std::clamp(iv, 0, h - 1);
  t.y1 = std::clamp(iv + 1, 0, h - 1);
  return t;
}

Rgba8 sampleBitmap(const Bitmap& src, double sx, double sy) {
  BilinearTap t = bilinearTap(sx, sy, src.width(), src.height());
  Rgba8 p[4] = {src.pixel(t.x0, t.y0), src.pixel(t.x1, t.y0),
                src.pixel(t.x0, t.y1), src.pixel(t.x1, t.y1)};
  float wts[4] = {(1 - t.fx) * (1 - t.fy), t.fx * (1 - t.fy),
                  (1 - t.fx) * t.fy, t.fx * t.fy};

  // Interpolate premultiplied so transparent texels do not darken edges.
  float r = 0, g = 0, b = 0, a = 0;
  for (int i = 0; i < 4; i++) {
    float pa = static_cast<float>(p[i].a) * wts[i];
    r += static_cast<float>(p[i].r) * pa;
    g += static_cast<float>(p[i].g) * pa;
    b += static_cast<float>(p[i].b) * pa;
    a += pa;
  }
  if (a <= 0.0f) return kTransparent;

  auto to8 = [](float v) {
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
  };
  return {to8(r / a), to8(g / a), to8(b / a), to8(a)};
}

float sampleMask(const std::uint8_t* mask, int w, int h, double sx, double sy) {
  BilinearTap t = bilinearTap(sx, sy, w, h);
  auto at = [&](int x, int y) {
    return static_cast<float>(mask[static_cast<std::size_t>(y) * static_cast<std::size_t>(w) +
                                   static_cast<std::size_t>(x)]);
  };
  float top = at(t.x0, t.y0) * (1 - t.fx) + at(t.x1, t.y0) * t.fx;
  float bot = at(t.x0, t.y1) * (1 - t.fx) + at(t.x1, t.y1) * t.fx;
  return (top * (1 - t.fy) + bot * t.fy) / 255.0f;
}

} // anonymous namespace

void drawBitmap(Bitmap& dst, const Bitmap& src, const Affine2D& toDst, float opacity) {
  if (src.empty() || opacity <= 0.0f) return;
  scanTransformed(dst, src.width(), src.height(), toDst,
                  [&](int px, int py, double sx, double sy) {
                    dst.blendPixel(px, py, sampleBitmap(src, sx, sy), opacity);
                  });
}

void drawMask(Bitmap& dst, const std::uint8_t* mask, int maskW, int maskH,
              const Affine2D& toDst, Rgba8 color, float opacity) {
  if (!mask || maskW <= 0 || maskH <= 0 || opacity <= 0.0f) return;
  scanTransformed(dst, maskW, maskH, toDst,
                  [&](int px, int py, double sx, double sy) {
                    float cov = sampleMask(mask, maskW, maskH, sx, sy);
                    if (cov > 0.0f) dst.blendPixel(px, py, color, cov * opacity);
                  });
}

void fillRect(Bitmap& dst, double w, double h, const Affine2D& toDst,
              Rgba8 color, float opacity) {
  if (opacity <= 0.0f || color.a == 0) return;
  scanTransformed(dst, w, h, toDst,
                  [&](int px, int py, double, double) {
                    dst.blendPixel(px, py, color, opacity);
                  });
}

} // namespace cf
