#pragma once
#include "cf/math/Affine2D.hpp"
#include "cf/raster/Bitmap.hpp"
#include "cf/raster/Color.hpp"

#include <cstdint>

namespace cf {

// C4.2: Transformed painting onto a Bitmap.
//
// Each call maps a local rectangle (0,0)-(w,h) into destination pixel space
// through `toDst` and paints every destination pixel whose center falls
// inside it (inverse mapping, no edge anti-aliasing). Singular transforms
// paint nothing.

// Paint `src`; local units are source pixels. Bilinear, clamp-to-edge.
void drawBitmap(Bitmap& dst, const Bitmap& src, const Affine2D& toDst, float opacity);

// Paint an 8-bit coverage mask (maskW*maskH bytes) in `color`.
void drawMask(Bitmap& dst, const std::uint8_t* mask, int maskW, int maskH,
              const Affine2D& toDst, Rgba8 color, float opacity);

// Fill the local rectangle (0,0)-(w,h) with `color`.
void fillRect(Bitmap& dst, double w, double h, const Affine2D& toDst,
              Rgba8 color, float opacity);

} // namespace cf
