// C4.2 — Painter: transformed bitmaps, masks and fills

#include "cf/raster/Painter.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static const cf::Rgba8 kRed{255, 0, 0, 255};
static const cf::Rgba8 kBlue{0, 0, 255, 255};

// 4x4, left half red, right half blue.
static cf::Bitmap splitImage() {
  cf::Bitmap img(4, 4);
  for (int y = 0; y < 4; y++)
    for (int x = 0; x < 4; x++) img.setPixel(x, y, x < 2 ? kRed : kBlue);
  return img;
}

static cf::Affine2D aroundCenter(double degrees) {
  return cf::Affine2D::translate(2, 2) *
         cf::Affine2D::rotate(cf::degreesToRadians(degrees)) *
         cf::Affine2D::translate(-2, -2);
}

int main() {
  // ---- Test 1: identity copy ----
  {
    cf::Bitmap dst(4, 4);
    cf::drawBitmap(dst, splitImage(), cf::Affine2D{}, 1.0f);
    requireTrue(dst.pixel(0, 0) == kRed, "left red");
    requireTrue(dst.pixel(3, 3) == kBlue, "right blue");
    std::printf("  Test 1 (identity): PASS\n");
  }

  // ---- Test 2: 180 degree rotation swaps the halves ----
  {
    cf::Bitmap dst(4, 4);
    cf::drawBitmap(dst, splitImage(), aroundCenter(180), 1.0f);
    requireTrue(dst.pixel(0, 0) == kBlue, "left now blue");
    requireTrue(dst.pixel(0, 3) == kBlue, "left bottom blue");
    requireTrue(dst.pixel(3, 0) == kRed, "right now red");
    std::printf("  Test 2 (rotate 180): PASS\n");
  }

  // ---- Test 3: 90 degrees turns clockwise ----
  {
    cf::Bitmap dst(4, 4);
    cf::drawBitmap(dst, splitImage(), aroundCenter(90), 1.0f);
    requireTrue(dst.pixel(0, 0) == kRed && dst.pixel(3, 0) == kRed, "top row red");
    requireTrue(dst.pixel(0, 3) == kBlue && dst.pixel(3, 3) == kBlue, "bottom row blue");
    std::printf("  Test 3 (rotate 90 clockwise): PASS\n");
  }

  // ---- Test 4: scaling and placement ----
  {
    cf::Bitmap dst(8, 8);
    cf::Affine2D m = cf::Affine2D::translate(4, 4) * cf::Affine2D::scale(0.5, 0.5);
    cf::drawBitmap(dst, splitImage(), m, 1.0f);
    requireTrue(dst.pixel(3, 3) == cf::kTransparent, "outside untouched");
    requireTrue(dst.pixel(4, 4).a == 255, "inside painted");
    requireTrue(dst.pixel(4, 5).r == 255 && dst.pixel(4, 5).b == 0, "left part red");
    requireTrue(dst.pixel(5, 5).b == 255 && dst.pixel(5, 5).r == 0, "right part blue");
    requireTrue(dst.pixel(6, 6) == cf::kTransparent, "past the far edge untouched");
    std::printf("  Test 4 (scale + translate): PASS\n");
  }

  // ---- Test 5: opacity ----
  {
    cf::Bitmap dst(4, 4, cf::kWhite);
    cf::drawBitmap(dst, splitImage(), cf::Affine2D{}, 0.5f);
    cf::Rgba8 p = dst.pixel(0, 0);
    requireTrue(p.r == 255 && p.g == 128 && p.b == 128 && p.a == 255, "half red over white");

    cf::Bitmap none(4, 4, cf::kWhite);
    cf::drawBitmap(none, splitImage(), cf::Affine2D{}, 0.0f);
    requireTrue(none.pixel(0, 0) == cf::kWhite, "zero opacity draws nothing");
    std::printf("  Test 5 (opacity): PASS\n");
  }

  // ---- Test 6: fillRect and drawMask ----
  {
    cf::Bitmap dst(4, 4);
    cf::fillRect(dst, 2, 2, cf::Affine2D::translate(1, 1), kRed, 1.0f);
    requireTrue(dst.pixel(1, 1) == kRed && dst.pixel(2, 2) == kRed, "rect filled");
    requireTrue(dst.pixel(0, 0) == cf::kTransparent && dst.pixel(3, 3) == cf::kTransparent,
                "outside rect untouched");

    std::vector<std::uint8_t> mask{255, 0, 255, 0};
    cf::Bitmap m(2, 2);
    cf::drawMask(m, mask.data(), 2, 2, cf::Affine2D{}, kBlue, 1.0f);
    requireTrue(m.pixel(0, 0) == kBlue && m.pixel(0, 1) == kBlue, "covered column painted");
    requireTrue(m.pixel(1, 0) == cf::kTransparent, "uncovered column untouched");
    std::printf("  Test 6 (fill + mask): PASS\n");
  }

  // ---- Test 7: singular transform paints nothing ----
  {
    cf::Bitmap dst(4, 4);
    cf::drawBitmap(dst, splitImage(), cf::Affine2D::scale(0, 1), 1.0f);
    cf::fillRect(dst, 4, 4, cf::Affine2D::scale(1, 0), kRed, 1.0f);
    bool untouched = true;
    for (int y = 0; y < 4; y++)
      for (int x = 0; x < 4; x++) untouched = untouched && dst.pixel(x, y) == cf::kTransparent;
    requireTrue(untouched, "nothing painted");
    std::printf("  Test 7 (singular): PASS\n");
  }

  // ---- Test 8: huge covering rect is clipped, not dropped ----
  {
    cf::Bitmap dst(10, 10);
    cf::fillRect(dst, 6e9 + 10, 20, cf::Affine2D::translate(-3e9, -5), kRed, 1.0f);
    requireTrue(dst.pixel(0, 0) == kRed, "top-left covered");
    requireTrue(dst.pixel(5, 5) == kRed, "center covered");
    requireTrue(dst.pixel(9, 9) == kRed, "bottom-right covered");

    cf::Bitmap far(10, 10);
    cf::fillRect(far, 10, 10, cf::Affine2D::translate(5e9, -4e9), kRed, 1.0f);
    requireTrue(far.pixel(5, 5) == cf::kTransparent, "far off-canvas rect paints nothing");
    std::printf("  Test 8 (huge geometry): PASS\n");
  }

  std::printf("C4.2 painter: ALL PASS\n");
  return 0;
}
