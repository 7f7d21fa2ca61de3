// C4.3 — PNG/JPEG encoding, decoding, export file naming

#include "cf/export/ImageEncoding.hpp"
#include "cf/raster/ImageDecode.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static std::uint32_t readBE32(const std::vector<std::uint8_t>& b, std::size_t at) {
  return (static_cast<std::uint32_t>(b[at]) << 24) | (static_cast<std::uint32_t>(b[at + 1]) << 16) |
         (static_cast<std::uint32_t>(b[at + 2]) << 8) | static_cast<std::uint32_t>(b[at + 3]);
}

static cf::Bitmap gradient(int w, int h) {
  cf::Bitmap bmp(w, h);
  for (int y = 0; y < h; y++)
    for (int x = 0; x < w; x++)
      bmp.setPixel(x, y, cf::Rgba8{static_cast<std::uint8_t>(x * 255 / (w - 1)),
                                   static_cast<std::uint8_t>(y * 255 / (h - 1)),
                                   100,
                                   static_cast<std::uint8_t>(x % 2 ? 255 : 64)});
  return bmp;
}

int main() {
  // ---- Test 1: PNG structure ----
  {
    cf::Bitmap bmp = gradient(16, 8);
    std::vector<std::uint8_t> png = cf::encodePNG(bmp);
    requireTrue(png.size() > 8 + 25 + 12, "non-trivial size");
    const std::uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    for (int i = 0; i < 8; i++) requireTrue(png[static_cast<std::size_t>(i)] == sig[i], "signature");
    requireTrue(readBE32(png, 8) == 13, "IHDR length");
    requireTrue(std::string(png.begin() + 12, png.begin() + 16) == "IHDR", "IHDR first");
    requireTrue(readBE32(png, 16) == 16 && readBE32(png, 20) == 8, "dimensions");
    requireTrue(png[24] == 8, "8-bit");
    requireTrue(png[25] == 6, "RGBA color type");
    requireTrue(std::string(png.end() - 8, png.end() - 4) == "IEND", "IEND last");

    requireTrue(cf::encodePNG(cf::Bitmap()).empty(), "empty bitmap -> no output");
    std::printf("  Test 1 (PNG structure): PASS\n");
  }

  // ---- Test 2: PNG decodes back losslessly, alpha included ----
  {
    cf::Bitmap bmp = gradient(16, 8);
    cf::Bitmap back;
    std::string err;
    requireTrue(cf::decodeImage(cf::encodePNG(bmp), back, err), "decode own PNG");
    requireTrue(back.width() == 16 && back.height() == 8, "decoded size");
    bool same = true;
    for (int y = 0; y < 8; y++)
      for (int x = 0; x < 16; x++) same = same && back.pixel(x, y) == bmp.pixel(x, y);
    requireTrue(same, "pixels identical");
    std::printf("  Test 2 (PNG lossless): PASS\n");
  }

  // ---- Test 3: large image survives encoding ----
  {
    cf::Bitmap bmp(300, 100, cf::Rgba8{10, 20, 30, 255});
    cf::Bitmap back;
    std::string err;
    requireTrue(cf::decodeImage(cf::encodePNG(bmp), back, err), "decode large PNG");
    requireTrue(back.pixel(299, 99) == bmp.pixel(299, 99), "last pixel intact");
    std::printf("  Test 3 (large PNG): PASS\n");
  }

  // ---- Test 4: JPEG ----
  {
    cf::Bitmap bmp(32, 32, cf::Rgba8{200, 40, 40, 255});
    std::vector<std::uint8_t> jpg;
    requireTrue(cf::encodeJPEG(bmp, 0.9, jpg), "encode JPEG");
    requireTrue(jpg.size() > 4 && jpg[0] == 0xFF && jpg[1] == 0xD8, "SOI marker");
    requireTrue(jpg[jpg.size() - 2] == 0xFF && jpg[jpg.size() - 1] == 0xD9, "EOI marker");

    cf::Bitmap back;
    std::string err;
    requireTrue(cf::decodeImage(jpg, back, err), "decode JPEG");
    cf::Rgba8 p = back.pixel(16, 16);
    requireTrue(p.a == 255, "JPEG decodes opaque");
    requireTrue(p.r > 170 && p.g < 80 && p.b < 80, "color approximately kept");

    std::vector<std::uint8_t> low, high;
    requireTrue(cf::encodeJPEG(gradient(64, 64), 0.1, low), "low quality");
    requireTrue(cf::encodeJPEG(gradient(64, 64), 1.0, high), "high quality");
    requireTrue(low.size() < high.size(), "quality controls size");

    std::vector<std::uint8_t> untouched{1, 2, 3};
    requireTrue(!cf::encodeJPEG(cf::Bitmap(), 0.9, untouched), "empty bitmap fails");
    requireTrue(untouched.size() == 3, "output untouched on failure");
    std::printf("  Test 4 (JPEG): PASS\n");
  }

  // ---- Test 5: decode failures ----
  {
    cf::Bitmap out;
    std::string err;
    requireTrue(!cf::decodeImage({}, out, err), "empty input");
    requireTrue(!err.empty(), "reason given");
    err.clear();
    requireTrue(!cf::decodeImage({'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'}, out, err),
                "garbage input");
    requireTrue(!err.empty(), "reason given for garbage");
    std::printf("  Test 5 (decode failures): PASS\n");
  }

  // ---- Test 6: file naming and writing ----
  {
    requireTrue(cf::generateExportFilename("My Poster!", cf::ImageFormat::Png, 0) ==
                    "My_Poster__19700101T000000.png",
                "sanitized title + UTC stamp");
    requireTrue(cf::generateExportFilename("", cf::ImageFormat::Jpeg, 86400 + 3661) ==
                    "canvas_export_19700102T010101.jpeg",
                "default title, jpeg extension");
    requireTrue(std::string(cf::imageFormatMimeType(cf::ImageFormat::Jpeg)) == "image/jpeg",
                "mime type");

    std::string path = "c4_3_test_output.png";
    std::vector<std::uint8_t> png = cf::encodePNG(gradient(4, 4));
    requireTrue(cf::writeFile(path, png), "write file");
    FILE* f = std::fopen(path.c_str(), "rb");
    requireTrue(f != nullptr, "file exists");
    std::fseek(f, 0, SEEK_END);
    long size = std::ftell(f);
    std::fclose(f);
    requireTrue(size == static_cast<long>(png.size()), "file size matches");
    std::remove(path.c_str());

    requireTrue(!cf::writeFile("/nonexistent-dir/x.png", png), "unwritable path fails");
    std::printf("  Test 6 (naming + writing): PASS\n");
  }

  std::printf("C4.3 image_encoding: ALL PASS\n");
  return 0;
}
