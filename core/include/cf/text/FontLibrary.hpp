#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cf {

// Rasterized glyph coverage. (offsetX, offsetY) is the top-left corner of
// the bitmap relative to the pen position on the baseline, y down, in pixels.
struct GlyphBitmap {
  int width{0}, height{0};
  int offsetX{0}, offsetY{0};
  std::vector<std::uint8_t> coverage; // width*height, 0..255
};

struct FontVMetrics {
  float ascent{0};  // above baseline, positive
  float descent{0}; // below baseline, negative
  float lineGap{0};
};

// One TrueType/OpenType face. Read-only after construction; safe to share
// across threads.
class FontFace {
  struct ConstructKey {};

public:
  // Use fromBytes; the key keeps construction inside the factory.
  explicit FontFace(ConstructKey);
  ~FontFace();
  FontFace(const FontFace&) = delete;
  FontFace& operator=(const FontFace&) = delete;

  // Returns nullptr if the bytes are not a usable font.
  static std::unique_ptr<FontFace> fromBytes(std::vector<std::uint8_t> data);

  // Pixel sizes are em sizes, as in CSS font-size.
  FontVMetrics verticalMetrics(float pixelSize) const;
  float advance(std::uint32_t codepoint, float pixelSize) const;
  float kerning(std::uint32_t left, std::uint32_t right, float pixelSize) const;
  GlyphBitmap rasterize(std::uint32_t codepoint, float pixelSize) const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

struct FontMatch {
  const FontFace* face{nullptr};
  bool syntheticBold{false};   // face is regular weight, embolden when drawing
  bool syntheticItalic{false}; // face is upright, slant when drawing
};

// Faces keyed by (family, bold, italic). Family names match
// case-insensitively.
class FontLibrary {
public:
  bool loadFont(const std::string& family, bool bold, bool italic,
                std::vector<std::uint8_t> data);
  bool loadFontFile(const std::string& family, bool bold, bool italic,
                    const std::string& path);

  // Family tried when none of a CSS family list is loaded.
  void setDefaultFamily(const std::string& family);
  const std::string& defaultFamily() const { return defaultFamily_; }

  // `familyList` is a CSS font-family list, e.g. "'Open Sans', Arial, sans-serif".
  // Falls back to the default family, then to the first loaded face.
  FontMatch match(const std::string& familyList, bool bold, bool italic) const;

  bool empty() const { return faces_.empty(); }
  std::size_t faceCount() const { return faces_.size(); }

private:
  struct Entry {
    std::string family; // lower-case
    bool bold;
    bool italic;
    std::unique_ptr<FontFace> face;
  };

  const Entry* find(const std::string& family, bool bold, bool italic) const;
  bool matchFamily(const std::string& family, bool bold, bool italic, FontMatch& out) const;

  std::vector<Entry> faces_;
  std::string defaultFamily_;
};

} // namespace cf
