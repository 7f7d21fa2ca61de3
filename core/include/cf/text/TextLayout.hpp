#pragma once
#include "cf/text/FontLibrary.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cf {

struct PlacedGlyph {
  float penX{0};       // pen position along the baseline, pixels from line start
  GlyphBitmap bitmap;  // empty for whitespace
};

struct TextLine {
  std::vector<PlacedGlyph> glyphs;
  float width{0}; // total advance
  FontVMetrics metrics;
};

// Decode UTF-8; malformed sequences become U+FFFD.
std::vector<std::uint32_t> decodeUtf8(const std::string& text);

// Single-line layout with kerning. Line breaks and tabs are laid out as spaces.
TextLine layoutLine(const FontFace& face, const std::string& utf8, float pixelSize);

} // namespace cf
