#include "cf/text/TextLayout.hpp"

#include <utility>

namespace cf {

std::vector<std::uint32_t> decodeUtf8(const std::string& text) {
  constexpr std::uint32_t kReplacement = 0xFFFD;
  std::vector<std::uint32_t> out;
  out.reserve(text.size());

  std::size_t i = 0;
  const std::size_t n = text.size();
  while (i < n) {
    auto c = static_cast<unsigned char>(text[i]);
    std::uint32_t cp = 0;
    int extra = 0;
    if (c < 0x80) { cp = c; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
    else { out.push_back(kReplacement); i++; continue; }

    bool ok = true;
    for (int k = 1; k <= extra; k++) {
      if (i + static_cast<std::size_t>(k) >= n) { ok = false; break; }
      auto cc = static_cast<unsigned char>(text[i + static_cast<std::size_t>(k)]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) {
      out.push_back(kReplacement);
      i++;
      continue;
    }
    out.push_back(cp > 0x10FFFF ? kReplacement : cp);
    i += static_cast<std::size_t>(extra) + 1;
  }
  return out;
}

TextLine layoutLine(const FontFace& face, const std::string& utf8, float pixelSize) {
  TextLine line;
  line.metrics = face.verticalMetrics(pixelSize);

  float pen = 0;
  std::uint32_t prev = 0;
  for (std::uint32_t cp : decodeUtf8(utf8)) {
    if (cp == '\n' || cp == '\r' || cp == '\t' || cp == '\f') cp = ' ';
    if (prev) pen += face.kerning(prev, cp, pixelSize);

    PlacedGlyph g;
    g.penX = pen;
    g.bitmap = face.rasterize(cp, pixelSize);
    line.glyphs.push_back(std::move(g));

    pen += face.advance(cp, pixelSize);
    prev = cp;
  }
  line.width = pen;
  return line;
}

} // namespace cf
