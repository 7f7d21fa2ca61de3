#include "cf/text/FontLibrary.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <utility>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace cf {

// ---------------------------------------------------------------------------
// FontFace
// ---------------------------------------------------------------------------

struct FontFace::Impl {
  std::vector<std::uint8_t> data; // stbtt_fontinfo points into this
  stbtt_fontinfo info{};
};

FontFace::FontFace(ConstructKey) : impl_(std::make_unique<Impl>()) {}
FontFace::~FontFace() = default;

std::unique_ptr<FontFace> FontFace::fromBytes(std::vector<std::uint8_t> data) {
  if (data.empty()) return nullptr;

  auto face = std::make_unique<FontFace>(ConstructKey{});
  face->impl_->data = std::move(data);
  const unsigned char* bytes = face->impl_->data.data();

  int offset = stbtt_GetFontOffsetForIndex(bytes, 0);
  if (offset < 0 || !stbtt_InitFont(&face->impl_->info, bytes, offset)) {
    std::fprintf(stderr, "[FontLibrary] stbtt_InitFont failed\n");
    return nullptr;
  }
  return face;
}

FontVMetrics FontFace::verticalMetrics(float pixelSize) const {
  int ascent = 0, descent = 0, lineGap = 0;
  stbtt_GetFontVMetrics(&impl_->info, &ascent, &descent, &lineGap);
  float scale = stbtt_ScaleForMappingEmToPixels(&impl_->info, pixelSize);
  return {static_cast<float>(ascent) * scale,
          static_cast<float>(descent) * scale,
          static_cast<float>(lineGap) * scale};
}

float FontFace::advance(std::uint32_t codepoint, float pixelSize) const {
  int advW = 0, lsb = 0;
  stbtt_GetCodepointHMetrics(&impl_->info, static_cast<int>(codepoint), &advW, &lsb);
  return static_cast<float>(advW) * stbtt_ScaleForMappingEmToPixels(&impl_->info, pixelSize);
}

float FontFace::kerning(std::uint32_t left, std::uint32_t right, float pixelSize) const {
  int k = stbtt_GetCodepointKernAdvance(&impl_->info, static_cast<int>(left),
                                        static_cast<int>(right));
  return static_cast<float>(k) * stbtt_ScaleForMappingEmToPixels(&impl_->info, pixelSize);
}

GlyphBitmap FontFace::rasterize(std::uint32_t codepoint, float pixelSize) const {
  GlyphBitmap g;
  float scale = stbtt_ScaleForMappingEmToPixels(&impl_->info, pixelSize);

  int ix0 = 0, iy0 = 0, ix1 = 0, iy1 = 0;
  stbtt_GetCodepointBitmapBox(&impl_->info, static_cast<int>(codepoint),
                              scale, scale, &ix0, &iy0, &ix1, &iy1);
  int gw = ix1 - ix0;
  int gh = iy1 - iy0;
  if (gw <= 0 || gh <= 0) return g; // whitespace: metrics only

  g.width = gw;
  g.height = gh;
  g.offsetX = ix0;
  g.offsetY = iy0;
  g.coverage.assign(static_cast<std::size_t>(gw) * static_cast<std::size_t>(gh), 0);
  stbtt_MakeCodepointBitmap(&impl_->info, g.coverage.data(), gw, gh, gw,
                            scale, scale, static_cast<int>(codepoint));
  return g;
}

// ---------------------------------------------------------------------------
// FontLibrary
// ---------------------------------------------------------------------------

namespace {

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// "'Open Sans', Arial , sans-serif" -> {"open sans", "arial", "sans-serif"}
std::vector<std::string> splitFamilies(const std::string& list) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= list.size()) {
    auto comma = list.find(',', pos);
    std::string tok = list.substr(pos, comma == std::string::npos ? std::string::npos
                                                                  : comma - pos);
    auto isTrim = [](char c) {
      return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
    };
    while (!tok.empty() && isTrim(tok.front())) tok.erase(tok.begin());
    while (!tok.empty() && isTrim(tok.back())) tok.pop_back();
    if (!tok.empty()) out.push_back(lower(tok));
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  return out;
}

} // anonymous namespace

bool FontLibrary::loadFont(const std::string& family, bool bold, bool italic,
                           std::vector<std::uint8_t> data) {
  auto face = FontFace::fromBytes(std::move(data));
  if (!face) return false;

  std::string key = lower(family);
  for (auto& e : faces_) {
    if (e.family == key && e.bold == bold && e.italic == italic) {
      e.face = std::move(face);
      return true;
    }
  }
  faces_.push_back({key, bold, italic, std::move(face)});
  return true;
}

bool FontLibrary::loadFontFile(const std::string& family, bool bold, bool italic,
                               const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "[FontLibrary] cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) {
    std::fprintf(stderr, "[FontLibrary] empty font file %s\n", path.c_str());
    return false;
  }
  std::vector<std::uint8_t> data(static_cast<std::size_t>(sz));
  f.seekg(0);
  if (!f.read(reinterpret_cast<char*>(data.data()), sz)) {
    std::fprintf(stderr, "[FontLibrary] read failed for %s\n", path.c_str());
    return false;
  }
  if (!loadFont(family, bold, italic, std::move(data))) {
    std::fprintf(stderr, "[FontLibrary] %s is not a usable font\n", path.c_str());
    return false;
  }
  return true;
}

void FontLibrary::setDefaultFamily(const std::string& family) {
  defaultFamily_ = family;
}

const FontLibrary::Entry* FontLibrary::find(const std::string& family,
                                            bool bold, bool italic) const {
  for (const auto& e : faces_) {
    if (e.family == family && e.bold == bold && e.italic == italic) return &e;
  }
  return nullptr;
}

bool FontLibrary::matchFamily(const std::string& family, bool bold, bool italic,
                              FontMatch& out) const {
  // Exact face first, then the closest face with the missing traits synthesized.
  const bool tries[4][2] = {
    {bold, italic}, {bold, false}, {false, italic}, {false, false}
  };
  for (const auto& t : tries) {
    if (const Entry* e = find(family, t[0], t[1])) {
      out.face = e->face.get();
      out.syntheticBold = bold && !e->bold;
      out.syntheticItalic = italic && !e->italic;
      return true;
    }
  }
  // Only heavier/slanted faces of this family are loaded.
  for (const auto& e : faces_) {
    if (e.family == family) {
      out.face = e.face.get();
      out.syntheticBold = bold && !e.bold;
      out.syntheticItalic = italic && !e.italic;
      return true;
    }
  }
  return false;
}

FontMatch FontLibrary::match(const std::string& familyList, bool bold, bool italic) const {
  FontMatch m;
  if (faces_.empty()) return m;

  for (const auto& family : splitFamilies(familyList)) {
    if (matchFamily(family, bold, italic, m)) return m;
  }
  if (!defaultFamily_.empty() && matchFamily(lower(defaultFamily_), bold, italic, m))
    return m;

  const auto& first = faces_.front();
  m.face = first.face.get();
  m.syntheticBold = bold && !first.bold;
  m.syntheticItalic = italic && !first.italic;
  return m;
}

} // namespace cf
