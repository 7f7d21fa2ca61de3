#include "cf/raster/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace cf {

namespace {

struct NamedColor {
  const char* name;
  Rgba8 color;
};

const NamedColor kNamed[] = {
  {"transparent", {0, 0, 0, 0}},
  {"black",   {0, 0, 0, 255}},
  {"white",   {255, 255, 255, 255}},
  {"red",     {255, 0, 0, 255}},
  {"green",   {0, 128, 0, 255}},
  {"lime",    {0, 255, 0, 255}},
  {"blue",    {0, 0, 255, 255}},
  {"yellow",  {255, 255, 0, 255}},
  {"cyan",    {0, 255, 255, 255}},
  {"magenta", {255, 0, 255, 255}},
  {"orange",  {255, 165, 0, 255}},
  {"purple",  {128, 0, 128, 255}},
  {"gray",    {128, 128, 128, 255}},
  {"grey",    {128, 128, 128, 255}},
};

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool parseHex(const std::string& s, Rgba8& out) {
  // s has the leading '#' stripped and is lower-case.
  std::vector<int> d;
  for (char c : s) {
    int v = hexValue(c);
    if (v < 0) return false;
    d.push_back(v);
  }

  if (d.size() == 3 || d.size() == 4) {
    out.r = static_cast<std::uint8_t>(d[0] * 17);
    out.g = static_cast<std::uint8_t>(d[1] * 17);
    out.b = static_cast<std::uint8_t>(d[2] * 17);
    out.a = d.size() == 4 ? static_cast<std::uint8_t>(d[3] * 17) : 255;
    return true;
  }
  if (d.size() == 6 || d.size() == 8) {
    out.r = static_cast<std::uint8_t>(d[0] * 16 + d[1]);
    out.g = static_cast<std::uint8_t>(d[2] * 16 + d[3]);
    out.b = static_cast<std::uint8_t>(d[4] * 16 + d[5]);
    out.a = d.size() == 8 ? static_cast<std::uint8_t>(d[6] * 16 + d[7]) : 255;
    return true;
  }
  return false;
}

bool parseFunctional(const std::string& s, Rgba8& out) {
  // "rgb(" or "rgba(" already checked by the caller.
  auto open = s.find('(');
  auto close = s.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close < open)
    return false;

  std::vector<double> parts;
  std::string body = s.substr(open + 1, close - open - 1);
  std::size_t pos = 0;
  while (pos <= body.size()) {
    auto comma = body.find(',', pos);
    std::string tok = body.substr(pos, comma == std::string::npos ? std::string::npos
                                                                  : comma - pos);
    char* end = nullptr;
    double v = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str()) return false;
    parts.push_back(v);
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }

  if (parts.size() != 3 && parts.size() != 4) return false;

  auto channel = [](double v) {
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
  };
  out.r = channel(parts[0]);
  out.g = channel(parts[1]);
  out.b = channel(parts[2]);
  out.a = parts.size() == 4
              ? static_cast<std::uint8_t>(std::lround(std::clamp(parts[3], 0.0, 1.0) * 255.0))
              : 255;
  return true;
}

} // anonymous namespace

bool parseColor(const std::string& text, Rgba8& out) {
  std::string s;
  s.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (s.empty()) return false;

  Rgba8 c;
  if (s[0] == '#') {
    if (!parseHex(s.substr(1), c)) return false;
    out = c;
    return true;
  }
  if (s.compare(0, 4, "rgb(") == 0 || s.compare(0, 5, "rgba(") == 0) {
    if (!parseFunctional(s, c)) return false;
    out = c;
    return true;
  }
  for (const auto& n : kNamed) {
    if (s == n.name) {
      out = n.color;
      return true;
    }
  }
  return false;
}

Rgba8 colorOr(const std::string& text, Rgba8 fallback) {
  Rgba8 c;
  return parseColor(text, c) ? c : fallback;
}

} // namespace cf
