#pragma once
#include <cstdint>
#include <string>

namespace cf {

// Straight (non-premultiplied) 8-bit RGBA.
struct Rgba8 {
  std::uint8_t r{0}, g{0}, b{0}, a{0};
};

inline bool operator==(Rgba8 x, Rgba8 y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(Rgba8 x, Rgba8 y) { return !(x == y); }

inline constexpr Rgba8 kTransparent{0, 0, 0, 0};
inline constexpr Rgba8 kWhite{255, 255, 255, 255};
inline constexpr Rgba8 kBlack{0, 0, 0, 255};

// Parse a CSS-style color: "#rgb", "#rgba", "#rrggbb", "#rrggbbaa",
// "rgb(r, g, b)", "rgba(r, g, b, a)", "transparent" and the basic named
// colors. Case-insensitive. Returns false (out untouched) if unrecognized.
bool parseColor(const std::string& text, Rgba8& out);

// Parse, or `fallback` if the text is empty or unrecognized.
Rgba8 colorOr(const std::string& text, Rgba8 fallback);

} // namespace cf
