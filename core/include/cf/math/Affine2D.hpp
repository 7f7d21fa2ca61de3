#pragma once
#include <cmath>

namespace cf {

// 2D affine transform in the canvas convention:
//   x' = a*x + c*y + e
//   y' = b*x + d*y + f
// Y grows downward, so a positive rotation angle turns clockwise on screen.
struct Affine2D {
  double a{1}, b{0}, c{0}, d{1}, e{0}, f{0};

  static Affine2D translate(double tx, double ty) { return {1, 0, 0, 1, tx, ty}; }
  static Affine2D scale(double sx, double sy) { return {sx, 0, 0, sy, 0, 0}; }
  static Affine2D rotate(double radians) {
    double cs = std::cos(radians), sn = std::sin(radians);
    return {cs, sn, -sn, cs, 0, 0};
  }
  // Horizontal shear: x' = x + k*y.
  static Affine2D shearX(double k) { return {1, 0, k, 1, 0, 0}; }

  void apply(double x, double y, double& ox, double& oy) const {
    ox = a * x + c * y + e;
    oy = b * x + d * y + f;
  }

  double determinant() const { return a * d - b * c; }

  // Returns false (out untouched) for a singular transform.
  bool invert(Affine2D& out) const {
    double det = determinant();
    if (std::fabs(det) < 1e-12) return false;
    double inv = 1.0 / det;
    out.a = d * inv;
    out.b = -b * inv;
    out.c = -c * inv;
    out.d = a * inv;
    out.e = (c * f - d * e) * inv;
    out.f = (b * e - a * f) * inv;
    return true;
  }
};

// m1 * m2: the result applies m2 first, then m1.
inline Affine2D operator*(const Affine2D& m1, const Affine2D& m2) {
  Affine2D r;
  r.a = m1.a * m2.a + m1.c * m2.b;
  r.b = m1.b * m2.a + m1.d * m2.b;
  r.c = m1.a * m2.c + m1.c * m2.d;
  r.d = m1.b * m2.c + m1.d * m2.d;
  r.e = m1.a * m2.e + m1.c * m2.f + m1.e;
  r.f = m1.b * m2.e + m1.d * m2.f + m1.f;
  return r;
}

inline double degreesToRadians(double deg) {
  return deg * 3.14159265358979323846 / 180.0;
}

} // namespace cf
