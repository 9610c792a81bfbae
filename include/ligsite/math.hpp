// Copyright The ligsite Authors.
//
// Math utilities: 3D vector and rounding.

#ifndef LIGSITE_MATH_HPP_
#define LIGSITE_MATH_HPP_

#include <cmath>  // for sqrt, round

namespace ligsite {

constexpr double sq(double x) { return x * x; }

// the precision used for distances in interaction records
inline double round3(double d) { return std::round(d * 1000.) / 1000.; }

struct Vec3 {
  double x, y, z;

  Vec3() : x(0), y(0), z(0) {}
  Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  Vec3 operator-(const Vec3& o) const { return {x-o.x, y-o.y, z-o.z}; }
  bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }

  double length_sq() const { return x * x + y * y + z * z; }
  double dist_sq(const Vec3& o) const { return (*this - o).length_sq(); }
  double dist(const Vec3& o) const { return std::sqrt(dist_sq(o)); }
};

// Cartesian coordinates in Angstroms.
struct Position : Vec3 {
  using Vec3::Vec3;
  Position() = default;
};

} // namespace ligsite
#endif
