#pragma once
#include <cmath>
#include <numbers>

namespace brownbot {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

struct Vec2 {
  double x{};
  double y{};

  friend bool operator==(const Vec2&, const Vec2&) = default;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double k) { return {a.x * k, a.y * k}; }

// Wrap an angle into [0, 2pi).
inline double wrap_angle(double rad) {
  double a = std::fmod(rad, kTAU);
  if (a < 0.0) a += kTAU;
  // fmod of a tiny negative can round up to exactly kTAU
  if (a >= kTAU) a = 0.0;
  return a;
}

// Unit direction for a heading (radians, CCW from +x).
inline Vec2 heading_vector(double heading_rad) {
  return {std::cos(heading_rad), std::sin(heading_rad)};
}

} // namespace brownbot
