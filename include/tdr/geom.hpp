#pragma once
#include <cmath>
#include <numbers>
#include <optional>

namespace tdr {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kDegToRad = kPI / 180.0;

// Below this |cross| two directions count as parallel.
inline constexpr double kParallelEps = 1e-10;
// Squared length below which a segment carries no geometry.
inline constexpr double kDegenerateLenSq = 1e-20;

struct Vec2 {
  double x{};
  double y{};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double k) { return {a.x * k, a.y * k}; }
inline Vec2 operator*(double k, Vec2 a) { return {a.x * k, a.y * k}; }
inline Vec2& operator+=(Vec2& a, Vec2 b) { a.x += b.x; a.y += b.y; return a; }
inline Vec2& operator-=(Vec2& a, Vec2 b) { a.x -= b.x; a.y -= b.y; return a; }
inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }

inline double dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }
inline double cross(Vec2 a, Vec2 b) { return a.x * b.y - a.y * b.x; }
inline double length_sq(Vec2 a) { return dot(a, a); }
inline double length(Vec2 a) { return std::hypot(a.x, a.y); }
inline Vec2 from_angle(double rad) { return {std::cos(rad), std::sin(rad)}; }

struct Segment {
  Vec2 a{};
  Vec2 b{};

  Vec2 direction() const { return b - a; }
  double length() const { return tdr::length(b - a); }
  bool is_degenerate() const { return length_sq(b - a) < kDegenerateLenSq; }
};

// Result of a segment/segment test. t is the parameter along the first
// segment, s along the second; both in [0,1].
struct SegmentHit {
  Vec2 point{};
  double t{};
  double s{};
};

// Parametric intersection of p1-p2 with p3-p4 via the 2D cross product.
// Parallel or coincident segments report no hit.
inline std::optional<SegmentHit> segment_intersection(Vec2 p1, Vec2 p2, Vec2 p3, Vec2 p4) {
  const Vec2 d1 = p2 - p1;
  const Vec2 d2 = p4 - p3;
  const double denom = cross(d1, d2);
  if (std::abs(denom) < kParallelEps) return std::nullopt;

  const Vec2 d3 = p3 - p1;
  const double t = cross(d3, d2) / denom;
  const double s = cross(d3, d1) / denom;
  if (t < 0.0 || t > 1.0 || s < 0.0 || s > 1.0) return std::nullopt;

  return SegmentHit{p1 + d1 * t, t, s};
}

// Wrap to [-pi, pi).
inline double wrap_angle(double a) {
  double w = std::fmod(a + kPI, kTAU);
  if (w < 0.0) w += kTAU;
  return w - kPI;
}

// Directed line across the track. direction is the way a car must travel
// through it.
struct Gate {
  Segment line{};
  Vec2 direction{};
};

struct Pose {
  Vec2 position{};
  double heading_rad = 0.0;  // 0 = +x, counter-clockwise positive
};

} // namespace tdr
