#pragma once
#include <array>
#include <cstddef>
#include <vector>
#include <tdr/geom.hpp>

namespace tdr {

// 240 degree forward fan, relative to the car heading.
inline constexpr std::array<double, 13> kCanonicalRayAnglesDeg{
  -120.0, -100.0, -75.0, -50.0, -30.0, -10.0, 0.0, 10.0, 30.0, 50.0, 75.0, 100.0, 120.0
};

// Fixed fan of rays cast from the car centre. Each reading is the distance
// to the nearest wall over max_distance, in [0,1]; 1.0 means no hit.
class RayFan {
public:
  // Angles in radians. Throws ConfigError for an empty fan or max_distance <= 0.
  RayFan(std::vector<double> relative_angles_rad, double max_distance);

  static RayFan canonical(double max_distance);

  std::size_t size() const { return angles_.size(); }
  double max_distance() const { return max_distance_; }
  const std::vector<double>& angles() const { return angles_; }

  // Resizes out to size(). Degenerate walls are skipped, parallel walls miss.
  void cast(Vec2 origin, double heading, const std::vector<Segment>& walls,
            std::vector<double>& out) const;

  // Single-ray helper used by cast().
  double cast_one(Vec2 origin, double absolute_angle, const std::vector<Segment>& walls) const;

private:
  std::vector<double> angles_;
  double max_distance_;
};

} // namespace tdr
