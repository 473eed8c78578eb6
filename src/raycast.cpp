#include <tdr/raycast.hpp>
#include <algorithm>
#include <cmath>
#include <utility>
#include <tdr/errors.hpp>

namespace tdr {

RayFan::RayFan(std::vector<double> relative_angles_rad, double max_distance)
  : angles_(std::move(relative_angles_rad)), max_distance_(max_distance) {
  if (angles_.empty()) throw ConfigError("ray fan needs at least one ray", "sensor");
  if (!(max_distance_ > 0.0) || !std::isfinite(max_distance_)) {
    throw ConfigError("max_ray_distance must be > 0", "sensor");
  }
  for (double a : angles_) {
    if (!std::isfinite(a)) throw ConfigError("ray angle must be finite", "sensor");
  }
}

RayFan RayFan::canonical(double max_distance) {
  std::vector<double> rad;
  rad.reserve(kCanonicalRayAnglesDeg.size());
  for (double deg : kCanonicalRayAnglesDeg) rad.push_back(deg * kDegToRad);
  return RayFan(std::move(rad), max_distance);
}

double RayFan::cast_one(Vec2 origin, double absolute_angle, const std::vector<Segment>& walls) const {
  const Vec2 end = origin + from_angle(absolute_angle) * max_distance_;
  double best = 1.0;
  for (const Segment& w : walls) {
    if (w.is_degenerate()) continue;
    if (const auto hit = segment_intersection(origin, end, w.a, w.b)) {
      best = std::min(best, hit->t);
    }
  }
  // t is already distance / max_distance because the ray spans max_distance.
  return std::clamp(best, 0.0, 1.0);
}

void RayFan::cast(Vec2 origin, double heading, const std::vector<Segment>& walls,
                  std::vector<double>& out) const {
  out.resize(angles_.size());
  if (walls.empty()) {
    std::fill(out.begin(), out.end(), 1.0);
    return;
  }
  for (std::size_t i = 0; i < angles_.size(); ++i) {
    out[i] = cast_one(origin, heading + angles_[i], walls);
  }
}

} // namespace tdr
