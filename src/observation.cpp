#include <tdr/observation.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <tdr/errors.hpp>

namespace tdr {

static double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

double relative_bearing(const Pose& pose, Vec2 target) {
  const Vec2 d = target - pose.position;
  return wrap_angle(std::atan2(d.y, d.x) - pose.heading_rad);
}

ObservationBuilder::ObservationBuilder(const SimConfig& config, const TrackGeometry& track)
  : track_(&track)
  , fan_(RayFan::canonical(config.sensor.max_ray_distance))
  , lookahead_(static_cast<std::size_t>(config.sensor.curvature_lookahead_steps))
  , max_speed_(config.car.max_speed)
  , max_angular_(config.car.steering_speed)
  , max_health_(config.damage.max_health) {
  validate(config.sensor);
}

void ObservationBuilder::build(const CarDynamics& car, Vec2 next_checkpoint, double progress,
                               std::vector<double>& out) {
  const CarState& s = car.state();
  out.clear();
  out.reserve(size());

  fan_.cast(s.position, s.heading, track_->walls(), rays_);
  out.insert(out.end(), rays_.begin(), rays_.end());

  out.push_back(clamp01(std::abs(s.speed) / max_speed_));
  out.push_back(clamp01((s.angular_velocity + max_angular_) / (2.0 * max_angular_)));
  out.push_back(s.drifting ? 1.0 : 0.0);
  out.push_back(clamp01(s.health / max_health_));
  out.push_back(clamp01((relative_bearing(car.pose(), next_checkpoint) + kPI) / kTAU));

  const auto curv = track_->get_curvature_lookahead(progress, static_cast<int>(lookahead_));
  out.insert(out.end(), curv.begin(), curv.end());

  for (std::size_t i = 0; i < out.size(); ++i) {
    if (!std::isfinite(out[i])) {
      throw SimulationError(TDR_LOC("non-finite observation value at index " + std::to_string(i)),
                            "observation");
    }
  }
}

} // namespace tdr
