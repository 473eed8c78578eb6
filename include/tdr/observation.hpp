#pragma once
#include <cstddef>
#include <vector>
#include <tdr/car.hpp>
#include <tdr/config.hpp>
#include <tdr/raycast.hpp>
#include <tdr/track_geom.hpp>

namespace tdr {

// Values after the rays: speed, angular velocity, drift, health, checkpoint angle.
inline constexpr std::size_t kObservationStateValues = 5;
// 13 rays + 5 state values + 3 curvature lookahead values.
inline constexpr std::size_t kCanonicalObservationSize = 21;

// Signed angle from the pose heading to target, in [-pi, pi).
double relative_bearing(const Pose& pose, Vec2 target);

// Assembles the fixed-layout observation each tick:
//   [0, R)        ray readings
//   R             |speed| / max_speed
//   R+1           angular velocity, [-steering_speed, steering_speed] -> [0,1]
//   R+2           drift flag
//   R+3           health fraction
//   R+4           bearing to next checkpoint, [-pi, pi] -> [0,1]
//   R+5 ...       curvature lookahead
// Every value lies in [0,1]. A non-finite value throws SimulationError.
class ObservationBuilder {
public:
  ObservationBuilder(const SimConfig& config, const TrackGeometry& track);

  std::size_t size() const { return fan_.size() + kObservationStateValues + lookahead_; }
  const RayFan& fan() const { return fan_; }

  void build(const CarDynamics& car, Vec2 next_checkpoint, double progress,
             std::vector<double>& out);

private:
  const TrackGeometry* track_;
  RayFan fan_;
  std::size_t lookahead_;
  double max_speed_;
  double max_angular_;
  double max_health_;
  std::vector<double> rays_;
};

} // namespace tdr
