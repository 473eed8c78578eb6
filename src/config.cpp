#include <tdr/config.hpp>
#include <cmath>
#include <string>
#include <tdr/errors.hpp>

namespace tdr {

static void require(bool ok, const char* section, const std::string& what) {
  if (!ok) throw ConfigError(what, section);
}

static bool positive(double v) { return std::isfinite(v) && v > 0.0; }
static bool non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

void validate(const CarParams& p) {
  require(positive(p.max_speed), "car", "max_speed must be > 0");
  require(positive(p.acceleration), "car", "acceleration must be > 0");
  require(positive(p.brake_force), "car", "brake_force must be > 0");
  require(non_negative(p.reverse_max_speed), "car", "reverse_max_speed must be >= 0");
  require(positive(p.steering_speed), "car", "steering_speed must be > 0");
  require(positive(p.normal_grip) && p.normal_grip <= 1.0, "car", "normal_grip must be in (0, 1]");
  require(positive(p.drift_grip_multiplier) && p.drift_grip_multiplier <= p.normal_grip,
          "car", "drift_grip_multiplier must be in (0, normal_grip]");
  require(positive(p.friction_per_second) && p.friction_per_second <= 1.0,
          "car", "friction_per_second must be in (0, 1]");
  require(positive(p.width), "car", "width must be > 0");
  require(positive(p.length), "car", "length must be > 0");
}

void validate(const DamageParams& p) {
  require(non_negative(p.wall_damage_multiplier), "damage", "wall_damage_multiplier must be >= 0");
  require(non_negative(p.min_damage_speed), "damage", "min_damage_speed must be >= 0");
  require(positive(p.max_health), "damage", "max_health must be > 0");
}

void validate(const DriftParams& p) {
  require(positive(p.trail_lifetime), "drift", "trail_lifetime must be > 0");
}

void validate(const TrackParams& p) {
  require(positive(p.track_width), "track", "track_width must be > 0");
  require(std::isfinite(p.spawn_offset), "track", "spawn_offset must be finite");
  require(p.max_miter >= 1.0 && std::isfinite(p.max_miter), "track", "max_miter must be >= 1");
}

void validate(const CheckpointParams& p) {
  require(positive(p.spacing), "checkpoints", "spacing must be > 0");
  require(positive(p.radius), "checkpoints", "radius must be > 0");
  require(non_negative(p.curvature_threshold), "checkpoints", "curvature_threshold must be >= 0");
  require(positive(p.zigzag_multiplier), "checkpoints", "zigzag_multiplier must be > 0");
  require(p.grace_steps >= 0, "checkpoints", "grace_steps must be >= 0");
  require(std::isfinite(p.min_forward_speed), "checkpoints", "min_forward_speed must be finite");
  require(positive(p.auto_advance_multiplier), "checkpoints", "auto_advance_multiplier must be > 0");
}

void validate(const EpisodeParams& p) {
  require(positive(p.fps), "episode", "fps must be > 0");
  require(p.max_episode_steps > 0, "episode", "max_episode_steps must be > 0");
  require(non_negative(p.stuck_speed_threshold), "episode", "stuck_speed_threshold must be >= 0");
  require(positive(p.stuck_timeout), "episode", "stuck_timeout must be > 0");
}

void validate(const SensorParams& p) {
  require(positive(p.max_ray_distance), "sensor", "max_ray_distance must be > 0");
  require(p.curvature_lookahead_steps >= 1, "sensor", "curvature_lookahead_steps must be >= 1");
}

void validate(const SimConfig& c) {
  validate(c.car);
  validate(c.damage);
  validate(c.drift);
  validate(c.track);
  validate(c.checkpoints);
  validate(c.episode);
  validate(c.sensor);
}

} // namespace tdr
