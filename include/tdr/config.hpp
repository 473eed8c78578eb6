#pragma once
#include <cstddef>

namespace tdr {

struct CarParams {
  double max_speed = 400.0;           // units/s
  double acceleration = 200.0;        // units/s^2
  double brake_force = 300.0;         // units/s^2
  double reverse_max_speed = 100.0;   // units/s (positive magnitude)
  double steering_speed = 3.0;        // rad/s at full speed fraction
  double drift_grip_multiplier = 0.3; // grip while handbraking
  double normal_grip = 1.0;           // 1 = velocity snaps to heading
  double friction_per_second = 0.3;   // coast decay factor per second
  double width = 20.0;
  double length = 40.0;
};

struct DamageParams {
  double wall_damage_multiplier = 0.5;
  double min_damage_speed = 50.0;
  double max_health = 100.0;
};

struct DriftParams {
  double trail_lifetime = 1.5;        // seconds
  std::size_t max_trail_points = 256; // oldest dropped beyond this
};

struct TrackParams {
  double track_width = 120.0;
  double spawn_offset = 0.0;          // along the first segment from centerline[0]
  double max_miter = 4.0;             // cap on miter length, in half-widths
};

struct CheckpointParams {
  double spacing = 150.0;
  double radius = 40.0;
  double curvature_threshold = 0.3;   // rad; tight section when exceeded
  double zigzag_multiplier = 0.7;
  int grace_steps = 0;                // ticks after reset before collection counts
  double min_forward_speed = 0.0;     // forward speed needed to collect
  double auto_advance_multiplier = 3.0;
};

struct EpisodeParams {
  double fps = 60.0;                  // fixed tick rate, dt = 1/fps
  int max_episode_steps = 3000;
  double stuck_speed_threshold = 5.0;
  double stuck_timeout = 3.0;         // seconds
};

struct SensorParams {
  double max_ray_distance = 400.0;
  int curvature_lookahead_steps = 3;
};

struct RewardWeights {
  double checkpoint = 2.0;
  double lap_bonus = 20.0;
  double speed_scale = 0.1;
  double forward_progress_scale = 2.0;
  double backward_progress_scale = 0.5;
  double lateral_scale = 0.005;
  double wall_damage_scale = 0.5;
  double death_penalty = 20.0;
  double time_penalty = 0.01;
  double smooth_steering_bonus = 0.01;
};

// Immutable set of named parameters, built once and handed to each component.
struct SimConfig {
  CarParams car{};
  DamageParams damage{};
  DriftParams drift{};
  TrackParams track{};
  CheckpointParams checkpoints{};
  EpisodeParams episode{};
  SensorParams sensor{};
  RewardWeights reward{};

  double dt() const { return 1.0 / episode.fps; }
};

// Throw ConfigError on the first out-of-range parameter.
void validate(const CarParams& p);
void validate(const DamageParams& p);
void validate(const DriftParams& p);
void validate(const TrackParams& p);
void validate(const CheckpointParams& p);
void validate(const EpisodeParams& p);
void validate(const SensorParams& p);
void validate(const SimConfig& c);

} // namespace tdr
