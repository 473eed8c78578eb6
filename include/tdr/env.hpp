#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include <tdr/car.hpp>
#include <tdr/checkpoints.hpp>
#include <tdr/collision.hpp>
#include <tdr/config.hpp>
#include <tdr/lap_timer.hpp>
#include <tdr/observation.hpp>
#include <tdr/reward.hpp>
#include <tdr/track_geom.hpp>

namespace tdr {

// Continuous control. steering in [-1,1] (negative = left), throttle in
// [-1,1] (negative = brake/reverse), drift in [0,1].
struct Action {
  double steering = 0.0;
  double throttle = 0.0;
  double drift = 0.0;
};

// Fixed thresholds: |steering|, |throttle| > 0.1 engage, drift > 0.5 engages
// the handbrake. Throws InputError for non-finite components.
CarControls quantize(const Action& a);

struct EpisodeInfo {
  std::size_t laps = 0;
  std::vector<double> lap_times;     // seconds
  double best_lap = -1.0;
  std::size_t wall_hits = 0;
  RewardBreakdown breakdown{};
  bool checkpoint_reached = false;
  bool lap_completed = false;
  double wall_damage = 0.0;
  bool dead = false;
  bool stuck = false;
  std::size_t next_checkpoint = 0;
  std::size_t checkpoints_skipped = 0;
  double progress = 0.0;             // fractional centerline index
  std::size_t collision_overflow = 0;
  bool start_line_crossed = false;       // forward through the start/finish gate this tick
  std::size_t start_line_crossings = 0;  // since reset
  int step_count = 0;
};

struct ResetResult {
  std::vector<double> observation;
  EpisodeInfo info;
};

struct StepResult {
  std::vector<double> observation;
  double reward = 0.0;
  RewardBreakdown breakdown{};
  bool terminated = false;  // health reached 0
  bool truncated = false;   // step budget exhausted or stuck
  EpisodeInfo info;
};

// Single-agent racing episode: the one step/reset contract the training loop
// and any renderer drive. Not thread-safe; run one instance per thread.
class RacingEnv {
public:
  // Validates the config and builds checkpoints and sensors. Throws ConfigError.
  RacingEnv(SimConfig config, TrackGeometry track);

  RacingEnv(const RacingEnv&) = delete;
  RacingEnv& operator=(const RacingEnv&) = delete;

  // Defaults to the track spawn pose.
  ResetResult reset(std::optional<Pose> pose = std::nullopt);
  StepResult step(const Action& action);

  std::size_t observation_size() const { return obs_.size(); }
  std::pair<double, double> reward_range() const;

  const SimConfig& config() const { return config_; }
  const TrackGeometry& track() const { return track_; }
  const CheckpointSet& checkpoints() const { return checkpoints_; }
  const CheckpointTracker& tracker() const { return tracker_; }
  const CarDynamics& car() const { return car_; }
  const CollisionBuffer& last_collisions() const { return collisions_; }
  int step_count() const { return step_count_; }

private:
  void fill_info_(EpisodeInfo& info) const;

  SimConfig config_;
  TrackGeometry track_;
  CheckpointSet checkpoints_;
  CheckpointTracker tracker_;
  CarDynamics car_;
  ObservationBuilder obs_;
  CollisionBuffer collisions_{};
  LapTimer lap_timer_;

  double dt_;
  int stuck_limit_;
  int step_count_{0};
  int stuck_steps_{0};
  std::size_t wall_hits_{0};
  std::size_t start_line_crossings_{0};
  double prev_steering_{0.0};
  double prev_progress_{0.0};
};

} // namespace tdr
