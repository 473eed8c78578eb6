#pragma once
#include <map>
#include <string>
#include <utility>
#include <tdr/config.hpp>

namespace tdr {

// Everything the reward needs from one tick.
struct StepSignals {
  bool checkpoint_reached = false;
  bool lap_completed = false;
  double wall_damage = 0.0;
  bool dead = false;
  double speed = 0.0;              // absolute
  double prev_steering = 0.0;
  double curr_steering = 0.0;
  bool stuck = false;
  double forward_progress = 0.0;   // progress delta in centerline index units
  double lateral_displacement = 0.0;
};

// Per-component contributions; positive = reward, negative = penalty.
struct RewardBreakdown {
  double checkpoint = 0.0;
  double lap = 0.0;
  double speed = 0.0;
  double forward_progress = 0.0;
  double lateral_penalty = 0.0;
  double wall_penalty = 0.0;
  double death_penalty = 0.0;
  double time_penalty = 0.0;
  double smooth_steering = 0.0;
  double stuck_penalty = 0.0;

  double total() const;
  std::map<std::string, double> to_map() const;
};

RewardBreakdown compute_reward(const StepSignals& s, const RewardWeights& w, double max_speed);

// Theoretical (min, max) reward for a single step.
std::pair<double, double> reward_range(const RewardWeights& w, const DamageParams& damage,
                                       const TrackParams& track);

} // namespace tdr
