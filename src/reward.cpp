#include <tdr/reward.hpp>
#include <algorithm>
#include <cmath>

namespace tdr {

// Steering change below this earns the smooth steering bonus.
static constexpr double kSmoothSteeringDelta = 0.1;
// Generous per-step bounds on centerline progress, used only for reward_range().
static constexpr double kMaxForwardProgressPerStep = 0.1;
static constexpr double kMaxBackwardProgressPerStep = 1.0;

double RewardBreakdown::total() const {
  return checkpoint + lap + speed + forward_progress + lateral_penalty +
         wall_penalty + death_penalty + time_penalty + smooth_steering + stuck_penalty;
}

std::map<std::string, double> RewardBreakdown::to_map() const {
  return {
    {"checkpoint", checkpoint},
    {"lap", lap},
    {"speed", speed},
    {"forward_progress", forward_progress},
    {"lateral_penalty", lateral_penalty},
    {"wall_penalty", wall_penalty},
    {"death_penalty", death_penalty},
    {"time_penalty", time_penalty},
    {"smooth_steering", smooth_steering},
    {"stuck_penalty", stuck_penalty},
  };
}

RewardBreakdown compute_reward(const StepSignals& s, const RewardWeights& w, double max_speed) {
  RewardBreakdown b{};
  if (s.checkpoint_reached) b.checkpoint = w.checkpoint;
  if (s.lap_completed) b.lap = w.lap_bonus;

  const double frac = max_speed > 0.0 ? std::min(std::abs(s.speed) / max_speed, 1.0) : 0.0;
  b.speed = frac * w.speed_scale;

  if (s.forward_progress > 0.0) {
    b.forward_progress = s.forward_progress * w.forward_progress_scale;
  } else if (s.forward_progress < 0.0) {
    b.forward_progress = s.forward_progress * w.backward_progress_scale;
  }

  if (s.lateral_displacement > 0.0) b.lateral_penalty = -s.lateral_displacement * w.lateral_scale;
  if (s.wall_damage > 0.0) b.wall_penalty = -s.wall_damage * w.wall_damage_scale;
  if (s.dead) b.death_penalty = -w.death_penalty;

  b.time_penalty = -w.time_penalty;

  if (std::abs(s.curr_steering - s.prev_steering) < kSmoothSteeringDelta) {
    b.smooth_steering = w.smooth_steering_bonus;
  }

  // Being stuck ends the episode, so it costs as much as dying.
  if (s.stuck) b.stuck_penalty = -w.death_penalty;
  return b;
}

std::pair<double, double> reward_range(const RewardWeights& w, const DamageParams& damage,
                                       const TrackParams& track) {
  const double worst_wall = damage.max_health * w.wall_damage_scale;
  const double worst_lateral = track.track_width * 0.5 * w.lateral_scale;
  const double lo = -(2.0 * w.death_penalty + worst_wall + w.time_penalty +
                      kMaxBackwardProgressPerStep * w.backward_progress_scale + worst_lateral);
  const double hi = w.checkpoint + w.lap_bonus + w.speed_scale + w.smooth_steering_bonus +
                    kMaxForwardProgressPerStep * w.forward_progress_scale;
  return {lo, hi};
}

} // namespace tdr
