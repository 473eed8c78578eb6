#include <tdr/env.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <tdr/errors.hpp>
#include <tdr/log.hpp>

namespace tdr {

static constexpr double kEngageThreshold = 0.1;
static constexpr double kHandbrakeThreshold = 0.5;

static void require_finite(double v, const char* name) {
  if (!std::isfinite(v)) throw InputError(std::string(name) + " must be finite", "action");
}

CarControls quantize(const Action& a) {
  require_finite(a.steering, "steering");
  require_finite(a.throttle, "throttle");
  require_finite(a.drift, "drift");

  const double steer = std::clamp(a.steering, -1.0, 1.0);
  const double throttle = std::clamp(a.throttle, -1.0, 1.0);
  const double drift = std::clamp(a.drift, 0.0, 1.0);

  CarControls c{};
  c.accelerate = throttle > kEngageThreshold;
  c.brake = throttle < -kEngageThreshold;
  c.steer_left = steer < -kEngageThreshold;
  c.steer_right = steer > kEngageThreshold;
  c.handbrake = drift > kHandbrakeThreshold;
  return c;
}

static SimConfig validated(SimConfig c) {
  validate(c);
  return c;
}

RacingEnv::RacingEnv(SimConfig config, TrackGeometry track)
  : config_(validated(std::move(config)))
  , track_(std::move(track))
  , checkpoints_(track_, config_.checkpoints)
  , tracker_(checkpoints_, config_.checkpoints)
  , car_(config_.car, config_.damage, config_.drift)
  , obs_(config_, track_)
  , lap_timer_(config_.dt())
  , dt_(config_.dt())
  , stuck_limit_(std::max(1, static_cast<int>(config_.episode.stuck_timeout / config_.dt()))) {
  log::logger()->info("env ready: {} centerline pts, length {:.1f}, {} checkpoints ({} tight), obs size {}",
                      track_.size(), track_.length(), checkpoints_.size(),
                      checkpoints_.tight_segments().size(), obs_.size());
  reset();
}

std::pair<double, double> RacingEnv::reward_range() const {
  return tdr::reward_range(config_.reward, config_.damage, config_.track);
}

void RacingEnv::fill_info_(EpisodeInfo& info) const {
  info.laps = tracker_.laps();
  info.lap_times = lap_timer_.history();
  info.best_lap = lap_timer_.times().best_lap;
  info.wall_hits = wall_hits_;
  info.start_line_crossings = start_line_crossings_;
  info.dead = !car_.is_alive();
  info.next_checkpoint = tracker_.next_index();
  info.progress = prev_progress_;
  info.step_count = step_count_;
}

ResetResult RacingEnv::reset(std::optional<Pose> pose) {
  const Pose start = pose.value_or(track_.spawn());
  car_.reset(start);
  tracker_.reset(checkpoints_.first_ahead_of(start, track_));
  lap_timer_.reset();
  collisions_.clear();

  step_count_ = 0;
  stuck_steps_ = 0;
  wall_hits_ = 0;
  start_line_crossings_ = 0;
  prev_steering_ = 0.0;
  prev_progress_ = track_.get_track_progress(start.position.x, start.position.y);

  ResetResult r{};
  obs_.build(car_, checkpoints_.position(tracker_.next_index()), prev_progress_, r.observation);
  fill_info_(r.info);
  return r;
}

StepResult RacingEnv::step(const Action& action) {
  const CarControls controls = quantize(action);
  const double steering = std::clamp(action.steering, -1.0, 1.0);
  ++step_count_;

  car_.step(dt_, controls);

  // Walls: records are resolved in detection order.
  double wall_damage = 0.0;
  detect_collisions(car_.corners(), track_.walls(), collisions_);
  for (const CollisionRecord& rec : collisions_) {
    const double dmg = resolve_collision(car_, rec, config_.damage);
    car_.apply_damage(dmg);
    wall_damage += dmg;
    ++wall_hits_;
  }
  if (collisions_.dropped() > 0) {
    log::logger()->warn("collision buffer full: dropped {} records at step {}",
                        collisions_.dropped(), step_count_);
  }

  const CarState& s = car_.state();
  const double progress = track_.get_track_progress(s.position.x, s.position.y);
  const double forward_speed = dot(s.velocity, from_angle(s.heading));
  const CheckpointUpdate cp =
      tracker_.update(s.position, forward_speed, track_.arc_length_at(progress), track_);

  if (cp.lap_completed) {
    const double t = lap_timer_.complete_lap(static_cast<std::uint64_t>(step_count_));
    log::logger()->debug("lap {} completed in {:.3f}s", tracker_.laps(), t);
  }

  const bool crossed_line = crossed_gate(s.prev_position, s.position, track_.start_gate());
  if (crossed_line) ++start_line_crossings_;

  if (std::abs(s.speed) < config_.episode.stuck_speed_threshold) {
    ++stuck_steps_;
  } else {
    stuck_steps_ = 0;
  }
  const bool stuck = stuck_steps_ >= stuck_limit_;

  StepResult r{};
  r.terminated = !car_.is_alive();
  r.truncated = step_count_ >= config_.episode.max_episode_steps || stuck;

  StepSignals sig{};
  sig.checkpoint_reached = cp.collected;
  sig.lap_completed = cp.lap_completed;
  sig.wall_damage = wall_damage;
  sig.dead = !car_.is_alive();
  sig.speed = std::abs(s.speed);
  sig.prev_steering = prev_steering_;
  sig.curr_steering = steering;
  sig.stuck = stuck;
  sig.forward_progress = track_.progress_delta(prev_progress_, progress);
  sig.lateral_displacement = track_.get_lateral_displacement(s.position.x, s.position.y);
  r.breakdown = compute_reward(sig, config_.reward, config_.car.max_speed);
  r.reward = r.breakdown.total();

  prev_steering_ = steering;
  prev_progress_ = progress;

  obs_.build(car_, checkpoints_.position(tracker_.next_index()), progress, r.observation);

  fill_info_(r.info);
  r.info.breakdown = r.breakdown;
  r.info.checkpoint_reached = cp.collected;
  r.info.lap_completed = cp.lap_completed;
  r.info.wall_damage = wall_damage;
  r.info.stuck = stuck;
  r.info.checkpoints_skipped = cp.skipped;
  r.info.collision_overflow = collisions_.dropped();
  r.info.start_line_crossed = crossed_line;
  return r;
}

} // namespace tdr
