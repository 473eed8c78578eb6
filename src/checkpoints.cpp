#include <tdr/checkpoints.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>
#include <tdr/errors.hpp>

namespace tdr {

std::vector<std::size_t> tight_section_indices(const std::vector<Vec2>& centerline, double threshold) {
  const std::size_t n = centerline.size();
  std::vector<std::size_t> out;
  if (n < 3) return out;

  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 vin  = centerline[i] - centerline[(i + n - 1) % n];
    const Vec2 vout = centerline[(i + 1) % n] - centerline[i];
    const double len_in = length(vin);
    const double len_out = length(vout);
    if (len_in < 1e-9 || len_out < 1e-9) continue;

    const double c = std::clamp(dot(vin, vout) / (len_in * len_out), -1.0, 1.0);
    if (std::acos(c) > threshold) out.push_back(i);
  }
  return out;
}

std::vector<Vec2> generate_checkpoints(const std::vector<Vec2>& centerline,
                                       double spacing,
                                       const std::vector<std::size_t>& tight,
                                       double zigzag_multiplier) {
  if (!(spacing > 0.0) || !std::isfinite(spacing)) {
    throw ConfigError("spacing must be > 0", "checkpoints");
  }
  if (!(zigzag_multiplier > 0.0) || !std::isfinite(zigzag_multiplier)) {
    throw ConfigError("zigzag_multiplier must be > 0", "checkpoints");
  }

  const std::size_t n = centerline.size();
  std::vector<Vec2> out;
  if (n < 2) return out;

  const std::unordered_set<std::size_t> tight_set(tight.begin(), tight.end());

  out.push_back(centerline[0]);
  double accumulated = 0.0;  // arc length since the last checkpoint

  for (std::size_t seg = 0; seg < n; ++seg) {
    const Vec2 a = centerline[seg];
    const Vec2 ab = centerline[(seg + 1) % n] - a;
    const double seg_len = length(ab);
    if (seg_len < 1e-9) continue;
    const Vec2 dir = ab * (1.0 / seg_len);

    const double step = tight_set.count(seg) ? spacing * zigzag_multiplier : spacing;

    double walked = 0.0;
    while (true) {
      const double to_next = step - accumulated;
      if (to_next <= seg_len - walked) {
        walked += to_next;
        out.push_back(a + dir * walked);
        accumulated = 0.0;
      } else {
        accumulated += seg_len - walked;
        break;
      }
    }
  }
  return out;
}

bool crossed_gate(Vec2 prev, Vec2 pos, const Gate& gate) {
  if (gate.line.is_degenerate()) return false;
  const Vec2 move = pos - prev;
  if (dot(move, gate.direction) <= 0.0) return false;
  const auto hit = segment_intersection(prev, pos, gate.line.a, gate.line.b);
  return hit.has_value() && hit->t > 0.0;
}

CheckpointSet::CheckpointSet(const TrackGeometry& track, const CheckpointParams& params) {
  validate(params);
  tight_ = tight_section_indices(track.centerline(), params.curvature_threshold);
  pts_ = generate_checkpoints(track.centerline(), params.spacing, tight_, params.zigzag_multiplier);

  arc_.reserve(pts_.size());
  for (const Vec2& p : pts_) {
    arc_.push_back(track.arc_length_at(track.get_track_progress(p.x, p.y)));
  }
  avg_spacing_ = track.length() / static_cast<double>(pts_.size());
}

std::size_t CheckpointSet::first_ahead_of(const Pose& pose, const TrackGeometry& track) const {
  const double L = track.length();
  const double start_arc =
      track.arc_length_at(track.get_track_progress(pose.position.x, pose.position.y));
  const Vec2 h = from_angle(pose.heading_rad);

  std::size_t best = 0;
  double best_fwd = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < pts_.size(); ++i) {
    if (dot(pts_[i] - pose.position, h) <= 0.0) continue;
    double fwd = std::fmod(arc_[i] - start_arc, L);
    if (fwd < 0.0) fwd += L;
    if (fwd < best_fwd) { best_fwd = fwd; best = i; }
  }
  return best;
}

const char* cursor_state_name(CursorState s) {
  switch (s) {
    case CursorState::Idle:       return "idle";
    case CursorState::Armed:      return "armed";
    case CursorState::Collecting: return "collecting";
  }
  return "unknown";
}

CheckpointTracker::CheckpointTracker(const CheckpointSet& set, const CheckpointParams& params)
  : set_(&set), params_(params) {
  validate(params_);
  if (set_->size() == 0) throw ConfigError("checkpoint set is empty", "checkpoints");
}

void CheckpointTracker::reset(std::size_t start_index) {
  cursor_ = start_index % set_->size();
  state_ = CursorState::Idle;
  steps_ = 0;
  laps_ = 0;
}

bool CheckpointTracker::advance_() {
  cursor_ = (cursor_ + 1) % set_->size();
  if (cursor_ == 0) {
    ++laps_;
    return true;
  }
  return false;
}

CheckpointUpdate CheckpointTracker::update(Vec2 car_pos, double forward_speed, double car_arc,
                                           const TrackGeometry& track) {
  CheckpointUpdate u{};
  ++steps_;
  if (state_ == CursorState::Idle) {
    if (steps_ <= params_.grace_steps) return u;
    state_ = CursorState::Armed;
  }

  if (reached(car_pos, set_->position(cursor_), params_.radius) &&
      forward_speed >= params_.min_forward_speed) {
    u.collected = true;
    u.lap_completed = advance_() || u.lap_completed;
    state_ = CursorState::Collecting;
  }

  // Skip checkpoints the car has clearly driven past without touching.
  const double limit = params_.auto_advance_multiplier * set_->average_spacing();
  for (std::size_t guard = 1; guard < set_->size(); ++guard) {
    const double ahead = track.arc_delta(set_->arc_at(cursor_), car_arc);
    if (ahead <= limit) break;
    u.lap_completed = advance_() || u.lap_completed;
    ++u.skipped;
  }
  return u;
}

} // namespace tdr
