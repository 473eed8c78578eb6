#pragma once
#include <cstddef>
#include <vector>
#include <tdr/config.hpp>
#include <tdr/geom.hpp>
#include <tdr/track_geom.hpp>

namespace tdr {

// Segment indices (segment i leaves vertex i) whose leading vertex turns by
// more than threshold radians. Vertices next to a zero-length segment are
// skipped.
std::vector<std::size_t> tight_section_indices(const std::vector<Vec2>& centerline, double threshold);

// Walk the closed centerline by arc length and drop a checkpoint every
// spacing units (spacing * zigzag_multiplier inside tight segments). The
// first checkpoint is always centerline[0]. Deterministic; throws
// ConfigError for non-positive spacing or multiplier.
std::vector<Vec2> generate_checkpoints(const std::vector<Vec2>& centerline,
                                       double spacing,
                                       const std::vector<std::size_t>& tight = {},
                                       double zigzag_multiplier = 0.7);

// Radius test, not a crossing test: dx^2 + dy^2 <= radius^2.
inline bool reached(Vec2 car_pos, Vec2 checkpoint_pos, double radius) {
  const double dx = car_pos.x - checkpoint_pos.x;
  const double dy = car_pos.y - checkpoint_pos.y;
  return dx*dx + dy*dy <= radius*radius;
}

// Crossing test for a directed gate: the move prev -> pos must intersect the
// gate line and travel along gate.direction. Starting exactly on the line
// does not count, ending on it does, so a car never scores one line twice.
bool crossed_gate(Vec2 prev, Vec2 pos, const Gate& gate);

// Ordered cyclic checkpoint list bound to a track. Built once, never mutated.
class CheckpointSet {
public:
  CheckpointSet(const TrackGeometry& track, const CheckpointParams& params);

  std::size_t size() const { return pts_.size(); }
  const std::vector<Vec2>& positions() const { return pts_; }
  const Vec2& position(std::size_t i) const { return pts_[i]; }
  // Arc position of checkpoint i along the centerline.
  double arc_at(std::size_t i) const { return arc_[i]; }
  double average_spacing() const { return avg_spacing_; }
  const std::vector<std::size_t>& tight_segments() const { return tight_; }

  // Nearest checkpoint (by forward arc distance) lying in front of the pose's
  // heading. Falls back to 0 when none is in front.
  std::size_t first_ahead_of(const Pose& pose, const TrackGeometry& track) const;

private:
  std::vector<std::size_t> tight_;
  std::vector<Vec2> pts_;
  std::vector<double> arc_;
  double avg_spacing_{0.0};
};

enum class CursorState {
  Idle,       // grace period running, nothing counts
  Armed,      // grace elapsed, waiting for the first collection
  Collecting  // at least one checkpoint collected this episode
};

const char* cursor_state_name(CursorState s);

struct CheckpointUpdate {
  bool collected = false;      // the cursor checkpoint was reached this tick
  std::size_t skipped = 0;     // checkpoints passed over by auto-advance
  bool lap_completed = false;  // cursor wrapped from last to first
};

// Episode-owned cursor over a CheckpointSet. Only update() moves it.
class CheckpointTracker {
public:
  CheckpointTracker(const CheckpointSet& set, const CheckpointParams& params);

  void reset(std::size_t start_index);

  // One call per tick, after collision resolution.
  CheckpointUpdate update(Vec2 car_pos, double forward_speed, double car_arc,
                          const TrackGeometry& track);

  std::size_t next_index() const { return cursor_; }
  CursorState state() const { return state_; }
  int steps_since_reset() const { return steps_; }
  std::size_t laps() const { return laps_; }

private:
  bool advance_();  // returns true on lap wrap

  const CheckpointSet* set_;
  CheckpointParams params_;
  std::size_t cursor_{0};
  CursorState state_{CursorState::Idle};
  int steps_{0};
  std::size_t laps_{0};
};

} // namespace tdr
