#pragma once
#include <cstddef>
#include <vector>
#include <tdr/config.hpp>
#include <tdr/geom.hpp>

namespace tdr {

// Closed centerline loop with arc-length parameterization, derived walls and
// spawn pose. Immutable after construction.
//
// Progress is a fractional centerline index in [0, n): segment i runs from
// centerline[i] to centerline[(i+1) % n].
class TrackGeometry {
public:
  // Throws ConfigError for fewer than 2 points, zero-length segments or bad
  // track parameters.
  TrackGeometry(std::vector<Vec2> centerline, const TrackParams& params);

  const std::vector<Vec2>& centerline() const { return pts_; }
  const std::vector<Segment>& walls() const { return walls_; }
  const std::vector<Vec2>& inner_boundary() const { return inner_; }
  const std::vector<Vec2>& outer_boundary() const { return outer_; }
  std::size_t size() const { return pts_.size(); }
  double length() const { return length_; }
  double width() const { return width_; }
  const Pose& spawn() const { return spawn_; }
  // Start/finish line: full track width across centerline[0], facing along
  // the first segment.
  const Gate& start_gate() const { return start_gate_; }

  // Nearest-segment projection -> fractional index in [0, n).
  double get_track_progress(double x, double y) const;
  // Perpendicular distance to the nearest centerline segment.
  double get_lateral_displacement(double x, double y) const;
  // n values for the vertices after floor(progress); 0.5 = straight,
  // towards 0 = sharp left, towards 1 = sharp right.
  std::vector<double> get_curvature_lookahead(double progress, int n) const;

  // Arc length from centerline[0] to the given progress.
  double arc_length_at(double progress) const;
  // Shortest signed cyclic difference to - from, in index units.
  double progress_delta(double from, double to) const;
  // Shortest signed cyclic difference in arc length.
  double arc_delta(double from_arc, double to_arc) const;

  // Turn at vertex i between incoming and outgoing segments.
  double vertex_turn_angle(std::size_t i) const;  // unsigned, [0, pi]
  double signed_turn_angle(std::size_t i) const;  // CCW (left) positive

private:
  struct Projection { std::size_t seg; double t; double dist_sq; };
  Projection project_(Vec2 p) const;
  double wrap_progress_(double p) const;
  void build_cumulative_();
  void build_walls_(double max_miter);

  std::vector<Vec2> pts_;
  std::vector<double> cum_;   // cum_[i] = arc length at vertex i; cum_[n] = length_
  double length_{0.0};
  double width_{0.0};
  std::vector<Vec2> inner_;
  std::vector<Vec2> outer_;
  std::vector<Segment> walls_;
  Pose spawn_{};
  Gate start_gate_{};
};

} // namespace tdr
