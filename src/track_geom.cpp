#include <tdr/track_geom.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <tdr/errors.hpp>
#include <tdr/log.hpp>

namespace tdr {

namespace {

Vec2 unit(Vec2 v) {
  const double len = length(v);
  return {v.x / len, v.y / len};
}

Vec2 left_normal(Vec2 d) { return {-d.y, d.x}; }

// Shoelace sign (CCW positive, CW negative)
double polygon_area_sign(const std::vector<Vec2>& pts) {
  double A = 0.0;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    const Vec2& p = pts[i];
    const Vec2& q = pts[(i + 1) % pts.size()];
    A += p.x * q.y - q.x * p.y;
  }
  return (A >= 0.0) ? +1.0 : -1.0;
}

} // namespace

TrackGeometry::TrackGeometry(std::vector<Vec2> centerline, const TrackParams& params)
  : pts_(std::move(centerline)) {
  validate(params);
  if (pts_.size() < 2) {
    throw ConfigError("centerline needs at least 2 points, got " + std::to_string(pts_.size()),
                      "track");
  }
  const std::size_t n = pts_.size();
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = pts_[i];
    const Vec2& b = pts_[(i + 1) % n];
    if (!std::isfinite(a.x) || !std::isfinite(a.y)) {
      throw ConfigError("centerline point " + std::to_string(i) + " is not finite", "track");
    }
    if (length_sq(b - a) < kDegenerateLenSq) {
      throw ConfigError("centerline segment " + std::to_string(i) + " has zero length", "track");
    }
  }

  width_ = params.track_width;
  build_cumulative_();
  build_walls_(params.max_miter);

  const Vec2 dir0 = unit(pts_[1] - pts_[0]);
  spawn_.position = pts_[0] + dir0 * params.spawn_offset;
  spawn_.heading_rad = std::atan2(dir0.y, dir0.x);

  const Vec2 across = left_normal(dir0) * (0.5 * width_);
  start_gate_.line = Segment{pts_[0] - across, pts_[0] + across};
  start_gate_.direction = dir0;

  log::logger()->debug("track: {} centerline pts, length {:.1f}, {} wall segments",
                       n, length_, walls_.size());
}

void TrackGeometry::build_cumulative_() {
  const std::size_t n = pts_.size();
  cum_.resize(n + 1);
  cum_[0] = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    cum_[i + 1] = cum_[i] + tdr::length(pts_[(i + 1) % n] - pts_[i]);
  }
  length_ = cum_.back();
}

void TrackGeometry::build_walls_(double max_miter) {
  const std::size_t n = pts_.size();
  const double hw = 0.5 * width_;
  std::vector<Vec2> left(n), right(n);

  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 d_in  = unit(pts_[i] - pts_[(i + n - 1) % n]);
    const Vec2 d_out = unit(pts_[(i + 1) % n] - pts_[i]);
    const Vec2 n_in  = left_normal(d_in);
    const Vec2 n_out = left_normal(d_out);

    Vec2 m = n_in + n_out;
    double scale = 1.0;
    if (length_sq(m) < 1e-12) {
      // Full reversal: no usable miter, offset along the outgoing normal.
      m = n_out;
    } else {
      m = unit(m);
      const double c = dot(m, n_out);
      scale = std::min(1.0 / c, max_miter);
    }
    left[i]  = pts_[i] + m * (hw * scale);
    right[i] = pts_[i] - m * (hw * scale);
  }

  // For a counter-clockwise loop the left offset is the infield side.
  if (polygon_area_sign(pts_) > 0.0) {
    inner_ = std::move(left);
    outer_ = std::move(right);
  } else {
    inner_ = std::move(right);
    outer_ = std::move(left);
  }

  walls_.clear();
  walls_.reserve(2 * n);
  for (const auto* boundary : {&inner_, &outer_}) {
    for (std::size_t i = 0; i < n; ++i) {
      Segment s{(*boundary)[i], (*boundary)[(i + 1) % n]};
      if (s.is_degenerate()) continue;
      walls_.push_back(s);
    }
  }
}

TrackGeometry::Projection TrackGeometry::project_(Vec2 p) const {
  const std::size_t n = pts_.size();
  Projection best{0, 0.0, -1.0};
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 a = pts_[i];
    const Vec2 ab = pts_[(i + 1) % n] - a;
    double t = dot(p - a, ab) / length_sq(ab);
    t = std::clamp(t, 0.0, 1.0);
    const double d2 = length_sq(p - (a + ab * t));
    if (best.dist_sq < 0.0 || d2 < best.dist_sq) best = {i, t, d2};
  }
  return best;
}

double TrackGeometry::wrap_progress_(double p) const {
  const double n = static_cast<double>(pts_.size());
  double w = std::fmod(p, n);
  if (w < 0.0) w += n;
  if (w >= n) w = 0.0;
  return w;
}

double TrackGeometry::get_track_progress(double x, double y) const {
  const Projection pr = project_({x, y});
  return wrap_progress_(static_cast<double>(pr.seg) + pr.t);
}

double TrackGeometry::get_lateral_displacement(double x, double y) const {
  return std::sqrt(project_({x, y}).dist_sq);
}

std::vector<double> TrackGeometry::get_curvature_lookahead(double progress, int n) const {
  std::vector<double> out;
  if (n <= 0) return out;
  out.reserve(static_cast<std::size_t>(n));
  const std::size_t count = pts_.size();
  const auto base = static_cast<std::size_t>(std::floor(wrap_progress_(progress)));
  for (int k = 1; k <= n; ++k) {
    const std::size_t v = (base + static_cast<std::size_t>(k)) % count;
    const double curv = 0.5 - signed_turn_angle(v) / kTAU;
    out.push_back(std::clamp(curv, 0.0, 1.0));
  }
  return out;
}

double TrackGeometry::arc_length_at(double progress) const {
  const double w = wrap_progress_(progress);
  const auto i = static_cast<std::size_t>(std::floor(w));
  const double t = w - static_cast<double>(i);
  return cum_[i] + t * (cum_[i + 1] - cum_[i]);
}

double TrackGeometry::progress_delta(double from, double to) const {
  const double n = static_cast<double>(pts_.size());
  double d = wrap_progress_(to) - wrap_progress_(from);
  if (d > 0.5 * n) d -= n;
  else if (d < -0.5 * n) d += n;
  return d;
}

double TrackGeometry::arc_delta(double from_arc, double to_arc) const {
  double d = std::fmod(to_arc - from_arc, length_);
  if (d > 0.5 * length_) d -= length_;
  else if (d < -0.5 * length_) d += length_;
  return d;
}

double TrackGeometry::signed_turn_angle(std::size_t i) const {
  const std::size_t n = pts_.size();
  i %= n;
  const Vec2 d_in  = pts_[i] - pts_[(i + n - 1) % n];
  const Vec2 d_out = pts_[(i + 1) % n] - pts_[i];
  return std::atan2(cross(d_in, d_out), dot(d_in, d_out));
}

double TrackGeometry::vertex_turn_angle(std::size_t i) const {
  return std::abs(signed_turn_angle(i));
}

} // namespace tdr
