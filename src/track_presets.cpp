#include <tdr/track_presets.hpp>
#include <cmath>
#include <cstddef>

namespace tdr {

namespace {

// Point at u in [0,1) on the uniform Catmull-Rom span P1 -> P2.
Vec2 catmull_rom(Vec2 p0, Vec2 p1, Vec2 p2, Vec2 p3, double u) {
  const Vec2 c1 = p2 - p0;
  const Vec2 c2 = 2.0 * p0 - 5.0 * p1 + 4.0 * p2 - p3;
  const Vec2 c3 = 3.0 * (p1 - p2) + p3 - p0;
  return p1 + 0.5 * (c1 * u + c2 * (u * u) + c3 * (u * u * u));
}

// Chicane into a long top straight, hairpin, then the bottom return (CCW).
constexpr double kChicaneHairpinCtrl[][2] = {
  { 1500, -600}, { 1500,  600}, {  400,  800}, { -100,  600},
  { -400,  300}, {-1200,  300}, {-1600,    0}, {-1500, -600},
  {-1200,-1000}, { -600,-1100}, {  400, -900}, { 1200, -800},
};

} // namespace

std::vector<Vec2> stadium_centerline(double straight_len, double radius, int arc_pts_per_quadrant) {
  std::vector<Vec2> pts;
  const double R = radius;
  const double L = straight_len * 0.5;
  const int steps = arc_pts_per_quadrant * 2;

  auto arc = [&](double cx, double a0, double a1){
    for (int i = 0; i <= steps; ++i) {
      const double a = a0 + (a1 - a0) * (double(i)/double(steps));
      pts.push_back({ cx + R*std::cos(a), R*std::sin(a) });
    }
  };

  // Right arc from (L, -R) up to (L, +R); the top straight is the implicit
  // segment to the left arc, which runs from (-L, +R) down to (-L, -R).
  // The bottom straight closes the loop.
  arc( L, -kPI/2.0, +kPI/2.0);
  arc(-L, +kPI/2.0, 3.0*kPI/2.0);
  return pts;
}

std::vector<Vec2> catmull_rom_centerline(const std::vector<Vec2>& ctrl, int samples_per_seg) {
  std::vector<Vec2> pts;
  const std::size_t n = ctrl.size();
  if (n < 3 || samples_per_seg < 1) return pts;

  pts.reserve(n * static_cast<std::size_t>(samples_per_seg));
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 p0 = ctrl[(i + n - 1) % n];
    const Vec2 p1 = ctrl[i];
    const Vec2 p2 = ctrl[(i + 1) % n];
    const Vec2 p3 = ctrl[(i + 2) % n];
    for (int k = 0; k < samples_per_seg; ++k) {
      pts.push_back(catmull_rom(p0, p1, p2, p3, double(k) / double(samples_per_seg)));
    }
  }
  return pts;
}

std::vector<Vec2> square_centerline(double side) {
  return {{0.0, 0.0}, {side, 0.0}, {side, side}, {0.0, side}};
}

std::vector<Vec2> make_preset_centerline(TrackPreset p) {
  switch (p) {
    case TrackPreset::ChicaneHairpin: {
      std::vector<Vec2> ctrl;
      for (const auto& c : kChicaneHairpinCtrl) ctrl.push_back({c[0], c[1]});
      return catmull_rom_centerline(ctrl, 6);
    }
    case TrackPreset::Square:
      return square_centerline(1600.0);
    case TrackPreset::Stadium:
    default:
      return stadium_centerline(1200.0, 400.0, 6);
  }
}

const char* preset_name(TrackPreset p) {
  switch (p) {
    case TrackPreset::Stadium:        return "Stadium";
    case TrackPreset::ChicaneHairpin: return "Chicane+Hairpin";
    case TrackPreset::Square:         return "Square";
    default: return "Unknown";
  }
}

std::optional<TrackPreset> preset_by_name(const std::string& name) {
  for (int i = 0; i < static_cast<int>(TrackPreset::Count); ++i) {
    const auto p = static_cast<TrackPreset>(i);
    if (name == preset_name(p)) return p;
  }
  return std::nullopt;
}

} // namespace tdr
