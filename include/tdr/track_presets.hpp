#pragma once
#include <optional>
#include <string>
#include <vector>
#include <tdr/geom.hpp>

namespace tdr {

enum class TrackPreset : int {
  Stadium = 0,
  ChicaneHairpin = 1,
  Square = 2,
  Count
};

// Rounded-rectangle "stadium" loop centered at (0,0), counter-clockwise.
// straight_len: length of each straight section (centerline)
// radius: corner radius (centerline)
// No point is repeated at the seam; the loop closes implicitly.
std::vector<Vec2> stadium_centerline(double straight_len, double radius, int arc_pts_per_quadrant = 12);

// Smooth closed loop through control points using a uniform Catmull-Rom spline.
// - ctrl: control polygon, treated as closed by wrapping indices
// - samples_per_seg: how many points to generate between each pair of control points
// Returns an empty vector for fewer than 3 control points.
std::vector<Vec2> catmull_rom_centerline(const std::vector<Vec2>& ctrl, int samples_per_seg = 24);

// Axis-aligned square, counter-clockwise from (0,0).
std::vector<Vec2> square_centerline(double side);

std::vector<Vec2> make_preset_centerline(TrackPreset p);
const char* preset_name(TrackPreset p);
// Case-sensitive match against preset_name().
std::optional<TrackPreset> preset_by_name(const std::string& name);

} // namespace tdr
