#include <tdr/collision.hpp>
#include <algorithm>
#include <cmath>

namespace tdr {

static constexpr double kMinPenetration = 1.0;
static constexpr double kBounce = 0.3;

const char* car_edge_name(CarEdge e) {
  switch (e) {
    case CarEdge::Front: return "front";
    case CarEdge::Right: return "right";
    case CarEdge::Back:  return "back";
    case CarEdge::Left:  return "left";
  }
  return "unknown";
}

// Deepest corner on the wrong side of the wall line.
static double estimate_penetration(const std::array<Vec2, 4>& corners, Vec2 wall_point, Vec2 normal) {
  double deepest = 0.0;
  for (const Vec2& c : corners) {
    const double d = dot(c - wall_point, normal);
    if (d < 0.0) deepest = std::max(deepest, -d);
  }
  return deepest;
}

std::size_t detect_collisions(const std::array<Vec2, 4>& corners,
                              const std::vector<Segment>& walls,
                              CollisionBuffer& out) {
  out.clear();
  const Vec2 centre = (corners[0] + corners[1] + corners[2] + corners[3]) * 0.25;

  for (int e = 0; e < 4; ++e) {
    const Vec2 ea = corners[e];
    const Vec2 eb = corners[(e + 1) % 4];

    for (std::size_t w = 0; w < walls.size(); ++w) {
      const Segment& wall = walls[w];
      if (wall.is_degenerate()) continue;

      const auto hit = segment_intersection(ea, eb, wall.a, wall.b);
      if (!hit) continue;

      const Vec2 wd = wall.direction();
      const double len = length(wd);
      Vec2 n{-wd.y / len, wd.x / len};
      if (dot(n, centre - hit->point) < 0.0) n = n * -1.0;

      CollisionRecord rec{};
      rec.point = hit->point;
      rec.normal = n;
      rec.penetration = std::max(estimate_penetration(corners, wall.a, n), kMinPenetration);
      rec.wall = wall;
      rec.wall_index = w;
      rec.car_edge = static_cast<CarEdge>(e);
      out.push(rec);
    }
  }
  return out.size();
}

double resolve_collision(CarDynamics& car, const CollisionRecord& rec, const DamageParams& damage) {
  CarState& s = car.state();
  s.position += rec.normal * rec.penetration;

  const double vn = dot(s.velocity, rec.normal);
  if (vn < 0.0) {
    s.velocity -= rec.normal * (vn * (1.0 + kBounce));
    const double v = length(s.velocity);
    s.speed = (s.speed >= 0.0) ? v : -v;
    car.clamp_state();
  }

  const double impact = std::abs(vn);
  if (impact > damage.min_damage_speed) {
    return (impact - damage.min_damage_speed) * damage.wall_damage_multiplier;
  }
  return 0.0;
}

} // namespace tdr
