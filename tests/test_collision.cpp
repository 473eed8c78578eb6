#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include <tdr/car.hpp>
#include <tdr/collision.hpp>

using Catch::Detail::Approx;
using namespace tdr;

// Car facing +y with its front edge poking across the wall x = 0 near the
// wall's lower end. Only the front edge reaches the segment.
static CarDynamics car_at_wall_end() {
  CarDynamics car(CarParams{}, DamageParams{}, DriftParams{});
  car.reset(Pose{{-5.0, 10.0}, kPI / 2.0});
  car.state().velocity = {100.0, 0.0};  // sliding in +x
  car.state().speed = 100.0;
  return car;
}

static const std::vector<Segment> kWall{{{0.0, 0.0}, {0.0, 100.0}}};

TEST_CASE("detect_collisions: front edge against a vertical wall") {
  CarDynamics car = car_at_wall_end();
  CollisionBuffer buf;
  const std::size_t n = detect_collisions(car.corners(), kWall, buf);

  REQUIRE(n == 1);
  const CollisionRecord& r = buf[0];
  REQUIRE(r.car_edge == CarEdge::Front);
  REQUIRE(static_cast<int>(r.car_edge) == 0);
  REQUIRE(r.normal.x == Approx(-1.0));
  REQUIRE(r.normal.y == Approx(0.0).margin(1e-12));
  REQUIRE(r.point.x == Approx(0.0).margin(1e-9));
  REQUIRE(r.point.y == Approx(30.0));
  REQUIRE(r.penetration == Approx(5.0));
  REQUIRE(r.wall_index == 0);
}

TEST_CASE("detect_collisions: no walls, degenerate walls and clear space") {
  CarDynamics car = car_at_wall_end();
  CollisionBuffer buf;
  REQUIRE(detect_collisions(car.corners(), {}, buf) == 0);

  const std::vector<Segment> degenerate{{{0.0, 20.0}, {0.0, 20.0}}};
  REQUIRE(detect_collisions(car.corners(), degenerate, buf) == 0);

  const std::vector<Segment> far{{{500.0, 0.0}, {500.0, 100.0}}};
  REQUIRE(detect_collisions(car.corners(), far, buf) == 0);
}

TEST_CASE("detect_collisions: penetration is floored at one unit") {
  CarDynamics car(CarParams{}, DamageParams{}, DriftParams{});
  // Right side at x = -9.5, so the deepest corner is only 0.5 past x = -10.
  car.reset(Pose{{-19.5, 50.0}, kPI / 2.0});
  const std::vector<Segment> wall{{{-10.0, 0.0}, {-10.0, 45.0}}};
  CollisionBuffer buf;
  REQUIRE(detect_collisions(car.corners(), wall, buf) == 1);
  REQUIRE(buf[0].car_edge == CarEdge::Back);
  REQUIRE(buf[0].penetration == Approx(1.0));
}

TEST_CASE("resolve_collision pushes out, reflects 30% and reports damage") {
  CarDynamics car = car_at_wall_end();
  CollisionBuffer buf;
  detect_collisions(car.corners(), kWall, buf);
  REQUIRE(buf.size() == 1);

  DamageParams dmg{};
  const double damage = resolve_collision(car, buf[0], dmg);

  const CarState& s = car.state();
  REQUIRE(s.position.x == Approx(-10.0));
  REQUIRE(s.velocity.x == Approx(-30.0));
  REQUIRE(s.speed == Approx(30.0));
  // impact 100, threshold 50, multiplier 0.5
  REQUIRE(damage == Approx(25.0));

  SECTION("re-detecting after resolution never reports a deeper penetration") {
    CollisionBuffer again;
    detect_collisions(car.corners(), kWall, again);
    for (const auto& r : again) REQUIRE(r.penetration <= buf[0].penetration);
  }
}

TEST_CASE("resolve_collision: slow impacts are free, separating motion keeps its velocity") {
  CarDynamics car = car_at_wall_end();
  car.state().velocity = {40.0, 0.0};
  CollisionBuffer buf;
  detect_collisions(car.corners(), kWall, buf);
  REQUIRE(resolve_collision(car, buf[0], DamageParams{}) == 0.0);

  CarDynamics away = car_at_wall_end();
  away.state().velocity = {-80.0, 0.0};
  const double before = away.state().velocity.x;
  detect_collisions(away.corners(), kWall, buf);
  REQUIRE(resolve_collision(away, buf[0], DamageParams{}) == Approx(15.0));
  REQUIRE(away.state().velocity.x == before);  // not moving into the wall
}

TEST_CASE("resolve_collision keeps reverse speed negative and in range") {
  CarDynamics car = car_at_wall_end();
  car.state().speed = -20.0;
  car.state().velocity = {500.0, 0.0};
  CollisionBuffer buf;
  detect_collisions(car.corners(), kWall, buf);
  resolve_collision(car, buf[0], DamageParams{});
  REQUIRE(car.state().speed < 0.0);
  REQUIRE(car.state().speed >= -CarParams{}.reverse_max_speed);
}

TEST_CASE("CollisionBuffer drops and counts records past capacity") {
  CollisionBuffer buf;
  for (std::size_t i = 0; i < CollisionBuffer::kCapacity + 5; ++i) {
    CollisionRecord r{};
    r.wall_index = i;
    buf.push(r);
  }
  REQUIRE(buf.size() == CollisionBuffer::kCapacity);
  REQUIRE(buf.dropped() == 5);
  REQUIRE(buf[CollisionBuffer::kCapacity - 1].wall_index == CollisionBuffer::kCapacity - 1);

  buf.clear();
  REQUIRE(buf.empty());
  REQUIRE(buf.dropped() == 0);
}

TEST_CASE("car_edge_name") {
  REQUIRE(std::string(car_edge_name(CarEdge::Front)) == "front");
  REQUIRE(std::string(car_edge_name(CarEdge::Left)) == "left");
}
