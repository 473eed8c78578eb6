#pragma once
#include <array>
#include <cstddef>
#include <vector>
#include <tdr/car.hpp>
#include <tdr/config.hpp>
#include <tdr/geom.hpp>

namespace tdr {

enum class CarEdge : int {
  Front = 0,  // FL -> FR
  Right = 1,  // FR -> RR
  Back  = 2,  // RR -> RL
  Left  = 3   // RL -> FL
};

const char* car_edge_name(CarEdge e);

// One car-edge / wall crossing found this tick.
struct CollisionRecord {
  Vec2 point{};
  Vec2 normal{};            // unit, wall perpendicular, pointing toward the car centre
  double penetration = 0.0; // >= 1
  Segment wall{};
  std::size_t wall_index = 0;
  CarEdge car_edge = CarEdge::Front;
};

// Caller-owned, fixed-capacity record buffer reused every tick. Records past
// capacity are dropped and counted.
class CollisionBuffer {
public:
  static constexpr std::size_t kCapacity = 64;

  void clear() { size_ = 0; dropped_ = 0; }
  bool push(const CollisionRecord& r) {
    if (size_ == kCapacity) { ++dropped_; return false; }
    items_[size_++] = r;
    return true;
  }

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  std::size_t dropped() const { return dropped_; }
  const CollisionRecord& operator[](std::size_t i) const { return items_[i]; }
  const CollisionRecord* begin() const { return items_.data(); }
  const CollisionRecord* end() const { return items_.data() + size_; }

private:
  std::array<CollisionRecord, kCapacity> items_{};
  std::size_t size_{0};
  std::size_t dropped_{0};
};

// Test all four car edges against every wall. Clears the buffer first and
// returns the number of records written. Degenerate walls are skipped.
std::size_t detect_collisions(const std::array<Vec2, 4>& corners,
                              const std::vector<Segment>& walls,
                              CollisionBuffer& out);

// Push the car out along the record normal, kill the inward velocity with a
// 30% rebound and return the impact damage. The caller applies the damage.
double resolve_collision(CarDynamics& car, const CollisionRecord& rec, const DamageParams& damage);

} // namespace tdr
