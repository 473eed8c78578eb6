#pragma once
#include <array>
#include <deque>
#include <tdr/config.hpp>
#include <tdr/geom.hpp>

namespace tdr {

// Discrete inputs for one tick. Accelerate wins over brake, left over right.
struct CarControls {
  bool accelerate = false;
  bool brake = false;
  bool steer_left = false;
  bool steer_right = false;
  bool handbrake = false;
};

// Rear-wheel sample left behind while drifting.
struct TrailPoint {
  Vec2 position{};
  double age = 0.0;      // seconds
  double opacity = 1.0;  // 1 fresh, 0 expired
};

struct CarState {
  Vec2 position{};
  Vec2 prev_position{};
  double heading = 0.0;          // rad, 0 = +x, CCW positive
  double speed = 0.0;            // signed, positive forward
  Vec2 velocity{};
  double angular_velocity = 0.0; // rad/s
  double health = 0.0;
  bool drifting = false;
};

// Bicycle-steering car with a grip-based drift mechanic. Fixed timestep: the
// caller supplies regular ticks and the model never sub-steps.
class CarDynamics {
public:
  // Throws ConfigError for invalid car, damage or drift parameters.
  CarDynamics(const CarParams& car, const DamageParams& damage, const DriftParams& drift);

  void reset(const Pose& pose);
  void step(double dt, const CarControls& in);

  // Front-left, front-right, rear-right, rear-left. Collision edge indices
  // depend on this order.
  std::array<Vec2, 4> corners() const;

  void apply_damage(double amount);
  bool is_alive() const { return s_.health > 0.0; }

  const CarState& state() const { return s_; }
  // Mutable access for collision resolution.
  CarState& state() { return s_; }
  Pose pose() const { return Pose{s_.position, s_.heading}; }

  const std::deque<TrailPoint>& trail() const { return trail_; }
  const CarParams& params() const { return car_; }
  const DamageParams& damage_params() const { return damage_; }

  // Clamp speed and health back into their configured ranges.
  void clamp_state();

private:
  void update_trail_(double dt);

  CarParams car_;
  DamageParams damage_;
  DriftParams drift_;
  CarState s_{};
  std::deque<TrailPoint> trail_;
};

} // namespace tdr
