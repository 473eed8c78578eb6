#include <tdr/car.hpp>
#include <algorithm>
#include <cmath>

namespace tdr {

static constexpr double kMinSteerSpeed = 10.0;   // below this steering and drift do nothing
static constexpr double kSnapSpeed = 1.0;        // coasting speed snapped to 0 below this
static constexpr double kDriftSpin = 1.05;       // angular velocity gain per drifting tick
static constexpr double kSpinDamping = 0.92;     // angular velocity decay per tick
static constexpr double kResidualSpin = 0.01;    // rad/s; below this residual spin is ignored

CarDynamics::CarDynamics(const CarParams& car, const DamageParams& damage, const DriftParams& drift)
  : car_(car), damage_(damage), drift_(drift) {
  validate(car_);
  validate(damage_);
  validate(drift_);
  reset(Pose{});
}

void CarDynamics::reset(const Pose& pose) {
  s_ = CarState{};
  s_.position = pose.position;
  s_.prev_position = pose.position;
  s_.heading = pose.heading_rad;
  s_.health = damage_.max_health;
  trail_.clear();
}

void CarDynamics::step(double dt, const CarControls& in) {
  // Speed
  if (in.accelerate) {
    s_.speed = std::min(s_.speed + car_.acceleration * dt, car_.max_speed);
  } else if (in.brake) {
    if (s_.speed > 0.0) {
      s_.speed = std::max(s_.speed - car_.brake_force * dt, 0.0);
    } else {
      s_.speed = std::max(s_.speed - car_.acceleration * dt, -car_.reverse_max_speed);
    }
  } else {
    s_.speed *= std::pow(car_.friction_per_second, dt);
    if (std::abs(s_.speed) < kSnapSpeed) s_.speed = 0.0;
  }

  // Steering; reversing steers the other way through the signed fraction.
  const bool steering = in.steer_left || in.steer_right;
  if (std::abs(s_.speed) > kMinSteerSpeed) {
    const double frac = s_.speed / car_.max_speed;
    const double turn = car_.steering_speed * dt * frac;
    if (in.steer_left) {
      s_.heading += turn;
      s_.angular_velocity = car_.steering_speed * frac;
    } else if (in.steer_right) {
      s_.heading -= turn;
      s_.angular_velocity = -car_.steering_speed * frac;
    }
  } else {
    s_.angular_velocity = 0.0;
  }

  // Drift
  double grip = car_.normal_grip;
  s_.drifting = in.handbrake && std::abs(s_.speed) > kMinSteerSpeed;
  if (s_.drifting) {
    grip = car_.drift_grip_multiplier;
    s_.angular_velocity *= kDriftSpin;
  }

  s_.angular_velocity *= kSpinDamping;
  if (!steering && std::abs(s_.angular_velocity) > kResidualSpin) {
    s_.heading += s_.angular_velocity * dt;
  }
  s_.heading = wrap_angle(s_.heading);

  // Velocity lags the heading by (1 - grip).
  const Vec2 intended = from_angle(s_.heading) * s_.speed;
  s_.velocity = s_.velocity * (1.0 - grip) + intended * grip;

  s_.prev_position = s_.position;
  s_.position += s_.velocity * dt;

  update_trail_(dt);
}

void CarDynamics::update_trail_(double dt) {
  if (s_.drifting && std::abs(s_.speed) > damage_.min_damage_speed) {
    const double hl = car_.length * 0.5;
    const double hw = car_.width * 0.5;
    const double c = std::cos(s_.heading);
    const double s = std::sin(s_.heading);
    const Vec2 back{s_.position.x - c * hl, s_.position.y - s * hl};
    trail_.push_back(TrailPoint{{back.x + s * hw, back.y - c * hw}});
    trail_.push_back(TrailPoint{{back.x - s * hw, back.y + c * hw}});
  }

  for (auto& p : trail_) {
    p.age += dt;
    p.opacity = std::max(0.0, 1.0 - p.age / drift_.trail_lifetime);
  }
  // Samples are appended in age order, so expired ones sit at the front.
  while (!trail_.empty() && trail_.front().age >= drift_.trail_lifetime) trail_.pop_front();
  while (trail_.size() > drift_.max_trail_points) trail_.pop_front();
}

std::array<Vec2, 4> CarDynamics::corners() const {
  const double hl = car_.length * 0.5;
  const double hw = car_.width * 0.5;
  const double c = std::cos(s_.heading);
  const double s = std::sin(s_.heading);
  const Vec2 f{c * hl, s * hl};   // forward
  const Vec2 r{s * hw, -c * hw};  // right
  const Vec2 p = s_.position;
  return {p + f - r, p + f + r, p - f + r, p - f - r};
}

void CarDynamics::apply_damage(double amount) {
  s_.health = std::max(0.0, s_.health - amount);
}

void CarDynamics::clamp_state() {
  s_.speed = std::clamp(s_.speed, -car_.reverse_max_speed, car_.max_speed);
  s_.health = std::clamp(s_.health, 0.0, damage_.max_health);
}

} // namespace tdr
