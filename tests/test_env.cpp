#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <random>

#include <tdr/env.hpp>
#include <tdr/errors.hpp>
#include <tdr/track_presets.hpp>

using Catch::Detail::Approx;
using namespace tdr;

static RacingEnv make_square_env(SimConfig cfg = {}) {
  return RacingEnv(cfg, TrackGeometry(square_centerline(1600.0), cfg.track));
}

static const Action kFullThrottle{0.0, 1.0, 0.0};
static const Action kIdle{};

TEST_CASE("quantize: thresholds and clamping") {
  SECTION("small inputs engage nothing") {
    const CarControls c = quantize({0.05, -0.05, 0.5});
    REQUIRE_FALSE(c.accelerate);
    REQUIRE_FALSE(c.brake);
    REQUIRE_FALSE(c.steer_left);
    REQUIRE_FALSE(c.steer_right);
    REQUIRE_FALSE(c.handbrake);
  }
  SECTION("negative steering is left, positive throttle accelerates") {
    const CarControls c = quantize({-0.2, 0.2, 0.6});
    REQUIRE(c.steer_left);
    REQUIRE(c.accelerate);
    REQUIRE(c.handbrake);
  }
  SECTION("out-of-range values are clamped, not rejected") {
    const CarControls c = quantize({5.0, -5.0, 2.0});
    REQUIRE(c.steer_right);
    REQUIRE(c.brake);
    REQUIRE(c.handbrake);
  }
  SECTION("non-finite components are an InputError") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(quantize({nan, 0.0, 0.0}), InputError);
    REQUIRE_THROWS_AS(quantize({0.0, inf, 0.0}), InputError);
    REQUIRE_THROWS_AS(quantize({0.0, 0.0, -inf}), InputError);
  }
}

TEST_CASE("RacingEnv: reset at the spawn pose") {
  RacingEnv env = make_square_env();
  REQUIRE(env.observation_size() == kCanonicalObservationSize);

  const ResetResult r = env.reset();
  REQUIRE(r.observation.size() == kCanonicalObservationSize);
  for (double v : r.observation) {
    REQUIRE(v >= 0.0);
    REQUIRE(v <= 1.0);
  }
  REQUIRE(r.info.laps == 0);
  REQUIRE(r.info.step_count == 0);
  REQUIRE(r.info.best_lap < 0.0);
  REQUIRE(r.info.lap_times.empty());
  REQUIRE(r.info.next_checkpoint == 1);
  REQUIRE(env.car().state().health == Approx(env.config().damage.max_health));
}

TEST_CASE("RacingEnv: reset to a custom pose targets the next checkpoint ahead") {
  RacingEnv env = make_square_env();
  const ResetResult r = env.reset(Pose{{800.0, 0.0}, 0.0});
  REQUIRE(env.car().state().position.x == Approx(800.0));

  const Vec2 next = env.checkpoints().position(r.info.next_checkpoint);
  REQUIRE(next.y == Approx(0.0).margin(1e-9));
  REQUIRE(next.x > 800.0);
  REQUIRE(next.x <= 800.0 + env.checkpoints().average_spacing());
}

TEST_CASE("RacingEnv: one idle step") {
  RacingEnv env = make_square_env();
  const StepResult r = env.step(kIdle);
  REQUIRE(env.step_count() == 1);
  REQUIRE(r.info.step_count == 1);
  REQUIRE(r.observation.size() == kCanonicalObservationSize);
  REQUIRE_FALSE(r.terminated);
  REQUIRE_FALSE(r.truncated);
  REQUIRE(r.breakdown.time_penalty == Approx(-0.01));
  REQUIRE(r.reward == Approx(r.breakdown.total()));
  REQUIRE(r.info.breakdown.time_penalty == Approx(-0.01));
}

TEST_CASE("RacingEnv: a rejected action does not advance the episode") {
  RacingEnv env = make_square_env();
  const Action bad{std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0};
  REQUIRE_THROWS_AS(env.step(bad), InputError);
  REQUIRE(env.step_count() == 0);
}

TEST_CASE("RacingEnv: accelerating down the first straight collects checkpoints") {
  RacingEnv env = make_square_env();
  int collected = 0;
  double total = 0.0;
  for (int i = 0; i < 120; ++i) {
    const StepResult r = env.step(kFullThrottle);
    REQUIRE_FALSE(r.terminated);
    REQUIRE_FALSE(r.truncated);
    if (r.info.checkpoint_reached) {
      ++collected;
      REQUIRE(r.breakdown.checkpoint == Approx(2.0));
    }
    total += r.reward;
  }
  REQUIRE(collected >= 3);
  REQUIRE(total > 0.0);
  REQUIRE(env.tracker().next_index() > 3);
  REQUIRE(env.car().state().speed == Approx(400.0));
  REQUIRE(env.last_collisions().empty());
}

TEST_CASE("RacingEnv: collecting the last checkpoint completes a lap") {
  RacingEnv env = make_square_env();
  const std::size_t last = env.checkpoints().size() - 1;
  const Vec2 lp = env.checkpoints().position(last);
  REQUIRE(lp.x == Approx(0.0).margin(1e-9));

  const ResetResult start = env.reset(Pose{{lp.x, lp.y + 100.0}, -kPI / 2.0});
  REQUIRE(start.info.next_checkpoint == last);

  bool lap = false;
  for (int i = 0; i < 80 && !lap; ++i) {
    const StepResult r = env.step(kFullThrottle);
    lap = r.info.lap_completed;
    if (lap) {
      REQUIRE(r.info.laps == 1);
      REQUIRE(r.info.next_checkpoint == 0);
      REQUIRE(r.info.lap_times.size() == 1);
      REQUIRE(r.info.best_lap == Approx(r.info.step_count * env.config().dt()));
      REQUIRE(r.breakdown.lap == Approx(20.0));
      REQUIRE(r.breakdown.checkpoint == Approx(2.0));
    }
  }
  REQUIRE(lap);
}

TEST_CASE("RacingEnv: start/finish line counts forward crossings only") {
  RacingEnv env = make_square_env();

  SECTION("driving off the line from the spawn pose") {
    env.reset();
    for (int i = 0; i < 30; ++i) REQUIRE_FALSE(env.step(kFullThrottle).info.start_line_crossed);
  }
  SECTION("approaching from behind the line") {
    env.reset(Pose{{-30.0, 0.0}, 0.0});
    int flagged = 0;
    StepResult r{};
    for (int i = 0; i < 60; ++i) {
      r = env.step(kFullThrottle);
      if (r.info.start_line_crossed) ++flagged;
    }
    REQUIRE(flagged == 1);
    REQUIRE(r.info.start_line_crossings == 1);
    REQUIRE(env.car().state().position.x > 0.0);
    REQUIRE(env.reset().info.start_line_crossings == 0);
  }
  SECTION("driving the wrong way through it") {
    env.reset(Pose{{30.0, 0.0}, kPI});
    StepResult r{};
    for (int i = 0; i < 40; ++i) r = env.step(kFullThrottle);
    REQUIRE(env.car().state().position.x < 0.0);
    REQUIRE(r.info.start_line_crossings == 0);
  }
}

TEST_CASE("RacingEnv: the step budget truncates the episode") {
  SimConfig cfg{};
  cfg.episode.max_episode_steps = 5;
  RacingEnv env = make_square_env(cfg);
  for (int i = 1; i < 5; ++i) {
    REQUIRE_FALSE(env.step(kFullThrottle).truncated);
  }
  const StepResult r = env.step(kFullThrottle);
  REQUIRE(r.truncated);
  REQUIRE_FALSE(r.terminated);
  REQUIRE_FALSE(r.info.stuck);

  // reset starts a fresh episode
  REQUIRE(env.reset().info.step_count == 0);
  REQUIRE_FALSE(env.step(kFullThrottle).truncated);
}

TEST_CASE("RacingEnv: standing still is truncated as stuck") {
  SimConfig cfg{};
  cfg.episode.stuck_timeout = 0.1;  // about six ticks
  RacingEnv env = make_square_env(cfg);

  StepResult r{};
  int steps = 0;
  do {
    r = env.step(kIdle);
    ++steps;
  } while (!r.truncated && steps < 20);

  REQUIRE(r.truncated);
  REQUIRE_FALSE(r.terminated);
  REQUIRE(r.info.stuck);
  REQUIRE(steps <= 6);
  REQUIRE(r.breakdown.stuck_penalty == Approx(-cfg.reward.death_penalty));
}

TEST_CASE("RacingEnv: random driving keeps the car state in range") {
  RacingEnv env = make_square_env();
  const CarParams& car = env.config().car;
  const double max_health = env.config().damage.max_health;

  std::mt19937 rng(7);
  std::uniform_real_distribution<double> sym(-1.0, 1.0);
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  for (int i = 0; i < 2000; ++i) {
    const StepResult r = env.step({sym(rng), sym(rng), unit(rng)});
    const CarState& s = env.car().state();
    REQUIRE(s.speed <= car.max_speed);
    REQUIRE(s.speed >= -car.reverse_max_speed);
    REQUIRE(s.health >= 0.0);
    REQUIRE(s.health <= max_health);
    REQUIRE(r.terminated == (s.health <= 0.0));
    for (double v : r.observation) {
      REQUIRE(v >= 0.0);
      REQUIRE(v <= 1.0);
    }
    if (r.terminated || r.truncated) env.reset();
  }
}

TEST_CASE("RacingEnv: reward_range matches the configured weights") {
  RacingEnv env = make_square_env();
  const auto [lo, hi] = env.reward_range();
  const auto expected = reward_range(env.config().reward, env.config().damage, env.config().track);
  REQUIRE(lo == Approx(expected.first));
  REQUIRE(hi == Approx(expected.second));
  REQUIRE(lo < 0.0);
  REQUIRE(hi > 0.0);
}

TEST_CASE("RacingEnv: invalid config is rejected at construction") {
  SimConfig cfg{};
  cfg.episode.fps = -1.0;
  REQUIRE_THROWS_AS(make_square_env(cfg), ConfigError);
}
