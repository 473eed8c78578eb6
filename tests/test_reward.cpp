#include <catch2/catch.hpp>

#include <tdr/reward.hpp>

using Catch::Detail::Approx;
using namespace tdr;

TEST_CASE("compute_reward: every component on a good tick") {
  const RewardWeights w{};
  StepSignals s{};
  s.checkpoint_reached = true;
  s.lap_completed = true;
  s.wall_damage = 10.0;
  s.speed = 200.0;
  s.prev_steering = 0.0;
  s.curr_steering = 0.05;
  s.forward_progress = 0.1;
  s.lateral_displacement = 20.0;

  const RewardBreakdown b = compute_reward(s, w, 400.0);
  REQUIRE(b.checkpoint == Approx(2.0));
  REQUIRE(b.lap == Approx(20.0));
  REQUIRE(b.speed == Approx(0.05));
  REQUIRE(b.forward_progress == Approx(0.2));
  REQUIRE(b.lateral_penalty == Approx(-0.1));
  REQUIRE(b.wall_penalty == Approx(-5.0));
  REQUIRE(b.death_penalty == Approx(0.0));
  REQUIRE(b.time_penalty == Approx(-0.01));
  REQUIRE(b.smooth_steering == Approx(0.01));
  REQUIRE(b.stuck_penalty == Approx(0.0));
  REQUIRE(b.total() == Approx(17.15));
}

TEST_CASE("compute_reward: penalties") {
  const RewardWeights w{};

  SECTION("backward progress uses its own scale") {
    StepSignals s{};
    s.forward_progress = -0.4;
    REQUIRE(compute_reward(s, w, 400.0).forward_progress == Approx(-0.2));
  }
  SECTION("death and stuck each cost the death penalty") {
    StepSignals s{};
    s.dead = true;
    s.stuck = true;
    const auto b = compute_reward(s, w, 400.0);
    REQUIRE(b.death_penalty == Approx(-20.0));
    REQUIRE(b.stuck_penalty == Approx(-20.0));
  }
  SECTION("jerky steering loses the smooth steering bonus") {
    StepSignals s{};
    s.prev_steering = -0.3;
    s.curr_steering = 0.2;
    REQUIRE(compute_reward(s, w, 400.0).smooth_steering == Approx(0.0));
  }
  SECTION("an idle tick only pays time and smoothness") {
    const auto b = compute_reward(StepSignals{}, w, 400.0);
    REQUIRE(b.total() == Approx(0.0).margin(1e-12));
  }
}

TEST_CASE("compute_reward: speed fraction is capped and sign-free") {
  const RewardWeights w{};
  StepSignals s{};
  s.speed = -1000.0;
  REQUIRE(compute_reward(s, w, 400.0).speed == Approx(0.1));
  REQUIRE(compute_reward(s, w, 0.0).speed == Approx(0.0));
}

TEST_CASE("RewardBreakdown::to_map names every component") {
  RewardBreakdown b{};
  b.lap = 20.0;
  b.time_penalty = -0.01;
  const auto m = b.to_map();
  REQUIRE(m.size() == 10);
  REQUIRE(m.at("lap") == Approx(20.0));
  REQUIRE(m.at("time_penalty") == Approx(-0.01));
  REQUIRE(m.count("stuck_penalty") == 1);

  double sum = 0.0;
  for (const auto& [name, v] : m) sum += v;
  REQUIRE(sum == Approx(b.total()));
}

TEST_CASE("reward_range brackets a single step") {
  const auto [lo, hi] = reward_range(RewardWeights{}, DamageParams{}, TrackParams{});
  REQUIRE(lo == Approx(-90.81));
  REQUIRE(hi == Approx(22.31));
  REQUIRE(lo < 0.0);
  REQUIRE(hi > 0.0);
}
