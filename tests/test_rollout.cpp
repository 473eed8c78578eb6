#include <catch2/catch.hpp>
#include <limits>
#include <random>
#include <vector>

#include <tdr/errors.hpp>
#include <tdr/rollout.hpp>
#include <tdr/track_presets.hpp>

using namespace tdr;

static SimConfig short_episodes() {
  SimConfig cfg{};
  cfg.episode.max_episode_steps = 200;
  return cfg;
}

TEST_CASE("run_episode stops at the step budget or earlier") {
  const SimConfig cfg = short_episodes();
  RacingEnv env(cfg, TrackGeometry(square_centerline(1600.0), cfg.track));
  std::mt19937 rng(3);
  const EpisodeSummary s = run_episode(env, random_policy(), rng);
  REQUIRE(s.steps > 0);
  REQUIRE(s.steps <= 200);
  REQUIRE((s.terminated || s.truncated));
}

TEST_CASE("run_parallel_rollouts: one result per instance and episode, in order") {
  const SimConfig cfg = short_episodes();
  const TrackGeometry track(make_preset_centerline(TrackPreset::Stadium), cfg.track);

  RolloutOptions opts{};
  opts.instances = 3;
  opts.episodes_per_instance = 2;
  opts.base_seed = 11;

  const auto results = run_parallel_rollouts(cfg, track, opts, random_policy());
  REQUIRE(results.size() == 6);
  for (std::size_t i = 0; i < results.size(); ++i) {
    REQUIRE(results[i].instance == i / 2);
    REQUIRE(results[i].episode == i % 2);
    REQUIRE(results[i].steps > 0);
    REQUIRE(results[i].steps <= 200);
  }
}

TEST_CASE("run_parallel_rollouts: results depend only on the seeds") {
  const SimConfig cfg = short_episodes();
  const TrackGeometry track(make_preset_centerline(TrackPreset::ChicaneHairpin), cfg.track);

  RolloutOptions opts{};
  opts.instances = 2;
  opts.base_seed = 5;

  const auto a = run_parallel_rollouts(cfg, track, opts, random_policy());
  const auto b = run_parallel_rollouts(cfg, track, opts, random_policy());
  REQUIRE(a == b);

  // A single instance with the same seed replays instance 0.
  RolloutOptions one = opts;
  one.instances = 1;
  const auto c = run_parallel_rollouts(cfg, track, one, random_policy());
  REQUIRE(c.size() == 1);
  REQUIRE(c[0] == a[0]);
}

TEST_CASE("run_parallel_rollouts: bad options and failing policies") {
  const SimConfig cfg = short_episodes();
  const TrackGeometry track(square_centerline(1600.0), cfg.track);

  RolloutOptions none{};
  none.instances = 0;
  REQUIRE_THROWS_AS(run_parallel_rollouts(cfg, track, none, random_policy()), ConfigError);
  REQUIRE_THROWS_AS(run_parallel_rollouts(cfg, track, RolloutOptions{}, Policy{}), ConfigError);

  // An exception inside a worker reaches the caller after every thread joins.
  const Policy broken = [](const std::vector<double>&, std::mt19937&) -> Action {
    return Action{0.0, std::numeric_limits<double>::quiet_NaN(), 0.0};
  };
  RolloutOptions two{};
  two.instances = 2;
  REQUIRE_THROWS_AS(run_parallel_rollouts(cfg, track, two, broken), InputError);
}
