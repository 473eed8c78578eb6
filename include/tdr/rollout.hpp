#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>
#include <tdr/config.hpp>
#include <tdr/env.hpp>
#include <tdr/track_geom.hpp>

namespace tdr {

// Maps an observation to an action. Called concurrently from every rollout
// thread, each with its own generator, so it must not share mutable state.
using Policy = std::function<Action(const std::vector<double>& observation, std::mt19937& rng)>;

// Uniform random actions over the full action ranges.
Policy random_policy();

struct RolloutOptions {
  std::size_t instances = 4;
  std::size_t episodes_per_instance = 1;
  std::uint32_t base_seed = 0;  // instance i draws from base_seed + i
};

struct EpisodeSummary {
  std::size_t instance = 0;
  std::size_t episode = 0;
  int steps = 0;
  double total_reward = 0.0;
  std::size_t laps = 0;
  double best_lap = -1.0;
  std::size_t wall_hits = 0;
  bool terminated = false;
  bool truncated = false;

  bool operator==(const EpisodeSummary&) const = default;
};

// Runs one episode to termination or truncation.
EpisodeSummary run_episode(RacingEnv& env, const Policy& policy, std::mt19937& rng);

// One independent env per std::thread; nothing is shared between instances
// apart from the read-only config and track. Results are ordered by instance
// then episode and depend only on the seeds. The first exception raised by
// any instance is rethrown after all threads have joined.
std::vector<EpisodeSummary> run_parallel_rollouts(const SimConfig& config,
                                                  const TrackGeometry& track,
                                                  const RolloutOptions& opts,
                                                  const Policy& policy);

} // namespace tdr
