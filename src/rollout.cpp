#include <tdr/rollout.hpp>
#include <exception>
#include <thread>
#include <utility>
#include <tdr/errors.hpp>
#include <tdr/log.hpp>

namespace tdr {

Policy random_policy() {
  return [](const std::vector<double>&, std::mt19937& rng) {
    std::uniform_real_distribution<double> sym(-1.0, 1.0);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    Action a{};
    a.steering = sym(rng);
    a.throttle = sym(rng);
    a.drift = unit(rng);
    return a;
  };
}

EpisodeSummary run_episode(RacingEnv& env, const Policy& policy, std::mt19937& rng) {
  EpisodeSummary out{};
  ResetResult start = env.reset();
  std::vector<double> obs = std::move(start.observation);

  while (true) {
    StepResult r = env.step(policy(obs, rng));
    out.total_reward += r.reward;
    obs = std::move(r.observation);
    if (r.terminated || r.truncated) {
      out.steps = r.info.step_count;
      out.laps = r.info.laps;
      out.best_lap = r.info.best_lap;
      out.wall_hits = r.info.wall_hits;
      out.terminated = r.terminated;
      out.truncated = r.truncated;
      break;
    }
  }
  return out;
}

std::vector<EpisodeSummary> run_parallel_rollouts(const SimConfig& config,
                                                  const TrackGeometry& track,
                                                  const RolloutOptions& opts,
                                                  const Policy& policy) {
  if (opts.instances == 0) throw ConfigError("instances must be > 0", "rollout");
  if (!policy) throw ConfigError("policy is empty", "rollout");

  const std::size_t per = opts.episodes_per_instance;
  std::vector<EpisodeSummary> results(opts.instances * per);
  std::vector<std::exception_ptr> errors(opts.instances);
  std::vector<std::thread> threads;
  threads.reserve(opts.instances);

  for (std::size_t i = 0; i < opts.instances; ++i) {
    threads.emplace_back([&, i] {
      try {
        RacingEnv env(config, track);
        std::mt19937 rng(opts.base_seed + static_cast<std::uint32_t>(i));
        for (std::size_t e = 0; e < per; ++e) {
          EpisodeSummary s = run_episode(env, policy, rng);
          s.instance = i;
          s.episode = e;
          results[i * per + e] = s;
        }
      } catch (...) {
        errors[i] = std::current_exception();
      }
    });
  }
  for (auto& t : threads) t.join();

  for (const auto& err : errors) {
    if (err) std::rethrow_exception(err);
  }

  log::logger()->info("rollout finished: {} instances x {} episodes", opts.instances, per);
  return results;
}

} // namespace tdr
