#include <cstdint>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <tdr/centerline_csv.hpp>
#include <tdr/config_loader.hpp>
#include <tdr/errors.hpp>
#include <tdr/log.hpp>
#include <tdr/rollout.hpp>
#include <tdr/track_geom.hpp>
#include <tdr/track_presets.hpp>

using namespace tdr;

static void usage() {
  log::logger()->info(
      "usage: tdr_rollout [--config file.yaml] [--track Stadium|Chicane+Hairpin|Square]"
      " [--centerline file.csv] [--instances N] [--episodes N] [--seed S] [--log-level LEVEL]");
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string track_name = "Stadium";
  std::string csv_path;
  RolloutOptions opts{};

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      auto next = [&]() -> std::string {
        if (i + 1 >= argc) throw InputError("missing value for " + arg, "cli");
        return argv[++i];
      };
      if (arg == "--config") config_path = next();
      else if (arg == "--track") track_name = next();
      else if (arg == "--centerline") csv_path = next();
      else if (arg == "--instances") opts.instances = std::stoul(next());
      else if (arg == "--episodes") opts.episodes_per_instance = std::stoul(next());
      else if (arg == "--seed") opts.base_seed = static_cast<std::uint32_t>(std::stoul(next()));
      else if (arg == "--log-level") {
        const std::string lvl = next();
        if (!log::set_level(lvl)) throw InputError("unknown log level " + lvl, "cli");
      }
      else if (arg == "--help" || arg == "-h") { usage(); return EXIT_SUCCESS; }
      else throw InputError("unknown argument " + arg, "cli");
    }

    LoadedConfig loaded = config_path.empty() ? LoadedConfig{} : load_config_yaml(config_path);

    std::vector<Vec2> centerline;
    if (!csv_path.empty()) {
      auto pts = load_centerline_csv(csv_path);
      if (!pts) throw ConfigError("cannot open " + csv_path, "centerline");
      centerline = std::move(*pts);
    } else if (loaded.centerline) {
      centerline = *loaded.centerline;
    } else {
      const auto preset = preset_by_name(track_name);
      if (!preset) throw ConfigError("unknown track preset " + track_name, "track");
      centerline = make_preset_centerline(*preset);
    }

    const TrackGeometry track(std::move(centerline), loaded.config.track);
    const auto results = run_parallel_rollouts(loaded.config, track, opts, random_policy());

    for (const auto& r : results) {
      log::logger()->info("instance {} episode {}: {} steps, reward {:.2f}, laps {}, wall hits {}{}",
                          r.instance, r.episode, r.steps, r.total_reward, r.laps, r.wall_hits,
                          r.terminated ? " (crashed out)" : "");
    }
  } catch (const TdrError& e) {
    log::logger()->error("{}", e.what());
    return EXIT_FAILURE;
  } catch (const std::logic_error& e) {
    log::logger()->error("bad numeric argument: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
