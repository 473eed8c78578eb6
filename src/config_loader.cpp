#include <tdr/config_loader.hpp>
#include <tdr/errors.hpp>
#include <tdr/log.hpp>
#include <yaml-cpp/yaml.h>

namespace tdr {

namespace {

template <class T>
void read_opt(const YAML::Node& section, const char* section_name, const char* key, T& out) {
  const YAML::Node v = section[key];
  if (!v) return;
  if (!v.IsScalar()) {
    throw ConfigError(std::string("'") + key + "' must be a scalar", section_name);
  }
  try {
    out = v.as<T>();
  } catch (const YAML::BadConversion&) {
    throw ConfigError(std::string("invalid value for '") + key + "'", section_name);
  }
}

YAML::Node section_of(const YAML::Node& root, const char* name) {
  const YAML::Node s = root[name];
  if (s && !s.IsMap()) {
    throw ConfigError("section must be a map", name);
  }
  return s;
}

void read_car(const YAML::Node& s, CarParams& p) {
  if (!s) return;
  read_opt(s, "car", "max_speed", p.max_speed);
  read_opt(s, "car", "acceleration", p.acceleration);
  read_opt(s, "car", "brake_force", p.brake_force);
  read_opt(s, "car", "reverse_max_speed", p.reverse_max_speed);
  read_opt(s, "car", "steering_speed", p.steering_speed);
  read_opt(s, "car", "drift_grip_multiplier", p.drift_grip_multiplier);
  read_opt(s, "car", "normal_grip", p.normal_grip);
  read_opt(s, "car", "friction_per_second", p.friction_per_second);
  read_opt(s, "car", "width", p.width);
  read_opt(s, "car", "length", p.length);
}

void read_damage(const YAML::Node& s, DamageParams& p) {
  if (!s) return;
  read_opt(s, "damage", "wall_damage_multiplier", p.wall_damage_multiplier);
  read_opt(s, "damage", "min_damage_speed", p.min_damage_speed);
  read_opt(s, "damage", "max_health", p.max_health);
}

void read_drift(const YAML::Node& s, DriftParams& p) {
  if (!s) return;
  read_opt(s, "drift", "trail_lifetime", p.trail_lifetime);
  read_opt(s, "drift", "max_trail_points", p.max_trail_points);
}

std::optional<std::vector<Vec2>> read_track(const YAML::Node& s, TrackParams& p) {
  if (!s) return std::nullopt;
  read_opt(s, "track", "track_width", p.track_width);
  read_opt(s, "track", "spawn_offset", p.spawn_offset);
  read_opt(s, "track", "max_miter", p.max_miter);

  const YAML::Node pts = s["centerline_points"];
  if (!pts) return std::nullopt;
  if (!pts.IsSequence()) throw ConfigError("centerline_points must be a list of [x, y]", "track");

  std::vector<Vec2> out;
  out.reserve(pts.size());
  for (std::size_t i = 0; i < pts.size(); ++i) {
    const YAML::Node pt = pts[i];
    if (!pt.IsSequence() || pt.size() != 2) {
      throw ConfigError("centerline point " + std::to_string(i) + " must be [x, y]", "track");
    }
    try {
      out.push_back({pt[0].as<double>(), pt[1].as<double>()});
    } catch (const YAML::BadConversion&) {
      throw ConfigError("centerline point " + std::to_string(i) + " is not numeric", "track");
    }
  }
  return out;
}

void read_ai(const YAML::Node& s, SimConfig& c) {
  if (!s) return;
  auto& cp = c.checkpoints;
  read_opt(s, "ai", "training_checkpoint_spacing", cp.spacing);
  read_opt(s, "ai", "training_checkpoint_radius", cp.radius);
  read_opt(s, "ai", "curvature_threshold", cp.curvature_threshold);
  read_opt(s, "ai", "zigzag_spacing_multiplier", cp.zigzag_multiplier);
  read_opt(s, "ai", "checkpoint_grace_steps", cp.grace_steps);
  read_opt(s, "ai", "min_forward_speed", cp.min_forward_speed);
  read_opt(s, "ai", "auto_advance_multiplier", cp.auto_advance_multiplier);

  auto& ep = c.episode;
  read_opt(s, "ai", "max_episode_steps", ep.max_episode_steps);
  read_opt(s, "ai", "stuck_speed_threshold", ep.stuck_speed_threshold);
  read_opt(s, "ai", "stuck_timeout", ep.stuck_timeout);

  read_opt(s, "ai", "max_ray_distance", c.sensor.max_ray_distance);
  read_opt(s, "ai", "curvature_lookahead_steps", c.sensor.curvature_lookahead_steps);

  auto& rw = c.reward;
  read_opt(s, "ai", "training_checkpoint_reward", rw.checkpoint);
  read_opt(s, "ai", "lap_completion_bonus", rw.lap_bonus);
  read_opt(s, "ai", "speed_reward_scale", rw.speed_scale);
  read_opt(s, "ai", "forward_progress_reward_scale", rw.forward_progress_scale);
  read_opt(s, "ai", "backward_progress_penalty_scale", rw.backward_progress_scale);
  read_opt(s, "ai", "lateral_displacement_penalty_scale", rw.lateral_scale);
  read_opt(s, "ai", "wall_damage_penalty_scale", rw.wall_damage_scale);
  read_opt(s, "ai", "death_penalty", rw.death_penalty);
  read_opt(s, "ai", "time_penalty", rw.time_penalty);
  read_opt(s, "ai", "smooth_steering_bonus", rw.smooth_steering_bonus);
}

LoadedConfig from_root(const YAML::Node& root) {
  LoadedConfig out;
  if (!root || root.IsNull()) {
    validate(out.config);
    return out;
  }
  if (!root.IsMap()) throw ConfigError("YAML root must be a map");

  read_car(section_of(root, "car"), out.config.car);
  read_damage(section_of(root, "damage"), out.config.damage);
  read_drift(section_of(root, "drift"), out.config.drift);
  out.centerline = read_track(section_of(root, "track"), out.config.track);
  read_ai(section_of(root, "ai"), out.config);
  if (const YAML::Node screen = section_of(root, "screen")) {
    read_opt(screen, "screen", "fps", out.config.episode.fps);
  }

  validate(out.config);
  return out;
}

} // namespace

LoadedConfig config_from_yaml_string(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("YAML parse error: ") + e.what());
  }
  return from_root(root);
}

LoadedConfig load_config_yaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw ConfigError("cannot open config file", path);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("YAML parse error: ") + e.what(), path);
  }
  LoadedConfig out = from_root(root);
  log::logger()->info("loaded config {} (fps={}, centerline={})", path, out.config.episode.fps,
                      out.centerline ? std::to_string(out.centerline->size()) + " pts" : "none");
  return out;
}

} // namespace tdr
