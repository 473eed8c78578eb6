#pragma once
#include <optional>
#include <string>
#include <vector>
#include <tdr/config.hpp>
#include <tdr/geom.hpp>

namespace tdr {

// Parsed YAML document: parameters plus an optional inline centerline
// (track.centerline_points: [[x, y], ...]).
struct LoadedConfig {
  SimConfig config{};
  std::optional<std::vector<Vec2>> centerline{};
};

// Sections: car, damage, drift, track, ai, screen (fps only).
// Missing keys keep their defaults. Malformed values or out-of-range
// parameters throw ConfigError.
LoadedConfig config_from_yaml_string(const std::string& text);

// Filesystem wrapper; a missing or unreadable file is a ConfigError.
LoadedConfig load_config_yaml(const std::string& path);

} // namespace tdr
