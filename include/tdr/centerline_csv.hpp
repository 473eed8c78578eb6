#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <tdr/geom.hpp>

namespace tdr {

// Stream-based centerline reader (test-friendly; no filesystem required).
// One "x,y" point per row. Accepts an optional header row; ignores lines
// starting with '#' and blank lines. Whitespace around fields is trimmed.
// Invalid rows are skipped.
std::vector<Vec2> centerline_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Vec2>> load_centerline_csv(const std::string& path);

} // namespace tdr
