#include <tdr/centerline_csv.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace tdr {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return false;
  return (cols[0] == "x" || cols[0] == "X") && (cols[1] == "y" || cols[1] == "Y");
}

static std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

static std::optional<Vec2> parse_point_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  const auto x = to_double(cols[0]);
  const auto y = to_double(cols[1]);
  if (!x || !y) return std::nullopt;
  return Vec2{*x, *y};
}

std::vector<Vec2> centerline_from_csv_stream(std::istream& in) {
  std::vector<Vec2> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);

    if (!header_consumed && out.empty() && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto pt = parse_point_row(cols); pt.has_value()) {
      out.push_back(*pt);
    }
  }
  return out;
}

std::optional<std::vector<Vec2>> load_centerline_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return centerline_from_csv_stream(f);
}

} // namespace tdr
