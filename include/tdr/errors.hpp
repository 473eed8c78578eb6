#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tdr {

inline std::string append_context(std::string message, std::string_view context) {
  if (!context.empty()) {
    message = std::string(context) + ": " + message;
  }
  return message;
}

inline std::string with_location(std::string message, const char* file, int line) {
  return append_context(std::move(message), std::string("at ") + file + ":" + std::to_string(line));
}

class TdrError : public std::runtime_error {
public:
  explicit TdrError(std::string message, std::string context = {})
    : std::runtime_error(append_context(std::move(message), context))
    , context_(std::move(context)) {}

  const std::string& context() const noexcept { return context_; }

private:
  std::string context_{};
};

// Bad parameters or geometry handed to a constructor.
class ConfigError : public TdrError {
public:
  using TdrError::TdrError;
};

// Bad per-step input from a consumer (e.g. NaN action).
class InputError : public TdrError {
public:
  using TdrError::TdrError;
};

// Broken internal invariant. Always a bug, never a recoverable condition.
class SimulationError : public TdrError {
public:
  using TdrError::TdrError;
};

} // namespace tdr

#define TDR_LOC(msg) ::tdr::with_location((msg), __FILE__, __LINE__)
