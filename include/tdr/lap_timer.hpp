#pragma once
#include <cstdint>
#include <vector>

namespace tdr {

struct LapTimes {
  double last_lap{-1.0};
  double best_lap{-1.0};
  std::uint64_t laps{0};
};

// Lap times from fixed-step counts. The first lap is timed from reset.
class LapTimer {
public:
  explicit LapTimer(double dt) : dt_(dt) {}

  void reset() {
    lap_start_step_ = 0;
    times_ = LapTimes{};
    history_.clear();
  }

  // step is the tick count at which the lap completed.
  double complete_lap(std::uint64_t step) {
    const double lap_time = double(step - lap_start_step_) * dt_;
    times_.last_lap = lap_time;
    if (times_.best_lap < 0.0 || lap_time < times_.best_lap) {
      times_.best_lap = lap_time;
    }
    ++times_.laps;
    history_.push_back(lap_time);
    lap_start_step_ = step;
    return lap_time;
  }

  const LapTimes& times() const { return times_; }
  const std::vector<double>& history() const { return history_; }

private:
  double dt_;
  std::uint64_t lap_start_step_{0};
  LapTimes times_{};
  std::vector<double> history_;
};

} // namespace tdr
