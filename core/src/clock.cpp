#include "animkit/core/time/clock.hpp"

#include <chrono>

namespace animkit::core {

double steadySeconds() {
  using SteadyClock = std::chrono::steady_clock;
  static const SteadyClock::time_point origin = SteadyClock::now();
  return std::chrono::duration<double>(SteadyClock::now() - origin).count();
}

Clock defaultClock() {
  return &steadySeconds;
}

}  // namespace animkit::core
