#pragma once
#include <functional>
#include <memory>

namespace animkit::core {

// Zero-argument function returning monotonic seconds.
using Clock = std::function<double()>;

// Seconds since the first call, from std::chrono::steady_clock.
double steadySeconds();
Clock defaultClock();

// Deterministic clock for tests and offline stepping. Copies of `fn()` observe
// later `advance`/`set` calls on this clock.
class ManualClock {
public:
  explicit ManualClock(double start = 0.0) : now_(std::make_shared<double>(start)) {}

  double now() const { return *now_; }
  void set(double t) { *now_ = t; }
  void advance(double dt) { *now_ += dt; }

  Clock fn() const {
    std::shared_ptr<double> now = now_;
    return [now]() { return *now; };
  }

private:
  std::shared_ptr<double> now_;
};

}  // namespace animkit::core
