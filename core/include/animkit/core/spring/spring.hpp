#pragma once
#include "animkit/core/common/constants.hpp"
#include "animkit/core/common/status.hpp"
#include "animkit/core/export.hpp"
#include "animkit/core/time/clock.hpp"
#include "animkit/core/time/tick_scheduler.hpp"
#include "animkit/core/value/springable.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace animkit::core {

// Damped harmonic oscillator evaluated in closed form.
//
// State is stored as a snapshot (position0, velocity0, time0) plus target, damper and speed.
// The current position/velocity are a pure function of the snapshot and clock() - time0:
// - reads never modify the snapshot;
// - every write first commits the current position/velocity at clock() as the new snapshot
//   (time0 = now), then applies the change.
//
// Damping regimes (damper d): d^2 < 1 underdamped, d^2 == 1 critical, d^2 > 1 overdamped.
// Speed scales time; speed 0 freezes the oscillator (position drifts with velocity0 only).
//
// The value kind is fixed at construction. Position, velocity, target and impulse writes of a
// different kind are rejected with Status::TypeMismatch.
enum class SpringProperty : std::uint8_t {
  Position = 0,
  Velocity = 1,
  Target = 2,
  Damper = 3,
  Speed = 4,
  Clock = 5,
  Type = 6
};

// Accepts "Position"/"Value"/"p", "Velocity"/"v", "Target"/"t", "Damper"/"d", "Speed"/"s",
// "Clock" and "Type". Throws std::invalid_argument naming the member otherwise.
SpringProperty springPropertyFromName(std::string_view name);
const char* springPropertyToString(SpringProperty property);

enum class Advance : std::uint8_t {
  Peek = 0,    // compute only
  Commit = 1   // compute and store as the new snapshot
};

struct SpringState {
  Springable position;
  Springable velocity;
};

// Raw channel form of a spring state (see value/springable.hpp).
struct ChannelState {
  Channels position;
  Channels velocity;
};

using BindCallback = std::function<void(const Springable& position, const Springable& velocity)>;

struct SpringOptions {
  Clock clock;                         // defaults to defaultClock()
  TickScheduler* scheduler = nullptr;  // defaults to defaultScheduler()
  Tolerances tol = kDefaultTolerances;
};

class ANIMKIT_CORE_API Spring {
public:
  explicit Spring(const Springable& initial, SpringOptions options = {});
  Spring(const Springable& initial, Clock clock);
  ~Spring();

  // Bound callbacks capture the spring's address.
  Spring(const Spring&) = delete;
  Spring& operator=(const Spring&) = delete;
  Spring(Spring&&) = delete;
  Spring& operator=(Spring&&) = delete;

  // Reads
  Springable position() const;
  Springable velocity() const;
  SpringState state() const;  // one clock read for both values
  const Springable& target() const { return target_; }
  double damper() const { return damper_; }
  double speed() const { return speed_; }
  const Clock& clock() const { return clock_; }
  ValueKind type() const { return kind_; }
  TickScheduler& scheduler() const { return *scheduler_; }

  // Pure evaluation of the oscillator at absolute time `now`.
  ChannelState computePositionVelocity(double now) const;

  // Evaluates at `now`; with Advance::Commit the result becomes the new snapshot and time0 = now.
  SpringState advanceTo(double now, Advance mode);

  // Writes (snapshot first, then apply)
  Status setPosition(const Springable& value);
  Status setVelocity(const Springable& value);
  Status setTarget(const Springable& value);
  Status setDamper(double damper);
  Status setSpeed(double speed);  // negative input is clamped to 0
  Status setClock(Clock clock);

  // Adds `delta` to the velocity channel-wise.
  Status impulse(const Springable& delta);

  // Fast-forwards the simulated state by `dt` seconds without moving time0 past now.
  Status timeSkip(double dt);

  // (true, position) while any channel group exceeds epsilon; (false, exact target) once settled.
  std::pair<bool, Springable> isAnimating(std::optional<double> epsilon = std::nullopt) const;

  // Named observers, invoked once per scheduler tick while animating plus one final time with
  // (target, zero) once settled. Rebinding an existing label replaces its callback.
  Status bind(const std::string& label, BindCallback callback);
  bool unbind(const std::string& label);
  bool isBound() const { return !callbacks_.empty(); }
  bool isObserving() const { return task_ != kInvalidTask; }

  // Name-based access. Value names: Position, Velocity, Target. Scalar names: Damper, Speed.
  // Unknown names, or a name of the other category, throw std::invalid_argument.
  Springable getValue(std::string_view name) const;
  Status setValue(std::string_view name, const Springable& value);
  double getScalar(std::string_view name) const;
  Status setScalar(std::string_view name, double value);

private:
  bool checkKind(const Springable& value, const char* where) const;
  ChannelState commitAt(double now);
  bool observeTick();
  void scheduleObservation();

  ValueKind kind_;
  Channels position0_;
  Channels velocity0_;
  Channels target_channels_;
  Springable target_;
  double damper_{1.0};
  double speed_{1.0};
  double time0_{0.0};
  Clock clock_;
  TickScheduler* scheduler_{nullptr};
  Tolerances tol_;

  std::vector<std::pair<std::string, BindCallback>> callbacks_;  // insertion order
  TaskId task_{kInvalidTask};
};

// Optional property set used to create or reconfigure springs in one call.
struct SpringInfo {
  std::optional<Springable> initial;
  std::optional<Springable> position;
  std::optional<Springable> velocity;
  std::optional<Springable> target;
  std::optional<double> damper;
  std::optional<double> speed;
  Clock clock;
  TickScheduler* scheduler = nullptr;
};

// Creates a spring from `info` (initial defaults to 0.0). Throws std::invalid_argument if any
// field is rejected.
std::unique_ptr<Spring> createSpring(const SpringInfo& info);

// Applies target, velocity, damper and speed from `info`. Initial, clock and position are ignored.
Status updateSpring(Spring& spring, const SpringInfo& info);

}  // namespace animkit::core
