// Closed-form damped spring.
//
// With t = speed * (now - time0) and damper d, every regime reduces to the coefficients
//   a = h*cos + d*sin,  b = speed*sin
// and the per-channel update
//   position = a*p0 + (1 - a)*target + (sin / speed)*v0
//   velocity = -b*p0 + b*target + (h*cos - d*sin)*v0
// where (h, sin, cos) are:
//   d^2 < 1 : h = sqrt(1 - d^2), sin = e^(-dt)/h * sin(ht), cos = e^(-dt)/h * cos(ht)
//   d^2 == 1: h = 1,             sin = e^(-dt) * t,         cos = e^(-dt)
//   d^2 > 1 : h = sqrt(d^2 - 1), sin = u - v,               cos = u + v
//             u = e^((h - d)t) / 2h, v = e^(-(h + d)t) / 2h
#include "animkit/core/spring/spring.hpp"

#include "animkit/core/common/logger.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace animkit::core {

SpringProperty springPropertyFromName(std::string_view name) {
  if (name == "Position" || name == "Value" || name == "p") return SpringProperty::Position;
  if (name == "Velocity" || name == "v") return SpringProperty::Velocity;
  if (name == "Target" || name == "t") return SpringProperty::Target;
  if (name == "Damper" || name == "d") return SpringProperty::Damper;
  if (name == "Speed" || name == "s") return SpringProperty::Speed;
  if (name == "Clock") return SpringProperty::Clock;
  if (name == "Type") return SpringProperty::Type;

  const std::string msg = "\"" + std::string(name) + "\" is not a valid member of Spring";
  log(LogLevel::Error, msg);
  throw std::invalid_argument(msg);
}

const char* springPropertyToString(SpringProperty property) {
  switch (property) {
    case SpringProperty::Position: return "Position";
    case SpringProperty::Velocity: return "Velocity";
    case SpringProperty::Target: return "Target";
    case SpringProperty::Damper: return "Damper";
    case SpringProperty::Speed: return "Speed";
    case SpringProperty::Clock: return "Clock";
    case SpringProperty::Type: return "Type";
  }
  return "Unknown";
}

Spring::Spring(const Springable& initial, SpringOptions options)
  : kind_(kindOf(initial)),
    position0_(toChannels(initial)),
    velocity0_(Channels::Zero(channelCount(kind_))),
    target_channels_(position0_),
    target_(initial),
    clock_(options.clock ? std::move(options.clock) : defaultClock()),
    scheduler_(options.scheduler ? options.scheduler : &defaultScheduler()),
    tol_(options.tol) {
  time0_ = clock_();
}

Spring::Spring(const Springable& initial, Clock clock)
  : Spring(initial, SpringOptions{std::move(clock), nullptr, kDefaultTolerances}) {}

Spring::~Spring() {
  if (task_ != kInvalidTask) {
    scheduler_->cancel(task_);
  }
}

ChannelState Spring::computePositionVelocity(double now) const {
  const double elapsed = now - time0_;

  // Limit of the general form as speed -> 0.
  if (speed_ <= 0.0) {
    return ChannelState{position0_ + elapsed * velocity0_, velocity0_};
  }

  const double d = damper_;
  const double s = speed_;
  const double t = s * elapsed;
  const double d2 = d * d;

  double h = 1.0;
  double sine = 0.0;
  double cosine = 0.0;
  if (d2 < 1.0) {
    h = std::sqrt(1.0 - d2);
    const double ep = std::exp(-d * t) / h;
    cosine = ep * std::cos(h * t);
    sine = ep * std::sin(h * t);
  } else if (d2 == 1.0) {
    const double ep = std::exp(-d * t);
    cosine = ep;
    sine = ep * t;
  } else {
    h = std::sqrt(d2 - 1.0);
    const double u = std::exp((-d + h) * t) / (2.0 * h);
    const double v = std::exp((-d - h) * t) / (2.0 * h);
    cosine = u + v;
    sine = u - v;
  }

  const double cos_h = h * cosine;
  const double damper_sin = d * sine;
  const double a = cos_h + damper_sin;
  const double b = s * sine;

  ChannelState out;
  out.position = a * position0_ + (1.0 - a) * target_channels_ + (sine / s) * velocity0_;
  out.velocity = -b * position0_ + b * target_channels_ + (cos_h - damper_sin) * velocity0_;
  return out;
}

ChannelState Spring::commitAt(double now) {
  ChannelState st = computePositionVelocity(now);
  st.position = normalizePosition(kind_, st.position);
  position0_ = st.position;
  velocity0_ = st.velocity;
  time0_ = now;
  return st;
}

SpringState Spring::advanceTo(double now, Advance mode) {
  ChannelState st;
  if (mode == Advance::Commit) {
    st = commitAt(now);
  } else {
    st = computePositionVelocity(now);
    st.position = normalizePosition(kind_, st.position);
  }
  return SpringState{fromChannels(kind_, st.position), fromChannels(kind_, st.velocity)};
}

Springable Spring::position() const {
  const ChannelState st = computePositionVelocity(clock_());
  return fromChannels(kind_, normalizePosition(kind_, st.position));
}

Springable Spring::velocity() const {
  const ChannelState st = computePositionVelocity(clock_());
  return fromChannels(kind_, st.velocity);
}

SpringState Spring::state() const {
  const ChannelState st = computePositionVelocity(clock_());
  return SpringState{fromChannels(kind_, normalizePosition(kind_, st.position)),
                     fromChannels(kind_, st.velocity)};
}

bool Spring::checkKind(const Springable& value, const char* where) const {
  if (!value.valueless_by_exception() && kindOf(value) == kind_) return true;

  if (shouldLog(LogLevel::Error)) {
    std::ostringstream oss;
    oss << "Spring::" << where << ": expected " << valueKindToString(kind_);
    if (!value.valueless_by_exception()) {
      oss << ", got " << valueKindToString(kindOf(value));
    }
    log(LogLevel::Error, oss.str());
  }
  return false;
}

Status Spring::setPosition(const Springable& value) {
  if (!checkKind(value, "setPosition")) return Status::TypeMismatch;

  const double now = clock_();
  const ChannelState st = computePositionVelocity(now);
  position0_ = toChannels(value);
  velocity0_ = st.velocity;
  time0_ = now;
  target_channels_ = unwrapTarget(kind_, target_channels_, position0_);

  scheduleObservation();
  return Status::Success;
}

Status Spring::setVelocity(const Springable& value) {
  if (!checkKind(value, "setVelocity")) return Status::TypeMismatch;

  commitAt(clock_());
  velocity0_ = toChannels(value);

  scheduleObservation();
  return Status::Success;
}

Status Spring::setTarget(const Springable& value) {
  if (!checkKind(value, "setTarget")) return Status::TypeMismatch;

  const ChannelState st = commitAt(clock_());
  target_ = value;
  target_channels_ = unwrapTarget(kind_, toChannels(value), st.position);

  scheduleObservation();
  return Status::Success;
}

Status Spring::setDamper(double damper) {
  if (!std::isfinite(damper) || damper < 0.0) {
    if (shouldLog(LogLevel::Error)) {
      std::ostringstream oss;
      oss << "Spring::setDamper: damper must be finite and >= 0 (got " << damper << ")";
      log(LogLevel::Error, oss.str());
    }
    return Status::InvalidParameter;
  }

  commitAt(clock_());
  damper_ = damper;

  scheduleObservation();
  return Status::Success;
}

Status Spring::setSpeed(double speed) {
  if (!std::isfinite(speed)) {
    log(LogLevel::Error, "Spring::setSpeed: speed must be finite");
    return Status::InvalidParameter;
  }

  commitAt(clock_());
  speed_ = speed < 0.0 ? 0.0 : speed;

  scheduleObservation();
  return Status::Success;
}

Status Spring::setClock(Clock clock) {
  if (!clock) {
    log(LogLevel::Error, "Spring::setClock: empty clock");
    return Status::InvalidParameter;
  }

  commitAt(clock_());
  clock_ = std::move(clock);
  time0_ = clock_();

  scheduleObservation();
  return Status::Success;
}

Status Spring::impulse(const Springable& delta) {
  if (!checkKind(delta, "impulse")) return Status::TypeMismatch;

  commitAt(clock_());
  velocity0_ += toChannels(delta);

  scheduleObservation();
  return Status::Success;
}

Status Spring::timeSkip(double dt) {
  if (!std::isfinite(dt)) {
    log(LogLevel::Error, "Spring::timeSkip: dt must be finite");
    return Status::InvalidParameter;
  }

  const double now = clock_();
  const ChannelState st = computePositionVelocity(now + dt);
  position0_ = normalizePosition(kind_, st.position);
  velocity0_ = st.velocity;
  time0_ = now;

  scheduleObservation();
  return Status::Success;
}

std::pair<bool, Springable> Spring::isAnimating(std::optional<double> epsilon) const {
  const double eps = epsilon.value_or(tol_.settle_epsilon);
  const ChannelState st = computePositionVelocity(clock_());
  const Channels position = normalizePosition(kind_, st.position);

  if (!isSettled(kind_, position, st.velocity, target_channels_, eps)) {
    return {true, fromChannels(kind_, position)};
  }
  return {false, target_};
}

Status Spring::bind(const std::string& label, BindCallback callback) {
  if (!callback) {
    log(LogLevel::Error, "Spring::bind: empty callback for label '" + label + "'");
    return Status::InvalidParameter;
  }

  bool replaced = false;
  for (auto& entry : callbacks_) {
    if (entry.first == label) {
      log(LogLevel::Warn, "Spring::bind: label '" + label + "' already bound, overwriting");
      entry.second = std::move(callback);
      replaced = true;
      break;
    }
  }
  if (!replaced) {
    callbacks_.emplace_back(label, std::move(callback));
  }

  scheduleObservation();
  return Status::Success;
}

bool Spring::unbind(const std::string& label) {
  for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
    if (it->first == label) {
      callbacks_.erase(it);
      return true;
    }
  }
  return false;
}

void Spring::scheduleObservation() {
  if (callbacks_.empty() || task_ != kInvalidTask) return;
  task_ = scheduler_->schedule([this]() { return observeTick(); });
  log(LogLevel::Debug, "Spring: observation loop started");
}

bool Spring::observeTick() {
  // No labels left: let the loop end without a final emit.
  if (callbacks_.empty()) {
    task_ = kInvalidTask;
    log(LogLevel::Debug, "Spring: observation loop stopped (unbound)");
    return false;
  }

  // Callbacks may bind, unbind, mutate or destroy the spring; nothing below touches members
  // after the first callback runs.
  const auto callbacks = callbacks_;
  const ChannelState st = computePositionVelocity(clock_());
  const Channels position = normalizePosition(kind_, st.position);

  if (!isSettled(kind_, position, st.velocity, target_channels_, tol_.settle_epsilon)) {
    const Springable p = fromChannels(kind_, position);
    const Springable v = fromChannels(kind_, st.velocity);
    for (const auto& entry : callbacks) {
      entry.second(p, v);
    }
    return true;
  }

  task_ = kInvalidTask;
  log(LogLevel::Debug, "Spring: observation loop settled");
  const Springable p = target_;
  const Springable v = zeroValue(kind_);
  for (const auto& entry : callbacks) {
    entry.second(p, v);
  }
  return false;
}

Springable Spring::getValue(std::string_view name) const {
  const SpringProperty prop = springPropertyFromName(name);
  switch (prop) {
    case SpringProperty::Position: return position();
    case SpringProperty::Velocity: return velocity();
    case SpringProperty::Target: return target_;
    default: break;
  }
  const std::string msg = std::string("Spring::getValue: ") + springPropertyToString(prop)
                        + " is not a springable property";
  log(LogLevel::Error, msg);
  throw std::invalid_argument(msg);
}

Status Spring::setValue(std::string_view name, const Springable& value) {
  const SpringProperty prop = springPropertyFromName(name);
  switch (prop) {
    case SpringProperty::Position: return setPosition(value);
    case SpringProperty::Velocity: return setVelocity(value);
    case SpringProperty::Target: return setTarget(value);
    default: break;
  }
  const std::string msg = std::string("Spring::setValue: ") + springPropertyToString(prop)
                        + " is not a springable property";
  log(LogLevel::Error, msg);
  throw std::invalid_argument(msg);
}

double Spring::getScalar(std::string_view name) const {
  const SpringProperty prop = springPropertyFromName(name);
  switch (prop) {
    case SpringProperty::Damper: return damper_;
    case SpringProperty::Speed: return speed_;
    default: break;
  }
  const std::string msg = std::string("Spring::getScalar: ") + springPropertyToString(prop)
                        + " is not a scalar property";
  log(LogLevel::Error, msg);
  throw std::invalid_argument(msg);
}

Status Spring::setScalar(std::string_view name, double value) {
  const SpringProperty prop = springPropertyFromName(name);
  switch (prop) {
    case SpringProperty::Damper: return setDamper(value);
    case SpringProperty::Speed: return setSpeed(value);
    default: break;
  }
  const std::string msg = std::string("Spring::setScalar: ") + springPropertyToString(prop)
                        + " is not a scalar property";
  log(LogLevel::Error, msg);
  throw std::invalid_argument(msg);
}

std::unique_ptr<Spring> createSpring(const SpringInfo& info) {
  SpringOptions options;
  options.clock = info.clock;
  options.scheduler = info.scheduler;
  auto spring = std::make_unique<Spring>(info.initial.value_or(Springable(0.0)), options);

  if (info.position && !ok(spring->setPosition(*info.position))) {
    throw std::invalid_argument("createSpring: rejected position");
  }
  const Status st = updateSpring(*spring, info);
  if (!ok(st)) {
    throw std::invalid_argument(std::string("createSpring: rejected spring info (")
                                + statusToString(st) + ")");
  }
  return spring;
}

Status updateSpring(Spring& spring, const SpringInfo& info) {
  if (info.velocity) {
    const Status st = spring.setVelocity(*info.velocity);
    if (!ok(st)) return st;
  }
  if (info.target) {
    const Status st = spring.setTarget(*info.target);
    if (!ok(st)) return st;
  }
  if (info.damper) {
    const Status st = spring.setDamper(*info.damper);
    if (!ok(st)) return st;
  }
  if (info.speed) {
    const Status st = spring.setSpeed(*info.speed);
    if (!ok(st)) return st;
  }
  return Status::Success;
}

}  // namespace animkit::core
