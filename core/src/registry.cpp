#include "animkit/core/registry.hpp"

#include "animkit/core/common/logger.hpp"

#include <stdexcept>
#include <utility>

namespace animkit::core {

static void requireName(const std::string& name, const char* where) {
  if (name.empty()) {
    const std::string msg = std::string(where) + ": name must not be empty";
    log(LogLevel::Error, msg);
    throw std::invalid_argument(msg);
  }
}

Spring& Registry::addSpring(const std::string& name, const SpringInfo& info) {
  requireName(name, "Registry::addSpring");
  std::unique_ptr<Spring> created = createSpring(info);
  if (springs_.count(name) != 0) {
    log(LogLevel::Info, "Registry::addSpring: replacing spring '" + name + "'");
  }
  std::unique_ptr<Spring>& slot = springs_[name];
  slot = std::move(created);
  return *slot;
}

Spring& Registry::spring(const std::string& name) const {
  const auto it = springs_.find(name);
  if (it == springs_.end()) {
    const std::string msg = "Spring '" + name + "' does not exist";
    log(LogLevel::Error, msg);
    throw std::out_of_range(msg);
  }
  return *it->second;
}

bool Registry::hasSpring(const std::string& name) const {
  return springs_.count(name) != 0;
}

bool Registry::removeSpring(const std::string& name) {
  return springs_.erase(name) != 0;
}

Spline& Registry::addSpline(const std::string& name,
                            std::vector<Pose> control_points,
                            const Tolerances& tol) {
  requireName(name, "Registry::addSpline");
  auto created = std::make_unique<Spline>(std::move(control_points), tol);
  if (splines_.count(name) != 0) {
    log(LogLevel::Info, "Registry::addSpline: replacing spline '" + name + "'");
  }
  std::unique_ptr<Spline>& slot = splines_[name];
  slot = std::move(created);
  return *slot;
}

Spline& Registry::spline(const std::string& name) const {
  const auto it = splines_.find(name);
  if (it == splines_.end()) {
    const std::string msg = "Spline '" + name + "' does not exist";
    log(LogLevel::Error, msg);
    throw std::out_of_range(msg);
  }
  return *it->second;
}

bool Registry::hasSpline(const std::string& name) const {
  return splines_.count(name) != 0;
}

bool Registry::removeSpline(const std::string& name) {
  return splines_.erase(name) != 0;
}

}  // namespace animkit::core
