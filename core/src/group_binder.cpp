#include "animkit/core/spring/group_binder.hpp"

#include "animkit/core/common/logger.hpp"

#include <algorithm>
#include <utility>

namespace animkit::core {

SpringGroupBinder::SpringGroupBinder(TickScheduler* scheduler)
  : scheduler_(scheduler ? scheduler : &defaultScheduler()) {}

SpringGroupBinder::~SpringGroupBinder() {
  if (task_ != kInvalidTask) {
    scheduler_->cancel(task_);
  }
}

SpringGroupBinder::Binding* SpringGroupBinder::find(const std::string& label) {
  for (Binding& b : bindings_) {
    if (b.label == label) return &b;
  }
  return nullptr;
}

Status SpringGroupBinder::bind(const std::string& label,
                               std::vector<Spring*> springs,
                               GroupCallback callback) {
  if (!callback) {
    log(LogLevel::Error, "SpringGroupBinder::bind: empty callback for label '" + label + "'");
    return Status::InvalidParameter;
  }
  if (std::find(springs.begin(), springs.end(), nullptr) != springs.end()) {
    log(LogLevel::Error, "SpringGroupBinder::bind: null spring in '" + label + "'");
    return Status::InvalidParameter;
  }

  if (Binding* existing = find(label)) {
    existing->springs = std::move(springs);
    existing->callback = std::move(callback);
    existing->idle = false;
  } else {
    Binding b;
    b.label = label;
    b.springs = std::move(springs);
    b.callback = std::move(callback);
    bindings_.push_back(std::move(b));
  }

  if (task_ == kInvalidTask) {
    task_ = scheduler_->schedule([this]() { return tick(); });
  }
  return Status::Success;
}

bool SpringGroupBinder::unbind(const std::string& label) {
  const auto it = std::find_if(bindings_.begin(), bindings_.end(),
                               [&label](const Binding& b) { return b.label == label; });
  if (it == bindings_.end()) return false;
  bindings_.erase(it);
  return true;
}

bool SpringGroupBinder::tick() {
  if (bindings_.empty()) {
    task_ = kInvalidTask;
    return false;
  }

  std::vector<std::string> labels;
  labels.reserve(bindings_.size());
  for (const Binding& b : bindings_) labels.push_back(b.label);

  for (const std::string& label : labels) {
    // Earlier callbacks may have unbound this label.
    const Binding* current = find(label);
    if (!current) continue;

    const std::vector<Spring*> springs = current->springs;
    const GroupCallback callback = current->callback;
    const bool was_idle = current->idle;

    std::vector<Springable> positions;
    std::vector<Springable> velocities;
    positions.reserve(springs.size());
    velocities.reserve(springs.size());

    bool idle = true;
    for (const Spring* spring : springs) {
      auto [animating, position] = spring->isAnimating();
      if (animating) {
        positions.push_back(std::move(position));
        velocities.push_back(spring->velocity());
        idle = false;
      } else {
        positions.push_back(spring->target());
        velocities.push_back(zeroValue(spring->type()));
      }
    }

    if (!idle || !was_idle) {
      callback(positions, velocities);
    }

    if (Binding* after = find(label)) {
      after->idle = idle;
    }
  }
  return true;
}

}  // namespace animkit::core
