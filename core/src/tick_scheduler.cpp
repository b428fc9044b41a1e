#include "animkit/core/time/tick_scheduler.hpp"

#include "animkit/core/common/logger.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace animkit::core {

TaskId TickScheduler::schedule(Task task) {
  if (!task) {
    log(LogLevel::Error, "TickScheduler::schedule: empty task");
    return kInvalidTask;
  }
  Entry e;
  e.id = next_id_++;
  e.task = std::move(task);
  incoming_.push_back(std::move(e));
  return incoming_.back().id;
}

bool TickScheduler::cancel(TaskId id) {
  if (id == kInvalidTask) return false;

  for (Entry& e : tasks_) {
    if (e.id == id && e.alive) {
      e.alive = false;
      return true;
    }
  }
  const auto it = std::find_if(incoming_.begin(), incoming_.end(),
                               [id](const Entry& e) { return e.id == id; });
  if (it == incoming_.end()) return false;
  incoming_.erase(it);
  return true;
}

void TickScheduler::tick() {
  if (ticking_) {
    log(LogLevel::Warn, "TickScheduler::tick: re-entrant tick ignored");
    return;
  }
  ticking_ = true;
  ++ticks_;

  tasks_.insert(tasks_.end(),
                std::make_move_iterator(incoming_.begin()),
                std::make_move_iterator(incoming_.end()));
  incoming_.clear();

  // `tasks_` is not resized while tasks run; new work lands in `incoming_`.
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    if (!tasks_[i].alive) continue;
    const bool again = tasks_[i].task();
    if (!again) tasks_[i].alive = false;
  }

  tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                              [](const Entry& e) { return !e.alive; }),
               tasks_.end());
  ticking_ = false;
}

std::size_t TickScheduler::pending() const {
  const auto live = std::count_if(tasks_.begin(), tasks_.end(),
                                  [](const Entry& e) { return e.alive; });
  return static_cast<std::size_t>(live) + incoming_.size();
}

TickScheduler& defaultScheduler() {
  static TickScheduler scheduler;
  return scheduler;
}

}  // namespace animkit::core
