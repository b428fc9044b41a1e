#pragma once
#include "animkit/core/export.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace animkit::core {

using TaskId = std::uint64_t;
inline constexpr TaskId kInvalidTask = 0;

// Cooperative single-threaded task list driven by an external per-frame signal.
//
// - `tick()` runs every live task once, in scheduling order.
// - A task returns true to run again on the next tick, false to finish.
// - Tasks scheduled from inside a task first run on the following tick.
// - `cancel` takes effect immediately, including for tasks later in the current tick.
class ANIMKIT_CORE_API TickScheduler {
public:
  using Task = std::function<bool()>;

  TickScheduler() = default;
  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  TaskId schedule(Task task);
  bool cancel(TaskId id);

  void tick();

  std::size_t pending() const;
  std::uint64_t tickCount() const { return ticks_; }

private:
  struct Entry {
    TaskId id{kInvalidTask};
    Task task;
    bool alive{true};
  };

  std::vector<Entry> tasks_;
  std::vector<Entry> incoming_;
  TaskId next_id_{1};
  std::uint64_t ticks_{0};
  bool ticking_{false};
};

// Process-wide scheduler used when a spring is not given one explicitly.
// The host is expected to call `defaultScheduler().tick()` once per frame.
TickScheduler& defaultScheduler();

}  // namespace animkit::core
