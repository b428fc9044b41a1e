#pragma once
#include "animkit/core/common/status.hpp"
#include "animkit/core/export.hpp"
#include "animkit/core/spring/spring.hpp"
#include "animkit/core/time/tick_scheduler.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace animkit::core {

using GroupCallback = std::function<void(const std::vector<Springable>& positions,
                                         const std::vector<Springable>& velocities)>;

// Drives one callback per label from several springs at once.
//
// Each tick, per binding: animating springs report (position, velocity), settled springs
// report (exact target, zero). The callback runs when any spring is animating, or when the
// previous tick was not idle, so exactly one all-settled frame is delivered after motion stops.
// The loop task ends itself once no bindings remain.
//
// Springs are not owned and must outlive their binding.
class ANIMKIT_CORE_API SpringGroupBinder {
public:
  explicit SpringGroupBinder(TickScheduler* scheduler = nullptr);
  ~SpringGroupBinder();

  SpringGroupBinder(const SpringGroupBinder&) = delete;
  SpringGroupBinder& operator=(const SpringGroupBinder&) = delete;

  // Replaces an existing binding with the same label.
  Status bind(const std::string& label, std::vector<Spring*> springs, GroupCallback callback);
  bool unbind(const std::string& label);

  std::size_t size() const { return bindings_.size(); }
  bool running() const { return task_ != kInvalidTask; }

private:
  struct Binding {
    std::string label;
    std::vector<Spring*> springs;
    GroupCallback callback;
    bool idle{false};
  };

  bool tick();
  Binding* find(const std::string& label);

  std::vector<Binding> bindings_;
  TickScheduler* scheduler_;
  TaskId task_{kInvalidTask};
};

}  // namespace animkit::core
