#pragma once
#include "animkit/core/export.hpp"
#include "animkit/core/math/types.hpp"
#include "animkit/core/spline/spline.hpp"
#include "animkit/core/spring/spring.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace animkit::core {

// Named directories of springs and splines. Adding under an existing name replaces (and
// destroys) the previous entry. Lookups of unknown names throw std::out_of_range.
class ANIMKIT_CORE_API Registry {
public:
  Spring& addSpring(const std::string& name, const SpringInfo& info);
  Spring& spring(const std::string& name) const;
  bool hasSpring(const std::string& name) const;
  bool removeSpring(const std::string& name);

  Spline& addSpline(const std::string& name,
                    std::vector<Pose> control_points,
                    const Tolerances& tol = kDefaultTolerances);
  Spline& spline(const std::string& name) const;
  bool hasSpline(const std::string& name) const;
  bool removeSpline(const std::string& name);

  std::size_t springCount() const { return springs_.size(); }
  std::size_t splineCount() const { return splines_.size(); }

private:
  std::unordered_map<std::string, std::unique_ptr<Spring>> springs_;
  std::unordered_map<std::string, std::unique_ptr<Spline>> splines_;
};

}  // namespace animkit::core
