#pragma once
#include "animkit/core/common/constants.hpp"
#include "animkit/core/common/status.hpp"
#include "animkit/core/export.hpp"
#include "animkit/core/math/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>
#include <vector>

namespace animkit::core {

// How a spline query orients its result.
// - Track: look along the analytic curve derivative at the query point.
// - Nodes: blend the rotations of the segment's two control points with smoothstep easing.
enum class Alignment : std::uint8_t {
  Track = 0,
  Nodes = 1
};

const char* alignmentToString(Alignment alignment);
// Throws std::invalid_argument for names other than "Track" and "Nodes".
Alignment alignmentFromName(std::string_view name);

// One point of the tessellated curve.
struct CurveSample {
  double alpha{0.0};
  Pose pose;
  int segment{-1};  // first segment whose normalized end distance reaches alpha, -1 if none
};

using ListenerId = std::uint64_t;

// Uniform Catmull-Rom curve through oriented control points.
//
// Segment i runs from control point i to i+1 and is evaluated on the window
// [i-1, i, i+1, i+2] with indices clamped to the ends, so the end points act as their own
// neighbors.
//
// Arc-length tables (built with >= 3 control points, rebuilt on every change):
// - distancePoints()[i]: cumulative polyline length through the end of segment i, sampled
//   every `arc_length_step` in t;
// - normalizedDistancePoints()[i] = distancePoints()[i] / curveLength(); the last entry is 1.
//
// Alpha values are not clamped, except that parametric alpha == 1 returns the last control
// point exactly.
class ANIMKIT_CORE_API Spline {
public:
  // Throws std::invalid_argument when `control_points` is empty.
  explicit Spline(std::vector<Pose> control_points, const Tolerances& tol = kDefaultTolerances);
  ~Spline();

  Spline(const Spline&) = delete;
  Spline& operator=(const Spline&) = delete;

  const std::vector<Pose>& controlPoints() const { return control_points_; }
  Status setControlPoints(std::vector<Pose> control_points);

  int segments() const { return segments_; }
  Status setSegments(int segments);

  // Curve visualization data; while visible the tessellation is kept in sync with rebuilds.
  bool visible() const { return visible_; }
  void setVisible(bool visible);
  const std::vector<CurveSample>& curve() const { return curve_; }
  std::vector<CurveSample> tessellate() const;

  bool hasArcLengthTable() const { return !normalized_distance_points_.empty(); }
  const std::vector<double>& distancePoints() const { return distance_points_; }
  const std::vector<double>& normalizedDistancePoints() const { return normalized_distance_points_; }
  double curveLength() const { return curve_length_; }
  bool isDegenerate() const { return hasArcLengthTable() && curve_length_ <= tol_.zero_length_eps; }

  // Natural query: alpha spreads uniformly over the (count - 1) segments.
  Pose pointAtParametricAlpha(double alpha, Alignment alignment = Alignment::Track) const;

  // Linear query: alpha is reparameterized by the arc-length table so equal alpha steps cover
  // roughly equal distances. Fails with InvalidParameter when fewer than 3 control points exist.
  // A zero-length curve returns the first control point.
  Status pointAtArcLengthAlpha(double alpha, Pose* out, Alignment alignment = Alignment::Track) const;

  // Destroying notification. Listeners run once, in connection order, when destroy() runs.
  ListenerId onDestroying(std::function<void()> listener);
  bool disconnect(ListenerId id);

  // Fires the destroying notification, then releases curve data and listeners. Idempotent;
  // also run by the destructor.
  // An exception from a listener propagates out of destroy() with the spline already
  // destroyed and later listeners skipped. When run by the destructor, std::exception
  // errors are logged and the remaining listeners still run; any other exception type
  // terminates.
  void destroy();
  bool destroyed() const { return destroyed_; }

private:
  void rebuild();
  void releaseCurve();
  void teardown(bool from_destructor);
  Pose evaluateSegment(int segment, double t, Alignment alignment) const;

  std::vector<Pose> control_points_;
  int segments_;
  Tolerances tol_;

  std::vector<double> distance_points_;
  std::vector<double> normalized_distance_points_;
  double curve_length_{0.0};

  bool visible_{false};
  std::vector<CurveSample> curve_;

  std::vector<std::pair<ListenerId, std::function<void()>>> destroying_listeners_;
  ListenerId next_listener_{1};
  bool destroyed_{false};
};

}  // namespace animkit::core
