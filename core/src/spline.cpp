#include "animkit/core/spline/spline.hpp"

#include "animkit/core/common/logger.hpp"
#include "animkit/core/math/orientation.hpp"
#include "animkit/core/spline/catmull_rom.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace animkit::core {

const char* alignmentToString(Alignment alignment) {
  switch (alignment) {
    case Alignment::Track: return "Track";
    case Alignment::Nodes: return "Nodes";
  }
  return "Unknown";
}

Alignment alignmentFromName(std::string_view name) {
  if (name == "Track") return Alignment::Track;
  if (name == "Nodes") return Alignment::Nodes;
  throw std::invalid_argument("'" + std::string(name) + "' is not a valid alignment");
}

static inline int clampIndex(int i, int last) {
  return std::max(0, std::min(i, last));
}

// Window [i-1, i, i+1, i+2] clamped to the control point range.
static CatmullRomSegment<Vec3> segmentWindow(const std::vector<Pose>& cps, int i) {
  const int last = static_cast<int>(cps.size()) - 1;
  const Vec3& p0 = cps[static_cast<size_t>(clampIndex(i - 1, last))].p;
  const Vec3& p1 = cps[static_cast<size_t>(clampIndex(i, last))].p;
  const Vec3& p2 = cps[static_cast<size_t>(clampIndex(i + 1, last))].p;
  const Vec3& p3 = cps[static_cast<size_t>(clampIndex(i + 2, last))].p;
  return catmullRom<Vec3>(p0, p1, p2, p3);
}

Spline::Spline(std::vector<Pose> control_points, const Tolerances& tol)
  : control_points_(std::move(control_points)),
    segments_(tol.default_segments),
    tol_(tol) {
  if (control_points_.empty()) {
    log(LogLevel::Error, "Spline: at least one control point is required");
    throw std::invalid_argument("Spline: empty control point list");
  }
  rebuild();
}

Spline::~Spline() {
  teardown(true);
}

Status Spline::setControlPoints(std::vector<Pose> control_points) {
  if (destroyed_) {
    log(LogLevel::Error, "Spline::setControlPoints: spline was destroyed");
    return Status::Failure;
  }
  if (control_points.empty()) {
    log(LogLevel::Error, "Spline::setControlPoints: at least one control point is required");
    return Status::InvalidParameter;
  }
  control_points_ = std::move(control_points);
  rebuild();
  return Status::Success;
}

Status Spline::setSegments(int segments) {
  if (destroyed_) {
    log(LogLevel::Error, "Spline::setSegments: spline was destroyed");
    return Status::Failure;
  }
  if (segments < 1) {
    log(LogLevel::Error, "Spline::setSegments: segments must be >= 1");
    return Status::InvalidParameter;
  }
  segments_ = segments;
  rebuild();
  return Status::Success;
}

void Spline::setVisible(bool visible) {
  visible_ = visible && !destroyed_;
  if (visible_ && curve_.empty()) {
    curve_ = tessellate();
  }
}

void Spline::rebuild() {
  distance_points_.clear();
  normalized_distance_points_.clear();
  curve_length_ = 0.0;
  curve_.clear();

  const int n = static_cast<int>(control_points_.size());
  if (n < 3) {
    log(LogLevel::Debug, "Spline: fewer than 3 control points, arc-length table skipped");
    if (visible_) curve_ = tessellate();
    return;
  }

  double step = tol_.arc_length_step;
  if (!(step > 0.0) || !std::isfinite(step)) {
    log(LogLevel::Warn, "Spline: arc_length_step must be > 0, using the default step");
    step = kDefaultTolerances.arc_length_step;
  }

  distance_points_.reserve(static_cast<size_t>(n - 1));
  for (int i = 0; i < n - 1; ++i) {
    const CatmullRomSegment<Vec3> seg = segmentWindow(control_points_, i);

    // Polyline over t = 0, step, 2*step, ... while t <= 1 - step. t is accumulated, so with
    // step 0.01 rounding ends the walk at t ~ 0.98 (99 samples).
    double length = 0.0;
    Vec3 last = control_points_[static_cast<size_t>(i)].p;
    for (double t = 0.0; t <= 1.0 - step; t += step) {
      const Vec3 pos = seg.position(t);
      length += (pos - last).norm();
      last = pos;
    }

    curve_length_ += length;
    distance_points_.push_back(curve_length_);
  }

  normalized_distance_points_.resize(distance_points_.size(), 0.0);
  if (curve_length_ <= tol_.zero_length_eps) {
    log(LogLevel::Warn, "Spline: curve has zero length, arc-length queries return the first control point");
  } else {
    for (size_t i = 0; i < distance_points_.size(); ++i) {
      normalized_distance_points_[i] = distance_points_[i] / curve_length_;
    }
  }

  if (visible_) {
    curve_ = tessellate();
  }
}

Pose Spline::evaluateSegment(int segment, double t, Alignment alignment) const {
  const CatmullRomSegment<Vec3> seg = segmentWindow(control_points_, segment);
  const Vec3 position = seg.position(t);

  if (alignment == Alignment::Track) {
    return Pose(lookRotation(seg.derivative(t), Vec3::UnitY(), tol_), position);
  }

  const int last = static_cast<int>(control_points_.size()) - 1;
  const Pose& c1 = control_points_[static_cast<size_t>(clampIndex(segment, last))];
  const Pose& c2 = control_points_[static_cast<size_t>(clampIndex(segment + 1, last))];
  return Pose(slerp(c1.q, c2.q, smoothstep(t)), position);
}

Pose Spline::pointAtParametricAlpha(double alpha, Alignment alignment) const {
  if (alpha == 1.0) {
    return control_points_.back();
  }

  const int segment_count = static_cast<int>(control_points_.size()) - 1;
  if (segment_count == 0) {
    return control_points_.front();
  }

  const double scaled = segment_count * alpha;
  // Out-of-range alpha extrapolates the end segments instead of indexing past them.
  const double index = std::max(-1.0, std::min(std::floor(scaled), static_cast<double>(segment_count)));
  const double t = scaled - index;
  return evaluateSegment(static_cast<int>(index), t, alignment);
}

Status Spline::pointAtArcLengthAlpha(double alpha, Pose* out, Alignment alignment) const {
  if (!out) {
    log(LogLevel::Error, "Spline::pointAtArcLengthAlpha: null output");
    return Status::InvalidParameter;
  }
  if (!hasArcLengthTable()) {
    if (shouldLog(LogLevel::Error)) {
      std::ostringstream oss;
      oss << "Spline::pointAtArcLengthAlpha: requires at least 3 control points (have "
          << control_points_.size() << ")";
      log(LogLevel::Error, oss.str());
    }
    return Status::InvalidParameter;
  }
  if (isDegenerate()) {
    *out = control_points_.front();
    return Status::Success;
  }

  const std::vector<double>& nd = normalized_distance_points_;
  const auto it = std::find_if(nd.begin(), nd.end(), [alpha](double d) { return d >= alpha; });
  const int segment = (it == nd.end())
    ? static_cast<int>(nd.size()) - 1
    : static_cast<int>(it - nd.begin());

  const double previous = segment > 0 ? nd[static_cast<size_t>(segment - 1)] : 0.0;
  const double span = nd[static_cast<size_t>(segment)] - previous;
  const double t = span > tol_.zero_length_eps ? (alpha - previous) / span : 0.0;

  *out = evaluateSegment(segment, t, alignment);
  return Status::Success;
}

std::vector<CurveSample> Spline::tessellate() const {
  std::vector<CurveSample> out;
  const int count = segments_ * static_cast<int>(control_points_.size());
  if (count <= 0) return out;

  out.reserve(static_cast<size_t>(count) + 1);
  for (int i = 0; i <= count; ++i) {
    CurveSample sample;
    sample.alpha = static_cast<double>(i) / static_cast<double>(count);
    sample.pose = pointAtParametricAlpha(sample.alpha, Alignment::Track);
    for (size_t j = 0; j < normalized_distance_points_.size(); ++j) {
      if (normalized_distance_points_[j] >= sample.alpha) {
        sample.segment = static_cast<int>(j);
        break;
      }
    }
    out.push_back(sample);
  }
  return out;
}

ListenerId Spline::onDestroying(std::function<void()> listener) {
  if (!listener || destroyed_) return 0;
  const ListenerId id = next_listener_++;
  destroying_listeners_.emplace_back(id, std::move(listener));
  return id;
}

bool Spline::disconnect(ListenerId id) {
  const auto it = std::find_if(destroying_listeners_.begin(), destroying_listeners_.end(),
                               [id](const auto& entry) { return entry.first == id; });
  if (it == destroying_listeners_.end()) return false;
  destroying_listeners_.erase(it);
  return true;
}

void Spline::destroy() {
  teardown(false);
}

void Spline::releaseCurve() {
  visible_ = false;
  curve_.clear();
  curve_.shrink_to_fit();
}

void Spline::teardown(bool from_destructor) {
  if (destroyed_) return;
  destroyed_ = true;

  const auto listeners = std::move(destroying_listeners_);
  destroying_listeners_.clear();
  for (const auto& entry : listeners) {
    if (!from_destructor) {
      try {
        entry.second();
      } catch (...) {
        releaseCurve();
        throw;
      }
      continue;
    }

    // Nothing may escape a destructor; log and keep notifying.
    try {
      entry.second();
    } catch (const std::exception& e) {
      log(LogLevel::Error, std::string("Spline::~Spline: destroying listener threw: ") + e.what());
    }
  }

  releaseCurve();
}

}  // namespace animkit::core
