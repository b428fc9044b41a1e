#include "animkit/core/value/springable.hpp"

#include "animkit/core/math/orientation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace animkit::core {

static inline double clamp01(double x) {
  return std::max(0.0, std::min(1.0, x));
}

ValueKind kindOf(const Springable& value) {
  if (value.valueless_by_exception()) {
    throw std::invalid_argument("kindOf: valueless springable");
  }
  return static_cast<ValueKind>(value.index());
}

const char* valueKindToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::Scalar: return "number";
    case ValueKind::Vector2: return "Vector2";
    case ValueKind::Vector3: return "Vector3";
    case ValueKind::UDim2: return "UDim2";
    case ValueKind::UDim: return "UDim";
    case ValueKind::Pose: return "Pose";
    case ValueKind::Color3: return "Color3";
  }
  return "Unknown";
}

ValueKind valueKindFromName(std::string_view name) {
  if (name == "number") return ValueKind::Scalar;
  if (name == "Vector2") return ValueKind::Vector2;
  if (name == "Vector3") return ValueKind::Vector3;
  if (name == "UDim2") return ValueKind::UDim2;
  if (name == "UDim") return ValueKind::UDim;
  if (name == "Pose" || name == "CFrame") return ValueKind::Pose;
  if (name == "Color3") return ValueKind::Color3;
  throw std::invalid_argument("'" + std::string(name) + "' is not a springable type");
}

int channelCount(ValueKind kind) {
  switch (kind) {
    case ValueKind::Scalar: return 1;
    case ValueKind::Vector2: return 2;
    case ValueKind::Vector3: return 3;
    case ValueKind::UDim2: return 4;
    case ValueKind::UDim: return 2;
    case ValueKind::Pose: return 6;
    case ValueKind::Color3: return 3;
  }
  return 0;
}

Springable zeroValue(ValueKind kind) {
  switch (kind) {
    case ValueKind::Scalar: return 0.0;
    case ValueKind::Vector2: return Vec2(Vec2::Zero());
    case ValueKind::Vector3: return Vec3(Vec3::Zero());
    case ValueKind::UDim2: return UDim2();
    case ValueKind::UDim: return UDim();
    case ValueKind::Pose: return Pose::Identity();
    case ValueKind::Color3: return Color3();
  }
  throw std::invalid_argument("zeroValue: unknown value kind");
}

Channels toChannels(const Springable& value) {
  const ValueKind kind = kindOf(value);
  Channels c(channelCount(kind));

  switch (kind) {
    case ValueKind::Scalar:
      c(0) = std::get<double>(value);
      break;
    case ValueKind::Vector2:
      c = std::get<Vec2>(value);
      break;
    case ValueKind::Vector3:
      c = std::get<Vec3>(value);
      break;
    case ValueKind::UDim2: {
      const UDim2& u = std::get<UDim2>(value);
      c << u.x.scale, u.x.offset, u.y.scale, u.y.offset;
      break;
    }
    case ValueKind::UDim: {
      const UDim& u = std::get<UDim>(value);
      c << u.scale, u.offset;
      break;
    }
    case ValueKind::Pose: {
      const Pose& pose = std::get<Pose>(value);
      c.head<3>() = pose.p;
      c.tail<3>() = orientationFromQuat(pose.q);
      break;
    }
    case ValueKind::Color3: {
      const Color3& col = std::get<Color3>(value);
      c << col.r, col.g, col.b;
      break;
    }
  }
  return c;
}

Springable fromChannels(ValueKind kind, const Channels& c) {
  if (c.size() != channelCount(kind)) {
    throw std::invalid_argument(std::string("fromChannels: channel count mismatch for ")
                                + valueKindToString(kind));
  }

  switch (kind) {
    case ValueKind::Scalar:
      return c(0);
    case ValueKind::Vector2:
      return Vec2(c(0), c(1));
    case ValueKind::Vector3:
      return Vec3(c(0), c(1), c(2));
    case ValueKind::UDim2:
      return UDim2(c(0), c(1), c(2), c(3));
    case ValueKind::UDim:
      return UDim(c(0), c(1));
    case ValueKind::Pose:
      return Pose(quatFromOrientation(Vec3(c(3), c(4), c(5))), Vec3(c(0), c(1), c(2)));
    case ValueKind::Color3:
      return Color3(c(0), c(1), c(2));
  }
  throw std::invalid_argument("fromChannels: unknown value kind");
}

Channels normalizePosition(ValueKind kind, const Channels& position) {
  if (kind != ValueKind::Color3) return position;
  Channels out = position;
  for (Eigen::Index i = 0; i < out.size(); ++i) {
    out(i) = clamp01(out(i));
  }
  return out;
}

Channels unwrapTarget(ValueKind kind, const Channels& target, const Channels& reference) {
  if (kind != ValueKind::Pose) return target;
  Channels out = target;
  for (Eigen::Index i = 3; i < 6; ++i) {
    out(i) = closestAngle(target(i), reference(i));
  }
  return out;
}

bool isSettled(ValueKind kind,
               const Channels& position,
               const Channels& velocity,
               const Channels& target,
               double epsilon) {
  const Channels delta = position - target;

  switch (kind) {
    case ValueKind::Scalar:
    case ValueKind::UDim2:
    case ValueKind::UDim:
      return delta.cwiseAbs().maxCoeff() <= epsilon
          && velocity.cwiseAbs().maxCoeff() <= epsilon;

    case ValueKind::Vector2:
    case ValueKind::Vector3:
    case ValueKind::Color3:
      return delta.norm() <= epsilon && velocity.norm() <= epsilon;

    case ValueKind::Pose:
      return delta.head<3>().norm() <= epsilon
          && velocity.head<3>().norm() <= epsilon
          && delta.tail<3>().norm() <= epsilon
          && velocity.tail<3>().norm() <= epsilon;
  }
  return true;
}

}  // namespace animkit::core
