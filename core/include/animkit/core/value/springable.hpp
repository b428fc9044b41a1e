#pragma once
#include "animkit/core/math/types.hpp"

#include <cstdint>
#include <string_view>
#include <variant>

namespace animkit::core {

// Scale + pixel offset along one axis.
struct UDim {
  double scale = 0.0;
  double offset = 0.0;

  UDim() = default;
  UDim(double scale_in, double offset_in) : scale(scale_in), offset(offset_in) {}
};

struct UDim2 {
  UDim x;
  UDim y;

  UDim2() = default;
  UDim2(const UDim& x_in, const UDim& y_in) : x(x_in), y(y_in) {}
  UDim2(double x_scale, double x_offset, double y_scale, double y_offset)
    : x(x_scale, x_offset), y(y_scale, y_offset) {}
};

// RGB in [0, 1].
struct Color3 {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;

  Color3() = default;
  Color3(double r_in, double g_in, double b_in) : r(r_in), g(g_in), b(b_in) {}
};

// The variant index of a Springable equals its ValueKind.
enum class ValueKind : std::uint8_t {
  Scalar = 0,
  Vector2 = 1,
  Vector3 = 2,
  UDim2 = 3,
  UDim = 4,
  Pose = 5,
  Color3 = 6
};

using Springable = std::variant<double, Vec2, Vec3, UDim2, UDim, Pose, Color3>;

// One independent scalar per channel; a pose uses all six (x, y, z, pitch, yaw, roll).
inline constexpr int kMaxChannels = 6;
using Channels = Eigen::Matrix<double, Eigen::Dynamic, 1, 0, kMaxChannels, 1>;

ValueKind kindOf(const Springable& value);
const char* valueKindToString(ValueKind kind);

// Accepts the names produced by valueKindToString plus "CFrame" for Pose.
// Throws std::invalid_argument for anything else.
ValueKind valueKindFromName(std::string_view name);

int channelCount(ValueKind kind);
Springable zeroValue(ValueKind kind);

Channels toChannels(const Springable& value);
Springable fromChannels(ValueKind kind, const Channels& channels);

// Applies the kind's value-domain constraints to a position: color channels clamp to [0, 1].
// Only positions pass through here; color velocity is left unclamped so it can carry a sign.
Channels normalizePosition(ValueKind kind, const Channels& position);

// Pose angle channels of `target` are moved to the equivalent angle closest to `reference`.
Channels unwrapTarget(ValueKind kind, const Channels& target, const Channels& reference);

// True when every channel group of (position - target) and velocity is within epsilon.
// Vector-like kinds compare magnitudes, compound kinds compare per component.
bool isSettled(ValueKind kind,
               const Channels& position,
               const Channels& velocity,
               const Channels& target,
               double epsilon);

}  // namespace animkit::core
