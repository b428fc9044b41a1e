#pragma once
#include "animkit/core/common/constants.hpp"
#include "animkit/core/math/types.hpp"

#include <utility>

namespace animkit::core {

// Euler orientation <-> rotation, radians. Layout is (pitch, yaw, roll).
Quat quatFromOrientation(const Vec3& pitch_yaw_roll);
Vec3 orientationFromQuat(const Quat& q);

// Same conversions in degrees.
Quat quatFromOrientationDegrees(const Vec3& pitch_yaw_roll_deg);
Vec3 orientationDegreesFromQuat(const Quat& q);

// Unit axis and angle in [0, pi]. The axis is zero for the identity rotation.
std::pair<Vec3, double> axisAngle(const Quat& q);

// Shortest-path spherical interpolation.
Quat slerp(const Quat& q0, const Quat& q1, double t);

// Returns the angle equivalent to `angle` (modulo 2*pi) that is closest to `reference`.
double closestAngle(double angle, double reference);

// Quaternion chordal distance min(||q1 - q2||, ||q1 + q2||).
double rotationDistance(const Quat& q1, const Quat& q2);

// Rotation whose look vector (-Z) points along `direction`.
// A zero direction yields identity; a direction parallel to `up` falls back to +Z as up.
Quat lookRotation(const Vec3& direction,
                  const Vec3& up = Vec3::UnitY(),
                  const Tolerances& tol = kDefaultTolerances);

Pose lookAt(const Vec3& eye,
            const Vec3& target,
            const Vec3& up = Vec3::UnitY(),
            const Tolerances& tol = kDefaultTolerances);

}  // namespace animkit::core
