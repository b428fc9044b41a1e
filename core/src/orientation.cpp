// Orientation utilities.
// - Euler layout is (pitch, yaw, roll) with R = Ry(yaw) * Rx(pitch) * Rz(roll).
// - `orientationFromQuat` returns pitch in [-pi/2, pi/2]; at gimbal lock roll is folded into yaw.
// - `rotationDistance` is the quaternion chordal distance, not an angle.
#include "animkit/core/math/orientation.hpp"
#include <algorithm>
#include <cmath>

namespace animkit::core {

static inline double clamp(double x, double lo, double hi) {
  return std::max(lo, std::min(hi, x));
}

static constexpr double kDegToRad = kPi / 180.0;
static constexpr double kRadToDeg = 180.0 / kPi;

Quat quatFromOrientation(const Vec3& pitch_yaw_roll) {
  const Quat q = Eigen::AngleAxisd(pitch_yaw_roll.y(), Vec3::UnitY())
               * Eigen::AngleAxisd(pitch_yaw_roll.x(), Vec3::UnitX())
               * Eigen::AngleAxisd(pitch_yaw_roll.z(), Vec3::UnitZ());
  return q.normalized();
}

Vec3 orientationFromQuat(const Quat& q) {
  const Mat3 R = q.normalized().toRotationMatrix();
  const double sin_pitch = clamp(-R(1,2), -1.0, 1.0);
  const double pitch = std::asin(sin_pitch);

  if (std::abs(sin_pitch) < 1.0 - 1e-12) {
    const double yaw = std::atan2(R(0,2), R(2,2));
    const double roll = std::atan2(R(1,0), R(1,1));
    return Vec3(pitch, yaw, roll);
  }

  // Gimbal lock: yaw and roll share an axis, keep roll at zero.
  const double yaw = std::atan2(-R(2,0), R(0,0));
  return Vec3(pitch, yaw, 0.0);
}

Quat quatFromOrientationDegrees(const Vec3& pitch_yaw_roll_deg) {
  return quatFromOrientation(pitch_yaw_roll_deg * kDegToRad);
}

Vec3 orientationDegreesFromQuat(const Quat& q) {
  return orientationFromQuat(q) * kRadToDeg;
}

std::pair<Vec3, double> axisAngle(const Quat& q) {
  const Eigen::AngleAxisd aa(q.normalized());
  if (std::abs(aa.angle()) < 1e-12) {
    return {Vec3::Zero(), 0.0};
  }
  return {aa.axis().normalized(), aa.angle()};
}

Quat slerp(const Quat& q0, const Quat& q1, double t) {
  Quat a = q0.normalized();
  Quat b = q1.normalized();
  // Ensure shortest path
  if (a.dot(b) < 0.0) b.coeffs() *= -1.0;
  Quat out = a.slerp(t, b);
  out.normalize();
  return out;
}

double closestAngle(double angle, double reference) {
  const double turns = std::round((reference - angle) / kTwoPi);
  return angle + turns * kTwoPi;
}

double rotationDistance(const Quat& q1, const Quat& q2) {
  const Eigen::Vector4d v1 = q1.normalized().coeffs();
  const Eigen::Vector4d v2 = q2.normalized().coeffs();
  return std::min((v1 - v2).norm(), (v1 + v2).norm());
}

Quat lookRotation(const Vec3& direction, const Vec3& up, const Tolerances& tol) {
  const double len = direction.norm();
  if (len < tol.direction_eps) {
    return Quat::Identity();
  }
  const Vec3 forward = direction / len;

  Vec3 right = forward.cross(up);
  if (right.norm() < tol.direction_eps) {
    right = forward.cross(Vec3::UnitZ());
  }
  right.normalize();
  const Vec3 true_up = right.cross(forward);

  Mat3 R;
  R.col(0) = right;
  R.col(1) = true_up;
  R.col(2) = -forward;
  Quat q(R);
  q.normalize();
  return q;
}

Pose lookAt(const Vec3& eye, const Vec3& target, const Vec3& up, const Tolerances& tol) {
  return Pose(lookRotation(target - eye, up, tol), eye);
}

}  // namespace animkit::core
