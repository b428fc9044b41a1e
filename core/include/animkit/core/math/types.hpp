#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace animkit::core {

// Fundamental math types and conventions used across the library.
// - `Pose` is a rigid transform (rotation + translation), composed by left-multiplication
//   (A * B applies B, then A).
// - The look vector of a rotation is its -Z axis; +Y is up.
// - Orientation angles are (pitch, yaw, roll) in radians about (X, Y, Z),
//   composed as R = Ry(yaw) * Rx(pitch) * Rz(roll).
using Vec2 = Eigen::Vector2d;
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Quat = Eigen::Quaterniond;

struct Pose {
  Quat q{Quat::Identity()};  // rotation
  Vec3 p{Vec3::Zero()};      // translation

  Pose() = default;
  Pose(const Quat& q_in, const Vec3& p_in) : q(q_in), p(p_in) {}

  static Pose Identity() { return Pose(); }
  static Pose fromPosition(const Vec3& p_in) { return Pose(Quat::Identity(), p_in); }

  Mat3 R() const { return q.toRotationMatrix(); }

  Vec3 lookVector() const { return -(q * Vec3::UnitZ()); }
  Vec3 upVector() const { return q * Vec3::UnitY(); }
  Vec3 rightVector() const { return q * Vec3::UnitX(); }

  Pose inverse() const {
    Quat qi = q.conjugate();
    return Pose(qi, -(qi * p));
  }

  Pose operator*(const Pose& other) const {
    return Pose(q * other.q, p + q * other.p);
  }

  Vec3 operator*(const Vec3& point) const {
    return p + q * point;
  }
};

}  // namespace animkit::core
