#pragma once
#include <Eigen/Core>

namespace animkit::core {

// Uniform Catmull-Rom segment between p1 and p2 in power form:
//   x(t) = point + tangent*t + second*t^2 + third*t^3,  t in [0, 1]
// `V` is any fixed-size Eigen column vector, so control points may have any dimension.
template <typename V>
struct CatmullRomSegment {
  V point;    // x(0) = p1
  V tangent;  // x'(0)
  V second;   // t^2 coefficient
  V third;    // t^3 coefficient

  V position(double t) const {
    return point + tangent * t + second * (t * t) + third * (t * t * t);
  }

  // Analytic first derivative dx/dt.
  V derivative(double t) const {
    return tangent + 2.0 * second * t + 3.0 * third * (t * t);
  }
};

template <typename V>
CatmullRomSegment<V> catmullRom(const V& p0, const V& p1, const V& p2, const V& p3) {
  CatmullRomSegment<V> seg;
  seg.point = p1;
  seg.tangent = 0.5 * (p2 - p0);
  seg.second = p0 - 2.5 * p1 + 2.0 * p2 - 0.5 * p3;
  seg.third = 1.5 * (p1 - p2) + 0.5 * (p3 - p0);
  return seg;
}

// Smoothstep 3t^2 - 2t^3.
inline double smoothstep(double t) {
  return t * t * (3.0 - 2.0 * t);
}

}  // namespace animkit::core
