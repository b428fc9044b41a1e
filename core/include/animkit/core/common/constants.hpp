#pragma once

namespace animkit::core {

// Numerical tolerances and defaults shared by the spring and spline code.
struct Tolerances {
  double settle_epsilon = 1.0e-4;    // isAnimating() threshold per channel group
  double arc_length_step = 0.01;     // parametric step for arc-length tables
  int default_segments = 10;         // spline resolution (samples per curve)

  // general numerical
  double zero_length_eps = 1.0e-12;
  double direction_eps = 1.0e-12;
};

inline constexpr Tolerances kDefaultTolerances{};

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kTwoPi = 2.0 * kPi;

}  // namespace animkit::core
