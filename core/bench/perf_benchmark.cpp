#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "animkit/core/math/orientation.hpp"
#include "animkit/core/spline/spline.hpp"
#include "animkit/core/spring/spring.hpp"
#include "animkit/core/time/clock.hpp"
#include "animkit/core/time/tick_scheduler.hpp"

using animkit::core::Alignment;
using animkit::core::ManualClock;
using animkit::core::Pose;
using animkit::core::Spline;
using animkit::core::Spring;
using animkit::core::SpringOptions;
using animkit::core::Status;
using animkit::core::TickScheduler;
using animkit::core::Vec3;
using animkit::core::ok;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

// Helix-like path with a gentle roll at every control point.
static std::vector<Pose> makeBenchPath(int points) {
  std::vector<Pose> cps;
  cps.reserve(static_cast<size_t>(points));
  for (int i = 0; i < points; ++i) {
    const double a = 0.6 * static_cast<double>(i);
    const Vec3 p(10.0 * std::cos(a), 2.0 * static_cast<double>(i), 10.0 * std::sin(a));
    const Vec3 angles(0.0, -a, 0.1 * std::sin(a));
    cps.emplace_back(animkit::core::quatFromOrientation(angles), p);
  }
  return cps;
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: animkit_core_perf [--points=N] [--spring-iters=N] [--spline-iters=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int points = parseIntArg(argc, argv, "--points", 32);
  const int spring_iters = parseIntArg(argc, argv, "--spring-iters", 200000);
  const int spline_iters = parseIntArg(argc, argv, "--spline-iters", 100000);
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  if (points < 3) {
    std::cerr << "--points must be >= 3\n";
    return 1;
  }

  ManualClock clock;
  TickScheduler scheduler;
  SpringOptions options;
  options.clock = clock.fn();
  options.scheduler = &scheduler;

  Spring scalar(0.0, options);
  Spring pose(Pose::Identity(), options);
  if (!ok(scalar.setTarget(10.0)) || !ok(scalar.setDamper(0.4)) ||
      !ok(pose.setTarget(Pose(animkit::core::quatFromOrientation(Vec3(0.3, 2.5, -0.2)),
                              Vec3(4.0, -1.0, 7.0))))) {
    std::cerr << "spring setup failed\n";
    return 1;
  }

  const Spline spline(makeBenchPath(points));
  double acc = 0.0;

  auto run_scalar = [&]() {
    for (int i = 0; i < spring_iters; ++i) {
      clock.set(0.0001 * static_cast<double>(i));
      acc += std::get<double>(scalar.position());
    }
  };

  auto run_pose = [&]() {
    for (int i = 0; i < spring_iters; ++i) {
      clock.set(0.0001 * static_cast<double>(i));
      acc += std::get<Pose>(pose.position()).p.x();
    }
  };

  auto run_parametric = [&]() {
    for (int i = 0; i < spline_iters; ++i) {
      const double alpha = static_cast<double>(i % 1000) / 1000.0;
      acc += spline.pointAtParametricAlpha(alpha, Alignment::Track).p.y();
    }
  };

  auto run_linear = [&]() {
    Pose out;
    for (int i = 0; i < spline_iters; ++i) {
      const double alpha = static_cast<double>(i % 1000) / 1000.0;
      const Status st = spline.pointAtArcLengthAlpha(alpha, &out, Alignment::Nodes);
      if (!ok(st)) {
        std::cerr << "pointAtArcLengthAlpha failed\n";
        std::exit(1);
      }
      acc += out.p.y();
    }
  };

  std::vector<double> scalar_runs;
  std::vector<double> pose_runs;
  std::vector<double> parametric_runs;
  std::vector<double> linear_runs;
  scalar_runs.reserve(trials);
  pose_runs.reserve(trials);
  parametric_runs.reserve(trials);
  linear_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_scalar();
    run_pose();
    run_parametric();
    run_linear();
  }

  for (int i = 0; i < trials; ++i) {
    scalar_runs.push_back(benchMs(run_scalar));
    pose_runs.push_back(benchMs(run_pose));
    parametric_runs.push_back(benchMs(run_parametric));
    linear_runs.push_back(benchMs(run_linear));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double scalar_ms = median(scalar_runs);
  const double pose_ms = median(pose_runs);
  const double parametric_ms = median(parametric_runs);
  const double linear_ms = median(linear_runs);

  std::cout << "animkit_core_perf\n";
  std::cout << "  control points: " << points << " (curve length " << spline.curveLength() << ")\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  Spring<number>::position: " << scalar_ms << " ms total, "
            << (scalar_ms * 1e6 / spring_iters) << " ns/call\n";
  std::cout << "  Spring<Pose>::position:   " << pose_ms << " ms total, "
            << (pose_ms * 1e6 / spring_iters) << " ns/call\n";
  std::cout << "  pointAtParametricAlpha:   " << parametric_ms << " ms total, "
            << (parametric_ms * 1e6 / spline_iters) << " ns/call\n";
  std::cout << "  pointAtArcLengthAlpha:    " << linear_ms << " ms total, "
            << (linear_ms * 1e6 / spline_iters) << " ns/call\n";

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
