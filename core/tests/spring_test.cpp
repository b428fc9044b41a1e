#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>

#include "animkit/core/math/orientation.hpp"
#include "animkit/core/spring/spring.hpp"
#include "animkit/core/time/clock.hpp"
#include "animkit/core/time/tick_scheduler.hpp"

using animkit::core::Color3;
using animkit::core::ManualClock;
using animkit::core::Pose;
using animkit::core::Spring;
using animkit::core::SpringInfo;
using animkit::core::SpringOptions;
using animkit::core::Springable;
using animkit::core::Status;
using animkit::core::TickScheduler;
using animkit::core::UDim;
using animkit::core::UDim2;
using animkit::core::Vec2;
using animkit::core::Vec3;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static double scalar(const Springable& v) {
  return std::get<double>(v);
}

// Every spring in this file gets a private scheduler so nothing leaks into the default one.
static SpringOptions opts(const ManualClock& clock, TickScheduler& sched) {
  SpringOptions o;
  o.clock = clock.fn();
  o.scheduler = &sched;
  return o;
}

static void test_reads_are_idempotent() {
  ManualClock c;
  TickScheduler sched;
  Spring s(0.0, opts(c, sched));
  assert(s.setTarget(10.0) == Status::Success);
  c.advance(0.3);

  const double p1 = scalar(s.position());
  const double p2 = scalar(s.position());
  const double v1 = scalar(s.velocity());
  const double v2 = scalar(s.velocity());
  assert(p1 == p2);
  assert(v1 == v2);
  assert(p1 > 0.0 && p1 < 10.0);

  const auto st = s.state();
  assert(scalar(st.position) == p1);
  assert(scalar(st.velocity) == v1);
}

static void test_reaches_target() {
  ManualClock c;
  TickScheduler sched;
  Spring s(0.0, opts(c, sched));
  assert(s.damper() == 1.0);
  assert(s.speed() == 1.0);
  assert(s.setTarget(10.0) == Status::Success);
  assert(scalar(s.position()) == 0.0);

  c.set(100.0);
  assert(near(scalar(s.position()), 10.0, 1e-6));
  assert(near(scalar(s.velocity()), 0.0, 1e-6));
}

static void test_settles_to_exact_target() {
  const double dampers[] = {0.5, 1.0, 2.0, 5.0};
  const double speeds[] = {1.0, 10.0, 50.0};

  for (double d : dampers) {
    for (double sp : speeds) {
      ManualClock c;
      TickScheduler sched;
      Spring s(0.0, opts(c, sched));
      assert(s.setDamper(d) == Status::Success);
      assert(s.setSpeed(sp) == Status::Success);
      assert(s.setTarget(10.0) == Status::Success);
      assert(s.impulse(3.0) == Status::Success);

      const double bound = 200.0 / sp;
      bool settled = false;
      for (double t = 0.0; t < bound; t += 0.05) {
        c.advance(0.05);
        const auto [animating, value] = s.isAnimating();
        if (!animating) {
          assert(scalar(value) == 10.0);
          settled = true;
          break;
        }
      }
      assert(settled);
    }
  }
}

static void test_regimes_are_continuous() {
  const double dampers[] = {1.0 - 1e-6, 1.0, 1.0 + 1e-6};
  double positions[3];
  double velocities[3];

  for (int i = 0; i < 3; ++i) {
    ManualClock c;
    TickScheduler sched;
    Spring s(2.0, opts(c, sched));
    assert(s.setDamper(dampers[i]) == Status::Success);
    assert(s.setSpeed(4.0) == Status::Success);
    assert(s.setVelocity(-1.5) == Status::Success);
    assert(s.setTarget(-3.0) == Status::Success);
    c.advance(0.7);
    positions[i] = scalar(s.position());
    velocities[i] = scalar(s.velocity());
  }

  assert(near(positions[0], positions[1], 1e-4));
  assert(near(positions[2], positions[1], 1e-4));
  assert(near(velocities[0], velocities[1], 1e-4));
  assert(near(velocities[2], velocities[1], 1e-4));
}

static void test_time_skip_matches_waiting() {
  ManualClock skipped_clock;
  ManualClock waited_clock;
  TickScheduler sched;
  Spring skipped(0.0, opts(skipped_clock, sched));
  Spring waited(0.0, opts(waited_clock, sched));

  for (Spring* s : {&skipped, &waited}) {
    assert(s->setDamper(0.4) == Status::Success);
    assert(s->setSpeed(3.0) == Status::Success);
    assert(s->setTarget(10.0) == Status::Success);
  }

  assert(skipped.timeSkip(0.4) == Status::Success);
  waited_clock.advance(0.4);

  assert(near(scalar(skipped.position()), scalar(waited.position()), 1e-12));
  assert(near(scalar(skipped.velocity()), scalar(waited.velocity()), 1e-12));

  // The skip does not stop time: both keep evolving identically.
  skipped_clock.advance(0.25);
  waited_clock.advance(0.25);
  assert(near(scalar(skipped.position()), scalar(waited.position()), 1e-12));
}

static void test_writes_snapshot_first() {
  ManualClock c;
  TickScheduler sched;
  Spring s(0.0, opts(c, sched));
  assert(s.impulse(5.0) == Status::Success);
  assert(scalar(s.velocity()) == 5.0);

  c.advance(0.2);
  const double v_before = scalar(s.velocity());
  assert(scalar(s.position()) > 0.0);

  // Changing the target keeps the current motion.
  assert(s.setTarget(4.0) == Status::Success);
  assert(scalar(s.velocity()) == v_before);

  // Position writes keep velocity too.
  assert(s.setPosition(1.0) == Status::Success);
  assert(scalar(s.position()) == 1.0);
  assert(scalar(s.velocity()) == v_before);
}

static void test_advance_to() {
  ManualClock c;
  TickScheduler sched;
  Spring s(0.0, opts(c, sched));
  assert(s.setTarget(1.0) == Status::Success);

  const auto peek = s.advanceTo(0.5, animkit::core::Advance::Peek);
  assert(scalar(s.position()) == 0.0);

  const auto commit = s.advanceTo(0.5, animkit::core::Advance::Commit);
  assert(scalar(commit.position) == scalar(peek.position));
  assert(scalar(commit.velocity) == scalar(peek.velocity));

  // The committed snapshot now sits at t = 0.5.
  c.set(0.5);
  assert(near(scalar(s.position()), scalar(peek.position), 1e-12));
}

static void test_speed_and_damper_limits() {
  ManualClock c;
  TickScheduler sched;
  Spring s(0.0, opts(c, sched));

  assert(s.setSpeed(-3.0) == Status::Success);
  assert(s.speed() == 0.0);
  assert(s.setTarget(10.0) == Status::Success);
  c.advance(5.0);
  assert(scalar(s.position()) == 0.0);

  assert(s.setVelocity(2.0) == Status::Success);
  c.advance(1.5);
  assert(near(scalar(s.position()), 3.0, 1e-12));
  assert(scalar(s.velocity()) == 2.0);

  assert(s.setDamper(-1.0) == Status::InvalidParameter);
  assert(s.setDamper(std::nan("")) == Status::InvalidParameter);
  assert(s.damper() == 1.0);
  assert(s.setDamper(0.0) == Status::Success);
  assert(s.setSpeed(std::numeric_limits<double>::infinity()) == Status::InvalidParameter);
}

static void test_type_mismatch() {
  ManualClock c;
  TickScheduler sched;
  Spring s(Vec3(1.0, 2.0, 3.0), opts(c, sched));
  assert(s.type() == animkit::core::ValueKind::Vector3);

  assert(s.impulse(1.0) == Status::TypeMismatch);
  assert(s.setTarget(Vec2(1.0, 2.0)) == Status::TypeMismatch);
  assert(s.setPosition(Color3(0.1, 0.2, 0.3)) == Status::TypeMismatch);
  assert(s.setVelocity(UDim2(0.0, 1.0, 0.0, 1.0)) == Status::TypeMismatch);

  const Vec3 target = std::get<Vec3>(s.target());
  assert(target == Vec3(1.0, 2.0, 3.0));
  assert(std::get<Vec3>(s.velocity()) == Vec3::Zero());
}

static void test_named_access() {
  ManualClock c;
  TickScheduler sched;
  Spring s(0.0, opts(c, sched));

  assert(s.setScalar("d", 0.5) == Status::Success);
  assert(s.damper() == 0.5);
  assert(s.setScalar("Speed", 7.0) == Status::Success);
  assert(s.getScalar("s") == 7.0);
  assert(s.setValue("t", 3.0) == Status::Success);
  assert(scalar(s.getValue("Target")) == 3.0);
  assert(s.setValue("Value", 1.0) == Status::Success);
  assert(near(scalar(s.getValue("p")), 1.0, 1e-12));
  assert(s.setValue("Velocity", 2.0) == Status::Success);
  assert(near(scalar(s.getValue("v")), 2.0, 1e-12));

  bool threw = false;
  try {
    (void)s.getValue("Bogus");
  } catch (const std::invalid_argument& e) {
    threw = std::string(e.what()).find("\"Bogus\" is not a valid member of Spring") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    (void)s.getScalar("Position");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)s.setValue("Damper", 1.0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  assert(animkit::core::springPropertyFromName("Clock") == animkit::core::SpringProperty::Clock);
  assert(std::string(animkit::core::springPropertyToString(animkit::core::SpringProperty::Type)) == "Type");
}

static void test_pose_takes_short_way_round() {
  using animkit::core::quatFromOrientation;
  ManualClock c;
  TickScheduler sched;

  const Pose start(quatFromOrientation(Vec3(0.0, 3.0, 0.0)), Vec3::Zero());
  const Pose goal(quatFromOrientation(Vec3(0.0, -3.0, 0.0)), Vec3(1.0, 2.0, 3.0));
  Spring s(start, opts(c, sched));
  assert(s.setTarget(goal) == Status::Success);

  // Yaw channel moves from 3.0 up to -3.0 + 2*pi instead of sweeping through zero.
  const double unwrapped = -3.0 + animkit::core::kTwoPi;
  for (int i = 0; i < 20; ++i) {
    c.advance(0.25);
    const double yaw = s.computePositionVelocity(c.now()).position(4);
    assert(yaw >= 3.0 - 1e-9 && yaw <= unwrapped + 1e-9);
  }

  c.set(100.0);
  const Pose reached = std::get<Pose>(s.position());
  assert(animkit::core::rotationDistance(reached.q, goal.q) < 1e-6);
  assert((reached.p - goal.p).norm() < 1e-6);

  const auto [animating, value] = s.isAnimating();
  assert(!animating);
  const Pose exact = std::get<Pose>(value);
  assert(exact.p == goal.p);
  assert(exact.q.coeffs() == goal.q.coeffs());
}

static void test_color_clamps_position_only() {
  ManualClock c;
  TickScheduler sched;
  Spring s(Color3(0.5, 0.5, 0.5), opts(c, sched));
  assert(s.impulse(Color3(50.0, 0.0, 0.0)) == Status::Success);
  c.advance(0.1);

  const Color3 p = std::get<Color3>(s.position());
  const Color3 v = std::get<Color3>(s.velocity());
  assert(p.r == 1.0);
  assert(near(p.g, 0.5, 1e-12));
  assert(v.r > 1.0);
}

static void test_udim2_channels_are_independent() {
  ManualClock c;
  TickScheduler sched;
  Spring s(UDim2(), opts(c, sched));
  const UDim2 goal(1.0, 100.0, 0.5, -40.0);
  assert(s.setTarget(goal) == Status::Success);
  c.advance(0.5);

  const UDim2 p = std::get<UDim2>(s.position());
  const UDim2 v = std::get<UDim2>(s.velocity());
  assert(p.x.offset > 0.0);
  assert(p.y.offset < 0.0);
  assert(v.x.offset > 0.0);
  assert(v.y.offset < 0.0);
  assert(near(p.y.offset / p.x.offset, -0.4, 1e-12));

  c.set(200.0);
  const auto [animating, value] = s.isAnimating();
  assert(!animating);
  const UDim2 exact = std::get<UDim2>(value);
  assert(exact.y.offset == -40.0);
  assert(exact.x.scale == 1.0);
}

static void test_set_clock() {
  ManualClock a(5.0);
  ManualClock b(100.0);
  TickScheduler sched;
  Spring s(0.0, opts(a, sched));
  assert(s.setTarget(1.0) == Status::Success);
  a.advance(0.5);
  const double before = scalar(s.position());

  assert(s.setClock(b.fn()) == Status::Success);
  assert(near(scalar(s.position()), before, 1e-15));
  assert(s.setClock(animkit::core::Clock{}) == Status::InvalidParameter);

  b.advance(0.5);
  assert(scalar(s.position()) > before);
}

static void test_create_and_update_spring() {
  ManualClock c;
  TickScheduler sched;

  SpringInfo info;
  info.initial = 1.0;
  info.target = 4.0;
  info.damper = 0.3;
  info.speed = 8.0;
  info.clock = c.fn();
  info.scheduler = &sched;

  auto s = animkit::core::createSpring(info);
  assert(near(scalar(s->position()), 1.0, 1e-12));
  assert(scalar(s->target()) == 4.0);
  assert(s->damper() == 0.3);
  assert(s->speed() == 8.0);
  assert(&s->scheduler() == &sched);

  SpringInfo update;
  update.velocity = Vec2(1.0, 0.0);
  assert(animkit::core::updateSpring(*s, update) == Status::TypeMismatch);

  update.velocity = 2.0;
  update.speed = 0.0;
  assert(animkit::core::updateSpring(*s, update) == Status::Success);
  assert(near(scalar(s->velocity()), 2.0, 1e-12));
  assert(s->speed() == 0.0);

  SpringInfo bad = info;
  bad.damper = -1.0;
  bool threw = false;
  try {
    (void)animkit::core::createSpring(bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

static void test_pose_impulse_adds_channels() {
  ManualClock c;
  TickScheduler sched;
  Spring s(Pose::Identity(), opts(c, sched));

  const Pose kick(animkit::core::quatFromOrientation(Vec3(0.0, 0.5, 0.0)), Vec3(1.0, 0.0, 0.0));
  assert(s.impulse(kick) == Status::Success);

  // The delta lands on the velocity as (x, y, z, pitch, yaw, roll).
  const animkit::core::Channels v = s.computePositionVelocity(c.now()).velocity;
  assert(v.size() == 6);
  const double expected[] = {1.0, 0.0, 0.0, 0.0, 0.5, 0.0};
  for (int i = 0; i < 6; ++i) {
    assert(near(v(i), expected[i], 1e-12));
  }

  const Pose v_pose = std::get<Pose>(s.velocity());
  assert((v_pose.p - Vec3(1.0, 0.0, 0.0)).norm() < 1e-12);
  assert(animkit::core::rotationDistance(v_pose.q, kick.q) < 1e-12);

  c.advance(0.5);
  const animkit::core::Channels p = s.computePositionVelocity(c.now()).position;
  assert(p(0) > 0.0);
  assert(p(4) > 0.0);

  c.set(100.0);
  const auto [animating, value] = s.isAnimating();
  assert(!animating);
  const Pose rest = std::get<Pose>(value);
  assert(rest.p == Vec3::Zero());
  assert(rest.q.coeffs() == Pose::Identity().q.coeffs());
}

static void test_vector_and_udim_settle() {
  ManualClock c;
  TickScheduler sched;

  Spring v3(Vec3(Vec3::Zero()), opts(c, sched));
  Spring v2(Vec2(Vec2::Zero()), opts(c, sched));
  Spring ud(UDim(), opts(c, sched));
  assert(v3.setTarget(Vec3(3.0, -4.0, 12.0)) == Status::Success);
  assert(v2.setTarget(Vec2(-2.0, 7.5)) == Status::Success);
  assert(ud.setTarget(UDim(0.5, 20.0)) == Status::Success);

  c.advance(0.5);
  assert(v3.isAnimating().first);
  const UDim mid = std::get<UDim>(ud.position());
  assert(mid.scale > 0.0 && mid.scale < 0.5);
  assert(mid.offset > 0.0 && mid.offset < 20.0);
  assert(near(mid.offset / mid.scale, 40.0, 1e-9));

  c.set(100.0);
  const auto [v3_animating, v3_value] = v3.isAnimating();
  assert(!v3_animating);
  assert(std::get<Vec3>(v3_value) == Vec3(3.0, -4.0, 12.0));

  const auto [v2_animating, v2_value] = v2.isAnimating();
  assert(!v2_animating);
  assert(std::get<Vec2>(v2_value) == Vec2(-2.0, 7.5));

  const auto [ud_animating, ud_value] = ud.isAnimating();
  assert(!ud_animating);
  assert(std::get<UDim>(ud_value).scale == 0.5);
  assert(std::get<UDim>(ud_value).offset == 20.0);
}

static void test_settle_uses_magnitude_for_vectors() {
  ManualClock c;
  TickScheduler sched;

  // Frozen springs sitting just off target: every component is inside epsilon.
  Spring v3(Vec3(Vec3::Zero()), opts(c, sched));
  Spring v2(Vec2(Vec2::Zero()), opts(c, sched));
  Spring ud(UDim(), opts(c, sched));
  for (Spring* s : {&v3, &v2, &ud}) {
    assert(s->setSpeed(0.0) == Status::Success);
  }
  assert(v3.setTarget(Vec3(6e-5, 6e-5, 6e-5)) == Status::Success);
  assert(v2.setTarget(Vec2(8e-5, 8e-5)) == Status::Success);
  assert(ud.setTarget(UDim(6e-5, 6e-5)) == Status::Success);
  c.advance(1.0);

  // Vectors compare the length of the offset, UDim compares each component.
  assert(v3.isAnimating().first);
  assert(v2.isAnimating().first);
  assert(!ud.isAnimating().first);

  assert(!v3.isAnimating(2e-4).first);
  assert(!v2.isAnimating(2e-4).first);
}

int main() {
  test_reads_are_idempotent();
  test_reaches_target();
  test_settles_to_exact_target();
  test_regimes_are_continuous();
  test_time_skip_matches_waiting();
  test_writes_snapshot_first();
  test_advance_to();
  test_speed_and_damper_limits();
  test_type_mismatch();
  test_named_access();
  test_pose_takes_short_way_round();
  test_color_clamps_position_only();
  test_udim2_channels_are_independent();
  test_pose_impulse_adds_channels();
  test_vector_and_udim_settle();
  test_settle_uses_magnitude_for_vectors();
  test_set_clock();
  test_create_and_update_spring();
  std::cout << "spring_test: PASS\n";
  return 0;
}
