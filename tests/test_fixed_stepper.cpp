// tests/test_fixed_stepper.cpp
//
// Accumulator drain and stall clamp of core/FixedStepper.

#include <doctest/doctest.h>

#include <vector>

#include "core/FixedStepper.h"

namespace {

constexpr double kStep = 1.0 / 60.0;

}  // namespace

TEST_CASE("FixedStepper runs whole steps and keeps the remainder") {
  FixedStepper stepper([] { return 0.0; }, kStep, 0.05);

  std::vector<uint64_t> frames;
  const int n = stepper.advanceBy(0.04, [&](TimeStep ts) {
    CHECK(ts.dt == doctest::Approx(kStep));
    frames.push_back(ts.frame);
  });

  CHECK(n == 2);
  REQUIRE(frames.size() == 2);
  CHECK(frames[0] == 0);
  CHECK(frames[1] == 1);
  CHECK(stepper.remainder() == doctest::Approx(0.04 - 2.0 * kStep));

  // The leftover carries into the next frame.
  CHECK(stepper.advanceBy(0.012, nullptr) == 1);
  CHECK(stepper.frame() == 3);
}

TEST_CASE("FixedStepper runs nothing for a frame shorter than one step") {
  FixedStepper stepper([] { return 0.0; });
  int calls = 0;
  CHECK(stepper.advanceBy(0.01, [&](TimeStep) { ++calls; }) == 0);
  CHECK(calls == 0);
  CHECK(stepper.remainder() == doctest::Approx(0.01));
}

TEST_CASE("FixedStepper clamps a stall to the frame limit") {
  FixedStepper stepper([] { return 0.0; }, kStep, 0.045);
  int calls = 0;
  const int n = stepper.advanceBy(2.5, [&](TimeStep) { ++calls; });

  CHECK(n == 2);
  CHECK(calls == 2);
  CHECK(stepper.remainder() < kStep);
}

TEST_CASE("FixedStepper default clamp allows at most three steps per frame") {
  FixedStepper stepper([] { return 0.0; });
  CHECK(stepper.maxFrameDt() == doctest::Approx(0.05));
  const int n = stepper.advanceBy(10.0, nullptr);
  CHECK(n >= 2);
  CHECK(n <= 3);
}

TEST_CASE("FixedStepper ignores a clock that runs backwards") {
  FixedStepper stepper([] { return 0.0; });
  CHECK(stepper.advanceBy(-1.0, nullptr) == 0);
  CHECK(stepper.remainder() == doctest::Approx(0.0));
}

TEST_CASE("FixedStepper::advance measures time from the injected clock") {
  double now = 100.0;
  FixedStepper stepper([&now] { return now; });

  CHECK(stepper.advance(nullptr) == 0);

  now += 0.02;
  CHECK(stepper.advance(nullptr) == 1);

  // A long hitch is clamped like advanceBy.
  now += 30.0;
  CHECK(stepper.advance(nullptr) <= 3);
}

TEST_CASE("FixedStepper::reset drops the remainder but keeps the frame counter") {
  double now = 0.0;
  FixedStepper stepper([&now] { return now; });
  (void)stepper.advanceBy(0.03, nullptr);
  const uint64_t frame = stepper.frame();
  REQUIRE(stepper.remainder() > 0.0);

  now = 5.0;
  stepper.reset();
  CHECK(stepper.remainder() == doctest::Approx(0.0));
  CHECK(stepper.frame() == frame);

  // Time before the reset is not replayed.
  CHECK(stepper.advance(nullptr) == 0);
}
