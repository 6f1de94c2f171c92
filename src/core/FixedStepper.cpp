#include "core/FixedStepper.h"

#include <algorithm>
#include <utility>

FixedStepper::FixedStepper(Clock clock, double stepSeconds, double maxFrameDt)
    : clock_(std::move(clock)),
      step_(stepSeconds > 0.0 ? stepSeconds : 1.0 / 60.0),
      maxFrameDt_(std::max(0.0, maxFrameDt)) {
  last_ = clock_ ? clock_() : 0.0;
}

int FixedStepper::advance(const StepFn& update) {
  if (!clock_) {
    return 0;
  }
  const double now = clock_();
  const double elapsed = now - last_;
  last_ = now;
  return advanceBy(elapsed, update);
}

int FixedStepper::advanceBy(double elapsedSeconds, const StepFn& update) {
  // Clocks that step backwards count as no time.
  const double clamped = std::clamp(elapsedSeconds, 0.0, maxFrameDt_);
  accumulator_ += clamped;

  int steps = 0;
  const TimeStep ts{static_cast<float>(step_), 0};
  while (accumulator_ >= step_) {
    TimeStep s = ts;
    s.frame = frame_++;
    if (update) {
      update(s);
    }
    accumulator_ -= step_;
    ++steps;
  }
  return steps;
}

void FixedStepper::reset() {
  accumulator_ = 0.0;
  last_ = clock_ ? clock_() : 0.0;
}
