#pragma once

#include <cstdint>
#include <functional>

#include "core/Time.h"

// Turns wall-clock frame callbacks into a whole number of constant-size
// simulation steps. Elapsed time per frame is clamped so a stall (debugger,
// minimized window) never turns into a burst of catch-up steps.
class FixedStepper {
 public:
  using Clock = std::function<double()>;  // monotonic seconds
  using StepFn = std::function<void(TimeStep)>;

  explicit FixedStepper(Clock clock, double stepSeconds = 1.0 / 60.0, double maxFrameDt = 0.05);

  // Once per frame: reads the clock and runs zero or more steps.
  // Returns how many steps ran.
  int advance(const StepFn& update);

  // Same drain with an externally measured elapsed time.
  int advanceBy(double elapsedSeconds, const StepFn& update);

  // Drops the remainder and restarts elapsed-time measurement from now.
  void reset();

  [[nodiscard]] double stepSeconds() const { return step_; }
  [[nodiscard]] double maxFrameDt() const { return maxFrameDt_; }
  [[nodiscard]] double remainder() const { return accumulator_; }
  [[nodiscard]] uint64_t frame() const { return frame_; }

 private:
  Clock clock_;
  double step_ = 1.0 / 60.0;
  double maxFrameDt_ = 0.05;
  double accumulator_ = 0.0;
  double last_ = 0.0;
  uint64_t frame_ = 0;
};
