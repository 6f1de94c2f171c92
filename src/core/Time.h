#pragma once

#include <cstdint>

// One fixed simulation step. `frame` counts steps since the stepper was
// created and is the clock input scripts are keyed on.
struct TimeStep {
  float dt = 0.0F;  // seconds
  uint64_t frame = 0;
};
