#pragma once

#include <cstdint>
#include <random>

namespace util {

// Seeded generator for gameplay rolls. Two instances built from the same
// seed produce the same sequence, which keeps runs reproducible.
class Rng {
 public:
  explicit Rng(std::uint32_t seed = 0x5EEDU) : engine_(seed) {}

  // Uniform in [0, 1).
  float next01() { return unit_(engine_); }

  // Uniform in [lo, hi).
  float range(float lo, float hi) { return lo + (hi - lo) * next01(); }

  bool chance(float p) { return next01() < p; }

 private:
  std::mt19937 engine_;
  std::uniform_real_distribution<float> unit_{0.0F, 1.0F};
};

}  // namespace util
