#pragma once

#include <algorithm>
#include <cmath>

namespace util {

inline float clampf(float v, float lo, float hi) {
  return std::min(std::max(v, lo), hi);
}

// Wraps v into [0, period). A non-positive period leaves v untouched.
inline float wrapf(float v, float period) {
  if (period <= 0.0F)
    return v;
  const float r = std::fmod(v, period);
  return (r < 0.0F) ? r + period : r;
}

}  // namespace util
