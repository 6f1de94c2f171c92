#pragma once

#include "ecs/Components.h"

namespace runner {

struct Box {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;
};

// Insets the visual bounds by `shrink` of each dimension, half per side.
inline Box shrinkBox(const Transform& t, const AABB& a, float shrink) {
  const float sx = a.w * shrink;
  const float sy = a.h * shrink;
  return Box{t.pos.x + sx * 0.5F, t.pos.y + sy * 0.5F, a.w - sx, a.h - sy};
}

// Touching edges do not count as overlap.
inline bool overlaps(const Box& a, const Box& b) {
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h && a.y + a.h > b.y;
}

}  // namespace runner
