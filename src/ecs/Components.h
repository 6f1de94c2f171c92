#pragma once

// Components shared by every entity kind. Game-specific state lives in
// runner/components/RunnerComponents.h.

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
};

// Top-left corner in viewport pixels.
struct Transform {
  Vec2 pos{};
};

struct AABB {
  float w = 0.0F;
  float h = 0.0F;
};
