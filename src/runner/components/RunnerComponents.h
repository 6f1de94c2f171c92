#pragma once

#include <cstdint>

namespace runner {

// Plain data records attached to EnTT entities alongside Transform and AABB.
// All mutation happens in RunnerSystems / Spawner.

struct PlayerTag {};
struct ObstacleTag {};
struct HeartTag {};
struct FireflyTag {};

struct PlayerState {
  float vy = 0.0F;
  bool onGround = true;
  int jumpsRemaining = 2;
  float hitCooldown = 0.0F;  // seconds of invulnerability left
};

enum class ObstacleKind : std::uint8_t {
  Small,
  Large,
};

struct ObstacleState {
  ObstacleKind kind = ObstacleKind::Small;
  bool hit = false;     // collided with the player
  bool scored = false;  // passed cleanly
  bool remove = false;
  std::uint32_t serial = 0;  // spawn order
};

struct HeartState {
  bool taken = false;
  std::uint32_t serial = 0;
};

// Decorative only; never collides.
struct FireflyState {
  float radius = 1.0F;
  float phase = 0.0F;
  float twinkleSpeed = 1.0F;
};

}  // namespace runner
