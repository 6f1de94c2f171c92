#pragma once

#include <cstdint>

namespace runner {

enum class GameState : std::uint8_t {
  Title,
  Playing,
  Paused,
  GameOver,
};

const char* gameStateName(GameState s);

// Viewport-derived quantities, recomputed on resize.
struct Metrics {
  int viewW = 0;
  int viewH = 0;
  float u = 1.0F;  // resolution unit
  float gravity = 0.0F;
  float jumpVelocity = 0.0F;
  float groundY = 0.0F;
  float minGapPx = 0.0F;
};

// Scalar simulation state. One instance per RunnerGame; mutated only inside
// the fixed step and the state transitions.
struct Session {
  GameState state = GameState::Title;
  float t = 0.0F;  // world clock, frozen while paused
  float bgOffset = 0.0F;
  float speed = 0.0F;  // px/s
  float difficultySeconds = 0.0F;

  float obsTimer = 0.0F;
  float obsInterval = 0.0F;
  float lastObstacleX = 0.0F;

  float heartTimer = 0.0F;
  float heartInterval = 0.0F;

  int score = 0;
  int hearts = 0;

  std::uint32_t nextSerial = 1;
  std::uint64_t steps = 0;  // fixed steps taken while Playing this session

  Metrics metrics{};
};

}  // namespace runner
