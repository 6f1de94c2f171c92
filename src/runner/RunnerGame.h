#pragma once

#include <cstdint>
#include <vector>

#include "core/Time.h"
#include "ecs/World.h"
#include "runner/RunnerEvents.h"
#include "runner/Session.h"
#include "runner/config/RunnerConfig.h"
#include "runner/systems/Spawner.h"
#include "util/Rng.h"

namespace runner {

struct PlayerState;

// Owns one simulation: entity world, session scalars, spawner and the two
// random streams (gameplay rolls are seeded; decoration has its own stream so
// resizes never perturb spawns). Drives the Title / Playing / Paused /
// GameOver state machine. Inputs that do not apply to the current state are
// ignored.
class RunnerGame {
 public:
  RunnerGame(const RunnerConfig& cfg, int viewW, int viewH);

  // Fixed-size simulation step.
  void step(TimeStep ts);

  // Title or GameOver -> Playing, with a full session reset.
  bool requestStart();
  // Playing only.
  bool requestJump();
  // Playing -> Paused.
  bool requestPause();
  // Paused -> Playing, nothing reset.
  bool requestResume();
  // Pause while Playing, resume while Paused.
  bool requestPauseToggle();

  // New drawable size. Non-positive dimensions are ignored (returns false).
  bool setViewport(int viewW, int viewH);

  // Width the background offset wraps at, once the backdrop image is known.
  void setBackgroundWrapWidth(float width);

  std::vector<GameEvent> drainEvents() { return events_.drain(); }
  [[nodiscard]] const std::vector<GameEvent>& pendingEvents() const { return events_.pending(); }

  // Read-only snapshot accessors for presentation and tests.
  [[nodiscard]] const World& world() const { return world_; }
  [[nodiscard]] const Session& session() const { return session_; }
  [[nodiscard]] const RunnerConfig& config() const { return cfg_; }
  [[nodiscard]] const Spawner& spawner() const { return spawner_; }
  [[nodiscard]] GameState state() const { return session_.state; }
  [[nodiscard]] int score() const { return session_.score; }
  [[nodiscard]] int hearts() const { return session_.hearts; }
  [[nodiscard]] EntityId player() const { return world_.player; }
  [[nodiscard]] const PlayerState* playerState() const;

  // Direct access for tests and the debug panel.
  World& mutableWorld() { return world_; }
  Session& mutableSession() { return session_; }

 private:
  void resetSession();
  void transition(GameState to);
  void enterGameOver();

  RunnerConfig cfg_;
  World world_;
  Session session_;
  Spawner spawner_;
  EventQueue events_;
  util::Rng rng_;
  util::Rng decorRng_;
};

}  // namespace runner
