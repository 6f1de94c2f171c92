#include "runner/RunnerGame.h"

#include "runner/Scoring.h"
#include "runner/components/RunnerComponents.h"
#include "runner/systems/RunnerSystems.h"

namespace runner {

const char* gameStateName(GameState s) {
  switch (s) {
    case GameState::Title:
      return "title";
    case GameState::Playing:
      return "playing";
    case GameState::Paused:
      return "paused";
    case GameState::GameOver:
      return "game_over";
  }
  return "?";
}

const char* gameEventName(GameEventType t) {
  switch (t) {
    case GameEventType::ScoreChanged:
      return "score";
    case GameEventType::HeartsChanged:
      return "hearts";
    case GameEventType::GameOver:
      return "game_over";
    case GameEventType::StateChanged:
      return "state";
    case GameEventType::Jumped:
      return "jump";
    case GameEventType::Hit:
      return "hit";
    case GameEventType::PickedUp:
      return "pickup";
  }
  return "?";
}

RunnerGame::RunnerGame(const RunnerConfig& cfg, int viewW, int viewH)
    : cfg_(cfg), rng_(cfg.seed), decorRng_(cfg.seed ^ 0x9E3779B9U) {
  const int w = (viewW > 0) ? viewW : 1;
  const int h = (viewH > 0) ? viewH : 1;
  session_.metrics = RunnerSystems::computeMetrics(cfg_, w, h);
  RunnerSystems::spawnFireflies(world_, session_, cfg_, decorRng_);
  resetSession();
}

void RunnerGame::resetSession() {
  world_.destroyAll<ObstacleTag>();
  world_.destroyAll<HeartTag>();
  world_.destroyAll<PlayerTag>();

  session_.t = 0.0F;
  session_.bgOffset = 0.0F;
  session_.speed = cfg_.world.baseSpeed;
  session_.difficultySeconds = 0.0F;
  session_.nextSerial = 1;
  session_.steps = 0;
  spawner_.reset(session_, cfg_);
  Scoring::reset(session_, cfg_);

  RunnerSystems::spawnPlayer(world_, session_, cfg_);
}

// Order matters: a hit removes its obstacle before anything else can score it,
// and a game over ends the step before pickups and cleanup.
void RunnerGame::step(TimeStep ts) {
  RunnerSystems::decorations(world_, session_, cfg_, ts);
  RunnerSystems::cooldowns(world_, ts);

  if (session_.state != GameState::Playing) {
    return;
  }
  ++session_.steps;

  RunnerSystems::difficulty(session_, cfg_, ts);
  RunnerSystems::playerPhysics(world_, session_, cfg_, ts);
  spawner_.update(world_, session_, cfg_, rng_, ts);
  RunnerSystems::scrollWorld(world_, session_, ts);

  if (RunnerSystems::obstacleCollisions(world_, session_, cfg_, events_)) {
    enterGameOver();
    return;
  }
  RunnerSystems::pickupCollisions(world_, session_, cfg_, events_);
  RunnerSystems::cleanup(world_, cfg_);
}

bool RunnerGame::requestStart() {
  if (session_.state != GameState::Title && session_.state != GameState::GameOver) {
    return false;
  }
  resetSession();
  transition(GameState::Playing);
  events_.push(GameEventType::ScoreChanged, session_.score);
  events_.push(GameEventType::HeartsChanged, session_.hearts);
  return true;
}

bool RunnerGame::requestJump() {
  if (session_.state != GameState::Playing) {
    return false;
  }
  return RunnerSystems::tryJump(world_, session_, events_);
}

bool RunnerGame::requestPause() {
  if (session_.state != GameState::Playing) {
    return false;
  }
  transition(GameState::Paused);
  return true;
}

bool RunnerGame::requestResume() {
  if (session_.state != GameState::Paused) {
    return false;
  }
  transition(GameState::Playing);
  return true;
}

bool RunnerGame::requestPauseToggle() {
  if (session_.state == GameState::Playing) {
    return requestPause();
  }
  return requestResume();
}

bool RunnerGame::setViewport(int viewW, int viewH) {
  if (viewW <= 0 || viewH <= 0) {
    return false;
  }
  if (viewW == session_.metrics.viewW && viewH == session_.metrics.viewH) {
    return true;
  }
  const float previousGround = session_.metrics.groundY;
  session_.metrics = RunnerSystems::computeMetrics(cfg_, viewW, viewH);
  RunnerSystems::anchorToGround(world_, session_, previousGround);
  RunnerSystems::spawnFireflies(world_, session_, cfg_, decorRng_);
  return true;
}

void RunnerGame::setBackgroundWrapWidth(float width) {
  if (width > 0.0F) {
    cfg_.world.backgroundWrapWidth = width;
  }
}

const PlayerState* RunnerGame::playerState() const {
  if (world_.player == kInvalidEntity || !world_.registry.valid(world_.player)) {
    return nullptr;
  }
  return world_.registry.try_get<PlayerState>(world_.player);
}

void RunnerGame::transition(GameState to) {
  const GameState from = session_.state;
  session_.state = to;
  events_.pushTransition(from, to);
}

void RunnerGame::enterGameOver() {
  transition(GameState::GameOver);
  events_.push(GameEventType::GameOver, session_.score);
}

}  // namespace runner
