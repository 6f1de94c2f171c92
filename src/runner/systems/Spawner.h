#pragma once

#include "ecs/Entity.h"
#include "runner/components/RunnerComponents.h"

class World;
struct TimeStep;

namespace util {
class Rng;
}

namespace runner {

struct RunnerConfig;
struct Session;

// Procedural obstacle and heart placement. Timers and the spacing tracker
// live in Session so a snapshot captures them; this struct only keeps
// counters for the debug panel.
struct Spawner {
  int obstaclesSpawned = 0;
  int spacingRejects = 0;
  int heartsSpawned = 0;
  int heartsDropped = 0;

  // Timers for a fresh session.
  void reset(Session& s, const RunnerConfig& cfg);

  // One fixed step of obstacle and heart spawning.
  void update(World& w, Session& s, const RunnerConfig& cfg, util::Rng& rng, TimeStep ts);

  // Difficulty-ramped target, clamped, before jitter.
  [[nodiscard]] static float targetObstacleInterval(const Session& s, const RunnerConfig& cfg);

  static EntityId spawnObstacle(World& w,
                                Session& s,
                                const RunnerConfig& cfg,
                                ObstacleKind kind,
                                float x);

  static EntityId spawnHeart(World& w, Session& s, const RunnerConfig& cfg, float x, float y);

  // True when a heart whose left edge is at x would sit in some obstacle's
  // lane (obstacle width widened by the heart and a buffer).
  [[nodiscard]] static bool heartBlocked(const World& w,
                                         const Session& s,
                                         const RunnerConfig& cfg,
                                         float x);

 private:
  void updateObstacles(World& w, Session& s, const RunnerConfig& cfg, util::Rng& rng, TimeStep ts);
  void updateHearts(World& w, Session& s, const RunnerConfig& cfg, util::Rng& rng, TimeStep ts);
};

}  // namespace runner
