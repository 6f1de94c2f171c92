#include "runner/systems/Spawner.h"

#include <cmath>

#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "runner/Session.h"
#include "runner/config/RunnerConfig.h"
#include "util/Math.h"
#include "util/Rng.h"

namespace runner {

void Spawner::reset(Session& s, const RunnerConfig& cfg) {
  s.obsTimer = 0.0F;
  s.obsInterval = cfg.obstacles.initialInterval;
  s.lastObstacleX = static_cast<float>(s.metrics.viewW);
  s.heartTimer = cfg.hearts.startTimer;
  s.heartInterval = cfg.hearts.initialInterval;

  obstaclesSpawned = 0;
  spacingRejects = 0;
  heartsSpawned = 0;
  heartsDropped = 0;
}

void Spawner::update(World& w,
                     Session& s,
                     const RunnerConfig& cfg,
                     util::Rng& rng,
                     TimeStep ts) {
  updateObstacles(w, s, cfg, rng, ts);
  updateHearts(w, s, cfg, rng, ts);
}

float Spawner::targetObstacleInterval(const Session& s, const RunnerConfig& cfg) {
  const auto& oc = cfg.obstacles;
  const float ramped = oc.rampStart - s.difficultySeconds * oc.rampPerSecond;
  return util::clampf(ramped, oc.minInterval, oc.maxInterval);
}

void Spawner::updateObstacles(World& w,
                              Session& s,
                              const RunnerConfig& cfg,
                              util::Rng& rng,
                              TimeStep ts) {
  const auto& oc = cfg.obstacles;
  const float viewW = static_cast<float>(s.metrics.viewW);

  s.obsTimer += ts.dt;
  if (s.obsTimer >= s.obsInterval) {
    const bool spacingOk = s.lastObstacleX < viewW - s.metrics.minGapPx;
    if (spacingOk) {
      s.obsTimer = 0.0F;
      s.obsInterval = targetObstacleInterval(s, cfg) + rng.range(-oc.jitter, oc.jitter);
      const ObstacleKind kind =
          rng.chance(oc.smallChance) ? ObstacleKind::Small : ObstacleKind::Large;
      const float x = viewW + oc.spawnOffset * s.metrics.u;
      spawnObstacle(w, s, cfg, kind, x);
      s.lastObstacleX = x;
      ++obstaclesSpawned;
      return;
    }
    // Retry soon, but not immediately.
    s.obsTimer = s.obsInterval * oc.retryFraction;
    ++spacingRejects;
  }
  s.lastObstacleX -= s.speed * ts.dt;
}

void Spawner::updateHearts(World& w,
                           Session& s,
                           const RunnerConfig& cfg,
                           util::Rng& rng,
                           TimeStep ts) {
  const auto& hc = cfg.hearts;
  const float u = s.metrics.u;
  const float viewW = static_cast<float>(s.metrics.viewW);

  s.heartTimer += ts.dt;
  if (s.hearts >= cfg.lives.max || s.heartTimer < s.heartInterval || !rng.chance(hc.chance)) {
    return;
  }

  s.heartTimer = 0.0F;
  s.heartInterval = hc.rerollMin + rng.next01() * hc.rerollSpan;

  float x = viewW + hc.windowOffset * u + rng.next01() * hc.windowSpan * u;
  const float y = s.metrics.groundY - (hc.liftMin + rng.next01() * hc.liftSpan) * u;

  bool blocked = heartBlocked(w, s, cfg, x);
  for (int trials = 0; blocked && trials < hc.maxRetries; ++trials) {
    x += hc.retryShift * u;
    blocked = heartBlocked(w, s, cfg, x);
  }

  if (blocked || x >= viewW + hc.maxAhead * u) {
    ++heartsDropped;
    return;
  }
  spawnHeart(w, s, cfg, x, y);
  ++heartsSpawned;
}

bool Spawner::heartBlocked(const World& w, const Session& s, const RunnerConfig& cfg, float x) {
  const float u = s.metrics.u;
  const float hw = cfg.hearts.width * u;
  const float centerX = x + hw * 0.5F;
  const float buffer = cfg.hearts.obstacleBuffer * u;

  auto view = w.registry.view<ObstacleTag, Transform, AABB>();
  for (auto [entity, t, box] : view.each()) {
    const float obstacleCenter = t.pos.x + box.w * 0.5F;
    if (std::abs(obstacleCenter - centerX) < box.w * 0.5F + hw * 0.5F + buffer) {
      return true;
    }
  }
  return false;
}

EntityId Spawner::spawnObstacle(World& w,
                                Session& s,
                                const RunnerConfig& cfg,
                                ObstacleKind kind,
                                float x) {
  const auto& oc = cfg.obstacles;
  const float u = s.metrics.u;
  const bool small = kind == ObstacleKind::Small;
  const float ow = (small ? oc.smallW : oc.largeW) * u;
  const float oh = (small ? oc.smallH : oc.largeH) * u;

  EntityId id = w.create();
  auto& reg = w.registry;
  reg.emplace<Transform>(id, Vec2{x, s.metrics.groundY - oh});
  reg.emplace<AABB>(id, ow, oh);
  reg.emplace<ObstacleTag>(id);

  ObstacleState o;
  o.kind = kind;
  o.serial = s.nextSerial++;
  reg.emplace<ObstacleState>(id, o);
  return id;
}

EntityId Spawner::spawnHeart(World& w, Session& s, const RunnerConfig& cfg, float x, float y) {
  const float u = s.metrics.u;

  EntityId id = w.create();
  auto& reg = w.registry;
  reg.emplace<Transform>(id, Vec2{x, y});
  reg.emplace<AABB>(id, cfg.hearts.width * u, cfg.hearts.height * u);
  reg.emplace<HeartTag>(id);

  HeartState h;
  h.serial = s.nextSerial++;
  reg.emplace<HeartState>(id, h);
  return id;
}

}  // namespace runner
