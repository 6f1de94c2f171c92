#include "runner/systems/RunnerSystems.h"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "runner/RunnerEvents.h"
#include "runner/Scoring.h"
#include "runner/Session.h"
#include "runner/components/RunnerComponents.h"
#include "runner/config/RunnerConfig.h"
#include "runner/systems/Hitbox.h"
#include "util/Math.h"
#include "util/Rng.h"

namespace runner {

Metrics RunnerSystems::computeMetrics(const RunnerConfig& cfg, int viewW, int viewH) {
  Metrics m;
  m.viewW = viewW;
  m.viewH = viewH;
  m.u = static_cast<float>(viewH) / cfg.world.referenceHeight;
  m.gravity = cfg.player.gravity * m.u;
  m.jumpVelocity = cfg.player.jumpVelocity * m.u;
  m.groundY = static_cast<float>(viewH) - cfg.world.groundOffset * m.u;
  m.minGapPx = cfg.obstacles.minGap * m.u;
  return m;
}

EntityId RunnerSystems::spawnPlayer(World& w, const Session& s, const RunnerConfig& cfg) {
  const Metrics& m = s.metrics;
  const float pw = cfg.player.width * m.u;
  const float ph = cfg.player.height * m.u;
  const float px = std::min(cfg.player.maxX, static_cast<float>(m.viewW) * cfg.player.xRatio);

  EntityId id = w.create();
  auto& reg = w.registry;
  reg.emplace<Transform>(id, Vec2{px, m.groundY - ph});
  reg.emplace<AABB>(id, pw, ph);
  reg.emplace<PlayerTag>(id);

  PlayerState p;
  p.vy = 0.0F;
  p.onGround = true;
  p.jumpsRemaining = cfg.player.maxJumps;
  p.hitCooldown = 0.0F;
  reg.emplace<PlayerState>(id, p);

  w.player = id;
  return id;
}

void RunnerSystems::spawnFireflies(World& w,
                                   const Session& s,
                                   const RunnerConfig& cfg,
                                   util::Rng& rng) {
  w.destroyAll<FireflyTag>();

  const auto& fc = cfg.fireflies;
  const float viewW = static_cast<float>(s.metrics.viewW);
  const float viewH = static_cast<float>(s.metrics.viewH);
  const float wanted = std::floor((viewW * viewH) / fc.areaPerFly);
  const int count = static_cast<int>(
      util::clampf(wanted, static_cast<float>(fc.minCount), static_cast<float>(fc.maxCount)));

  auto& reg = w.registry;
  for (int i = 0; i < count; ++i) {
    EntityId id = w.create();
    const float x = rng.next01() * viewW;
    const float y = rng.next01() * viewH;
    reg.emplace<Transform>(id, Vec2{x, y});
    reg.emplace<FireflyTag>(id);

    FireflyState f;
    f.radius = fc.minRadius + rng.next01() * fc.radiusSpan;
    f.phase = rng.next01() * 2.0F * std::numbers::pi_v<float>;
    f.twinkleSpeed = fc.minTwinkle + rng.next01() * fc.twinkleSpan;
    reg.emplace<FireflyState>(id, f);
  }
}

void RunnerSystems::anchorToGround(World& w, const Session& s, float previousGroundY) {
  const float groundY = s.metrics.groundY;
  const float shift = groundY - previousGroundY;

  auto obstacles = w.registry.view<ObstacleTag, Transform, AABB>();
  for (auto [entity, t, box] : obstacles.each()) {
    t.pos.y = groundY - box.h;
  }

  auto hearts = w.registry.view<HeartTag, Transform>();
  for (auto [entity, t] : hearts.each()) {
    t.pos.y += shift;
  }

  auto players = w.registry.view<PlayerTag, PlayerState, Transform, AABB>();
  for (auto [entity, p, t, box] : players.each()) {
    const float groundTop = groundY - box.h;
    if (p.onGround || t.pos.y > groundTop) {
      t.pos.y = groundTop;
    }
  }
}

void RunnerSystems::decorations(World& w, Session& s, const RunnerConfig& cfg, TimeStep ts) {
  if (s.state != GameState::Paused) {
    s.t += ts.dt;
  }

  const float twinkleRate = cfg.fireflies.twinkleRate;
  auto flies = w.registry.view<FireflyTag, FireflyState, Transform>();
  for (auto [entity, f, t] : flies.each()) {
    f.phase += f.twinkleSpeed * twinkleRate * ts.dt;
  }

  if (s.state != GameState::Playing) {
    return;
  }

  const float bgSpeed =
      std::max(cfg.world.backgroundMinSpeed, s.speed * cfg.world.backgroundSpeedRatio);
  s.bgOffset = util::wrapf(s.bgOffset + bgSpeed * ts.dt, cfg.world.backgroundWrapWidth);

  const float margin = cfg.fireflies.wrapMargin;
  const float wrapX = static_cast<float>(s.metrics.viewW) + margin;
  for (auto [entity, f, t] : flies.each()) {
    t.pos.x -= bgSpeed * ts.dt;
    if (t.pos.x < -margin) {
      t.pos.x = wrapX;
    }
  }
}

void RunnerSystems::cooldowns(World& w, TimeStep ts) {
  auto view = w.registry.view<PlayerTag, PlayerState>();
  for (auto [entity, p] : view.each()) {
    p.hitCooldown = std::max(0.0F, p.hitCooldown - ts.dt);
  }
}

void RunnerSystems::difficulty(Session& s, const RunnerConfig& cfg, TimeStep ts) {
  s.difficultySeconds += ts.dt;
  s.speed = cfg.world.baseSpeed + s.difficultySeconds * cfg.world.speedRampPerSecond;
}

void RunnerSystems::playerPhysics(World& w,
                                  const Session& s,
                                  const RunnerConfig& cfg,
                                  TimeStep ts) {
  const Metrics& m = s.metrics;
  auto view = w.registry.view<PlayerTag, PlayerState, Transform, AABB>();
  for (auto [entity, p, t, box] : view.each()) {
    p.vy += m.gravity * ts.dt;
    t.pos.y += p.vy * ts.dt;

    const float groundTop = m.groundY - box.h;
    if (t.pos.y >= groundTop) {
      t.pos.y = groundTop;
      p.vy = 0.0F;
      if (!p.onGround) {
        p.onGround = true;
        p.jumpsRemaining = cfg.player.maxJumps;
      }
    } else {
      p.onGround = false;
    }
  }
}

bool RunnerSystems::tryJump(World& w, const Session& s, EventQueue& events) {
  if (w.player == kInvalidEntity || !w.registry.valid(w.player)) {
    return false;
  }
  auto& p = w.registry.get<PlayerState>(w.player);
  if (p.jumpsRemaining <= 0) {
    return false;
  }
  p.vy = s.metrics.jumpVelocity;
  p.onGround = false;
  --p.jumpsRemaining;
  events.push(GameEventType::Jumped, p.jumpsRemaining);
  return true;
}

void RunnerSystems::scrollWorld(World& w, const Session& s, TimeStep ts) {
  const float vx = s.speed * ts.dt;

  auto obstacles = w.registry.view<ObstacleTag, Transform>();
  for (auto [entity, t] : obstacles.each()) {
    t.pos.x -= vx;
  }

  auto hearts = w.registry.view<HeartTag, Transform>();
  for (auto [entity, t] : hearts.each()) {
    t.pos.x -= vx;
  }
}

std::vector<EntityId> RunnerSystems::obstaclesInSpawnOrder(const World& w) {
  std::vector<EntityId> out;
  auto view = w.registry.view<ObstacleTag, ObstacleState>();
  for (auto e : view) {
    out.push_back(e);
  }
  std::sort(out.begin(), out.end(), [&](EntityId a, EntityId b) {
    return view.get<ObstacleState>(a).serial < view.get<ObstacleState>(b).serial;
  });
  return out;
}

bool RunnerSystems::obstacleCollisions(World& w,
                                       Session& s,
                                       const RunnerConfig& cfg,
                                       EventQueue& events) {
  if (w.player == kInvalidEntity || !w.registry.valid(w.player)) {
    return false;
  }
  auto& reg = w.registry;
  auto& p = reg.get<PlayerState>(w.player);
  const auto& pt = reg.get<Transform>(w.player);
  const Box pr = shrinkBox(pt, reg.get<AABB>(w.player), cfg.hitbox.shrink);

  for (EntityId e : obstaclesInSpawnOrder(w)) {
    auto& o = reg.get<ObstacleState>(e);
    const auto& ot = reg.get<Transform>(e);
    const auto& ob = reg.get<AABB>(e);

    const bool collide = overlaps(pr, shrinkBox(ot, ob, cfg.hitbox.shrink));
    if (collide && p.hitCooldown <= 0.0F && !o.hit && !o.scored) {
      o.hit = true;
      o.remove = true;
      p.hitCooldown = cfg.player.hitCooldown;
      if (Scoring::loseHeart(s, cfg, events)) {
        return true;
      }
    }

    if (!o.scored && !o.hit && pt.pos.x > ot.pos.x + ob.w) {
      o.scored = true;
      Scoring::awardPass(s, events);
    }
  }
  return false;
}

void RunnerSystems::pickupCollisions(World& w,
                                     Session& s,
                                     const RunnerConfig& cfg,
                                     EventQueue& events) {
  if (w.player == kInvalidEntity || !w.registry.valid(w.player)) {
    return;
  }
  auto& reg = w.registry;
  const Box pr = shrinkBox(reg.get<Transform>(w.player), reg.get<AABB>(w.player), cfg.hitbox.shrink);

  std::vector<EntityId> touching;
  auto view = reg.view<HeartTag, HeartState, Transform, AABB>();
  for (auto [entity, h, t, box] : view.each()) {
    if (h.taken)
      continue;
    if (overlaps(pr, shrinkBox(t, box, cfg.hitbox.shrink))) {
      touching.push_back(entity);
    }
  }
  std::sort(touching.begin(), touching.end(), [&](EntityId a, EntityId b) {
    return view.get<HeartState>(a).serial < view.get<HeartState>(b).serial;
  });

  for (EntityId e : touching) {
    if (Scoring::gainHeart(s, cfg, events)) {
      reg.get<HeartState>(e).taken = true;
    }
  }
}

void RunnerSystems::cleanup(World& w, const RunnerConfig& cfg) {
  const float edge = -cfg.obstacles.despawnMargin;
  std::vector<EntityId> toRemove;

  auto obstacles = w.registry.view<ObstacleTag, ObstacleState, Transform, AABB>();
  for (auto [entity, o, t, box] : obstacles.each()) {
    if (o.remove || t.pos.x + box.w <= edge) {
      toRemove.push_back(entity);
    }
  }

  auto hearts = w.registry.view<HeartTag, HeartState, Transform, AABB>();
  for (auto [entity, h, t, box] : hearts.each()) {
    if (h.taken || t.pos.x + box.w <= edge) {
      toRemove.push_back(entity);
    }
  }

  for (EntityId e : toRemove) {
    w.destroy(e);
  }
}

}  // namespace runner
