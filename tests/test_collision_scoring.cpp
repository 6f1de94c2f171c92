// tests/test_collision_scoring.cpp
//
// Obstacle hits, pass scoring, game over ordering and heart pickups at the cap.

#include <doctest/doctest.h>

#include <vector>

#include "TestSupport.h"
#include "runner/RunnerEvents.h"
#include "runner/RunnerGame.h"
#include "runner/components/RunnerComponents.h"
#include "runner/systems/Hitbox.h"
#include "runner/systems/Spawner.h"

using namespace testsupport;
using runner::GameEvent;
using runner::GameEventType;
using runner::GameState;
using runner::ObstacleKind;
using runner::RunnerConfig;
using runner::Spawner;

namespace {

EntityId placeObstacle(runner::RunnerGame& game, float x, ObstacleKind kind = ObstacleKind::Small) {
  return Spawner::spawnObstacle(game.mutableWorld(), game.mutableSession(), game.config(), kind, x);
}

EntityId placeHeartOnPlayer(runner::RunnerGame& game) {
  const auto& t = playerTransform(game);
  return Spawner::spawnHeart(game.mutableWorld(), game.mutableSession(), game.config(),
                             t.pos.x + 4.0F, t.pos.y + 4.0F);
}

}  // namespace

TEST_CASE("shrinkBox removes the fraction evenly from both sides") {
  const Transform t{Vec2{100.0F, 200.0F}};
  const AABB a{50.0F, 80.0F};
  const runner::Box b = runner::shrinkBox(t, a, 0.1F);
  CHECK(b.x == doctest::Approx(102.5F));
  CHECK(b.y == doctest::Approx(204.0F));
  CHECK(b.w == doctest::Approx(45.0F));
  CHECK(b.h == doctest::Approx(72.0F));
}

TEST_CASE("boxes that only share an edge do not overlap") {
  const runner::Box a{0.0F, 0.0F, 10.0F, 10.0F};
  CHECK_FALSE(runner::overlaps(a, runner::Box{10.0F, 0.0F, 5.0F, 5.0F}));
  CHECK_FALSE(runner::overlaps(a, runner::Box{0.0F, 10.0F, 5.0F, 5.0F}));
  CHECK(runner::overlaps(a, runner::Box{9.0F, 9.0F, 5.0F, 5.0F}));
}

TEST_CASE("an obstacle hit costs one heart and starts the cooldown") {
  auto game = startedGame();
  placeObstacle(game, playerTransform(game).pos.x);

  game.step(fixedStep(game.config()));

  CHECK(game.hearts() == 2);
  CHECK(game.score() == 0);
  CHECK(playerState(game).hitCooldown == doctest::Approx(game.config().player.hitCooldown));
  CHECK(countWith<runner::ObstacleTag>(game) == 0);

  const auto events = game.drainEvents();
  REQUIRE(events.size() == 2);
  CHECK(events[0].type == GameEventType::HeartsChanged);
  CHECK(events[0].value == 2);
  CHECK(events[1].type == GameEventType::Hit);
  CHECK(game.state() == GameState::Playing);
}

TEST_CASE("the cooldown protects against a second hit and the obstacle still scores") {
  auto game = startedGame();
  const float px = playerTransform(game).pos.x;
  placeObstacle(game, px);
  game.step(fixedStep(game.config()));
  REQUIRE(game.hearts() == 2);

  placeObstacle(game, px);
  game.step(fixedStep(game.config()));
  CHECK(game.hearts() == 2);
  CHECK(countWith<runner::ObstacleTag>(game) == 1);

  // Scrolls past the player well inside the cooldown window.
  stepN(game, 15);
  CHECK(game.hearts() == 2);
  CHECK(game.score() == 1);
}

TEST_CASE("a cleanly passed obstacle scores exactly once") {
  auto game = startedGame();
  placeObstacle(game, 40.0F);

  game.step(fixedStep(game.config()));
  CHECK(game.score() == 1);
  const auto events = game.drainEvents();
  REQUIRE(events.size() == 1);
  CHECK(events[0].type == GameEventType::ScoreChanged);
  CHECK(events[0].value == 1);

  stepN(game, 10);
  CHECK(game.score() == 1);
  CHECK(game.drainEvents().empty());
}

TEST_CASE("a hit obstacle never scores") {
  auto game = startedGame();
  placeObstacle(game, playerTransform(game).pos.x, ObstacleKind::Large);
  stepN(game, 60);
  CHECK(game.hearts() == 2);
  CHECK(game.score() == 0);
}

TEST_CASE("losing the last heart ends the run with the score at that moment") {
  auto game = startedGame();
  game.mutableSession().hearts = 1;
  game.mutableSession().score = 7;
  placeObstacle(game, playerTransform(game).pos.x);

  game.step(fixedStep(game.config()));

  CHECK(game.state() == GameState::GameOver);
  CHECK(game.hearts() == 0);

  const std::vector<GameEvent> events = game.drainEvents();
  REQUIRE(events.size() == 4);
  CHECK(events[0].type == GameEventType::HeartsChanged);
  CHECK(events[0].value == 0);
  CHECK(events[1].type == GameEventType::Hit);
  CHECK(events[2].type == GameEventType::StateChanged);
  CHECK(events[2].from == GameState::Playing);
  CHECK(events[2].to == GameState::GameOver);
  CHECK(events[3].type == GameEventType::GameOver);
  CHECK(events[3].value == 7);

  // Frozen afterwards.
  stepN(game, 30);
  CHECK(game.drainEvents().empty());
  CHECK(game.score() == 7);
}

TEST_CASE("the fatal hit stops processing of later obstacles in that step") {
  auto game = startedGame();
  game.mutableSession().hearts = 1;
  placeObstacle(game, playerTransform(game).pos.x);
  placeObstacle(game, 40.0F);

  game.step(fixedStep(game.config()));

  CHECK(game.state() == GameState::GameOver);
  CHECK(game.score() == 0);
}

TEST_CASE("obstacles are resolved in spawn order") {
  auto game = startedGame();
  game.mutableSession().hearts = 1;
  // Spawned first, so its score lands before the fatal hit.
  placeObstacle(game, 40.0F);
  placeObstacle(game, playerTransform(game).pos.x);

  game.step(fixedStep(game.config()));

  CHECK(game.state() == GameState::GameOver);
  CHECK(game.score() == 1);
  const auto events = game.drainEvents();
  REQUIRE_FALSE(events.empty());
  CHECK(events.back().type == GameEventType::GameOver);
  CHECK(events.back().value == 1);
}

TEST_CASE("a heart pickup adds a heart and leaves the field") {
  auto game = startedGame();
  placeHeartOnPlayer(game);

  game.step(fixedStep(game.config()));

  CHECK(game.hearts() == 4);
  CHECK(countWith<runner::HeartTag>(game) == 0);
  const auto events = game.drainEvents();
  REQUIRE(events.size() == 2);
  CHECK(events[0].type == GameEventType::HeartsChanged);
  CHECK(events[0].value == 4);
  CHECK(events[1].type == GameEventType::PickedUp);
}

TEST_CASE("at the heart cap an overlapping pickup stays on the field") {
  auto game = startedGame();
  game.mutableSession().hearts = game.config().lives.max;
  const EntityId heart = placeHeartOnPlayer(game);

  game.step(fixedStep(game.config()));

  CHECK(game.hearts() == game.config().lives.max);
  REQUIRE(game.world().registry.valid(heart));
  CHECK_FALSE(game.world().registry.get<runner::HeartState>(heart).taken);
  CHECK(game.drainEvents().empty());

  // Once below the cap, the same pickup is collected.
  game.mutableSession().hearts = game.config().lives.max - 1;
  game.step(fixedStep(game.config()));
  CHECK(game.hearts() == game.config().lives.max);
  CHECK_FALSE(game.world().registry.valid(heart));
}

TEST_CASE("entities past the left edge are cleaned up") {
  auto game = startedGame();
  placeObstacle(game, -200.0F);
  Spawner::spawnHeart(game.mutableWorld(), game.mutableSession(), game.config(), -200.0F, 100.0F);

  game.step(fixedStep(game.config()));

  CHECK(countWith<runner::ObstacleTag>(game) == 0);
  CHECK(countWith<runner::HeartTag>(game) == 0);
}
