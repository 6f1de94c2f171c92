// tests/test_resize.cpp
//
// Viewport changes: ignored sizes, ground re-anchoring and the firefly field.

#include <doctest/doctest.h>

#include "TestSupport.h"
#include "runner/RunnerGame.h"
#include "runner/components/RunnerComponents.h"
#include "runner/systems/Spawner.h"

using namespace testsupport;
using runner::RunnerConfig;

TEST_CASE("non-positive viewport sizes are ignored") {
  auto game = startedGame();
  const runner::Metrics before = game.session().metrics;

  CHECK_FALSE(game.setViewport(0, kViewH));
  CHECK_FALSE(game.setViewport(kViewW, 0));
  CHECK_FALSE(game.setViewport(-10, -10));

  CHECK(game.session().metrics.viewW == before.viewW);
  CHECK(game.session().metrics.viewH == before.viewH);
  CHECK(game.session().metrics.groundY == before.groundY);
}

TEST_CASE("a zero-sized window at construction still yields a usable game") {
  RunnerConfig cfg;
  runner::RunnerGame game(cfg, 0, 0);
  CHECK(game.session().metrics.viewW == 1);
  CHECK(game.session().metrics.viewH == 1);
  CHECK(game.setViewport(kViewW, kViewH));
  CHECK(game.requestStart());
}

TEST_CASE("resize keeps grounded entities on the new ground line") {
  auto game = startedGame();
  runner::Spawner::spawnObstacle(game.mutableWorld(), game.mutableSession(), game.config(),
                                 runner::ObstacleKind::Large, 600.0F);
  const EntityId heart = runner::Spawner::spawnHeart(game.mutableWorld(), game.mutableSession(),
                                                     game.config(), 700.0F, 380.0F);
  const float oldGround = game.session().metrics.groundY;

  REQUIRE(game.setViewport(1920, 1080));
  const float groundY = game.session().metrics.groundY;
  CHECK(groundY == doctest::Approx(1080.0F - 128.0F));

  const auto& box = game.world().registry.get<AABB>(game.player());
  CHECK(game.world().registry.get<Transform>(game.player()).pos.y + box.h ==
        doctest::Approx(groundY));

  for (auto [e, t, b] :
       game.mutableWorld().registry.view<runner::ObstacleTag, Transform, AABB>().each()) {
    CHECK(t.pos.y + b.h == doctest::Approx(groundY));
  }

  CHECK(game.world().registry.get<Transform>(heart).pos.y ==
        doctest::Approx(380.0F + (groundY - oldGround)));
}

TEST_CASE("an airborne player is only pulled up when below the new ground") {
  auto game = startedGame();
  REQUIRE(game.requestJump());
  stepN(game, 10);
  const float y = playerTransform(game).pos.y;
  REQUIRE_FALSE(playerState(game).onGround);

  // Taller window: ground moves down, the player keeps falling naturally.
  REQUIRE(game.setViewport(kViewW, 720));
  CHECK(playerTransform(game).pos.y == y);

  // Much shorter window: ground line is above the player, so it snaps.
  REQUIRE(game.setViewport(kViewW, 200));
  CHECK(playerTransform(game).pos.y <= playerGroundTop(game));
}

TEST_CASE("the firefly field is rebuilt for the new area") {
  RunnerConfig cfg;
  runner::RunnerGame game(cfg, kViewW, kViewH);
  CHECK(countWith<runner::FireflyTag>(game) == static_cast<std::size_t>(cfg.fireflies.minCount));

  REQUIRE(game.setViewport(1920, 1080));
  CHECK(countWith<runner::FireflyTag>(game) == 51);

  REQUIRE(game.setViewport(4000, 3000));
  CHECK(countWith<runner::FireflyTag>(game) == static_cast<std::size_t>(cfg.fireflies.maxCount));
}

TEST_CASE("resizing to the same size is a no-op") {
  RunnerConfig cfg;
  runner::RunnerGame game(cfg, kViewW, kViewH);
  const EntityId anyFly = *game.mutableWorld().registry.view<runner::FireflyTag>().begin();

  CHECK(game.setViewport(kViewW, kViewH));
  CHECK(game.world().registry.valid(anyFly));
}
