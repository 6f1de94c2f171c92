// tests/test_state_machine.cpp
//
// Title / Playing / Paused / GameOver transitions and session reset.

#include <doctest/doctest.h>

#include "TestSupport.h"
#include "runner/RunnerEvents.h"
#include "runner/RunnerGame.h"
#include "runner/components/RunnerComponents.h"
#include "runner/systems/Spawner.h"

using namespace testsupport;
using runner::GameEventType;
using runner::GameState;
using runner::RunnerConfig;

TEST_CASE("a new game waits on the title screen") {
  RunnerConfig cfg;
  runner::RunnerGame game(cfg, kViewW, kViewH);

  CHECK(game.state() == GameState::Title);
  CHECK(game.score() == 0);
  CHECK(game.hearts() == cfg.lives.start);
  CHECK(game.playerState() != nullptr);
  CHECK(game.drainEvents().empty());

  stepN(game, 600);
  CHECK(game.session().steps == 0);
  CHECK(countWith<runner::ObstacleTag>(game) == 0);
  CHECK(game.session().bgOffset == 0.0F);
}

TEST_CASE("illegal requests leave the state untouched") {
  RunnerConfig cfg;
  runner::RunnerGame game(cfg, kViewW, kViewH);

  CHECK_FALSE(game.requestPause());
  CHECK_FALSE(game.requestResume());
  CHECK_FALSE(game.requestPauseToggle());
  CHECK_FALSE(game.requestJump());
  CHECK(game.state() == GameState::Title);
  CHECK(game.drainEvents().empty());

  REQUIRE(game.requestStart());
  CHECK_FALSE(game.requestStart());
  CHECK_FALSE(game.requestResume());
  CHECK(game.state() == GameState::Playing);
}

TEST_CASE("start announces the transition then the fresh score and hearts") {
  RunnerConfig cfg;
  runner::RunnerGame game(cfg, kViewW, kViewH);
  REQUIRE(game.requestStart());
  CHECK(game.pendingEvents().size() == 3);

  const auto events = game.drainEvents();
  CHECK(game.pendingEvents().empty());
  REQUIRE(events.size() == 3);
  CHECK(events[0].type == GameEventType::StateChanged);
  CHECK(events[0].from == GameState::Title);
  CHECK(events[0].to == GameState::Playing);
  CHECK(events[1].type == GameEventType::ScoreChanged);
  CHECK(events[1].value == 0);
  CHECK(events[2].type == GameEventType::HeartsChanged);
  CHECK(events[2].value == cfg.lives.start);
}

TEST_CASE("pause freezes the world and resume picks up where it left off") {
  auto game = startedGame();
  stepN(game, 200);
  const auto before = game.session();
  const std::size_t obstacles = countWith<runner::ObstacleTag>(game);

  REQUIRE(game.requestPause());
  CHECK(game.state() == GameState::Paused);
  CHECK_FALSE(game.requestPause());

  stepN(game, 120);
  CHECK(game.session().t == before.t);
  CHECK(game.session().bgOffset == before.bgOffset);
  CHECK(game.session().speed == before.speed);
  CHECK(game.session().steps == before.steps);
  CHECK(game.session().obsTimer == before.obsTimer);
  CHECK(countWith<runner::ObstacleTag>(game) == obstacles);

  REQUIRE(game.requestResume());
  CHECK(game.state() == GameState::Playing);
  CHECK(game.score() == before.score);
  CHECK(game.hearts() == before.hearts);

  const auto events = game.drainEvents();
  REQUIRE(events.size() == 2);
  CHECK(events[0].to == GameState::Paused);
  CHECK(events[1].from == GameState::Paused);
  CHECK(events[1].to == GameState::Playing);
}

TEST_CASE("pause toggle flips between Playing and Paused") {
  auto game = startedGame();
  CHECK(game.requestPauseToggle());
  CHECK(game.state() == GameState::Paused);
  CHECK(game.requestPauseToggle());
  CHECK(game.state() == GameState::Playing);
}

TEST_CASE("restart after game over resets the whole session") {
  auto game = startedGame();
  stepN(game, 300);
  game.mutableSession().hearts = 1;
  game.mutableSession().score = 12;
  playerState(game).hitCooldown = 0.0F;
  runner::Spawner::spawnObstacle(game.mutableWorld(), game.mutableSession(), game.config(),
                                 runner::ObstacleKind::Small, playerTransform(game).pos.x);
  game.step(fixedStep(game.config()));
  REQUIRE(game.state() == GameState::GameOver);

  CHECK_FALSE(game.requestPause());
  CHECK_FALSE(game.requestJump());
  (void)game.drainEvents();

  REQUIRE(game.requestStart());
  CHECK(game.state() == GameState::Playing);
  CHECK(game.score() == 0);
  CHECK(game.hearts() == game.config().lives.start);
  CHECK(game.session().steps == 0);
  CHECK(game.session().t == 0.0F);
  CHECK(game.session().speed == doctest::Approx(game.config().world.baseSpeed));
  CHECK(game.session().nextSerial == 1);
  CHECK(countWith<runner::ObstacleTag>(game) == 0);
  CHECK(countWith<runner::HeartTag>(game) == 0);
  CHECK(countWith<runner::PlayerTag>(game) == 1);
  CHECK(playerState(game).jumpsRemaining == game.config().player.maxJumps);
  CHECK(playerState(game).hitCooldown == 0.0F);

  const auto events = game.drainEvents();
  REQUIRE(events.size() == 3);
  CHECK(events[0].from == GameState::GameOver);
  CHECK(events[0].to == GameState::Playing);
}

TEST_CASE("an idle run never leaves the ground and never gains hearts") {
  RunnerConfig cfg;
  cfg.hearts.chance = 0.0F;
  auto game = startedGame(cfg);

  int lastHearts = game.hearts();
  for (int i = 0; i < 1000; ++i) {
    game.step(fixedStep(cfg, static_cast<uint64_t>(i)));
    INFO("step ", i);
    REQUIRE(game.playerState() != nullptr);
    CHECK(game.playerState()->onGround);
    CHECK(game.hearts() <= lastHearts);
    lastHearts = game.hearts();
  }
  CHECK(game.score() >= 0);
}

TEST_CASE("speed ramps with play time") {
  auto game = startedGame();
  stepN(game, 600);
  const float expected = game.config().world.baseSpeed +
                         game.session().difficultySeconds * game.config().world.speedRampPerSecond;
  CHECK(game.session().speed == doctest::Approx(expected));
  CHECK(game.session().speed > game.config().world.baseSpeed);
}

TEST_CASE("state and event names are stable") {
  CHECK(std::string(runner::gameStateName(GameState::GameOver)) == "game_over");
  CHECK(std::string(runner::gameStateName(GameState::Playing)) == "playing");
  CHECK(std::string(runner::gameEventName(GameEventType::PickedUp)) == "pickup");
}
