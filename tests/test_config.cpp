// tests/test_config.cpp
//
// RunnerConfig TOML loading: shipped defaults, unknown keys, clamping and
// parse failures.

#include <doctest/doctest.h>

#include <filesystem>
#include <string>

#include "TestSupport.h"
#include "runner/config/RunnerConfig.h"
#include "util/TomlUtil.h"

using runner::RunnerConfig;
using testsupport::makeTempDir;
using testsupport::writeFile;

namespace fs = std::filesystem;

TEST_CASE("the shipped runner.toml matches the built-in defaults") {
  const std::string path = std::string(GLIMMERWOOD_DATA_DIR) + "/runner.toml";
  TomlUtil::resetWarningCount();

  RunnerConfig cfg;
  REQUIRE(cfg.loadFromToml(path.c_str()));
  CHECK(TomlUtil::warningCount() == 0);

  const RunnerConfig defaults;
  CHECK(cfg.version == 1);
  CHECK(cfg.seed == 24301U);
  CHECK(cfg.world.baseSpeed == doctest::Approx(defaults.world.baseSpeed));
  CHECK(cfg.world.referenceHeight == doctest::Approx(defaults.world.referenceHeight));
  CHECK(cfg.player.gravity == doctest::Approx(defaults.player.gravity));
  CHECK(cfg.player.jumpVelocity == doctest::Approx(defaults.player.jumpVelocity));
  CHECK(cfg.player.maxJumps == defaults.player.maxJumps);
  CHECK(cfg.hitbox.shrink == doctest::Approx(defaults.hitbox.shrink));
  CHECK(cfg.lives.start == defaults.lives.start);
  CHECK(cfg.lives.max == defaults.lives.max);
  CHECK(cfg.obstacles.smallChance == doctest::Approx(defaults.obstacles.smallChance));
  CHECK(cfg.obstacles.minGap == doctest::Approx(defaults.obstacles.minGap));
  CHECK(cfg.hearts.maxRetries == defaults.hearts.maxRetries);
  CHECK(cfg.hearts.obstacleBuffer == doctest::Approx(defaults.hearts.obstacleBuffer));
  CHECK(cfg.fireflies.maxCount == defaults.fireflies.maxCount);
  CHECK(cfg.clock.stepHz == defaults.clock.stepHz);
  CHECK(cfg.clock.maxFrameDt == doctest::Approx(defaults.clock.maxFrameDt));
}

TEST_CASE("unknown keys warn but known keys still load") {
  const fs::path dir = makeTempDir("config_unknown");
  const fs::path p = dir / "runner.toml";
  writeFile(p,
            "version = 1\n"
            "turbo = true\n"
            "[world]\n"
            "base_speed = 500\n"
            "warp = 2.0\n");

  TomlUtil::resetWarningCount();
  RunnerConfig cfg;
  REQUIRE(cfg.loadFromToml(p.string().c_str()));
  CHECK(TomlUtil::warningCount() == 2);
  CHECK(cfg.world.baseSpeed == doctest::Approx(500.0F));
  // Sections that are absent keep their defaults.
  CHECK(cfg.player.gravity == doctest::Approx(RunnerConfig{}.player.gravity));
}

TEST_CASE("a wrong value type warns and keeps the default") {
  const fs::path dir = makeTempDir("config_types");
  const fs::path p = dir / "runner.toml";
  writeFile(p,
            "[player]\n"
            "gravity = \"heavy\"\n"
            "max_jumps = 3\n");

  TomlUtil::resetWarningCount();
  RunnerConfig cfg;
  REQUIRE(cfg.loadFromToml(p.string().c_str()));
  CHECK(TomlUtil::warningCount() == 1);
  CHECK(cfg.player.gravity == doctest::Approx(2600.0F));
  CHECK(cfg.player.maxJumps == 3);
}

TEST_CASE("out-of-range values are clamped") {
  const fs::path dir = makeTempDir("config_clamp");
  const fs::path p = dir / "runner.toml";
  writeFile(p,
            "[lives]\n"
            "start = 10\n"
            "max = 4\n"
            "[hitbox]\n"
            "shrink = 2.0\n"
            "[obstacles]\n"
            "small_chance = 1.5\n"
            "min_interval = 3.0\n"
            "max_interval = 1.0\n"
            "[player]\n"
            "jump_velocity = 900.0\n"
            "[clock]\n"
            "step_hz = 0\n"
            "max_frame_dt = 0.0\n");

  RunnerConfig cfg;
  REQUIRE(cfg.loadFromToml(p.string().c_str()));
  CHECK(cfg.lives.max == 4);
  CHECK(cfg.lives.start == 4);
  CHECK(cfg.hitbox.shrink == doctest::Approx(0.95F));
  CHECK(cfg.obstacles.smallChance == doctest::Approx(1.0F));
  CHECK(cfg.obstacles.maxInterval == doctest::Approx(3.0F));
  CHECK(cfg.player.jumpVelocity == doctest::Approx(0.0F));
  CHECK(cfg.clock.stepHz == 1);
  CHECK(cfg.clock.maxFrameDt == doctest::Approx(1.0F));
}

TEST_CASE("a parse error leaves the current config untouched") {
  const fs::path dir = makeTempDir("config_parse");
  const fs::path p = dir / "runner.toml";
  writeFile(p, "[world\nbase_speed = 1\n");

  RunnerConfig cfg;
  cfg.world.baseSpeed = 123.0F;
  cfg.seed = 77U;

  TomlUtil::resetWarningCount();
  CHECK_FALSE(cfg.loadFromToml(p.string().c_str()));
  CHECK(TomlUtil::warningCount() == 1);
  CHECK(cfg.world.baseSpeed == doctest::Approx(123.0F));
  CHECK(cfg.seed == 77U);
}

TEST_CASE("a missing config file fails without changing anything") {
  const fs::path dir = makeTempDir("config_missing");
  RunnerConfig cfg;
  cfg.lives.start = 5;
  CHECK_FALSE(cfg.loadFromToml((dir / "nope.toml").string().c_str()));
  CHECK(cfg.lives.start == 5);
}

TEST_CASE("step length follows the configured rate") {
  RunnerConfig cfg;
  CHECK(cfg.stepSeconds() == doctest::Approx(1.0F / 60.0F));
  cfg.clock.stepHz = 120;
  CHECK(cfg.stepSeconds() == doctest::Approx(1.0F / 120.0F));
}
