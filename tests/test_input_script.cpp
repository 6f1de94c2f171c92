// tests/test_input_script.cpp
//
// Scripted held-button keyframes: edge triggering, includes and a full
// scripted run through the controller.

#include <doctest/doctest.h>

#include <filesystem>
#include <string>

#include "TestSupport.h"
#include "core/FixedStepper.h"
#include "core/InputScript.h"
#include "runner/RunnerEvents.h"
#include "runner/RunnerGame.h"
#include "runner/controller/RunnerController.h"
#include "util/TomlUtil.h"

using namespace testsupport;
using runner::GameEventType;
using runner::GameState;

namespace fs = std::filesystem;

TEST_CASE("held buttons fire once per press") {
  const fs::path dir = makeTempDir("script_edges");
  const fs::path p = dir / "edges.toml";
  writeFile(p,
            "version = 1\n"
            "keyframes = [\n"
            "  { frame = 2, jump = true },\n"
            "  { frame = 5, jump = false },\n"
            "  { frame = 7, jump = true, pause = true },\n"
            "  { frame = 8, pause = false },\n"
            "]\n");

  InputScript script;
  REQUIRE(script.loadFromToml(p.string().c_str()));
  CHECK(script.keyframeCount() == 4);
  CHECK(script.lastKeyframe() == 8);

  CHECK_FALSE(script.sample(0).jump);
  CHECK_FALSE(script.sample(1).jump);
  CHECK(script.sample(2).jump);
  CHECK_FALSE(script.sample(3).jump);
  CHECK_FALSE(script.sample(4).jump);
  CHECK_FALSE(script.sample(5).jump);
  CHECK_FALSE(script.sample(6).jump);

  const GameCommands at7 = script.sample(7);
  CHECK(at7.jump);
  CHECK(at7.pauseToggle);

  // frame 8 only releases pause; jump stays held and does not refire.
  const GameCommands at8 = script.sample(8);
  CHECK_FALSE(at8.jump);
  CHECK_FALSE(at8.pauseToggle);
}

TEST_CASE("skipped frames still apply every keyframe up to the sample") {
  const fs::path dir = makeTempDir("script_skip");
  const fs::path p = dir / "skip.toml";
  writeFile(p,
            "keyframes = [\n"
            "  { frame = 3, start = true },\n"
            "  { frame = 4, primary = true },\n"
            "]\n");

  InputScript script;
  REQUIRE(script.loadFromToml(p.string().c_str()));
  const GameCommands c = script.sample(10);
  CHECK(c.start);
  CHECK(c.primary);
}

TEST_CASE("sampling an earlier frame restarts playback") {
  const fs::path dir = makeTempDir("script_rewind");
  const fs::path p = dir / "rewind.toml";
  writeFile(p, "keyframes = [ { frame = 1, start = true } ]\n");

  InputScript script;
  REQUIRE(script.loadFromToml(p.string().c_str()));
  CHECK(script.sample(1).start);
  CHECK_FALSE(script.sample(2).start);
  CHECK_FALSE(script.sample(0).start);
  CHECK(script.sample(1).start);
}

TEST_CASE("an unloaded script produces no commands") {
  InputScript script;
  CHECK_FALSE(script.loaded());
  CHECK_FALSE(script.sample(0).anyGameplay());
}

TEST_CASE("bad keyframes warn and are skipped") {
  const fs::path dir = makeTempDir("script_bad");
  const fs::path p = dir / "bad.toml";
  writeFile(p,
            "keyframes = [\n"
            "  { jump = true },\n"
            "  { frame = 4, jump = 1 },\n"
            "  { frame = 6, dash = true },\n"
            "  7,\n"
            "]\n");

  TomlUtil::resetWarningCount();
  InputScript script;
  REQUIRE(script.loadFromToml(p.string().c_str()));
  CHECK(TomlUtil::warningCount() == 4);
  CHECK(script.keyframeCount() == 2);
  CHECK_FALSE(script.sample(10).jump);
}

TEST_CASE("a script that fails to parse is not loaded") {
  const fs::path dir = makeTempDir("script_parse");
  const fs::path p = dir / "broken.toml";
  writeFile(p, "keyframes = [ { frame = 1 \n");

  InputScript script;
  CHECK_FALSE(script.loadFromToml(p.string().c_str()));
  CHECK_FALSE(script.loaded());
  CHECK(script.keyframeCount() == 0);
}

TEST_CASE("includes resolve next to the including file and run first") {
  const std::string path = std::string(GLIMMERWOOD_DATA_DIR) + "/scripts/hop_run.toml";
  InputScript script;
  REQUIRE(script.loadFromToml(path.c_str()));
  CHECK(script.keyframeCount() == 16);
  CHECK(script.lastKeyframe() == 482);
  CHECK(script.sample(2).start);
}

TEST_CASE("an include cycle is reported once and loading continues") {
  const fs::path dir = makeTempDir("script_cycle");
  writeFile(dir / "a.toml",
            "include = \"b.toml\"\n"
            "keyframes = [ { frame = 1, jump = true } ]\n");
  writeFile(dir / "b.toml",
            "include = \"a.toml\"\n"
            "keyframes = [ { frame = 2, start = true } ]\n");

  TomlUtil::resetWarningCount();
  InputScript script;
  REQUIRE(script.loadFromToml((dir / "a.toml").string().c_str()));
  CHECK(TomlUtil::warningCount() == 1);
  CHECK(script.keyframeCount() == 2);
}

TEST_CASE("the hop_run script drives a run through start, jumps and a pause") {
  const std::string path = std::string(GLIMMERWOOD_DATA_DIR) + "/scripts/hop_run.toml";
  InputScript script;
  REQUIRE(script.loadFromToml(path.c_str()));

  runner::RunnerConfig cfg;
  runner::RunnerGame game(cfg, kViewW, kViewH);
  FixedStepper stepper([] { return 0.0; }, cfg.stepSeconds(), cfg.clock.maxFrameDt);

  int jumps = 0;
  int pauses = 0;
  int resumes = 0;
  for (int frame = 0; frame < 320; ++frame) {
    (void)stepper.advanceBy(stepper.stepSeconds(), [&](TimeStep ts) {
      (void)runner::applyCommands(game, script.sample(ts.frame));
      game.step(ts);
    });
    for (const runner::GameEvent& e : game.drainEvents()) {
      if (e.type == GameEventType::Jumped)
        ++jumps;
      if (e.type == GameEventType::StateChanged && e.to == GameState::Paused)
        ++pauses;
      if (e.type == GameEventType::StateChanged && e.from == GameState::Paused)
        ++resumes;
    }
  }

  CHECK(game.state() == GameState::Playing);
  CHECK(jumps == 3);
  CHECK(pauses == 1);
  CHECK(resumes == 1);
}
