#include "runner/controller/RunnerController.h"

#include "runner/RunnerGame.h"

namespace runner {

ControlOutcome applyCommands(RunnerGame& game, const GameCommands& cmds) {
  ControlOutcome out;

  const auto togglePause = [&game, &out]() {
    const GameState before = game.state();
    if (game.requestPauseToggle()) {
      out.paused = before == GameState::Playing;
      out.resumed = before == GameState::Paused;
    }
  };

  if (cmds.start || cmds.primary) {
    out.started = game.requestStart();
  }
  if (cmds.confirm) {
    if (game.state() == GameState::Title) {
      out.started = game.requestStart() || out.started;
    } else {
      togglePause();
    }
  }
  if (cmds.pauseToggle) {
    togglePause();
  }

  // A press that just started the run does not also jump.
  if (!out.started && (cmds.primary || cmds.jump)) {
    out.jumped = game.requestJump();
  }
  return out;
}

}  // namespace runner
