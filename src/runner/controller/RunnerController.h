#pragma once

#include "core/Commands.h"

namespace runner {

class RunnerGame;

// What a batch of commands actually changed; ignored commands leave no trace.
struct ControlOutcome {
  bool started = false;
  bool jumped = false;
  bool paused = false;
  bool resumed = false;
};

// Routes device-independent commands to the engine according to the current
// state: primary starts from Title/GameOver and jumps while Playing; confirm
// starts from Title and toggles pause otherwise.
ControlOutcome applyCommands(RunnerGame& game, const GameCommands& cmds);

}  // namespace runner
