#pragma once

// Edge-triggered requests gathered from devices or a script over one frame.
// Each flag is set at most once per physical press.
struct GameCommands {
  // gameplay
  bool primary = false;  // start on Title/GameOver, jump while Playing
  bool jump = false;     // jump only
  bool confirm = false;  // start on Title/GameOver, else pause toggle
  bool start = false;    // start only
  bool pauseToggle = false;

  // host
  bool quit = false;
  bool toggleMusic = false;
  bool toggleSfx = false;
  bool toggleFullscreen = false;
  bool toggleDebugPanel = false;

  void merge(const GameCommands& o) {
    primary = primary || o.primary;
    jump = jump || o.jump;
    confirm = confirm || o.confirm;
    start = start || o.start;
    pauseToggle = pauseToggle || o.pauseToggle;
    quit = quit || o.quit;
    toggleMusic = toggleMusic || o.toggleMusic;
    toggleSfx = toggleSfx || o.toggleSfx;
    toggleFullscreen = toggleFullscreen || o.toggleFullscreen;
    toggleDebugPanel = toggleDebugPanel || o.toggleDebugPanel;
  }

  [[nodiscard]] bool anyGameplay() const {
    return primary || jump || confirm || start || pauseToggle;
  }
};
