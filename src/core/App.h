#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <memory>
#include <string>

#include "core/Audio.h"
#include "core/Commands.h"
#include "core/DebugUI.h"
#include "core/FixedStepper.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/Prefs.h"
#include "core/SpriteCache.h"
#include "core/Time.h"
#include "runner/RunnerGame.h"
#include "runner/config/RunnerConfig.h"
#include "runner/render/RunnerRenderer.h"

struct AppConfig {
  const char* title = "Glimmerwood Dash";
  int width = 1280;
  int height = 720;
  int maxFrames = -1;  // -1 = run until quit
  const char* configPath = nullptr;
  const char* inputScriptPath = nullptr;
  const char* assetsDir = nullptr;
  const char* argv0 = nullptr;
  bool seedOverride = false;
  uint32_t seed = 0;
  bool noPrefs = false;
  bool noAudio = false;
  bool noUi = false;
  bool logEvents = false;
};

// SDL host: owns the window, devices and collaborators around one
// RunnerGame, and drives it from the frame loop through a FixedStepper.
class App {
 public:
  bool init(const AppConfig& cfg);
  void run();
  void shutdown();

  [[nodiscard]] const runner::RunnerGame* game() const { return game_.get(); }

 private:
  void handleEvent(const SDL_Event& e);
  void handleHostCommands(const GameCommands& cmds);
  void applyGameplay(const GameCommands& cmds);
  void step(TimeStep ts);
  void drainEvents();
  void syncMusic();
  void render();
  void drawDebugPanel();
  void resizeTo(int w, int h);

  void setMusicOn(bool on, bool fromUser);
  void setSfxOn(bool on);
  void savePrefs();

  AppConfig cfg_{};
  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  bool running_ = true;
  bool fullscreen_ = false;
  bool debugPanel_ = false;
  bool userSetMusic_ = false;
  int stepsLastFrame_ = 0;
  uint64_t frames_ = 0;
  TimeStep lastTs_{};

  runner::RunnerConfig runnerCfg_{};
  std::unique_ptr<runner::RunnerGame> game_;
  std::unique_ptr<FixedStepper> stepper_;
  runner::RunnerRenderer view_;

  Input input_;
  InputScript script_;
  bool scripted_ = false;
  Audio audio_;
  SpriteCache sprites_;
  DebugUI debugUi_;

  GamePrefs prefs_{};
  std::string prefsPath_;
  std::string prefDir_;
};
