#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <string>
#include <vector>

// Dear ImGui settings and inspection panel. The host fills a model each frame
// and applies the returned actions; the panel never touches the engine.

struct DebugUIOverlayModel {
  uint64_t frame = 0;
  int stepsThisFrame = 0;
  float dt = 0.0F;
  const char* state = "";
  float worldTime = 0.0F;
  float speed = 0.0F;
  float difficultySeconds = 0.0F;
  float bgOffset = 0.0F;
  int score = 0;
  int hearts = 0;
  int highScore = 0;
  int viewW = 0;
  int viewH = 0;
  float unit = 1.0F;

  float obsTimer = 0.0F;
  float obsInterval = 0.0F;
  float lastObstacleX = 0.0F;
  float heartTimer = 0.0F;
  float heartInterval = 0.0F;

  int obstacleCount = 0;
  int heartCount = 0;
  int fireflyCount = 0;
  int obstaclesSpawned = 0;
  int spacingRejects = 0;
  int heartsSpawned = 0;
  int heartsDropped = 0;

  bool hasPlayer = false;
  float posX = 0.0F;
  float posY = 0.0F;
  float velY = 0.0F;
  bool grounded = false;
  int jumpsRemaining = 0;
  float hitCooldown = 0.0F;

  bool scripted = false;
  std::string scriptPath;
};

struct DebugUISettingsModel {
  bool musicOn = false;
  bool sfxOn = true;
  bool audioDevice = false;
  bool prefsEnabled = true;
  bool paused = false;
  bool canPause = false;
  bool canStart = false;
  std::vector<std::string> legend;
};

struct DebugUIActions {
  bool close = false;
  bool quit = false;
  bool setMusic = false;
  bool musicOn = false;
  bool setSfx = false;
  bool sfxOn = true;
  bool togglePause = false;
  bool start = false;
  bool resetHighScore = false;
};

class DebugUI {
 public:
  // `iniDir` keeps the window layout; empty disables the ini file.
  bool init(SDL_Window* window, SDL_Renderer* renderer, const std::string& iniDir);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  [[nodiscard]] bool initialized() const { return initialized_; }

  [[nodiscard]] bool wantCaptureKeyboard() const;
  [[nodiscard]] bool wantCaptureMouse() const;

  DebugUIActions drawPanel(const DebugUIOverlayModel& overlay, const DebugUISettingsModel& settings);

 private:
  bool initialized_ = false;
  std::string iniPath_;
};
