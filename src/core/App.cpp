#include "core/App.h"

#include <SDL3/SDL.h>
#include <SDL3/SDL_events.h>
#include <SDL3/SDL_init.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_timer.h>
#include <SDL3/SDL_video.h>

#include <cstdio>
#include <string>
#include <vector>

#include "ecs/Components.h"
#include "ecs/World.h"
#include "runner/RunnerEvents.h"
#include "runner/components/RunnerComponents.h"
#include "runner/controller/RunnerController.h"
#include "util/Paths.h"

namespace {

double nowSeconds() {
  return static_cast<double>(SDL_GetTicksNS()) / 1e9;
}

void logEvent(const runner::GameEvent& ev) {
  if (ev.type == runner::GameEventType::StateChanged) {
    std::printf("event %s %s -> %s\n", runner::gameEventName(ev.type),
                runner::gameStateName(ev.from), runner::gameStateName(ev.to));
    return;
  }
  std::printf("event %s %d\n", runner::gameEventName(ev.type), ev.value);
}

}  // namespace

// NOLINTNEXTLINE
bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;

  const std::string configPath =
      Paths::resolveAssetPath(cfg_.configPath ? cfg_.configPath : "data/runner.toml", cfg_.argv0);
  if (!runnerCfg_.loadFromToml(configPath.c_str())) {
    if (cfg_.configPath) {
      std::printf("Config load failed: %s\n", configPath.c_str());
      return false;
    }
    std::printf("Config %s not loaded; using built-in defaults\n", configPath.c_str());
  }
  if (cfg_.seedOverride) {
    runnerCfg_.seed = cfg_.seed;
  }

  if (cfg_.inputScriptPath) {
    const std::string scriptPath = Paths::resolveAssetPath(cfg_.inputScriptPath, cfg_.argv0);
    if (!script_.loadFromToml(scriptPath.c_str())) {
      std::printf("Input script load failed: %s\n", scriptPath.c_str());
      return false;
    }
    scripted_ = true;
    std::printf("Input script: %s (%zu keyframes)\n", scriptPath.c_str(), script_.keyframeCount());
  }

  SDL_InitFlags flags = SDL_INIT_VIDEO | SDL_INIT_GAMEPAD;
  if (!cfg_.noAudio)
    flags |= SDL_INIT_AUDIO;
  if (!SDL_Init(flags)) {
    std::printf("SDL_Init failed: %s\n", SDL_GetError());
    return false;
  }

  window_ = SDL_CreateWindow(cfg_.title, cfg_.width, cfg_.height,
                             SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
  if (!window_) {
    std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
    return false;
  }

  renderer_ = SDL_CreateRenderer(window_, nullptr);
  if (!renderer_) {
    std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
    return false;
  }
  SDL_SetRenderVSync(renderer_, 1);

  if (!cfg_.noPrefs) {
    prefDir_ = Paths::prefDir();
    if (!prefDir_.empty()) {
      prefsPath_ = prefDir_ + "settings.toml";
      (void)loadGamePrefs(prefsPath_, prefs_);
    }
  }

  const std::string assets =
      Paths::resolveAssetPath(cfg_.assetsDir ? cfg_.assetsDir : "assets", cfg_.argv0);

  sprites_.init(renderer_);
  const runner::RenderAssets images = runner::RenderAssets::fromDir(assets + "/images");
  view_.init(renderer_, &sprites_, images);
  const std::vector<std::string> imagePaths = images.all();
  if (sprites_.preload(imagePaths) > 0) {
    std::printf("Images: %zu/%zu loaded, %zu drawn as placeholders\n", sprites_.loadedCount(),
                imagePaths.size(), sprites_.failedCount());
  }

  if (!cfg_.noAudio && !audio_.init(assets + "/music")) {
    std::printf("Audio disabled\n");
  }
  audio_.setSfxEnabled(prefs_.sfxOn);
  audio_.setMusicEnabled(prefs_.musicOn);
  audio_.setMusic(Audio::Music::Title);

  input_.init();

  if (!cfg_.noUi && !debugUi_.init(window_, renderer_, prefDir_)) {
    std::printf("Debug UI init failed\n");
  }

  int viewW = cfg_.width;
  int viewH = cfg_.height;
  if (!SDL_GetRenderOutputSize(renderer_, &viewW, &viewH)) {
    viewW = cfg_.width;
    viewH = cfg_.height;
  }
  game_ = std::make_unique<runner::RunnerGame>(runnerCfg_, viewW, viewH);
  game_->setBackgroundWrapWidth(view_.backdropTileWidth(viewH));

  stepper_ = std::make_unique<FixedStepper>(nowSeconds, runnerCfg_.stepSeconds(),
                                            runnerCfg_.clock.maxFrameDt);

  std::printf("Glimmerwood Dash %dx%d seed=%u\n", viewW, viewH, runnerCfg_.seed);
  return true;
}

void App::run() {
  stepper_->reset();

  while (running_) {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
      handleEvent(e);
    }

    const GameCommands cmds = input_.consumeCommands();
    handleHostCommands(cmds);
    applyGameplay(cmds);

    const auto stepFn = [this](TimeStep ts) { step(ts); };
    // Scripted runs advance exactly one step per frame so replays do not
    // depend on the display rate.
    if (scripted_)
      stepsLastFrame_ = stepper_->advanceBy(stepper_->stepSeconds(), stepFn);
    else
      stepsLastFrame_ = stepper_->advance(stepFn);

    drainEvents();
    audio_.update();
    render();

    ++frames_;
    if (cfg_.maxFrames > 0 && frames_ >= static_cast<uint64_t>(cfg_.maxFrames)) {
      running_ = false;
    }
  }

  std::printf("frames=%llu steps=%llu state=%s score=%d hearts=%d\n",
              static_cast<unsigned long long>(frames_),
              static_cast<unsigned long long>(stepper_->frame()),
              runner::gameStateName(game_->state()), game_->score(), game_->hearts());
}

void App::shutdown() {
  debugUi_.shutdown();
  audio_.shutdown();
  input_.shutdown();
  sprites_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  SDL_Quit();
}

void App::handleEvent(const SDL_Event& e) {
  debugUi_.processEvent(e);

  switch (e.type) {
    case SDL_EVENT_QUIT:
      running_ = false;
      return;
    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
      resizeTo(e.window.data1, e.window.data2);
      return;
    default:
      break;
  }

  if (debugPanel_) {
    input_.setUiCapture(debugUi_.wantCaptureKeyboard(), debugUi_.wantCaptureMouse());
  } else {
    input_.setUiCapture(false, false);
  }
  input_.handleEvent(e);
}

void App::resizeTo(int w, int h) {
  if (!game_ || !game_->setViewport(w, h))
    return;
  game_->setBackgroundWrapWidth(view_.backdropTileWidth(h));
}

void App::handleHostCommands(const GameCommands& cmds) {
  if (cmds.quit)
    running_ = false;
  if (cmds.toggleMusic)
    setMusicOn(!audio_.musicEnabled(), true);
  if (cmds.toggleSfx)
    setSfxOn(!audio_.sfxEnabled());
  if (cmds.toggleFullscreen && window_) {
    if (SDL_SetWindowFullscreen(window_, !fullscreen_))
      fullscreen_ = !fullscreen_;
    else
      std::printf("SDL_SetWindowFullscreen failed: %s\n", SDL_GetError());
  }
  if (cmds.toggleDebugPanel && debugUi_.initialized())
    debugPanel_ = !debugPanel_;
}

void App::applyGameplay(const GameCommands& cmds) {
  if (!cmds.anyGameplay())
    return;
  (void)runner::applyCommands(*game_, cmds);
}

void App::step(TimeStep ts) {
  lastTs_ = ts;
  if (scripted_)
    applyGameplay(script_.sample(ts.frame));
  game_->step(ts);
}

// NOLINTNEXTLINE
void App::drainEvents() {
  for (const runner::GameEvent& ev : game_->drainEvents()) {
    if (cfg_.logEvents)
      logEvent(ev);

    switch (ev.type) {
      case runner::GameEventType::StateChanged:
        if (ev.to == runner::GameState::Playing && ev.from != runner::GameState::Paused &&
            !userSetMusic_ && !audio_.musicEnabled()) {
          setMusicOn(true, false);
        }
        syncMusic();
        break;
      case runner::GameEventType::Jumped:
        audio_.play(Audio::Sfx::Jump);
        break;
      case runner::GameEventType::Hit:
        audio_.play(Audio::Sfx::Hit);
        break;
      case runner::GameEventType::PickedUp:
        audio_.play(Audio::Sfx::Pickup);
        break;
      case runner::GameEventType::GameOver:
        if (recordFinalScore(prefs_, ev.value)) {
          std::printf("New high score: %d\n", prefs_.highScore);
          savePrefs();
        }
        break;
      case runner::GameEventType::ScoreChanged:
      case runner::GameEventType::HeartsChanged:
        break;
    }
  }
}

void App::syncMusic() {
  switch (game_->state()) {
    case runner::GameState::Title:
    case runner::GameState::GameOver:
      audio_.setMusic(Audio::Music::Title);
      break;
    case runner::GameState::Playing:
      audio_.setMusic(Audio::Music::Gameplay);
      break;
    case runner::GameState::Paused:
      audio_.setMusic(Audio::Music::None);
      break;
  }
}

void App::setMusicOn(bool on, bool fromUser) {
  if (fromUser)
    userSetMusic_ = true;
  audio_.setMusicEnabled(on);
  prefs_.musicOn = on;
  savePrefs();
}

void App::setSfxOn(bool on) {
  audio_.setSfxEnabled(on);
  prefs_.sfxOn = on;
  savePrefs();
}

void App::savePrefs() {
  if (prefsPath_.empty())
    return;
  if (!saveGamePrefs(prefsPath_, prefs_))
    std::printf("Failed to write %s\n", prefsPath_.c_str());
}

void App::render() {
  if (!renderer_)
    return;

  SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
  SDL_RenderClear(renderer_);

  runner::HudModel hud;
  hud.highScore = prefs_.highScore;
  hud.musicOn = audio_.musicEnabled();
  hud.sfxOn = audio_.sfxEnabled();
  view_.render(*game_, hud);

  if (debugUi_.initialized()) {
    debugUi_.beginFrame();
    if (debugPanel_)
      drawDebugPanel();
    debugUi_.endFrame(renderer_);
  }

  SDL_RenderPresent(renderer_);
}

// NOLINTNEXTLINE
void App::drawDebugPanel() {
  const runner::Session& s = game_->session();
  const World& w = game_->world();
  const runner::Spawner& sp = game_->spawner();

  DebugUIOverlayModel o;
  o.frame = stepper_->frame();
  o.stepsThisFrame = stepsLastFrame_;
  o.dt = lastTs_.dt;
  o.state = runner::gameStateName(s.state);
  o.worldTime = s.t;
  o.speed = s.speed;
  o.difficultySeconds = s.difficultySeconds;
  o.bgOffset = s.bgOffset;
  o.score = s.score;
  o.hearts = s.hearts;
  o.highScore = prefs_.highScore;
  o.viewW = s.metrics.viewW;
  o.viewH = s.metrics.viewH;
  o.unit = s.metrics.u;
  o.obsTimer = s.obsTimer;
  o.obsInterval = s.obsInterval;
  o.lastObstacleX = s.lastObstacleX;
  o.heartTimer = s.heartTimer;
  o.heartInterval = s.heartInterval;
  o.obstacleCount = static_cast<int>(w.registry.view<runner::ObstacleTag>().size());
  o.heartCount = static_cast<int>(w.registry.view<runner::HeartTag>().size());
  o.fireflyCount = static_cast<int>(w.registry.view<runner::FireflyTag>().size());
  o.obstaclesSpawned = sp.obstaclesSpawned;
  o.spacingRejects = sp.spacingRejects;
  o.heartsSpawned = sp.heartsSpawned;
  o.heartsDropped = sp.heartsDropped;
  if (const runner::PlayerState* p = game_->playerState()) {
    const auto& t = w.registry.get<Transform>(game_->player());
    o.hasPlayer = true;
    o.posX = t.pos.x;
    o.posY = t.pos.y;
    o.velY = p->vy;
    o.grounded = p->onGround;
    o.jumpsRemaining = p->jumpsRemaining;
    o.hitCooldown = p->hitCooldown;
  }
  o.scripted = scripted_;
  if (scripted_)
    o.scriptPath = script_.path();

  DebugUISettingsModel settings;
  settings.musicOn = audio_.musicEnabled();
  settings.sfxOn = audio_.sfxEnabled();
  settings.audioDevice = audio_.deviceOpen();
  settings.prefsEnabled = !prefsPath_.empty();
  settings.paused = s.state == runner::GameState::Paused;
  settings.canPause =
      s.state == runner::GameState::Playing || s.state == runner::GameState::Paused;
  settings.canStart =
      s.state == runner::GameState::Title || s.state == runner::GameState::GameOver;
  input_.appendLegend(settings.legend);

  const DebugUIActions a = debugUi_.drawPanel(o, settings);
  if (a.close)
    debugPanel_ = false;
  if (a.quit)
    running_ = false;
  if (a.setMusic)
    setMusicOn(a.musicOn, true);
  if (a.setSfx)
    setSfxOn(a.sfxOn);
  if (a.togglePause)
    (void)game_->requestPauseToggle();
  if (a.start)
    (void)game_->requestStart();
  if (a.resetHighScore) {
    prefs_.highScore = 0;
    savePrefs();
  }
}
