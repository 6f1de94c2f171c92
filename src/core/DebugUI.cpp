#include "core/DebugUI.h"

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer, const std::string& iniDir) {
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  iniPath_.clear();
  if (!iniDir.empty()) {
    iniPath_ = iniDir + "imgui.ini";
    io.IniFilename = iniPath_.c_str();  // persist layout outside the repo
  } else {
    io.IniFilename = nullptr;
  }
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
}

void DebugUI::shutdown() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
}

void DebugUI::processEvent(const SDL_Event& e) {
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
}

void DebugUI::beginFrame() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
}

bool DebugUI::wantCaptureKeyboard() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
}

bool DebugUI::wantCaptureMouse() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureMouse;
}

// NOLINTNEXTLINE
DebugUIActions DebugUI::drawPanel(const DebugUIOverlayModel& o, const DebugUISettingsModel& s) {
  DebugUIActions actions{};
  if (!initialized_)
    return actions;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 16.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(340.0F, 0.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.85F);

  bool open = true;
  if (ImGui::Begin("Glimmerwood", &open)) {
    if (ImGui::CollapsingHeader("Session", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("state: %s", o.state);
      ImGui::Text("frame: %llu  steps: %d  dt: %.4F", static_cast<unsigned long long>(o.frame),
                  o.stepsThisFrame, o.dt);
      ImGui::Text("t: %.2F  difficulty: %.2F", o.worldTime, o.difficultySeconds);
      ImGui::Text("speed: %.1F px/s  bg: %.0F", o.speed, o.bgOffset);
      ImGui::Text("score: %d  hearts: %d  best: %d", o.score, o.hearts, o.highScore);
      ImGui::Text("view: %dx%d  u: %.3F", o.viewW, o.viewH, o.unit);
      if (o.scripted)
        ImGui::TextWrapped("script: %s", o.scriptPath.c_str());
    }

    if (ImGui::CollapsingHeader("Spawner", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("obstacle timer: %.2F / %.2F", o.obsTimer, o.obsInterval);
      ImGui::Text("last obstacle x: %.0F", o.lastObstacleX);
      ImGui::Text("heart timer: %.2F / %.2F", o.heartTimer, o.heartInterval);
      ImGui::Text("live: obstacles=%d hearts=%d fireflies=%d", o.obstacleCount, o.heartCount,
                  o.fireflyCount);
      ImGui::Text("spawned=%d spacing_rejects=%d", o.obstaclesSpawned, o.spacingRejects);
      ImGui::Text("hearts spawned=%d dropped=%d", o.heartsSpawned, o.heartsDropped);
    }

    if (ImGui::CollapsingHeader("Player")) {
      if (o.hasPlayer) {
        ImGui::Text("pos: (%.1F, %.1F)  vy: %.1F", o.posX, o.posY, o.velY);
        ImGui::Text("grounded: %d  jumps: %d", o.grounded ? 1 : 0, o.jumpsRemaining);
        ImGui::Text("hit cooldown: %.2F", o.hitCooldown);
      } else {
        ImGui::TextUnformatted("player: (none)");
      }
    }

    if (ImGui::CollapsingHeader("Settings", ImGuiTreeNodeFlags_DefaultOpen)) {
      bool music = s.musicOn;
      if (ImGui::Checkbox("Music", &music)) {
        actions.setMusic = true;
        actions.musicOn = music;
      }
      ImGui::SameLine();
      bool sfx = s.sfxOn;
      if (ImGui::Checkbox("Sound effects", &sfx)) {
        actions.setSfx = true;
        actions.sfxOn = sfx;
      }
      if (!s.audioDevice)
        ImGui::TextDisabled("no audio device");

      ImGui::BeginDisabled(!s.canPause);
      if (ImGui::Button(s.paused ? "Resume" : "Pause"))
        actions.togglePause = true;
      ImGui::EndDisabled();
      ImGui::SameLine();
      ImGui::BeginDisabled(!s.canStart);
      if (ImGui::Button("Start"))
        actions.start = true;
      ImGui::EndDisabled();
      ImGui::SameLine();
      ImGui::BeginDisabled(!s.prefsEnabled);
      if (ImGui::Button("Reset best"))
        actions.resetHighScore = true;
      ImGui::EndDisabled();
      ImGui::SameLine();
      if (ImGui::Button("Quit"))
        actions.quit = true;
    }

    if (!s.legend.empty() && ImGui::CollapsingHeader("Controls")) {
      for (const std::string& line : s.legend)
        ImGui::TextWrapped("%s", line.c_str());
    }
  }
  ImGui::End();

  if (!open)
    actions.close = true;
  return actions;
}
