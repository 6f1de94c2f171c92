#pragma once

#include <SDL3/SDL_render.h>

#include <string>
#include <vector>

class SpriteCache;

namespace runner {

class RunnerGame;

// Image files the renderer draws; any of them may be missing.
struct RenderAssets {
  std::string backdrop;
  std::string player;
  std::string smallObstacle;
  std::string largeObstacle;
  std::string heart;
  std::string logo;
  std::string musicOn;
  std::string musicOff;
  std::string sfxOn;
  std::string sfxOff;

  // Standard file names under `dir`.
  static RenderAssets fromDir(const std::string& dir);
  [[nodiscard]] std::vector<std::string> all() const;
};

// Values the HUD shows that the engine does not own.
struct HudModel {
  int highScore = 0;
  bool musicOn = false;
  bool sfxOn = true;
};

// Draws one frame from a read-only engine snapshot: backdrop, fireflies,
// ground shadow, pickups, obstacles, player, then HUD and state overlays.
class RunnerRenderer {
 public:
  void init(SDL_Renderer* renderer, SpriteCache* sprites, RenderAssets assets);

  // Width of one backdrop tile scaled to fill `viewH`; 0 without a backdrop.
  [[nodiscard]] float backdropTileWidth(int viewH) const;

  void render(const RunnerGame& game, const HudModel& hud) const;

 private:
  void renderBackdrop(const RunnerGame& game) const;
  void renderFireflies(const RunnerGame& game) const;
  void renderGround(const RunnerGame& game) const;
  void renderEntities(const RunnerGame& game) const;
  void renderHud(const RunnerGame& game, const HudModel& hud) const;
  void renderOverlay(const RunnerGame& game, const HudModel& hud) const;

  SDL_Renderer* renderer_ = nullptr;
  SpriteCache* sprites_ = nullptr;
  RenderAssets assets_;
};

}  // namespace runner
