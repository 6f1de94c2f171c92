#include "runner/render/RunnerRenderer.h"

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_rect.h>
#include <SDL3/SDL_render.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <utility>

#include "core/SpriteCache.h"
#include "ecs/Components.h"
#include "runner/RunnerGame.h"
#include "runner/components/RunnerComponents.h"

namespace runner {

namespace {

struct Rgba {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;
};

constexpr Rgba kPrimary{0x00, 0x00, 0xa3, 255};
constexpr Rgba kLight{0x40, 0xb0, 0xdf, 255};
constexpr Rgba kGold{0xff, 0xd5, 0x3d, 255};
constexpr Rgba kPale{0xff, 0xf5, 0x93, 255};
constexpr Rgba kNight{0x04, 0x12, 0x3b, 255};
constexpr Rgba kShadow{0, 0, 0, 89};  // 35%
constexpr Rgba kScrim{0, 0, 0, 140};

constexpr float kGlyph = 8.0F;  // SDL debug font cell

void setColor(SDL_Renderer* r, Rgba c) {
  SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
}

void fillRect(SDL_Renderer* r, float x, float y, float w, float h, Rgba c) {
  setColor(r, c);
  const SDL_FRect rect{x, y, w, h};
  SDL_RenderFillRect(r, &rect);
}

// Sprite stretched over the box, or a flat placeholder when it did not load.
void drawBox(SDL_Renderer* r,
             SpriteCache* sprites,
             const std::string& path,
             float x,
             float y,
             float w,
             float h,
             Rgba fallback) {
  if (sprites != nullptr) {
    if (const SpriteCache::Sprite s = sprites->get(path)) {
      const SDL_FRect dst{std::round(x), std::round(y), w, h};
      SDL_RenderTexture(r, s.texture, nullptr, &dst);
      return;
    }
  }
  fillRect(r, x, y, w, h, fallback);
}

void drawText(SDL_Renderer* r, const char* text, float x, float y, float scale, Rgba c) {
  setColor(r, c);
  SDL_SetRenderScale(r, scale, scale);
  SDL_RenderDebugText(r, x / scale, y / scale, text);
  SDL_SetRenderScale(r, 1.0F, 1.0F);
}

void drawTextCentered(SDL_Renderer* r, const char* text, float cx, float y, float scale, Rgba c) {
  const float w = static_cast<float>(std::strlen(text)) * kGlyph * scale;
  drawText(r, text, cx - w * 0.5F, y, scale, c);
}

}  // namespace

RenderAssets RenderAssets::fromDir(const std::string& dir) {
  const std::string base = dir.empty() ? std::string() : dir + "/";
  RenderAssets a;
  a.backdrop = base + "backdrop.png";
  a.player = base + "player.png";
  a.smallObstacle = base + "small-mushroom.png";
  a.largeObstacle = base + "large-mushroom.png";
  a.heart = base + "heart.png";
  a.logo = base + "glimmerwood-dash-logo.png";
  a.musicOn = base + "music-on.png";
  a.musicOff = base + "music-off.png";
  a.sfxOn = base + "sfx-on.png";
  a.sfxOff = base + "sfx-off.png";
  return a;
}

std::vector<std::string> RenderAssets::all() const {
  return {backdrop, player, smallObstacle, largeObstacle, heart,
          logo,     musicOn, musicOff,     sfxOn,         sfxOff};
}

void RunnerRenderer::init(SDL_Renderer* renderer, SpriteCache* sprites, RenderAssets assets) {
  renderer_ = renderer;
  sprites_ = sprites;
  assets_ = std::move(assets);
}

float RunnerRenderer::backdropTileWidth(int viewH) const {
  if (sprites_ == nullptr || viewH <= 0)
    return 0.0F;
  const SpriteCache::Sprite bg = sprites_->get(assets_.backdrop);
  if (!bg || bg.h <= 0.0F)
    return 0.0F;
  return bg.w * (static_cast<float>(viewH) / bg.h);
}

void RunnerRenderer::render(const RunnerGame& game, const HudModel& hud) const {
  if (!renderer_)
    return;

  SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
  renderBackdrop(game);
  renderFireflies(game);
  renderGround(game);
  renderEntities(game);
  renderHud(game, hud);
  renderOverlay(game, hud);
}

void RunnerRenderer::renderBackdrop(const RunnerGame& game) const {
  const auto& m = game.session().metrics;
  const float viewW = static_cast<float>(m.viewW);
  const float viewH = static_cast<float>(m.viewH);

  const float tileW = backdropTileWidth(m.viewH);
  if (tileW <= 0.0F) {
    fillRect(renderer_, 0.0F, 0.0F, viewW, viewH, kNight);
    return;
  }

  SDL_Texture* tex = sprites_->get(assets_.backdrop).texture;
  // The offset only advances while Playing, so pause and game over hold the frame.
  for (float x = -std::fmod(game.session().bgOffset, tileW); x < viewW; x += tileW) {
    const SDL_FRect dst{x, 0.0F, tileW, viewH};
    SDL_RenderTexture(renderer_, tex, nullptr, &dst);
  }
}

void RunnerRenderer::renderFireflies(const RunnerGame& game) const {
  const auto& reg = game.world().registry;
  auto view = reg.view<FireflyTag, FireflyState, Transform>();
  for (auto [entity, f, t] : view.each()) {
    const float alpha = 0.3F + 0.7F * (0.5F + 0.5F * std::sin(f.phase));
    Rgba c = kPale;
    c.a = static_cast<uint8_t>(std::clamp(alpha, 0.0F, 1.0F) * 255.0F);
    fillRect(renderer_, std::round(t.pos.x), std::round(t.pos.y), f.radius, f.radius, c);
  }
}

void RunnerRenderer::renderGround(const RunnerGame& game) const {
  const auto& m = game.session().metrics;
  fillRect(renderer_, 0.0F, m.groundY + 2.0F * m.u, static_cast<float>(m.viewW), 3.0F * m.u,
           kShadow);
}

void RunnerRenderer::renderEntities(const RunnerGame& game) const {
  const auto& reg = game.world().registry;

  auto hearts = reg.view<HeartTag, HeartState, Transform, AABB>();
  for (auto [entity, h, t, box] : hearts.each()) {
    drawBox(renderer_, sprites_, assets_.heart, t.pos.x, t.pos.y, box.w, box.h, kGold);
  }

  auto obstacles = reg.view<ObstacleTag, ObstacleState, Transform, AABB>();
  for (auto [entity, o, t, box] : obstacles.each()) {
    const bool small = o.kind == ObstacleKind::Small;
    drawBox(renderer_, sprites_, small ? assets_.smallObstacle : assets_.largeObstacle, t.pos.x,
            t.pos.y, box.w, box.h, small ? kGold : kLight);
  }

  auto players = reg.view<PlayerTag, PlayerState, Transform, AABB>();
  for (auto [entity, p, t, box] : players.each()) {
    drawBox(renderer_, sprites_, assets_.player, t.pos.x, t.pos.y, box.w, box.h, kPrimary);
  }
}

void RunnerRenderer::renderHud(const RunnerGame& game, const HudModel& hud) const {
  const auto& m = game.session().metrics;
  const float viewW = static_cast<float>(m.viewW);

  // Music and sound indicators in the top-right corner on every screen.
  const float icon = 24.0F;
  drawBox(renderer_, sprites_, hud.sfxOn ? assets_.sfxOn : assets_.sfxOff, viewW - 16.0F - icon,
          16.0F, icon, icon, hud.sfxOn ? kLight : kShadow);
  drawBox(renderer_, sprites_, hud.musicOn ? assets_.musicOn : assets_.musicOff,
          viewW - 28.0F - 2.0F * icon, 16.0F, icon, icon, hud.musicOn ? kLight : kShadow);

  if (game.state() != GameState::Playing)
    return;

  char scoreText[32];
  std::snprintf(scoreText, sizeof(scoreText), "Score: %d", game.score());
  drawText(renderer_, scoreText, 12.0F, 14.0F, 2.0F, kGold);

  const float hw = 24.0F;
  const float hh = 22.0F;
  const float gap = 6.0F;
  const float rowRight = viewW - 40.0F - 2.0F * icon;
  for (int i = 0; i < game.hearts(); ++i) {
    const float x = rowRight - static_cast<float>(game.hearts() - i) * (hw + gap);
    drawBox(renderer_, sprites_, assets_.heart, x, 16.0F, hw, hh, kGold);
  }
}

void RunnerRenderer::renderOverlay(const RunnerGame& game, const HudModel& hud) const {
  const auto& m = game.session().metrics;
  const float viewW = static_cast<float>(m.viewW);
  const float viewH = static_cast<float>(m.viewH);
  const float cx = viewW * 0.5F;
  char line[64];

  switch (game.state()) {
    case GameState::Title: {
      float y = viewH * 0.3F;
      const SpriteCache::Sprite logo = sprites_ ? sprites_->get(assets_.logo) : SpriteCache::Sprite{};
      if (logo && logo.w > 0.0F) {
        const float w = std::min(viewW * 0.7F, 720.0F);
        const float h = w * (logo.h / logo.w);
        const SDL_FRect dst{cx - w * 0.5F, y - h * 0.5F, w, h};
        SDL_RenderTexture(renderer_, logo.texture, nullptr, &dst);
        y += h * 0.5F + 24.0F;
      } else {
        drawTextCentered(renderer_, "Glimmerwood Dash", cx, y, 5.0F, kPale);
        y += 64.0F;
      }
      std::snprintf(line, sizeof(line), "High Score: %d", hud.highScore);
      drawTextCentered(renderer_, line, cx, y, 3.0F, kGold);
      drawTextCentered(renderer_, "Press SPACE or Click to Start", cx, y + 56.0F, 2.0F, kLight);
      break;
    }
    case GameState::Paused:
      fillRect(renderer_, 0.0F, 0.0F, viewW, viewH, kScrim);
      drawTextCentered(renderer_, "Paused", cx, viewH * 0.4F, 5.0F, kPale);
      drawTextCentered(renderer_, "Press P or Enter to resume", cx, viewH * 0.4F + 64.0F, 2.0F,
                       kLight);
      break;
    case GameState::GameOver:
      fillRect(renderer_, 0.0F, 0.0F, viewW, viewH, kScrim);
      drawTextCentered(renderer_, "Game Over", cx, viewH * 0.32F, 6.0F, kPale);
      std::snprintf(line, sizeof(line), "Score: %d", game.score());
      drawTextCentered(renderer_, line, cx, viewH * 0.32F + 72.0F, 3.0F, kGold);
      std::snprintf(line, sizeof(line), "High Score: %d", hud.highScore);
      drawTextCentered(renderer_, line, cx, viewH * 0.32F + 112.0F, 2.0F, kLight);
      drawTextCentered(renderer_, "Press SPACE or Click to Restart", cx, viewH * 0.32F + 148.0F,
                       2.0F, kLight);
      break;
    case GameState::Playing:
      break;
  }
}

}  // namespace runner
