#pragma once

#include <SDL3/SDL_render.h>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Texture cache keyed by path, decoded with stb_image. A path that failed to
// load is remembered and not retried, so the renderer can ask every frame and
// draw a placeholder instead.
class SpriteCache {
 public:
  struct Sprite {
    SDL_Texture* texture = nullptr;
    float w = 0.0F;
    float h = 0.0F;

    explicit operator bool() const { return texture != nullptr; }
  };

  void init(SDL_Renderer* renderer);
  void shutdown();

  Sprite get(const std::string& path);

  // Loads every path up front. Returns how many are missing.
  int preload(const std::vector<std::string>& paths);

  [[nodiscard]] std::size_t loadedCount() const { return textures_.size(); }
  [[nodiscard]] std::size_t failedCount() const { return failed_.size(); }

 private:
  SDL_Texture* loadTexture(const std::string& path);

  SDL_Renderer* renderer_ = nullptr;
  std::unordered_map<std::string, Sprite> textures_;
  std::unordered_set<std::string> failed_;
};
