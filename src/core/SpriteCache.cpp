#include "core/SpriteCache.h"

#include <cstddef>
#include <cstdio>

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_iostream.h>
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_stdinc.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace {

// Decoded RGBA pixels owned by stb.
struct Pixels {
  stbi_uc* data = nullptr;
  int w = 0;
  int h = 0;

  Pixels() = default;
  Pixels(const Pixels&) = delete;
  Pixels& operator=(const Pixels&) = delete;
  ~Pixels() {
    if (data)
      stbi_image_free(data);
  }
};

bool decodeFile(const std::string& path, Pixels& out) {
  std::size_t size = 0;
  void* bytes = SDL_LoadFile(path.c_str(), &size);
  if (!bytes) {
    std::printf("Sprite: cannot read %s (%s)\n", path.c_str(), SDL_GetError());
    return false;
  }

  int channels = 0;
  out.data = stbi_load_from_memory(static_cast<const stbi_uc*>(bytes), static_cast<int>(size),
                                   &out.w, &out.h, &channels, 4);
  SDL_free(bytes);
  if (!out.data) {
    std::printf("Sprite: cannot decode %s (%s)\n", path.c_str(), stbi_failure_reason());
    return false;
  }
  return true;
}

}  // namespace

void SpriteCache::init(SDL_Renderer* renderer) {
  renderer_ = renderer;
}

void SpriteCache::shutdown() {
  for (auto& [path, sprite] : textures_) {
    (void)path;
    if (sprite.texture)
      SDL_DestroyTexture(sprite.texture);
  }
  textures_.clear();
  failed_.clear();
  renderer_ = nullptr;
}

SpriteCache::Sprite SpriteCache::get(const std::string& path) {
  auto it = textures_.find(path);
  if (it != textures_.end())
    return it->second;
  if (path.empty() || failed_.count(path) != 0)
    return Sprite{};

  SDL_Texture* tex = loadTexture(path);
  if (!tex) {
    failed_.insert(path);
    return Sprite{};
  }

  Sprite sprite;
  sprite.texture = tex;
  (void)SDL_GetTextureSize(tex, &sprite.w, &sprite.h);
  textures_.emplace(path, sprite);
  return sprite;
}

int SpriteCache::preload(const std::vector<std::string>& paths) {
  int missing = 0;
  for (const std::string& p : paths) {
    if (!get(p))
      ++missing;
  }
  return missing;
}

// Sprites are drawn scaled by the resolution unit, so they filter linearly.
SDL_Texture* SpriteCache::loadTexture(const std::string& path) {
  if (!renderer_)
    return nullptr;

  Pixels px;
  if (!decodeFile(path, px))
    return nullptr;

  SDL_Texture* tex = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA32,
                                       SDL_TEXTUREACCESS_STATIC, px.w, px.h);
  if (!tex) {
    std::printf("Sprite: texture %dx%d for %s failed (%s)\n", px.w, px.h, path.c_str(),
                SDL_GetError());
    return nullptr;
  }
  if (!SDL_UpdateTexture(tex, nullptr, px.data, px.w * 4)) {
    std::printf("Sprite: upload of %s failed (%s)\n", path.c_str(), SDL_GetError());
    SDL_DestroyTexture(tex);
    return nullptr;
  }

  (void)SDL_SetTextureScaleMode(tex, SDL_SCALEMODE_LINEAR);
  (void)SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
  return tex;
}
