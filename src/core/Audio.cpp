#include "core/Audio.h"

#include <SDL3/SDL_audio.h>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_stdinc.h>

#include <cstdio>

namespace {

constexpr float kMusicGain = 0.6F;
constexpr float kSfxGain = 0.8F;

std::size_t idx(Audio::Sfx s) {
  return static_cast<std::size_t>(s);
}

std::size_t idx(Audio::Music m) {
  return static_cast<std::size_t>(m);
}

}  // namespace

bool Audio::loadClip(Clip& clip, const std::string& path, float gain) {
  if (!SDL_LoadWAV(path.c_str(), &clip.spec, &clip.data, &clip.len)) {
    std::printf("Audio: %s not loaded (%s)\n", path.c_str(), SDL_GetError());
    return false;
  }

  // Destination format is filled in by the device on bind.
  clip.stream = SDL_CreateAudioStream(&clip.spec, nullptr);
  if (!clip.stream || !SDL_BindAudioStream(device_, clip.stream)) {
    std::printf("Audio: stream for %s failed (%s)\n", path.c_str(), SDL_GetError());
    freeClip(clip);
    return false;
  }
  (void)SDL_SetAudioStreamGain(clip.stream, gain);
  return true;
}

void Audio::freeClip(Clip& clip) {
  if (clip.stream) {
    SDL_DestroyAudioStream(clip.stream);
    clip.stream = nullptr;
  }
  if (clip.data) {
    SDL_free(clip.data);
    clip.data = nullptr;
  }
  clip.len = 0;
}

bool Audio::init(const std::string& dir) {
  device_ = SDL_OpenAudioDevice(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, nullptr);
  if (device_ == 0) {
    std::printf("SDL_OpenAudioDevice failed: %s\n", SDL_GetError());
    return false;
  }

  const std::string base = dir.empty() ? std::string() : dir + "/";
  int loaded = 0;
  loaded += loadClip(sfx_[idx(Sfx::Jump)], base + "jump.wav", kSfxGain) ? 1 : 0;
  loaded += loadClip(sfx_[idx(Sfx::Hit)], base + "hit.wav", kSfxGain) ? 1 : 0;
  loaded += loadClip(sfx_[idx(Sfx::Pickup)], base + "pickupHeart.wav", kSfxGain) ? 1 : 0;
  loaded += loadClip(music_[idx(Music::Title)], base + "titleSong.wav", kMusicGain) ? 1 : 0;
  loaded += loadClip(music_[idx(Music::Gameplay)], base + "gameplaySong.wav", kMusicGain) ? 1 : 0;
  std::printf("Audio: %d/5 clips from %s\n", loaded, dir.c_str());
  return true;
}

void Audio::shutdown() {
  for (Clip& c : sfx_)
    freeClip(c);
  for (Clip& c : music_)
    freeClip(c);
  if (device_ != 0) {
    SDL_CloseAudioDevice(device_);
    device_ = 0;
  }
  current_ = Music::None;
}

void Audio::play(Sfx sfx) {
  if (!sfxOn_ || sfx == Sfx::Count)
    return;
  Clip& clip = sfx_[idx(sfx)];
  if (!clip.stream)
    return;
  // Retrigger from the start, dropping whatever of the last play is left.
  (void)SDL_ClearAudioStream(clip.stream);
  (void)SDL_PutAudioStreamData(clip.stream, clip.data, static_cast<int>(clip.len));
}

void Audio::setMusic(Music music) {
  if (music == current_ || music == Music::Count)
    return;
  if (Clip& old = music_[idx(current_)]; old.stream)
    (void)SDL_ClearAudioStream(old.stream);
  current_ = music;
  restartMusic();
}

void Audio::setMusicEnabled(bool on) {
  if (on == musicOn_)
    return;
  musicOn_ = on;
  if (!on) {
    for (Clip& c : music_) {
      if (c.stream)
        (void)SDL_ClearAudioStream(c.stream);
    }
    return;
  }
  restartMusic();
}

void Audio::setSfxEnabled(bool on) {
  sfxOn_ = on;
  if (on)
    return;
  for (Clip& c : sfx_) {
    if (c.stream)
      (void)SDL_ClearAudioStream(c.stream);
  }
}

void Audio::restartMusic() {
  if (!musicOn_ || current_ == Music::None)
    return;
  Clip& clip = music_[idx(current_)];
  if (!clip.stream)
    return;
  (void)SDL_ClearAudioStream(clip.stream);
  (void)SDL_PutAudioStreamData(clip.stream, clip.data, static_cast<int>(clip.len));
}

void Audio::update() {
  if (!musicOn_ || current_ == Music::None)
    return;
  Clip& clip = music_[idx(current_)];
  if (!clip.stream)
    return;
  // Queue the next loop before the current one drains.
  const int queued = SDL_GetAudioStreamQueued(clip.stream);
  if (queued >= 0 && static_cast<uint32_t>(queued) < clip.len / 2) {
    (void)SDL_PutAudioStreamData(clip.stream, clip.data, static_cast<int>(clip.len));
  }
}
