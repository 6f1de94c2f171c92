#pragma once

#include <SDL3/SDL_audio.h>

#include <array>
#include <cstdint>
#include <string>

// WAV effects and looping music over SDL audio streams. Every clip is
// optional: a missing file or device leaves that sound silent.
class Audio {
 public:
  enum class Sfx : uint8_t { Jump, Hit, Pickup, Count };
  enum class Music : uint8_t { None, Title, Gameplay, Count };

  // `dir` holds jump.wav, hit.wav, pickupHeart.wav, titleSong.wav and
  // gameplaySong.wav. Returns false when no playback device could be opened.
  bool init(const std::string& dir);
  void shutdown();

  void play(Sfx sfx);

  // Track that should loop; None stops music.
  void setMusic(Music music);

  void setMusicEnabled(bool on);
  void setSfxEnabled(bool on);
  [[nodiscard]] bool musicEnabled() const { return musicOn_; }
  [[nodiscard]] bool sfxEnabled() const { return sfxOn_; }
  [[nodiscard]] bool deviceOpen() const { return device_ != 0; }

  // Once per frame: keeps the current track queued.
  void update();

 private:
  struct Clip {
    SDL_AudioSpec spec{};
    uint8_t* data = nullptr;
    uint32_t len = 0;
    SDL_AudioStream* stream = nullptr;
  };

  bool loadClip(Clip& clip, const std::string& path, float gain);
  static void freeClip(Clip& clip);
  void restartMusic();

  SDL_AudioDeviceID device_ = 0;
  std::array<Clip, static_cast<std::size_t>(Sfx::Count)> sfx_{};
  std::array<Clip, static_cast<std::size_t>(Music::Count)> music_{};
  Music current_ = Music::None;
  bool musicOn_ = false;
  bool sfxOn_ = true;
};
