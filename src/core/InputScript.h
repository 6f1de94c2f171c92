#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/Commands.h"

// Replays held-button keyframes from TOML by simulation frame. A keyframe only
// changes the buttons it names; the rest keep their previous value. Commands
// fire on each false-to-true change.
class InputScript {
 public:
  bool loadFromToml(const char* path);
  void reset();
  GameCommands sample(uint64_t frame);

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }
  // Frame of the last keyframe, 0 when empty.
  [[nodiscard]] uint64_t lastKeyframe() const;

 private:
  struct Held {
    bool primary = false;
    bool jump = false;
    bool start = false;
    bool pause = false;
  };

  enum MaskBits : uint32_t {
    kPrimary = 1U << 0U,
    kJump = 1U << 1U,
    kStart = 1U << 2U,
    kPause = 1U << 3U,
  };

  struct Keyframe {
    uint64_t frame = 0;
    uint32_t mask = 0;
    Held values{};
  };

  bool appendFromToml(const std::filesystem::path& path, std::unordered_set<std::string>& seen);

  std::vector<Keyframe> keyframes_;
  Held held_{};
  Held prevHeld_{};
  std::size_t nextIndex_ = 0;
  uint64_t lastFrame_ = 0;
  bool hasLastFrame_ = false;
  bool loaded_ = false;
  std::string path_;
};
