#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace {

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--frames N] [--video-driver NAME] [--width W] [--height H]\n"
      "       [--config PATH] [--seed S] [--input-script PATH] [--assets DIR]\n"
      "       [--no-prefs] [--no-audio] [--no-ui] [--log-events]\n",
      argv0);
  std::printf("  --frames N           Run N frames then exit (smoke test)\n");
  std::printf("  --video-driver NAME  Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  --width W            Window width (default: 1280)\n");
  std::printf("  --height H           Window height (default: 720)\n");
  std::printf("  --config PATH        Gameplay tuning TOML (default: data/runner.toml)\n");
  std::printf("  --seed S             Gameplay random seed (overrides the config)\n");
  std::printf("  --input-script PATH  Replay a TOML input script, one step per frame\n");
  std::printf("  --assets DIR         Directory with images/ and music/ (default: assets)\n");
  std::printf("  --no-prefs           Do not read or write settings.toml\n");
  std::printf("  --no-audio           Skip audio device setup\n");
  std::printf("  --no-ui              Disable the ImGui panel\n");
  std::printf("  --log-events         Print game events as they happen\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < 1 || v > 100000)
    return false;
  out = static_cast<int>(v);
  return true;
}

bool parseSeed(const char* s, uint32_t& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 0);
  if (!end || *end != '\0' || v > 0xFFFFFFFFULL)
    return false;
  out = static_cast<uint32_t>(v);
  return true;
}

}  // namespace

// NOLINTNEXTLINE
int main(int argc, char** argv) {
  AppConfig cfg{};
  cfg.argv0 = argv[0];
  const char* videoDriver = nullptr;

  const auto needValue = [&](int i, const char* flag) {
    if (i + 1 < argc)
      return true;
    std::printf("missing %s value\n", flag);
    usage(argv[0]);
    return false;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--frames") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.maxFrames)) {
        std::printf("invalid --frames value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--video-driver") {
      if (!needValue(i, "--video-driver"))
        return 1;
      videoDriver = argv[++i];
    } else if (arg == "--width") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.width)) {
        std::printf("invalid --width value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--height") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.height)) {
        std::printf("invalid --height value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--config") {
      if (!needValue(i, "--config"))
        return 1;
      cfg.configPath = argv[++i];
    } else if (arg == "--seed") {
      if (i + 1 >= argc || !parseSeed(argv[i + 1], cfg.seed)) {
        std::printf("invalid --seed value\n");
        usage(argv[0]);
        return 1;
      }
      cfg.seedOverride = true;
      ++i;
    } else if (arg == "--input-script") {
      if (!needValue(i, "--input-script"))
        return 1;
      cfg.inputScriptPath = argv[++i];
    } else if (arg == "--assets") {
      if (!needValue(i, "--assets"))
        return 1;
      cfg.assetsDir = argv[++i];
    } else if (arg == "--no-prefs") {
      cfg.noPrefs = true;
    } else if (arg == "--no-audio") {
      cfg.noAudio = true;
    } else if (arg == "--no-ui") {
      cfg.noUi = true;
    } else if (arg == "--log-events") {
      cfg.logEvents = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

  App app;
  if (!app.init(cfg)) {
    app.shutdown();
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
}
