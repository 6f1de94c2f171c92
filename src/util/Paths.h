#pragma once

#include <SDL3/SDL.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace Paths {

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Finds `relativePath` next to the working directory, the executable, or
// one level above either. Returns the input unchanged when nothing matches.
inline std::string resolveAssetPath(std::string_view relativePath, const char* argv0 = nullptr) {
  namespace fs = std::filesystem;

  fs::path rel(relativePath);
  if (rel.empty() || rel.is_absolute() || pathExists(rel)) {
    return rel.string();
  }

  const auto tryBase = [&rel](const fs::path& base, std::string& out) {
    for (const fs::path& candidate : {base / rel, base / ".." / rel}) {
      if (pathExists(candidate)) {
        out = candidate.lexically_normal().string();
        return true;
      }
    }
    return false;
  };

  std::string found;
  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    const fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec && tryBase(exe.parent_path(), found)) {
      return found;
    }
  }

  const char* basePathC = SDL_GetBasePath();
  if ((basePathC != nullptr) && (*basePathC != 0) && tryBase(fs::path(basePathC), found)) {
    return found;
  }

  return rel.string();
}

// Per-user writable directory for settings and the ImGui layout, with a
// trailing separator. Empty when SDL cannot provide one.
inline std::string prefDir() {
  std::string path;
  if (char* prefPath = SDL_GetPrefPath("glimmerwood", "dash")) {
    path = std::string(prefPath);
    SDL_free(prefPath);
  }
  return path;
}

}  // namespace Paths
