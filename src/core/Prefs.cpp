#include "core/Prefs.h"

#include <toml++/toml.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "util/TomlUtil.h"

bool loadGamePrefs(const std::string& path, GamePrefs& out) {
  if (path.empty())
    return false;

  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec))
    return false;

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(path.c_str(), "parse error: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path.c_str(), "root",
                            {"version", "high_score", "music_on", "sfx_on"});

  GamePrefs next = out;
  TomlUtil::readInt(tbl, "high_score", next.highScore, path.c_str(), "root");
  TomlUtil::readBool(tbl, "music_on", next.musicOn, path.c_str(), "root");
  TomlUtil::readBool(tbl, "sfx_on", next.sfxOn, path.c_str(), "root");
  if (next.highScore < 0)
    next.highScore = 0;

  out = next;
  return true;
}

bool deleteGamePrefs(const std::string& path) {
  if (path.empty())
    return false;

  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec))
    return true;
  (void)fs::remove(path, ec);
  return !ec;
}

bool saveGamePrefs(const std::string& path, const GamePrefs& prefs) {
  if (path.empty())
    return false;

  toml::table tbl;
  tbl.insert("version", 1);
  tbl.insert("high_score", static_cast<int64_t>(prefs.highScore));
  tbl.insert("music_on", prefs.musicOn);
  tbl.insert("sfx_on", prefs.sfxOn);

  namespace fs = std::filesystem;
  const fs::path outPath(path);
  const fs::path tmpPath = outPath.string() + ".tmp";

  std::ofstream tmp(tmpPath, std::ios::binary | std::ios::trunc);
  if (!tmp.is_open())
    return false;
  tmp << tbl << '\n';
  tmp.close();
  if (!tmp)
    return false;

  std::error_code ec;
  fs::rename(tmpPath, outPath, ec);
  if (ec) {
    fs::remove(tmpPath, ec);
    return false;
  }

  return true;
}

bool recordFinalScore(GamePrefs& prefs, int finalScore) {
  if (finalScore <= prefs.highScore)
    return false;
  prefs.highScore = finalScore;
  return true;
}
