#pragma once

#include <string>

// Player settings that outlive a session. The host owns the file location
// (SDL pref dir); these functions only do the TOML I/O.
struct GamePrefs {
  int highScore = 0;
  bool musicOn = false;
  bool sfxOn = true;
};

// Missing file leaves `out` at its current values and returns false.
bool loadGamePrefs(const std::string& path, GamePrefs& out);
// Writes `path.tmp` then renames it over `path`.
bool saveGamePrefs(const std::string& path, const GamePrefs& prefs);
bool deleteGamePrefs(const std::string& path);

// Keeps the best of the stored high score and `finalScore`.
// Returns true when the stored value went up.
bool recordFinalScore(GamePrefs& prefs, int finalScore);
