#include "core/InputScript.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

void readButton(const toml::table& t,
                const char* key,
                uint32_t bit,
                bool& value,
                uint32_t& mask,
                const char* path,
                const std::string& scope) {
  const toml::node* node = t.get(key);
  if (!node)
    return;
  if (auto v = node->value<bool>()) {
    value = *v;
    mask |= bit;
    return;
  }
  TomlUtil::warnf(path, "{}.{} must be a boolean", scope, key);
}

}  // namespace

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(pathStr.c_str(), "parse error: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root", {"version", "keyframes", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(pathStr.c_str(), "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    const std::filesystem::path includePath = normalized.parent_path() / *include;
    if (!appendFromToml(includePath, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(pathStr.c_str(), "include must be a string path");
  }

  const toml::array* framesArr = tbl["keyframes"].as_array();
  if (!framesArr) {
    return true;
  }

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    const std::string scope = "keyframes[" + std::to_string(idx) + "]";
    ++idx;
    const auto* t = node.as_table();
    if (!t) {
      TomlUtil::warnf(pathStr.c_str(), "{} is not a table", scope);
      continue;
    }

    TomlUtil::warnUnknownKeys(*t, pathStr.c_str(), scope,
                              {"frame", "primary", "jump", "start", "pause"});

    int64_t f = -1;
    if (const toml::node* fn = t->get("frame"))
      f = fn->value_or(int64_t{-1});
    if (f < 0) {
      TomlUtil::warnf(pathStr.c_str(), "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<uint64_t>(f);
    readButton(*t, "primary", kPrimary, kf.values.primary, kf.mask, pathStr.c_str(), scope);
    readButton(*t, "jump", kJump, kf.values.jump, kf.mask, pathStr.c_str(), scope);
    readButton(*t, "start", kStart, kf.values.start, kf.mask, pathStr.c_str(), scope);
    readButton(*t, "pause", kPause, kf.values.pause, kf.mask, pathStr.c_str(), scope);
    keyframes_.push_back(kf);
  }

  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  reset();
  loaded_ = false;
  path_ = path ? path : "";

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    keyframes_.clear();
    return false;
  }

  // Included files come first; stable sort keeps that order within a frame.
  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });

  loaded_ = true;
  return true;
}

void InputScript::reset() {
  held_ = Held{};
  prevHeld_ = Held{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

uint64_t InputScript::lastKeyframe() const {
  return keyframes_.empty() ? 0 : keyframes_.back().frame;
}

GameCommands InputScript::sample(uint64_t frame) {
  if (!loaded_)
    return GameCommands{};

  if (!hasLastFrame_ || frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    if ((kf.mask & kPrimary) != 0U)
      held_.primary = kf.values.primary;
    if ((kf.mask & kJump) != 0U)
      held_.jump = kf.values.jump;
    if ((kf.mask & kStart) != 0U)
      held_.start = kf.values.start;
    if ((kf.mask & kPause) != 0U)
      held_.pause = kf.values.pause;
    ++nextIndex_;
  }

  GameCommands out{};
  out.primary = held_.primary && !prevHeld_.primary;
  out.jump = held_.jump && !prevHeld_.jump;
  out.start = held_.start && !prevHeld_.start;
  out.pauseToggle = held_.pause && !prevHeld_.pause;

  prevHeld_ = held_;
  lastFrame_ = frame;
  hasLastFrame_ = true;
  return out;
}
