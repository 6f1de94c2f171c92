#include "runner/config/RunnerConfig.h"

#include <algorithm>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace runner {

namespace {

using TomlUtil::readFloat;
using TomlUtil::readInt;

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

float clampUnit(float v) {
  return std::clamp(v, 0.0F, 1.0F);
}

void sanitize(RunnerConfig& c) {
  c.world.referenceHeight = std::max(1.0F, c.world.referenceHeight);
  c.world.groundOffset = clampNonNegative(c.world.groundOffset);
  c.world.baseSpeed = clampNonNegative(c.world.baseSpeed);
  c.world.speedRampPerSecond = clampNonNegative(c.world.speedRampPerSecond);
  c.world.backgroundMinSpeed = clampNonNegative(c.world.backgroundMinSpeed);
  c.world.backgroundSpeedRatio = clampNonNegative(c.world.backgroundSpeedRatio);
  c.world.backgroundWrapWidth = std::max(1.0F, c.world.backgroundWrapWidth);

  c.player.width = clampNonNegative(c.player.width);
  c.player.height = clampNonNegative(c.player.height);
  c.player.maxX = clampNonNegative(c.player.maxX);
  c.player.xRatio = clampUnit(c.player.xRatio);
  c.player.gravity = clampNonNegative(c.player.gravity);
  c.player.jumpVelocity = std::min(0.0F, c.player.jumpVelocity);
  c.player.maxJumps = std::max(0, c.player.maxJumps);
  c.player.hitCooldown = clampNonNegative(c.player.hitCooldown);

  c.hitbox.shrink = std::clamp(c.hitbox.shrink, 0.0F, 0.95F);

  c.lives.max = std::max(1, c.lives.max);
  c.lives.start = std::clamp(c.lives.start, 1, c.lives.max);

  auto& o = c.obstacles;
  o.smallChance = clampUnit(o.smallChance);
  o.smallW = clampNonNegative(o.smallW);
  o.smallH = clampNonNegative(o.smallH);
  o.largeW = clampNonNegative(o.largeW);
  o.largeH = clampNonNegative(o.largeH);
  o.spawnOffset = clampNonNegative(o.spawnOffset);
  o.minGap = clampNonNegative(o.minGap);
  o.initialInterval = clampNonNegative(o.initialInterval);
  o.rampPerSecond = clampNonNegative(o.rampPerSecond);
  o.minInterval = clampNonNegative(o.minInterval);
  o.maxInterval = std::max(o.minInterval, o.maxInterval);
  o.jitter = clampNonNegative(o.jitter);
  o.retryFraction = clampUnit(o.retryFraction);
  o.despawnMargin = clampNonNegative(o.despawnMargin);

  auto& h = c.hearts;
  h.width = clampNonNegative(h.width);
  h.height = clampNonNegative(h.height);
  h.initialInterval = clampNonNegative(h.initialInterval);
  h.startTimer = clampNonNegative(h.startTimer);
  h.rerollMin = clampNonNegative(h.rerollMin);
  h.rerollSpan = clampNonNegative(h.rerollSpan);
  h.chance = clampUnit(h.chance);
  h.windowOffset = clampNonNegative(h.windowOffset);
  h.windowSpan = clampNonNegative(h.windowSpan);
  h.liftMin = clampNonNegative(h.liftMin);
  h.liftSpan = clampNonNegative(h.liftSpan);
  h.retryShift = clampNonNegative(h.retryShift);
  h.maxRetries = std::max(0, h.maxRetries);
  h.obstacleBuffer = clampNonNegative(h.obstacleBuffer);
  h.maxAhead = clampNonNegative(h.maxAhead);

  auto& f = c.fireflies;
  f.areaPerFly = std::max(1.0F, f.areaPerFly);
  f.minCount = std::max(0, f.minCount);
  f.maxCount = std::max(f.minCount, f.maxCount);
  f.minRadius = clampNonNegative(f.minRadius);
  f.radiusSpan = clampNonNegative(f.radiusSpan);
  f.minTwinkle = clampNonNegative(f.minTwinkle);
  f.twinkleSpan = clampNonNegative(f.twinkleSpan);
  f.twinkleRate = clampNonNegative(f.twinkleRate);
  f.wrapMargin = clampNonNegative(f.wrapMargin);

  c.clock.stepHz = std::clamp(c.clock.stepHz, 1, 1000);
  c.clock.maxFrameDt = std::max(c.stepSeconds(), c.clock.maxFrameDt);
}

}  // namespace

// NOLINTNEXTLINE
bool RunnerConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(path, "parse error: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "seed", "world", "player", "hitbox", "lives",
                             "obstacles", "hearts", "fireflies", "clock"});

  RunnerConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;
  if (auto v = tbl["seed"].value<int64_t>())
    next.seed = static_cast<std::uint32_t>(*v);

  if (auto t = tbl["world"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "world",
                              {"reference_height", "ground_offset", "base_speed",
                               "speed_ramp_per_second", "background_min_speed",
                               "background_speed_ratio", "background_wrap_width"});
    readFloat(*t, "reference_height", next.world.referenceHeight, path, "world");
    readFloat(*t, "ground_offset", next.world.groundOffset, path, "world");
    readFloat(*t, "base_speed", next.world.baseSpeed, path, "world");
    readFloat(*t, "speed_ramp_per_second", next.world.speedRampPerSecond, path, "world");
    readFloat(*t, "background_min_speed", next.world.backgroundMinSpeed, path, "world");
    readFloat(*t, "background_speed_ratio", next.world.backgroundSpeedRatio, path, "world");
    readFloat(*t, "background_wrap_width", next.world.backgroundWrapWidth, path, "world");
  }

  if (auto t = tbl["player"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "player",
                              {"width", "height", "max_x", "x_ratio", "gravity",
                               "jump_velocity", "max_jumps", "hit_cooldown"});
    readFloat(*t, "width", next.player.width, path, "player");
    readFloat(*t, "height", next.player.height, path, "player");
    readFloat(*t, "max_x", next.player.maxX, path, "player");
    readFloat(*t, "x_ratio", next.player.xRatio, path, "player");
    readFloat(*t, "gravity", next.player.gravity, path, "player");
    readFloat(*t, "jump_velocity", next.player.jumpVelocity, path, "player");
    readInt(*t, "max_jumps", next.player.maxJumps, path, "player");
    readFloat(*t, "hit_cooldown", next.player.hitCooldown, path, "player");
  }

  if (auto t = tbl["hitbox"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "hitbox", {"shrink"});
    readFloat(*t, "shrink", next.hitbox.shrink, path, "hitbox");
  }

  if (auto t = tbl["lives"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "lives", {"start", "max"});
    readInt(*t, "start", next.lives.start, path, "lives");
    readInt(*t, "max", next.lives.max, path, "lives");
  }

  if (auto t = tbl["obstacles"].as_table()) {
    TomlUtil::warnUnknownKeys(
        *t, path, "obstacles",
        {"small_chance", "small_w", "small_h", "large_w", "large_h", "spawn_offset", "min_gap",
         "initial_interval", "ramp_start", "ramp_per_second", "min_interval", "max_interval",
         "jitter", "retry_fraction", "despawn_margin"});
    auto& o = next.obstacles;
    readFloat(*t, "small_chance", o.smallChance, path, "obstacles");
    readFloat(*t, "small_w", o.smallW, path, "obstacles");
    readFloat(*t, "small_h", o.smallH, path, "obstacles");
    readFloat(*t, "large_w", o.largeW, path, "obstacles");
    readFloat(*t, "large_h", o.largeH, path, "obstacles");
    readFloat(*t, "spawn_offset", o.spawnOffset, path, "obstacles");
    readFloat(*t, "min_gap", o.minGap, path, "obstacles");
    readFloat(*t, "initial_interval", o.initialInterval, path, "obstacles");
    readFloat(*t, "ramp_start", o.rampStart, path, "obstacles");
    readFloat(*t, "ramp_per_second", o.rampPerSecond, path, "obstacles");
    readFloat(*t, "min_interval", o.minInterval, path, "obstacles");
    readFloat(*t, "max_interval", o.maxInterval, path, "obstacles");
    readFloat(*t, "jitter", o.jitter, path, "obstacles");
    readFloat(*t, "retry_fraction", o.retryFraction, path, "obstacles");
    readFloat(*t, "despawn_margin", o.despawnMargin, path, "obstacles");
  }

  if (auto t = tbl["hearts"].as_table()) {
    TomlUtil::warnUnknownKeys(
        *t, path, "hearts",
        {"width", "height", "initial_interval", "start_timer", "reroll_min", "reroll_span",
         "chance", "window_offset", "window_span", "lift_min", "lift_span", "retry_shift",
         "max_retries", "obstacle_buffer", "max_ahead"});
    auto& h = next.hearts;
    readFloat(*t, "width", h.width, path, "hearts");
    readFloat(*t, "height", h.height, path, "hearts");
    readFloat(*t, "initial_interval", h.initialInterval, path, "hearts");
    readFloat(*t, "start_timer", h.startTimer, path, "hearts");
    readFloat(*t, "reroll_min", h.rerollMin, path, "hearts");
    readFloat(*t, "reroll_span", h.rerollSpan, path, "hearts");
    readFloat(*t, "chance", h.chance, path, "hearts");
    readFloat(*t, "window_offset", h.windowOffset, path, "hearts");
    readFloat(*t, "window_span", h.windowSpan, path, "hearts");
    readFloat(*t, "lift_min", h.liftMin, path, "hearts");
    readFloat(*t, "lift_span", h.liftSpan, path, "hearts");
    readFloat(*t, "retry_shift", h.retryShift, path, "hearts");
    readInt(*t, "max_retries", h.maxRetries, path, "hearts");
    readFloat(*t, "obstacle_buffer", h.obstacleBuffer, path, "hearts");
    readFloat(*t, "max_ahead", h.maxAhead, path, "hearts");
  }

  if (auto t = tbl["fireflies"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "fireflies",
                              {"area_per_fly", "min_count", "max_count", "min_radius",
                               "radius_span", "min_twinkle", "twinkle_span", "twinkle_rate",
                               "wrap_margin"});
    auto& f = next.fireflies;
    readFloat(*t, "area_per_fly", f.areaPerFly, path, "fireflies");
    readInt(*t, "min_count", f.minCount, path, "fireflies");
    readInt(*t, "max_count", f.maxCount, path, "fireflies");
    readFloat(*t, "min_radius", f.minRadius, path, "fireflies");
    readFloat(*t, "radius_span", f.radiusSpan, path, "fireflies");
    readFloat(*t, "min_twinkle", f.minTwinkle, path, "fireflies");
    readFloat(*t, "twinkle_span", f.twinkleSpan, path, "fireflies");
    readFloat(*t, "twinkle_rate", f.twinkleRate, path, "fireflies");
    readFloat(*t, "wrap_margin", f.wrapMargin, path, "fireflies");
  }

  if (auto t = tbl["clock"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "clock", {"step_hz", "max_frame_dt"});
    readInt(*t, "step_hz", next.clock.stepHz, path, "clock");
    readFloat(*t, "max_frame_dt", next.clock.maxFrameDt, path, "clock");
  }

  sanitize(next);
  *this = std::move(next);
  return true;
}

}  // namespace runner
