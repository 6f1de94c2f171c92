#pragma once

#include <cstdint>

namespace runner {

// Gameplay tuning. Lengths are in reference pixels at kReferenceHeight and get
// multiplied by the resolution unit u = viewportHeight / referenceHeight,
// except where noted. Defaults match the shipped data/runner.toml.
struct RunnerConfig {
  int version = 0;

  struct World {
    float referenceHeight = 540.0F;
    float groundOffset = 64.0F;            // ground line sits this far above the bottom
    float baseSpeed = 350.0F;              // px/s, unscaled
    float speedRampPerSecond = 4.0F;       // px/s gained per second of play
    float backgroundMinSpeed = 120.0F;     // px/s, unscaled
    float backgroundSpeedRatio = 0.35F;    // of world speed
    float backgroundWrapWidth = 10000.0F;  // used until a backdrop size is known
  } world;

  struct Player {
    float width = 48.0F;
    float height = 64.0F;
    float maxX = 140.0F;     // screen px, unscaled
    float xRatio = 0.22F;    // of viewport width
    float gravity = 2600.0F;
    float jumpVelocity = -900.0F;
    int maxJumps = 2;
    float hitCooldown = 0.6F;  // seconds
  } player;

  struct Hitbox {
    float shrink = 0.1F;  // fraction of w/h removed, split evenly per side
  } hitbox;

  struct Lives {
    int start = 3;
    int max = 6;
  } lives;

  struct Obstacles {
    float smallChance = 0.7F;
    float smallW = 52.0F;
    float smallH = 52.0F;
    float largeW = 92.0F;
    float largeH = 150.0F;
    float spawnOffset = 40.0F;  // past the right edge
    float minGap = 280.0F;
    float initialInterval = 2.1F;
    float rampStart = 2.1F;
    float rampPerSecond = 0.01F;
    float minInterval = 1.1F;
    float maxInterval = 2.4F;
    float jitter = 0.3F;
    float retryFraction = 0.7F;
    float despawnMargin = 40.0F;  // px past the left edge, unscaled
  } obstacles;

  struct Hearts {
    float width = 30.0F;
    float height = 28.0F;
    float initialInterval = 5.5F;
    float startTimer = 2.2F;
    float rerollMin = 5.0F;
    float rerollSpan = 3.5F;
    float chance = 0.6F;
    float windowOffset = 240.0F;
    float windowSpan = 420.0F;
    float liftMin = 80.0F;
    float liftSpan = 70.0F;
    float retryShift = 220.0F;
    int maxRetries = 12;
    float obstacleBuffer = 130.0F;
    float maxAhead = 1000.0F;
  } hearts;

  struct Fireflies {
    float areaPerFly = 40000.0F;  // px^2 per firefly
    int minCount = 30;
    int maxCount = 90;
    float minRadius = 1.0F;
    float radiusSpan = 2.0F;
    float minTwinkle = 0.8F;
    float twinkleSpan = 1.4F;
    float twinkleRate = 2.2F;
    float wrapMargin = 10.0F;
  } fireflies;

  struct Clock {
    int stepHz = 60;
    float maxFrameDt = 0.05F;
  } clock;

  std::uint32_t seed = 0x5EEDU;

  [[nodiscard]] float stepSeconds() const { return 1.0F / static_cast<float>(clock.stepHz); }

  bool loadFromToml(const char* path);
};

}  // namespace runner
