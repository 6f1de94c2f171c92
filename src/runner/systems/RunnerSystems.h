#pragma once

#include <vector>

#include "ecs/Entity.h"

class World;
struct TimeStep;

namespace util {
class Rng;
}

namespace runner {

struct RunnerConfig;
struct Session;
struct Metrics;
class EventQueue;

// Per-step systems for the runner. RunnerGame::step calls them in a fixed
// order; see RunnerGame.cpp.
namespace RunnerSystems {

// Derive resolution unit, gravity, jump impulse, ground line and spacing
// from the viewport size.
Metrics computeMetrics(const RunnerConfig& cfg, int viewW, int viewH);

// Create the player resting on the ground line.
EntityId spawnPlayer(World& w, const Session& s, const RunnerConfig& cfg);

// Replace all fireflies with a fresh field sized to the viewport.
void spawnFireflies(World& w, const Session& s, const RunnerConfig& cfg, util::Rng& rng);

// Move ground-relative entities onto a new ground line after a resize.
void anchorToGround(World& w, const Session& s, float previousGroundY);

// World clock, firefly twinkle (every state); background and firefly drift
// (Playing only).
void decorations(World& w, Session& s, const RunnerConfig& cfg, TimeStep ts);

// Hit cooldown decays in every state.
void cooldowns(World& w, TimeStep ts);

// Scroll speed from elapsed play time.
void difficulty(Session& s, const RunnerConfig& cfg, TimeStep ts);

// Gravity, ground clamp and jump replenish on landing.
void playerPhysics(World& w, const Session& s, const RunnerConfig& cfg, TimeStep ts);

// Apply a jump request. Returns false when no jumps remain.
bool tryJump(World& w, const Session& s, EventQueue& events);

// Translate obstacles and pickups left by one step of world scroll.
void scrollWorld(World& w, const Session& s, TimeStep ts);

// Obstacles in spawn order. Hits and scoring passes. Returns true when the
// hearts reached zero; processing stops at that obstacle.
bool obstacleCollisions(World& w, Session& s, const RunnerConfig& cfg, EventQueue& events);

// Heart pickups. At the cap an overlapping pickup stays on the field.
void pickupCollisions(World& w, Session& s, const RunnerConfig& cfg, EventQueue& events);

// Destroy flagged entities and those fully past the left edge.
void cleanup(World& w, const RunnerConfig& cfg);

// Obstacle entities sorted by spawn serial.
std::vector<EntityId> obstaclesInSpawnOrder(const World& w);

}  // namespace RunnerSystems

}  // namespace runner
