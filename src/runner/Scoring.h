#pragma once

namespace runner {

struct RunnerConfig;
struct Session;
class EventQueue;

// Score and lives bookkeeping. Every change is mirrored onto the event queue
// at the moment it happens.
namespace Scoring {

// Fresh session values: score 0, hearts at the configured start.
void reset(Session& s, const RunnerConfig& cfg);

// One point for an obstacle passed cleanly.
void awardPass(Session& s, EventQueue& events);

// Removes one heart (floor 0). Returns true when the hearts just reached 0.
bool loseHeart(Session& s, const RunnerConfig& cfg, EventQueue& events);

// Adds one heart if below the cap. Returns false, changing nothing, at the cap.
bool gainHeart(Session& s, const RunnerConfig& cfg, EventQueue& events);

[[nodiscard]] bool atHeartCap(const Session& s, const RunnerConfig& cfg);

}  // namespace Scoring

}  // namespace runner
