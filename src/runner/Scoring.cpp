#include "runner/Scoring.h"

#include <algorithm>

#include "runner/RunnerEvents.h"
#include "runner/Session.h"
#include "runner/config/RunnerConfig.h"

namespace runner {

void Scoring::reset(Session& s, const RunnerConfig& cfg) {
  s.score = 0;
  s.hearts = cfg.lives.start;
}

void Scoring::awardPass(Session& s, EventQueue& events) {
  ++s.score;
  events.push(GameEventType::ScoreChanged, s.score);
}

bool Scoring::loseHeart(Session& s, const RunnerConfig& cfg, EventQueue& events) {
  s.hearts = std::clamp(s.hearts - 1, 0, cfg.lives.max);
  events.push(GameEventType::HeartsChanged, s.hearts);
  events.push(GameEventType::Hit, s.hearts);
  return s.hearts <= 0;
}

bool Scoring::gainHeart(Session& s, const RunnerConfig& cfg, EventQueue& events) {
  if (atHeartCap(s, cfg)) {
    return false;
  }
  ++s.hearts;
  events.push(GameEventType::HeartsChanged, s.hearts);
  events.push(GameEventType::PickedUp, s.hearts);
  return true;
}

bool Scoring::atHeartCap(const Session& s, const RunnerConfig& cfg) {
  return s.hearts >= cfg.lives.max;
}

}  // namespace runner
