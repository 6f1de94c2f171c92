#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "runner/Session.h"

namespace runner {

enum class GameEventType : std::uint8_t {
  ScoreChanged,   // value = new score
  HeartsChanged,  // value = new heart count
  GameOver,       // value = final score
  StateChanged,   // from -> to
  Jumped,
  Hit,
  PickedUp,
};

const char* gameEventName(GameEventType t);

struct GameEvent {
  GameEventType type = GameEventType::StateChanged;
  int value = 0;
  GameState from = GameState::Title;
  GameState to = GameState::Title;
};

// Outbound messages enqueued by the engine in the order they happen and
// drained by the host after each frame.
class EventQueue {
 public:
  void push(GameEventType type, int value = 0) { events_.push_back(GameEvent{type, value}); }

  void pushTransition(GameState from, GameState to) {
    GameEvent e;
    e.type = GameEventType::StateChanged;
    e.from = from;
    e.to = to;
    events_.push_back(e);
  }

  std::vector<GameEvent> drain() { return std::exchange(events_, {}); }

  [[nodiscard]] const std::vector<GameEvent>& pending() const { return events_; }
  void clear() { events_.clear(); }

 private:
  std::vector<GameEvent> events_;
};

}  // namespace runner
