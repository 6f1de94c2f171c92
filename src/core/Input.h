#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/Commands.h"

// Maps keyboard, pointer, touch and gamepad events onto edge-triggered
// GameCommands. Key repeat never re-fires a command.
class Input {
 public:
  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  // Set while an ImGui window wants the device; pointer presses are then
  // left to the UI.
  void setUiCapture(bool keyboard, bool mouse) {
    uiKeyboard_ = keyboard;
    uiMouse_ = mouse;
  }

  [[nodiscard]] const char* gamepadName() const;
  void appendLegend(std::vector<std::string>& out) const;

  // Commands gathered since the previous call.
  GameCommands consumeCommands();

 private:
  void onKey(SDL_Scancode sc, bool down);
  void onGamepadButton(uint8_t button, bool down);
  void tryOpenFirstGamepad();

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  GameCommands commands_{};

  SDL_Gamepad* gamepad_ = nullptr;
  uint32_t gamepadId_ = 0;
  bool btnSouth_ = false;
  bool btnStart_ = false;

  bool uiKeyboard_ = false;
  bool uiMouse_ = false;
};
