#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_mouse.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <memory>

namespace {

// SDL key mappings live here and are consumed by both input processing and UI legends.
constexpr SDL_Scancode kPrimaryKey = SDL_SCANCODE_SPACE;
constexpr SDL_Scancode kJumpPrimary = SDL_SCANCODE_UP;
constexpr SDL_Scancode kJumpAlt = SDL_SCANCODE_W;
constexpr SDL_Scancode kConfirmKey = SDL_SCANCODE_RETURN;
constexpr SDL_Scancode kConfirmAltKey = SDL_SCANCODE_KP_ENTER;
constexpr SDL_Scancode kPauseKey = SDL_SCANCODE_P;
constexpr SDL_Scancode kMusicKey = SDL_SCANCODE_M;
constexpr SDL_Scancode kSfxKey = SDL_SCANCODE_N;
constexpr SDL_Scancode kFullscreenKey = SDL_SCANCODE_F11;
constexpr SDL_Scancode kDebugPanelKey = SDL_SCANCODE_F1;
constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_ESCAPE;
constexpr SDL_Scancode kQuitChordKey = SDL_SCANCODE_C;

constexpr SDL_Scancode kCtrlLeft = SDL_SCANCODE_LCTRL;
constexpr SDL_Scancode kCtrlRight = SDL_SCANCODE_RCTRL;

constexpr SDL_GamepadButton kPrimaryButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kPauseButton = SDL_GAMEPAD_BUTTON_START;

const char* prettyScancode(SDL_Scancode sc) {
  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name)
    return "?";
  return name;
}

}  // namespace

void Input::tryOpenFirstGamepad() {
  if (gamepad_)
    return;

  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    SDL_Gamepad* gp = SDL_OpenGamepad(ids.get()[i]);
    if (!gp)
      continue;
    gamepad_ = gp;
    gamepadId_ = ids.get()[i];
    break;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  btnSouth_ = false;
  btnStart_ = false;
}

// NOLINTNEXTLINE
void Input::handleEvent(const SDL_Event& e) {
  switch (e.type) {
    case SDL_EVENT_GAMEPAD_ADDED:
      if (!gamepad_) {
        SDL_Gamepad* gp = SDL_OpenGamepad(e.gdevice.which);
        if (gp) {
          gamepad_ = gp;
          gamepadId_ = e.gdevice.which;
        }
      }
      return;
    case SDL_EVENT_GAMEPAD_REMOVED:
      if (gamepad_ && e.gdevice.which == gamepadId_) {
        SDL_CloseGamepad(gamepad_);
        gamepad_ = nullptr;
        gamepadId_ = 0;
        btnSouth_ = false;
        btnStart_ = false;
        tryOpenFirstGamepad();
      }
      return;
    case SDL_EVENT_GAMEPAD_BUTTON_DOWN:
    case SDL_EVENT_GAMEPAD_BUTTON_UP:
      if (gamepad_ && e.gbutton.which == gamepadId_) {
        onGamepadButton(e.gbutton.button, e.gbutton.down);
      }
      return;
    case SDL_EVENT_MOUSE_BUTTON_DOWN:
      if (!uiMouse_ && e.button.button == SDL_BUTTON_LEFT && e.button.which != SDL_TOUCH_MOUSEID) {
        commands_.primary = true;
      }
      return;
    case SDL_EVENT_FINGER_DOWN:
      if (!uiMouse_) {
        commands_.primary = true;
      }
      return;
    case SDL_EVENT_KEY_DOWN:
    case SDL_EVENT_KEY_UP:
      break;
    default:
      return;
  }

  const int sc = static_cast<int>(e.key.scancode);
  if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
    return;

  onKey(e.key.scancode, e.key.down);
}

void Input::onKey(SDL_Scancode sc, bool down) {
  const bool wasDown = scancodeDown_[sc];
  scancodeDown_[sc] = down;
  if (!down || wasDown)
    return;

  const bool ctrlHeld = scancodeDown_[kCtrlLeft] || scancodeDown_[kCtrlRight];

  // Host commands stay live while a UI widget has keyboard focus.
  if (sc == kQuitKey || (sc == kQuitChordKey && ctrlHeld)) {
    commands_.quit = true;
    return;
  }
  if (sc == kFullscreenKey) {
    commands_.toggleFullscreen = true;
    return;
  }
  if (sc == kDebugPanelKey) {
    commands_.toggleDebugPanel = true;
    return;
  }
  if (uiKeyboard_)
    return;

  if (sc == kPrimaryKey)
    commands_.primary = true;
  else if (sc == kJumpPrimary || sc == kJumpAlt)
    commands_.jump = true;
  else if (sc == kConfirmKey || sc == kConfirmAltKey)
    commands_.confirm = true;
  else if (sc == kPauseKey)
    commands_.pauseToggle = true;
  else if (sc == kMusicKey)
    commands_.toggleMusic = true;
  else if (sc == kSfxKey)
    commands_.toggleSfx = true;
}

void Input::onGamepadButton(uint8_t button, bool down) {
  if (button == kPrimaryButton) {
    if (down && !btnSouth_)
      commands_.primary = true;
    btnSouth_ = down;
  } else if (button == kPauseButton) {
    if (down && !btnStart_)
      commands_.pauseToggle = true;
    btnStart_ = down;
  }
}

const char* Input::gamepadName() const {
  if (!gamepad_)
    return nullptr;
  const char* name = SDL_GetGamepadName(gamepad_);
  if (!name || !*name)
    return nullptr;
  return name;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  out.push_back(std::string("Jump / start: ") + prettyScancode(kPrimaryKey) +
                ", click or tap  (pad: South)");
  out.push_back(std::string("Jump: ") + prettyScancode(kJumpPrimary) + " or " +
                prettyScancode(kJumpAlt));
  out.push_back(std::string("Start / pause: ") + prettyScancode(kConfirmKey) + "  Pause: " +
                prettyScancode(kPauseKey) + "  (pad: Start)");
  out.push_back(std::string("Music: ") + prettyScancode(kMusicKey) + "  Sound: " +
                prettyScancode(kSfxKey));
  out.push_back(std::string("Fullscreen: ") + prettyScancode(kFullscreenKey) + "  Panel: " +
                prettyScancode(kDebugPanelKey));
  out.push_back(std::string("Quit: ") + prettyScancode(kQuitKey) + " or Ctrl-" +
                prettyScancode(kQuitChordKey));
  if (const char* gpName = gamepadName())
    out.push_back(std::string("Gamepad: ") + gpName);
}

GameCommands Input::consumeCommands() {
  GameCommands out = commands_;
  commands_ = GameCommands{};
  return out;
}
