#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "action_result.h"
#include "talon_cancel_scope.h"
#include "talon_protocol_client.h"

namespace talon {

class Keyboard;

enum class MouseButton {
  NONE,
  LEFT,
  MIDDLE,
  RIGHT,
  BACK,
  FORWARD
};

// Protocol name of the button ("left", "right", ...)
const char* MouseButtonToString(MouseButton button);

// Bit used in the protocol's "buttons" field
int MouseButtonFlag(MouseButton button);

// Encode a pressed sequence: |primary| is the first pressed button (NONE when
// empty), the returned mask ORs every button's flag.
int EncodeMouseButtons(const std::vector<MouseButton>& pressed, MouseButton& primary);

struct MousePosition {
  int x = 0;
  int y = 0;
};

// Pointer controller for one page (always the main frame's session).
//
// Every operation holds the controller's lock for its whole duration, so
// gestures from different threads never interleave. State is committed only
// after the corresponding dispatch succeeds. Nothing is rolled back: if Down
// succeeds and Up fails, the remote button stays pressed.
class Mouse {
public:
  // |keyboard| supplies modifier state and may be null. Neither pointer is owned.
  Mouse(ProtocolClient* client, std::string session_id, const Keyboard* keyboard);

  Mouse(const Mouse&) = delete;
  Mouse& operator=(const Mouse&) = delete;

  // Move in |steps| equal strides. The stride is computed once with
  // truncating division, so an indivisible delta stops short of the target
  // by less than |steps| units per axis.
  ActionResult Move(const CancelScope& scope, int x, int y, int steps = 1);

  // Press |button|. The button is appended even if already pressed.
  ActionResult Down(const CancelScope& scope, MouseButton button, int click_count = 1);

  // Release |button|. Every occurrence is removed from the pressed sequence.
  ActionResult Up(const CancelScope& scope, MouseButton button, int click_count = 1);

  // Down then Up with click count 1. A failed Up is returned as is.
  ActionResult Click(const CancelScope& scope, MouseButton button = MouseButton::LEFT);

  // Locked snapshots
  MousePosition Position() const;
  std::vector<MouseButton> PressedButtons() const;

private:
  ActionResult Dispatch(const CancelScope& scope, const json& params);
  int Modifiers() const;

  ProtocolClient* client_;
  std::string session_id_;
  const Keyboard* keyboard_;

  mutable std::mutex mutex_;
  int x_ = 0;
  int y_ = 0;
  std::vector<MouseButton> buttons_;  // press order
};

}  // namespace talon
