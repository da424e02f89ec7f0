#include "talon_touch.h"
#include "talon_keyboard.h"

namespace talon {

ProtocolTouch::ProtocolTouch(ProtocolClient* client, std::string session_id, const Keyboard* keyboard)
    : client_(client), session_id_(std::move(session_id)), keyboard_(keyboard) {}

ActionResult ProtocolTouch::Tap(const CancelScope& scope, int x, int y) {
  int modifiers = keyboard_ ? keyboard_->Modifiers() : 0;
  json ignored;

  json point = {{"x", x}, {"y", y}};
  json start = {
    {"type", "touchStart"},
    {"touchPoints", json::array({point})},
    {"modifiers", modifiers}
  };
  ActionResult result = client_->Call(scope, session_id_, "Input.dispatchTouchEvent", start, ignored);
  if (!result.success) {
    return result;
  }

  json end = {
    {"type", "touchEnd"},
    {"touchPoints", json::array()},
    {"modifiers", modifiers}
  };
  return client_->Call(scope, session_id_, "Input.dispatchTouchEvent", end, ignored);
}

}  // namespace talon
