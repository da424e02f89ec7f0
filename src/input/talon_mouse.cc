#include "talon_mouse.h"
#include <algorithm>
#include <cstdint>
#include <iterator>
#include "logger.h"
#include "talon_keyboard.h"

namespace talon {

const char* MouseButtonToString(MouseButton button) {
  switch (button) {
    case MouseButton::NONE: return "none";
    case MouseButton::LEFT: return "left";
    case MouseButton::MIDDLE: return "middle";
    case MouseButton::RIGHT: return "right";
    case MouseButton::BACK: return "back";
    case MouseButton::FORWARD: return "forward";
    default: return "none";
  }
}

int MouseButtonFlag(MouseButton button) {
  switch (button) {
    case MouseButton::LEFT: return 1;
    case MouseButton::RIGHT: return 2;
    case MouseButton::MIDDLE: return 4;
    case MouseButton::BACK: return 8;
    case MouseButton::FORWARD: return 16;
    default: return 0;
  }
}

int EncodeMouseButtons(const std::vector<MouseButton>& pressed, MouseButton& primary) {
  int flags = 0;
  for (MouseButton button : pressed) {
    flags |= MouseButtonFlag(button);
  }
  primary = pressed.empty() ? MouseButton::NONE : pressed.front();
  return flags;
}

Mouse::Mouse(ProtocolClient* client, std::string session_id, const Keyboard* keyboard)
    : client_(client), session_id_(std::move(session_id)), keyboard_(keyboard) {}

int Mouse::Modifiers() const {
  return keyboard_ ? keyboard_->Modifiers() : 0;
}

ActionResult Mouse::Dispatch(const CancelScope& scope, const json& params) {
  json ignored;
  return client_->Call(scope, session_id_, "Input.dispatchMouseEvent", params, ignored);
}

ActionResult Mouse::Move(const CancelScope& scope, int x, int y, int steps) {
  if (steps < 1) {
    steps = 1;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  // Computed once; not corrected on the last step
  int64_t step_x = (static_cast<int64_t>(x) - x_) / steps;
  int64_t step_y = (static_cast<int64_t>(y) - y_) / steps;

  MouseButton primary;
  int flags = EncodeMouseButtons(buttons_, primary);

  for (int i = 0; i < steps; i++) {
    int to_x = static_cast<int>(x_ + step_x);
    int to_y = static_cast<int>(y_ + step_y);

    json params = {
      {"type", "mouseMoved"},
      {"x", to_x},
      {"y", to_y},
      {"button", MouseButtonToString(primary)},
      {"buttons", flags},
      {"modifiers", Modifiers()}
    };

    ActionResult result = Dispatch(scope, params);
    if (!result.success) {
      LOG_WARN("Mouse", "Move aborted at step " + std::to_string(i + 1) + "/" +
               std::to_string(steps) + ": " + result.message);
      return result;
    }

    x_ = to_x;
    y_ = to_y;
  }

  LOG_DEBUG("Mouse", "Moved to (" + std::to_string(x_) + "," + std::to_string(y_) + ") in " +
            std::to_string(steps) + " step(s)");
  return ActionResult::Success();
}

ActionResult Mouse::Down(const CancelScope& scope, MouseButton button, int click_count) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<MouseButton> to_buttons = buttons_;
  to_buttons.push_back(button);

  MouseButton primary;
  int flags = EncodeMouseButtons(to_buttons, primary);

  json params = {
    {"type", "mousePressed"},
    {"button", MouseButtonToString(button)},
    {"buttons", flags},
    {"clickCount", click_count},
    {"modifiers", Modifiers()},
    {"x", x_},
    {"y", y_}
  };

  ActionResult result = Dispatch(scope, params);
  if (!result.success) {
    LOG_WARN("Mouse", std::string("Down(") + MouseButtonToString(button) + ") failed: " + result.message);
    return result;
  }

  buttons_ = std::move(to_buttons);
  return result;
}

ActionResult Mouse::Up(const CancelScope& scope, MouseButton button, int click_count) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<MouseButton> to_buttons;
  to_buttons.reserve(buttons_.size());
  std::copy_if(buttons_.begin(), buttons_.end(), std::back_inserter(to_buttons),
               [button](MouseButton b) { return b != button; });

  MouseButton primary;
  int flags = EncodeMouseButtons(to_buttons, primary);

  json params = {
    {"type", "mouseReleased"},
    {"button", MouseButtonToString(button)},
    {"buttons", flags},
    {"clickCount", click_count},
    {"modifiers", Modifiers()},
    {"x", x_},
    {"y", y_}
  };

  ActionResult result = Dispatch(scope, params);
  if (!result.success) {
    LOG_WARN("Mouse", std::string("Up(") + MouseButtonToString(button) + ") failed: " + result.message);
    return result;
  }

  buttons_ = std::move(to_buttons);
  return result;
}

ActionResult Mouse::Click(const CancelScope& scope, MouseButton button) {
  ActionResult result = Down(scope, button, 1);
  if (!result.success) {
    return result;
  }
  return Up(scope, button, 1);
}

MousePosition Mouse::Position() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MousePosition pos;
  pos.x = x_;
  pos.y = y_;
  return pos;
}

std::vector<MouseButton> Mouse::PressedButtons() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buttons_;
}

}  // namespace talon
