#include "talon_keyboard.h"
#include "logger.h"

namespace talon {

std::string EncodeUtf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    if (cp >= 0xD800 && cp <= 0xDFFF) return "";  // lone surrogate
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

ProtocolKeyboard::ProtocolKeyboard(ProtocolClient* client, std::string session_id)
    : client_(client), session_id_(std::move(session_id)) {}

ActionResult ProtocolKeyboard::Press(const CancelScope& scope, char32_t key) {
  std::string text = EncodeUtf8(key);
  if (text.empty()) {
    return ActionResult::Failure(ActionStatus::INVALID_PARAMETER, "invalid key code point");
  }

  int modifiers = Modifiers();
  json ignored;

  json down = {
    {"type", "keyDown"},
    {"key", text},
    {"text", text},
    {"unmodifiedText", text},
    {"modifiers", modifiers}
  };
  ActionResult result = client_->Call(scope, session_id_, "Input.dispatchKeyEvent", down, ignored);
  if (!result.success) {
    return result;
  }

  json up = {
    {"type", "keyUp"},
    {"key", text},
    {"modifiers", modifiers}
  };
  return client_->Call(scope, session_id_, "Input.dispatchKeyEvent", up, ignored);
}

ActionResult ProtocolKeyboard::InsertText(const CancelScope& scope, const std::string& text) {
  json ignored;
  LOG_DEBUG("Keyboard", "Inserting " + std::to_string(text.size()) + " byte(s) of text");
  return client_->Call(scope, session_id_, "Input.insertText", {{"text", text}}, ignored);
}

}  // namespace talon
