#pragma once

#include <atomic>
#include <string>
#include "action_result.h"
#include "talon_cancel_scope.h"
#include "talon_protocol_client.h"

namespace talon {

// Modifier bits as the protocol expects them
enum KeyModifier {
  MODIFIER_NONE = 0,
  MODIFIER_ALT = 1,
  MODIFIER_CTRL = 2,
  MODIFIER_META = 4,
  MODIFIER_SHIFT = 8
};

class Keyboard {
public:
  virtual ~Keyboard() = default;

  virtual ActionResult Press(const CancelScope& scope, char32_t key) = 0;
  virtual ActionResult InsertText(const CancelScope& scope, const std::string& text) = 0;

  // Currently held modifiers, attached to pointer events too
  virtual int Modifiers() const = 0;
};

// Keyboard over Input.dispatchKeyEvent / Input.insertText.
// Press() sends a character keyDown/keyUp pair carrying the key as text; it
// does not map keys to virtual key codes.
class ProtocolKeyboard : public Keyboard {
public:
  ProtocolKeyboard(ProtocolClient* client, std::string session_id);

  ActionResult Press(const CancelScope& scope, char32_t key) override;
  ActionResult InsertText(const CancelScope& scope, const std::string& text) override;

  int Modifiers() const override { return modifiers_.load(std::memory_order_relaxed); }
  void SetModifiers(int modifiers) { modifiers_.store(modifiers, std::memory_order_relaxed); }

private:
  ProtocolClient* client_;
  std::string session_id_;
  std::atomic<int> modifiers_{MODIFIER_NONE};
};

// UTF-8 encoding of a single code point; empty for invalid code points
std::string EncodeUtf8(char32_t code_point);

}  // namespace talon
