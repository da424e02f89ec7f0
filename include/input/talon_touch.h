#pragma once

#include <string>
#include "action_result.h"
#include "talon_cancel_scope.h"
#include "talon_protocol_client.h"

namespace talon {

class Keyboard;

class Touch {
public:
  virtual ~Touch() = default;
  virtual ActionResult Tap(const CancelScope& scope, int x, int y) = 0;
};

// Single-finger tap: touchStart at (x,y) followed by touchEnd.
class ProtocolTouch : public Touch {
public:
  ProtocolTouch(ProtocolClient* client, std::string session_id, const Keyboard* keyboard);

  ActionResult Tap(const CancelScope& scope, int x, int y) override;

private:
  ProtocolClient* client_;
  std::string session_id_;
  const Keyboard* keyboard_;
};

}  // namespace talon
