#pragma once

#include <string>
#include "action_result.h"
#include "talon_cancel_scope.h"
#include "talon_json.h"

namespace talon {

// Request/response channel to the remote browser (Chrome DevTools Protocol).
// Implementations must be safe to call from several threads at once.
class ProtocolClient {
public:
  virtual ~ProtocolClient() = default;

  // Execute |method| with |params| in the target session (empty = browser
  // target). Blocks until the reply arrives, the call fails, or |scope| ends.
  // On success |result| holds the reply's "result" object. Remote errors come
  // back as PROTOCOL_ERROR carrying the remote code and message.
  virtual ActionResult Call(const CancelScope& scope,
                            const std::string& session_id,
                            const std::string& method,
                            const json& params,
                            json& result) = 0;
};

}  // namespace talon
