#pragma once

#include <string>

namespace talon {

// Status codes for element interaction results
enum class ActionStatus {
  OK,                        // Action completed successfully

  // Element errors
  ELEMENT_NOT_FOUND,         // Requested structure (shadow root, frame) does not exist
  ELEMENT_NOT_INTERACTABLE,  // No visible shape, or another element covers it

  // Remote errors
  PROTOCOL_ERROR,            // Remote/transport failure, passed through verbatim
  EVAL_ERROR,                // In-page script threw

  // Scope errors
  CANCELED,                  // Cancel scope was cancelled
  TIMEOUT,                   // Deadline passed or retries exhausted

  // Local errors
  INVALID_PARAMETER,         // A parameter has invalid value
  DECODE_ERROR,              // Base64 / data URI payload could not be decoded
  INTERNAL_ERROR,            // Unexpected internal error

  UNKNOWN
};

inline const char* ActionStatusToCode(ActionStatus status) {
  switch (status) {
    case ActionStatus::OK: return "ok";
    case ActionStatus::ELEMENT_NOT_FOUND: return "element_not_found";
    case ActionStatus::ELEMENT_NOT_INTERACTABLE: return "element_not_interactable";
    case ActionStatus::PROTOCOL_ERROR: return "protocol_error";
    case ActionStatus::EVAL_ERROR: return "eval_error";
    case ActionStatus::CANCELED: return "canceled";
    case ActionStatus::TIMEOUT: return "timeout";
    case ActionStatus::INVALID_PARAMETER: return "invalid_parameter";
    case ActionStatus::DECODE_ERROR: return "decode_error";
    case ActionStatus::INTERNAL_ERROR: return "internal_error";
    default: return "unknown";
  }
}

inline const char* ActionStatusToMessage(ActionStatus status) {
  switch (status) {
    case ActionStatus::OK: return "Action completed successfully";
    case ActionStatus::ELEMENT_NOT_FOUND: return "Element not found";
    case ActionStatus::ELEMENT_NOT_INTERACTABLE: return "Element cannot be interacted with";
    case ActionStatus::PROTOCOL_ERROR: return "Protocol call failed";
    case ActionStatus::EVAL_ERROR: return "Script evaluation failed";
    case ActionStatus::CANCELED: return "Operation canceled";
    case ActionStatus::TIMEOUT: return "Operation timed out";
    case ActionStatus::INVALID_PARAMETER: return "Invalid parameter value";
    case ActionStatus::DECODE_ERROR: return "Failed to decode payload";
    case ActionStatus::INTERNAL_ERROR: return "Internal error";
    default: return "Unknown error";
  }
}

// Structured result for every interaction. Values are handed back through
// out-parameters; this carries success or the reason for failure.
struct ActionResult {
  bool success;               // True if action completed successfully
  ActionStatus status;        // Detailed status code
  std::string message;        // Human-readable message

  std::string method;         // For protocol errors: the remote method that failed
  int error_code;             // For protocol errors: the remote error code

  // For ELEMENT_NOT_INTERACTABLE: the element found on top of the target
  std::string obstructing_object_id;
  std::string obstructing_description;

  ActionResult() : success(false), status(ActionStatus::UNKNOWN), error_code(0) {}

  static ActionResult Success() {
    ActionResult r;
    r.success = true;
    r.status = ActionStatus::OK;
    r.message = ActionStatusToMessage(ActionStatus::OK);
    return r;
  }

  static ActionResult Failure(ActionStatus status, const std::string& msg = "") {
    ActionResult r;
    r.success = false;
    r.status = status;
    r.message = msg.empty() ? ActionStatusToMessage(status) : msg;
    return r;
  }

  // Remote or transport failure. |code| is the protocol error code (0 for transport errors).
  static ActionResult ProtocolError(const std::string& method, int code, const std::string& msg) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::PROTOCOL_ERROR;
    r.message = method + ": " + msg;
    r.method = method;
    r.error_code = code;
    return r;
  }

  static ActionResult EvalError(const std::string& description) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::EVAL_ERROR;
    r.message = "Script threw: " + description;
    return r;
  }

  // Element has no rendered shape at all
  static ActionResult NoVisibleShape() {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::ELEMENT_NOT_INTERACTABLE;
    r.message = "Element not interactable: element has no visible shape";
    return r;
  }

  // Another element sits on top of the target's hit point
  static ActionResult Covered(const std::string& object_id, const std::string& description) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::ELEMENT_NOT_INTERACTABLE;
    r.message = "Element not interactable: another element covers current one (" +
                (description.empty() ? object_id : description) + ")";
    r.obstructing_object_id = object_id;
    r.obstructing_description = description;
    return r;
  }

  bool IsNotInteractable() const { return status == ActionStatus::ELEMENT_NOT_INTERACTABLE; }

  std::string ToString() const {
    return std::string("[") + ActionStatusToCode(status) + "] " + message;
  }
};

}  // namespace talon
