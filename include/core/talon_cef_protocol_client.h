#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "include/cef_browser.h"
#include "include/cef_devtools_message_observer.h"
#include "include/cef_registration.h"
#include "talon_protocol_client.h"

namespace talon {

// ProtocolClient backed by CEF's in-process DevTools channel.
//
// Messages are posted to the CEF UI thread with SendDevToolsMessage() and the
// replies are matched by id in OnDevToolsMessage(). Call() blocks the calling
// thread, so it must never run on the UI thread itself (the reply could never
// be delivered); such calls fail with INTERNAL_ERROR.
class CefProtocolClient : public ProtocolClient {
public:
  CefProtocolClient(CefRefPtr<CefBrowser> browser, int timeout_ms);
  ~CefProtocolClient() override;

  CefProtocolClient(const CefProtocolClient&) = delete;
  CefProtocolClient& operator=(const CefProtocolClient&) = delete;

  // Register the DevTools observer. Must be called on the UI thread before
  // the first Call().
  bool Attach();

  // Unregister the observer and fail every pending call.
  void Detach();

  ActionResult Call(const CancelScope& scope,
                    const std::string& session_id,
                    const std::string& method,
                    const json& params,
                    json& result) override;

  // Pending-call table shared with the observer and posted tasks so neither
  // outlives it, whichever side is torn down first.
  class Channel;

private:
  class Observer;

  CefRefPtr<CefBrowser> browser_;
  int timeout_ms_;
  std::shared_ptr<Channel> channel_;
  CefRefPtr<Observer> observer_;
  CefRefPtr<CefRegistration> registration_;
  std::atomic<int> next_id_{1};
  std::atomic<bool> attached_{false};
};

}  // namespace talon
