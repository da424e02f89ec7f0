#include "talon_cef_protocol_client.h"
#include <chrono>
#include <condition_variable>
#include <unordered_map>
#include "include/cef_task.h"
#include "include/wrapper/cef_helpers.h"
#include "logger.h"

namespace talon {

namespace {
constexpr std::chrono::milliseconds kWaitSlice(10);
}  // namespace

class CefProtocolClient::Channel {
public:
  struct Reply {
    bool done = false;
    json message;            // Full reply: {"id", "result"|"error"}
    std::string send_error;  // Set when the message never left this process
  };

  void Register(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[id] = Reply();
  }

  // Returns false when no caller waits for |id| (abandoned or unknown)
  bool Complete(int id, json message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(id);
      if (it == pending_.end()) {
        return false;
      }
      it->second.done = true;
      it->second.message = std::move(message);
    }
    cv_.notify_all();
    return true;
  }

  void Fail(int id, const std::string& error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(id);
      if (it == pending_.end()) {
        return;
      }
      it->second.done = true;
      it->second.send_error = error;
    }
    cv_.notify_all();
  }

  void FailAll(const std::string& error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& entry : pending_) {
        if (!entry.second.done) {
          entry.second.done = true;
          entry.second.send_error = error;
        }
      }
    }
    cv_.notify_all();
  }

  // Wait for |id| until it completes, |scope| ends or |deadline| passes.
  // Removes the entry and hands the reply back only when it completed.
  bool Wait(int id, const CancelScope& scope, bool has_deadline,
            std::chrono::steady_clock::time_point deadline, Reply& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
      auto it = pending_.find(id);
      if (it == pending_.end()) {
        return false;
      }
      if (it->second.done) {
        out = std::move(it->second);
        pending_.erase(it);
        return true;
      }
      if (scope.Done() || (has_deadline && std::chrono::steady_clock::now() >= deadline)) {
        pending_.erase(it);
        return false;
      }
      cv_.wait_for(lock, kWaitSlice);
    }
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<int, Reply> pending_;
};

class CefProtocolClient::Observer : public CefDevToolsMessageObserver {
public:
  explicit Observer(std::shared_ptr<Channel> channel) : channel_(std::move(channel)) {}

  bool OnDevToolsMessage(CefRefPtr<CefBrowser> browser,
                         const void* message,
                         size_t message_size) override {
    const char* begin = static_cast<const char*>(message);
    json parsed = json::parse(begin, begin + message_size, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      LOG_WARN("CefProtocol", "Dropping unparseable DevTools message");
      return true;
    }

    const json* id = JsonField(parsed, "id");
    if (!id || !id->is_number_integer()) {
      // Events are left to CEF's own dispatch (OnDevToolsEvent)
      return false;
    }

    int message_id = id->get<int>();
    if (!channel_->Complete(message_id, std::move(parsed))) {
      LOG_DEBUG("CefProtocol", "Late reply for abandoned call " + std::to_string(message_id));
    }
    return true;
  }

  void OnDevToolsAgentDetached(CefRefPtr<CefBrowser> browser) override {
    LOG_WARN("CefProtocol", "DevTools agent detached, failing pending calls");
    channel_->FailAll("devtools agent detached");
  }

private:
  std::shared_ptr<Channel> channel_;

  IMPLEMENT_REFCOUNTING(Observer);
};

namespace {

// Runs SendDevToolsMessage on the UI thread
class SendDevToolsMessageTask : public CefTask {
public:
  SendDevToolsMessageTask(CefRefPtr<CefBrowser> browser,
                          std::shared_ptr<CefProtocolClient::Channel> channel,
                          int id,
                          std::string message)
      : browser_(browser), channel_(std::move(channel)), id_(id), message_(std::move(message)) {}

  void Execute() override;

private:
  CefRefPtr<CefBrowser> browser_;
  std::shared_ptr<CefProtocolClient::Channel> channel_;
  int id_;
  std::string message_;

  IMPLEMENT_REFCOUNTING(SendDevToolsMessageTask);
};

}  // namespace

void SendDevToolsMessageTask::Execute() {
  CefRefPtr<CefBrowserHost> host;
  if (browser_) {
    host = browser_->GetHost();
  }
  if (!host) {
    channel_->Fail(id_, "browser host is gone");
    return;
  }
  if (!host->SendDevToolsMessage(message_.data(), message_.size())) {
    channel_->Fail(id_, "SendDevToolsMessage rejected the message");
  }
}

CefProtocolClient::CefProtocolClient(CefRefPtr<CefBrowser> browser, int timeout_ms)
    : browser_(browser),
      timeout_ms_(timeout_ms),
      channel_(std::make_shared<Channel>()) {}

CefProtocolClient::~CefProtocolClient() {
  Detach();
}

bool CefProtocolClient::Attach() {
  CEF_REQUIRE_UI_THREAD();

  if (registration_) {
    return true;
  }
  if (!browser_ || !browser_->GetHost()) {
    LOG_ERROR("CefProtocol", "Cannot attach: no browser host");
    return false;
  }

  observer_ = new Observer(channel_);
  registration_ = browser_->GetHost()->AddDevToolsMessageObserver(observer_);
  if (!registration_) {
    LOG_ERROR("CefProtocol", "AddDevToolsMessageObserver failed");
    observer_ = nullptr;
    return false;
  }

  attached_.store(true, std::memory_order_release);
  LOG_INFO("CefProtocol", "Attached to browser " + std::to_string(browser_->GetIdentifier()));
  return true;
}

void CefProtocolClient::Detach() {
  attached_.store(false, std::memory_order_release);
  // Dropping the registration removes the observer
  registration_ = nullptr;
  observer_ = nullptr;
  channel_->FailAll("protocol client detached");
}

ActionResult CefProtocolClient::Call(const CancelScope& scope,
                                     const std::string& session_id,
                                     const std::string& method,
                                     const json& params,
                                     json& result) {
  if (CefCurrentlyOn(TID_UI)) {
    LOG_ERROR("CefProtocol", "Call(" + method + ") on the UI thread would deadlock");
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR,
                                 "protocol calls must not run on the CEF UI thread");
  }
  if (!attached_.load(std::memory_order_acquire)) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "protocol client is not attached");
  }
  if (scope.Done()) {
    return scope.Err();
  }

  int id = next_id_.fetch_add(1, std::memory_order_relaxed);

  json message = {{"id", id}, {"method", method}};
  message["params"] = params.is_null() ? json::object() : params;
  if (!session_id.empty()) {
    message["sessionId"] = session_id;
  }

  LOG_DEBUG("CefProtocol", "-> #" + std::to_string(id) + " " + method +
            (session_id.empty() ? "" : " [" + session_id + "]"));

  channel_->Register(id);
  CefPostTask(TID_UI, new SendDevToolsMessageTask(browser_, channel_, id, message.dump()));

  bool has_deadline = timeout_ms_ > 0;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

  Channel::Reply reply;
  if (!channel_->Wait(id, scope, has_deadline, deadline, reply)) {
    if (scope.Done()) {
      return scope.Err();
    }
    LOG_WARN("CefProtocol", method + " timed out after " + std::to_string(timeout_ms_) + "ms");
    return ActionResult::Failure(ActionStatus::TIMEOUT,
                                 method + ": no reply within " + std::to_string(timeout_ms_) + "ms");
  }

  if (!reply.send_error.empty()) {
    LOG_WARN("CefProtocol", method + " failed: " + reply.send_error);
    return ActionResult::ProtocolError(method, 0, reply.send_error);
  }

  if (const json* error = JsonField(reply.message, "error")) {
    int code = static_cast<int>(JsonInt(*error, "code"));
    std::string text = JsonString(*error, "message", "unknown error");
    std::string data = JsonString(*error, "data");
    if (!data.empty()) {
      text += " (" + data + ")";
    }
    LOG_DEBUG("CefProtocol", "<- #" + std::to_string(id) + " error " + std::to_string(code) + ": " + text);
    return ActionResult::ProtocolError(method, code, text);
  }

  const json* payload = JsonField(reply.message, "result");
  result = payload ? *payload : json::object();
  LOG_DEBUG("CefProtocol", "<- #" + std::to_string(id) + " ok");
  return ActionResult::Success();
}

}  // namespace talon
