#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include "action_result.h"

namespace talon {

// Cooperative cancellation token with an optional deadline.
// Child scopes observe their parent: cancelling or expiring the parent
// makes every child Done() as well. Shared between threads by shared_ptr.
class CancelScope {
public:
  using Clock = std::chrono::steady_clock;

  // Scope that never expires on its own
  static std::shared_ptr<CancelScope> Background();

  static std::shared_ptr<CancelScope> WithCancel(std::shared_ptr<CancelScope> parent);
  static std::shared_ptr<CancelScope> WithTimeout(std::shared_ptr<CancelScope> parent,
                                                  std::chrono::milliseconds timeout);
  static std::shared_ptr<CancelScope> WithDeadline(std::shared_ptr<CancelScope> parent,
                                                   Clock::time_point deadline);

  CancelScope(const CancelScope&) = delete;
  CancelScope& operator=(const CancelScope&) = delete;

  void Cancel();

  bool Done() const;

  // CANCELED or TIMEOUT once Done(), success otherwise
  ActionResult Err() const;

  // Sleep for |duration| or until this scope is cancelled, whichever comes
  // first. Returns false if the scope is Done() on return.
  bool SleepFor(std::chrono::milliseconds duration) const;

  bool HasDeadline() const { return has_deadline_; }
  Clock::time_point Deadline() const { return deadline_; }

private:
  CancelScope(std::shared_ptr<CancelScope> parent, bool has_deadline, Clock::time_point deadline);

  bool Expired() const;
  bool SelfCanceled() const { return canceled_.load(std::memory_order_acquire); }

  std::shared_ptr<CancelScope> parent_;
  bool has_deadline_;
  Clock::time_point deadline_;
  std::atomic<bool> canceled_{false};

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

using CancelScopePtr = std::shared_ptr<CancelScope>;

}  // namespace talon
