#include "talon_cancel_scope.h"
#include <algorithm>

namespace talon {

namespace {
// Upper bound on one condition-variable wait so parent cancellation is
// noticed even though only this scope's own Cancel() notifies.
constexpr std::chrono::milliseconds kMaxWaitSlice(10);
}  // namespace

CancelScope::CancelScope(std::shared_ptr<CancelScope> parent, bool has_deadline,
                         Clock::time_point deadline)
    : parent_(std::move(parent)), has_deadline_(has_deadline), deadline_(deadline) {
  // Inherit the tighter of the two deadlines
  if (parent_ && parent_->has_deadline_) {
    if (!has_deadline_ || parent_->deadline_ < deadline_) {
      has_deadline_ = true;
      deadline_ = parent_->deadline_;
    }
  }
}

std::shared_ptr<CancelScope> CancelScope::Background() {
  return std::shared_ptr<CancelScope>(new CancelScope(nullptr, false, Clock::time_point()));
}

std::shared_ptr<CancelScope> CancelScope::WithCancel(std::shared_ptr<CancelScope> parent) {
  return std::shared_ptr<CancelScope>(new CancelScope(std::move(parent), false, Clock::time_point()));
}

std::shared_ptr<CancelScope> CancelScope::WithTimeout(std::shared_ptr<CancelScope> parent,
                                                      std::chrono::milliseconds timeout) {
  return WithDeadline(std::move(parent), Clock::now() + timeout);
}

std::shared_ptr<CancelScope> CancelScope::WithDeadline(std::shared_ptr<CancelScope> parent,
                                                       Clock::time_point deadline) {
  return std::shared_ptr<CancelScope>(new CancelScope(std::move(parent), true, deadline));
}

void CancelScope::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    canceled_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool CancelScope::Expired() const {
  return has_deadline_ && Clock::now() >= deadline_;
}

bool CancelScope::Done() const {
  if (SelfCanceled() || Expired()) {
    return true;
  }
  return parent_ && parent_->Done();
}

ActionResult CancelScope::Err() const {
  // Explicit cancellation wins over an expired deadline
  for (const CancelScope* s = this; s; s = s->parent_.get()) {
    if (s->SelfCanceled()) {
      return ActionResult::Failure(ActionStatus::CANCELED, "context canceled");
    }
  }
  if (Expired()) {
    return ActionResult::Failure(ActionStatus::TIMEOUT, "context deadline exceeded");
  }
  return ActionResult::Success();
}

bool CancelScope::SleepFor(std::chrono::milliseconds duration) const {
  auto until = Clock::now() + duration;
  if (has_deadline_) {
    until = std::min(until, deadline_);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  while (!Done()) {
    auto now = Clock::now();
    if (now >= until) {
      break;
    }
    auto slice = std::min<Clock::duration>(until - now, kMaxWaitSlice);
    cv_.wait_for(lock, slice);
  }
  return !Done();
}

}  // namespace talon
