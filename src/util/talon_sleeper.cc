#include "talon_sleeper.h"
#include <algorithm>

namespace talon {

BackoffSleeper::BackoffSleeper(std::chrono::milliseconds initial,
                               std::chrono::milliseconds max,
                               double multiplier,
                               int max_attempts)
    : interval_(std::max(initial, std::chrono::milliseconds(0))),
      max_(std::max(max, initial)),
      multiplier_(multiplier < 1.0 ? 1.0 : multiplier),
      max_attempts_(max_attempts) {}

ActionResult BackoffSleeper::Sleep(const CancelScope& scope) {
  if (max_attempts_ > 0 && attempts_ >= max_attempts_) {
    return ActionResult::Failure(ActionStatus::TIMEOUT,
                                 "max sleep count " + std::to_string(max_attempts_) + " reached");
  }
  ++attempts_;

  if (!scope.SleepFor(interval_)) {
    return scope.Err();
  }

  auto next = std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(interval_.count() * multiplier_));
  interval_ = std::min(next, max_);
  return ActionResult::Success();
}

SleeperFactory MakeBackoffSleeperFactory(std::chrono::milliseconds initial,
                                         std::chrono::milliseconds max,
                                         double multiplier,
                                         int max_attempts) {
  return [initial, max, multiplier, max_attempts]() -> std::unique_ptr<Sleeper> {
    return std::make_unique<BackoffSleeper>(initial, max, multiplier, max_attempts);
  };
}

ActionResult Retry(const CancelScope& scope, Sleeper& sleeper,
                   const std::function<ActionResult(bool& stop)>& fn) {
  for (;;) {
    bool stop = false;
    ActionResult result = fn(stop);
    if (stop) {
      return result;
    }

    if (scope.Done()) {
      return scope.Err();
    }

    ActionResult slept = sleeper.Sleep(scope);
    if (!slept.success) {
      return slept;
    }
  }
}

}  // namespace talon
