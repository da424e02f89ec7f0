#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include "action_result.h"
#include "talon_cancel_scope.h"

namespace talon {

// One backoff policy instance per retry loop. Sleep() blocks for the next
// interval and fails when the scope ends or the attempt budget runs out.
class Sleeper {
public:
  virtual ~Sleeper() = default;
  virtual ActionResult Sleep(const CancelScope& scope) = 0;
};

// Produces a fresh Sleeper for each wait, so state is never shared between waits
using SleeperFactory = std::function<std::unique_ptr<Sleeper>()>;

// Exponential backoff: initial, initial*m, initial*m^2 ... capped at max.
// max_attempts == 0 means unlimited.
class BackoffSleeper : public Sleeper {
public:
  BackoffSleeper(std::chrono::milliseconds initial,
                 std::chrono::milliseconds max,
                 double multiplier,
                 int max_attempts = 0);

  ActionResult Sleep(const CancelScope& scope) override;

  int Attempts() const { return attempts_; }
  std::chrono::milliseconds NextInterval() const { return interval_; }

private:
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds max_;
  double multiplier_;
  int max_attempts_;
  int attempts_ = 0;
};

SleeperFactory MakeBackoffSleeperFactory(std::chrono::milliseconds initial,
                                         std::chrono::milliseconds max,
                                         double multiplier,
                                         int max_attempts = 0);

// Runs |fn| until it sets |stop|, sleeping with |sleeper| between attempts.
// The scope is checked once per tick, before sleeping.
ActionResult Retry(const CancelScope& scope, Sleeper& sleeper,
                   const std::function<ActionResult(bool& stop)>& fn);

}  // namespace talon
