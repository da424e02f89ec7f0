#include "talon_wait_engine.h"
#include "logger.h"
#include "talon_element.h"

namespace talon {

ActionResult WaitEngine::Until(Element& element, const EvalOptions& predicate) {
  const SleeperFactory& factory = element.Sleepers();
  std::unique_ptr<Sleeper> sleeper = factory ? factory() : nullptr;
  if (!sleeper) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "sleeper factory returned no sleeper");
  }

  return Retry(*element.Scope(), *sleeper, [&](bool& stop) {
    RemoteObject result;
    ActionResult r = element.EvalWithOptions(predicate, result);
    if (!r.success) {
      stop = true;
      return r;
    }

    stop = JsonTruthy(result.value);
    return ActionResult::Success();
  });
}

ActionResult WaitEngine::Stable(Element& element, std::chrono::milliseconds interval) {
  ActionResult r = element.WaitVisible();
  if (!r.success) {
    return r;
  }

  Shape previous;
  r = element.GetShape(previous);
  if (!r.success) {
    return r;
  }

  const CancelScope& scope = *element.Scope();
  int samples = 1;
  for (;;) {
    if (!scope.SleepFor(interval)) {
      return scope.Err();
    }

    Shape current;
    r = element.GetShape(current);
    if (!r.success) {
      return r;
    }
    samples++;

    if (current == previous) {
      LOG_DEBUG("WaitEngine", "Element " + element.ObjectId() + " stable after " +
                std::to_string(samples) + " samples");
      return ActionResult::Success();
    }
    previous.swap(current);
  }
}

}  // namespace talon
