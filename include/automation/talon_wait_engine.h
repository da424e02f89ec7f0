#pragma once

#include <chrono>
#include "action_result.h"
#include "talon_eval_options.h"

namespace talon {

class Element;

class WaitEngine {
public:
  // Evaluate |predicate| on the element until it is truthy. An evaluation
  // error ends the wait at once; otherwise the handle's sleeper paces the
  // polls and the scope (or an exhausted sleeper) bounds them.
  static ActionResult Until(Element& element, const EvalOptions& predicate);

  // Wait for visibility, then sample the shape every |interval| until two
  // consecutive samples are equal.
  static ActionResult Stable(Element& element, std::chrono::milliseconds interval);
};

}  // namespace talon
