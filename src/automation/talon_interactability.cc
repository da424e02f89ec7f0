#include "talon_interactability.h"
#include <cmath>
#include "logger.h"
#include "talon_element.h"
#include "talon_js_helpers.h"
#include "talon_page.h"

namespace talon {

ActionResult InteractabilityChecker::Check(Element& element, Shape& shape) {
  const CancelScope& scope = *element.Scope();

  ActionResult r = element.GetShape(shape);
  if (!r.success) {
    return r;
  }
  if (shape.empty()) {
    LOG_WARN("Interactability", "Element " + element.ObjectId() + " has no visible shape");
    return ActionResult::NoVisibleShape();
  }

  // Hit-testing works in root document coordinates
  RemoteObject scroll;
  Page* root = element.GetPage()->Root();
  r = root->Evaluate(scope, EvalOptions("({ x: window.scrollX, y: window.scrollY })", EvalArgs()), scroll);
  if (!r.success) {
    return r;
  }

  int x = static_cast<int>(shape[0].CenterX()) + static_cast<int>(JsonInt(scroll.value, "x"));
  int y = static_cast<int>(shape[0].CenterY()) + static_cast<int>(JsonInt(scroll.value, "y"));

  RemoteObject hit;
  r = element.GetPage()->ElementFromPoint(scope, x, y, hit);
  if (!r.success) {
    return r;
  }

  RemoteObject contains;
  EvalOptions opts = JsHelper(js_helper::kContainsElement, {EvalArg::Object(hit.object_id)});
  r = element.EvalWithOptions(opts, contains);
  if (!r.success) {
    return r;
  }

  if (!JsonTruthy(contains.value)) {
    LOG_WARN("Interactability", "Element " + element.ObjectId() + " covered by " +
             (hit.description.empty() ? hit.object_id : hit.description) +
             " at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
    return ActionResult::Covered(hit.object_id, hit.description);
  }

  return ActionResult::Success();
}

}  // namespace talon
