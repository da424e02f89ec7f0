#pragma once

#include "action_result.h"
#include "talon_dom_types.h"

namespace talon {

class Element;

// Hit-test verification: an element is interactable only if the node on top
// at the centre of its first quad is the element itself or a descendant.
class InteractabilityChecker {
public:
  // On success |shape| holds the element's quads (never empty).
  // ELEMENT_NOT_INTERACTABLE names the covering object when there is one.
  static ActionResult Check(Element& element, Shape& shape);
};

}  // namespace talon
