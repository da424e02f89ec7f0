#include "talon_frame_resolver.h"
#include <vector>
#include "logger.h"
#include "talon_element.h"
#include "talon_page.h"

namespace talon {

FrameSearchResult FrameResolver::Search(Element& element, Page* page, int64_t node_id) {
  const CancelScope& scope = *element.Scope();

  std::vector<std::string> iframes;
  ActionResult r = page->Elements(scope, "iframe", iframes);
  if (!r.success) {
    return FrameSearchResult::Error(r);
  }

  for (const auto& iframe_id : iframes) {
    Element owner = page->ElementFromObject(element.Scope(), iframe_id);

    // Out-of-process iframes have no document in this session; skip them
    Page* child = nullptr;
    r = owner.Frame(child);
    if (r.status == ActionStatus::ELEMENT_NOT_FOUND) {
      continue;
    }
    if (!r.success) {
      return FrameSearchResult::Error(r);
    }

    std::string object_id;
    r = child->ResolveNode(scope, node_id, object_id);
    if (r.status == ActionStatus::ELEMENT_NOT_FOUND) {
      continue;
    }
    if (!r.success) {
      return FrameSearchResult::Error(r);
    }
    if (!object_id.empty()) {
      return FrameSearchResult::Found(child, object_id);
    }

    FrameSearchResult nested = Search(element, child, node_id);
    if (nested.kind != FrameSearchResult::NOT_FOUND) {
      return nested;
    }
  }

  return FrameSearchResult::NotFound();
}

ActionResult FrameResolver::EnsureOwningPage(Element& element, int64_t node_id,
                                             const std::string& object_id) {
  bool has = false;
  ActionResult r = element.GetPage()->HasObject(*element.Scope(), object_id, has);
  if (!r.success) {
    return r;
  }
  if (has) {
    return ActionResult::Success();
  }

  FrameSearchResult found = Search(element, element.GetPage(), node_id);
  switch (found.kind) {
    case FrameSearchResult::FOUND:
      element.Rebind(found.page, found.object_id);
      return ActionResult::Success();
    case FrameSearchResult::ERROR:
      LOG_WARN("FrameResolver", "Frame search failed: " + found.error.ToString());
      return found.error;
    case FrameSearchResult::NOT_FOUND:
    default:
      LOG_DEBUG("FrameResolver", "Node " + std::to_string(node_id) + " not found in any frame");
      return ActionResult::Success();
  }
}

}  // namespace talon
