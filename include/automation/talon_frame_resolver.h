#pragma once

#include <cstdint>
#include <string>
#include "action_result.h"

namespace talon {

class Element;
class Page;

// Outcome of searching the frame tree for a node
struct FrameSearchResult {
  enum Kind {
    NOT_FOUND,
    FOUND,
    ERROR
  };

  Kind kind = NOT_FOUND;
  Page* page = nullptr;        // FOUND
  std::string object_id;       // FOUND
  ActionResult error;          // ERROR

  static FrameSearchResult NotFound() { return FrameSearchResult(); }

  static FrameSearchResult Found(Page* page, const std::string& object_id) {
    FrameSearchResult r;
    r.kind = FOUND;
    r.page = page;
    r.object_id = object_id;
    return r;
  }

  static FrameSearchResult Error(const ActionResult& error) {
    FrameSearchResult r;
    r.kind = ERROR;
    r.error = error;
    return r;
  }
};

// Relocates a stale element reference into the frame that owns its node
class FrameResolver {
public:
  // Depth-first over |page|'s iframes in document order: each child page is
  // asked to resolve |node_id| before its own iframes are searched, and
  // before the next sibling. The first hit wins; a protocol error aborts.
  static FrameSearchResult Search(Element& element, Page* page, int64_t node_id);

  // No-op if the element's page knows |object_id|; else search and rebind.
  static ActionResult EnsureOwningPage(Element& element, int64_t node_id,
                                       const std::string& object_id);
};

}  // namespace talon
