#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "action_result.h"
#include "talon_cancel_scope.h"
#include "talon_dom_types.h"
#include "talon_eval_options.h"
#include "talon_mouse.h"
#include "talon_sleeper.h"

namespace talon {

class Page;

// Handle to a DOM element in a remote page.
//
// The object id is only meaningful in the execution context that issued it
// and goes stale once the node is detached or the document navigates.
// Every call runs under the handle's cancel scope; waits poll with a fresh
// sleeper from the handle's factory. The page is not owned.
//
// A handle may be shared between threads for reads and gestures, but
// EnsureOwningPage() rebinds it and must not race with other calls.
class Element {
public:
  Element(CancelScopePtr scope, SleeperFactory sleeper, Page* page, std::string object_id);

  const std::string& ObjectId() const { return object_id_; }
  Page* GetPage() const { return page_; }
  const CancelScopePtr& Scope() const { return scope_; }
  const SleeperFactory& Sleepers() const { return sleeper_; }

  // Same remote object under another scope or backoff policy
  Element WithScope(CancelScopePtr scope) const;
  Element WithSleeper(SleeperFactory sleeper) const;
  Element WithTimeout(std::chrono::milliseconds timeout) const;

  // ---- Input ----

  // Scroll into view, then focus
  ActionResult Focus();
  ActionResult ScrollIntoView();

  // Move the pointer to the centre of the element's first quad
  ActionResult Hover();
  ActionResult Click(MouseButton button = MouseButton::LEFT);
  ActionResult Tap();

  ActionResult Press(char32_t key);
  ActionResult SelectText(const std::string& regex);
  ActionResult SelectAllText();

  // Insert |text| at the caret, then fire input/change events.
  // To replace a value, call SelectAllText() first.
  ActionResult Input(const std::string& text);
  ActionResult Blur();

  // Select <option>s matching any of |selectors| by text or CSS selector
  ActionResult Select(const std::vector<std::string>& selectors);

  // Relative paths are made absolute against the working directory
  ActionResult SetFiles(const std::vector<std::string>& paths);

  // ---- Geometry ----

  ActionResult Interactable(Shape& shape);
  ActionResult GetShape(Shape& shape);
  ActionResult GetBox(BoxModel& box);

  // ---- Reads ----

  ActionResult Matches(const std::string& selector, bool& matches);

  // |present| is false when the attribute is absent
  ActionResult Attribute(const std::string& name, std::string& value, bool& present);
  ActionResult Property(const std::string& name, json& value);
  ActionResult Text(std::string& text);
  ActionResult HTML(std::string& html);
  ActionResult Visible(bool& visible);

  // True if |target| is this element or a descendant of it
  ActionResult ContainsElement(const Element& target, bool& contains);

  // ---- Structure ----

  ActionResult Describe(int depth, bool pierce, DomNode& node);
  ActionResult NodeID(int64_t& node_id);

  // ELEMENT_NOT_FOUND if the element hosts no shadow root
  ActionResult ShadowRoot(std::unique_ptr<Element>& root);

  // Page for this iframe's content document. Established on first call and
  // cached on the handle; owned by the root page.
  ActionResult Frame(Page*& frame);

  // ---- Waits ----

  // Poll |js| (evaluated with this = element) until it returns truthy
  ActionResult Wait(const std::string& js, const EvalArgs& args = EvalArgs());
  ActionResult WaitVisible();
  ActionResult WaitInvisible();
  ActionResult WaitStable(std::chrono::milliseconds interval);
  ActionResult WaitStable();  // Page config interval
  ActionResult WaitLoad();

  // ---- Resources ----

  // Bytes behind the element's src (img, video, ...)
  ActionResult Resource(std::vector<uint8_t>& data);

  // Canvas pixels through toDataURL(format, quality)
  ActionResult CanvasToImage(const std::string& format, double quality, std::vector<uint8_t>& image);

  // Root page capture clipped to the content box. |quality| < 0 = default.
  ActionResult Screenshot(const std::string& format, int quality, std::vector<uint8_t>& image);

  // ---- Lifecycle ----

  ActionResult Release();

  // Detach from the document, then release the reference
  ActionResult Remove();

  // ---- Eval ----

  ActionResult Eval(const std::string& js, const EvalArgs& args, RemoteObject& result);
  ActionResult EvalWithOptions(EvalOptions opts, RemoteObject& result);

  // Rebind the handle to the frame that owns |node_id| if the current page
  // does not know |object_id|. Leaves the handle unchanged when no frame does.
  ActionResult EnsureOwningPage(int64_t node_id, const std::string& object_id);

private:
  friend class FrameResolver;

  // Protocol call in the page's session; failures are logged
  ActionResult Call(const std::string& method, const json& params, json& result);

  // wait-visible -> scroll-into-view -> interactable; yields the shape
  ActionResult PrepareGesture(Shape& shape);

  void Rebind(Page* page, const std::string& object_id);

  CancelScopePtr scope_;
  SleeperFactory sleeper_;
  Page* page_;
  std::string object_id_;
  Page* frame_ = nullptr;   // cached content page when this is an iframe
};

}  // namespace talon
