#include "talon_element.h"
#include <filesystem>
#include <system_error>
#include "logger.h"
#include "talon_encoding.h"
#include "talon_frame_resolver.h"
#include "talon_interactability.h"
#include "talon_js_helpers.h"
#include "talon_keyboard.h"
#include "talon_page.h"
#include "talon_wait_engine.h"

namespace talon {

namespace {

std::string ValueToString(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return "";
  return value.dump();
}

std::string JoinSelectors(const std::vector<std::string>& selectors) {
  std::string joined;
  for (size_t i = 0; i < selectors.size(); i++) {
    if (i > 0) joined += "; ";
    joined += selectors[i];
  }
  return joined;
}

}  // namespace

Element::Element(CancelScopePtr scope, SleeperFactory sleeper, Page* page, std::string object_id)
    : scope_(std::move(scope)),
      sleeper_(std::move(sleeper)),
      page_(page),
      object_id_(std::move(object_id)) {}

Element Element::WithScope(CancelScopePtr scope) const {
  Element copy(*this);
  copy.scope_ = std::move(scope);
  return copy;
}

Element Element::WithSleeper(SleeperFactory sleeper) const {
  Element copy(*this);
  copy.sleeper_ = std::move(sleeper);
  return copy;
}

Element Element::WithTimeout(std::chrono::milliseconds timeout) const {
  return WithScope(CancelScope::WithTimeout(scope_, timeout));
}

ActionResult Element::Call(const std::string& method, const json& params, json& result) {
  ActionResult r = page_->Call(*scope_, method, params, result);
  if (!r.success) {
    LOG_WARN("Element", "Element " + object_id_ + ": " + r.ToString());
  }
  return r;
}

// ---- Input ----

ActionResult Element::Focus() {
  ActionResult r = ScrollIntoView();
  if (!r.success) {
    return r;
  }

  RemoteObject ignored;
  return EvalWithOptions(EvalOptions("this.focus()", EvalArgs()).ByUser(), ignored);
}

ActionResult Element::ScrollIntoView() {
  InputTrace trace(*page_, "scroll into view");
  page_->TrySlowMotion(*scope_);

  json ignored;
  return Call("DOM.scrollIntoViewIfNeeded", {{"objectId", object_id_}}, ignored);
}

ActionResult Element::PrepareGesture(Shape& shape) {
  ActionResult r = WaitVisible();
  if (!r.success) {
    return r;
  }

  r = ScrollIntoView();
  if (!r.success) {
    return r;
  }

  return Interactable(shape);
}

ActionResult Element::Hover() {
  Shape shape;
  ActionResult r = PrepareGesture(shape);
  if (!r.success) {
    return r;
  }

  return page_->GetMouse().Move(*scope_,
                                static_cast<int>(shape[0].CenterX()),
                                static_cast<int>(shape[0].CenterY()), 1);
}

ActionResult Element::Click(MouseButton button) {
  ActionResult r = Hover();
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, std::string(MouseButtonToString(button)) + " click");
  return page_->GetMouse().Click(*scope_, button);
}

ActionResult Element::Tap() {
  Shape shape;
  ActionResult r = PrepareGesture(shape);
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, "tap");
  return page_->GetTouch().Tap(*scope_,
                               static_cast<int>(shape[0].CenterX()),
                               static_cast<int>(shape[0].CenterY()));
}

ActionResult Element::Press(char32_t key) {
  ActionResult r = WaitVisible();
  if (!r.success) {
    return r;
  }

  r = Focus();
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, "press " + EncodeUtf8(key));
  return page_->GetKeyboard().Press(*scope_, key);
}

ActionResult Element::SelectText(const std::string& regex) {
  ActionResult r = Focus();
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, "select text: " + regex);
  page_->TrySlowMotion(*scope_);

  RemoteObject ignored;
  return EvalWithOptions(JsHelper(js_helper::kSelectText, {EvalArg::Value(regex)}).ByUser(), ignored);
}

ActionResult Element::SelectAllText() {
  ActionResult r = Focus();
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, "select all text");
  page_->TrySlowMotion(*scope_);

  RemoteObject ignored;
  return EvalWithOptions(JsHelper(js_helper::kSelectAllText).ByUser(), ignored);
}

ActionResult Element::Input(const std::string& text) {
  ActionResult r = WaitVisible();
  if (!r.success) {
    return r;
  }

  r = Focus();
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, "input " + text);

  r = page_->GetKeyboard().InsertText(*scope_, text);
  if (!r.success) {
    return r;
  }

  RemoteObject ignored;
  return EvalWithOptions(JsHelper(js_helper::kInputEvent).ByUser(), ignored);
}

ActionResult Element::Blur() {
  RemoteObject ignored;
  return EvalWithOptions(EvalOptions("this.blur()", EvalArgs()).ByUser(), ignored);
}

ActionResult Element::Select(const std::vector<std::string>& selectors) {
  ActionResult r = WaitVisible();
  if (!r.success) {
    return r;
  }

  InputTrace trace(*page_, "select \"" + JoinSelectors(selectors) + "\"");
  page_->TrySlowMotion(*scope_);

  RemoteObject ignored;
  return EvalWithOptions(JsHelper(js_helper::kSelect, {EvalArg::Value(json(selectors))}).ByUser(), ignored);
}

ActionResult Element::SetFiles(const std::vector<std::string>& paths) {
  json files = json::array();
  for (const auto& path : paths) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
      return ActionResult::Failure(ActionStatus::INVALID_PARAMETER,
                                   "Cannot resolve path '" + path + "': " + ec.message());
    }
    files.push_back(absolute.string());
  }

  InputTrace trace(*page_, "set files: " + files.dump());
  page_->TrySlowMotion(*scope_);

  json ignored;
  return Call("DOM.setFileInputFiles", {{"files", files}, {"objectId", object_id_}}, ignored);
}

// ---- Geometry ----

ActionResult Element::Interactable(Shape& shape) {
  return InteractabilityChecker::Check(*this, shape);
}

ActionResult Element::GetShape(Shape& shape) {
  json result;
  ActionResult r = Call("DOM.getContentQuads", {{"objectId", object_id_}}, result);
  if (!r.success) {
    return r;
  }
  if (!ParseShape(result, shape)) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "DOM.getContentQuads returned malformed quads");
  }
  return ActionResult::Success();
}

ActionResult Element::GetBox(BoxModel& box) {
  json result;
  ActionResult r = Call("DOM.getBoxModel", {{"objectId", object_id_}}, result);
  if (!r.success) {
    return r;
  }
  if (!ParseBoxModel(result, box)) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "DOM.getBoxModel returned a malformed model");
  }
  return ActionResult::Success();
}

// ---- Reads ----

ActionResult Element::Matches(const std::string& selector, bool& matches) {
  RemoteObject result;
  ActionResult r = Eval("(s) => this.matches(s)", {EvalArg::Value(selector)}, result);
  if (r.success) {
    matches = JsonTruthy(result.value);
  }
  return r;
}

ActionResult Element::Attribute(const std::string& name, std::string& value, bool& present) {
  RemoteObject result;
  ActionResult r = Eval("(n) => this.getAttribute(n)", {EvalArg::Value(name)}, result);
  if (!r.success) {
    return r;
  }

  present = !result.value.is_null();
  value = present ? ValueToString(result.value) : "";
  return r;
}

ActionResult Element::Property(const std::string& name, json& value) {
  RemoteObject result;
  ActionResult r = Eval("(n) => this[n]", {EvalArg::Value(name)}, result);
  if (r.success) {
    value = result.value;
  }
  return r;
}

ActionResult Element::Text(std::string& text) {
  RemoteObject result;
  ActionResult r = EvalWithOptions(JsHelper(js_helper::kText), result);
  if (r.success) {
    text = ValueToString(result.value);
  }
  return r;
}

ActionResult Element::HTML(std::string& html) {
  RemoteObject result;
  ActionResult r = Eval("this.outerHTML", EvalArgs(), result);
  if (r.success) {
    html = ValueToString(result.value);
  }
  return r;
}

ActionResult Element::Visible(bool& visible) {
  RemoteObject result;
  ActionResult r = EvalWithOptions(JsHelper(js_helper::kVisible), result);
  if (r.success) {
    visible = JsonTruthy(result.value);
  }
  return r;
}

ActionResult Element::ContainsElement(const Element& target, bool& contains) {
  RemoteObject result;
  ActionResult r = EvalWithOptions(
      JsHelper(js_helper::kContainsElement, {EvalArg::Object(target.object_id_)}), result);
  if (r.success) {
    contains = JsonTruthy(result.value);
  }
  return r;
}

// ---- Structure ----

ActionResult Element::Describe(int depth, bool pierce, DomNode& node) {
  json result;
  ActionResult r = Call("DOM.describeNode",
                        {{"objectId", object_id_}, {"depth", depth}, {"pierce", pierce}}, result);
  if (!r.success) {
    return r;
  }

  const json* raw = JsonField(result, "node");
  if (!raw || !ParseDomNode(*raw, node)) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "DOM.describeNode returned no node");
  }
  return ActionResult::Success();
}

ActionResult Element::NodeID(int64_t& node_id) {
  ActionResult r = page_->EnableNodeTracking(*scope_);
  if (!r.success) {
    return r;
  }

  json result;
  r = Call("DOM.requestNode", {{"objectId", object_id_}}, result);
  if (r.success) {
    node_id = JsonInt(result, "nodeId");
  }
  return r;
}

ActionResult Element::ShadowRoot(std::unique_ptr<Element>& root) {
  DomNode node;
  ActionResult r = Describe(1, false, node);
  if (!r.success) {
    return r;
  }

  if (node.shadow_root_backend_ids.empty()) {
    return ActionResult::Failure(ActionStatus::ELEMENT_NOT_FOUND, "element has no shadow root");
  }

  json result;
  r = Call("DOM.resolveNode", {{"backendNodeId", node.shadow_root_backend_ids[0]}}, result);
  if (!r.success) {
    return r;
  }

  std::string id;
  if (const json* raw = JsonField(result, "object")) {
    id = JsonString(*raw, "objectId");
  }
  if (id.empty()) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "DOM.resolveNode returned no object");
  }

  root = std::make_unique<Element>(scope_, sleeper_, page_, id);
  return ActionResult::Success();
}

ActionResult Element::Frame(Page*& frame) {
  if (frame_) {
    frame = frame_;
    return ActionResult::Success();
  }

  DomNode node;
  ActionResult r = Describe(1, false, node);
  if (!r.success) {
    return r;
  }

  if (node.frame_id.empty()) {
    return ActionResult::Failure(ActionStatus::ELEMENT_NOT_FOUND,
                                 "element is not a frame owner (" + node.node_name + ")");
  }

  r = page_->DeriveFrame(*scope_, node.frame_id, object_id_, frame_);
  if (!r.success) {
    return r;
  }
  frame = frame_;
  return ActionResult::Success();
}

// ---- Waits ----

ActionResult Element::Wait(const std::string& js, const EvalArgs& args) {
  return WaitEngine::Until(*this, EvalOptions(js, args));
}

ActionResult Element::WaitVisible() {
  return WaitEngine::Until(*this, JsHelper(js_helper::kVisible));
}

ActionResult Element::WaitInvisible() {
  return WaitEngine::Until(*this, JsHelper(js_helper::kInvisible));
}

ActionResult Element::WaitStable(std::chrono::milliseconds interval) {
  return WaitEngine::Stable(*this, interval);
}

ActionResult Element::WaitStable() {
  return WaitEngine::Stable(*this, page_->Config().WaitStableInterval());
}

ActionResult Element::WaitLoad() {
  RemoteObject ignored;
  return EvalWithOptions(JsHelper(js_helper::kWaitLoad), ignored);
}

// ---- Resources ----

ActionResult Element::Resource(std::vector<uint8_t>& data) {
  RemoteObject src;
  ActionResult r = EvalWithOptions(JsHelper(js_helper::kResource), src);
  if (!r.success) {
    return r;
  }

  std::string frame_id;
  r = page_->FrameId(*scope_, frame_id);
  if (!r.success) {
    return r;
  }

  json result;
  r = Call("Page.getResourceContent", {{"frameId", frame_id}, {"url", ValueToString(src.value)}}, result);
  if (!r.success) {
    return r;
  }

  std::string content = JsonString(result, "content");
  if (JsonBool(result, "base64Encoded")) {
    if (!Base64Decode(content, data)) {
      return ActionResult::Failure(ActionStatus::DECODE_ERROR, "resource content is not valid base64");
    }
  } else {
    data.assign(content.begin(), content.end());
  }
  return ActionResult::Success();
}

ActionResult Element::CanvasToImage(const std::string& format, double quality, std::vector<uint8_t>& image) {
  RemoteObject result;
  ActionResult r = Eval("(format, quality) => this.toDataURL(format, quality)",
                        {EvalArg::Value(format), EvalArg::Value(quality)}, result);
  if (!r.success) {
    return r;
  }

  std::string mime;
  if (!ParseDataURI(ValueToString(result.value), mime, image)) {
    return ActionResult::Failure(ActionStatus::DECODE_ERROR, "canvas returned an invalid data URI");
  }
  return ActionResult::Success();
}

ActionResult Element::Screenshot(const std::string& format, int quality, std::vector<uint8_t>& image) {
  ActionResult r = WaitVisible();
  if (!r.success) {
    return r;
  }

  r = ScrollIntoView();
  if (!r.success) {
    return r;
  }

  BoxModel box;
  r = GetBox(box);
  if (!r.success) {
    return r;
  }

  ScreenshotOptions opts;
  opts.format = format;
  opts.quality = quality;
  opts.has_clip = true;
  opts.clip_x = box.content.X();
  opts.clip_y = box.content.Y();
  opts.clip_width = box.content.Width();
  opts.clip_height = box.content.Height();
  opts.clip_scale = 1;

  return page_->Root()->Screenshot(*scope_, opts, image);
}

// ---- Lifecycle ----

ActionResult Element::Release() {
  return page_->Release(*scope_, object_id_);
}

ActionResult Element::Remove() {
  RemoteObject ignored;
  ActionResult r = Eval("this.remove()", EvalArgs(), ignored);
  if (!r.success) {
    return r;
  }
  return Release();
}

// ---- Eval ----

ActionResult Element::Eval(const std::string& js, const EvalArgs& args, RemoteObject& result) {
  return EvalWithOptions(EvalOptions(js, args), result);
}

ActionResult Element::EvalWithOptions(EvalOptions opts, RemoteObject& result) {
  opts.This(object_id_);
  return page_->Evaluate(*scope_, opts, result);
}

ActionResult Element::EnsureOwningPage(int64_t node_id, const std::string& object_id) {
  return FrameResolver::EnsureOwningPage(*this, node_id, object_id);
}

void Element::Rebind(Page* page, const std::string& object_id) {
  LOG_DEBUG("Element", "Rebound " + object_id_ + " to " + object_id);
  page_ = page;
  object_id_ = object_id;
  frame_ = nullptr;
}

}  // namespace talon
