#include "talon_page.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>
#include "logger.h"
#include "talon_dom_types.h"
#include "talon_element.h"
#include "talon_encoding.h"
#include "talon_js_helpers.h"

namespace talon {

namespace {

// Chrome's messages when an object id is stale or belongs to another context
bool IsForeignObjectError(const ActionResult& result) {
  if (result.status != ActionStatus::PROTOCOL_ERROR) {
    return false;
  }
  static const char* kMessages[] = {
    "Could not find object with given id",
    "Cannot find context with specified id",
    "Argument should belong to the same JavaScript world as target object",
  };
  for (const char* msg : kMessages) {
    if (result.message.find(msg) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool IsFunctionExpression(const std::string& js) {
  static const std::regex fn_regex(
      R"(^\s*(async\s+)?(function\b|\([^)]*\)\s*=>|[A-Za-z_$][\w$]*\s*=>))");
  return std::regex_search(js, fn_regex);
}

bool IsArrayIndex(const std::string& name) {
  return !name.empty() &&
         std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string ExceptionDescription(const json& details) {
  if (const json* exception = JsonField(details, "exception")) {
    std::string desc = JsonString(*exception, "description");
    if (!desc.empty()) return desc;
  }
  return JsonString(details, "text", "exception");
}

}  // namespace

Page::Page(ProtocolClient* client, std::string session_id, TalonConfig config)
    : client_(client),
      session_id_(std::move(session_id)),
      config_(std::move(config)),
      root_(this) {
  keyboard_ = std::make_unique<ProtocolKeyboard>(client_, session_id_);
  mouse_ = std::make_unique<Mouse>(client_, session_id_, keyboard_.get());
  touch_ = std::make_unique<ProtocolTouch>(client_, session_id_, keyboard_.get());
  LOG_DEBUG("Page", "Created page for session '" + session_id_ + "'");
}

Page::Page(Page* parent, std::string frame_id, std::string owner_object_id)
    : client_(parent->client_),
      session_id_(parent->session_id_),
      config_(parent->config_),
      root_(parent->root_),
      parent_(parent),
      frame_id_(std::move(frame_id)),
      owner_object_id_(std::move(owner_object_id)) {}

Page::~Page() = default;

ActionResult Page::Call(const CancelScope& scope, const std::string& method,
                        const json& params, json& result) {
  if (scope.Done()) {
    return scope.Err();
  }
  LOG_DEBUG("Page", "-> " + method);
  return client_->Call(scope, session_id_, method, params, result);
}

ActionResult Page::FrameId(const CancelScope& scope, std::string& frame_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!frame_id_.empty()) {
      frame_id = frame_id_;
      return ActionResult::Success();
    }
  }

  if (IsFrame()) {
    return ActionResult::Failure(ActionStatus::ELEMENT_NOT_FOUND, "iframe has no frame id");
  }

  json result;
  ActionResult r = Call(scope, "Page.getFrameTree", json::object(), result);
  if (!r.success) {
    return r;
  }

  std::string id;
  if (const json* tree = JsonField(result, "frameTree")) {
    if (const json* frame = JsonField(*tree, "frame")) {
      id = JsonString(*frame, "id");
    }
  }
  if (id.empty()) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "Page.getFrameTree returned no frame id");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  frame_id_ = id;
  frame_id = id;
  return ActionResult::Success();
}

ActionResult Page::WindowObject(const CancelScope& scope, std::string& object_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!window_object_id_.empty()) {
      object_id = window_object_id_;
      return ActionResult::Success();
    }
  }

  std::string id;
  json result;

  if (!IsFrame()) {
    ActionResult r = Call(scope, "Runtime.evaluate", {{"expression", "window"}}, result);
    if (!r.success) {
      return r;
    }
    if (const json* raw = JsonField(result, "result")) {
      id = JsonString(*raw, "objectId");
    }
  } else {
    // window of an iframe: owner -> content document -> defaultView
    json params = {{"objectId", OwnerObjectId()}, {"depth", 1}, {"pierce", true}};
    ActionResult r = Call(scope, "DOM.describeNode", params, result);
    if (!r.success) {
      return r;
    }

    DomNode owner;
    const json* node = JsonField(result, "node");
    if (!node || !ParseDomNode(*node, owner) || owner.content_document_backend_id == 0) {
      return ActionResult::Failure(ActionStatus::ELEMENT_NOT_FOUND, "iframe has no content document");
    }

    json resolved;
    r = Call(scope, "DOM.resolveNode", {{"backendNodeId", owner.content_document_backend_id}}, resolved);
    if (!r.success) {
      return r;
    }
    std::string document_id;
    if (const json* raw = JsonField(resolved, "object")) {
      document_id = JsonString(*raw, "objectId");
    }

    json view;
    json call = {
      {"objectId", document_id},
      {"functionDeclaration", "function() { return this.defaultView }"},
      {"returnByValue", false}
    };
    r = Call(scope, "Runtime.callFunctionOn", call, view);
    if (!r.success) {
      return r;
    }
    if (const json* raw = JsonField(view, "result")) {
      id = JsonString(*raw, "objectId");
    }

    r = Release(scope, document_id);
    if (!r.success) {
      LOG_WARN("Page", "Failed to release content document: " + r.message);
    }
  }

  if (id.empty()) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "window object not available");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (window_object_id_.empty()) {
    window_object_id_ = id;
  }
  object_id = window_object_id_;
  return ActionResult::Success();
}

ActionResult Page::HelperObject(const CancelScope& scope, std::string& object_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!helper_object_id_.empty()) {
      object_id = helper_object_id_;
      return ActionResult::Success();
    }
  }

  std::string window;
  ActionResult r = WindowObject(scope, window);
  if (!r.success) {
    return r;
  }

  json result;
  json params = {
    {"objectId", window},
    {"functionDeclaration", HelperObjectSource()},
    {"returnByValue", false}
  };
  r = Call(scope, "Runtime.callFunctionOn", params, result);
  if (!r.success) {
    return r;
  }

  std::string id;
  if (const json* raw = JsonField(result, "result")) {
    id = JsonString(*raw, "objectId");
  }
  if (id.empty()) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "helper object not created");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (helper_object_id_.empty()) {
    helper_object_id_ = id;
  }
  object_id = helper_object_id_;
  return ActionResult::Success();
}

ActionResult Page::Evaluate(const CancelScope& scope, const EvalOptions& opts, RemoteObject& out) {
  std::string this_id = opts.this_id;
  if (this_id.empty()) {
    ActionResult r = WindowObject(scope, this_id);
    if (!r.success) {
      return r;
    }
  }

  json args = json::array();
  if (opts.use_helper) {
    std::string helper;
    ActionResult r = HelperObject(scope, helper);
    if (!r.success) {
      return r;
    }
    args.push_back(EvalArg::Object(helper).ToProtocol());
  }
  for (const auto& arg : opts.args) {
    args.push_back(arg.ToProtocol());
  }

  std::string fn = IsFunctionExpression(opts.js) ? opts.js : "() => (" + opts.js + ")";
  json params = {
    {"objectId", this_id},
    {"functionDeclaration", "function() { return (" + fn + ").apply(this, arguments) }"},
    {"arguments", args},
    {"returnByValue", opts.by_value},
    {"awaitPromise", opts.await_promise},
    {"userGesture", opts.by_user}
  };

  json result;
  ActionResult r = Call(scope, "Runtime.callFunctionOn", params, result);
  if (!r.success) {
    return r;
  }

  if (const json* details = JsonField(result, "exceptionDetails")) {
    std::string desc = ExceptionDescription(*details);
    LOG_WARN("Page", "Script threw: " + desc);
    return ActionResult::EvalError(desc);
  }

  const json* raw = JsonField(result, "result");
  if (!raw) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "Runtime.callFunctionOn returned no result");
  }
  out = ParseRemoteObject(*raw);
  return ActionResult::Success();
}

ActionResult Page::ElementFromPoint(const CancelScope& scope, int x, int y, RemoteObject& out) {
  json located;
  json params = {{"x", x}, {"y", y}, {"includeUserAgentShadowDOM", true}};
  ActionResult r = Call(scope, "DOM.getNodeForLocation", params, located);
  if (!r.success) {
    return r;
  }

  json resolved;
  r = Call(scope, "DOM.resolveNode", {{"backendNodeId", JsonInt(located, "backendNodeId")}}, resolved);
  if (!r.success) {
    return r;
  }

  const json* raw = JsonField(resolved, "object");
  if (!raw) {
    return ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "DOM.resolveNode returned no object");
  }
  out = ParseRemoteObject(*raw);
  return ActionResult::Success();
}

Element Page::ElementFromObject(const CancelScopePtr& scope, const std::string& object_id) {
  return Element(scope, config_.MakeSleeperFactory(), this, object_id);
}

ActionResult Page::Elements(const CancelScope& scope, const std::string& selector,
                            std::vector<std::string>& object_ids) {
  EvalOptions opts("(s) => this.document.querySelectorAll(s)", {EvalArg::Value(selector)});
  opts.ByObject();

  RemoteObject list;
  ActionResult r = Evaluate(scope, opts, list);
  if (!r.success) {
    return r;
  }

  object_ids.clear();
  if (list.object_id.empty()) {
    return ActionResult::Success();
  }

  json props;
  r = Call(scope, "Runtime.getProperties", {{"objectId", list.object_id}, {"ownProperties", true}}, props);
  if (!r.success) {
    return r;
  }

  std::vector<std::pair<long, std::string>> indexed;
  if (const json* entries = JsonField(props, "result")) {
    if (entries->is_array()) {
      for (const auto& entry : *entries) {
        std::string name = JsonString(entry, "name");
        const json* value = JsonField(entry, "value");
        if (!IsArrayIndex(name) || !value) continue;
        indexed.emplace_back(std::stol(name), JsonString(*value, "objectId"));
      }
    }
  }
  std::sort(indexed.begin(), indexed.end());
  for (auto& item : indexed) {
    object_ids.push_back(std::move(item.second));
  }

  return Release(scope, list.object_id);
}

ActionResult Page::HasObject(const CancelScope& scope, const std::string& object_id, bool& has) {
  std::string window;
  ActionResult r = WindowObject(scope, window);
  if (!r.success) {
    return r;
  }

  json result;
  json params = {
    {"objectId", window},
    {"functionDeclaration", "function(obj) { return true }"},
    {"arguments", json::array({EvalArg::Object(object_id).ToProtocol()})},
    {"returnByValue", true}
  };
  r = Call(scope, "Runtime.callFunctionOn", params, result);
  if (!r.success) {
    if (IsForeignObjectError(r)) {
      has = false;
      return ActionResult::Success();
    }
    return r;
  }

  has = true;
  return ActionResult::Success();
}

ActionResult Page::ResolveNode(const CancelScope& scope, int64_t node_id, std::string& object_id) {
  object_id.clear();

  json result;
  ActionResult r = Call(scope, "DOM.resolveNode", {{"nodeId", node_id}}, result);
  if (!r.success) {
    if (r.status == ActionStatus::PROTOCOL_ERROR &&
        r.message.find("No node with given id") != std::string::npos) {
      return ActionResult::Success();
    }
    return r;
  }

  std::string id;
  if (const json* raw = JsonField(result, "object")) {
    id = JsonString(*raw, "objectId");
  }
  if (id.empty()) {
    return ActionResult::Success();
  }

  bool has = false;
  r = HasObject(scope, id, has);
  if (!r.success) {
    return r;
  }
  if (!has) {
    return Release(scope, id);
  }

  object_id = id;
  return ActionResult::Success();
}

ActionResult Page::EnableNodeTracking(const CancelScope& scope) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (node_tracking_) {
      return ActionResult::Success();
    }
  }

  json result;
  ActionResult r = Call(scope, "DOM.getDocument", {{"depth", 1}}, result);
  if (!r.success) {
    return r;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  node_tracking_ = true;
  return ActionResult::Success();
}

ActionResult Page::Release(const CancelScope& scope, const std::string& object_id) {
  json ignored;
  return Call(scope, "Runtime.releaseObject", {{"objectId", object_id}}, ignored);
}

ActionResult Page::Screenshot(const CancelScope& scope, const ScreenshotOptions& opts,
                              std::vector<uint8_t>& image) {
  json params = {{"format", opts.format}};
  if (opts.quality >= 0 && opts.format != "png") {
    params["quality"] = opts.quality;
  }
  if (opts.has_clip) {
    params["clip"] = {
      {"x", opts.clip_x},
      {"y", opts.clip_y},
      {"width", opts.clip_width},
      {"height", opts.clip_height},
      {"scale", opts.clip_scale}
    };
  }

  json result;
  ActionResult r = Call(scope, "Page.captureScreenshot", params, result);
  if (!r.success) {
    return r;
  }

  if (!Base64Decode(JsonString(result, "data"), image)) {
    return ActionResult::Failure(ActionStatus::DECODE_ERROR, "screenshot data is not valid base64");
  }
  return ActionResult::Success();
}

ActionResult Page::DeriveFrame(const CancelScope& scope, const std::string& frame_id,
                              const std::string& owner_object_id, Page*& frame) {
  struct Sibling {
    Page* page;
    std::string frame_id;
  };
  std::vector<Sibling> siblings;

  {
    std::lock_guard<std::mutex> lock(root_->mutex_);
    for (const auto& entry : root_->frames_) {
      if (entry->parent_ != this) {
        continue;
      }
      std::lock_guard<std::mutex> frame_lock(entry->mutex_);
      if (entry->frame_id_ == frame_id) {
        // The frame may have navigated since the last lookup
        entry->ResetFrameLocked(frame_id, owner_object_id);
        frame = entry.get();
        return ActionResult::Success();
      }
      siblings.push_back({entry.get(), entry->frame_id_});
    }
  }

  // Take over an entry whose frame was detached from the document
  Page* vacant = nullptr;
  std::string vacant_frame_id;
  for (const auto& sibling : siblings) {
    bool gone = false;
    ActionResult r = FrameGone(scope, sibling.frame_id, gone);
    if (!r.success) {
      return r;
    }
    if (gone) {
      vacant = sibling.page;
      vacant_frame_id = sibling.frame_id;
      break;
    }
  }

  std::lock_guard<std::mutex> lock(root_->mutex_);
  for (const auto& entry : root_->frames_) {
    if (entry->parent_ != this) {
      continue;
    }
    std::lock_guard<std::mutex> frame_lock(entry->mutex_);
    if (entry->frame_id_ == frame_id) {
      entry->ResetFrameLocked(frame_id, owner_object_id);
      frame = entry.get();
      return ActionResult::Success();
    }
  }

  if (vacant) {
    std::lock_guard<std::mutex> frame_lock(vacant->mutex_);
    if (vacant->frame_id_ == vacant_frame_id) {
      LOG_DEBUG("Page", "Reusing frame page " + vacant_frame_id + " for " + frame_id);
      vacant->ResetFrameLocked(frame_id, owner_object_id);
      frame = vacant;
      return ActionResult::Success();
    }
  }

  root_->frames_.emplace_back(new Page(this, frame_id, owner_object_id));
  LOG_DEBUG("Page", "Derived frame page " + frame_id);
  frame = root_->frames_.back().get();
  return ActionResult::Success();
}

void Page::ResetFrameLocked(const std::string& frame_id, const std::string& owner_object_id) {
  frame_id_ = frame_id;
  owner_object_id_ = owner_object_id;
  window_object_id_.clear();
  helper_object_id_.clear();
  node_tracking_ = false;
}

ActionResult Page::FrameGone(const CancelScope& scope, const std::string& frame_id, bool& gone) {
  gone = false;
  json ignored;
  ActionResult r = Call(scope, "DOM.getFrameOwner", {{"frameId", frame_id}}, ignored);
  if (r.status == ActionStatus::PROTOCOL_ERROR &&
      r.message.find("Frame with the given id was not found") != std::string::npos) {
    gone = true;
    return ActionResult::Success();
  }
  return r;
}

std::string Page::OwnerObjectId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return owner_object_id_;
}

size_t Page::FrameCount() const {
  std::lock_guard<std::mutex> lock(root_->mutex_);
  return root_->frames_.size();
}

void Page::TrySlowMotion(const CancelScope& scope) const {
  if (config_.slow_motion_ms <= 0) {
    return;
  }
  if (!scope.SleepFor(std::chrono::milliseconds(config_.slow_motion_ms))) {
    LOG_DEBUG("Page", "Slow motion interrupted");
  }
}

InputTrace::InputTrace(const Page& page, std::string what)
    : enabled_(page.Config().trace_input),
      what_(std::move(what)),
      start_(std::chrono::steady_clock::now()) {
  if (enabled_) {
    LOG_INFO("Input", "input: " + what_);
  }
}

InputTrace::~InputTrace() {
  if (enabled_) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
    LOG_INFO("Input", "input: " + what_ + " done (" + std::to_string(elapsed) + "ms)");
  }
}

}  // namespace talon
