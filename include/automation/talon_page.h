#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "action_result.h"
#include "talon_cancel_scope.h"
#include "talon_config.h"
#include "talon_eval_options.h"
#include "talon_keyboard.h"
#include "talon_mouse.h"
#include "talon_protocol_client.h"
#include "talon_touch.h"

namespace talon {

class Element;

// Clip rectangle and encoding for Page.captureScreenshot
struct ScreenshotOptions {
  std::string format = "png";   // png, jpeg or webp
  int quality = -1;             // 0-100, jpeg/webp only (-1 = browser default)
  bool has_clip = false;
  double clip_x = 0;
  double clip_y = 0;
  double clip_width = 0;
  double clip_height = 0;
  double clip_scale = 1;
};

// A document in the remote browser: the main frame of a target session, or
// an iframe inside it.
//
// The root page owns the input devices and every frame page derived from it;
// frame pages share the root's session and input devices. All calls take the
// caller's cancel scope. Cached helper/window references and the frame
// registry are guarded by the page mutex; protocol calls run unlocked.
class Page {
public:
  Page(ProtocolClient* client, std::string session_id, TalonConfig config = TalonConfig());
  ~Page();

  Page(const Page&) = delete;
  Page& operator=(const Page&) = delete;

  // Identity
  ProtocolClient* Client() const { return client_; }
  const std::string& SessionId() const { return session_id_; }
  const TalonConfig& Config() const { return config_; }
  bool IsFrame() const { return parent_ != nullptr; }
  Page* Parent() const { return parent_; }
  Page* Root() { return root_; }
  std::string OwnerObjectId() const;

  // Frame id of this document. Fetched from Page.getFrameTree for the root.
  ActionResult FrameId(const CancelScope& scope, std::string& frame_id);

  // Input devices (always the root page's)
  Mouse& GetMouse() { return *root_->mouse_; }
  ProtocolKeyboard& GetKeyboard() { return *root_->keyboard_; }
  Touch& GetTouch() { return *root_->touch_; }

  // Raw call in this page's session
  ActionResult Call(const CancelScope& scope, const std::string& method,
                    const json& params, json& result);

  // Run a function in the page. |this| is opts.this_id, or the page's window.
  ActionResult Evaluate(const CancelScope& scope, const EvalOptions& opts, RemoteObject& out);

  // Hit-test: the object on top at document point (x, y)
  ActionResult ElementFromPoint(const CancelScope& scope, int x, int y, RemoteObject& out);

  // Handle bound to |scope| and the page's configured sleeper
  Element ElementFromObject(const CancelScopePtr& scope, const std::string& object_id);

  // querySelectorAll in document order
  ActionResult Elements(const CancelScope& scope, const std::string& selector,
                        std::vector<std::string>& object_ids);

  // Whether |object_id| lives in this page's execution context
  ActionResult HasObject(const CancelScope& scope, const std::string& object_id, bool& has);

  // Resolve |node_id| to an object in this page. |object_id| is left empty
  // if the node is unknown or belongs to another frame.
  ActionResult ResolveNode(const CancelScope& scope, int64_t node_id, std::string& object_id);

  // DOM.getDocument once per page, so DOM.requestNode can hand out node ids
  ActionResult EnableNodeTracking(const CancelScope& scope);

  ActionResult Release(const CancelScope& scope, const std::string& object_id);

  ActionResult Screenshot(const CancelScope& scope, const ScreenshotOptions& opts,
                          std::vector<uint8_t>& image);

  // Page for the iframe |owner_object_id| whose content frame is |frame_id|.
  // Owned by the root's frame registry and never freed while the root lives.
  // An entry is reused for the same parent and frame, or taken over from a
  // sibling whose iframe is gone. Either way its cached window and helper
  // objects are dropped.
  ActionResult DeriveFrame(const CancelScope& scope, const std::string& frame_id,
                           const std::string& owner_object_id, Page*& frame);

  size_t FrameCount() const;

  // Sleep config().slow_motion_ms before an input action
  void TrySlowMotion(const CancelScope& scope) const;

private:
  Page(Page* parent, std::string frame_id, std::string owner_object_id);

  ActionResult WindowObject(const CancelScope& scope, std::string& object_id);
  ActionResult HelperObject(const CancelScope& scope, std::string& object_id);

  // Rebinds a frame page to a (possibly new) document. Caller holds mutex_.
  void ResetFrameLocked(const std::string& frame_id, const std::string& owner_object_id);

  // Whether |frame_id| is no longer attached to the target
  ActionResult FrameGone(const CancelScope& scope, const std::string& frame_id, bool& gone);

  ProtocolClient* client_;
  std::string session_id_;
  TalonConfig config_;

  Page* root_;
  Page* parent_ = nullptr;

  // Root only
  std::unique_ptr<ProtocolKeyboard> keyboard_;
  std::unique_ptr<Mouse> mouse_;
  std::unique_ptr<ProtocolTouch> touch_;
  std::vector<std::unique_ptr<Page>> frames_;

  mutable std::mutex mutex_;
  std::string frame_id_;
  std::string owner_object_id_;   // iframe element, frame pages only
  std::string window_object_id_;
  std::string helper_object_id_;
  bool node_tracking_ = false;
};

// Logs "input: <what>" at INFO on entry and exit when input tracing is on
class InputTrace {
public:
  InputTrace(const Page& page, std::string what);
  ~InputTrace();

  InputTrace(const InputTrace&) = delete;
  InputTrace& operator=(const InputTrace&) = delete;

private:
  bool enabled_;
  std::string what_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace talon
