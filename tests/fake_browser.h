#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "action_result.h"
#include "talon_dom_types.h"
#include "talon_protocol_client.h"

namespace talon {
namespace test {

struct FakeNode {
  int64_t node_id = 0;
  int64_t backend_id = 0;
  std::string name;              // Lower-case tag name, "#document" for documents
  std::string frame_id;          // Frame the node lives in
  int64_t parent = 0;
  std::string content_frame;     // iframes: frame of the content document
  Shape quads;
  BoxModel box;
  int z = 0;                     // Hit-testing: higher is on top
  bool visible = true;
  bool removed = false;
  std::map<std::string, std::string> attributes;
  std::string text;
  std::string src;
  std::string data_uri;
  std::vector<int64_t> shadow_roots;  // backend ids
};

struct RecordedCall {
  std::string session_id;
  std::string method;
  json params;
};

// In-process stand-in for a browser target.
//
// Models frames, nodes, remote objects (per-frame execution contexts,
// release), hit-testing on first-quad bounding boxes, and the scripts the
// library evaluates. Every call is recorded. Handlers installed with On()
// take precedence over the model; OnScript() intercepts matching
// Runtime.callFunctionOn declarations.
class FakeBrowser : public ProtocolClient {
public:
  using Handler = std::function<ActionResult(const json& params, json& result)>;
  using ScriptHandler =
      std::function<ActionResult(const FakeNode* self, const json& arguments, json& result)>;

  static constexpr const char* kMainFrame = "main";

  FakeBrowser();

  ActionResult Call(const CancelScope& scope,
                    const std::string& session_id,
                    const std::string& method,
                    const json& params,
                    json& result) override;

  // ---- Model ----

  // Element node in |frame_id|, appended in document order
  int64_t AddNode(const std::string& frame_id, const std::string& name, int64_t parent = 0);

  // iframe element in |parent_frame| whose content document is |frame_id|
  int64_t AddFrame(const std::string& parent_frame, const std::string& frame_id, int64_t parent = 0);

  FakeNode& Node(int64_t node_id);

  // Rectangle quad helper: (x, y) top-left, w x h
  static Quad Rect(double x, double y, double w, double h);
  void SetRect(int64_t node_id, double x, double y, double w, double h, int z = 0);

  // Fresh remote object for the node, as DOM.resolveNode would issue
  std::string ObjectFor(int64_t node_id);
  bool IsReleased(const std::string& object_id) const;

  // New execution context for |frame_id|: objects issued there are released
  void Navigate(const std::string& frame_id);

  void SetScroll(int x, int y);

  // ---- Interception ----

  void On(const std::string& method, Handler handler);
  void Fail(const std::string& method, int code, const std::string& message);
  void OnScript(const std::string& needle, ScriptHandler handler);

  // ---- Inspection ----

  std::vector<RecordedCall> Calls() const;
  std::vector<json> ParamsOf(const std::string& method) const;
  int Count(const std::string& method) const;
  void ClearCalls();

private:
  enum class ObjectKind { NODE, WINDOW, DOCUMENT, HELPERS, LIST };

  struct FakeObject {
    ObjectKind kind = ObjectKind::NODE;
    std::string frame_id;
    int64_t node_id = 0;
    std::string selector;   // LIST
    bool released = false;
  };

  ActionResult Dispatch(const std::string& method, const json& params, json& result);
  ActionResult CallFunctionOn(const json& params, json& result);
  ActionResult DescribeNode(const json& params, json& result);
  ActionResult ResolveNode(const json& params, json& result);
  ActionResult NodeForLocation(const json& params, json& result);

  // Looks up a live object; PROTOCOL_ERROR for unknown or released ids
  ActionResult LiveObject(const std::string& method, const json& params, FakeObject*& object);

  std::string NewObject(ObjectKind kind, const std::string& frame_id, int64_t node_id = 0);
  std::string WindowOf(const std::string& frame_id);
  json NodeDescription(const FakeNode& node, const std::string& object_id) const;
  bool IsInside(int64_t node_id, int64_t ancestor_id) const;
  int64_t DocumentOf(const std::string& frame_id) const;
  // iframe hosting |frame_id| while it and its ancestors are attached, else 0
  int64_t FrameOwner(const std::string& frame_id) const;

  static ActionResult Error(const std::string& method, const std::string& message);
  static json Value(const json& value);
  static json Undefined();

  mutable std::recursive_mutex mutex_;
  std::vector<RecordedCall> calls_;
  std::map<std::string, Handler> handlers_;
  std::vector<std::pair<std::string, ScriptHandler>> scripts_;

  std::map<int64_t, FakeNode> nodes_;
  std::map<int64_t, int64_t> backend_to_node_;
  std::map<std::string, int64_t> frame_documents_;
  std::map<std::string, FakeObject> objects_;
  int64_t next_node_id_ = 1;
  int next_object_id_ = 1;
  int scroll_x_ = 0;
  int scroll_y_ = 0;
};

}  // namespace test
}  // namespace talon
