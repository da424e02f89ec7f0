#include "talon_dom_types.h"

namespace talon {

bool ParseQuad(const json& value, Quad& out) {
  if (!value.is_array() || value.size() != 8) {
    return false;
  }
  for (size_t i = 0; i < 8; i++) {
    if (!value[i].is_number()) {
      return false;
    }
    out.points[i] = value[i].get<double>();
  }
  return true;
}

bool ParseShape(const json& result, Shape& out) {
  const json* quads = JsonField(result, "quads");
  if (!quads || !quads->is_array()) {
    return false;
  }

  Shape shape;
  shape.reserve(quads->size());
  for (const auto& raw : *quads) {
    Quad quad;
    if (!ParseQuad(raw, quad)) {
      return false;
    }
    shape.push_back(quad);
  }
  out.swap(shape);
  return true;
}

bool ParseBoxModel(const json& result, BoxModel& out) {
  const json* model = JsonField(result, "model");
  if (!model || !model->is_object()) {
    return false;
  }

  const json* content = JsonField(*model, "content");
  const json* padding = JsonField(*model, "padding");
  const json* border = JsonField(*model, "border");
  const json* margin = JsonField(*model, "margin");
  if (!content || !padding || !border || !margin) {
    return false;
  }

  BoxModel box;
  if (!ParseQuad(*content, box.content) || !ParseQuad(*padding, box.padding) ||
      !ParseQuad(*border, box.border) || !ParseQuad(*margin, box.margin)) {
    return false;
  }
  box.width = static_cast<int>(JsonInt(*model, "width"));
  box.height = static_cast<int>(JsonInt(*model, "height"));
  out = box;
  return true;
}

bool ParseDomNode(const json& node, DomNode& out) {
  if (!node.is_object()) {
    return false;
  }

  DomNode parsed;
  parsed.node_id = JsonInt(node, "nodeId");
  parsed.backend_node_id = JsonInt(node, "backendNodeId");
  parsed.node_type = static_cast<int>(JsonInt(node, "nodeType"));
  parsed.node_name = JsonString(node, "nodeName");
  parsed.frame_id = JsonString(node, "frameId");

  if (const json* roots = JsonField(node, "shadowRoots")) {
    if (roots->is_array()) {
      for (const auto& root : *roots) {
        parsed.shadow_root_backend_ids.push_back(JsonInt(root, "backendNodeId"));
      }
    }
  }

  if (const json* doc = JsonField(node, "contentDocument")) {
    parsed.content_document_backend_id = JsonInt(*doc, "backendNodeId");
  }

  out = parsed;
  return true;
}

}  // namespace talon
