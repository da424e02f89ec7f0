#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "talon_json.h"

namespace talon {

// Four points (x1,y1 .. x4,y4) clockwise from the top-left corner
struct Quad {
  std::array<double, 8> points{};

  double CenterX() const { return (points[0] + points[2] + points[4] + points[6]) / 4; }
  double CenterY() const { return (points[1] + points[3] + points[5] + points[7]) / 4; }

  // Axis-aligned reading used for box model content rectangles
  double X() const { return points[0]; }
  double Y() const { return points[1]; }
  double Width() const { return points[2] - points[0]; }
  double Height() const { return points[5] - points[1]; }

  bool operator==(const Quad& other) const { return points == other.points; }
  bool operator!=(const Quad& other) const { return !(*this == other); }
};

// Rendered footprint of an element; a non-convex element needs several quads.
// Empty when the element is not rendered.
using Shape = std::vector<Quad>;

struct BoxModel {
  Quad content;
  Quad padding;
  Quad border;
  Quad margin;
  int width = 0;
  int height = 0;
};

struct DomNode {
  int64_t node_id = 0;
  int64_t backend_node_id = 0;
  int node_type = 0;
  std::string node_name;
  std::string frame_id;                         // Set for frame owners (iframe)
  std::vector<int64_t> shadow_root_backend_ids;
  int64_t content_document_backend_id = 0;      // 0 when absent
};

// Parsers for protocol payloads; return false on malformed input
bool ParseQuad(const json& value, Quad& out);
bool ParseShape(const json& result, Shape& out);      // DOM.getContentQuads result
bool ParseBoxModel(const json& result, BoxModel& out);  // DOM.getBoxModel result
bool ParseDomNode(const json& node, DomNode& out);    // DOM.Node object

}  // namespace talon
