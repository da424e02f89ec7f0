#pragma once

#include <string>
#include <vector>
#include "talon_json.h"

namespace talon {

// One argument of an in-page call: a JSON value, or a reference to a remote object
struct EvalArg {
  json value;
  std::string object_id;  // Non-empty = pass the remote object itself

  static EvalArg Value(json v) {
    EvalArg a;
    a.value = std::move(v);
    return a;
  }

  static EvalArg Object(std::string id) {
    EvalArg a;
    a.object_id = std::move(id);
    return a;
  }

  json ToProtocol() const {
    if (!object_id.empty()) {
      return {{"objectId", object_id}};
    }
    return {{"value", value}};
  }
};

using EvalArgs = std::vector<EvalArg>;

// Options for Runtime.callFunctionOn.
// |js| is either a function expression ("(a) => this.x(a)") or a plain
// expression ("this.outerHTML"), which is wrapped into an arrow function.
struct EvalOptions {
  std::string js;
  EvalArgs args;
  std::string this_id;        // Empty = the page's window object
  bool by_value = true;       // returnByValue
  bool by_user = false;       // userGesture
  bool await_promise = true;
  bool use_helper = false;    // Prepend the page's helper object as the first argument

  EvalOptions() = default;
  EvalOptions(std::string script, EvalArgs arguments)
      : js(std::move(script)), args(std::move(arguments)) {}

  EvalOptions& This(const std::string& id) { this_id = id; return *this; }
  EvalOptions& ByUser() { by_user = true; return *this; }
  EvalOptions& ByObject() { by_value = false; return *this; }
};

// The protocol's Runtime.RemoteObject, reduced to the fields callers read
struct RemoteObject {
  std::string type;
  std::string subtype;
  std::string class_name;
  std::string description;
  std::string object_id;   // Empty for primitives and by-value results
  json value;              // Null unless returned by value

  bool IsNull() const { return subtype == "null" || type == "undefined"; }
};

inline RemoteObject ParseRemoteObject(const json& raw) {
  RemoteObject obj;
  obj.type = JsonString(raw, "type");
  obj.subtype = JsonString(raw, "subtype");
  obj.class_name = JsonString(raw, "className");
  obj.description = JsonString(raw, "description");
  obj.object_id = JsonString(raw, "objectId");
  if (const json* v = JsonField(raw, "value")) {
    obj.value = *v;
  }
  return obj;
}

}  // namespace talon
