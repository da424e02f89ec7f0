#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace talon {

using json = nlohmann::json;

// Type-checked field access. Protocol payloads come from the remote side, so
// a missing or mistyped field yields the fallback instead of throwing.

inline const json* JsonField(const json& obj, const char* key) {
  if (!obj.is_object()) return nullptr;
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &*it;
}

inline std::string JsonString(const json& obj, const char* key, const std::string& fallback = "") {
  const json* v = JsonField(obj, key);
  return (v && v->is_string()) ? v->get<std::string>() : fallback;
}

inline int64_t JsonInt(const json& obj, const char* key, int64_t fallback = 0) {
  const json* v = JsonField(obj, key);
  if (!v) return fallback;
  if (v->is_number_integer()) return v->get<int64_t>();
  if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
  return fallback;
}

inline double JsonDouble(const json& obj, const char* key, double fallback = 0.0) {
  const json* v = JsonField(obj, key);
  return (v && v->is_number()) ? v->get<double>() : fallback;
}

inline bool JsonBool(const json& obj, const char* key, bool fallback = false) {
  const json* v = JsonField(obj, key);
  return (v && v->is_boolean()) ? v->get<bool>() : fallback;
}

// Truthiness of a by-value JSON result, matching how JS predicates are read
inline bool JsonTruthy(const json& value) {
  if (value.is_boolean()) return value.get<bool>();
  if (value.is_number()) return value.get<double>() != 0.0;
  if (value.is_string()) return !value.get<std::string>().empty();
  if (value.is_null()) return false;
  return true;
}

}  // namespace talon
