#include "talon_config.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include "talon_json.h"

namespace talon {

namespace {

bool ReadIntKey(const json& doc, const char* key, int& out) {
  const json* v = JsonField(doc, key);
  if (!v) return true;
  if (!v->is_number_integer()) {
    LOG_WARN("Config", std::string("Ignoring '") + key + "': expected integer");
    return false;
  }
  out = v->get<int>();
  return true;
}

bool ReadDoubleKey(const json& doc, const char* key, double& out) {
  const json* v = JsonField(doc, key);
  if (!v) return true;
  if (!v->is_number()) {
    LOG_WARN("Config", std::string("Ignoring '") + key + "': expected number");
    return false;
  }
  out = v->get<double>();
  return true;
}

bool ReadBoolKey(const json& doc, const char* key, bool& out) {
  const json* v = JsonField(doc, key);
  if (!v) return true;
  if (!v->is_boolean()) {
    LOG_WARN("Config", std::string("Ignoring '") + key + "': expected boolean");
    return false;
  }
  out = v->get<bool>();
  return true;
}

bool ReadStringKey(const json& doc, const char* key, std::string& out) {
  const json* v = JsonField(doc, key);
  if (!v) return true;
  if (!v->is_string()) {
    LOG_WARN("Config", std::string("Ignoring '") + key + "': expected string");
    return false;
  }
  out = v->get<std::string>();
  return true;
}

bool EnvInt(const char* name, int& out) {
  const char* value = std::getenv(name);
  if (!value || !*value) return false;

  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0') {
    LOG_WARN("Config", std::string("Ignoring ") + name + "=" + value + ": not an integer");
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

}  // namespace

bool TalonConfig::LoadFromString(const std::string& text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    LOG_ERROR("Config", "Config is not a JSON object");
    return false;
  }

  std::string level_name;
  if (ReadStringKey(doc, "log_level", level_name) && !level_name.empty()) {
    TalonLogger::Level level;
    if (TalonLogger::Logger::ParseLevel(level_name, level)) {
      log_level = level;
    } else {
      LOG_WARN("Config", "Unknown log_level: " + level_name);
    }
  }
  ReadStringKey(doc, "log_file", log_file);

  ReadIntKey(doc, "slow_motion_ms", slow_motion_ms);
  ReadBoolKey(doc, "trace_input", trace_input);

  ReadIntKey(doc, "sleeper_initial_ms", sleeper_initial_ms);
  ReadIntKey(doc, "sleeper_max_ms", sleeper_max_ms);
  ReadDoubleKey(doc, "sleeper_multiplier", sleeper_multiplier);
  ReadIntKey(doc, "sleeper_max_attempts", sleeper_max_attempts);
  ReadIntKey(doc, "wait_stable_interval_ms", wait_stable_interval_ms);

  ReadIntKey(doc, "protocol_timeout_ms", protocol_timeout_ms);
  return true;
}

bool TalonConfig::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Config", "Cannot open config file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!LoadFromString(buffer.str())) {
    LOG_ERROR("Config", "Invalid config file: " + path);
    return false;
  }

  LOG_INFO("Config", "Loaded config from " + path);
  return true;
}

void TalonConfig::ApplyEnvironment() {
  if (const char* level_name = std::getenv("TALON_LOG_LEVEL")) {
    TalonLogger::Level level;
    if (TalonLogger::Logger::ParseLevel(level_name, level)) {
      log_level = level;
    } else {
      LOG_WARN("Config", std::string("Unknown TALON_LOG_LEVEL: ") + level_name);
    }
  }
  if (const char* file = std::getenv("TALON_LOG_FILE")) {
    log_file = file;
  }

  EnvInt("TALON_SLOW_MOTION_MS", slow_motion_ms);

  if (const char* trace = std::getenv("TALON_TRACE")) {
    std::string value = trace;
    trace_input = !(value.empty() || value == "0" || value == "false");
  }

  EnvInt("TALON_SLEEPER_MAX_ATTEMPTS", sleeper_max_attempts);
  EnvInt("TALON_PROTOCOL_TIMEOUT_MS", protocol_timeout_ms);
}

void TalonConfig::ApplyLogging() const {
  if (log_file.empty()) {
    TalonLogger::Logger::Init();
  } else {
    TalonLogger::Logger::Init(log_file);
  }
  TalonLogger::Logger::SetLevel(log_level);
}

}  // namespace talon
