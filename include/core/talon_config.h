#pragma once

#include <chrono>
#include <string>
#include "logger.h"
#include "talon_sleeper.h"

namespace talon {

// Interaction settings shared by a page and every element created from it.
// Priority order: environment variables > config file > defaults.
struct TalonConfig {
  // Logging
  TalonLogger::Level log_level = TalonLogger::INFO;
  std::string log_file;                 // Empty = stderr only

  // Pacing
  int slow_motion_ms = 0;               // Delay before each input action (0 = off)
  bool trace_input = false;             // Log every input action at INFO

  // Wait backoff (defaults match a 100ms..1s exponential poll)
  int sleeper_initial_ms = 100;
  int sleeper_max_ms = 1000;
  double sleeper_multiplier = 2.0;
  int sleeper_max_attempts = 0;         // 0 = poll until the scope ends

  int wait_stable_interval_ms = 100;    // Fixed sampling interval for WaitStable

  // Transport
  int protocol_timeout_ms = 30000;      // Per-call timeout for CefProtocolClient (0 = none)

  SleeperFactory MakeSleeperFactory() const {
    return MakeBackoffSleeperFactory(std::chrono::milliseconds(sleeper_initial_ms),
                                     std::chrono::milliseconds(sleeper_max_ms),
                                     sleeper_multiplier,
                                     sleeper_max_attempts);
  }

  std::chrono::milliseconds WaitStableInterval() const {
    return std::chrono::milliseconds(wait_stable_interval_ms);
  }

  // Merge keys from a JSON document. Unknown or mistyped keys are logged and
  // skipped. Returns false only if |text| is not valid JSON object.
  bool LoadFromString(const std::string& text);

  // Read and merge a JSON config file. Returns false if unreadable or invalid.
  bool LoadFromFile(const std::string& path);

  // Apply TALON_LOG_LEVEL, TALON_LOG_FILE, TALON_SLOW_MOTION_MS,
  // TALON_TRACE, TALON_SLEEPER_MAX_ATTEMPTS, TALON_PROTOCOL_TIMEOUT_MS.
  void ApplyEnvironment();

  // Push log settings into the process-wide logger
  void ApplyLogging() const;
};

}  // namespace talon
