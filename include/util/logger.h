#ifndef TALON_LOGGER_H_
#define TALON_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace TalonLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to a log file
  static void SetLevel(Level level);
  static Level GetLevel();
  static void Log(Level level, const std::string& component, const std::string& message);

  // Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
  // Returns false and leaves |level| untouched for anything else.
  static bool ParseLevel(const std::string& name, Level& level);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace TalonLogger

// LOG_DEBUG only compiles in debug builds
#ifdef TALON_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) TalonLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) TalonLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) TalonLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) TalonLogger::Logger::Error(component, msg)

#endif  // TALON_LOGGER_H_
