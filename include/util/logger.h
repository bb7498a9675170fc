#ifndef SWATCH_LOGGER_H_
#define SWATCH_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <functional>

namespace SwatchLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

// Receives every record that passes the level filter. Lets the embedding
// pipeline route branding logs into its own logger. Called with the log
// mutex held, so a sink must not log through Logger itself.
using Sink = std::function<void(Level level, const std::string& component, const std::string& message)>;

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Initialize with log file
  static void SetLevel(Level level);
  static Level GetLevel();  // Get current log level
  static void Log(Level level, const std::string& component, const std::string& message);

  // Replace the default stderr/file output. Passing an empty sink restores it.
  static void SetSink(Sink sink);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

  // "debug", "info", "warn"/"warning", "error"; anything else yields INFO
  static Level ParseLevel(const std::string& name);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace SwatchLogger

// Convenience macros - LOG_DEBUG only compiles in debug builds
#ifdef SWATCH_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) SwatchLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)  // No-op in release builds
#endif

#define LOG_INFO(component, msg) SwatchLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) SwatchLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) SwatchLogger::Logger::Error(component, msg)

#endif  // SWATCH_LOGGER_H_
