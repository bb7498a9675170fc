#include "util/logger.h"
#include <mutex>
#include <cctype>
#include <unistd.h>  // for write(), close()
#include <fcntl.h>   // for open()

namespace SwatchLogger {

#ifdef SWATCH_DEBUG_BUILD
Level Logger::current_level_ = DEBUG;
#else
Level Logger::current_level_ = INFO;
#endif

static std::mutex log_mutex;
static std::string log_file_path_global;
static Sink log_sink;

void Logger::Init() {
#ifdef SWATCH_DEBUG_BUILD
  current_level_ = DEBUG;
#else
  current_level_ = INFO;
#endif
}

void Logger::Init(const std::string& log_file_path) {
  Init();

  // Report an unwritable path once, here
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    return;
  }
  close(fd);

  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global = log_file_path;
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_sink = std::move(sink);
}

Level Logger::ParseLevel(const std::string& name) {
  std::string lower;
  for (char c : name) {
    lower += std::tolower(static_cast<unsigned char>(c));
  }
  if (lower == "debug") return DEBUG;
  if (lower == "warn" || lower == "warning") return WARN;
  if (lower == "error") return ERROR;
  return INFO;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt;
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::lock_guard<std::mutex> lock(log_mutex);

  if (log_sink) {
    log_sink(level, component, message);
    return;
  }

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::cerr << log_line;

  // Open fresh for every record so several worker processes can share the file
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      (void)bytes_written;  // a short write must not fail the pipeline
      close(fd);
    }
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace SwatchLogger
