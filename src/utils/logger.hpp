#pragma once

#include <cstddef>
#include <sstream>
#include <string>

namespace dlmgr::utils {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

// Parses "DEBUG", "info", ... Throws std::invalid_argument on anything else.
LogLevel parseLogLevel(const std::string& name);

struct LogConfig {
  std::string logDir;     // empty: console only
  size_t maxFileSize;     // bytes per log file before rotation
  size_t maxBackupFiles;  // rotated files kept next to the active one
  LogLevel minLevel;
  LogConfig()
      : maxFileSize(10 * 1024 * 1024),  // 10 MB
        maxBackupFiles(3),
        minLevel(LogLevel::INFO) {}
};

// key=value field appended to a log line.
template <typename T>
struct LogField {
  const char* key;
  const T& value;
};

template <typename T>
LogField<T> kv(const char* key, const T& value) {
  return LogField<T>{key, value};
}

class Logger {
 public:
  static void initialize(const LogConfig& config = LogConfig());
  static bool enabled(LogLevel level);

  class LogStream {
   public:
    LogStream(LogLevel level, const char* file, const char* function, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& msg) {
      if (enabled_) oss_ << msg;
      return *this;
    }

    template <typename T>
    LogStream& operator<<(const LogField<T>& field) {
      if (enabled_) oss_ << ' ' << field.key << '=' << field.value;
      return *this;
    }

   private:
    bool enabled_;
    std::ostringstream oss_;
  };

 private:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

}  // namespace dlmgr::utils

// LOG(INFO) << "message" << dlmgr::utils::kv("url", url);
#define LOG(level)                                               \
  ::dlmgr::utils::Logger::LogStream(::dlmgr::utils::LogLevel::level, \
                                    __FILE__, __FUNCTION__, __LINE__)
