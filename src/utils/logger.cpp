#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace dlmgr::utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_file_path;
size_t max_file_size = 10 * 1024 * 1024;  // 10MB
size_t max_backup_files = 3;
std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)};

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// Caller holds log_mutex.
void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() ||
      std::filesystem::file_size(log_file_path, ec) < max_file_size || ec) {
    return;
  }
  log_file.close();
  for (size_t i = max_backup_files; i > 0; --i) {
    std::string old_name =
        log_file_path + (i == 1 ? "" : ("." + std::to_string(i - 1)));
    std::string new_name = log_file_path + "." + std::to_string(i);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

// Caller holds log_mutex.
void openLogFile(const std::string& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory " << dir << ": "
              << ec.message() << std::endl;
    return;
  }
  log_file_path = dir + "/dlmgr.log";
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
    log_file_path.clear();
  }
}
}  // namespace

LogLevel parseLogLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  throw std::invalid_argument("unknown log level: " + name);
}

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  min_level.store(static_cast<int>(config.minLevel));
  max_file_size = config.maxFileSize ? config.maxFileSize : 10 * 1024 * 1024;
  max_backup_files = config.maxBackupFiles;
  if (log_file.is_open()) log_file.close();
  log_file_path.clear();
  if (!config.logDir.empty()) openLogFile(config.logDir);
}

bool Logger::enabled(LogLevel level) {
  return static_cast<int>(level) >= min_level.load(std::memory_order_relaxed);
}

Logger::LogStream::LogStream(LogLevel level, const char* file,
                             const char* func, int line)
    : enabled_(Logger::enabled(level)), oss_() {
  if (enabled_) {
    oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
         << file << ":" << line << " " << func << ": ";
  }
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  oss_ << "\n";
  std::string msg = oss_.str();
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << msg << std::flush;
    if (log_file.is_open()) {
      rotateLogsIfNeeded();
      log_file << msg;
      log_file.flush();
    }
  }
}

}  // namespace dlmgr::utils
