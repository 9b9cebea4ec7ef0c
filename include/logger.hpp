#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sessiondb {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

using LogContext = std::unordered_map<std::string, std::string>;

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/sessiondb.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string> componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Copy constructor - can't copy atomics directly, so copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()), startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  LogConfig getConfig() const;
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void setLogFile(const std::string &filename);
  void enableConsoleOutput(bool enable);
  void setComponentFilter(const std::unordered_set<std::string> &components);

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  LogMetrics getMetrics() const;
  bool shouldLog(LogLevel level, const std::string &component) const;

  // Formatting is public so that output can be checked without a sink
  std::string formatMessage(LogLevel level, const std::string &component,
                            const std::string &message,
                            const LogContext &context) const;

  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  // File handling
  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &filename);
  void writeLog(const std::string &formattedMessage, bool console, bool file);
  void rotateLogFile(int maxBackupFiles);
};

} // namespace sessiondb

#include "component_logger.hpp"

#define STORE_LOG_DEBUG(message, ...)                                          \
  sessiondb::StoreLogger::debug(message, ##__VA_ARGS__)
#define STORE_LOG_INFO(message, ...)                                           \
  sessiondb::StoreLogger::info(message, ##__VA_ARGS__)
#define STORE_LOG_WARN(message, ...)                                           \
  sessiondb::StoreLogger::warn(message, ##__VA_ARGS__)
#define STORE_LOG_ERROR(message, ...)                                          \
  sessiondb::StoreLogger::error(message, ##__VA_ARGS__)

#define PG_LOG_DEBUG(message, ...)                                             \
  sessiondb::PostgresLogger::debug(message, ##__VA_ARGS__)
#define PG_LOG_INFO(message, ...)                                              \
  sessiondb::PostgresLogger::info(message, ##__VA_ARGS__)
#define PG_LOG_WARN(message, ...)                                              \
  sessiondb::PostgresLogger::warn(message, ##__VA_ARGS__)
#define PG_LOG_ERROR(message, ...)                                             \
  sessiondb::PostgresLogger::error(message, ##__VA_ARGS__)

#define SQLITE_LOG_DEBUG(message, ...)                                         \
  sessiondb::SqliteLogger::debug(message, ##__VA_ARGS__)
#define SQLITE_LOG_INFO(message, ...)                                          \
  sessiondb::SqliteLogger::info(message, ##__VA_ARGS__)
#define SQLITE_LOG_WARN(message, ...)                                          \
  sessiondb::SqliteLogger::warn(message, ##__VA_ARGS__)
#define SQLITE_LOG_ERROR(message, ...)                                         \
  sessiondb::SqliteLogger::error(message, ##__VA_ARGS__)

#define CODEC_LOG_DEBUG(message, ...)                                          \
  sessiondb::CodecLogger::debug(message, ##__VA_ARGS__)
#define CODEC_LOG_ERROR(message, ...)                                          \
  sessiondb::CodecLogger::error(message, ##__VA_ARGS__)

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  sessiondb::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  sessiondb::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  sessiondb::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  sessiondb::ConfigLogger::error(message, ##__VA_ARGS__)

#define CLI_LOG_DEBUG(message, ...)                                            \
  sessiondb::CliLogger::debug(message, ##__VA_ARGS__)
#define CLI_LOG_INFO(message, ...)                                             \
  sessiondb::CliLogger::info(message, ##__VA_ARGS__)
#define CLI_LOG_ERROR(message, ...)                                            \
  sessiondb::CliLogger::error(message, ##__VA_ARGS__)
