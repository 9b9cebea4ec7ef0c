#include "logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>

namespace sessiondb {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;

    std::lock_guard<std::mutex> fileLock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
    currentLogFile_ = config_.logFile;

    if (config_.fileOutput) {
        openLogFile(currentLogFile_);
        if (!fileStream_.is_open()) {
            std::cerr << "Failed to open log file: " << currentLogFile_ << std::endl;
            config_.fileOutput = false;
        }
    }
}

LogConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.format = format;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(configMutex_);
    std::lock_guard<std::mutex> fileLock(fileMutex_);

    if (fileStream_.is_open()) {
        fileStream_.close();
    }

    config_.logFile = filename;
    currentLogFile_ = filename;
    openLogFile(currentLogFile_);

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        config_.fileOutput = false;
    } else {
        config_.fileOutput = true;
    }
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.consoleOutput = enable;
}

void Logger::setComponentFilter(const std::unordered_set<std::string>& components) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.componentFilter = components;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    if (!shouldLog(level, component)) {
        return;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    bool console = false;
    bool file = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        console = config_.consoleOutput;
        file = config_.fileOutput;
    }

    writeLog(formatMessage(level, component, message, context), console, file);
}

void Logger::debug(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::FATAL, component, message, context);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

bool Logger::shouldLog(LogLevel level, const std::string& component) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level) {
        return false;
    }

    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }

    return true;
}

void Logger::flush() {
    std::clog.flush();
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

std::string Logger::formatTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

std::string Logger::formatMessage(LogLevel level, const std::string& component,
                                  const std::string& message,
                                  const LogContext& context) const {
    LogFormat format;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        format = config_.format;
    }
    return format == LogFormat::JSON
        ? formatJsonMessage(level, component, message, context)
        : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::ostringstream oss;
    oss << "[" << formatTimestamp() << "] "
        << "[" << levelToString(level) << "] "
        << "[" << component << "] "
        << message;

    if (!context.empty()) {
        std::map<std::string, std::string> ordered(context.begin(), context.end());
        oss << " |";
        for (const auto& [key, value] : ordered) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::string levelName = levelToString(level);
    levelName.erase(levelName.find_last_not_of(' ') + 1);

    nlohmann::json line = {
        {"timestamp", formatTimestamp()},
        {"level", levelName},
        {"component", component},
        {"message", message}
    };

    if (!context.empty()) {
        line["context"] = nlohmann::json(context);
    }

    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::openLogFile(const std::string& filename) {
    // Called with fileMutex_ held
    std::filesystem::path logPath(filename);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(filename, std::ios::app);
    if (!fileStream_.is_open()) {
        return;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(filename, ec);
    currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
}

void Logger::writeLog(const std::string& formattedMessage, bool console, bool file) {
    if (console) {
        // Standard output is reserved for command results
        std::clog << formattedMessage << std::endl;
    }

    if (!file) {
        return;
    }

    bool rotate = false;
    size_t maxFileSize = 0;
    int maxBackupFiles = 0;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        rotate = config_.enableRotation;
        maxFileSize = config_.maxFileSize;
        maxBackupFiles = config_.maxBackupFiles;
    }

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (!fileStream_.is_open()) {
        return;
    }

    if (rotate && currentFileSize_ + formattedMessage.length() + 1 > maxFileSize) {
        rotateLogFile(maxBackupFiles);
        if (!fileStream_.is_open()) {
            return;
        }
    }

    fileStream_ << formattedMessage << std::endl;
    currentFileSize_ += formattedMessage.length() + 1;
}

void Logger::rotateLogFile(int maxBackupFiles) {
    // Called with fileMutex_ held
    fileStream_.close();

    std::error_code ec;
    for (int i = maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = currentLogFile_ + "." + std::to_string(i);
        std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec); // Remove oldest
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (maxBackupFiles > 0 && std::filesystem::exists(currentLogFile_, ec)) {
        std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
    }

    fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
    currentFileSize_ = 0;

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to create new log file after rotation: " << currentLogFile_ << std::endl;
    }
}

} // namespace sessiondb
