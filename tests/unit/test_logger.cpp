#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

namespace sessiondb {

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    saved_ = Logger::getInstance().getConfig();
    dir_ = std::filesystem::temp_directory_path() /
           ("sessiondb_logger_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir_);
  }

  void TearDown() override {
    Logger::getInstance().configure(saved_);
    std::filesystem::remove_all(dir_);
  }

  LogConfig quietFileConfig(size_t maxFileSize = 1024 * 1024) {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = false;
    config.fileOutput = true;
    config.logFile = (dir_ / "sessiondb.log").string();
    config.maxFileSize = maxFileSize;
    config.maxBackupFiles = 2;
    return config;
  }

  std::string readLog() {
    Logger::getInstance().flush();
    std::ifstream in(dir_ / "sessiondb.log");
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  LogConfig saved_;
  std::filesystem::path dir_;
};

TEST_F(LoggerTest, TextFormatSortsContext) {
  auto &logger = Logger::getInstance();
  logger.setLogFormat(LogFormat::TEXT);

  std::string line = logger.formatMessage(LogLevel::INFO, "SqlStore", "hello",
                                          {{"b", "2"}, {"a", "1"}});
  EXPECT_NE(line.find("[INFO ] [SqlStore] hello | a=1 b=2"), std::string::npos);
  EXPECT_EQ(line.front(), '[');
}

TEST_F(LoggerTest, JsonFormatIsOneObject) {
  auto &logger = Logger::getInstance();
  logger.setLogFormat(LogFormat::JSON);

  auto line = nlohmann::json::parse(logger.formatMessage(
      LogLevel::WARN, "ConfigManager", "careful", {{"key", "store.table"}}));
  EXPECT_EQ(line["level"], "WARN");
  EXPECT_EQ(line["component"], "ConfigManager");
  EXPECT_EQ(line["message"], "careful");
  EXPECT_EQ(line["context"]["key"], "store.table");
  EXPECT_TRUE(line["timestamp"].is_string());
}

TEST_F(LoggerTest, LevelAndComponentFiltering) {
  auto &logger = Logger::getInstance();
  logger.setLogLevel(LogLevel::WARN);

  EXPECT_FALSE(logger.shouldLog(LogLevel::INFO, "SqlStore"));
  EXPECT_TRUE(logger.shouldLog(LogLevel::ERROR, "SqlStore"));

  logger.setComponentFilter({"SqlStore"});
  EXPECT_TRUE(logger.shouldLog(LogLevel::ERROR, "SqlStore"));
  EXPECT_FALSE(logger.shouldLog(LogLevel::ERROR, "ConfigManager"));
}

TEST_F(LoggerTest, MetricsCountWarningsAndErrors) {
  auto &logger = Logger::getInstance();
  logger.configure(quietFileConfig());
  auto before = logger.getMetrics();

  logger.warn("SqlStore", "w");
  logger.error("SqlStore", "e");
  logger.debug("SqlStore", "d");

  auto after = logger.getMetrics();
  EXPECT_EQ(after.totalMessages - before.totalMessages, 3u);
  EXPECT_EQ(after.warningCount - before.warningCount, 1u);
  EXPECT_EQ(after.errorCount - before.errorCount, 1u);
}

TEST_F(LoggerTest, ComponentLoggerFillsPlaceholders) {
  Logger::getInstance().configure(quietFileConfig());

  StoreLogger::info("set key={} bytes={}", "abc", 15);
  STORE_LOG_WARN("fallback for {}", std::string("k1"));

  std::string log = readLog();
  EXPECT_NE(log.find("[SqlStore] set key=abc bytes=15"), std::string::npos);
  EXPECT_NE(log.find("[WARN ] [SqlStore] fallback for k1"), std::string::npos);
  EXPECT_STREQ(CodecLogger::getComponentName(), "SerializerFactory");
}

TEST_F(LoggerTest, FilteredMessagesAreNotWritten) {
  LogConfig config = quietFileConfig();
  config.level = LogLevel::ERROR;
  Logger::getInstance().configure(config);

  CONFIG_LOG_INFO("not written {}", 1);
  CONFIG_LOG_ERROR("written {}", 2);

  std::string log = readLog();
  EXPECT_EQ(log.find("not written"), std::string::npos);
  EXPECT_NE(log.find("written 2"), std::string::npos);
}

TEST_F(LoggerTest, FileRotationKeepsBoundedBackups) {
  Logger::getInstance().configure(quietFileConfig(256));

  for (int i = 0; i < 40; ++i) {
    SQLITE_LOG_INFO("rotation message number {}", i);
  }
  Logger::getInstance().flush();

  EXPECT_TRUE(std::filesystem::exists(dir_ / "sessiondb.log"));
  EXPECT_TRUE(std::filesystem::exists(dir_ / "sessiondb.log.1"));
  EXPECT_TRUE(std::filesystem::exists(dir_ / "sessiondb.log.2"));
  EXPECT_FALSE(std::filesystem::exists(dir_ / "sessiondb.log.3"));
  EXPECT_LE(std::filesystem::file_size(dir_ / "sessiondb.log"), 256u);
}

} // namespace sessiondb
