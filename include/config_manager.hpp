#pragma once

#include "database_handle.hpp"
#include "logger.hpp"
#include "serializer.hpp"
#include "sql_store.hpp"
#include "sql_templates.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sessiondb {

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }

  // Appends another section's findings under a label
  void merge(const std::string &section, const ConfigValidationResult &other);
};

// Session store section ("store.*")
struct StoreConfig {
  TableLayout layout;
  UpsertStrategy upsertStrategy = UpsertStrategy::UPDATE_ON_CONFLICT;
  SerializerConfig serializer;

  ConfigValidationResult validate() const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  // Replaces the current configuration with an in-memory document
  bool loadFromJson(const nlohmann::json &document);

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  std::unordered_set<std::string> getStringSet(const std::string &key) const;
  // Unflattened value at a dot-separated path
  nlohmann::json getJson(const std::string &key,
                         const nlohmann::json &defaultValue = nullptr) const;
  bool hasKey(const std::string &key) const;

  LogConfig getLoggingConfig() const;
  DatabaseConnectionConfig getDatabaseConfig() const;
  // Throws ConfigException for an unknown upsert strategy
  StoreConfig getStoreConfig() const;

  ConfigValidationResult validateDatabaseConfig() const;
  ConfigValidationResult validateConfiguration() const;

  const std::string &getConfigFilePath() const { return configFilePath_; }

private:
  ConfigManager() = default;

  std::unordered_map<std::string, std::string> configData_;
  nlohmann::json rawConfig_ = nlohmann::json::object();
  std::string configFilePath_;
  mutable std::mutex mutex_;

  bool parseConfigFile(const std::string &configPath);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  LogLevel parseLogLevel(const std::string &levelStr) const;
  LogFormat parseLogFormat(const std::string &formatStr) const;
};

} // namespace sessiondb
