#include "config_manager.hpp"
#include "logger.hpp"
#include "sessiondb_exceptions.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sessiondb {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  return value;
}

} // namespace

void ConfigValidationResult::merge(const std::string &section,
                                   const ConfigValidationResult &other) {
  isValid = isValid && other.isValid;
  for (const auto &error : other.errors) {
    errors.push_back(section + ": " + error);
  }
  for (const auto &warning : other.warnings) {
    warnings.push_back(section + ": " + warning);
  }
}

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  std::lock_guard<std::mutex> lock(mutex_);
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  bool result = parseConfigFile(configPath);
  if (result) {
    configFilePath_ = configPath;
    CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                    configData_.size());
  } else {
    CONFIG_LOG_ERROR("Failed to load configuration from: {}", configPath);
  }
  return result;
}

bool ConfigManager::loadFromJson(const nlohmann::json &document) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!document.is_object()) {
    CONFIG_LOG_ERROR("Configuration document must be a JSON object");
    return false;
  }

  configData_.clear();
  rawConfig_ = document;
  configFilePath_.clear();
  flattenJson(rawConfig_, "", 0, 100);
  CONFIG_LOG_DEBUG("Configuration loaded from memory with {} parameters",
                   configData_.size());
  return true;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = getString(key);
  if (value.empty()) {
    return defaultValue;
  }
  try {
    return std::stoi(value);
  } catch (const std::invalid_argument &) {
    return defaultValue;
  } catch (const std::out_of_range &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (!hasKey(key)) {
    return defaultValue;
  }
  std::string value = toLower(getString(key));
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::string value = getString(key);
  if (value.empty()) {
    return defaultValue;
  }
  try {
    return std::stod(value);
  } catch (const std::invalid_argument &) {
    return defaultValue;
  } catch (const std::out_of_range &) {
    return defaultValue;
  }
}

std::unordered_set<std::string>
ConfigManager::getStringSet(const std::string &key) const {
  std::unordered_set<std::string> result;
  nlohmann::json value = getJson(key);

  if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string()) {
        result.insert(item.get<std::string>());
      }
    }
    return result;
  }

  if (value.is_string()) {
    std::stringstream ss(value.get<std::string>());
    std::string item;
    while (std::getline(ss, item, ',')) {
      item.erase(0, item.find_first_not_of(" \t"));
      item.erase(item.find_last_not_of(" \t") + 1);
      if (!item.empty()) {
        result.insert(item);
      }
    }
  }
  return result;
}

nlohmann::json ConfigManager::getJson(const std::string &key,
                                      const nlohmann::json &defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const nlohmann::json *node = &rawConfig_;

  std::stringstream ss(key);
  std::string part;
  while (std::getline(ss, part, '.')) {
    if (!node->is_object()) {
      return defaultValue;
    }
    auto it = node->find(part);
    if (it == node->end()) {
      return defaultValue;
    }
    node = &*it;
  }
  return *node;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return configData_.count(key) > 0;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = parseLogLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/sessiondb.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

DatabaseConnectionConfig ConfigManager::getDatabaseConfig() const {
  DatabaseConnectionConfig config;

  config.driver = getString("database.driver", config.driver);
  config.host = getString("database.host", config.host);
  config.port = getInt("database.port", config.port);
  config.database = getString("database.name", config.database);
  config.username = getString("database.username", config.username);
  config.password = getString("database.password", config.password);
  config.connectionString =
      getString("database.connection_string", config.connectionString);
  config.path = getString("database.path", config.path);
  config.busyTimeoutMs =
      getInt("database.busy_timeout_ms", config.busyTimeoutMs);

  return config;
}

StoreConfig ConfigManager::getStoreConfig() const {
  StoreConfig config;

  config.layout.table = getString("store.table", config.layout.table);
  config.layout.keyColumn =
      getString("store.key_column", config.layout.keyColumn);
  config.layout.dataColumn =
      getString("store.data_column", config.layout.dataColumn);
  config.layout.expirationColumn =
      getString("store.expiration_column", config.layout.expirationColumn);
  config.upsertStrategy =
      parseUpsertStrategy(getString("store.upsert_strategy", "update_on_conflict"));

  // "serializer": "CBOR" or "serializer": { "name": "JSON", "indent": 2 }
  nlohmann::json serializer = getJson("store.serializer");
  if (serializer.is_string()) {
    config.serializer.name = serializer.get<std::string>();
  } else if (serializer.is_object()) {
    auto name = serializer.find("name");
    if (name == serializer.end() || !name->is_string()) {
      throw ConfigException(ErrorCode::MISSING_FIELD,
                            "Serializer object requires a string 'name'",
                            "store.serializer.name");
    }
    config.serializer.name = name->get<std::string>();
    serializer.erase("name");
    config.serializer.options = serializer;
  } else if (!serializer.is_null()) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "Serializer must be a name or an object",
                          "store.serializer");
  }

  return config;
}

ConfigValidationResult StoreConfig::validate() const {
  ConfigValidationResult result;

  try {
    layout.validate();
  } catch (const ValidationException &e) {
    result.addError(e.getMessage());
  }

  try {
    SerializerFactory::create(serializer);
  } catch (const ConfigException &e) {
    result.addError(e.getMessage());
  }

  return result;
}

ConfigValidationResult ConfigManager::validateDatabaseConfig() const {
  ConfigValidationResult result;
  DatabaseConnectionConfig config = getDatabaseConfig();
  std::string driver = toLower(config.driver);

  if (driver == "postgresql" || driver == "postgres" || driver == "pg") {
    if (config.connectionString.empty()) {
      if (config.host.empty()) {
        result.addError("host must not be empty");
      }
      if (config.port <= 0 || config.port > 65535) {
        std::stringstream ss;
        ss << "port must be between 1 and 65535, got: " << config.port;
        result.addError(ss.str());
      }
      if (config.database.empty()) {
        result.addError("name must not be empty");
      }
    }
  } else if (driver == "sqlite" || driver == "sqlite3") {
    if (config.path.empty()) {
      result.addError("path must not be empty");
    } else if (config.path == ":memory:") {
      result.addWarning("in-memory SQLite database does not outlive the "
                        "process");
    }
    if (config.busyTimeoutMs < 0) {
      std::stringstream ss;
      ss << "busy_timeout_ms must not be negative, got: "
         << config.busyTimeoutMs;
      result.addError(ss.str());
    }
  } else {
    result.addError("unsupported driver: " + config.driver);
  }

  return result;
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  result.merge("database", validateDatabaseConfig());

  try {
    result.merge("store", getStoreConfig().validate());
  } catch (const ConfigException &e) {
    result.addError("store: " + e.getMessage());
  }

  LogConfig logging = getLoggingConfig();
  if (logging.maxBackupFiles < 0) {
    result.addError("logging: max_backup_files must not be negative");
  }
  if (logging.fileOutput && logging.logFile.empty()) {
    result.addError("logging: log_file must be set when file_output is on");
  }

  return result;
}

LogLevel ConfigManager::parseLogLevel(const std::string &levelStr) const {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(), ::toupper);

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "INFO")
    return LogLevel::INFO;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;

  return LogLevel::INFO;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) const {
  std::string format = formatStr;
  std::transform(format.begin(), format.end(), format.begin(), ::toupper);

  if (format == "JSON")
    return LogFormat::JSON;
  return LogFormat::TEXT;
}

bool ConfigManager::parseConfigFile(const std::string &configPath) {
  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  try {
    nlohmann::json jsonConfig;
    file >> jsonConfig;
    if (!jsonConfig.is_object()) {
      CONFIG_LOG_ERROR("Config file must contain a JSON object: {}",
                       configPath);
      return false;
    }

    configData_.clear();
    rawConfig_ = std::move(jsonConfig);
    flattenJson(rawConfig_, "", 0, 100);
    return true;
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file: {}", e.what());
    return false;
  }
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    std::string key = prefix.empty() ? "deep_nested" : prefix + ".deep_nested";
    configData_[key] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else {
      // Arrays, floats and null keep their JSON text
      configData_[key] = it->dump();
    }
  }
}

} // namespace sessiondb
