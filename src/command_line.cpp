#include "command_line.hpp"
#include "logger.hpp"
#include "sessiondb_exceptions.hpp"
#include "sql_store.hpp"
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace sessiondb {

namespace {

constexpr const char *DEFAULT_CONFIG_PATH = "config.json";

nlohmann::json parseValue(const std::string &text) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              std::string("Value is not valid JSON: ") +
                                  e.what(),
                              "value", text);
  }
}

std::int64_t parseTtl(const std::string &text) {
  ValidationException invalid(ErrorCode::INVALID_INPUT,
                              "TTL must be an integer number of seconds",
                              "ttl", text);
  size_t consumed = 0;
  long long ttl = 0;
  try {
    ttl = std::stoll(text, &consumed);
  } catch (const std::logic_error &) {
    throw invalid;
  }
  if (consumed != text.size()) {
    throw invalid;
  }
  return static_cast<std::int64_t>(ttl);
}

bool isCommand(const std::string &name) {
  return name == "set" || name == "get" || name == "remove";
}

} // namespace

void applyEnvironmentOverrides(nlohmann::json &document) {
  if (!document.contains("database") || !document["database"].is_object()) {
    document["database"] = nlohmann::json::object();
  }
  nlohmann::json &database = document["database"];

  if (const char *host = std::getenv("DATABASE_HOST")) {
    database["host"] = host;
  }
  if (const char *port = std::getenv("DATABASE_PORT")) {
    const std::string text = port;
    try {
      size_t consumed = 0;
      int value = std::stoi(text, &consumed);
      if (consumed == text.size()) {
        database["port"] = value;
      } else {
        CLI_LOG_ERROR("Ignoring DATABASE_PORT, trailing characters: {}", text);
      }
    } catch (const std::invalid_argument &) {
      CLI_LOG_ERROR("Ignoring DATABASE_PORT, not a number: {}", port);
    } catch (const std::out_of_range &) {
      CLI_LOG_ERROR("Ignoring DATABASE_PORT, out of range: {}", port);
    }
  }
  if (const char *name = std::getenv("DATABASE_NAME")) {
    database["name"] = name;
  }
  if (const char *user = std::getenv("DATABASE_USER")) {
    database["username"] = user;
  }
  if (const char *password = std::getenv("DATABASE_PASSWORD")) {
    database["password"] = password;
  }
}

CommandLine::CommandLine(std::ostream &out, std::ostream &err)
    : out_(out), err_(err) {}

std::string CommandLine::usage() {
  return "Usage: sessiondb [--config FILE] <command>\n"
         "\n"
         "Commands:\n"
         "  set KEY JSON TTL_SECONDS   store JSON under KEY for TTL_SECONDS\n"
         "  get KEY                    print the live value stored under KEY\n"
         "  remove KEY                 delete KEY\n";
}

int CommandLine::run(const std::vector<std::string> &args) {
  std::string configPath = DEFAULT_CONFIG_PATH;
  bool explicitPath = false;
  size_t index = 0;

  while (index < args.size() && args[index].rfind("--", 0) == 0) {
    const std::string &flag = args[index];
    if (flag == "--help") {
      out_ << usage();
      return EXIT_OK;
    }
    if (flag == "--config" && index + 1 < args.size()) {
      configPath = args[index + 1];
      explicitPath = true;
      index += 2;
      continue;
    }
    err_ << "Unknown or incomplete option: " << flag << "\n" << usage();
    return EXIT_USAGE;
  }

  if (index >= args.size()) {
    err_ << usage();
    return EXIT_USAGE;
  }

  const std::string command = args[index];
  std::vector<std::string> operands(args.begin() + index + 1, args.end());
  if (!isCommand(command)) {
    err_ << "Unknown command: " << command << "\n" << usage();
    return EXIT_USAGE;
  }

  try {
    auto &config = ConfigManager::getInstance();
    if (!loadConfiguration(config, configPath, explicitPath)) {
      throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                            "Failed to load configuration from " + configPath);
    }
    Logger::getInstance().configure(config.getLoggingConfig());

    return execute(command, operands);
  } catch (const SessionDbException &e) {
    CLI_LOG_ERROR("Command {} failed: {}", command, e.getMessage());
    err_ << e.toLogString() << "\n";
    return EXIT_ERROR;
  } catch (const std::exception &e) {
    CLI_LOG_ERROR("Command {} failed: {}", command, e.what());
    err_ << e.what() << "\n";
    return EXIT_ERROR;
  }
}

bool CommandLine::loadConfiguration(ConfigManager &config,
                                    const std::string &path,
                                    bool explicitPath) {
  if (explicitPath || std::ifstream(path).good()) {
    if (!config.loadConfig(path)) {
      return false;
    }
  } else {
    CLI_LOG_DEBUG("No {} found, using defaults", path);
    config.loadFromJson(nlohmann::json::object());
  }

  nlohmann::json document = config.getJson("", nlohmann::json::object());
  applyEnvironmentOverrides(document);
  return config.loadFromJson(document);
}

int CommandLine::execute(const std::string &command,
                         const std::vector<std::string> &operands) {
  if (command == "set") {
    if (operands.size() != 3) {
      err_ << "set takes KEY JSON TTL_SECONDS\n" << usage();
      return EXIT_USAGE;
    }
    nlohmann::json value = parseValue(operands[1]);
    std::int64_t ttl = parseTtl(operands[2]);

    auto store = SqlStore::fromConfig(ConfigManager::getInstance());
    store->set(operands[0], value, ttl);
    CLI_LOG_INFO("Stored key {} for {} seconds", operands[0], ttl);
    return EXIT_OK;
  }

  if (command == "get") {
    if (operands.size() != 1) {
      err_ << "get takes KEY\n" << usage();
      return EXIT_USAGE;
    }
    auto store = SqlStore::fromConfig(ConfigManager::getInstance());
    auto value = store->get(operands[0]);
    if (!value) {
      CLI_LOG_DEBUG("Key {} not found", operands[0]);
      return EXIT_NOT_FOUND;
    }
    out_ << value->dump() << "\n";
    return EXIT_OK;
  }

  if (command == "remove") {
    if (operands.size() != 1) {
      err_ << "remove takes KEY\n" << usage();
      return EXIT_USAGE;
    }
    auto store = SqlStore::fromConfig(ConfigManager::getInstance());
    store->remove(operands[0]);
    CLI_LOG_INFO("Removed key {}", operands[0]);
    return EXIT_OK;
  }

  err_ << "Unknown command: " << command << "\n" << usage();
  return EXIT_USAGE;
}

} // namespace sessiondb
