#include "database_handle.hpp"
#include "postgres_database.hpp"
#include "sessiondb_exceptions.hpp"
#include "sqlite_database.hpp"
#include <algorithm>
#include <cctype>

namespace sessiondb {

namespace {

// libpq keyword/value syntax: quote values, escape quotes and backslashes
std::string quoteConnectionValue(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += "'";
  return quoted;
}

} // namespace

std::string DatabaseConnectionConfig::buildConnectionString() const {
  if (!connectionString.empty()) {
    return connectionString;
  }

  std::string result = "host=" + quoteConnectionValue(host) +
                       " port=" + std::to_string(port) +
                       " dbname=" + quoteConnectionValue(database);
  if (!username.empty()) {
    result += " user=" + quoteConnectionValue(username);
  }
  if (!password.empty()) {
    result += " password=" + quoteConnectionValue(password);
  }
  return result;
}

std::shared_ptr<DatabaseHandle>
createDatabaseHandle(const DatabaseConnectionConfig &config) {
  std::string driver = config.driver;
  std::transform(driver.begin(), driver.end(), driver.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (driver == "postgresql" || driver == "postgres" || driver == "pg") {
    return std::make_shared<PostgresDatabase>(config);
  }
  if (driver == "sqlite" || driver == "sqlite3") {
    return std::make_shared<SqliteDatabase>(config);
  }

  throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                        "Unsupported database driver: " + config.driver,
                        "database.driver");
}

} // namespace sessiondb
