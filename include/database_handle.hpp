#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sessiondb {

// How a driver spells bind parameters in SQL text
enum class PlaceholderStyle {
  QUESTION_MARK, // ?, ?, ?
  NUMBERED       // $1, $2, $3
};

struct SqlParam {
  enum class Type { TEXT, INTEGER, BLOB };

  Type type = Type::TEXT;
  std::string bytes;       // TEXT and BLOB payload
  std::int64_t integer = 0;

  static SqlParam text(std::string value) {
    SqlParam param;
    param.type = Type::TEXT;
    param.bytes = std::move(value);
    return param;
  }

  static SqlParam blob(std::string value) {
    SqlParam param;
    param.type = Type::BLOB;
    param.bytes = std::move(value);
    return param;
  }

  static SqlParam int64(std::int64_t value) {
    SqlParam param;
    param.type = Type::INTEGER;
    param.integer = value;
    return param;
  }
};

struct DatabaseConnectionConfig {
  std::string driver = "postgresql"; // postgresql | sqlite
  std::string host = "localhost";
  int port = 5432;
  std::string database = "sessions";
  std::string username;
  std::string password;
  // Overrides host/port/database/username/password when set
  std::string connectionString;
  // SQLite only
  std::string path = "sessions.db";
  int busyTimeoutMs = 5000;

  std::string buildConnectionString() const;
};

/**
 * Minimal parameterized-statement contract the session store runs on.
 *
 * Implementations prepare each distinct SQL text once and reuse it for the
 * lifetime of the handle. Every call is a single auto-committed statement.
 * Failures are raised as DatabaseException.
 */
class DatabaseHandle {
public:
  virtual ~DatabaseHandle() = default;

  virtual void execute(const std::string &sql,
                       const std::vector<SqlParam> &params) = 0;

  // First column of the first row; nullopt for no row or a NULL value.
  virtual std::optional<std::string>
  selectValue(const std::string &sql, const std::vector<SqlParam> &params,
              SqlParam::Type resultType = SqlParam::Type::TEXT) = 0;

  virtual PlaceholderStyle placeholderStyle() const = 0;
  virtual std::string driverName() const = 0;
};

std::shared_ptr<DatabaseHandle>
createDatabaseHandle(const DatabaseConnectionConfig &config);

} // namespace sessiondb
