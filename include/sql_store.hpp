#pragma once

#include "database_handle.hpp"
#include "serializer.hpp"
#include "sql_templates.hpp"
#include "store.hpp"
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace sessiondb {

class ConfigManager;

// How set() turns "create or replace" into SQL
enum class UpsertStrategy {
  // Exists-check, then UPDATE or INSERT. Racy under concurrent writers, and
  // an expired row still holding a unique key makes the INSERT fail.
  CHECK_THEN_WRITE,
  // As above, but an INSERT that hits the unique key falls back to UPDATE
  UPDATE_ON_CONFLICT,
  // One INSERT ... ON CONFLICT (key) DO UPDATE statement
  NATIVE_UPSERT
};

std::string upsertStrategyToString(UpsertStrategy strategy);
// Throws ConfigException for an unknown name
UpsertStrategy parseUpsertStrategy(const std::string &name);

struct SqlStoreOptions {
  TableLayout layout;
  UpsertStrategy upsertStrategy = UpsertStrategy::UPDATE_ON_CONFLICT;
};

// Epoch seconds
using Clock = std::function<std::int64_t()>;
Clock systemClock();

using DatabaseOption =
    std::variant<std::shared_ptr<DatabaseHandle>, DatabaseConnectionConfig>;

/**
 * Session store backed by one SQL table.
 *
 * Each record is (key, data, expiration). A record is live while
 * expiration > now; expired rows stay in the table until overwritten or
 * removed. The store never interprets data beyond handing it to the
 * serializer.
 *
 * Statements are built once at construction from the table layout and the
 * handle's placeholder style. Nothing is retried and no transaction spans
 * more than one statement; driver and codec errors reach the caller as
 * DatabaseException and SerializationException.
 */
class SqlStore : public Store {
public:
  explicit SqlStore(DatabaseOption database,
                    SerializerOption serializer = std::string("JSON"),
                    SqlStoreOptions options = {}, Clock clock = systemClock());

  static std::unique_ptr<SqlStore> fromConfig(const ConfigManager &config);

  void set(const std::string &key, const nlohmann::json &value,
           std::int64_t ttlSeconds) override;
  std::optional<nlohmann::json> get(const std::string &key) override;
  void remove(const std::string &key) override;

  const std::shared_ptr<DatabaseHandle> &database() const { return database_; }
  const std::shared_ptr<Serializer> &serializer() const { return serializer_; }
  const TableLayout &layout() const { return options_.layout; }
  UpsertStrategy upsertStrategy() const { return options_.upsertStrategy; }
  const SqlTemplates &templates() const { return templates_; }

private:
  std::shared_ptr<DatabaseHandle> database_;
  std::shared_ptr<Serializer> serializer_;
  SqlStoreOptions options_;
  Clock clock_;
  SqlTemplates templates_;

  static std::shared_ptr<DatabaseHandle> resolveDatabase(DatabaseOption option);

  static SqlParam dataParam(std::string blob);
  void checkThenWrite(const std::string &key, const std::string &blob,
                      std::int64_t now, std::int64_t expiration);
  static void requireKey(const std::string &key);
};

} // namespace sessiondb
