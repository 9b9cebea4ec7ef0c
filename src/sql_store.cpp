#include "sql_store.hpp"
#include "config_manager.hpp"
#include "logger.hpp"
#include "sessiondb_exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>

namespace sessiondb {

std::string upsertStrategyToString(UpsertStrategy strategy) {
  switch (strategy) {
  case UpsertStrategy::CHECK_THEN_WRITE:
    return "check_then_write";
  case UpsertStrategy::UPDATE_ON_CONFLICT:
    return "update_on_conflict";
  case UpsertStrategy::NATIVE_UPSERT:
    return "native_upsert";
  }
  return "unknown";
}

UpsertStrategy parseUpsertStrategy(const std::string &name) {
  std::string value = name;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (value == "check_then_write")
    return UpsertStrategy::CHECK_THEN_WRITE;
  if (value == "update_on_conflict")
    return UpsertStrategy::UPDATE_ON_CONFLICT;
  if (value == "native_upsert")
    return UpsertStrategy::NATIVE_UPSERT;

  throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                        "Unknown upsert strategy: " + name,
                        "store.upsert_strategy");
}

Clock systemClock() {
  return [] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

SqlStore::SqlStore(DatabaseOption database, SerializerOption serializer,
                   SqlStoreOptions options, Clock clock)
    : options_(std::move(options)), clock_(std::move(clock)) {
  options_.layout.validate();
  if (!clock_) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Clock must not be empty", "clock");
  }

  database_ = resolveDatabase(std::move(database));
  serializer_ = SerializerFactory::create(serializer);
  templates_ = SqlTemplates::build(options_.layout, database_->placeholderStyle());

  STORE_LOG_INFO("Session store ready: table={} driver={} serializer={}{} "
                 "strategy={}",
                 options_.layout.table, database_->driverName(),
                 serializer_->name(),
                 serializer_->isBinary() ? " (binary)" : "",
                 upsertStrategyToString(options_.upsertStrategy));
}

std::unique_ptr<SqlStore> SqlStore::fromConfig(const ConfigManager &config) {
  auto validation = config.validateConfiguration();
  for (const auto &warning : validation.warnings) {
    STORE_LOG_WARN("Configuration warning: {}", warning);
  }
  if (!validation.isValid) {
    std::string message = "Invalid configuration";
    for (const auto &error : validation.errors) {
      message += "; " + error;
    }
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR, message);
  }

  StoreConfig storeConfig = config.getStoreConfig();
  SqlStoreOptions options;
  options.layout = storeConfig.layout;
  options.upsertStrategy = storeConfig.upsertStrategy;

  return std::make_unique<SqlStore>(config.getDatabaseConfig(),
                                    storeConfig.serializer, options);
}

std::shared_ptr<DatabaseHandle>
SqlStore::resolveDatabase(DatabaseOption option) {
  if (auto *config = std::get_if<DatabaseConnectionConfig>(&option)) {
    return createDatabaseHandle(*config);
  }

  auto handle = std::get<std::shared_ptr<DatabaseHandle>>(std::move(option));
  if (!handle) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Database handle must not be null", "database");
  }
  return handle;
}

void SqlStore::set(const std::string &key, const nlohmann::json &value,
                   std::int64_t ttlSeconds) {
  requireKey(key);
  if (ttlSeconds < 0) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "ttl must not be negative", "ttl",
                              std::to_string(ttlSeconds));
  }

  // One clock read serves both the liveness check and the new expiration
  const std::int64_t now = clock_();
  if (now > 0 && ttlSeconds > std::numeric_limits<std::int64_t>::max() - now) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "ttl overflows the expiration timestamp", "ttl",
                              std::to_string(ttlSeconds));
  }
  const std::int64_t expiration = now + ttlSeconds;

  // Encode before touching the database so a bad value leaves no trace
  std::string blob = serializer_->serialize(value);

  STORE_LOG_DEBUG("set key={} bytes={} expiration={}", key, blob.size(),
                  expiration);

  if (options_.upsertStrategy == UpsertStrategy::NATIVE_UPSERT) {
    database_->execute(templates_.upsert,
                       {SqlParam::text(key), dataParam(std::move(blob)),
                        SqlParam::int64(expiration)});
    return;
  }

  checkThenWrite(key, blob, now, expiration);
}

void SqlStore::checkThenWrite(const std::string &key, const std::string &blob,
                              std::int64_t now, std::int64_t expiration) {
  auto live = database_->selectValue(
      templates_.exists, {SqlParam::text(key), SqlParam::int64(now)},
      SqlParam::Type::INTEGER);

  if (live) {
    database_->execute(templates_.update, {dataParam(blob),
                                           SqlParam::int64(expiration),
                                           SqlParam::text(key)});
    return;
  }

  try {
    database_->execute(templates_.insert, {SqlParam::text(key),
                                           dataParam(blob),
                                           SqlParam::int64(expiration)});
  } catch (const DatabaseException &e) {
    // An expired row still holds the key, or another writer got there first
    if (options_.upsertStrategy != UpsertStrategy::UPDATE_ON_CONFLICT ||
        e.getCode() != ErrorCode::CONSTRAINT_VIOLATION) {
      throw;
    }
    STORE_LOG_WARN("Insert for key {} hit the unique key, updating instead",
                   key);
    database_->execute(templates_.update, {dataParam(blob),
                                           SqlParam::int64(expiration),
                                           SqlParam::text(key)});
  }
}

std::optional<nlohmann::json> SqlStore::get(const std::string &key) {
  requireKey(key);

  auto blob = database_->selectValue(
      templates_.select, {SqlParam::text(key), SqlParam::int64(clock_())},
      SqlParam::Type::BLOB);
  if (!blob) {
    STORE_LOG_DEBUG("get key={} miss", key);
    return std::nullopt;
  }

  STORE_LOG_DEBUG("get key={} hit bytes={}", key, blob->size());
  return serializer_->deserialize(*blob);
}

void SqlStore::remove(const std::string &key) {
  requireKey(key);
  STORE_LOG_DEBUG("remove key={}", key);
  database_->execute(templates_.remove, {SqlParam::text(key)});
}

SqlParam SqlStore::dataParam(std::string blob) {
  // Every codec goes in as raw bytes, so the column must be BLOB/bytea
  return SqlParam::blob(std::move(blob));
}

void SqlStore::requireKey(const std::string &key) {
  if (key.empty()) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Session key must not be empty", "key");
  }
}

} // namespace sessiondb
