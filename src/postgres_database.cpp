#include "postgres_database.hpp"
#include "logger.hpp"
#include "sessiondb_exceptions.hpp"
#include <atomic>
#include <cstddef>

namespace sessiondb {

namespace {

constexpr pqxx::oid BYTEA_OID = 17;

// Statement names live in the connection's namespace, and a connection may
// be shared by several handles
std::atomic<std::uint64_t> nextStatementId{0};

} // namespace

PostgresDatabase::PostgresDatabase(const DatabaseConnectionConfig& config) {
    PG_LOG_INFO("Connecting to PostgreSQL database: {}:{}/{}", config.host, config.port,
                config.database);

    try {
        connection_ = std::make_shared<pqxx::connection>(config.buildConnectionString());
    } catch (const std::exception& e) {
        PG_LOG_ERROR("PostgreSQL connection failed: {}", e.what());
        throw DatabaseException(ErrorCode::CONNECTION_FAILED,
                                std::string("PostgreSQL connection failed: ") + e.what(),
                                "postgresql");
    }

    PG_LOG_INFO("PostgreSQL connection established");
}

PostgresDatabase::PostgresDatabase(std::shared_ptr<pqxx::connection> connection)
    : connection_(std::move(connection)) {
    if (!connection_) {
        throw ValidationException(ErrorCode::INVALID_INPUT,
                                  "PostgresDatabase requires a non-null connection",
                                  "connection");
    }
}

PostgresDatabase::~PostgresDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);
    // Leave caller-shared connections open
    if (connection_ && connection_.use_count() == 1 && connection_->is_open()) {
        PG_LOG_DEBUG("Closing PostgreSQL connection");
        connection_->close();
    }
}

bool PostgresDatabase::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->is_open();
}

size_t PostgresDatabase::preparedStatementCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return preparedNames_.size();
}

void PostgresDatabase::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    run(sql, params);
}

std::optional<std::string> PostgresDatabase::selectValue(const std::string& sql,
                                                         const std::vector<SqlParam>& params,
                                                         SqlParam::Type /*resultType*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::result result = run(sql, params);

    if (result.empty() || result.columns() == 0 || result[0][0].is_null()) {
        return std::nullopt;
    }

    const auto field = result[0][0];
    try {
        // Text-format bytea comes back hex-escaped, so decode by column type
        if (field.type() == BYTEA_OID) {
            auto bytes = field.as<std::basic_string<std::byte>>();
            return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }
        return field.as<std::string>();
    } catch (const std::exception& e) {
        throw DatabaseException(ErrorCode::DATABASE_ERROR,
                                std::string("Failed to read result value: ") + e.what(),
                                "postgresql", sql);
    }
}

const std::string& PostgresDatabase::prepareCached(const std::string& sql) {
    auto it = preparedNames_.find(sql);
    if (it != preparedNames_.end()) {
        return it->second;
    }

    std::string name = "sessiondb_stmt_" + std::to_string(nextStatementId++);
    connection_->prepare(name, sql);
    PG_LOG_DEBUG("Prepared statement {}: {}", name, sql);
    return preparedNames_.emplace(sql, std::move(name)).first->second;
}

pqxx::result PostgresDatabase::run(const std::string& sql, const std::vector<SqlParam>& params) {
    try {
        const std::string& name = prepareCached(sql);
        pqxx::work txn(*connection_);
        pqxx::result result = txn.exec_prepared(name, bindParams(params));
        txn.commit();
        return result;
    } catch (...) {
        rethrow(sql);
    }
}

pqxx::params PostgresDatabase::bindParams(const std::vector<SqlParam>& params) {
    pqxx::params bound;
    for (const auto& param : params) {
        switch (param.type) {
            case SqlParam::Type::TEXT:
                bound.append(param.bytes);
                break;
            case SqlParam::Type::INTEGER:
                bound.append(param.integer);
                break;
            case SqlParam::Type::BLOB:
                bound.append(std::basic_string<std::byte>(
                    reinterpret_cast<const std::byte*>(param.bytes.data()), param.bytes.size()));
                break;
        }
    }
    return bound;
}

void PostgresDatabase::rethrow(const std::string& sql) const {
    try {
        throw;
    } catch (const pqxx::broken_connection& e) {
        PG_LOG_ERROR("PostgreSQL connection lost: {}", e.what());
        throw DatabaseException(ErrorCode::CONNECTION_FAILED, e.what(), "postgresql", sql);
    } catch (const pqxx::unique_violation& e) {
        DatabaseException error(ErrorCode::CONSTRAINT_VIOLATION, e.what(), "postgresql", sql);
        error.addContext("sqlstate", e.sqlstate());
        throw error;
    } catch (const pqxx::sql_error& e) {
        PG_LOG_ERROR("PostgreSQL statement failed: {}", e.what());
        DatabaseException error(ErrorCode::DATABASE_ERROR, e.what(), "postgresql", sql);
        error.addContext("sqlstate", e.sqlstate());
        throw error;
    } catch (const SessionDbException&) {
        throw;
    } catch (const std::exception& e) {
        PG_LOG_ERROR("PostgreSQL error: {}", e.what());
        throw DatabaseException(ErrorCode::DATABASE_ERROR, e.what(), "postgresql", sql);
    }
}

} // namespace sessiondb
