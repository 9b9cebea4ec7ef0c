#include "sqlite_database.hpp"
#include "logger.hpp"
#include "sessiondb_exceptions.hpp"

namespace sessiondb {

namespace {

// Leaves a cached statement ready for its next use
class StatementReset {
public:
    explicit StatementReset(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementReset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    StatementReset(const StatementReset&) = delete;
    StatementReset& operator=(const StatementReset&) = delete;

private:
    sqlite3_stmt* stmt_;
};

// Only unique-key failures count as CONSTRAINT_VIOLATION; rc is an extended code
ErrorCode errorCodeFor(int rc) {
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return ErrorCode::CONSTRAINT_VIOLATION;
    }
    switch (rc & 0xff) {
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
            return ErrorCode::CONNECTION_FAILED;
        default:
            return ErrorCode::DATABASE_ERROR;
    }
}

} // namespace

SqliteDatabase::SqliteDatabase(const DatabaseConnectionConfig& config)
    : path_(config.path) {
    open(config.busyTimeoutMs);
}

SqliteDatabase::SqliteDatabase(const std::string& path, int busyTimeoutMs)
    : path_(path) {
    open(busyTimeoutMs);
}

SqliteDatabase::~SqliteDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [sql, stmt] : statements_) {
        sqlite3_finalize(stmt);
    }
    statements_.clear();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        SQLITE_LOG_DEBUG("SQLite database closed: {}", path_);
    }
}

void SqliteDatabase::open(int busyTimeoutMs) {
    SQLITE_LOG_INFO("Opening SQLite database: {}", path_);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        SQLITE_LOG_ERROR("Failed to open SQLite database: {}", message);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        DatabaseException error(ErrorCode::CONNECTION_FAILED,
                                "Failed to open SQLite database " + path_ + ": " + message,
                                "sqlite");
        error.addContext("sqlite_code", std::to_string(rc));
        throw error;
    }

    sqlite3_extended_result_codes(db_, 1);
    if (busyTimeoutMs > 0) {
        sqlite3_busy_timeout(db_, busyTimeoutMs);
    }
}

size_t SqliteDatabase::preparedStatementCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statements_.size();
}

void SqliteDatabase::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepareCached(sql);
    StatementReset reset(stmt);
    bindParams(stmt, params, sql);

    int rc = sqlite3_step(stmt);
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt);
    }
    if (rc != SQLITE_DONE) {
        raise(rc, "Statement failed", sql);
    }
}

std::optional<std::string> SqliteDatabase::selectValue(const std::string& sql,
                                                       const std::vector<SqlParam>& params,
                                                       SqlParam::Type /*resultType*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepareCached(sql);
    StatementReset reset(stmt);
    bindParams(stmt, params, sql);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        raise(rc, "Query failed", sql);
    }

    switch (sqlite3_column_type(stmt, 0)) {
        case SQLITE_NULL:
            return std::nullopt;
        case SQLITE_INTEGER:
            return std::to_string(sqlite3_column_int64(stmt, 0));
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, 0);
            int size = sqlite3_column_bytes(stmt, 0);
            return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size))
                        : std::string();
        }
        default: {
            // TEXT and FLOAT; SQLite's dynamic typing needs no result hint
            const unsigned char* text = sqlite3_column_text(stmt, 0);
            int size = sqlite3_column_bytes(stmt, 0);
            return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size))
                        : std::string();
        }
    }
}

void SqliteDatabase::executeScript(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        if (errMsg) sqlite3_free(errMsg);
        SQLITE_LOG_ERROR("Script failed: {}", message);
        DatabaseException error(errorCodeFor(rc), message, "sqlite", sql);
        error.addContext("sqlite_code", std::to_string(rc));
        throw error;
    }
}

sqlite3_stmt* SqliteDatabase::prepareCached(const std::string& sql) {
    auto it = statements_.find(sql);
    if (it != statements_.end()) {
        return it->second;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        raise(rc, "Failed to prepare statement", sql);
    }

    SQLITE_LOG_DEBUG("Prepared statement: {}", sql);
    statements_.emplace(sql, stmt);
    return stmt;
}

void SqliteDatabase::bindParams(sqlite3_stmt* stmt, const std::vector<SqlParam>& params,
                                const std::string& sql) {
    int expected = sqlite3_bind_parameter_count(stmt);
    if (expected != static_cast<int>(params.size())) {
        throw DatabaseException(ErrorCode::DATABASE_ERROR,
                                "Statement expects " + std::to_string(expected) +
                                    " parameters, got " + std::to_string(params.size()),
                                "sqlite", sql);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const SqlParam& param = params[i];
        int index = static_cast<int>(i) + 1;
        int rc = SQLITE_OK;

        switch (param.type) {
            case SqlParam::Type::TEXT:
                rc = sqlite3_bind_text(stmt, index, param.bytes.data(),
                                       static_cast<int>(param.bytes.size()), SQLITE_TRANSIENT);
                break;
            case SqlParam::Type::INTEGER:
                rc = sqlite3_bind_int64(stmt, index, param.integer);
                break;
            case SqlParam::Type::BLOB:
                // A null pointer would bind NULL instead of an empty blob
                rc = param.bytes.empty()
                    ? sqlite3_bind_zeroblob(stmt, index, 0)
                    : sqlite3_bind_blob(stmt, index, param.bytes.data(),
                                        static_cast<int>(param.bytes.size()), SQLITE_TRANSIENT);
                break;
        }

        if (rc != SQLITE_OK) {
            raise(rc, "Failed to bind parameter " + std::to_string(index), sql);
        }
    }
}

void SqliteDatabase::raise(int rc, const std::string& context, const std::string& sql) const {
    std::string message = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));

    ErrorCode code = errorCodeFor(rc);
    if (code == ErrorCode::DATABASE_ERROR) {
        SQLITE_LOG_ERROR("{} (code {})", message, rc);
    }

    DatabaseException error(code, message, "sqlite", sql);
    error.addContext("sqlite_code", std::to_string(rc));
    throw error;
}

} // namespace sessiondb
