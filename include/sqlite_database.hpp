#ifndef SQLITE_DATABASE_HPP
#define SQLITE_DATABASE_HPP

#include "database_handle.hpp"
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <unordered_map>

namespace sessiondb {

class SqliteDatabase : public DatabaseHandle {
public:
    explicit SqliteDatabase(const DatabaseConnectionConfig& config);
    explicit SqliteDatabase(const std::string& path, int busyTimeoutMs = 5000);
    ~SqliteDatabase() override;

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    void execute(const std::string& sql, const std::vector<SqlParam>& params) override;
    std::optional<std::string> selectValue(const std::string& sql,
                                           const std::vector<SqlParam>& params,
                                           SqlParam::Type resultType = SqlParam::Type::TEXT) override;

    PlaceholderStyle placeholderStyle() const override { return PlaceholderStyle::QUESTION_MARK; }
    std::string driverName() const override { return "sqlite"; }

    // Runs one or more statements without parameters (schema setup)
    void executeScript(const std::string& sql);

    const std::string& path() const { return path_; }
    size_t preparedStatementCount() const;

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::unordered_map<std::string, sqlite3_stmt*> statements_;
    mutable std::mutex mutex_;

    void open(int busyTimeoutMs);
    // Called with mutex_ held
    sqlite3_stmt* prepareCached(const std::string& sql);
    void bindParams(sqlite3_stmt* stmt, const std::vector<SqlParam>& params, const std::string& sql);
    [[noreturn]] void raise(int rc, const std::string& context, const std::string& sql) const;
};

} // namespace sessiondb

#endif // SQLITE_DATABASE_HPP
