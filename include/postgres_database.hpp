#ifndef POSTGRES_DATABASE_HPP
#define POSTGRES_DATABASE_HPP

#include "database_handle.hpp"
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <unordered_map>

namespace sessiondb {

class PostgresDatabase : public DatabaseHandle {
public:
    explicit PostgresDatabase(const DatabaseConnectionConfig& config);
    // Adopts a connection built by the caller
    explicit PostgresDatabase(std::shared_ptr<pqxx::connection> connection);
    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;

    void execute(const std::string& sql, const std::vector<SqlParam>& params) override;
    std::optional<std::string> selectValue(const std::string& sql,
                                           const std::vector<SqlParam>& params,
                                           SqlParam::Type resultType = SqlParam::Type::TEXT) override;

    PlaceholderStyle placeholderStyle() const override { return PlaceholderStyle::NUMBERED; }
    std::string driverName() const override { return "postgresql"; }

    bool isConnected() const;
    size_t preparedStatementCount() const;

private:
    std::shared_ptr<pqxx::connection> connection_;
    std::unordered_map<std::string, std::string> preparedNames_; // sql -> statement name
    mutable std::mutex mutex_;

    // Called with mutex_ held
    const std::string& prepareCached(const std::string& sql);
    pqxx::result run(const std::string& sql, const std::vector<SqlParam>& params);
    static pqxx::params bindParams(const std::vector<SqlParam>& params);
    [[noreturn]] void rethrow(const std::string& sql) const;
};

} // namespace sessiondb

#endif // POSTGRES_DATABASE_HPP
