#pragma once
// MySQL connector -- libmysqlclient (or MariaDB Connector/C) session used
// for the statement history scan, schema switches and EXPLAIN calls.
#include "db_connector.hpp"

namespace harvest {

class MySqlConnector : public DbConnector {
public:
    MySqlConnector() = default;
    ~MySqlConnector() override { disconnect(); }

    MySqlConnector(const MySqlConnector&) = delete;
    MySqlConnector& operator=(const MySqlConnector&) = delete;

    bool connect(const DbConnection& conn) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    ResultSet execute(const std::string& sql) override;
    ResultSet execute(const std::string& sql, const std::vector<SqlParam>& params) override;

    [[nodiscard]] const char* system_name() const override { return "mysql"; }

private:
    void* conn_ = nullptr;  // MYSQL* handle
};

} // namespace harvest
