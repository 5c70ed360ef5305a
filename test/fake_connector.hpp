#pragma once
// Scripted in-memory DbConnector: answers by SQL prefix, records every call.
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "connectors/db_connector.hpp"

namespace harvest {
namespace test {

class FakeConnector : public DbConnector {
public:
    struct Call {
        std::string sql;
        std::vector<SqlParam> params;
    };

    using Handler = std::function<ResultSet(const std::string&, const std::vector<SqlParam>&)>;

    // Later registrations win over earlier ones for the same prefix
    void on(const std::string& prefix, Handler handler) {
        handlers_.emplace_back(prefix, std::move(handler));
    }

    void on_result(const std::string& prefix, ResultSet rs) {
        on(prefix, [rs](const std::string&, const std::vector<SqlParam>&) { return rs; });
    }

    void on_error(const std::string& prefix, unsigned int code, const std::string& message) {
        on(prefix, [code, message](const std::string&, const std::vector<SqlParam>&) -> ResultSet {
            throw DbError(code, message);
        });
    }

    bool connect(const DbConnection&) override { connected_ = true; return true; }
    void disconnect() override { connected_ = false; }
    [[nodiscard]] bool is_connected() const override { return connected_; }

    ResultSet execute(const std::string& sql) override { return execute(sql, {}); }

    ResultSet execute(const std::string& sql, const std::vector<SqlParam>& params) override {
        calls.push_back({sql, params});
        for (auto it = handlers_.rbegin(); it != handlers_.rend(); ++it) {
            if (sql.compare(0, it->first.size(), it->first) == 0) {
                return it->second(sql, params);
            }
        }
        return {};
    }

    [[nodiscard]] const char* system_name() const override { return "fake"; }

    // Number of recorded statements starting with prefix
    [[nodiscard]] int count(const std::string& prefix) const {
        int n = 0;
        for (const auto& c : calls) {
            if (c.sql.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

    void clear_calls() { calls.clear(); }

    std::vector<Call> calls;

private:
    bool connected_ = true;
    std::vector<std::pair<std::string, Handler>> handlers_;
};

// Single-cell result, as returned by EXPLAIN / CALL explain_statement
inline ResultSet plan_result(const std::string& plan_json) {
    ResultSet rs;
    rs.columns = {"EXPLAIN"};
    rs.rows = {{Cell{plan_json}}};
    return rs;
}

inline ResultSet high_water_mark_result(Cell value) {
    ResultSet rs;
    rs.columns = {"MAX(timer_start)"};
    rs.rows = {{std::move(value)}};
    return rs;
}

inline const std::vector<std::string>& history_columns() {
    static const std::vector<std::string> cols = {
        "current_schema", "sql_text", "digest_text", "timer_start",
        "max_timer_wait_ns", "lock_time_ns", "rows_affected", "rows_sent",
        "rows_examined", "select_full_join", "select_full_range_join",
        "select_range", "select_range_check", "select_scan",
        "sort_merge_passes", "sort_range", "sort_rows", "sort_scan",
        "no_index_used", "no_good_index_used",
    };
    return cols;
}

// Complete history row; tweak cells by index afterwards for edge cases
inline Row history_row(uint64_t timer_start, const std::string& sql, Cell schema = Cell{"app"}) {
    Row row = {
        std::move(schema), Cell{sql}, Cell{sql}, Cell{std::to_string(timer_start)},
        Cell{"1500.2500"}, Cell{"12.0000"}, Cell{"0"}, Cell{"10"},
        Cell{"100"}, Cell{"0"}, Cell{"0"},
        Cell{"0"}, Cell{"0"}, Cell{"1"},
        Cell{"0"}, Cell{"0"}, Cell{"0"}, Cell{"0"},
        Cell{"1"}, Cell{"0"},
    };
    return row;
}

inline ResultSet history_result(std::vector<Row> rows) {
    ResultSet rs;
    rs.columns = history_columns();
    rs.rows = std::move(rows);
    return rs;
}

// Statement prefixes the engine issues
inline constexpr const char* HIGH_WATER_MARK_SQL = "SELECT MAX(timer_start)";
inline constexpr const char* HISTORY_SQL = "SELECT current_schema";
inline constexpr const char* USE_SQL = "USE ";
inline constexpr const char* CALL_SQL = "CALL explain_statement";
inline constexpr const char* EXPLAIN_SQL = "EXPLAIN FORMAT=json";
inline constexpr const char* ENABLE_CONSUMERS_SQL = "UPDATE performance_schema.setup_consumers";

inline const char* const SIMPLE_PLAN =
    R"json({"query_block":{"select_id":1,"cost_info":{"query_cost":"12.50"},"table":{"table_name":"users","access_type":"ALL","rows_examined_per_scan":100,"attached_condition":"(`app`.`users`.`id` = 42)"}}})json";

} // namespace test
} // namespace harvest
