#pragma once
// Abstract database session used by the plan acquisition engine.
//
// Every statement goes through execute(). Server-side failures surface as
// DbError (numeric code + message); client-side failures (connection lost,
// protocol out of sync, not connected) surface as DbConnectionError and are
// never classified by the engine.
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <chrono>
#include <variant>
#include <vector>
#include "../config.hpp"
#include "../utils/logger.hpp"

namespace harvest {

// Server error codes the engine classifies
namespace mysql_errc {
    inline constexpr unsigned int DBACCESS_DENIED      = 1044;  // Access denied for user to database
    inline constexpr unsigned int NO_DB_ERROR          = 1046;  // No database selected / no permission on statement
    inline constexpr unsigned int BAD_DB_ERROR         = 1049;  // Unknown database
    inline constexpr unsigned int PARSE_ERROR          = 1064;  // Syntax error
    inline constexpr unsigned int TABLEACCESS_DENIED   = 1142;  // Command denied to user for table
    inline constexpr unsigned int OPTION_PREVENTS_STATEMENT = 1290;  // e.g. --read-only
    inline constexpr unsigned int SP_DOES_NOT_EXIST    = 1305;  // Procedure does not exist
    inline constexpr unsigned int PROCACCESS_DENIED    = 1370;  // No execute privilege on routine
}

// Structured server error: numeric code + message
class DbError : public std::runtime_error {
public:
    DbError(unsigned int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] unsigned int code() const noexcept { return code_; }
    [[nodiscard]] std::string message() const { return what(); }

private:
    unsigned int code_;
};

// Client-side failure without a server error code
class DbConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One result cell; NULL is std::nullopt
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

struct ResultSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;

    [[nodiscard]] bool empty() const { return rows.empty(); }

    // Index of a named column, or -1
    [[nodiscard]] int column_index(const std::string& name) const {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) return static_cast<int>(i);
        }
        return -1;
    }
};

// Bound parameter for execute(sql, params)
using SqlParam = std::variant<std::string, int64_t, uint64_t>;

class DbConnector {
public:
    virtual ~DbConnector() = default;

    virtual bool connect(const DbConnection& conn) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Runs a statement and returns its first result set (empty for
    // statements without one). Throws DbError / DbConnectionError.
    virtual ResultSet execute(const std::string& sql) = 0;

    // Same, with '?' placeholders bound server-side (never interpolated)
    virtual ResultSet execute(const std::string& sql, const std::vector<SqlParam>& params) = 0;

    [[nodiscard]] virtual const char* system_name() const = 0;

    // Connection resilience: reconnect after connection loss.
    virtual bool reconnect(const DbConnection& conn) {
        disconnect();
        return connect(conn);
    }

    // Ensure connection is alive, retry with exponential backoff if lost.
    // Backoff: base_delay_ms * 2^(attempt-1), capped at 30s.
    bool ensure_connected(const DbConnection& conn,
                          int max_retries = 5, int base_delay_ms = 1000) {
        if (is_connected()) return true;

        LOG_WRN("[%s] Not connected, starting reconnection (max %d retries)...",
            system_name(), max_retries);

        for (int attempt = 1; attempt <= max_retries; ++attempt) {
            if (reconnect(conn)) {
                LOG_INF("[%s] Connected on attempt %d", system_name(), attempt);
                return true;
            }
            if (attempt == max_retries) break;

            int delay = base_delay_ms * (1 << (attempt - 1));
            if (delay > 30000) delay = 30000;
            LOG_ERR("[%s] Connect attempt %d/%d failed, next in %d ms",
                system_name(), attempt, max_retries, delay);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }

        LOG_ERR("[%s] All %d connection attempts FAILED", system_name(), max_retries);
        return false;
    }
};

} // namespace harvest
