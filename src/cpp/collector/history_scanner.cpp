#include "history_scanner.hpp"
#include "../utils/logger.hpp"

#include <cerrno>
#include <cstdlib>

namespace harvest {

namespace {

// Most recent events, biased towards higher wait times, one row per digest.
// Excludes EXPLAINs so the collector never samples its own statements.
const char* const HISTORY_QUERY =
    "SELECT current_schema AS current_schema, "
    "       sql_text AS sql_text, "
    "       IFNULL(digest_text, sql_text) AS digest_text, "
    "       timer_start AS timer_start, "
    "       MAX(timer_wait) / 1000 AS max_timer_wait_ns, "
    "       lock_time / 1000 AS lock_time_ns, "
    "       rows_affected, "
    "       rows_sent, "
    "       rows_examined, "
    "       select_full_join, "
    "       select_full_range_join, "
    "       select_range, "
    "       select_range_check, "
    "       select_scan, "
    "       sort_merge_passes, "
    "       sort_range, "
    "       sort_rows, "
    "       sort_scan, "
    "       no_index_used, "
    "       no_good_index_used "
    "  FROM performance_schema.events_statements_history_long "
    " WHERE sql_text IS NOT NULL "
    "   AND event_name LIKE ? "
    "   AND digest_text NOT LIKE ? "
    "   AND timer_start > ? "
    " GROUP BY digest "
    " ORDER BY timer_wait DESC "
    " LIMIT ?";

const char* const HIGH_WATER_MARK_QUERY =
    "SELECT MAX(timer_start) FROM performance_schema.events_statements_history_long";

const char* const ENABLE_CONSUMERS_QUERY =
    "UPDATE performance_schema.setup_consumers SET enabled = 'YES' "
    "WHERE name = 'events_statements_history_long'";

const Cell* find_cell(const ResultSet& rs, const Row& row, const char* column) {
    int idx = rs.column_index(column);
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return nullptr;
    const Cell& c = row[static_cast<size_t>(idx)];
    return c ? &c : nullptr;
}

bool parse_u64(const Cell* cell, uint64_t& out) {
    if (!cell || (*cell)->empty() || (**cell)[0] == '-') return false;
    const std::string& s = **cell;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

bool parse_i64(const Cell* cell, int64_t& out) {
    if (!cell || (*cell)->empty()) return false;
    const std::string& s = **cell;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool parse_double(const Cell* cell, double& out) {
    if (!cell || (*cell)->empty()) return false;
    const std::string& s = **cell;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

bool parse_text(const Cell* cell, std::string& out) {
    if (!cell || (*cell)->empty()) return false;
    out = **cell;
    return true;
}

// Fills every required field; false if any is NULL or unparseable
bool parse_history_row(const ResultSet& rs, const Row& row, HistoryRow& out) {
    if (const Cell* schema = find_cell(rs, row, "current_schema")) {
        out.schema = **schema;
    }

    StatementCounters& c = out.counters;
    return parse_text(find_cell(rs, row, "sql_text"), out.sql_text)
        && parse_text(find_cell(rs, row, "digest_text"), out.digest_text)
        && parse_u64(find_cell(rs, row, "timer_start"), out.timer_start)
        && parse_double(find_cell(rs, row, "max_timer_wait_ns"), out.duration_ns)
        && parse_double(find_cell(rs, row, "lock_time_ns"), out.lock_time_ns)
        && parse_i64(find_cell(rs, row, "rows_affected"), c.rows_affected)
        && parse_i64(find_cell(rs, row, "rows_sent"), c.rows_sent)
        && parse_i64(find_cell(rs, row, "rows_examined"), c.rows_examined)
        && parse_i64(find_cell(rs, row, "select_full_join"), c.select_full_join)
        && parse_i64(find_cell(rs, row, "select_full_range_join"), c.select_full_range_join)
        && parse_i64(find_cell(rs, row, "select_range"), c.select_range)
        && parse_i64(find_cell(rs, row, "select_range_check"), c.select_range_check)
        && parse_i64(find_cell(rs, row, "select_scan"), c.select_scan)
        && parse_i64(find_cell(rs, row, "sort_merge_passes"), c.sort_merge_passes)
        && parse_i64(find_cell(rs, row, "sort_range"), c.sort_range)
        && parse_i64(find_cell(rs, row, "sort_rows"), c.sort_rows)
        && parse_i64(find_cell(rs, row, "sort_scan"), c.sort_scan)
        && parse_i64(find_cell(rs, row, "no_index_used"), c.no_index_used)
        && parse_i64(find_cell(rs, row, "no_good_index_used"), c.no_good_index_used);
}

} // namespace

HistoryScanner::HistoryScanner(DbConnector& db, bool auto_enable_consumers)
    : db_(db), auto_enable_consumers_(auto_enable_consumers) {}

bool HistoryScanner::establish_checkpoint() {
    ResultSet rs = db_.execute(HIGH_WATER_MARK_QUERY);

    uint64_t high_water_mark = 0;
    const Cell* cell = rs.rows.empty() || rs.rows.front().empty() || !rs.rows.front().front()
        ? nullptr : &rs.rows.front().front();
    if (!parse_u64(cell, high_water_mark) || high_water_mark == 0) {
        LOG_DBG("[scanner] Unable to fetch from performance_schema.events_statements_history_long");
        if (auto_enable_consumers_) enable_consumers();
        return false;
    }

    checkpoint_.establish(high_water_mark);
    return true;
}

void HistoryScanner::enable_consumers() {
    try {
        db_.execute(ENABLE_CONSUMERS_QUERY);
    } catch (const DbError& e) {
        if (e.code() == mysql_errc::TABLEACCESS_DENIED) {
            LOG_ERR("[scanner] Unable to enable performance_schema consumers: %s", e.what());
            return;
        }
        if (e.code() == mysql_errc::OPTION_PREVENTS_STATEMENT) {
            LOG_WRN("[scanner] Unable to enable performance_schema consumers because the instance is read-only");
            auto_enable_consumers_ = false;
            return;
        }
        throw;
    }
    LOG_INF("[scanner] Enabled events_statements_history_long consumers");
}

ScanResult HistoryScanner::scan(int limit) {
    ScanResult result;
    if (!checkpoint_.is_established() && !establish_checkpoint()) {
        return result;
    }
    result.ready = true;

    const uint64_t watermark = *checkpoint_.value();
    ResultSet rs = db_.execute(HISTORY_QUERY, {
        SqlParam{std::string("statement/%")},
        SqlParam{std::string("EXPLAIN %")},
        SqlParam{watermark},
        SqlParam{static_cast<int64_t>(limit > 0 ? limit : DEFAULT_QUERY_LIMIT)},
    });
    db_.execute("SET @@SESSION.sql_notes = 0");

    result.num_returned = static_cast<int>(rs.rows.size());
    for (const Row& row : rs.rows) {
        uint64_t ts = 0;
        bool has_ts = parse_u64(find_cell(rs, row, "timer_start"), ts);
        if (has_ts) {
            if (ts <= watermark) {
                LOG_DBG("[scanner] Skipping row at or below checkpoint (%llu)",
                    static_cast<unsigned long long>(ts));
                continue;
            }
            checkpoint_.advance(ts);
        }

        HistoryRow parsed;
        if (!has_ts || !parse_history_row(rs, row, parsed)) {
            LOG_DBG("[scanner] Row was unexpectedly truncated or events_statements_history_long table is not enabled");
            ++result.num_incomplete;
            continue;
        }

        // Plans cannot be captured for truncated text; needs a larger
        // performance_schema_max_sql_text_length
        if (is_truncated_sql(parsed.sql_text)) {
            ++result.num_truncated;
            continue;
        }

        result.rows.push_back(std::move(parsed));
    }

    LOG_DBG("[scanner] %d rows returned, %zu usable, %d incomplete, %d truncated, checkpoint=%llu",
        result.num_returned, result.rows.size(), result.num_incomplete, result.num_truncated,
        static_cast<unsigned long long>(*checkpoint_.value()));
    return result;
}

} // namespace harvest
