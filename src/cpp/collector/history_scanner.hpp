#pragma once
// =============================================================================
// HistoryScanner -- incremental reads of
// performance_schema.events_statements_history_long.
//
// Only rows with timer_start above the checkpoint are read, at most one per
// digest, most expensive first. Every returned row moves the checkpoint
// forward, including rows dropped afterwards, so a bad row can never stall
// the scan.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "checkpoint.hpp"
#include "../config.hpp"
#include "../connectors/db_connector.hpp"

namespace harvest {

// Optimizer / execution counters of one statement execution
struct StatementCounters {
    int64_t rows_affected = 0;
    int64_t rows_sent = 0;
    int64_t rows_examined = 0;
    int64_t select_full_join = 0;
    int64_t select_full_range_join = 0;
    int64_t select_range = 0;
    int64_t select_range_check = 0;
    int64_t select_scan = 0;
    int64_t sort_merge_passes = 0;
    int64_t sort_range = 0;
    int64_t sort_rows = 0;
    int64_t sort_scan = 0;
    int64_t no_index_used = 0;
    int64_t no_good_index_used = 0;
};

// One sampled statement execution
struct HistoryRow {
    std::optional<std::string> schema;  // NULL when no schema was selected
    std::string sql_text;
    std::string digest_text;
    uint64_t timer_start = 0;
    double duration_ns = 0.0;           // MAX(timer_wait) of the digest
    double lock_time_ns = 0.0;
    StatementCounters counters;
};

struct ScanResult {
    bool ready = false;                 // false: history table unavailable
    std::vector<HistoryRow> rows;       // Complete, untruncated rows
    int num_returned = 0;               // Rows the source returned
    int num_incomplete = 0;             // Dropped: NULL / unparseable field
    int num_truncated = 0;              // Dropped: sql_text cut off ("...")
};

// Suffix performance_schema appends to sql_text longer than
// performance_schema_max_sql_text_length
inline constexpr const char* TRUNCATION_MARKER = "...";

inline bool is_truncated_sql(const std::string& sql_text) {
    const std::string marker = TRUNCATION_MARKER;
    return sql_text.size() >= marker.size() &&
           sql_text.compare(sql_text.size() - marker.size(), marker.size(), marker) == 0;
}

class HistoryScanner {
public:
    HistoryScanner(DbConnector& db, bool auto_enable_consumers);

    // Reads the next batch. Establishes the checkpoint first if needed;
    // returns ready=false (no rows) if that is not possible yet.
    ScanResult scan(int limit = DEFAULT_QUERY_LIMIT);

    // Reads MAX(timer_start); false if the table is empty or disabled.
    bool establish_checkpoint();

    [[nodiscard]] const Checkpoint& checkpoint() const { return checkpoint_; }
    [[nodiscard]] bool auto_enable_consumers() const { return auto_enable_consumers_; }

private:
    // UPDATE performance_schema.setup_consumers; latches off on read-only
    void enable_consumers();

    DbConnector& db_;
    Checkpoint checkpoint_;
    bool auto_enable_consumers_;
};

} // namespace harvest
