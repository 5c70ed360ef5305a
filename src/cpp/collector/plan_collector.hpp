#pragma once
// =============================================================================
// PlanCollector -- one collection run:
//   scan history -> acquire plan per row -> build PlanRecord -> submit batch
//
// Owns the scanner (checkpoint) and the acquirer (per-schema strategy cache);
// both persist across runs for the lifetime of the collector. Runs are
// sequential and single-threaded.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>
#include "event_sink.hpp"
#include "history_scanner.hpp"
#include "obfuscator.hpp"
#include "plan_acquirer.hpp"
#include "../config.hpp"
#include "../connectors/db_connector.hpp"

namespace harvest {

// Outcome of one collect() call
struct CollectionStats {
    bool ran = false;             // false: disabled or history not ready
    int rows_scanned = 0;
    int plans_collected = 0;
    int num_incomplete = 0;
    int num_truncated = 0;
    int64_t duration_ms = 0;
};

class PlanCollector {
public:
    static constexpr const char* SOURCE = "mysql";

    PlanCollector(const CollectorConfig& config, DbConnector& db,
                  const SqlObfuscator& obfuscator, PlanEventSink& sink);

    // Same, with explicit strategies (priority order)
    PlanCollector(const CollectorConfig& config, DbConnector& db,
                  const SqlObfuscator& obfuscator, PlanEventSink& sink,
                  ExecutionPlanAcquirer::Strategies strategies);

    // One pass. Database errors the engine cannot classify propagate.
    CollectionStats collect();

    // Configured tags + server/port, sorted and de-duplicated
    [[nodiscard]] std::vector<std::string> run_tags() const;

    [[nodiscard]] const HistoryScanner& scanner() const { return scanner_; }
    [[nodiscard]] const ExecutionPlanAcquirer& acquirer() const { return acquirer_; }

private:
    PlanRecord build_record(const HistoryRow& row, std::string plan) const;

    CollectorConfig config_;
    const SqlObfuscator& obfuscator_;
    PlanEventSink& sink_;
    HistoryScanner scanner_;
    ExecutionPlanAcquirer acquirer_;
};

} // namespace harvest
