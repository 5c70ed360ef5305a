#include "plan_collector.hpp"
#include "plan_cost.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <set>

namespace harvest {

PlanCollector::PlanCollector(const CollectorConfig& config, DbConnector& db,
                             const SqlObfuscator& obfuscator, PlanEventSink& sink)
    : PlanCollector(config, db, obfuscator, sink,
                    ExecutionPlanAcquirer::default_strategies(config.explain_procedure)) {}

PlanCollector::PlanCollector(const CollectorConfig& config, DbConnector& db,
                             const SqlObfuscator& obfuscator, PlanEventSink& sink,
                             ExecutionPlanAcquirer::Strategies strategies)
    : config_(config)
    , obfuscator_(obfuscator)
    , sink_(sink)
    , scanner_(db, config.auto_enable_events_statements_history_long)
    , acquirer_(db, std::move(strategies))
{}

std::vector<std::string> PlanCollector::run_tags() const {
    std::set<std::string> tags(config_.tags.begin(), config_.tags.end());
    tags.insert("server:" + config_.connection.host);
    tags.insert("port:" + std::to_string(config_.connection.port));
    return {tags.begin(), tags.end()};
}

PlanRecord PlanCollector::build_record(const HistoryRow& row, std::string plan) const {
    PlanRecord r;
    r.duration_ns = row.duration_ns;
    r.schema = row.schema;
    r.statement = obfuscator_.obfuscate_sql(row.sql_text);
    r.query_signature = compute_sql_signature(r.statement);
    r.plan_cost = parse_plan_cost(plan);
    r.normalized_plan = obfuscator_.obfuscate_plan(plan, /*normalize=*/true);
    r.obfuscated_plan = obfuscator_.obfuscate_plan(plan, /*normalize=*/false);
    r.plan_signature = compute_plan_signature(r.normalized_plan);
    r.plan = std::move(plan);
    r.digest_text = row.digest_text;
    r.lock_time_ns = row.lock_time_ns;
    r.counters = row.counters;
    return r;
}

CollectionStats PlanCollector::collect() {
    CollectionStats stats;
    if (!config_.plans_enabled()) {
        LOG_DBG("[collector] Execution plan collection is disabled");
        return stats;
    }

    Timer timer;
    timer.start();

    ScanResult scan = scanner_.scan(config_.execution_plan_query_limit);
    if (!scan.ready) return stats;

    stats.ran = true;
    stats.rows_scanned = scan.num_returned;
    stats.num_incomplete = scan.num_incomplete;
    stats.num_truncated = scan.num_truncated;

    std::vector<PlanRecord> records;
    for (const HistoryRow& row : scan.rows) {
        auto plan = acquirer_.acquire(row.sql_text, row.schema);
        if (!plan) continue;
        records.push_back(build_record(row, std::move(*plan)));
    }
    stats.plans_collected = static_cast<int>(records.size());

    sink_.submit(records, run_tags(), SOURCE);

    if (scan.num_truncated > 0) {
        LOG_WRN("[collector] Unable to collect %d/%d execution plans due to truncated SQL text. "
                "Consider raising `performance_schema_max_sql_text_length` to capture these queries.",
            scan.num_truncated, scan.num_truncated + stats.plans_collected);
    }

    timer.stop();
    stats.duration_ms = timer.elapsed_ms();
    LOG_DBG("[collector] Run done: %d rows, %d plans, %lld ms",
        stats.rows_scanned, stats.plans_collected, static_cast<long long>(stats.duration_ms));
    return stats;
}

} // namespace harvest
