#pragma once
// One collected execution plan, ready for delivery.
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "history_scanner.hpp"

namespace harvest {

struct PlanRecord {
    double duration_ns = 0.0;
    std::optional<std::string> schema;
    std::string statement;          // Obfuscated SQL text
    std::string query_signature;
    std::string plan;               // EXPLAIN FORMAT=JSON document
    double plan_cost = 0.0;
    std::string plan_signature;

    // Debug payload
    std::string normalized_plan;
    std::string obfuscated_plan;
    std::string digest_text;

    double lock_time_ns = 0.0;
    StatementCounters counters;

    // Event body (without source, tags and timestamp)
    [[nodiscard]] nlohmann::json to_json() const {
        const StatementCounters& c = counters;
        nlohmann::json db = {
            {"instance", schema ? nlohmann::json(*schema) : nlohmann::json(nullptr)},
            {"statement", statement},
            {"query_signature", query_signature},
            {"plan", plan},
            {"plan_cost", plan_cost},
            {"plan_signature", plan_signature},
            {"debug", {
                {"normalized_plan", normalized_plan},
                {"obfuscated_plan", obfuscated_plan},
                {"digest_text", digest_text},
            }},
            {"mysql", {
                {"lock_time", lock_time_ns},
                {"rows_affected", c.rows_affected},
                {"rows_sent", c.rows_sent},
                {"rows_examined", c.rows_examined},
                {"select_full_join", c.select_full_join},
                {"select_full_range_join", c.select_full_range_join},
                {"select_range", c.select_range},
                {"select_range_check", c.select_range_check},
                {"select_scan", c.select_scan},
                {"sort_merge_passes", c.sort_merge_passes},
                {"sort_range", c.sort_range},
                {"sort_rows", c.sort_rows},
                {"sort_scan", c.sort_scan},
                {"no_index_used", c.no_index_used},
                {"no_good_index_used", c.no_good_index_used},
            }},
        };
        return {{"duration", duration_ns}, {"db", db}};
    }
};

} // namespace harvest
