#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include "utils/logger.hpp"

namespace harvest {

// Default per-run row limit for the statement history scan
inline constexpr int DEFAULT_QUERY_LIMIT = 500;

// Connection info for the monitored MySQL instance
struct DbConnection {
    std::string host = "localhost";
    uint16_t port = 3306;
    std::string user = "datadog";
    std::string password;
    std::string unix_socket;      // Empty: connect over TCP
    unsigned int connect_timeout_s = 10;
};

// Full collector configuration
struct CollectorConfig {
    DbConnection connection;

    // Feature switches
    bool dbm_enabled = true;
    bool collect_execution_plans = true;
    bool auto_enable_events_statements_history_long = false;

    // Statement history scan
    int execution_plan_query_limit = DEFAULT_QUERY_LIMIT;

    // Privileged procedure used by the first explain strategy
    std::string explain_procedure = "explain_statement";

    std::vector<std::string> tags;

    // Scheduling
    int collection_interval_s = 10;

    // Event intake (empty url: batches are only logged)
    std::string intake_url;
    std::string api_key;

    std::string log_level = "info";

    bool plans_enabled() const { return dbm_enabled && collect_execution_plans; }

    static CollectorConfig from_file(const std::string& path);
    static CollectorConfig from_json(const nlohmann::json& j);
};

inline CollectorConfig CollectorConfig::from_json(const nlohmann::json& j) {
    CollectorConfig cfg;
    cfg.connection.host = j.value("host", cfg.connection.host);
    cfg.connection.port = j.value("port", cfg.connection.port);
    cfg.connection.user = j.value("user", cfg.connection.user);
    cfg.connection.password = j.value("password", cfg.connection.password);
    cfg.connection.unix_socket = j.value("unix_socket", cfg.connection.unix_socket);
    cfg.connection.connect_timeout_s = j.value("connect_timeout_s", cfg.connection.connect_timeout_s);

    cfg.dbm_enabled = j.value("dbm_enabled", cfg.dbm_enabled);
    cfg.collect_execution_plans = j.value("collect_execution_plans", cfg.collect_execution_plans);
    cfg.auto_enable_events_statements_history_long = j.value(
        "auto_enable_events_statements_history_long",
        cfg.auto_enable_events_statements_history_long);

    cfg.execution_plan_query_limit = j.value("execution_plan_query_limit",
        cfg.execution_plan_query_limit);
    if (cfg.execution_plan_query_limit < 1) {
        LOG_WRN("[config] execution_plan_query_limit=%d is invalid, using %d",
            cfg.execution_plan_query_limit, DEFAULT_QUERY_LIMIT);
        cfg.execution_plan_query_limit = DEFAULT_QUERY_LIMIT;
    }

    cfg.explain_procedure = j.value("explain_procedure", cfg.explain_procedure);
    cfg.collection_interval_s = j.value("collection_interval_s", cfg.collection_interval_s);
    cfg.intake_url = j.value("intake_url", cfg.intake_url);
    cfg.api_key = j.value("api_key", cfg.api_key);
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (j.contains("tags")) {
        for (const auto& t : j["tags"]) {
            cfg.tags.push_back(t.get<std::string>());
        }
    }
    return cfg;
}

inline CollectorConfig CollectorConfig::from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] %s not found, using defaults", path.c_str());
        return CollectorConfig{};
    }

    nlohmann::json j;
    f >> j;
    return from_json(j);
}

} // namespace harvest
