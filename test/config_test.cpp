#include <gtest/gtest.h>

#include "config.hpp"

using namespace harvest;

TEST(ConfigTest, Defaults) {
    CollectorConfig cfg = CollectorConfig::from_json(nlohmann::json::object());
    EXPECT_EQ(cfg.connection.host, "localhost");
    EXPECT_EQ(cfg.connection.port, 3306);
    EXPECT_EQ(cfg.connection.user, "datadog");
    EXPECT_TRUE(cfg.plans_enabled());
    EXPECT_FALSE(cfg.auto_enable_events_statements_history_long);
    EXPECT_EQ(cfg.execution_plan_query_limit, DEFAULT_QUERY_LIMIT);
    EXPECT_EQ(cfg.explain_procedure, "explain_statement");
    EXPECT_EQ(cfg.collection_interval_s, 10);
    EXPECT_TRUE(cfg.tags.empty());
}

TEST(ConfigTest, Overrides) {
    auto j = nlohmann::json::parse(R"({
        "host": "db.internal",
        "port": 3307,
        "user": "monitor",
        "password": "secret",
        "collect_execution_plans": false,
        "auto_enable_events_statements_history_long": true,
        "execution_plan_query_limit": 50,
        "explain_procedure": "datadog.explain_statement",
        "tags": ["env:prod", "team:dbm"],
        "intake_url": "http://localhost:8126/dbm",
        "log_level": "debug"
    })");
    CollectorConfig cfg = CollectorConfig::from_json(j);
    EXPECT_EQ(cfg.connection.host, "db.internal");
    EXPECT_EQ(cfg.connection.port, 3307);
    EXPECT_EQ(cfg.connection.user, "monitor");
    EXPECT_EQ(cfg.connection.password, "secret");
    EXPECT_FALSE(cfg.plans_enabled());
    EXPECT_TRUE(cfg.auto_enable_events_statements_history_long);
    EXPECT_EQ(cfg.execution_plan_query_limit, 50);
    EXPECT_EQ(cfg.explain_procedure, "datadog.explain_statement");
    EXPECT_EQ(cfg.tags, (std::vector<std::string>{"env:prod", "team:dbm"}));
    EXPECT_EQ(cfg.intake_url, "http://localhost:8126/dbm");
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ConfigTest, InvalidQueryLimitFallsBack) {
    EXPECT_EQ(CollectorConfig::from_json({{"execution_plan_query_limit", 0}}).execution_plan_query_limit,
              DEFAULT_QUERY_LIMIT);
    EXPECT_EQ(CollectorConfig::from_json({{"execution_plan_query_limit", -5}}).execution_plan_query_limit,
              DEFAULT_QUERY_LIMIT);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    CollectorConfig cfg = CollectorConfig::from_file("/nonexistent/plan-harvest.json");
    EXPECT_EQ(cfg.connection.host, "localhost");
    EXPECT_EQ(cfg.execution_plan_query_limit, DEFAULT_QUERY_LIMIT);
}

TEST(ConfigTest, WrongTypeThrows) {
    EXPECT_THROW(CollectorConfig::from_json({{"port", "not-a-port"}}), nlohmann::json::exception);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("info"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::INFO);
}
