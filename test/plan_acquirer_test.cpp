#include <gtest/gtest.h>

#include "collector/plan_acquirer.hpp"
#include "fake_connector.hpp"

using namespace harvest;
using namespace harvest::test;

class PlanAcquirerTest : public ::testing::Test {
protected:
    int strategy_calls() const { return db_.count(CALL_SQL) + db_.count(EXPLAIN_SQL); }

    FakeConnector db_;
    ExecutionPlanAcquirer acquirer_{db_, ExecutionPlanAcquirer::default_strategies()};
};

TEST_F(PlanAcquirerTest, ExplainableKeywords) {
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("SELECT 1"));
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("  select * from t"));
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("TABLE t"));
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("Delete from t"));
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("INSERT INTO t VALUES (1)"));
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("replace into t values (1)"));
    EXPECT_TRUE(ExecutionPlanAcquirer::can_explain("UPDATE\tt SET a = 1"));

    EXPECT_FALSE(ExecutionPlanAcquirer::can_explain("CREATE TABLE t (a INT)"));
    EXPECT_FALSE(ExecutionPlanAcquirer::can_explain("SHOW TABLES"));
    EXPECT_FALSE(ExecutionPlanAcquirer::can_explain("selectx 1"));
    EXPECT_FALSE(ExecutionPlanAcquirer::can_explain(""));
}

TEST_F(PlanAcquirerTest, IneligibleStatementMakesNoDatabaseCall) {
    auto plan = acquirer_.acquire("CREATE TABLE t (a INT)", std::string("app"));
    EXPECT_FALSE(plan.has_value());
    EXPECT_TRUE(db_.calls.empty());
    EXPECT_EQ(acquirer_.cache().size(), 0u);
}

TEST_F(PlanAcquirerTest, ProcedureWinsWhenAvailable) {
    db_.on_result(CALL_SQL, plan_result(SIMPLE_PLAN));

    auto plan = acquirer_.acquire("SELECT * FROM users", std::string("app"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(*plan, SIMPLE_PLAN);
    EXPECT_EQ(db_.count("USE `app`"), 1);
    EXPECT_EQ(db_.count(EXPLAIN_SQL), 0);

    auto m = acquirer_.cache().get(std::string("app"));
    EXPECT_EQ(m.state, SchemaState::RESOLVED);
    EXPECT_EQ(m.strategy, ProcedureExplainStrategy::NAME);
}

TEST_F(PlanAcquirerTest, FallsBackToStatementAndRemembersIt) {
    db_.on_error(CALL_SQL, 1305, "PROCEDURE app.explain_statement does not exist");
    db_.on_result(EXPLAIN_SQL, plan_result(SIMPLE_PLAN));

    auto plan = acquirer_.acquire("SELECT * FROM users", std::string("app"));
    ASSERT_TRUE(plan.has_value());
    auto m = acquirer_.cache().get(std::string("app"));
    EXPECT_EQ(m.state, SchemaState::RESOLVED);
    EXPECT_EQ(m.strategy, StatementExplainStrategy::NAME);

    db_.clear_calls();
    plan = acquirer_.acquire("SELECT * FROM orders", std::string("app"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(db_.count(CALL_SQL), 0);
    EXPECT_EQ(db_.count(EXPLAIN_SQL), 1);
}

TEST_F(PlanAcquirerTest, AllNonRetryableDisablesSchema) {
    db_.on_error(CALL_SQL, 1370, "execute command denied");
    db_.on_error(EXPLAIN_SQL, 1046, "No database selected");

    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("locked")).has_value());
    EXPECT_TRUE(acquirer_.cache().is_disabled(std::string("locked")));

    db_.clear_calls();
    EXPECT_FALSE(acquirer_.acquire("SELECT 2", std::string("locked")).has_value());
    EXPECT_TRUE(db_.calls.empty());
}

TEST_F(PlanAcquirerTest, RetryableFailuresKeepSchemaUnresolved) {
    db_.on_error(CALL_SQL, 1213, "Deadlock found");
    db_.on_error(EXPLAIN_SQL, 1064, "syntax error");

    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("app")).has_value());
    EXPECT_EQ(acquirer_.cache().get(std::string("app")).state, SchemaState::UNRESOLVED);
    EXPECT_EQ(strategy_calls(), 2);

    // Next statement tries both strategies again
    db_.clear_calls();
    EXPECT_FALSE(acquirer_.acquire("SELECT 2", std::string("app")).has_value());
    EXPECT_EQ(strategy_calls(), 2);
}

TEST_F(PlanAcquirerTest, MixedFailuresKeepSchemaUnresolved) {
    db_.on_error(CALL_SQL, 1305, "PROCEDURE does not exist");
    db_.on_error(EXPLAIN_SQL, 1064, "syntax error");

    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("app")).has_value());
    EXPECT_EQ(acquirer_.cache().get(std::string("app")).state, SchemaState::UNRESOLVED);
}

TEST_F(PlanAcquirerTest, AccessDeniedOnSchemaDisablesIt) {
    db_.on_error("USE `restricted`", 1044, "Access denied for user to database 'restricted'");

    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("restricted")).has_value());
    EXPECT_TRUE(acquirer_.cache().is_disabled(std::string("restricted")));
    EXPECT_EQ(strategy_calls(), 0);

    db_.clear_calls();
    EXPECT_FALSE(acquirer_.acquire("SELECT 2", std::string("restricted")).has_value());
    EXPECT_FALSE(acquirer_.acquire("UPDATE t SET a = 1", std::string("restricted")).has_value());
    EXPECT_TRUE(db_.calls.empty());
}

TEST_F(PlanAcquirerTest, UnknownSchemaDisablesIt) {
    db_.on_error("USE `gone`", 1049, "Unknown database 'gone'");
    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("gone")).has_value());
    EXPECT_TRUE(acquirer_.cache().is_disabled(std::string("gone")));
}

TEST_F(PlanAcquirerTest, TransientSchemaSwitchErrorSkipsOnlyThisStatement) {
    bool fail = true;
    db_.on("USE `app`", [&fail](const std::string&, const std::vector<SqlParam>&) -> ResultSet {
        if (fail) throw DbError(1205, "Lock wait timeout exceeded");
        return {};
    });
    db_.on_result(CALL_SQL, plan_result(SIMPLE_PLAN));

    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("app")).has_value());
    EXPECT_EQ(acquirer_.cache().get(std::string("app")).state, SchemaState::UNRESOLVED);
    EXPECT_EQ(strategy_calls(), 0);

    fail = false;
    EXPECT_TRUE(acquirer_.acquire("SELECT 1", std::string("app")).has_value());
}

TEST_F(PlanAcquirerTest, UnclassifiedSchemaErrorPropagates) {
    db_.on("USE `app`", [](const std::string&, const std::vector<SqlParam>&) -> ResultSet {
        throw DbConnectionError("Lost connection to MySQL server");
    });
    EXPECT_THROW(acquirer_.acquire("SELECT 1", std::string("app")), DbConnectionError);
}

TEST_F(PlanAcquirerTest, NullSchemaSkipsUse) {
    db_.on_result(CALL_SQL, plan_result(SIMPLE_PLAN));

    EXPECT_TRUE(acquirer_.acquire("SELECT 1", std::nullopt).has_value());
    EXPECT_EQ(db_.count(USE_SQL), 0);
    EXPECT_EQ(acquirer_.cache().get(std::nullopt).state, SchemaState::RESOLVED);
}

TEST_F(PlanAcquirerTest, SchemaNameIsQuoted) {
    db_.on_result(CALL_SQL, plan_result(SIMPLE_PLAN));
    acquirer_.acquire("SELECT 1", std::string("we`ird"));
    EXPECT_EQ(db_.count("USE `we``ird`"), 1);
}

TEST_F(PlanAcquirerTest, ResolvedStrategyFailureLeavesCacheAlone) {
    db_.on_result(CALL_SQL, plan_result(SIMPLE_PLAN));
    ASSERT_TRUE(acquirer_.acquire("SELECT 1", std::string("app")).has_value());

    db_.on_error(CALL_SQL, 1305, "PROCEDURE does not exist");
    db_.clear_calls();
    EXPECT_FALSE(acquirer_.acquire("SELECT 2", std::string("app")).has_value());
    EXPECT_EQ(db_.count(EXPLAIN_SQL), 0);

    auto m = acquirer_.cache().get(std::string("app"));
    EXPECT_EQ(m.state, SchemaState::RESOLVED);
    EXPECT_EQ(m.strategy, ProcedureExplainStrategy::NAME);
}

TEST_F(PlanAcquirerTest, SchemasAreIndependent) {
    db_.on_error("USE `restricted`", 1044, "Access denied");
    db_.on_result(CALL_SQL, plan_result(SIMPLE_PLAN));

    EXPECT_FALSE(acquirer_.acquire("SELECT 1", std::string("restricted")).has_value());
    EXPECT_TRUE(acquirer_.acquire("SELECT 1", std::string("app")).has_value());
    EXPECT_EQ(acquirer_.cache().size(), 2u);
}
