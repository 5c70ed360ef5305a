#include <gtest/gtest.h>

#include <string>

#include "collector/plan_cost.hpp"

using harvest::parse_plan_cost;

TEST(PlanCostTest, ReadsStringCost) {
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"cost_info":{"query_cost":"12.5"}}})")), 12.5);
}

TEST(PlanCostTest, EmptyDocumentIsZero) {
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string("{}")), 0.0);
}

TEST(PlanCostTest, ReadsNumericCost) {
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"cost_info":{"query_cost":3}}})")), 3.0);
}

TEST(PlanCostTest, MissingCostInfoIsZero) {
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"select_id":1}})")), 0.0);
}

TEST(PlanCostTest, NonNumericCostIsZero) {
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"cost_info":{"query_cost":"n/a"}}})")), 0.0);
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"cost_info":{"query_cost":null}}})")), 0.0);
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"cost_info":{"query_cost":""}}})")), 0.0);
}

TEST(PlanCostTest, WrongShapesAreZero) {
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":[1,2]})")), 0.0);
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string(R"({"query_block":{"cost_info":"1.0"}})")), 0.0);
    EXPECT_DOUBLE_EQ(parse_plan_cost(std::string("[]")), 0.0);
}

TEST(PlanCostTest, MalformedJsonDoesNotThrow) {
    EXPECT_NO_THROW({
        EXPECT_DOUBLE_EQ(parse_plan_cost(std::string("{\"query_block\":")), 0.0);
        EXPECT_DOUBLE_EQ(parse_plan_cost(std::string("")), 0.0);
        EXPECT_DOUBLE_EQ(parse_plan_cost(std::string("not json")), 0.0);
    });
}
