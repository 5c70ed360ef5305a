#pragma once
// Cost extraction from EXPLAIN FORMAT=JSON documents
#include <string>
#include <nlohmann/json.hpp>

namespace harvest {

// query_block.cost_info.query_cost as a number. The server reports it as a
// string ("12.50"); numeric values are accepted too. Anything missing,
// non-numeric or unparseable yields 0.0. Never throws.
double parse_plan_cost(const std::string& plan);
double parse_plan_cost(const nlohmann::json& plan);

} // namespace harvest
