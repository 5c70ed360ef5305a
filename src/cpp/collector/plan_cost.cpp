#include "plan_cost.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace harvest {

namespace {

double parse_cost_value(const nlohmann::json& v) {
    if (v.is_number()) {
        double d = v.get<double>();
        return std::isfinite(d) ? d : 0.0;
    }
    if (!v.is_string()) return 0.0;

    const std::string& s = v.get_ref<const std::string&>();
    if (s.empty()) return 0.0;
    char* end = nullptr;
    errno = 0;
    double d = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(d)) return 0.0;
    return d;
}

} // namespace

double parse_plan_cost(const nlohmann::json& plan) {
    if (!plan.is_object()) return 0.0;
    auto qb = plan.find("query_block");
    if (qb == plan.end() || !qb->is_object()) return 0.0;
    auto ci = qb->find("cost_info");
    if (ci == qb->end() || !ci->is_object()) return 0.0;
    auto cost = ci->find("query_cost");
    if (cost == ci->end()) return 0.0;
    return parse_cost_value(*cost);
}

double parse_plan_cost(const std::string& plan) {
    auto j = nlohmann::json::parse(plan, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return 0.0;
    return parse_plan_cost(j);
}

} // namespace harvest
