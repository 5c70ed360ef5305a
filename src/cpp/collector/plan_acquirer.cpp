#include "plan_acquirer.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace harvest {

namespace {

constexpr std::array<const char*, 6> EXPLAINABLE_KEYWORDS = {
    "select", "table", "delete", "insert", "replace", "update",
};

std::string quote_identifier(const std::string& name) {
    std::string out = "`";
    for (char c : name) {
        if (c == '`') out += '`';
        out += c;
    }
    out += '`';
    return out;
}

} // namespace

ExecutionPlanAcquirer::ExecutionPlanAcquirer(DbConnector& db, Strategies strategies)
    : db_(db), strategies_(std::move(strategies)) {
    if (strategies_.empty()) {
        throw std::invalid_argument("ExecutionPlanAcquirer needs at least one explain strategy");
    }
}

ExecutionPlanAcquirer::Strategies ExecutionPlanAcquirer::default_strategies(const std::string& procedure) {
    Strategies s;
    s.push_back(std::make_unique<ProcedureExplainStrategy>(procedure));
    s.push_back(std::make_unique<StatementExplainStrategy>());
    return s;
}

bool ExecutionPlanAcquirer::can_explain(const std::string& statement) {
    size_t begin = 0;
    while (begin < statement.size() && std::isspace(static_cast<unsigned char>(statement[begin]))) {
        ++begin;
    }
    size_t end = begin;
    while (end < statement.size() && !std::isspace(static_cast<unsigned char>(statement[end]))) {
        ++end;
    }

    std::string keyword;
    keyword.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        keyword += static_cast<char>(std::tolower(static_cast<unsigned char>(statement[i])));
    }

    return std::any_of(EXPLAINABLE_KEYWORDS.begin(), EXPLAINABLE_KEYWORDS.end(),
        [&](const char* k) { return keyword == k; });
}

std::optional<std::string> ExecutionPlanAcquirer::acquire(const std::string& statement,
                                                          const SchemaKey& schema) {
    if (!can_explain(statement)) return std::nullopt;

    SchemaMethod method = cache_.get(schema);
    if (method.state == SchemaState::DISABLED) return std::nullopt;

    if (!use_schema(schema)) return std::nullopt;

    if (method.state == SchemaState::RESOLVED) {
        if (ExplainStrategy* strategy = find_strategy(method.strategy)) {
            return try_resolved(*strategy, statement, schema);
        }
    }
    return try_all(statement, schema);
}

bool ExecutionPlanAcquirer::use_schema(const SchemaKey& schema) {
    if (!schema) return true;  // Statement ran without a current schema

    try {
        db_.execute("USE " + quote_identifier(*schema));
    } catch (const DbError& e) {
        switch (classify_schema_error(e)) {
            case ErrorClass::NON_RETRYABLE:
                LOG_WRN("[acquirer] Cannot use schema %s (%u: %s), disabling plan collection for it",
                    schema->c_str(), e.code(), e.what());
                cache_.set(schema, SchemaMethod::disabled());
                return false;
            case ErrorClass::RETRYABLE:
                LOG_DBG("[acquirer] USE %s failed (%u: %s), skipping statement",
                    schema->c_str(), e.code(), e.what());
                return false;
            case ErrorClass::UNCLASSIFIED:
                throw;
        }
        throw;
    }
    return true;
}

ExplainStrategy* ExecutionPlanAcquirer::find_strategy(const std::string& name) const {
    for (const auto& s : strategies_) {
        if (name == s->name()) return s.get();
    }
    return nullptr;
}

std::optional<std::string> ExecutionPlanAcquirer::try_resolved(ExplainStrategy& strategy,
                                                               const std::string& statement,
                                                               const SchemaKey& schema) {
    ExplainOutcome outcome = strategy.attempt(db_, statement);
    if (outcome.has_plan()) return std::move(outcome.plan);

    // Capability is assumed stable: one failure does not change the cache
    LOG_DBG("[acquirer] Resolved strategy %s failed for schema %s (%u: %s)",
        strategy.name(), schema_label(schema).c_str(), outcome.error_code, outcome.error.c_str());
    return std::nullopt;
}

std::optional<std::string> ExecutionPlanAcquirer::try_all(const std::string& statement,
                                                          const SchemaKey& schema) {
    size_t non_retryable = 0;
    for (const auto& strategy : strategies_) {
        ExplainOutcome outcome = strategy->attempt(db_, statement);
        switch (outcome.status) {
            case ExplainStatus::PLAN:
                cache_.set(schema, SchemaMethod::resolved(strategy->name()));
                LOG_DBG("[acquirer] Schema %s resolved to %s strategy",
                    schema_label(schema).c_str(), strategy->name());
                return std::move(outcome.plan);
            case ExplainStatus::NON_RETRYABLE_FAILURE:
                ++non_retryable;
                break;
            case ExplainStatus::RETRYABLE_FAILURE:
                break;
        }
    }

    if (non_retryable == strategies_.size()) {
        LOG_WRN("[acquirer] No explain strategy works for schema %s, disabling plan collection for it",
            schema_label(schema).c_str());
        cache_.set(schema, SchemaMethod::disabled());
    }
    return std::nullopt;
}

} // namespace harvest
