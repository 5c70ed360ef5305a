#pragma once
// =============================================================================
// Explain strategies
//
// Each strategy is one way of obtaining an EXPLAIN FORMAT=JSON document for a
// statement. Strategies are tried in priority order by ExecutionPlanAcquirer:
//
//   1. ProcedureExplainStrategy  CALL <procedure>(?) -- statement bound as a
//                                parameter, runs with the definer's rights
//   2. StatementExplainStrategy  EXPLAIN FORMAT=json <statement>
//
// A failed attempt is reported as RETRYABLE (statement dependent, try the
// next strategy) or NON_RETRYABLE (this strategy cannot work for the schema).
// DbError codes with no known classification and DbConnectionError are
// rethrown to the caller.
// =============================================================================

#include <memory>
#include <string>
#include "../connectors/db_connector.hpp"

namespace harvest {

enum class ErrorClass { RETRYABLE, NON_RETRYABLE, UNCLASSIFIED };

inline const char* error_class_str(ErrorClass c) {
    switch (c) {
        case ErrorClass::RETRYABLE:     return "retryable";
        case ErrorClass::NON_RETRYABLE: return "non-retryable";
        case ErrorClass::UNCLASSIFIED:  return "unclassified";
    }
    return "??";
}

// USE `schema`
ErrorClass classify_schema_error(const DbError& e);
// CALL explain_statement(?)
ErrorClass classify_procedure_error(const DbError& e);
// EXPLAIN FORMAT=json ...
ErrorClass classify_statement_error(const DbError& e);

enum class ExplainStatus { PLAN, RETRYABLE_FAILURE, NON_RETRYABLE_FAILURE };

// Result of one strategy attempt
struct ExplainOutcome {
    ExplainStatus status = ExplainStatus::RETRYABLE_FAILURE;
    std::string plan;             // JSON document when status == PLAN
    unsigned int error_code = 0;  // Server error code on failure (0: no plan returned)
    std::string error;            // Empty on success

    [[nodiscard]] bool has_plan() const { return status == ExplainStatus::PLAN; }

    static ExplainOutcome plan_obtained(std::string plan_json) {
        ExplainOutcome o;
        o.status = ExplainStatus::PLAN;
        o.plan = std::move(plan_json);
        return o;
    }

    static ExplainOutcome failure(ErrorClass cls, unsigned int code, std::string message) {
        ExplainOutcome o;
        o.status = cls == ErrorClass::NON_RETRYABLE ? ExplainStatus::NON_RETRYABLE_FAILURE
                                                    : ExplainStatus::RETRYABLE_FAILURE;
        o.error_code = code;
        o.error = std::move(message);
        return o;
    }
};

class ExplainStrategy {
public:
    virtual ~ExplainStrategy() = default;

    // Stable identifier, remembered per schema
    [[nodiscard]] virtual const char* name() const = 0;

    // Runs against the session's current schema
    virtual ExplainOutcome attempt(DbConnector& db, const std::string& statement) = 0;
};

class ProcedureExplainStrategy : public ExplainStrategy {
public:
    static constexpr const char* NAME = "procedure";

    // Throws std::invalid_argument if procedure is not a plain identifier
    explicit ProcedureExplainStrategy(std::string procedure = "explain_statement");

    [[nodiscard]] const char* name() const override { return NAME; }
    ExplainOutcome attempt(DbConnector& db, const std::string& statement) override;

private:
    std::string procedure_;
};

class StatementExplainStrategy : public ExplainStrategy {
public:
    static constexpr const char* NAME = "statement";

    [[nodiscard]] const char* name() const override { return NAME; }
    ExplainOutcome attempt(DbConnector& db, const std::string& statement) override;
};

} // namespace harvest
