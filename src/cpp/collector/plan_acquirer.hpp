#pragma once
// =============================================================================
// ExecutionPlanAcquirer -- picks and remembers, per schema, the way to get a
// plan for a sampled statement.
//
// Per statement:
//   1. Only select/table/delete/insert/replace/update are explained.
//   2. DISABLED schemas are skipped without any database round-trip.
//   3. USE `schema`: unknown database / access denied disables the schema,
//      any other server error skips just this statement.
//   4. RESOLVED schema: only the remembered strategy is tried.
//      UNRESOLVED schema: strategies in priority order, first plan wins and
//      is remembered; if every strategy failed non-retryably the schema is
//      disabled, otherwise it stays unresolved.
// =============================================================================

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "explain_strategy.hpp"
#include "schema_method_cache.hpp"
#include "../connectors/db_connector.hpp"

namespace harvest {

class ExecutionPlanAcquirer {
public:
    using Strategies = std::vector<std::unique_ptr<ExplainStrategy>>;

    ExecutionPlanAcquirer(DbConnector& db, Strategies strategies);

    // Procedure call first, then the direct EXPLAIN statement
    static Strategies default_strategies(const std::string& procedure = "explain_statement");

    // Plan JSON for the statement, or std::nullopt. Unclassified database
    // errors propagate.
    std::optional<std::string> acquire(const std::string& statement, const SchemaKey& schema);

    // Leading keyword check, no I/O
    static bool can_explain(const std::string& statement);

    [[nodiscard]] const SchemaMethodCache& cache() const { return cache_; }

private:
    // Returns false if the statement must be skipped
    bool use_schema(const SchemaKey& schema);

    ExplainStrategy* find_strategy(const std::string& name) const;
    std::optional<std::string> try_resolved(ExplainStrategy& strategy,
                                            const std::string& statement,
                                            const SchemaKey& schema);
    std::optional<std::string> try_all(const std::string& statement, const SchemaKey& schema);

    DbConnector& db_;
    Strategies strategies_;
    SchemaMethodCache cache_;
};

} // namespace harvest
