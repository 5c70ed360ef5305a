#pragma once
// Per-schema memory of which explain strategy works.
//
//   UNRESOLVED  nothing known yet (also the answer for unseen schemas)
//   RESOLVED    strategy succeeded before; it is the only one tried
//   DISABLED    nothing works; the schema is skipped until restart
//
// Entries are never removed. Owned by one ExecutionPlanAcquirer.
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace harvest {

// Statements without a current schema share the std::nullopt key
using SchemaKey = std::optional<std::string>;

enum class SchemaState { UNRESOLVED, RESOLVED, DISABLED };

inline const char* schema_state_str(SchemaState s) {
    switch (s) {
        case SchemaState::UNRESOLVED: return "unresolved";
        case SchemaState::RESOLVED:   return "resolved";
        case SchemaState::DISABLED:   return "disabled";
    }
    return "??";
}

struct SchemaMethod {
    SchemaState state = SchemaState::UNRESOLVED;
    std::string strategy;  // Set when RESOLVED

    static SchemaMethod resolved(std::string strategy_name) {
        return {SchemaState::RESOLVED, std::move(strategy_name)};
    }
    static SchemaMethod disabled() { return {SchemaState::DISABLED, {}}; }
};

class SchemaMethodCache {
public:
    [[nodiscard]] SchemaMethod get(const SchemaKey& schema) const {
        auto it = entries_.find(schema);
        return it == entries_.end() ? SchemaMethod{} : it->second;
    }

    void set(const SchemaKey& schema, SchemaMethod method) {
        entries_[schema] = std::move(method);
    }

    [[nodiscard]] bool is_disabled(const SchemaKey& schema) const {
        return get(schema).state == SchemaState::DISABLED;
    }

    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::map<SchemaKey, SchemaMethod> entries_;
};

inline std::string schema_label(const SchemaKey& schema) {
    return schema ? *schema : std::string("<none>");
}

} // namespace harvest
