#pragma once
// SQL text / plan obfuscation and signatures.
//
// The collector only depends on the SqlObfuscator interface; LiteralObfuscator
// is the built-in implementation: literals become '?', whitespace collapses.
#include <string>
#include <nlohmann/json.hpp>

namespace harvest {

class SqlObfuscator {
public:
    virtual ~SqlObfuscator() = default;

    virtual std::string obfuscate_sql(const std::string& sql) const = 0;

    // normalize=true additionally drops cost and row estimates so that the
    // result only depends on the plan's shape
    virtual std::string obfuscate_plan(const std::string& plan, bool normalize) const = 0;
};

class LiteralObfuscator : public SqlObfuscator {
public:
    std::string obfuscate_sql(const std::string& sql) const override;
    std::string obfuscate_plan(const std::string& plan, bool normalize) const override;

private:
    void obfuscate_json(nlohmann::json& node, bool normalize) const;
};

// 16 hex digit signatures of obfuscated SQL / normalized plan text
std::string compute_sql_signature(const std::string& obfuscated_sql);
std::string compute_plan_signature(const std::string& normalized_plan);

} // namespace harvest
