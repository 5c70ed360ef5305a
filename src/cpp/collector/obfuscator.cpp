#include "obfuscator.hpp"
#include "../utils/signature.hpp"

#include <array>
#include <cctype>

namespace harvest {

namespace {

// Estimates that vary between executions of the same plan
constexpr std::array<const char*, 5> PLAN_ESTIMATE_KEYS = {
    "cost_info", "rows_examined_per_scan", "rows_produced_per_join",
    "rows_examined_per_join", "filtered",
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '.';
}

bool is_estimate_key(const std::string& key) {
    for (const char* k : PLAN_ESTIMATE_KEYS) {
        if (key == k) return true;
    }
    return false;
}

} // namespace

std::string LiteralObfuscator::obfuscate_sql(const std::string& sql) const {
    std::string out;
    out.reserve(sql.size());
    const size_t n = sql.size();
    size_t i = 0;

    auto emit_space = [&]() {
        if (!out.empty() && out.back() != ' ') out += ' ';
    };

    while (i < n) {
        char c = sql[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            emit_space();
            ++i;
            continue;
        }

        // 'string' and "string", with doubled or backslash-escaped quotes
        if (c == '\'' || c == '"') {
            const char quote = c;
            ++i;
            while (i < n) {
                if (sql[i] == '\\' && i + 1 < n) { i += 2; continue; }
                if (sql[i] == quote) {
                    if (i + 1 < n && sql[i + 1] == quote) { i += 2; continue; }
                    ++i;
                    break;
                }
                ++i;
            }
            out += '?';
            continue;
        }

        // `identifier` is kept verbatim
        if (c == '`') {
            size_t end = sql.find('`', i + 1);
            end = end == std::string::npos ? n : end + 1;
            out.append(sql, i, end - i);
            i = end;
            continue;
        }

        // Numbers (incl. 0x.. hex, decimals, exponents) not glued to a word
        bool prev_word = !out.empty() && is_word_char(out.back());
        if (!prev_word && (std::isdigit(static_cast<unsigned char>(c)) ||
                           (c == '.' && i + 1 < n && std::isdigit(static_cast<unsigned char>(sql[i + 1]))))) {
            ++i;
            while (i < n && (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '.' ||
                             ((sql[i] == '+' || sql[i] == '-') &&
                              (sql[i - 1] == 'e' || sql[i - 1] == 'E')))) {
                ++i;
            }
            out += '?';
            continue;
        }

        out += c;
        ++i;
    }

    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

void LiteralObfuscator::obfuscate_json(nlohmann::json& node, bool normalize) const {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end();) {
            if (normalize && is_estimate_key(it.key())) {
                it = node.erase(it);
                continue;
            }
            obfuscate_json(it.value(), normalize);
            ++it;
        }
    } else if (node.is_array()) {
        for (auto& child : node) obfuscate_json(child, normalize);
    } else if (node.is_string()) {
        node = obfuscate_sql(node.get<std::string>());
    }
}

std::string LiteralObfuscator::obfuscate_plan(const std::string& plan, bool normalize) const {
    auto j = nlohmann::json::parse(plan, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return obfuscate_sql(plan);
    }
    obfuscate_json(j, normalize);
    return j.dump();
}

std::string compute_sql_signature(const std::string& obfuscated_sql) {
    return Murmur3::hash64_hex(obfuscated_sql);
}

std::string compute_plan_signature(const std::string& normalized_plan) {
    return Murmur3::hash64_hex(normalized_plan);
}

} // namespace harvest
