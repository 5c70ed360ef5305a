#include "explain_strategy.hpp"
#include "../utils/logger.hpp"

#include <cctype>
#include <stdexcept>

namespace harvest {

namespace {

// Server errors live in 1000-1999 and 3000+; anything else is not a shape
// the classifiers know.
bool is_server_error_code(unsigned int code) {
    return (code >= 1000 && code < 2000) || code >= 3000;
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') return false;
    }
    return true;
}

// First column of the first row, if present and not NULL
std::optional<std::string> first_cell(const ResultSet& rs) {
    if (rs.rows.empty() || rs.rows.front().empty()) return std::nullopt;
    return rs.rows.front().front();
}

} // namespace

ErrorClass classify_schema_error(const DbError& e) {
    if (!is_server_error_code(e.code())) return ErrorClass::UNCLASSIFIED;
    switch (e.code()) {
        case mysql_errc::BAD_DB_ERROR:
        case mysql_errc::DBACCESS_DENIED:
            return ErrorClass::NON_RETRYABLE;
        default:
            return ErrorClass::RETRYABLE;
    }
}

ErrorClass classify_procedure_error(const DbError& e) {
    if (!is_server_error_code(e.code())) return ErrorClass::UNCLASSIFIED;
    switch (e.code()) {
        case mysql_errc::PROCACCESS_DENIED:
        case mysql_errc::SP_DOES_NOT_EXIST:
            return ErrorClass::NON_RETRYABLE;
        default:
            return ErrorClass::RETRYABLE;
    }
}

ErrorClass classify_statement_error(const DbError& e) {
    if (!is_server_error_code(e.code())) return ErrorClass::UNCLASSIFIED;
    switch (e.code()) {
        case mysql_errc::NO_DB_ERROR:
            return ErrorClass::NON_RETRYABLE;
        case mysql_errc::PARSE_ERROR:
            // May depend on the statement being explained
            return ErrorClass::RETRYABLE;
        default:
            return ErrorClass::RETRYABLE;
    }
}

// =============================================================================
// CALL explain_statement(?)
// =============================================================================

ProcedureExplainStrategy::ProcedureExplainStrategy(std::string procedure)
    : procedure_(std::move(procedure)) {
    if (!is_identifier(procedure_)) {
        throw std::invalid_argument("invalid explain procedure name: " + procedure_);
    }
}

ExplainOutcome ProcedureExplainStrategy::attempt(DbConnector& db, const std::string& statement) {
    ResultSet rs;
    try {
        rs = db.execute("CALL " + procedure_ + "(?)", {SqlParam{statement}});
    } catch (const DbError& e) {
        ErrorClass cls = classify_procedure_error(e);
        if (cls == ErrorClass::UNCLASSIFIED) throw;
        LOG_DBG("[explain] %s(?) failed (%s) %u: %s",
            procedure_.c_str(), error_class_str(cls), e.code(), e.what());
        return ExplainOutcome::failure(cls, e.code(), e.what());
    }

    auto plan = first_cell(rs);
    if (!plan) {
        LOG_DBG("[explain] %s(?) returned no plan", procedure_.c_str());
        return ExplainOutcome::failure(ErrorClass::RETRYABLE, 0, "procedure returned no plan");
    }
    LOG_DBG("[explain] Ran explain using %s procedure: %s", procedure_.c_str(), statement.c_str());
    return ExplainOutcome::plan_obtained(std::move(*plan));
}

// =============================================================================
// EXPLAIN FORMAT=json <statement>
// The whole statement cannot be a bound parameter here, so it is inlined.
// =============================================================================

ExplainOutcome StatementExplainStrategy::attempt(DbConnector& db, const std::string& statement) {
    ResultSet rs;
    try {
        rs = db.execute("EXPLAIN FORMAT=json " + statement);
    } catch (const DbError& e) {
        ErrorClass cls = classify_statement_error(e);
        if (cls == ErrorClass::UNCLASSIFIED) throw;
        if (e.code() == mysql_errc::NO_DB_ERROR) {
            LOG_WRN("[explain] Failed to collect EXPLAIN due to a permissions error: %u %s, Statement: %s",
                e.code(), e.what(), statement.c_str());
        } else if (e.code() == mysql_errc::PARSE_ERROR) {
            LOG_WRN("[explain] Programming error when collecting EXPLAIN: %u %s, Statement: %s",
                e.code(), e.what(), statement.c_str());
        } else {
            LOG_DBG("[explain] EXPLAIN failed (%s) %u: %s",
                error_class_str(cls), e.code(), e.what());
        }
        return ExplainOutcome::failure(cls, e.code(), e.what());
    }

    auto plan = first_cell(rs);
    if (!plan) {
        LOG_DBG("[explain] EXPLAIN returned no plan");
        return ExplainOutcome::failure(ErrorClass::RETRYABLE, 0, "EXPLAIN returned no plan");
    }
    LOG_DBG("[explain] Ran explain using EXPLAIN statement: %s", statement.c_str());
    return ExplainOutcome::plan_obtained(std::move(*plan));
}

} // namespace harvest
