// MySQL connector
// Plain statements: mysql_query + mysql_store_result
// Bound parameters: prepared statement API, every column fetched as string
// CALL needs CLIENT_MULTI_RESULTS and a drained trailing status result.

#include "mysql_connector.hpp"
#include "../utils/logger.hpp"

#include <memory>
#include <type_traits>
#include <mysql/mysql.h>

namespace harvest {

namespace {

// bool in libmysqlclient 8.x, my_bool (char) in older and MariaDB clients
using mysql_flag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

using StmtPtr = std::unique_ptr<MYSQL_STMT, decltype(&mysql_stmt_close)>;
using ResPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

constexpr unsigned long INITIAL_CELL_SIZE = 256;

bool is_client_error(unsigned int code) {
    return code == 0 || (code >= 2000 && code < 3000);
}

[[noreturn]] void raise_error(unsigned int code, const char* message) {
    if (is_client_error(code)) {
        throw DbConnectionError(std::string("[mysql] client error ") +
            std::to_string(code) + ": " + message);
    }
    throw DbError(code, message);
}

[[noreturn]] void raise_conn_error(MYSQL* mysql) {
    raise_error(mysql_errno(mysql), mysql_error(mysql));
}

[[noreturn]] void raise_stmt_error(MYSQL_STMT* stmt) {
    raise_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
}

// Consume any pending result set -- prevents "Commands out of sync"
void drain_results(MYSQL* mysql) {
    int status;
    while ((status = mysql_next_result(mysql)) == 0) {
        MYSQL_RES* r = mysql_store_result(mysql);
        if (r) mysql_free_result(r);
    }
    if (status > 0) raise_conn_error(mysql);
}

void drain_stmt_results(MYSQL_STMT* stmt) {
    int status;
    while ((status = mysql_stmt_next_result(stmt)) == 0) {
        mysql_stmt_free_result(stmt);
    }
    if (status > 0) raise_stmt_error(stmt);
}

} // namespace

bool MySqlConnector::connect(const DbConnection& conn) {
    disconnect();

    MYSQL* mysql = mysql_init(nullptr);
    if (!mysql) {
        LOG_ERR("[mysql] mysql_init failed");
        return false;
    }

    unsigned int timeout = conn.connect_timeout_s;
    mysql_options(mysql, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    const char* socket = conn.unix_socket.empty() ? nullptr : conn.unix_socket.c_str();
    if (!mysql_real_connect(mysql, conn.host.c_str(), conn.user.c_str(),
                            conn.password.c_str(), nullptr,  // no default schema; USE per statement
                            conn.port, socket, CLIENT_MULTI_RESULTS)) {
        LOG_ERR("[mysql] Connection to %s:%u failed: %s",
            conn.host.c_str(), conn.port, mysql_error(mysql));
        mysql_close(mysql);
        return false;
    }

    conn_ = mysql;
    LOG_INF("[mysql] Connected to %s:%u (server: %s)",
        conn.host.c_str(), conn.port, mysql_get_server_info(mysql));
    return true;
}

void MySqlConnector::disconnect() {
    if (conn_) {
        mysql_close(static_cast<MYSQL*>(conn_));
        conn_ = nullptr;
    }
}

bool MySqlConnector::is_connected() const { return conn_ != nullptr; }

ResultSet MySqlConnector::execute(const std::string& sql) {
    auto* mysql = static_cast<MYSQL*>(conn_);
    if (!mysql) throw DbConnectionError("[mysql] not connected");

    if (mysql_real_query(mysql, sql.data(), sql.size()) != 0) {
        raise_conn_error(mysql);
    }

    ResultSet rs;
    ResPtr res(mysql_store_result(mysql), &mysql_free_result);
    if (!res) {
        // No result set is fine for USE/SET/UPDATE, an error otherwise
        if (mysql_field_count(mysql) != 0) raise_conn_error(mysql);
        drain_results(mysql);
        return rs;
    }

    unsigned int ncols = mysql_num_fields(res.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(res.get());
    for (unsigned int i = 0; i < ncols; ++i) {
        rs.columns.emplace_back(fields[i].name);
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
        unsigned long* lengths = mysql_fetch_lengths(res.get());
        Row out;
        out.reserve(ncols);
        for (unsigned int i = 0; i < ncols; ++i) {
            if (row[i]) {
                out.emplace_back(std::string(row[i], lengths[i]));
            } else {
                out.emplace_back(std::nullopt);
            }
        }
        rs.rows.push_back(std::move(out));
    }

    res.reset();
    drain_results(mysql);
    return rs;
}

ResultSet MySqlConnector::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    auto* mysql = static_cast<MYSQL*>(conn_);
    if (!mysql) throw DbConnectionError("[mysql] not connected");

    StmtPtr stmt(mysql_stmt_init(mysql), &mysql_stmt_close);
    if (!stmt) throw DbConnectionError("[mysql] mysql_stmt_init failed");

    if (mysql_stmt_prepare(stmt.get(), sql.data(), sql.size()) != 0) {
        raise_stmt_error(stmt.get());
    }
    if (mysql_stmt_param_count(stmt.get()) != params.size()) {
        throw std::invalid_argument("[mysql] placeholder count does not match bound parameters");
    }

    // Input binds point into params, which outlive mysql_stmt_execute
    std::vector<MYSQL_BIND> in(params.size());
    std::vector<unsigned long> in_len(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        if (const auto* s = std::get_if<std::string>(&params[i])) {
            in_len[i] = s->size();
            in[i].buffer_type = MYSQL_TYPE_STRING;
            in[i].buffer = const_cast<char*>(s->data());
            in[i].buffer_length = in_len[i];
            in[i].length = &in_len[i];
        } else if (const auto* v = std::get_if<int64_t>(&params[i])) {
            in[i].buffer_type = MYSQL_TYPE_LONGLONG;
            in[i].buffer = const_cast<int64_t*>(v);
        } else {
            in[i].buffer_type = MYSQL_TYPE_LONGLONG;
            in[i].buffer = const_cast<uint64_t*>(&std::get<uint64_t>(params[i]));
            in[i].is_unsigned = 1;
        }
    }
    if (!params.empty() && mysql_stmt_bind_param(stmt.get(), in.data()) != 0) {
        raise_stmt_error(stmt.get());
    }

    if (mysql_stmt_execute(stmt.get()) != 0) {
        raise_stmt_error(stmt.get());
    }

    ResultSet rs;
    ResPtr meta(mysql_stmt_result_metadata(stmt.get()), &mysql_free_result);
    if (!meta) {
        drain_stmt_results(stmt.get());
        return rs;
    }

    unsigned int ncols = mysql_num_fields(meta.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(meta.get());
    for (unsigned int i = 0; i < ncols; ++i) {
        rs.columns.emplace_back(fields[i].name);
    }

    std::vector<MYSQL_BIND> out(ncols);
    std::vector<std::string> bufs(ncols, std::string(INITIAL_CELL_SIZE, '\0'));
    std::vector<unsigned long> out_len(ncols);
    std::unique_ptr<mysql_flag[]> is_null(new mysql_flag[ncols]());
    std::unique_ptr<mysql_flag[]> truncated(new mysql_flag[ncols]());
    for (unsigned int i = 0; i < ncols; ++i) {
        out[i].buffer_type = MYSQL_TYPE_STRING;
        out[i].buffer = bufs[i].data();
        out[i].buffer_length = bufs[i].size();
        out[i].length = &out_len[i];
        out[i].is_null = &is_null[i];
        out[i].error = &truncated[i];
    }
    if (mysql_stmt_bind_result(stmt.get(), out.data()) != 0) {
        raise_stmt_error(stmt.get());
    }

    for (;;) {
        int rc = mysql_stmt_fetch(stmt.get());
        if (rc == MYSQL_NO_DATA) break;
        if (rc == 1) raise_stmt_error(stmt.get());

        Row row;
        row.reserve(ncols);
        for (unsigned int i = 0; i < ncols; ++i) {
            if (is_null[i]) {
                row.emplace_back(std::nullopt);
            } else if (out_len[i] > bufs[i].size()) {
                // Plans routinely exceed the initial buffer: refetch the full cell
                std::string value(out_len[i], '\0');
                unsigned long len = 0;
                MYSQL_BIND col{};
                col.buffer_type = MYSQL_TYPE_STRING;
                col.buffer = value.data();
                col.buffer_length = value.size();
                col.length = &len;
                if (mysql_stmt_fetch_column(stmt.get(), &col, i, 0) != 0) {
                    raise_stmt_error(stmt.get());
                }
                row.emplace_back(std::move(value));
            } else {
                row.emplace_back(bufs[i].substr(0, out_len[i]));
            }
        }
        rs.rows.push_back(std::move(row));
    }

    mysql_stmt_free_result(stmt.get());
    drain_stmt_results(stmt.get());
    return rs;
}

} // namespace harvest
