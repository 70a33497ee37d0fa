#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <memory>
#include <string_view>
#include <type_traits>
#include <variant>

namespace sqlgateway {

namespace {

// Server error codes (mysqld_error.h) and client error codes (errmsg.h)
constexpr unsigned int kErQueryInterrupted = 1317;
constexpr unsigned int kErQueryTimeout = 3024;
constexpr unsigned int kCrServerGoneError = 2006;
constexpr unsigned int kCrServerLost = 2013;
constexpr unsigned int kCrConnectionError = 2002;
constexpr unsigned int kCrConnHostError = 2003;

// Seconds of slack past the statement timeout before the client gives up reading
constexpr unsigned int kReadTimeoutSlackSeconds = 5;

// Column buffer for prepared statement fetches; longer values are re-read whole
constexpr size_t kColumnBufferSize = 256;

constexpr const char* kReadOnlySession = "SET SESSION TRANSACTION READ ONLY";

/**
 * @brief Whether a statement may have changed the default database
 *
 * Only USE does, and USE is not allowed inside stored programs.
 */
bool may_change_database(std::string_view sql) {
    return utils::to_lower(sql).find("use") != std::string::npos;
}

/**
 * @brief Owns a prepared statement handle
 */
class PreparedStatement {
public:
    explicit PreparedStatement(MYSQL* conn) : stmt_(mysql_stmt_init(conn)) {}
    ~PreparedStatement() {
        if (stmt_) {
            mysql_stmt_close(stmt_);
        }
    }

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    [[nodiscard]] MYSQL_STMT* get() const { return stmt_; }

private:
    MYSQL_STMT* stmt_;
};

/**
 * @brief Storage a MYSQL_BIND points into while the statement runs
 */
struct ParamBuffer {
    int64_t integer = 0;
    double real = 0.0;
    signed char flag = 0;
    unsigned long length = 0;
};

/**
 * @brief Fetch target of one result column
 */
struct ColumnBuffer {
    std::vector<char> data;
    unsigned long length = 0;
    decltype(MYSQL_BIND::is_null_value) is_null = 0;
};

void bind_param(MYSQL_BIND& bind, ParamBuffer& buffer, const CellValue& value) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            bind.buffer_type = MYSQL_TYPE_NULL;
        } else if constexpr (std::is_same_v<T, bool>) {
            buffer.flag = v ? 1 : 0;
            bind.buffer_type = MYSQL_TYPE_TINY;
            bind.buffer = &buffer.flag;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            buffer.integer = v;
            bind.buffer_type = MYSQL_TYPE_LONGLONG;
            bind.buffer = &buffer.integer;
        } else if constexpr (std::is_same_v<T, double>) {
            buffer.real = v;
            bind.buffer_type = MYSQL_TYPE_DOUBLE;
            bind.buffer = &buffer.real;
        } else {
            buffer.length = static_cast<unsigned long>(v.size());
            bind.buffer_type = MYSQL_TYPE_STRING;
            bind.buffer = const_cast<char*>(v.data());
            bind.buffer_length = buffer.length;
            bind.length = &buffer.length;
        }
    }, value);
}

} // anonymous namespace

MysqlConnection::MysqlConnection(MYSQL* conn, ServerProfile profile, std::string database)
    : conn_(conn),
      profile_(std::move(profile)),
      current_database_(database),
      home_database_(std::move(database)) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql, size_t max_rows) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed", DbErrorKind::CONNECTION);
    }

    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return process_error();
    }

    // Check if the query produced a result set
    MYSQL_RES* res = mysql_store_result(conn_);
    DbResultSet result;
    if (res) {
        result = process_result_set(res, max_rows);
        mysql_free_result(res);
    } else if (mysql_field_count(conn_) == 0) {
        // DML/DDL - no result set expected
        result = process_affected_rows();
    } else {
        // Expected a result set but the fetch failed
        return process_error();
    }

    // Drain any further result sets so the session stays in sync
    int status;
    while ((status = mysql_next_result(conn_)) == 0) {
        if (MYSQL_RES* extra = mysql_store_result(conn_)) {
            mysql_free_result(extra);
        } else if (mysql_field_count(conn_) != 0) {
            return process_error();
        }
    }
    if (status > 0) {
        return process_error();
    }

    refresh_current_database(sql);
    return result;
}

DbResultSet MysqlConnection::execute_with_params(const std::string& sql,
                                                 const std::vector<QueryParam>& params,
                                                 size_t max_rows) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed", DbErrorKind::CONNECTION);
    }
    for (const auto& param : params) {
        if (!param.name.empty()) {
            return DbResultSet::failure("MySQL does not support named parameters",
                                        DbErrorKind::STATEMENT);
        }
    }

    PreparedStatement stmt(conn_);
    if (!stmt.get()) {
        return process_error();
    }
    if (mysql_stmt_prepare(stmt.get(), sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return classify_error(mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }

    const unsigned long expected = mysql_stmt_param_count(stmt.get());
    if (expected != params.size()) {
        return DbResultSet::failure(
            std::format("Statement has {} placeholders but {} parameters were supplied",
                        expected, params.size()),
            DbErrorKind::STATEMENT);
    }

    std::vector<MYSQL_BIND> binds(params.size());
    std::vector<ParamBuffer> buffers(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        bind_param(binds[i], buffers[i], params[i].value);
    }

    if (!binds.empty() && mysql_stmt_bind_param(stmt.get(), binds.data()) != 0) {
        return classify_error(mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }
    if (mysql_stmt_execute(stmt.get()) != 0) {
        return classify_error(mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }

    DbResultSet result = process_statement(stmt.get(), max_rows);
    if (result.success) {
        refresh_current_database(sql);
    }
    return result;
}

DbResultSet MysqlConnection::process_statement(MYSQL_STMT* stmt, size_t max_rows) {
    std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> metadata(
        mysql_stmt_result_metadata(stmt), &mysql_free_result);

    if (!metadata) {
        if (mysql_stmt_field_count(stmt) != 0) {
            return classify_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
        }
        DbResultSet result;
        result.success = true;
        result.has_rows = false;
        result.affected_rows = static_cast<uint64_t>(mysql_stmt_affected_rows(stmt));
        return result;
    }

    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(metadata.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(metadata.get());
    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name ? fields[i].name : "");
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    if (mysql_stmt_store_result(stmt) != 0) {
        return classify_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
    }

    // Every column is fetched as text
    std::vector<MYSQL_BIND> columns(num_fields);
    std::vector<ColumnBuffer> buffers(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        buffers[i].data.resize(kColumnBufferSize);
        columns[i].buffer_type = MYSQL_TYPE_STRING;
        columns[i].buffer = buffers[i].data.data();
        columns[i].buffer_length = static_cast<unsigned long>(buffers[i].data.size());
        columns[i].length = &buffers[i].length;
        columns[i].is_null = &buffers[i].is_null;
    }
    if (num_fields > 0 && mysql_stmt_bind_result(stmt, columns.data()) != 0) {
        return classify_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
    }

    while (true) {
        const int status = mysql_stmt_fetch(stmt);
        if (status == MYSQL_NO_DATA) {
            break;
        }
        if (status == 1) {
            return classify_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
        }
        if (max_rows > 0 && result.rows.size() >= max_rows) {
            result.truncated = true;
            break;
        }

        std::vector<std::optional<std::string>> row;
        row.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (buffers[i].is_null) {
                row.emplace_back(std::nullopt);
                continue;
            }
            const unsigned long length = buffers[i].length;
            if (length <= buffers[i].data.size()) {
                row.emplace_back(std::string(buffers[i].data.data(), length));
                continue;
            }

            // MYSQL_DATA_TRUNCATED: read this column again at full length
            std::string value(length, '\0');
            MYSQL_BIND full{};
            full.buffer_type = MYSQL_TYPE_STRING;
            full.buffer = value.data();
            full.buffer_length = length;
            if (mysql_stmt_fetch_column(stmt, &full, i, 0) != 0) {
                return classify_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
            }
            row.emplace_back(std::move(value));
        }
        result.rows.push_back(std::move(row));
    }

    mysql_stmt_free_result(stmt);
    result.affected_rows = result.rows.size();
    return result;
}

void MysqlConnection::refresh_current_database(const std::string& sql) {
    if (!may_change_database(sql)) {
        return;
    }

    if (mysql_query(conn_, "SELECT DATABASE()") != 0) {
        utils::log::warn(std::format("Server '{}': could not read the current database: {}",
            profile_.name, utils::trim(mysql_error(conn_))));
        return;
    }
    MYSQL_RES* res = mysql_store_result(conn_);
    if (!res) {
        return;
    }
    if (MYSQL_ROW row = mysql_fetch_row(res)) {
        current_database_ = row[0] ? row[0] : "";
    }
    mysql_free_result(res);
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res, size_t max_rows) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    // Extract column metadata
    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);

    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name ? fields[i].name : "");
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    // Extract rows
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        if (max_rows > 0 && result.rows.size() >= max_rows) {
            result.truncated = true;
            break;
        }

        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<std::optional<std::string>> row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(std::string(row[i], lengths[i]));
            } else {
                row_data.emplace_back(std::nullopt);
            }
        }

        result.rows.push_back(std::move(row_data));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

DbResultSet MysqlConnection::process_error() {
    return classify_error(mysql_errno(conn_), mysql_error(conn_));
}

DbResultSet MysqlConnection::classify_error(unsigned int code, const char* error) {
    std::string message = utils::trim(error ? error : "");

    DbErrorKind kind = DbErrorKind::STATEMENT;
    switch (code) {
        case kErQueryTimeout:
        case kErQueryInterrupted:
            kind = DbErrorKind::TIMEOUT;
            break;
        case kCrServerGoneError:
        case kCrServerLost:
        case kCrConnectionError:
        case kCrConnHostError:
            kind = DbErrorKind::CONNECTION;
            broken_ = true;
            break;
        default:
            break;
    }

    return DbResultSet::failure(std::move(message), kind);
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || broken_) {
        return false;
    }

    // Fast ping check
    if (mysql_ping(conn_) != 0) {
        broken_ = true;
        return false;
    }

    // Run health check query if provided
    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (res) {
            mysql_free_result(res);
        }
    }

    return true;
}

bool MysqlConnection::in_transaction() {
    if (!conn_ || broken_) {
        return true;
    }
    return (conn_->server_status & SERVER_STATUS_IN_TRANS) != 0;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr && !broken_;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }
    if (applied_timeout_ms_ == timeout_ms) {
        return true;
    }

    // MySQL uses SET max_execution_time (MySQL 5.7.8+, SELECT only)
    const std::string sql = std::format("SET SESSION max_execution_time = {}", timeout_ms);
    if (mysql_query(conn_, sql.c_str()) != 0) {
        return false;
    }
    applied_timeout_ms_ = timeout_ms;
    return true;
}

std::string MysqlConnection::switch_database(const std::string& database) {
    const std::string& target = database.empty() ? home_database_ : database;
    if (target == current_database_) {
        return "";
    }
    if (!conn_) {
        return "Connection is closed";
    }

    if (!target.empty()) {
        if (mysql_select_db(conn_, target.c_str()) != 0) {
            return process_error().error_message;
        }
        current_database_ = target;
        return "";
    }

    // No statement deselects the default database; a change of user starts
    // a fresh session without one
    if (mysql_change_user(conn_, profile_.user.c_str(), profile_.password.c_str(), nullptr) != 0) {
        return process_error().error_message;
    }
    current_database_.clear();
    applied_timeout_ms_.reset();

    if (std::string error = prepare_session(conn_, profile_); !error.empty()) {
        broken_ = true;
        return error;
    }
    return "";
}

std::string MysqlConnection::prepare_session(MYSQL* conn, const ServerProfile& profile) {
    if (profile.read_only && mysql_query(conn, kReadOnlySession) != 0) {
        return utils::trim(mysql_error(conn));
    }
    return "";
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> MysqlConnectionFactory::create(
    const ServerProfile& profile, const std::string& database) {

    using CreateResult = Result<std::unique_ptr<IDbConnection>>;

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR, "mysql_init failed");
    }

    const unsigned int connect_timeout = static_cast<unsigned int>(
        std::max<int64_t>(1, profile.connect_timeout.count() / 1000));
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);

    const unsigned int read_timeout = static_cast<unsigned int>(
        std::max<int64_t>(1, profile.query_timeout.count() / 1000)) + kReadTimeoutSlackSeconds;
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &read_timeout);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &read_timeout);

    // Set character set to UTF-8
    const auto charset = profile.options.find("charset");
    mysql_options(conn, MYSQL_SET_CHARSET_NAME,
                  charset != profile.options.end() ? charset->second.c_str() : "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        profile.host.c_str(),
        profile.user.c_str(),
        profile.password.c_str(),
        database.empty() ? nullptr : database.c_str(),
        profile.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        std::string error = utils::trim(mysql_error(conn));
        utils::log::error(std::format("MySQL connection to server '{}' failed: {}",
            profile.name, error));
        mysql_close(conn);
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR, std::move(error));
    }

    if (std::string error = MysqlConnection::prepare_session(conn, profile); !error.empty()) {
        utils::log::error(std::format("MySQL session setup on server '{}' failed: {}",
            profile.name, error));
        mysql_close(conn);
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR, std::move(error));
    }

    return CreateResult::ok(std::make_unique<MysqlConnection>(conn, profile, database));
}

} // namespace sqlgateway
