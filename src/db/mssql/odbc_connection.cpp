#include "db/mssql/odbc_connection.hpp"
#include "db/mssql/odbc_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqlgateway {

namespace {

constexpr const char* kDefaultDriver = "ODBC Driver 18 for SQL Server";
constexpr size_t kChunkSize = 8192;

// Longest nvarchar(n) bound without switching to nvarchar(max)
constexpr size_t kMaxBoundedText = 4000;

constexpr const char* kExecuteSql = "EXEC sp_executesql ?, ?";

bool succeeded(SQLRETURN ret) {
    return ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO;
}

void* to_sql_pointer(SQLULEN value) {
    return reinterpret_cast<void*>(static_cast<uintptr_t>(value));
}

struct Diagnostic {
    std::string sqlstate;
    std::string message;
};

/**
 * @brief First diagnostic record, with the driver's "[vendor][driver]" prefix removed
 */
Diagnostic read_diagnostic(SQLSMALLINT handle_type, SQLHANDLE handle) {
    std::array<SQLCHAR, 6> state{};
    SQLINTEGER native_error = 0;
    std::array<SQLCHAR, 1024> text{};
    SQLSMALLINT text_len = 0;

    const SQLRETURN ret = SQLGetDiagRec(handle_type, handle, 1, state.data(), &native_error,
        text.data(), static_cast<SQLSMALLINT>(text.size()), &text_len);
    if (!succeeded(ret)) {
        return {"", "Unknown ODBC error"};
    }

    const size_t len = std::min(static_cast<size_t>(std::max<SQLSMALLINT>(text_len, 0)),
                                text.size() - 1);
    std::string message(reinterpret_cast<const char*>(text.data()), len);
    while (!message.empty() && message.front() == '[') {
        const auto close = message.find(']');
        if (close == std::string::npos) break;
        message.erase(0, close + 1);
    }

    return {std::string(reinterpret_cast<const char*>(state.data())), utils::trim(message)};
}

/**
 * @brief Owns a statement handle for the duration of one execution
 */
class StatementHandle {
public:
    explicit StatementHandle(SQLHDBC dbc) {
        if (!succeeded(SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt_))) {
            stmt_ = SQL_NULL_HSTMT;
        }
    }
    ~StatementHandle() {
        if (stmt_ != SQL_NULL_HSTMT) {
            SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
        }
    }

    StatementHandle(const StatementHandle&) = delete;
    StatementHandle& operator=(const StatementHandle&) = delete;

    [[nodiscard]] bool valid() const { return stmt_ != SQL_NULL_HSTMT; }
    [[nodiscard]] SQLHSTMT get() const { return stmt_; }

private:
    SQLHSTMT stmt_ = SQL_NULL_HSTMT;
};

/**
 * @brief Read one column of the current row in chunks
 * @return false on a driver error
 */
bool read_column(SQLHSTMT stmt, SQLUSMALLINT column, bool binary,
                 std::optional<std::string>& out) {
    const SQLSMALLINT c_type = binary ? SQL_C_BINARY : SQL_C_CHAR;
    // Character chunks carry a terminating NUL the driver counts against the buffer
    const size_t usable = binary ? kChunkSize : kChunkSize - 1;
    std::vector<char> buffer(kChunkSize);
    std::string value;

    while (true) {
        SQLLEN indicator = 0;
        const SQLRETURN ret = SQLGetData(stmt, column, c_type, buffer.data(),
                                         static_cast<SQLLEN>(buffer.size()), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        if (!succeeded(ret)) {
            return false;
        }
        if (indicator == SQL_NULL_DATA) {
            out = std::nullopt;
            return true;
        }

        size_t chunk = usable;
        if (indicator != SQL_NO_TOTAL && static_cast<size_t>(indicator) < usable) {
            chunk = static_cast<size_t>(indicator);
        }
        value.append(buffer.data(), chunk);

        if (ret == SQL_SUCCESS) {
            break;
        }
    }

    out = std::move(value);
    return true;
}

/**
 * @brief Storage and ODBC types for one bound parameter
 *
 * Bound buffers must stay put until the statement is done, so bindings
 * live in a vector sized before the first SQLBindParameter.
 */
struct ParamBinding {
    SQLSMALLINT c_type = SQL_C_CHAR;
    SQLSMALLINT sql_type = SQL_VARCHAR;
    SQLULEN column_size = 1;
    std::string text;
    int64_t integer = 0;
    double real = 0.0;
    unsigned char flag = 0;
    SQLLEN indicator = 0;
};

ParamBinding text_binding(std::string text) {
    ParamBinding binding;
    binding.c_type = SQL_C_CHAR;
    binding.sql_type = text.size() > kMaxBoundedText ? SQL_WLONGVARCHAR : SQL_WVARCHAR;
    binding.column_size = std::max<SQLULEN>(1, text.size());
    binding.indicator = static_cast<SQLLEN>(text.size());
    binding.text = std::move(text);
    return binding;
}

ParamBinding value_binding(const CellValue& value) {
    return std::visit([](const auto& v) -> ParamBinding {
        using T = std::decay_t<decltype(v)>;
        ParamBinding binding;
        if constexpr (std::is_same_v<T, std::monostate>) {
            binding.indicator = SQL_NULL_DATA;
        } else if constexpr (std::is_same_v<T, bool>) {
            binding.c_type = SQL_C_BIT;
            binding.sql_type = SQL_BIT;
            binding.flag = v ? 1 : 0;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            binding.c_type = SQL_C_SBIGINT;
            binding.sql_type = SQL_BIGINT;
            binding.column_size = 19;
            binding.integer = v;
        } else if constexpr (std::is_same_v<T, double>) {
            binding.c_type = SQL_C_DOUBLE;
            binding.sql_type = SQL_DOUBLE;
            binding.column_size = 15;
            binding.real = v;
        } else {
            binding = text_binding(v);
        }
        return binding;
    }, value);
}

/**
 * @brief T-SQL type declared for a named parameter in sp_executesql
 */
const char* declared_type(const CellValue& value) {
    switch (value.index()) {
        case 1: return "bit";
        case 2: return "bigint";
        case 3: return "float";
        default: return "nvarchar(max)";
    }
}

SQLRETURN bind_parameter(SQLHSTMT stmt, SQLUSMALLINT number, ParamBinding& binding) {
    SQLPOINTER value = nullptr;
    SQLLEN buffer_length = 0;
    switch (binding.c_type) {
        case SQL_C_BIT: value = &binding.flag; break;
        case SQL_C_SBIGINT: value = &binding.integer; break;
        case SQL_C_DOUBLE: value = &binding.real; break;
        default:
            value = binding.text.data();
            buffer_length = static_cast<SQLLEN>(binding.text.size());
            break;
    }
    return SQLBindParameter(stmt, number, SQL_PARAM_INPUT, binding.c_type, binding.sql_type,
                            binding.column_size, 0, value, buffer_length, &binding.indicator);
}

/**
 * @brief Current catalog as tracked by the driver, empty if unavailable
 */
std::string read_current_catalog(SQLHDBC dbc) {
    std::array<SQLCHAR, 256> catalog{};
    SQLINTEGER catalog_len = 0;
    if (succeeded(SQLGetConnectAttr(dbc, SQL_ATTR_CURRENT_CATALOG, catalog.data(),
            static_cast<SQLINTEGER>(catalog.size()), &catalog_len)) && catalog_len > 0) {
        return std::string(reinterpret_cast<const char*>(catalog.data()),
            std::min(static_cast<size_t>(catalog_len), catalog.size() - 1));
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Connection string
// ============================================================================

std::string escape_odbc_value(std::string_view value) {
    std::string result = "{";
    for (char c : value) {
        if (c == '}') {
            result += "}}";
        } else {
            result += c;
        }
    }
    result += "}";
    return result;
}

std::string build_odbc_connection_string(const ServerProfile& profile,
                                         const std::string& database) {
    auto option = [&](const std::string& key) -> std::string {
        const auto it = profile.options.find(key);
        return it != profile.options.end() ? it->second : std::string();
    };
    auto yes_no = [](const std::string& value) -> std::string {
        const std::string lower = utils::to_lower(value);
        return (lower == "true" || lower == "yes" || lower == "1") ? "yes" : "no";
    };

    const std::string driver = option("odbc_driver");
    std::string conn_str = std::format("Driver={};Server={};",
        escape_odbc_value(driver.empty() ? kDefaultDriver : driver),
        escape_odbc_value(std::format("{},{}", profile.host, profile.port)));

    if (!database.empty()) {
        conn_str += std::format("Database={};", escape_odbc_value(database));
    }

    const std::string trusted = option("trusted_connection");
    if (!trusted.empty() && yes_no(trusted) == "yes") {
        conn_str += "Trusted_Connection=yes;";
    } else {
        conn_str += std::format("Uid={};Pwd={};",
            escape_odbc_value(profile.user), escape_odbc_value(profile.password));
    }

    if (profile.read_only && !profile.options.contains("ApplicationIntent")) {
        conn_str += "ApplicationIntent=ReadOnly;";
    }

    const std::string encrypt = option("encrypt");
    if (!encrypt.empty()) {
        conn_str += std::format("Encrypt={};", yes_no(encrypt));
    }
    const std::string trust_cert = option("trust_server_certificate");
    if (!trust_cert.empty()) {
        conn_str += std::format("TrustServerCertificate={};", yes_no(trust_cert));
    }

    for (const auto& [key, value] : profile.options) {
        if (key == "odbc_driver" || key == "encrypt" ||
            key == "trust_server_certificate" || key == "trusted_connection") {
            continue;
        }
        conn_str += std::format("{}={};", key, escape_odbc_value(value));
    }

    return conn_str;
}

// ============================================================================
// OdbcConnection
// ============================================================================

OdbcConnection::OdbcConnection(SQLHENV env, SQLHDBC dbc, std::string database)
    : env_(env), dbc_(dbc), connected_(true),
      current_database_(database), home_database_(std::move(database)) {}

OdbcConnection::~OdbcConnection() {
    close();
}

DbResultSet OdbcConnection::execute(const std::string& sql, size_t max_rows) {
    return execute_with_params(sql, {}, max_rows);
}

DbResultSet OdbcConnection::execute_with_params(const std::string& sql,
                                                const std::vector<QueryParam>& params,
                                                size_t max_rows) {
    if (!connected_) {
        return DbResultSet::failure("Connection is closed", DbErrorKind::CONNECTION);
    }

    StatementHandle stmt(dbc_);
    if (!stmt.valid()) {
        return diagnostic_failure(SQL_HANDLE_DBC, dbc_);
    }

    SQLSetStmtAttr(stmt.get(), SQL_ATTR_QUERY_TIMEOUT, to_sql_pointer(query_timeout_seconds_), 0);

    DbResultSet result = run(stmt.get(), sql, params, max_rows);
    refresh_current_database();
    return result;
}

DbResultSet OdbcConnection::run(SQLHSTMT stmt, const std::string& sql,
                                const std::vector<QueryParam>& params, size_t max_rows) {
    const auto named_count = std::count_if(params.begin(), params.end(),
        [](const QueryParam& p) { return !p.name.empty(); });
    if (named_count != 0 && static_cast<size_t>(named_count) != params.size()) {
        return DbResultSet::failure("Parameters must be all named or all positional",
                                    DbErrorKind::STATEMENT);
    }
    const bool named = named_count != 0;

    std::string text = named ? std::string(kExecuteSql) : sql;
    std::vector<ParamBinding> bindings;
    bindings.reserve(params.size() + 2);
    if (named) {
        // sp_executesql @stmt, @params, @name = value, ...
        std::string declarations;
        for (const auto& param : params) {
            if (!declarations.empty()) declarations += ", ";
            declarations += std::format("@{} {}", param.name, declared_type(param.value));
            text += std::format(", @{} = ?", param.name);
        }
        bindings.push_back(text_binding(sql));
        bindings.push_back(text_binding(std::move(declarations)));
    }
    for (const auto& param : params) {
        bindings.push_back(value_binding(param.value));
    }
    for (size_t i = 0; i < bindings.size(); ++i) {
        if (!succeeded(bind_parameter(stmt, static_cast<SQLUSMALLINT>(i + 1), bindings[i]))) {
            return diagnostic_failure(SQL_HANDLE_STMT, stmt);
        }
    }

    SQLRETURN ret = SQLExecDirect(stmt,
        reinterpret_cast<SQLCHAR*>(text.data()), static_cast<SQLINTEGER>(text.size()));
    if (!succeeded(ret) && ret != SQL_NO_DATA) {
        return diagnostic_failure(SQL_HANDLE_STMT, stmt);
    }

    // Row counts of leading DML are summed until the first result set
    std::optional<DbResultSet> first;
    uint64_t affected = 0;
    while (true) {
        if (ret != SQL_NO_DATA) {
            SQLSMALLINT num_cols = 0;
            if (!succeeded(SQLNumResultCols(stmt, &num_cols))) {
                return diagnostic_failure(SQL_HANDLE_STMT, stmt);
            }

            if (num_cols > 0 && !first) {
                DbResultSet fetched = fetch_result_set(stmt, num_cols, max_rows);
                if (!fetched.success) {
                    return fetched;
                }
                first = std::move(fetched);
            } else if (num_cols == 0 && !first) {
                SQLLEN row_count = 0;
                if (succeeded(SQLRowCount(stmt, &row_count)) && row_count > 0) {
                    affected += static_cast<uint64_t>(row_count);
                }
            }
        }

        ret = SQLMoreResults(stmt);
        if (ret == SQL_NO_DATA) {
            break;
        }
        if (!succeeded(ret)) {
            return diagnostic_failure(SQL_HANDLE_STMT, stmt);
        }
    }

    if (first) {
        return std::move(*first);
    }

    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = affected;
    return result;
}

void OdbcConnection::refresh_current_database() {
    if (!connected_) {
        return;
    }
    if (std::string catalog = read_current_catalog(dbc_); !catalog.empty()) {
        current_database_ = std::move(catalog);
    }
}

DbResultSet OdbcConnection::fetch_result_set(SQLHSTMT stmt, SQLSMALLINT num_cols,
                                             size_t max_rows) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    std::vector<bool> binary_columns;
    result.column_names.reserve(static_cast<size_t>(num_cols));
    result.column_types.reserve(static_cast<size_t>(num_cols));
    binary_columns.reserve(static_cast<size_t>(num_cols));

    for (SQLSMALLINT i = 1; i <= num_cols; ++i) {
        std::array<SQLCHAR, 256> name{};
        SQLSMALLINT name_len = 0;
        SQLSMALLINT data_type = 0;
        SQLULEN column_size = 0;
        SQLSMALLINT decimal_digits = 0;
        SQLSMALLINT nullable = 0;

        const SQLRETURN ret = SQLDescribeCol(stmt, static_cast<SQLUSMALLINT>(i), name.data(),
            static_cast<SQLSMALLINT>(name.size()), &name_len, &data_type, &column_size,
            &decimal_digits, &nullable);
        if (!succeeded(ret)) {
            return diagnostic_failure(SQL_HANDLE_STMT, stmt);
        }

        const size_t len = std::min(static_cast<size_t>(std::max<SQLSMALLINT>(name_len, 0)),
                                    name.size() - 1);
        result.column_names.emplace_back(reinterpret_cast<const char*>(name.data()), len);
        result.column_types.push_back(OdbcTypeMap::build_type_info(data_type, column_size));
        binary_columns.push_back(OdbcTypeMap::is_binary(data_type));
    }

    SQLRETURN ret;
    while ((ret = SQLFetch(stmt)) == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
        if (max_rows > 0 && result.rows.size() >= max_rows) {
            result.truncated = true;
            break;
        }

        std::vector<std::optional<std::string>> row(static_cast<size_t>(num_cols));
        for (SQLSMALLINT i = 1; i <= num_cols; ++i) {
            const size_t idx = static_cast<size_t>(i - 1);
            if (!read_column(stmt, static_cast<SQLUSMALLINT>(i), binary_columns[idx], row[idx])) {
                return diagnostic_failure(SQL_HANDLE_STMT, stmt);
            }
        }
        result.rows.push_back(std::move(row));
    }

    if (ret != SQL_NO_DATA && !result.truncated) {
        return diagnostic_failure(SQL_HANDLE_STMT, stmt);
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet OdbcConnection::diagnostic_failure(SQLSMALLINT handle_type, SQLHANDLE handle) {
    Diagnostic diag = read_diagnostic(handle_type, handle);

    DbErrorKind kind = DbErrorKind::STATEMENT;
    if (diag.sqlstate == "HYT00" || diag.sqlstate == "HYT01") {
        kind = DbErrorKind::TIMEOUT;
    } else if (diag.sqlstate.starts_with("08")) {
        kind = DbErrorKind::CONNECTION;
        connected_ = false;
    }

    return DbResultSet::failure(std::move(diag.message), kind);
}

bool OdbcConnection::is_healthy(const std::string& health_check_query) {
    if (!connected_) {
        return false;
    }

    SQLUINTEGER dead = SQL_CD_FALSE;
    if (succeeded(SQLGetConnectAttr(dbc_, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr)) &&
        dead == SQL_CD_TRUE) {
        connected_ = false;
        return false;
    }

    if (health_check_query.empty()) {
        return true;
    }
    return execute(health_check_query).success;
}

bool OdbcConnection::in_transaction() {
    if (!connected_) {
        return true;
    }

    const DbResultSet result = execute("SELECT @@TRANCOUNT");
    if (!result.success || result.rows.empty() || result.rows.front().empty() ||
        !result.rows.front().front()) {
        return true;
    }
    return utils::parse_int<int64_t>(*result.rows.front().front(), 1) > 0;
}

bool OdbcConnection::set_query_timeout(uint32_t timeout_ms) {
    // SQL_ATTR_QUERY_TIMEOUT has one-second resolution; round up so a short timeout never becomes 0
    query_timeout_seconds_ = timeout_ms == 0 ? 0 : static_cast<SQLULEN>((timeout_ms + 999) / 1000);
    return connected_;
}

std::string OdbcConnection::switch_database(const std::string& database) {
    const std::string target = database.empty() ? home_database_ : database;
    if (target.empty() || utils::iequals(target, current_database_)) {
        return "";
    }

    std::string quoted;
    quoted.reserve(target.size() + 2);
    for (char c : target) {
        quoted += c;
        if (c == ']') quoted += ']';
    }

    const DbResultSet result = execute(std::format("USE [{}]", quoted));
    if (!result.success) {
        return result.error_message;
    }

    current_database_ = target;
    return "";
}

void OdbcConnection::close() {
    if (dbc_ != SQL_NULL_HDBC) {
        if (connected_) {
            SQLDisconnect(dbc_);
        }
        SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
        dbc_ = SQL_NULL_HDBC;
    }
    if (env_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, env_);
        env_ = SQL_NULL_HENV;
    }
    connected_ = false;
}

// ============================================================================
// OdbcConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> OdbcConnectionFactory::create(
    const ServerProfile& profile, const std::string& database) {

    using CreateResult = Result<std::unique_ptr<IDbConnection>>;

    SQLHENV env = SQL_NULL_HENV;
    if (!succeeded(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env))) {
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR,
            "Failed to allocate ODBC environment handle");
    }
    if (!succeeded(SQLSetEnvAttr(env, SQL_ATTR_ODBC_VERSION, to_sql_pointer(SQL_OV_ODBC3), 0))) {
        SQLFreeHandle(SQL_HANDLE_ENV, env);
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR, "Failed to set ODBC version");
    }

    SQLHDBC dbc = SQL_NULL_HDBC;
    if (!succeeded(SQLAllocHandle(SQL_HANDLE_DBC, env, &dbc))) {
        SQLFreeHandle(SQL_HANDLE_ENV, env);
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR,
            "Failed to allocate ODBC connection handle");
    }

    const SQLULEN login_timeout = static_cast<SQLULEN>(
        std::max<int64_t>(1, profile.connect_timeout.count() / 1000));
    SQLSetConnectAttr(dbc, SQL_ATTR_LOGIN_TIMEOUT, to_sql_pointer(login_timeout), 0);
    SQLSetConnectAttr(dbc, SQL_ATTR_CONNECTION_TIMEOUT, to_sql_pointer(login_timeout), 0);

    std::string conn_str = build_odbc_connection_string(profile, database);
    std::array<SQLCHAR, 1024> out_conn_str{};
    SQLSMALLINT out_len = 0;

    const SQLRETURN ret = SQLDriverConnect(dbc, nullptr,
        reinterpret_cast<SQLCHAR*>(conn_str.data()), static_cast<SQLSMALLINT>(conn_str.size()),
        out_conn_str.data(), static_cast<SQLSMALLINT>(out_conn_str.size()),
        &out_len, SQL_DRIVER_NOPROMPT);

    if (!succeeded(ret)) {
        std::string error = read_diagnostic(SQL_HANDLE_DBC, dbc).message;
        utils::log::error(std::format("SQL Server connection to server '{}' failed: {}",
            profile.name, error));
        SQLFreeHandle(SQL_HANDLE_DBC, dbc);
        SQLFreeHandle(SQL_HANDLE_ENV, env);
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR, std::move(error));
    }

    // The login's default database when none was requested
    std::string current = database.empty() ? read_current_catalog(dbc) : database;

    return CreateResult::ok(std::make_unique<OdbcConnection>(env, dbc, std::move(current)));
}

} // namespace sqlgateway
