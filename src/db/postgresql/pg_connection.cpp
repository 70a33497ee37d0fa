#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <vector>

namespace sqlgateway {

namespace {

// SQLSTATE 57014 = query_canceled (statement_timeout fires as this)
constexpr const char* kQueryCanceled = "57014";

constexpr const char* kApplicationName = "sql-gateway";

constexpr const char* kReadOnlySession = "-c default_transaction_read_only=on";

std::string libpq_error(PGconn* conn) {
    return utils::trim(conn ? PQerrorMessage(conn) : "out of memory allocating PGconn");
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn, ServerProfile profile)
    : conn_(conn), profile_(std::move(profile)) {
    if (conn_) {
        const char* db = PQdb(conn_);
        current_database_ = db ? db : "";
    }
    home_database_ = current_database_;
}

PgConnection::~PgConnection() {
    close();
}

Result<PGconn*> PgConnection::open(const ServerProfile& profile, const std::string& database) {
    const std::string port = std::to_string(profile.port);
    const std::string connect_timeout = std::to_string(
        std::max<int64_t>(1, profile.connect_timeout.count() / 1000));
    const std::string application_name = kApplicationName;
    const std::string options = session_options(profile);

    std::vector<const char*> keywords;
    std::vector<const char*> values;
    auto add = [&](const char* key, const std::string& value) {
        if (!value.empty()) {
            keywords.push_back(key);
            values.push_back(value.c_str());
        }
    };

    add("host", profile.host);
    add("port", port);
    add("user", profile.user);
    add("password", profile.password);
    add("dbname", database);
    add("connect_timeout", connect_timeout);
    add("application_name", application_name);
    add("options", options);
    for (const auto& [key, value] : profile.options) {
        if (key == "options") continue;
        add(key.c_str(), value);
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    PGconn* conn = PQconnectdbParams(keywords.data(), values.data(), 0);
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        std::string error = libpq_error(conn);
        if (conn) PQfinish(conn);
        return Result<PGconn*>::error(ErrorCategory::CONNECTION_ERROR, std::move(error));
    }
    return Result<PGconn*>::ok(conn);
}

std::string PgConnection::session_options(const ServerProfile& profile) {
    std::string options;
    if (const auto it = profile.options.find("options"); it != profile.options.end()) {
        options = it->second;
    }
    if (profile.read_only) {
        if (!options.empty()) options += ' ';
        options += kReadOnlySession;
    }
    return options;
}

DbResultSet PgConnection::execute(const std::string& sql, size_t max_rows) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed", DbErrorKind::CONNECTION);
    }

    return process_result(PQexec(conn_, sql.c_str()), max_rows);
}

DbResultSet PgConnection::execute_with_params(const std::string& sql,
                                              const std::vector<QueryParam>& params,
                                              size_t max_rows) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed", DbErrorKind::CONNECTION);
    }

    std::vector<std::optional<std::string>> texts;
    std::vector<const char*> values;
    texts.reserve(params.size());
    values.reserve(params.size());
    for (const auto& param : params) {
        if (!param.name.empty()) {
            return DbResultSet::failure("PostgreSQL does not support named parameters",
                                        DbErrorKind::STATEMENT);
        }
        texts.push_back(param_text(param.value));
    }
    for (const auto& text : texts) {
        values.push_back(text ? text->c_str() : nullptr);
    }

    // Text format in and out; the server infers each $n type from context
    return process_result(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                       nullptr, values.data(), nullptr, nullptr, 0),
                          max_rows);
}

DbResultSet PgConnection::process_result(PGresult* res, size_t max_rows) {
    if (!res) {
        return DbResultSet::failure(libpq_error(conn_), DbErrorKind::CONNECTION);
    }

    DbResultSet result;
    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
            result = process_tuples_result(res, max_rows);
            break;
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
            result = process_command_result(res);
            break;
        default:
            result = process_error(res);
            break;
    }

    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::in_transaction() {
    // PQTRANS_UNKNOWN on a broken connection also counts
    return conn_ == nullptr || PQtransactionStatus(conn_) != PQTRANS_IDLE;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }
    if (applied_timeout_ms_ == timeout_ms) {
        return true;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    if (success) {
        applied_timeout_ms_ = timeout_ms;
    }
    return success;
}

std::string PgConnection::switch_database(const std::string& database) {
    const std::string& target = database.empty() ? home_database_ : database;
    if (target == current_database_) {
        return "";
    }

    auto opened = open(profile_, target);
    if (opened.is_error()) {
        return opened.error_message();
    }

    if (conn_) {
        PQfinish(conn_);
    }
    conn_ = opened.value();
    current_database_ = target;
    applied_timeout_ms_.reset();
    return "";
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res, size_t max_rows) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_types.push_back(
            PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    size_t limit = static_cast<size_t>(nrows);
    if (max_rows > 0 && limit > max_rows) {
        limit = max_rows;
        result.truncated = true;
    }
    result.rows.reserve(limit);

    for (size_t i = 0; i < limit; i++) {
        const int r = static_cast<int>(i);
        std::vector<std::optional<std::string>> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, r, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, r, j),
                                             static_cast<size_t>(PQgetlength(res, r, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = static_cast<uint64_t>(nrows);
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && *affected) {
        result.affected_rows = utils::parse_int<uint64_t>(affected, 0);
    }

    return result;
}

DbResultSet PgConnection::process_error(PGresult* res) {
    const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    std::string message = primary ? std::string(primary) : libpq_error(conn_);

    DbErrorKind kind = DbErrorKind::STATEMENT;
    if (PQstatus(conn_) != CONNECTION_OK) {
        kind = DbErrorKind::CONNECTION;
    } else if (sqlstate && std::string_view(sqlstate) == kQueryCanceled) {
        kind = DbErrorKind::TIMEOUT;
    } else if (sqlstate && std::string_view(sqlstate).starts_with("08")) {
        kind = DbErrorKind::CONNECTION;
    }

    return DbResultSet::failure(std::move(message), kind);
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const ServerProfile& profile, const std::string& database) {

    using CreateResult = Result<std::unique_ptr<IDbConnection>>;

    auto opened = PgConnection::open(profile, database);
    if (opened.is_error()) {
        utils::log::error(std::format("PostgreSQL connection to server '{}' failed: {}",
            profile.name, opened.error_message()));
        return CreateResult::error(ErrorCategory::CONNECTION_ERROR, opened.error_message());
    }

    return CreateResult::ok(std::make_unique<PgConnection>(opened.value(), profile));
}

} // namespace sqlgateway
