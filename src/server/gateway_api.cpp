#include "server/gateway_api.hpp"
#include "executor/result_normalizer.hpp"
#include "policy/permission_enforcer.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <limits>
#include <string_view>
#include <openssl/crypto.h>

namespace sqlgateway {

namespace {

constexpr int kOk = 200;
constexpr int kBadRequest = 400;
constexpr int kUnauthorized = 401;
constexpr int kForbidden = 403;
constexpr int kNotFound = 404;
constexpr int kInternalError = 500;
constexpr int kServiceUnavailable = 503;

/// Constant-time string comparison to prevent timing attacks on the API key.
/// The key length is not secret.
bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

GatewayResponse shutting_down() {
    return GatewayResponse::error(kServiceUnavailable, "Server shutting down");
}

/**
 * @brief Parse a request body that must be a JSON object
 */
std::optional<nlohmann::json> parse_object(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

/**
 * @brief Read the mandatory "sql" field of a query object
 * @return Error message, or empty with `sql` filled in
 */
std::string read_sql(const nlohmann::json& object, std::string& sql) {
    const auto it = object.find("sql");
    if (it == object.end() || it->is_null()) {
        return "Missing required field: sql";
    }
    if (!it->is_string()) {
        return "Field 'sql' must be a string";
    }
    sql = it->get<std::string>();
    if (utils::trim(sql).empty()) {
        return "Missing required field: sql";
    }
    return {};
}

bool valid_param_name(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

/**
 * @brief Convert one JSON parameter value; arrays and objects are rejected
 */
std::optional<CellValue> param_value(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return CellValue{};
        case nlohmann::json::value_t::boolean:
            return CellValue{value.get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return CellValue{value.get<int64_t>()};
        case nlohmann::json::value_t::number_unsigned: {
            const auto u = value.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return CellValue{static_cast<int64_t>(u)};
        }
        case nlohmann::json::value_t::number_float:
            return CellValue{value.get<double>()};
        case nlohmann::json::value_t::string:
            return CellValue{value.get<std::string>()};
        default:
            return std::nullopt;
    }
}

/**
 * @brief Read the optional "params" field of a query object
 *
 * An array binds by position, an object binds by name. A leading '@' on a
 * name is dropped.
 *
 * @return Error message, or empty with `params` filled in
 */
std::string read_params(const nlohmann::json& object, std::vector<QueryParam>& params) {
    const auto it = object.find("params");
    if (it == object.end() || it->is_null()) {
        return {};
    }

    if (it->is_array()) {
        params.reserve(it->size());
        for (size_t i = 0; i < it->size(); ++i) {
            auto value = param_value((*it)[i]);
            if (!value) {
                return std::format("Parameter {} must be null, a boolean, a number or a string", i + 1);
            }
            params.push_back(QueryParam{"", std::move(*value)});
        }
        return {};
    }

    if (it->is_object()) {
        for (const auto& item : it->items()) {
            const std::string& key = item.key();
            const nlohmann::json& raw = item.value();
            const std::string name = key.starts_with('@') ? key.substr(1) : key;
            if (!valid_param_name(name)) {
                return std::format("Invalid parameter name '{}'", key);
            }
            const bool duplicate = std::any_of(params.begin(), params.end(),
                [&](const QueryParam& p) { return utils::iequals(p.name, name); });
            if (duplicate) {
                return std::format("Duplicate parameter '{}'", name);
            }
            auto value = param_value(raw);
            if (!value) {
                return std::format("Parameter '{}' must be null, a boolean, a number or a string", name);
            }
            params.push_back(QueryParam{name, std::move(*value)});
        }
        return {};
    }

    return "Field 'params' must be an array or an object";
}

bool has_named_params(const std::vector<QueryParam>& params) {
    return std::any_of(params.begin(), params.end(),
        [](const QueryParam& p) { return !p.name.empty(); });
}

std::string named_params_unsupported(const ServerProfile& profile) {
    return std::format("Server '{}' ({}) binds parameters by position only; pass params as an array",
        profile.name, database_type_to_string(profile.type));
}

} // anonymous namespace

// ============================================================================
// Construction / hot reload
// ============================================================================

GatewayApi::GatewayApi(std::shared_ptr<ProfileRegistry> registry,
                       std::shared_ptr<ConnectionManager> connections,
                       std::string api_key,
                       Options options,
                       std::shared_ptr<ShutdownCoordinator> shutdown)
    : registry_(std::move(registry)),
      connections_(std::move(connections)),
      shutdown_(std::move(shutdown)),
      api_key_(std::make_shared<const std::string>(std::move(api_key))),
      max_sql_length_(options.max_sql_length),
      max_batch_size_(options.max_batch_size),
      require_auth_for_health_(options.require_auth_for_health) {}

void GatewayApi::update_api_key(std::string api_key) {
    std::atomic_store_explicit(&api_key_,
        std::make_shared<const std::string>(std::move(api_key)), std::memory_order_release);
}

void GatewayApi::update_options(const Options& options) {
    max_sql_length_.store(options.max_sql_length);
    max_batch_size_.store(options.max_batch_size);
    require_auth_for_health_.store(options.require_auth_for_health);
}

// ============================================================================
// Shared stages
// ============================================================================

std::optional<GatewayResponse> GatewayApi::authenticate(const GatewayRequest& req) const {
    const auto key = std::atomic_load_explicit(&api_key_, std::memory_order_acquire);
    if (!key || key->empty()) {
        utils::log::error("Rejected request: no API key is configured");
        return GatewayResponse::error(kInternalError, "Server configuration error");
    }

    std::optional<std::string_view> presented;
    if (req.api_key && !req.api_key->empty()) {
        presented = *req.api_key;
    } else if (req.authorization && req.authorization->starts_with(http::kBearerPrefix)) {
        presented = std::string_view(*req.authorization).substr(http::kBearerPrefix.size());
    }

    if (!presented || presented->empty()) {
        return GatewayResponse::error(kUnauthorized, "Missing API key. Include x-api-key header.");
    }
    if (!constant_time_equals(*presented, *key)) {
        utils::log::debug("Rejected request: invalid API key");
        return GatewayResponse::error(kUnauthorized, "Invalid API key.");
    }
    return std::nullopt;
}

std::optional<GatewayResponse> GatewayApi::read_optional_string(
    const nlohmann::json& body, const char* field, std::optional<std::string>& out) {

    const auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return GatewayResponse::error(kBadRequest, std::format("Field '{}' must be a string", field));
    }
    out = it->get<std::string>();
    return std::nullopt;
}

GatewayResponse GatewayApi::acquire_failure(const Result<Session>& acquired) {
    return GatewayResponse::error(kServiceUnavailable, acquired.error_message());
}

nlohmann::ordered_json GatewayApi::database_json(const std::string& database) {
    if (database.empty()) {
        return nullptr;
    }
    return database;
}

nlohmann::ordered_json GatewayApi::query_data_json(const QueryData& data) {
    nlohmann::ordered_json out;
    out["recordset"] = ResultNormalizer::to_json(data.recordset);
    out["columns"] = ResultNormalizer::unique_column_names(data.recordset.columns);
    out["row_count"] = data.recordset.rows.size();
    out["rows_affected"] = data.has_rows ? data.recordset.rows.size() : data.rows_affected;
    return out;
}

// ============================================================================
// GET /health
// ============================================================================

GatewayResponse GatewayApi::handle_health(const GatewayRequest& req) {
    ShutdownCoordinator::RequestGuard guard(shutdown_.get());
    if (!guard.admitted()) return shutting_down();

    if (require_auth_for_health_.load()) {
        if (auto rejected = authenticate(req)) return *rejected;
    }

    GatewayResponse res;
    res.body["status"] = "ok";
    res.body["timestamp"] = utils::format_timestamp(utils::now());

    if (req.param("level").value_or("") != "deep") {
        return res;
    }

    bool all_healthy = true;
    auto servers = nlohmann::ordered_json::object();
    for (const auto& name : connections_->profile_names()) {
        const HealthStatus health = connections_->health_check(name);
        all_healthy = all_healthy && health.healthy;
        servers[name] = {{"connected", health.connected}, {"healthy", health.healthy}};
    }
    res.body["servers"] = std::move(servers);

    if (!all_healthy) {
        res.status = kServiceUnavailable;
        res.body["status"] = "degraded";
    }
    return res;
}

// ============================================================================
// GET /v1/servers
// ============================================================================

GatewayResponse GatewayApi::handle_servers(const GatewayRequest& req) {
    ShutdownCoordinator::RequestGuard guard(shutdown_.get());
    if (!guard.admitted()) return shutting_down();
    if (auto rejected = authenticate(req)) return *rejected;

    const auto snapshot = registry_->snapshot();

    auto servers = nlohmann::ordered_json::array();
    for (const auto& profile : snapshot->profiles) {
        const auto state = connections_->status(profile.name);

        nlohmann::ordered_json entry;
        entry["name"] = profile.name;
        entry["type"] = std::string(database_type_to_string(profile.type));
        entry["host"] = profile.host;
        entry["port"] = profile.port;
        entry["defaultDatabase"] = database_json(profile.default_database);
        entry["connected"] = state ? state->connected : false;
        entry["healthy"] = state ? state->healthy : false;
        entry["readOnly"] = profile.read_only;
        entry["lastError"] = (state && !state->last_error.empty())
            ? nlohmann::ordered_json(state->last_error) : nlohmann::ordered_json(nullptr);
        servers.push_back(std::move(entry));
    }

    GatewayResponse res;
    res.body["success"] = true;
    res.body["data"]["servers"] = std::move(servers);
    res.body["data"]["defaultServer"] = snapshot->default_name
        ? nlohmann::ordered_json(*snapshot->default_name) : nlohmann::ordered_json(nullptr);
    return res;
}

// ============================================================================
// GET /v1/databases
// ============================================================================

GatewayResponse GatewayApi::handle_databases(const GatewayRequest& req) {
    ShutdownCoordinator::RequestGuard guard(shutdown_.get());
    if (!guard.admitted()) return shutting_down();
    if (auto rejected = authenticate(req)) return *rejected;

    auto resolved = registry_->resolve(req.param("server"));
    if (resolved.is_error()) {
        return GatewayResponse::error(kNotFound, resolved.error_message());
    }
    const ServerProfile& profile = resolved.value();

    auto acquired = connections_->acquire(profile);
    if (acquired.is_error()) {
        return acquire_failure(acquired);
    }
    Session& session = acquired.value();

    const DatabaseList list = executor_.list_databases(session, profile);

    GatewayResponse res;
    res.status = kOk;
    res.body["success"] = list.success;
    if (list.success) {
        res.body["data"]["server"] = profile.name;
        res.body["data"]["databases"] = list.databases;
        res.body["data"]["total"] = list.databases.size();
    } else {
        res.body["error"] = list.error_message;
        res.body["server"] = profile.name;
    }
    res.body["execution_ms"] = list.execution_ms();
    return res;
}

// ============================================================================
// POST /v1/query
// ============================================================================

GatewayResponse GatewayApi::handle_query(const GatewayRequest& req) {
    ShutdownCoordinator::RequestGuard guard(shutdown_.get());
    if (!guard.admitted()) return shutting_down();
    if (auto rejected = authenticate(req)) return *rejected;

    // ── Parse ──────────────────────────────────────────────────────────
    const auto body = parse_object(req.body);
    if (!body) {
        return GatewayResponse::error(kBadRequest, "Invalid JSON body: expected an object");
    }

    std::string sql;
    if (auto error = read_sql(*body, sql); !error.empty()) {
        return GatewayResponse::error(kBadRequest, std::move(error));
    }

    std::vector<QueryParam> params;
    if (auto error = read_params(*body, params); !error.empty()) {
        return GatewayResponse::error(kBadRequest, std::move(error));
    }

    std::optional<std::string> server;
    std::optional<std::string> database;
    if (auto bad = read_optional_string(*body, "server", server)) return *bad;
    if (auto bad = read_optional_string(*body, "database", database)) return *bad;

    const size_t max_sql = max_sql_length_.load();
    if (sql.size() > max_sql) {
        return GatewayResponse::error(kBadRequest, std::format("SQL too long: max {} bytes", max_sql));
    }

    // ── Resolve ────────────────────────────────────────────────────────
    auto resolved = registry_->resolve(server);
    if (resolved.is_error()) {
        return GatewayResponse::error(kNotFound, resolved.error_message());
    }
    const ServerProfile& profile = resolved.value();

    if (has_named_params(params) && !supports_named_parameters(profile.type)) {
        return GatewayResponse::error(kBadRequest, named_params_unsupported(profile));
    }

    // ── Permission check ───────────────────────────────────────────────
    const auto decision = PermissionEnforcer::check(profile, sql);
    if (!decision.allowed) {
        return GatewayResponse::error(kForbidden, decision.reason);
    }

    // ── Execute ────────────────────────────────────────────────────────
    auto acquired = connections_->acquire(profile);
    if (acquired.is_error()) {
        return acquire_failure(acquired);
    }
    Session& session = acquired.value();

    const QueryResult result = executor_.execute(session, profile, sql, database, params);

    std::string effective_db = session->current_database();
    if (effective_db.empty()) {
        effective_db = QueryExecutor::target_database(profile, database);
    }

    // ── Respond ────────────────────────────────────────────────────────
    GatewayResponse res;
    res.status = kOk;
    res.body["success"] = result.success();
    if (!result.success()) {
        res.body["error"] = result.error_message();
    }
    res.body["server"] = profile.name;
    res.body["database"] = database_json(effective_db);
    if (result.success()) {
        res.body["data"] = query_data_json(result.data());
    }
    res.body["execution_ms"] = result.execution_ms();
    return res;
}

// ============================================================================
// POST /v1/query/batch
// ============================================================================

GatewayResponse GatewayApi::handle_batch(const GatewayRequest& req) {
    ShutdownCoordinator::RequestGuard guard(shutdown_.get());
    if (!guard.admitted()) return shutting_down();
    if (auto rejected = authenticate(req)) return *rejected;

    const auto body = parse_object(req.body);
    if (!body) {
        return GatewayResponse::error(kBadRequest, "Invalid JSON body: expected an object");
    }

    const auto queries = body->find("queries");
    if (queries == body->end() || !queries->is_array()) {
        return GatewayResponse::error(kBadRequest, "Missing required field: queries array");
    }
    if (queries->empty()) {
        return GatewayResponse::error(kBadRequest, "Batch must contain at least one query");
    }
    const size_t max_batch = max_batch_size_.load();
    if (queries->size() > max_batch) {
        return GatewayResponse::error(kBadRequest,
            std::format("Batch too large: max {} queries", max_batch));
    }

    std::optional<std::string> server;
    std::optional<std::string> database;
    if (auto bad = read_optional_string(*body, "server", server)) return *bad;
    if (auto bad = read_optional_string(*body, "database", database)) return *bad;

    const size_t max_sql = max_sql_length_.load();
    std::vector<SqlStatement> statements;
    statements.reserve(queries->size());
    for (size_t i = 0; i < queries->size(); ++i) {
        const auto& query = (*queries)[i];
        if (!query.is_object()) {
            return GatewayResponse::error(kBadRequest, std::format("Query {} must be an object", i + 1));
        }
        std::string sql;
        if (auto error = read_sql(query, sql); !error.empty()) {
            return GatewayResponse::error(kBadRequest, std::format("Query {}: {}", i + 1, error));
        }
        if (sql.size() > max_sql) {
            return GatewayResponse::error(kBadRequest,
                std::format("Query {}: SQL too long: max {} bytes", i + 1, max_sql));
        }
        std::vector<QueryParam> params;
        if (auto error = read_params(query, params); !error.empty()) {
            return GatewayResponse::error(kBadRequest, std::format("Query {}: {}", i + 1, error));
        }
        statements.push_back(SqlStatement{std::move(sql), std::move(params)});
    }

    auto resolved = registry_->resolve(server);
    if (resolved.is_error()) {
        return GatewayResponse::error(kNotFound, resolved.error_message());
    }
    const ServerProfile& profile = resolved.value();

    // Every statement is checked before any of them runs
    for (size_t i = 0; i < statements.size(); ++i) {
        if (has_named_params(statements[i].params) && !supports_named_parameters(profile.type)) {
            return GatewayResponse::error(kBadRequest,
                std::format("Query {}: {}", i + 1, named_params_unsupported(profile)));
        }
        const auto decision = PermissionEnforcer::check(profile, statements[i].sql);
        if (!decision.allowed) {
            return GatewayResponse::error(kForbidden,
                std::format("Query {} validation failed: {}", i + 1, decision.reason));
        }
    }

    auto acquired = connections_->acquire(profile);
    if (acquired.is_error()) {
        return acquire_failure(acquired);
    }
    Session& session = acquired.value();

    const BatchResult result = executor_.execute_batch(session, profile, statements, database);

    std::string effective_db = session->current_database();
    if (effective_db.empty()) {
        effective_db = QueryExecutor::target_database(profile, database);
    }

    GatewayResponse res;
    res.status = kOk;
    res.body["success"] = result.success;
    if (!result.success) {
        res.body["error"] = result.error_message;
    }
    res.body["server"] = profile.name;
    res.body["database"] = database_json(effective_db);
    if (result.success) {
        auto results = nlohmann::ordered_json::array();
        for (const auto& data : result.results) {
            results.push_back(query_data_json(data));
        }
        res.body["data"]["results"] = std::move(results);
        res.body["data"]["transaction_committed"] = true;
    }
    res.body["execution_ms"] = result.execution_ms();
    return res;
}

} // namespace sqlgateway
