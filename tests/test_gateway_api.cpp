#include <catch2/catch_test_macros.hpp>
#include "server/gateway_api.hpp"
#include "mocks/mock_database.hpp"

using namespace sqlgateway;
using namespace sqlgateway::testing;
using json = nlohmann::json;
using ojson = nlohmann::ordered_json;

namespace {

constexpr const char* kKey = "test-api-key";

const ColumnTypeInfo kInt{GenericColumnType::INTEGER, 4, "int"};
const ColumnTypeInfo kVarchar{GenericColumnType::VARCHAR, 12, "varchar"};

/**
 * @brief Two SQL Server profiles (read-write, read-only) behind mock sessions
 */
struct ApiFixture {
    explicit ApiFixture(std::shared_ptr<ShutdownCoordinator> shutdown = nullptr)
        : backend(DatabaseType::MSSQL),
          registry(std::make_shared<ProfileRegistry>(profiles(), "SERVER_PROFILE_1")),
          connections(std::make_shared<ConnectionManager>(registry)),
          api(registry, connections, kKey, GatewayApi::Options{4096, 3, false}, std::move(shutdown)) {}

    static std::vector<ServerProfile> profiles() {
        auto rw = make_profile("SERVER_PROFILE_1", false, DatabaseType::MSSQL);
        rw.default_database = "master";
        auto ro = make_profile("SERVER_PROFILE_2", true, DatabaseType::MSSQL);
        ro.default_database = "master";
        return {rw, ro};
    }

    static GatewayRequest request(const json& body) {
        GatewayRequest req;
        req.api_key = kKey;
        req.body = body.dump();
        return req;
    }

    MockScript& script() { return backend.script(); }
    int creates() const { return backend.factory().creates(); }

    ScopedMockBackend backend;
    std::shared_ptr<ProfileRegistry> registry;
    std::shared_ptr<ConnectionManager> connections;
    GatewayApi api;
};

/**
 * @brief One PostgreSQL profile with no default database
 */
struct PgApiFixture {
    PgApiFixture()
        : backend(DatabaseType::POSTGRESQL),
          registry(std::make_shared<ProfileRegistry>(
              std::vector<ServerProfile>{make_profile("PG_MAIN")}, "PG_MAIN")),
          connections(std::make_shared<ConnectionManager>(registry)),
          api(registry, connections, kKey, GatewayApi::Options{4096, 3, false}) {
        backend.script().login_database = "postgres";
    }

    MockScript& script() { return backend.script(); }
    int creates() const { return backend.factory().creates(); }

    ScopedMockBackend backend;
    std::shared_ptr<ProfileRegistry> registry;
    std::shared_ptr<ConnectionManager> connections;
    GatewayApi api;
};

DbResultSet one_row(const std::string&) {
    return ok_rows({"id", "name"}, {kInt, kVarchar}, {{"1", "alice"}});
}

} // anonymous namespace

// ============================================================================
// Authentication
// ============================================================================

TEST_CASE("GatewayApi: missing API key is 401", "[api][auth]") {
    ApiFixture f;
    GatewayRequest req;
    req.body = R"({"sql":"SELECT 1"})";

    const auto res = f.api.handle_query(req);
    CHECK(res.status == 401);
    CHECK(res.body["success"] == false);
    CHECK(res.body["error"] == "Missing API key. Include x-api-key header.");
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: wrong API key is 401", "[api][auth]") {
    ApiFixture f;
    auto req = ApiFixture::request({{"sql", "SELECT 1"}});
    req.api_key = "wrong";

    const auto res = f.api.handle_query(req);
    CHECK(res.status == 401);
    CHECK(res.body["error"] == "Invalid API key.");
}

TEST_CASE("GatewayApi: near-miss API keys are rejected", "[api][auth]") {
    ApiFixture f;
    const std::string key = kKey;

    for (const std::string& presented : {key.substr(0, key.size() - 1), key + "x",
                                         std::string(key.size(), 'x'), std::string("Test-api-key")}) {
        auto req = ApiFixture::request({{"sql", "SELECT 1"}});
        req.api_key = presented;
        const auto res = f.api.handle_query(req);
        CHECK(res.status == 401);
        CHECK(res.body["error"] == "Invalid API key.");
    }
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: bearer token is accepted", "[api][auth]") {
    ApiFixture f;
    auto req = ApiFixture::request({{"sql", "SELECT 1"}});
    req.api_key.reset();
    req.authorization = std::string("Bearer ") + kKey;

    CHECK(f.api.handle_query(req).status == 200);
}

TEST_CASE("GatewayApi: unconfigured API key is a server error", "[api][auth]") {
    ApiFixture f;
    f.api.update_api_key("");

    const auto res = f.api.handle_servers(ApiFixture::request(json::object()));
    CHECK(res.status == 500);
    CHECK(res.body["error"] == "Server configuration error");
}

TEST_CASE("GatewayApi: rotated API key takes effect immediately", "[api][auth]") {
    ApiFixture f;
    f.api.update_api_key("rotated");

    CHECK(f.api.handle_servers(ApiFixture::request(json::object())).status == 401);

    GatewayRequest req;
    req.api_key = "rotated";
    CHECK(f.api.handle_servers(req).status == 200);
}

// ============================================================================
// POST /v1/query
// ============================================================================

TEST_CASE("GatewayApi: write against read-write server succeeds", "[api][query]") {
    ApiFixture f;
    f.script().set_handler([](const std::string&) { return ok_command(1); });

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "INSERT INTO users (name) VALUES ('x')"},
        {"server", "SERVER_PROFILE_1"},
        {"database", "app_db"},
    }));

    CHECK(res.status == 200);
    CHECK(res.body["success"] == true);
    CHECK(res.body["server"] == "SERVER_PROFILE_1");
    CHECK(res.body["database"] == "app_db");
    CHECK(res.body["data"]["rows_affected"] == 1);
    CHECK(res.body["data"]["recordset"].empty());
    CHECK(res.body.contains("execution_ms"));
}

TEST_CASE("GatewayApi: write against read-only server is 403", "[api][query]") {
    ApiFixture f;

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "INSERT INTO users (name) VALUES ('x')"},
        {"server", "SERVER_PROFILE_2"},
    }));

    CHECK(res.status == 403);
    CHECK(res.body["success"] == false);
    CHECK(res.body["error"].get<std::string>().find("READ-ONLY") != std::string::npos);
    // Rejected before any session was opened
    CHECK(f.creates() == 0);
    CHECK(f.script().statements().empty());
}

TEST_CASE("GatewayApi: select against read-only server returns rows", "[api][query]") {
    ApiFixture f;
    f.script().set_handler(one_row);

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "SELECT id, name FROM users"},
        {"server", "server_profile_2"},
    }));

    CHECK(res.status == 200);
    CHECK(res.body["success"] == true);
    CHECK(res.body["server"] == "SERVER_PROFILE_2");
    CHECK(res.body["database"] == "master");
    CHECK(res.body["data"]["row_count"] == 1);
    CHECK(res.body["data"]["columns"] == ojson::array({"id", "name"}));
    CHECK(res.body["data"]["recordset"][0]["id"] == 1);
    CHECK(res.body["data"]["recordset"][0]["name"] == "alice");
}

TEST_CASE("GatewayApi: absent server uses the default profile", "[api][query]") {
    ApiFixture f;

    const auto res = f.api.handle_query(ApiFixture::request({{"sql", "SELECT 1"}}));
    CHECK(res.status == 200);
    CHECK(res.body["server"] == "SERVER_PROFILE_1");
}

TEST_CASE("GatewayApi: unknown server is 404", "[api][query]") {
    ApiFixture f;

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "SELECT 1"}, {"server", "NOPE"}}));
    CHECK(res.status == 404);
    CHECK(res.body["error"].get<std::string>().find("'NOPE' not found") != std::string::npos);
    CHECK(f.creates() == 0);
    CHECK(f.script().statements().empty());
}

TEST_CASE("GatewayApi: malformed requests are 400", "[api][query]") {
    ApiFixture f;

    auto raw = [&](const std::string& body) {
        GatewayRequest req;
        req.api_key = kKey;
        req.body = body;
        return f.api.handle_query(req);
    };

    SECTION("not JSON") {
        const auto res = raw("{not json");
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Invalid JSON body: expected an object");
    }
    SECTION("JSON array") {
        CHECK(raw("[]").status == 400);
    }
    SECTION("missing sql") {
        const auto res = raw(R"({"server":"SERVER_PROFILE_1"})");
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Missing required field: sql");
    }
    SECTION("blank sql") {
        CHECK(raw(R"({"sql":"   "})").body["error"] == "Missing required field: sql");
    }
    SECTION("sql of the wrong type") {
        CHECK(raw(R"({"sql":42})").body["error"] == "Field 'sql' must be a string");
    }
    SECTION("server of the wrong type") {
        CHECK(raw(R"({"sql":"SELECT 1","server":7})").body["error"] == "Field 'server' must be a string");
    }
    SECTION("sql too long") {
        const auto res = f.api.handle_query(ApiFixture::request({{"sql", std::string(5000, 'x')}}));
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "SQL too long: max 4096 bytes");
    }
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: JSON-looking text is returned as the same string", "[api][query]") {
    ApiFixture f;
    const std::string doc = R"({"a": 1, "b": [true, null], "c": "\u00e9"})";
    f.script().set_handler([doc](const std::string&) {
        return ok_rows({"doc"}, {kVarchar}, {{doc}});
    });

    const auto res = f.api.handle_query(ApiFixture::request({{"sql", "SELECT doc FROM documents"}}));
    REQUIRE(res.status == 200);
    const auto& cell = res.body["data"]["recordset"][0]["doc"];
    REQUIRE(cell.is_string());
    CHECK(cell.get<std::string>() == doc);

    const auto reparsed = json::parse(res.body.dump());
    CHECK(reparsed["data"]["recordset"][0]["doc"].get<std::string>() == doc);
}

TEST_CASE("GatewayApi: repeating a select gives the same answer", "[api][query]") {
    ApiFixture f;
    f.script().set_handler([](const std::string&) {
        return ok_rows({"id", "name"}, {kInt, kVarchar}, {{"1", "alice"}, {"2", std::nullopt}});
    });

    const auto request = ApiFixture::request({{"sql", "SELECT id, name FROM users"}});
    const auto first = f.api.handle_query(request);
    const auto second = f.api.handle_query(request);

    REQUIRE(first.status == 200);
    REQUIRE(second.status == 200);
    CHECK(first.body["data"]["recordset"] == second.body["data"]["recordset"]);
    CHECK(first.body["data"]["row_count"] == 2);
    CHECK(second.body["data"]["row_count"] == 2);
    CHECK(first.body["data"]["columns"] == second.body["data"]["columns"]);
    CHECK(f.creates() == 1);
}

TEST_CASE("GatewayApi: response database follows the session, not the last request", "[api][query]") {
    PgApiFixture f;

    auto query = [&](json body) {
        GatewayRequest req;
        req.api_key = kKey;
        req.body = body.dump();
        return f.api.handle_query(req);
    };

    const auto first = query({{"sql", "SELECT 1"}, {"database", "tenant_a"}});
    REQUIRE(first.status == 200);
    CHECK(first.body["database"] == "tenant_a");

    const auto second = query({{"sql", "SELECT 1"}});
    REQUIRE(second.status == 200);
    CHECK(second.body["database"] == "postgres");
    CHECK(f.creates() == 1);
}

// ============================================================================
// Parameters
// ============================================================================

TEST_CASE("GatewayApi: positional params are bound in order", "[api][params]") {
    ApiFixture f;

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "SELECT * FROM users WHERE id = ? AND name = ? AND note IS ? AND active = ? AND score > ?"},
        {"params", json::array({7, "ann", nullptr, true, 2.5})},
    }));
    REQUIRE(res.status == 200);

    const auto bound = f.script().bound_params();
    REQUIRE(bound.size() == 1);
    const std::vector<QueryParam> expected{
        {"", CellValue{int64_t{7}}},
        {"", CellValue{std::string("ann")}},
        {"", CellValue{}},
        {"", CellValue{true}},
        {"", CellValue{2.5}},
    };
    CHECK(bound.front() == expected);
}

TEST_CASE("GatewayApi: named params drop the leading @", "[api][params]") {
    ApiFixture f;

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "SELECT * FROM users WHERE id = @id"},
        {"params", {{"@id", 42}}},
    }));
    REQUIRE(res.status == 200);

    const auto bound = f.script().bound_params();
    REQUIRE(bound.size() == 1);
    CHECK(bound.front() == std::vector<QueryParam>{{"id", CellValue{int64_t{42}}}});
}

TEST_CASE("GatewayApi: text that looks like SQL stays a bound value", "[api][params]") {
    ApiFixture f;
    const std::string hostile = "x'; DROP TABLE users; --";

    const auto res = f.api.handle_query(ApiFixture::request({
        {"sql", "SELECT * FROM users WHERE name = @name"},
        {"params", {{"name", hostile}}},
        {"server", "SERVER_PROFILE_2"},
    }));
    REQUIRE(res.status == 200);
    CHECK(f.script().statements() == std::vector<std::string>{"SELECT * FROM users WHERE name = @name"});
    REQUIRE(f.script().bound_params().size() == 1);
    CHECK(f.script().bound_params().front().front().value == CellValue{hostile});
}

TEST_CASE("GatewayApi: malformed params are 400", "[api][params]") {
    ApiFixture f;

    auto query = [&](json params) {
        return f.api.handle_query(ApiFixture::request({{"sql", "SELECT 1"}, {"params", std::move(params)}}));
    };

    SECTION("params of the wrong type") {
        const auto res = query("abc");
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Field 'params' must be an array or an object");
    }
    SECTION("nested value") {
        const auto res = query(json::array({1, json::array({2})}));
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Parameter 2 must be null, a boolean, a number or a string");
    }
    SECTION("object value") {
        const auto res = query({{"id", {{"x", 1}}}});
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Parameter 'id' must be null, a boolean, a number or a string");
    }
    SECTION("bad name") {
        const auto res = query({{"1st", 1}});
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Invalid parameter name '1st'");
    }
    SECTION("name with punctuation") {
        CHECK(query({{"id;drop", 1}}).status == 400);
    }
    SECTION("the same name twice") {
        const auto res = query({{"id", 1}, {"@id", 2}});
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Duplicate parameter 'id'");
    }
    SECTION("integer beyond the signed 64-bit range") {
        CHECK(query(json::array({uint64_t{18446744073709551615ULL}})).status == 400);
    }
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: named params on a positional backend are 400", "[api][params]") {
    PgApiFixture f;

    GatewayRequest req;
    req.api_key = kKey;
    req.body = json{{"sql", "SELECT * FROM t WHERE id = :id"}, {"params", {{"id", 1}}}}.dump();

    const auto res = f.api.handle_query(req);
    CHECK(res.status == 400);
    CHECK(res.body["error"].get<std::string>().find("binds parameters by position only") !=
          std::string::npos);
    CHECK(f.creates() == 0);

    req.body = json{{"sql", "SELECT * FROM t WHERE id = $1"}, {"params", json::array({1})}}.dump();
    CHECK(f.api.handle_query(req).status == 200);
    CHECK(f.script().bound_params().size() == 1);
}

TEST_CASE("GatewayApi: database error is reported in-band", "[api][query]") {
    ApiFixture f;
    f.script().set_handler([](const std::string&) {
        return DbResultSet::failure("Invalid object name 'nope'.", DbErrorKind::STATEMENT);
    });

    const auto res = f.api.handle_query(ApiFixture::request({{"sql", "SELECT * FROM nope"}}));
    CHECK(res.status == 200);
    CHECK(res.body["success"] == false);
    CHECK(res.body["error"] == "Invalid object name 'nope'.");
    CHECK_FALSE(res.body.contains("data"));
}

TEST_CASE("GatewayApi: unreachable server is 503", "[api][query]") {
    ApiFixture f;
    f.backend.factory().fail_with("Login timeout expired");

    const auto res = f.api.handle_query(ApiFixture::request({{"sql", "SELECT 1"}}));
    CHECK(res.status == 503);
    CHECK(res.body["error"] ==
          "Failed to connect to server 'SERVER_PROFILE_1': Login timeout expired");
}

TEST_CASE("GatewayApi: requests are refused while shutting down", "[api][shutdown]") {
    auto shutdown = std::make_shared<ShutdownCoordinator>();
    ApiFixture f(shutdown);
    shutdown->initiate_shutdown();

    const auto res = f.api.handle_query(ApiFixture::request({{"sql", "SELECT 1"}}));
    CHECK(res.status == 503);
    CHECK(res.body["error"] == "Server shutting down");
    CHECK(shutdown->in_flight_count() == 0);
}

// ============================================================================
// POST /v1/query/batch
// ============================================================================

TEST_CASE("GatewayApi: batch commits and returns every result", "[api][batch]") {
    ApiFixture f;
    f.script().set_handler([](const std::string& sql) {
        if (sql.starts_with("SELECT")) return one_row(sql);
        return ok_command(1);
    });

    const auto res = f.api.handle_batch(ApiFixture::request({
        {"server", "SERVER_PROFILE_1"},
        {"queries", json::array({
            {{"sql", "INSERT INTO t VALUES (1)"}},
            {{"sql", "SELECT id, name FROM users"}},
        })},
    }));

    CHECK(res.status == 200);
    CHECK(res.body["success"] == true);
    CHECK(res.body["data"]["transaction_committed"] == true);
    REQUIRE(res.body["data"]["results"].size() == 2);
    CHECK(res.body["data"]["results"][0]["rows_affected"] == 1);
    CHECK(res.body["data"]["results"][1]["row_count"] == 1);
    CHECK(f.script().count("COMMIT") == 1);
}

TEST_CASE("GatewayApi: failing batch statement rolls back", "[api][batch]") {
    ApiFixture f;
    f.script().set_handler([](const std::string& sql) {
        if (sql == "INSERT INTO t VALUES (2)") {
            return DbResultSet::failure("Violation of PRIMARY KEY constraint", DbErrorKind::STATEMENT);
        }
        return ok_command(1);
    });

    const auto res = f.api.handle_batch(ApiFixture::request({
        {"queries", json::array({
            {{"sql", "INSERT INTO t VALUES (1)"}},
            {{"sql", "INSERT INTO t VALUES (2)"}},
        })},
    }));

    CHECK(res.status == 200);
    CHECK(res.body["success"] == false);
    CHECK(res.body["error"] ==
          "Transaction failed: statement 2: Violation of PRIMARY KEY constraint");
    CHECK_FALSE(res.body.contains("data"));
    CHECK(f.script().count("ROLLBACK") == 1);
    CHECK(f.script().count("COMMIT") == 0);
}

TEST_CASE("GatewayApi: batch with a write against read-only runs nothing", "[api][batch]") {
    ApiFixture f;

    const auto res = f.api.handle_batch(ApiFixture::request({
        {"server", "SERVER_PROFILE_2"},
        {"queries", json::array({
            {{"sql", "SELECT 1"}},
            {{"sql", "DELETE FROM users"}},
        })},
    }));

    CHECK(res.status == 403);
    CHECK(res.body["error"].get<std::string>().find("Query 2 validation failed") == 0);
    CHECK(res.body["error"].get<std::string>().find("READ-ONLY") != std::string::npos);
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: batch shape is validated", "[api][batch]") {
    ApiFixture f;

    CHECK(f.api.handle_batch(ApiFixture::request({{"sql", "SELECT 1"}})).body["error"] ==
          "Missing required field: queries array");
    CHECK(f.api.handle_batch(ApiFixture::request({{"queries", json::array()}})).body["error"] ==
          "Batch must contain at least one query");

    auto four = json::array();
    for (int i = 0; i < 4; ++i) four.push_back(json{{"sql", "SELECT 1"}});
    CHECK(f.api.handle_batch(ApiFixture::request({{"queries", four}})).body["error"] ==
          "Batch too large: max 3 queries");

    CHECK(f.api.handle_batch(ApiFixture::request({
              {"queries", json::array({{{"sql", "SELECT 1"}}, {{"server", "x"}}})}})).body["error"] ==
          "Query 2: Missing required field: sql");
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: batch statements carry their own params", "[api][batch]") {
    ApiFixture f;
    f.script().set_handler([](const std::string&) { return ok_command(1); });

    const auto res = f.api.handle_batch(ApiFixture::request({
        {"queries", json::array({
            {{"sql", "INSERT INTO t VALUES (@v)"}, {"params", {{"v", 1}}}},
            {{"sql", "DELETE FROM t WHERE id = 9"}},
            {{"sql", "INSERT INTO t VALUES (?)"}, {"params", json::array({"two"})}},
        })},
    }));
    REQUIRE(res.status == 200);
    CHECK(res.body["success"] == true);

    const auto bound = f.script().bound_params();
    REQUIRE(bound.size() == 2);
    CHECK(bound[0] == std::vector<QueryParam>{{"v", CellValue{int64_t{1}}}});
    CHECK(bound[1] == std::vector<QueryParam>{{"", CellValue{std::string("two")}}});
}

TEST_CASE("GatewayApi: batch params are validated before anything runs", "[api][batch]") {
    SECTION("malformed value") {
        ApiFixture f;
        const auto res = f.api.handle_batch(ApiFixture::request({
            {"queries", json::array({
                {{"sql", "SELECT 1"}},
                {{"sql", "SELECT ?"}, {"params", json::array({json::object()})}},
            })},
        }));
        CHECK(res.status == 400);
        CHECK(res.body["error"] == "Query 2: Parameter 1 must be null, a boolean, a number or a string");
        CHECK(f.creates() == 0);
    }

    SECTION("named params on a positional backend") {
        PgApiFixture f;
        GatewayRequest req;
        req.api_key = kKey;
        req.body = json{{"queries", json::array({
            {{"sql", "INSERT INTO t VALUES (:v)"}, {"params", {{"v", 1}}}},
        })}}.dump();

        const auto res = f.api.handle_batch(req);
        CHECK(res.status == 400);
        CHECK(res.body["error"].get<std::string>().find("Query 1: ") == 0);
        CHECK(f.creates() == 0);
    }
}

// ============================================================================
// GET /v1/servers, /v1/databases, /health
// ============================================================================

TEST_CASE("GatewayApi: servers lists every profile without secrets", "[api][servers]") {
    ApiFixture f;

    const auto res = f.api.handle_servers(ApiFixture::request(json::object()));
    REQUIRE(res.status == 200);
    CHECK(res.body["success"] == true);
    CHECK(res.body["data"]["defaultServer"] == "SERVER_PROFILE_1");

    const auto& servers = res.body["data"]["servers"];
    REQUIRE(servers.size() == 2);
    CHECK(servers[0]["name"] == "SERVER_PROFILE_1");
    CHECK(servers[0]["type"] == "mssql");
    CHECK(servers[0]["port"] == 1433);
    CHECK(servers[0]["defaultDatabase"] == "master");
    CHECK(servers[0]["readOnly"] == false);
    CHECK(servers[1]["readOnly"] == true);
    CHECK(servers[0]["lastError"].is_null());
    CHECK_FALSE(servers[0].contains("password"));
    CHECK_FALSE(servers[0].contains("user"));
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: servers with no profiles configured", "[api][servers]") {
    auto registry = std::make_shared<ProfileRegistry>();
    auto connections = std::make_shared<ConnectionManager>(registry);
    GatewayApi api(registry, connections, kKey, GatewayApi::Options{});

    const auto res = api.handle_servers(ApiFixture::request(json::object()));
    REQUIRE(res.status == 200);
    CHECK(res.body["success"] == true);
    CHECK(res.body["data"]["servers"] == ojson::array());
    CHECK(res.body["data"]["defaultServer"].is_null());

    const auto query = api.handle_query(ApiFixture::request({{"sql", "SELECT 1"}}));
    CHECK(query.status == 404);
    CHECK(query.body["error"] == "No server specified and no default server configured");
}

TEST_CASE("GatewayApi: databases lists the catalog of a server", "[api][databases]") {
    ApiFixture f;
    f.script().set_handler([](const std::string& sql) {
        if (sql == MockBackend::kListDatabasesSql) {
            return ok_rows({"name"}, {kVarchar}, {{"master"}, {"app_db"}});
        }
        return ok_command();
    });

    GatewayRequest req;
    req.api_key = kKey;
    req.params["server"] = "server_profile_2";

    const auto res = f.api.handle_databases(req);
    REQUIRE(res.status == 200);
    CHECK(res.body["success"] == true);
    CHECK(res.body["data"]["server"] == "SERVER_PROFILE_2");
    CHECK(res.body["data"]["databases"] == ojson::array({"master", "app_db"}));
    CHECK(res.body["data"]["total"] == 2);
}

TEST_CASE("GatewayApi: databases for an unknown server is 404", "[api][databases]") {
    ApiFixture f;
    GatewayRequest req;
    req.api_key = kKey;
    req.params["server"] = "missing";

    CHECK(f.api.handle_databases(req).status == 404);
}

TEST_CASE("GatewayApi: shallow health needs no key and no backend", "[api][health]") {
    ApiFixture f;

    const auto res = f.api.handle_health(GatewayRequest{});
    CHECK(res.status == 200);
    CHECK(res.body["status"] == "ok");
    CHECK(res.body.contains("timestamp"));
    CHECK_FALSE(res.body.contains("servers"));
    CHECK(f.creates() == 0);
}

TEST_CASE("GatewayApi: deep health checks every server", "[api][health]") {
    ApiFixture f;
    GatewayRequest req;
    req.params["level"] = "deep";

    SECTION("all healthy") {
        const auto res = f.api.handle_health(req);
        CHECK(res.status == 200);
        CHECK(res.body["status"] == "ok");
        CHECK(res.body["servers"]["SERVER_PROFILE_1"]["healthy"] == true);
        CHECK(res.body["servers"]["SERVER_PROFILE_2"]["connected"] == true);
    }

    SECTION("one unhealthy server degrades the gateway") {
        f.script().healthy = false;
        const auto res = f.api.handle_health(req);
        CHECK(res.status == 503);
        CHECK(res.body["status"] == "degraded");
    }
}

TEST_CASE("GatewayApi: health can require the key", "[api][health]") {
    ApiFixture f;
    f.api.update_options(GatewayApi::Options{4096, 3, true});

    CHECK(f.api.handle_health(GatewayRequest{}).status == 401);

    GatewayRequest req;
    req.api_key = kKey;
    CHECK(f.api.handle_health(req).status == 200);
}
