#include <catch2/catch_test_macros.hpp>
#include "executor/result_normalizer.hpp"
#include "mocks/mock_database.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#endif
#ifdef ENABLE_MSSQL
#include "db/mssql/odbc_connection.hpp"
#endif

using namespace sqlgateway;

#ifdef ENABLE_POSTGRESQL

TEST_CASE("PgTypeMap: built-in OIDs map to generic types", "[backend][postgresql]") {
    CHECK(PgTypeMap::oid_to_generic_type(23) == GenericColumnType::INTEGER);
    CHECK(PgTypeMap::oid_to_generic_type(701) == GenericColumnType::DOUBLE_PRECISION);
    CHECK(PgTypeMap::oid_to_generic_type(16) == GenericColumnType::BOOLEAN);
    CHECK(PgTypeMap::oid_to_generic_type(17) == GenericColumnType::BLOB);
    CHECK(PgTypeMap::oid_to_generic_type(999999) == GenericColumnType::UNKNOWN);

    const auto info = PgTypeMap::build_type_info(17);
    CHECK(info.vendor_type_name == "bytea");
    CHECK(info.vendor_type_id == 17);
}

TEST_CASE("PgTypeMap: PostgreSQL text values normalize", "[backend][postgresql]") {
    CHECK(ResultNormalizer::normalize_value("t", PgTypeMap::build_type_info(16)) == CellValue{true});
    CHECK(ResultNormalizer::normalize_value("\\x0102", PgTypeMap::build_type_info(17)) ==
          CellValue{std::string("\\x0102")});
    CHECK(ResultNormalizer::normalize_value("7", PgTypeMap::build_type_info(20)) ==
          CellValue{int64_t{7}});
}

TEST_CASE("PgConnection: read-only profiles open read-only sessions", "[backend][postgresql]") {
    auto p = testing::make_profile("PG", true);
    CHECK(PgConnection::session_options(p) == "-c default_transaction_read_only=on");

    p.options["options"] = "-c search_path=app";
    CHECK(PgConnection::session_options(p) ==
          "-c search_path=app -c default_transaction_read_only=on");

    p.read_only = false;
    CHECK(PgConnection::session_options(p) == "-c search_path=app");
}

#endif // ENABLE_POSTGRESQL

#ifdef ENABLE_MSSQL

TEST_CASE("ODBC: connection string for SQL login", "[backend][mssql]") {
    auto p = testing::make_profile("SQL", false, DatabaseType::MSSQL);
    p.host = "sql1.internal";
    p.port = 1433;
    p.user = "sa";
    p.password = "p;w}d";

    CHECK(build_odbc_connection_string(p, "master") ==
          "Driver={ODBC Driver 18 for SQL Server};Server={sql1.internal,1433};"
          "Database={master};Uid={sa};Pwd={p;w}}d};");
}

TEST_CASE("ODBC: connection string honours driver and security options", "[backend][mssql]") {
    auto p = testing::make_profile("SQL", false, DatabaseType::MSSQL);
    p.host = "h";
    p.port = 1500;
    p.options["odbc_driver"] = "FreeTDS";
    p.options["trusted_connection"] = "true";
    p.options["encrypt"] = "false";
    p.options["trust_server_certificate"] = "yes";
    p.options["ApplicationIntent"] = "ReadOnly";

    CHECK(build_odbc_connection_string(p, "") ==
          "Driver={FreeTDS};Server={h,1500};Trusted_Connection=yes;"
          "Encrypt=no;TrustServerCertificate=yes;ApplicationIntent={ReadOnly};");
}

TEST_CASE("ODBC: read-only profiles declare a read-only application intent", "[backend][mssql]") {
    auto p = testing::make_profile("SQL_RO", true, DatabaseType::MSSQL);
    p.host = "h";
    p.port = 1433;
    p.user = "reader";
    p.password = "pw";

    CHECK(build_odbc_connection_string(p, "") ==
          "Driver={ODBC Driver 18 for SQL Server};Server={h,1433};"
          "Uid={reader};Pwd={pw};ApplicationIntent=ReadOnly;");
}

TEST_CASE("ODBC: values are brace-escaped", "[backend][mssql]") {
    CHECK(escape_odbc_value("plain") == "{plain}");
    CHECK(escape_odbc_value("a}b") == "{a}}b}");
    CHECK(escape_odbc_value("") == "{}");
}

#endif // ENABLE_MSSQL

TEST_CASE("BackendRegistry: unknown type throws", "[backend]") {
    BackendRegistry::instance().unregister_backend(DatabaseType::MYSQL);
    CHECK_FALSE(BackendRegistry::instance().has_backend(DatabaseType::MYSQL));
    CHECK_THROWS_AS(BackendRegistry::instance().create(DatabaseType::MYSQL), std::runtime_error);
}

TEST_CASE("BackendRegistry: registered factory builds the backend", "[backend]") {
    testing::ScopedMockBackend scoped(DatabaseType::MYSQL);
    REQUIRE(BackendRegistry::instance().has_backend(DatabaseType::MYSQL));

    auto backend = BackendRegistry::instance().create(DatabaseType::MYSQL);
    CHECK(backend->type() == DatabaseType::MYSQL);
    CHECK(backend->commit_sql() == "COMMIT");
    CHECK(backend->rollback_sql() == "ROLLBACK");
}

TEST_CASE("DatabaseType: names parse case-insensitively", "[backend]") {
    CHECK(parse_database_type("postgres") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("MariaDB") == DatabaseType::MYSQL);
    CHECK(parse_database_type("SQLSERVER") == DatabaseType::MSSQL);
    CHECK_FALSE(parse_database_type("oracle").has_value());
    CHECK(default_port(DatabaseType::MSSQL) == 1433);
}

TEST_CASE("DatabaseType: only SQL Server binds parameters by name", "[backend]") {
    CHECK(supports_named_parameters(DatabaseType::MSSQL));
    CHECK_FALSE(supports_named_parameters(DatabaseType::POSTGRESQL));
    CHECK_FALSE(supports_named_parameters(DatabaseType::MYSQL));
}

TEST_CASE("QueryParam: text form of parameter values", "[backend]") {
    CHECK_FALSE(param_text(CellValue{}).has_value());
    CHECK(param_text(CellValue{true}) == "true");
    CHECK(param_text(CellValue{int64_t{-42}}) == "-42");
    CHECK(param_text(CellValue{2.5}) == "2.5");
    CHECK(param_text(CellValue{std::string("O'Brien")}) == "O'Brien");
}
