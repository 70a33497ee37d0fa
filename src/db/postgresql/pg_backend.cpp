#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"

namespace sqlgateway {

std::shared_ptr<IConnectionFactory> PgBackend::create_connection_factory() {
    return std::make_shared<PgConnectionFactory>();
}

std::string PgBackend::list_databases_sql() const {
    return "SELECT datname FROM pg_database "
           "WHERE datallowconn AND NOT datistemplate ORDER BY datname";
}

} // namespace sqlgateway
