#include "db/mssql/mssql_backend.hpp"
#include "db/mssql/odbc_connection.hpp"

namespace sqlgateway {

std::shared_ptr<IConnectionFactory> MssqlBackend::create_connection_factory() {
    return std::make_shared<OdbcConnectionFactory>();
}

} // namespace sqlgateway
