#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"

namespace sqlgateway {

std::shared_ptr<IConnectionFactory> MysqlBackend::create_connection_factory() {
    return std::make_shared<MysqlConnectionFactory>();
}

} // namespace sqlgateway
