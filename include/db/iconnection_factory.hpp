#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlgateway {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (PQconnectdbParams, mysql_real_connect, SQLDriverConnect).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new connection to the profile's server
     * @param profile Connection target and credentials
     * @param database Database to connect into (empty = profile default)
     * @return Connection, or CONNECTION_ERROR carrying the driver's reason
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const ServerProfile& profile, const std::string& database) = 0;
};

} // namespace sqlgateway
