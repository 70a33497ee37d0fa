#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlgateway {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view MSSQL = "mssql";
    inline constexpr std::string_view SQLSERVER = "sqlserver";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    MSSQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::MSSQL: return keys::MSSQL;
        default: return "unknown";
    }
}

/**
 * @brief Well-known listener port for each backend type
 */
[[nodiscard]] inline uint16_t default_port(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return 5432;
        case DatabaseType::MYSQL: return 3306;
        case DatabaseType::MSSQL: return 1433;
        default: return 0;
    }
}

/**
 * @brief Whether the backend binds parameters by name
 *
 * SQL Server binds @name parameters through sp_executesql. PostgreSQL
 * ($1, $2) and MySQL (?) bind by position only.
 */
[[nodiscard]] inline bool supports_named_parameters(DatabaseType type) {
    return type == DatabaseType::MSSQL;
}

/**
 * @brief Parse a backend type name, case-insensitive
 * @return std::nullopt for unknown names
 */
[[nodiscard]] inline std::optional<DatabaseType> parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::MSSQL,      DatabaseType::MSSQL},
        {keys::SQLSERVER,  DatabaseType::MSSQL},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the exact lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    return std::nullopt;
}

} // namespace sqlgateway
