#pragma once

#include "core/column_type.hpp"
#include <sql.h>
#include <sqlext.h>
#include <string>

namespace sqlgateway {

/**
 * @brief ODBC SQL type mapping utilities
 *
 * Maps the SQL data type reported by SQLDescribeCol to GenericColumnType.
 * Covers the SQL Server driver-specific codes (time2, datetimeoffset, xml).
 */
class OdbcTypeMap {
public:
    // SQL Server extensions from msodbcsql.h
    static constexpr SQLSMALLINT kSsXml = -152;
    static constexpr SQLSMALLINT kSsTime2 = -154;
    static constexpr SQLSMALLINT kSsTimestampOffset = -155;

    [[nodiscard]] static GenericColumnType sql_type_to_generic(SQLSMALLINT data_type);

    [[nodiscard]] static std::string sql_type_name(SQLSMALLINT data_type);

    /**
     * @brief True for types fetched as raw bytes (SQL_C_BINARY)
     */
    [[nodiscard]] static bool is_binary(SQLSMALLINT data_type);

    [[nodiscard]] static ColumnTypeInfo build_type_info(SQLSMALLINT data_type, SQLULEN column_size);
};

} // namespace sqlgateway
