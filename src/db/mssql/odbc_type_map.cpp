#include "db/mssql/odbc_type_map.hpp"

namespace sqlgateway {

GenericColumnType OdbcTypeMap::sql_type_to_generic(SQLSMALLINT data_type) {
    switch (data_type) {
        case SQL_BIT:
            return GenericColumnType::BOOLEAN;
        case SQL_TINYINT:
        case SQL_SMALLINT:
            return GenericColumnType::SMALLINT;
        case SQL_INTEGER:
            return GenericColumnType::INTEGER;
        case SQL_BIGINT:
            return GenericColumnType::BIGINT;
        case SQL_REAL:
            return GenericColumnType::REAL;
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            return GenericColumnType::NUMERIC;
        case SQL_CHAR:
        case SQL_WCHAR:
            return GenericColumnType::CHAR;
        case SQL_VARCHAR:
        case SQL_WVARCHAR:
            return GenericColumnType::VARCHAR;
        case SQL_LONGVARCHAR:
        case SQL_WLONGVARCHAR:
            return GenericColumnType::TEXT;
        case SQL_TYPE_DATE:
            return GenericColumnType::DATE;
        case SQL_TYPE_TIME:
        case kSsTime2:
            return GenericColumnType::TIME;
        case SQL_TYPE_TIMESTAMP:
            return GenericColumnType::TIMESTAMP;
        case kSsTimestampOffset:
            return GenericColumnType::TIMESTAMP_TZ;
        case SQL_GUID:
            return GenericColumnType::UUID;
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            return GenericColumnType::BLOB;
        case kSsXml:
            return GenericColumnType::XML;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

std::string OdbcTypeMap::sql_type_name(SQLSMALLINT data_type) {
    switch (data_type) {
        case SQL_BIT: return "BIT";
        case SQL_TINYINT: return "TINYINT";
        case SQL_SMALLINT: return "SMALLINT";
        case SQL_INTEGER: return "INT";
        case SQL_BIGINT: return "BIGINT";
        case SQL_REAL: return "REAL";
        case SQL_FLOAT:
        case SQL_DOUBLE: return "FLOAT";
        case SQL_DECIMAL:
        case SQL_NUMERIC: return "DECIMAL";
        case SQL_CHAR: return "CHAR";
        case SQL_VARCHAR:
        case SQL_LONGVARCHAR: return "VARCHAR";
        case SQL_WCHAR: return "NCHAR";
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR: return "NVARCHAR";
        case SQL_TYPE_DATE: return "DATE";
        case SQL_TYPE_TIME:
        case kSsTime2: return "TIME";
        case SQL_TYPE_TIMESTAMP: return "DATETIME";
        case kSsTimestampOffset: return "DATETIMEOFFSET";
        case SQL_GUID: return "UNIQUEIDENTIFIER";
        case SQL_BINARY: return "BINARY";
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY: return "VARBINARY";
        case kSsXml: return "XML";
        default: return "UNKNOWN";
    }
}

bool OdbcTypeMap::is_binary(SQLSMALLINT data_type) {
    return data_type == SQL_BINARY ||
           data_type == SQL_VARBINARY ||
           data_type == SQL_LONGVARBINARY;
}

ColumnTypeInfo OdbcTypeMap::build_type_info(SQLSMALLINT data_type, SQLULEN column_size) {
    return ColumnTypeInfo(
        sql_type_to_generic(data_type),
        static_cast<uint32_t>(static_cast<uint16_t>(data_type)),
        sql_type_name(data_type),
        static_cast<uint32_t>(column_size));
}

} // namespace sqlgateway
