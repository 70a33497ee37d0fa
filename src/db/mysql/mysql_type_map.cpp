#include "db/mysql/mysql_type_map.hpp"

namespace sqlgateway {

GenericColumnType MysqlTypeMap::field_type_to_generic(
    enum_field_types field_type, unsigned int charsetnr, unsigned long length) {

    const bool binary = (charsetnr == kBinaryCharset);

    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return binary ? GenericColumnType::BLOB : GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            return binary ? GenericColumnType::BLOB : GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return binary ? GenericColumnType::BLOB : GenericColumnType::TEXT;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
            return length == 1 ? GenericColumnType::BOOLEAN : GenericColumnType::BLOB;
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::BLOB;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

std::string MysqlTypeMap::field_type_name(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY: return "TINYINT";
        case MYSQL_TYPE_SHORT: return "SMALLINT";
        case MYSQL_TYPE_LONG: return "INT";
        case MYSQL_TYPE_INT24: return "MEDIUMINT";
        case MYSQL_TYPE_LONGLONG: return "BIGINT";
        case MYSQL_TYPE_YEAR: return "YEAR";
        case MYSQL_TYPE_FLOAT: return "FLOAT";
        case MYSQL_TYPE_DOUBLE: return "DOUBLE";
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL: return "DECIMAL";
        case MYSQL_TYPE_STRING: return "CHAR";
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR: return "VARCHAR";
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB: return "BLOB";
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE: return "DATE";
        case MYSQL_TYPE_TIME: return "TIME";
        case MYSQL_TYPE_DATETIME: return "DATETIME";
        case MYSQL_TYPE_TIMESTAMP: return "TIMESTAMP";
        case MYSQL_TYPE_JSON: return "JSON";
        case MYSQL_TYPE_BIT: return "BIT";
        case MYSQL_TYPE_ENUM: return "ENUM";
        case MYSQL_TYPE_SET: return "SET";
        case MYSQL_TYPE_GEOMETRY: return "GEOMETRY";
        default: return "UNKNOWN";
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(const MYSQL_FIELD& field) {
    return ColumnTypeInfo(
        field_type_to_generic(field.type, field.charsetnr, field.length),
        static_cast<uint32_t>(field.type),
        field_type_name(field.type),
        static_cast<uint32_t>(field.length));
}

} // namespace sqlgateway
