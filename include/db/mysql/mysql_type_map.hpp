#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>

namespace sqlgateway {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field metadata to GenericColumnType. The field type alone is
 * not enough: TEXT and BLOB share MYSQL_TYPE_BLOB and differ only by the
 * binary character set, and BIT(1) is a boolean while BIT(n) is raw bytes.
 */
class MysqlTypeMap {
public:
    /** Character set number MySQL reports for binary data */
    static constexpr unsigned int kBinaryCharset = 63;

    /**
     * @brief Map a MySQL field to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @param charsetnr Field character set number
     * @param length Declared display length
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(
        enum_field_types field_type, unsigned int charsetnr, unsigned long length);

    /**
     * @brief SQL type name for a field type ("INT", "VARCHAR", ...)
     */
    [[nodiscard]] static std::string field_type_name(enum_field_types field_type);

    /**
     * @brief Build a full ColumnTypeInfo from a result field
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace sqlgateway
