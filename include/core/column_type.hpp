#pragma once

#include <cstdint>
#include <string>

namespace sqlgateway {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, MySQL field types, ODBC SQL types).
 * The result normalizer decides the JSON representation of a value from it.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,
    INTERVAL,

    // Binary
    BLOB,

    // JSON
    JSON,
    JSONB,

    UUID,
    INET,
    MONEY,
    XML,
    ARRAY,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

/**
 * @brief Extended column type info carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID, MySQL field type or ODBC SQL type
    std::string vendor_type_name;      // "int4", "BIT", "nvarchar", etc.
    uint32_t length = 0;               // Declared length where the driver reports one

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname, uint32_t len = 0)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)), length(len) {}
};

[[nodiscard]] inline bool is_integer_type(GenericColumnType type) {
    return type == GenericColumnType::SMALLINT ||
           type == GenericColumnType::INTEGER ||
           type == GenericColumnType::BIGINT;
}

[[nodiscard]] inline bool is_floating_type(GenericColumnType type) {
    return type == GenericColumnType::REAL ||
           type == GenericColumnType::DOUBLE_PRECISION;
}

} // namespace sqlgateway
