#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace sqlgateway {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps PG type OIDs (as reported by PQftype) to GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type, UNKNOWN for unmapped OIDs
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Canonical type name for a built-in OID ("int4", "bytea", ...)
     * @return Name, or empty string if the OID is not built-in
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);

    /**
     * @brief Build a full ColumnTypeInfo from a column OID
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(uint32_t oid);
};

} // namespace sqlgateway
