#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgateway {

/**
 * @brief Converts driver rows into the uniform typed recordset
 *
 * Column and row order are preserved exactly. Text is never decoded:
 * JSON, XML, UUID and date/time columns come back as the backend's string.
 */
class ResultNormalizer {
public:
    [[nodiscard]] static Recordset normalize(const DbResultSet& result);

    /**
     * @brief Normalize one cell according to its column type
     */
    [[nodiscard]] static CellValue normalize_value(const std::optional<std::string>& raw,
                                                   const ColumnTypeInfo& type);

    /**
     * @brief Row objects keyed by column name, in column order
     *
     * Duplicate column names get a numeric suffix (name, name_2, ...).
     */
    [[nodiscard]] static nlohmann::ordered_json to_json(const Recordset& recordset);

    [[nodiscard]] static nlohmann::ordered_json cell_to_json(const CellValue& cell);

    /**
     * @brief Make column names unique by suffixing repeats with _2, _3, ...
     */
    [[nodiscard]] static std::vector<std::string> unique_column_names(
        const std::vector<std::string>& columns);

    /**
     * @brief "0x" followed by lowercase hex digits
     */
    [[nodiscard]] static std::string to_hex(std::string_view bytes);

    /**
     * @brief Serialize, replacing invalid UTF-8 rather than throwing
     */
    [[nodiscard]] static std::string serialize(const nlohmann::ordered_json& json);
};

} // namespace sqlgateway
