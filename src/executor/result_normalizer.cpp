#include "executor/result_normalizer.hpp"
#include "core/utils.hpp"
#include <charconv>
#include <cmath>
#include <unordered_set>

namespace sqlgateway {

namespace {

std::optional<double> parse_double(std::string_view sv) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_bool(std::string_view sv) {
    // MySQL BIT(1) arrives as a single raw byte
    if (sv.size() == 1 && (sv[0] == '\x01' || sv[0] == '\x00')) {
        return sv[0] == '\x01';
    }
    if (sv == "t" || sv == "1" || utils::iequals(sv, "true")) return true;
    if (sv == "f" || sv == "0" || utils::iequals(sv, "false")) return false;
    return std::nullopt;
}

} // anonymous namespace

CellValue ResultNormalizer::normalize_value(const std::optional<std::string>& raw,
                                            const ColumnTypeInfo& type) {
    if (!raw) {
        return std::monostate{};
    }
    const std::string& value = *raw;

    if (is_integer_type(type.generic_type)) {
        if (auto parsed = utils::try_parse_int<int64_t>(value)) {
            return *parsed;
        }
        return value;
    }

    if (is_floating_type(type.generic_type)) {
        if (auto parsed = parse_double(value); parsed && std::isfinite(*parsed)) {
            return *parsed;
        }
        return value;
    }

    switch (type.generic_type) {
        case GenericColumnType::BOOLEAN:
            if (auto parsed = parse_bool(value)) {
                return *parsed;
            }
            return value;

        case GenericColumnType::BLOB:
            // PostgreSQL bytea is already rendered as \x... text
            if (type.vendor_type_name == "bytea") {
                return value;
            }
            return to_hex(value);

        default:
            return value;
    }
}

Recordset ResultNormalizer::normalize(const DbResultSet& result) {
    Recordset recordset;
    recordset.columns = result.column_names;
    recordset.rows.reserve(result.rows.size());

    static const ColumnTypeInfo kUnknownType;

    for (const auto& row : result.rows) {
        std::vector<CellValue> cells;
        cells.reserve(row.size());
        for (size_t i = 0; i < row.size(); ++i) {
            const ColumnTypeInfo& type = i < result.column_types.size()
                ? result.column_types[i] : kUnknownType;
            cells.push_back(normalize_value(row[i], type));
        }
        recordset.rows.push_back(std::move(cells));
    }

    return recordset;
}

std::vector<std::string> ResultNormalizer::unique_column_names(
    const std::vector<std::string>& columns) {

    std::vector<std::string> names;
    names.reserve(columns.size());
    std::unordered_set<std::string> used;

    for (const auto& column : columns) {
        std::string name = column;
        for (size_t n = 2; used.contains(name); ++n) {
            name = column + "_" + std::to_string(n);
        }
        used.insert(name);
        names.push_back(std::move(name));
    }
    return names;
}

nlohmann::ordered_json ResultNormalizer::cell_to_json(const CellValue& cell) {
    return std::visit([](const auto& v) -> nlohmann::ordered_json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, cell);
}

nlohmann::ordered_json ResultNormalizer::to_json(const Recordset& recordset) {
    const auto names = unique_column_names(recordset.columns);

    auto rows = nlohmann::ordered_json::array();
    for (const auto& row : recordset.rows) {
        auto object = nlohmann::ordered_json::object();
        for (size_t i = 0; i < row.size() && i < names.size(); ++i) {
            object[names[i]] = cell_to_json(row[i]);
        }
        rows.push_back(std::move(object));
    }
    return rows;
}

std::string ResultNormalizer::to_hex(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(2 + bytes.size() * 2);
    hex += "0x";
    for (const char c : bytes) {
        const auto b = static_cast<unsigned char>(c);
        hex += kDigits[b >> 4];
        hex += kDigits[b & 0x0F];
    }
    return hex;
}

std::string ResultNormalizer::serialize(const nlohmann::ordered_json& json) {
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace sqlgateway
