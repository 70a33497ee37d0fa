#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace sqlgateway {

namespace {

struct PgTypeEntry {
    const char* name;
    GenericColumnType generic;
};

// Built-in OIDs from pg_type.dat
const std::unordered_map<uint32_t, PgTypeEntry>& builtin_types() {
    static const std::unordered_map<uint32_t, PgTypeEntry> TYPES = {
        {16,   {"bool", GenericColumnType::BOOLEAN}},
        {17,   {"bytea", GenericColumnType::BLOB}},
        {18,   {"char", GenericColumnType::CHAR}},
        {19,   {"name", GenericColumnType::TEXT}},
        {20,   {"int8", GenericColumnType::BIGINT}},
        {21,   {"int2", GenericColumnType::SMALLINT}},
        {23,   {"int4", GenericColumnType::INTEGER}},
        {25,   {"text", GenericColumnType::TEXT}},
        {26,   {"oid", GenericColumnType::BIGINT}},
        {114,  {"json", GenericColumnType::JSON}},
        {142,  {"xml", GenericColumnType::XML}},
        {650,  {"cidr", GenericColumnType::INET}},
        {700,  {"float4", GenericColumnType::REAL}},
        {701,  {"float8", GenericColumnType::DOUBLE_PRECISION}},
        {790,  {"money", GenericColumnType::MONEY}},
        {869,  {"inet", GenericColumnType::INET}},
        {1042, {"bpchar", GenericColumnType::CHAR}},
        {1043, {"varchar", GenericColumnType::VARCHAR}},
        {1082, {"date", GenericColumnType::DATE}},
        {1083, {"time", GenericColumnType::TIME}},
        {1114, {"timestamp", GenericColumnType::TIMESTAMP}},
        {1184, {"timestamptz", GenericColumnType::TIMESTAMP_TZ}},
        {1186, {"interval", GenericColumnType::INTERVAL}},
        {1266, {"timetz", GenericColumnType::TIME}},
        {1700, {"numeric", GenericColumnType::NUMERIC}},
        {2950, {"uuid", GenericColumnType::UUID}},
        {3802, {"jsonb", GenericColumnType::JSONB}},
        // Common array types: values arrive in PG text form ("{1,2,3}")
        {1000, {"_bool", GenericColumnType::ARRAY}},
        {1005, {"_int2", GenericColumnType::ARRAY}},
        {1007, {"_int4", GenericColumnType::ARRAY}},
        {1009, {"_text", GenericColumnType::ARRAY}},
        {1015, {"_varchar", GenericColumnType::ARRAY}},
        {1016, {"_int8", GenericColumnType::ARRAY}},
        {1021, {"_float4", GenericColumnType::ARRAY}},
        {1022, {"_float8", GenericColumnType::ARRAY}},
        {2277, {"anyarray", GenericColumnType::ARRAY}},
        // Geometric and text-search types
        {600,  {"point", GenericColumnType::VENDOR_SPECIFIC}},
        {601,  {"lseg", GenericColumnType::VENDOR_SPECIFIC}},
        {602,  {"path", GenericColumnType::VENDOR_SPECIFIC}},
        {603,  {"box", GenericColumnType::VENDOR_SPECIFIC}},
        {604,  {"polygon", GenericColumnType::VENDOR_SPECIFIC}},
        {628,  {"line", GenericColumnType::VENDOR_SPECIFIC}},
        {718,  {"circle", GenericColumnType::VENDOR_SPECIFIC}},
        {829,  {"macaddr", GenericColumnType::VENDOR_SPECIFIC}},
        {3614, {"tsvector", GenericColumnType::VENDOR_SPECIFIC}},
        {3615, {"tsquery", GenericColumnType::VENDOR_SPECIFIC}},
    };
    return TYPES;
}

} // anonymous namespace

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    const auto& types = builtin_types();
    auto it = types.find(oid);
    return it != types.end() ? it->second.generic : GenericColumnType::UNKNOWN;
}

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    const auto& types = builtin_types();
    auto it = types.find(oid);
    return it != types.end() ? std::string(it->second.name) : std::string();
}

ColumnTypeInfo PgTypeMap::build_type_info(uint32_t oid) {
    return ColumnTypeInfo(oid_to_generic_type(oid), oid, oid_to_type_name(oid));
}

} // namespace sqlgateway
