#include <catch2/catch_test_macros.hpp>
#include "executor/result_normalizer.hpp"
#include "mocks/mock_database.hpp"

using namespace sqlgateway;
using sqlgateway::testing::ok_rows;

namespace {

const ColumnTypeInfo kInt{GenericColumnType::INTEGER, 23, "int4"};
const ColumnTypeInfo kBigint{GenericColumnType::BIGINT, 20, "int8"};
const ColumnTypeInfo kDouble{GenericColumnType::DOUBLE_PRECISION, 701, "float8"};
const ColumnTypeInfo kNumeric{GenericColumnType::NUMERIC, 1700, "numeric"};
const ColumnTypeInfo kText{GenericColumnType::TEXT, 25, "text"};
const ColumnTypeInfo kBool{GenericColumnType::BOOLEAN, 16, "bool"};
const ColumnTypeInfo kBit{GenericColumnType::BOOLEAN, 16, "BIT"};
const ColumnTypeInfo kVarbinary{GenericColumnType::BLOB, 252, "varbinary"};
const ColumnTypeInfo kBytea{GenericColumnType::BLOB, 17, "bytea"};
const ColumnTypeInfo kTimestamp{GenericColumnType::TIMESTAMP, 1114, "timestamp"};

CellValue norm(std::optional<std::string> raw, const ColumnTypeInfo& type) {
    return ResultNormalizer::normalize_value(raw, type);
}

} // anonymous namespace

TEST_CASE("ResultNormalizer: SQL NULL becomes null for every type", "[normalizer]") {
    for (const auto* type : {&kInt, &kDouble, &kText, &kBool, &kVarbinary, &kTimestamp}) {
        CHECK(std::holds_alternative<std::monostate>(norm(std::nullopt, *type)));
    }
}

TEST_CASE("ResultNormalizer: integer columns become numbers", "[normalizer]") {
    CHECK(norm("42", kInt) == CellValue{int64_t{42}});
    CHECK(norm("-7", kInt) == CellValue{int64_t{-7}});
    CHECK(norm("9223372036854775807", kBigint) == CellValue{int64_t{9223372036854775807LL}});
    // Out of range stays text
    CHECK(norm("99999999999999999999", kBigint) == CellValue{std::string("99999999999999999999")});
}

TEST_CASE("ResultNormalizer: floating columns become numbers", "[normalizer]") {
    CHECK(norm("1.5", kDouble) == CellValue{1.5});
    CHECK(norm("NaN", kDouble) == CellValue{std::string("NaN")});
    CHECK(norm("Infinity", kDouble) == CellValue{std::string("Infinity")});
}

TEST_CASE("ResultNormalizer: exact numerics keep their text", "[normalizer]") {
    CHECK(norm("12345678901234567890.123456789", kNumeric) ==
          CellValue{std::string("12345678901234567890.123456789")});
}

TEST_CASE("ResultNormalizer: boolean spellings of every backend", "[normalizer]") {
    CHECK(norm("t", kBool) == CellValue{true});
    CHECK(norm("f", kBool) == CellValue{false});
    CHECK(norm("1", kBit) == CellValue{true});
    CHECK(norm("0", kBit) == CellValue{false});
    CHECK(norm("TRUE", kBool) == CellValue{true});
    CHECK(norm(std::string(1, '\x01'), kBit) == CellValue{true});
    CHECK(norm(std::string(1, '\x00'), kBit) == CellValue{false});
    CHECK(norm("maybe", kBool) == CellValue{std::string("maybe")});
}

TEST_CASE("ResultNormalizer: binary becomes 0x hex text", "[normalizer]") {
    CHECK(norm(std::string("\x00\xff\x10", 3), kVarbinary) == CellValue{std::string("0x00ff10")});
    CHECK(norm("", kVarbinary) == CellValue{std::string("0x")});
    CHECK(norm("\\xdeadbeef", kBytea) == CellValue{std::string("\\xdeadbeef")});
}

TEST_CASE("ResultNormalizer: temporal and text values pass through verbatim", "[normalizer]") {
    CHECK(norm("2024-01-02 03:04:05", kTimestamp) == CellValue{std::string("2024-01-02 03:04:05")});
    CHECK(norm("héllo", kText) == CellValue{std::string("héllo")});
}

TEST_CASE("ResultNormalizer: normalize keeps column and row order", "[normalizer]") {
    const auto rs = ok_rows({"id", "name"}, {kInt, kText},
                            {{"2", "b"}, {"1", std::nullopt}});
    const Recordset r = ResultNormalizer::normalize(rs);

    CHECK(r.columns == std::vector<std::string>{"id", "name"});
    REQUIRE(r.rows.size() == 2);
    CHECK(r.rows[0][0] == CellValue{int64_t{2}});
    CHECK(r.rows[0][1] == CellValue{std::string("b")});
    CHECK(r.rows[1][0] == CellValue{int64_t{1}});
    CHECK(std::holds_alternative<std::monostate>(r.rows[1][1]));
}

TEST_CASE("ResultNormalizer: duplicate column names get suffixes", "[normalizer]") {
    CHECK(ResultNormalizer::unique_column_names({"id", "id", "name", "id"}) ==
          std::vector<std::string>{"id", "id_2", "name", "id_3"});
    CHECK(ResultNormalizer::unique_column_names({"a", "a_2", "a"}) ==
          std::vector<std::string>{"a", "a_2", "a_3"});
}

TEST_CASE("ResultNormalizer: to_json emits ordered row objects", "[normalizer]") {
    Recordset r;
    r.columns = {"z", "a", "z"};
    r.rows = {{int64_t{1}, std::string("x"), std::monostate{}}};

    const auto json = ResultNormalizer::to_json(r);
    REQUIRE(json.is_array());
    REQUIRE(json.size() == 1);
    CHECK(ResultNormalizer::serialize(json) == R"([{"z":1,"a":"x","z_2":null}])");
}

TEST_CASE("ResultNormalizer: empty recordset is an empty array", "[normalizer]") {
    CHECK(ResultNormalizer::serialize(ResultNormalizer::to_json(Recordset{})) == "[]");
}

TEST_CASE("ResultNormalizer: serialize replaces invalid UTF-8", "[normalizer]") {
    nlohmann::ordered_json j = std::string("bad\xff");
    CHECK_NOTHROW((void)ResultNormalizer::serialize(j));
}
