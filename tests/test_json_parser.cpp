/**
 * @file test_json_parser.cpp
 * @brief shell / strict 文本 -> 文档 解析器单元测试
 */

#include "bsonx/bson/decimal128.hpp"
#include "bsonx/bson/defaults.hpp"
#include "bsonx/bson/object_id.hpp"
#include "bsonx/core/error.hpp"
#include "bsonx/json/lexer.hpp"
#include "bsonx/json/parser.hpp"
#include "bsonx/json/writer.hpp"

#include "test_main.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

using namespace bsonx::json;
using bsonx::bson::Binary;
using bsonx::bson::binary_subtype;
using bsonx::bson::byte;
using bsonx::bson::Document;
using bsonx::bson::Guid;
using bsonx::bson::GuidRepresentation;
using bsonx::bson::GuidRepresentationMode;
using bsonx::bson::Value;

constexpr const char* kGuidText = "01020304-0506-0708-090a-0b0c0d0e0f10";

Guid sample_guid() {
  Guid g;
  TEST_EXPECT_OK(Guid::parse(kGuidText, g));
  return g;
}

// 解析单值并检查成功
Value value_of(std::string_view text, const ReaderSettings& settings = ReaderSettings{}) {
  auto result = parse_value(text, settings);
  if (result.ec) {
    TEST_FAIL(std::string("parse failed: ") + std::string(text) + " -> " + result.error_message);
  }
  return result.value;
}

std::error_code error_of(std::string_view text, const ReaderSettings& settings = ReaderSettings{}) {
  return parse(text, settings).ec;
}

// ============================================================================
// 基本结构
// ============================================================================

void test_parse_plain_document() {
  auto result = parse(R"({ "a" : 1, 'b' : "two", c : [true, false, null], "d" : { }, e : -2.5 })");
  TEST_EXPECT_OK(result.ec);

  Document expected;
  expected.append("a", Value::int32(1))
      .append("b", Value::string("two"))
      .append("c", Value::array({Value::boolean(true), Value::boolean(false), Value::null()}))
      .append("d", Value::document(Document{}))
      .append("e", Value::double_(-2.5));
  TEST_EXPECT(result.document == expected);

  TEST_EXPECT_OK(parse("{}").ec);
  TEST_EXPECT(parse("{}").document.empty());
}

void test_parse_numbers() {
  TEST_EXPECT(value_of("2147483647") == Value::int32(2147483647));
  TEST_EXPECT(value_of("2147483648") == Value::int64(2147483648LL));
  TEST_EXPECT(value_of("1e3") == Value::double_(1000.0));
  TEST_EXPECT(value_of("-Infinity") == Value::double_(-std::numeric_limits<double>::infinity()));

  const auto nan = value_of("NaN");
  TEST_EXPECT(nan.is<bsonx::bson::Double>());
  TEST_EXPECT(std::isnan(nan.get_if<bsonx::bson::Double>()->value));
}

void test_parse_shell_literals() {
  TEST_EXPECT(value_of("undefined") == Value(bsonx::bson::Undefined{}));
  TEST_EXPECT(value_of("MinKey") == Value(bsonx::bson::MinKey{}));
  TEST_EXPECT(value_of("MaxKey()") == Value(bsonx::bson::MaxKey{}));
  TEST_EXPECT(value_of("/a\\/b/gi") == Value::regex("a/b", "gi"));
  TEST_EXPECT(value_of("/\\d\\\\/") == Value::regex("\\d\\\\", ""));
  TEST_EXPECT(value_of(R"(RegExp("a", "i"))") == Value::regex("a", "i"));
  TEST_EXPECT(value_of(R"(RegExp("a"))") == Value::regex("a", ""));
}

// ============================================================================
// shell 构造函数
// ============================================================================

void test_parse_constructors() {
  bsonx::bson::ObjectId oid;
  TEST_EXPECT_OK(bsonx::bson::ObjectId::parse("0102030405060708090a0b0c", oid));
  TEST_EXPECT(value_of(R"(ObjectId("0102030405060708090a0b0c"))") == Value(oid));
  TEST_EXPECT(value_of(R"(new ObjectId("0102030405060708090a0b0c"))") == Value(oid));

  TEST_EXPECT(value_of(R"(ISODate("1970-01-01T00:00:00Z"))") == Value::date_time(0));
  TEST_EXPECT(value_of(R"(ISODate("2000-01-01T00:00:00.5Z"))") == Value::date_time(946684800500LL));
  TEST_EXPECT(value_of(R"(ISODate("1970-01-01T01:00:00+01:00"))") == Value::date_time(0));
  TEST_EXPECT(value_of(R"(ISODate("1970-01-01T00:00Z"))") == Value::date_time(0));
  TEST_EXPECT(value_of("new Date(1000)") == Value::date_time(1000));
  TEST_EXPECT(value_of("Date(-5)") == Value::date_time(-5));
  TEST_EXPECT(value_of(R"(Date("1970-01-01T00:00:01Z"))") == Value::date_time(1000));

  TEST_EXPECT(value_of("NumberLong(5)") == Value::int64(5));
  TEST_EXPECT(value_of(R"(NumberLong("-9223372036854775808"))") ==
              Value::int64(std::numeric_limits<std::int64_t>::min()));
  TEST_EXPECT(value_of("NumberInt(7)") == Value::int32(7));
  TEST_EXPECT(value_of(R"(NumberInt("7"))") == Value::int32(7));

  bsonx::bson::Decimal128 dec;
  TEST_EXPECT_OK(bsonx::bson::Decimal128::parse("1.5", dec));
  TEST_EXPECT(value_of(R"(NumberDecimal("1.5"))") == Value(dec));
  TEST_EXPECT(value_of("NumberDecimal(1.5)") == Value(dec));

  TEST_EXPECT(value_of("Timestamp(1, 2)") == Value(bsonx::bson::Timestamp(1, 2)));
  TEST_EXPECT(value_of("Timestamp(-1, 3)") == Value(bsonx::bson::Timestamp(0xFFFFFFFFu, 3)));
  TEST_EXPECT(value_of("Timestamp(4294967295, 0)") == Value(bsonx::bson::Timestamp(0xFFFFFFFFu, 0)));

  TEST_EXPECT(value_of(R"(new BinData(0, "AQID"))") == Value(Binary(std::vector<byte>{1, 2, 3})));
  TEST_EXPECT(value_of(R"(HexData(0, "010203"))") == Value(Binary(std::vector<byte>{1, 2, 3})));
  TEST_EXPECT(value_of(R"(HexData(128, "ff"))") ==
              Value(Binary(std::vector<byte>{0xFF}, static_cast<binary_subtype>(0x80))));
}

void test_parse_constructor_errors() {
  TEST_EXPECT_EQ(error_of(R"({ a : ObjectId("zz") })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of("{ a : Date() }"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of("{ a : Date(1.5) }"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of("{ a : NumberInt(5000000000) }"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : NumberLong("1x") })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : ISODate("2000-13-01T00:00:00Z") })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : HexData(4, "0102") })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : HexData(256, "01") })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : BinData(0, "A") })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of("{ a : Timestamp(4294967296, 0) }"), make_error_code(parser_errc::invalid_literal));

  TEST_EXPECT_EQ(error_of("{ a : Foo(1) }"), make_error_code(parser_errc::unknown_constructor));
  TEST_EXPECT_EQ(error_of("{ a : new Foo }"), make_error_code(parser_errc::unknown_constructor));
  TEST_EXPECT_EQ(error_of("{ a : foo }"), make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of("{ a : ObjectId(1) }"), make_error_code(parser_errc::unexpected_token));
}

// ============================================================================
// $ 包装对象
// ============================================================================

void test_parse_wrappers() {
  bsonx::bson::ObjectId oid;
  TEST_EXPECT_OK(bsonx::bson::ObjectId::parse("0102030405060708090a0b0c", oid));
  TEST_EXPECT(value_of(R"({ "$oid" : "0102030405060708090a0b0c" })") == Value(oid));

  const Value bin(Binary(std::vector<byte>{1, 2, 3}));
  TEST_EXPECT(value_of(R"({ "$binary" : "AQID", "$type" : "00" })") == bin);
  TEST_EXPECT(value_of(R"({ "$binary" : "AQID", "$type" : "0" })") == bin);
  TEST_EXPECT(value_of(R"({ "$binary" : { "base64" : "AQID", "subType" : "00" } })") == bin);
  TEST_EXPECT(value_of(R"({ "$binary" : { "subType" : "00", "base64" : "AQID" } })") == bin);

  TEST_EXPECT(value_of(R"({ "$date" : 5 })") == Value::date_time(5));
  TEST_EXPECT(value_of(R"({ "$date" : 5000000000 })") == Value::date_time(5000000000LL));
  TEST_EXPECT(value_of(R"({ "$date" : "1970-01-01T00:00:00.001Z" })") == Value::date_time(1));
  TEST_EXPECT(value_of(R"({ "$date" : { "$numberLong" : "-7" } })") == Value::date_time(-7));

  TEST_EXPECT(value_of(R"({ "$numberLong" : "5" })") == Value::int64(5));
  TEST_EXPECT(value_of(R"({ "$numberInt" : "7" })") == Value::int32(7));
  TEST_EXPECT(value_of(R"({ "$numberDouble" : "1.5" })") == Value::double_(1.5));
  TEST_EXPECT(value_of(R"({ "$numberDouble" : "-Infinity" })") ==
              Value::double_(-std::numeric_limits<double>::infinity()));

  bsonx::bson::Decimal128 dec;
  TEST_EXPECT_OK(bsonx::bson::Decimal128::parse("1.5", dec));
  TEST_EXPECT(value_of(R"({ "$numberDecimal" : "1.5" })") == Value(dec));

  TEST_EXPECT(value_of(R"({ "$timestamp" : { "t" : 1, "i" : 2 } })") == Value(bsonx::bson::Timestamp(1, 2)));
  TEST_EXPECT(value_of(R"({ "$timestamp" : { "i" : 2, "t" : 1 } })") == Value(bsonx::bson::Timestamp(1, 2)));

  TEST_EXPECT(value_of(R"({ "$regex" : "a", "$options" : "i" })") == Value::regex("a", "i"));
  TEST_EXPECT(value_of(R"({ "$regex" : "a" })") == Value::regex("a", ""));
  TEST_EXPECT(value_of(R"({ "$regularExpression" : { "pattern" : "a", "options" : "i" } })") == Value::regex("a", "i"));

  TEST_EXPECT(value_of(R"({ "$minKey" : 1 })") == Value(bsonx::bson::MinKey{}));
  TEST_EXPECT(value_of(R"({ "$maxKey" : 1 })") == Value(bsonx::bson::MaxKey{}));
  TEST_EXPECT(value_of(R"({ "$undefined" : true })") == Value(bsonx::bson::Undefined{}));
  TEST_EXPECT(value_of(R"({ "$symbol" : "s" })") == Value(bsonx::bson::Symbol{"s"}));
  TEST_EXPECT(value_of(R"~({ "$code" : "f()" })~") == Value(bsonx::bson::JavaScript{"f()"}));

  Document scope;
  scope.append("x", Value::int32(1));
  TEST_EXPECT(value_of(R"~({ "$code" : "f()", "$scope" : { "x" : 1 } })~") ==
              Value(bsonx::bson::JavaScriptWithScope{"f()", scope}));
}

void test_query_operators_stay_documents() {
  // { $regex : /.../ } 与未知的 $ 键按普通文档处理
  auto a = value_of(R"({ "$regex" : /a/i })");
  TEST_EXPECT(a.is<Document>());
  TEST_EXPECT(a.get_if<Document>()->find("$regex") != nullptr);

  auto b = value_of("{ $gt : 5 }");
  TEST_EXPECT(b.is<Document>());
  TEST_EXPECT(*b.get_if<Document>()->find("$gt") == Value::int32(5));
}

void test_wrapper_errors() {
  TEST_EXPECT_EQ(error_of(R"({ a : { "$minKey" : 2 } })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$undefined" : false } })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$binary" : "AQID", "$type" : "xyz" } })"),
                 make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$binary" : "AQID", "$kind" : "00" } })"),
                 make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$oid" : "0102030405060708090a0b0c", "x" : 1 } })"),
                 make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$date" : 1.5 } })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$numberInt" : "5000000000" } })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$numberDouble" : "abc" } })"), make_error_code(parser_errc::invalid_literal));
  TEST_EXPECT_EQ(error_of(R"({ a : { "$timestamp" : { "t" : 1, "x" : 2 } } })"),
                 make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of(R"~({ a : { "$code" : "f()", "$other" : { } } })~"),
                 make_error_code(parser_errc::unexpected_token));
}

// ============================================================================
// 标识符
// ============================================================================

void test_parse_guids_v2() {
  ReaderSettings settings;
  TEST_EXPECT_OK(settings.set_guid_representation_mode(GuidRepresentationMode::v2));
  TEST_EXPECT_OK(settings.set_guid_representation(GuidRepresentation::csharp_legacy));

  struct Case {
    const char* constructor;
    GuidRepresentation representation;
  };
  const Case cases[] = {
    {"UUID", GuidRepresentation::standard},
    {"GUID", GuidRepresentation::standard},
    {"CSUUID", GuidRepresentation::csharp_legacy},
    {"CSGUID", GuidRepresentation::csharp_legacy},
    {"JUUID", GuidRepresentation::java_legacy},
    {"JGUID", GuidRepresentation::java_legacy},
    {"PYUUID", GuidRepresentation::python_legacy},
    {"PYGUID", GuidRepresentation::python_legacy},
  };
  for (const auto& c : cases) {
    Binary expected;
    TEST_EXPECT_OK(Binary::from_guid(sample_guid(), c.representation, expected));
    const auto text = std::string(c.constructor) + "(\"" + kGuidText + "\")";
    TEST_EXPECT(value_of(text, settings) == Value(expected));
  }

  Binary standard;
  TEST_EXPECT_OK(Binary::from_guid(sample_guid(), GuidRepresentation::standard, standard));
  TEST_EXPECT(value_of(R"({ "$uuid" : "01020304-0506-0708-090a-0b0c0d0e0f10" })", settings) == Value(standard));

  // v2：HexData(3, ...) 按 settings 的表示法标记
  const auto hex = value_of(R"(HexData(3, "0102030405060708090a0b0c0d0e0f10"))", settings);
  TEST_EXPECT(hex.get_if<Binary>()->guid_representation() == GuidRepresentation::csharp_legacy);

  TEST_EXPECT_EQ(parse_value(R"(UUID("not-a-guid"))", settings).ec, make_error_code(parser_errc::invalid_literal));
}

void test_parse_guids_v3() {
  ReaderSettings settings;
  TEST_EXPECT_OK(settings.set_guid_representation_mode(GuidRepresentationMode::v3));

  // legacy 构造函数：字节按表示法排列，但不做标记
  Guid::bytes_type packed{};
  TEST_EXPECT_OK(bsonx::bson::guid_to_bytes(sample_guid(), GuidRepresentation::java_legacy, packed));
  Binary expected;
  TEST_EXPECT_OK(Binary::create(binary_subtype::uuid_legacy,
                                std::vector<byte>(packed.begin(), packed.end()),
                                GuidRepresentation::unspecified,
                                expected));
  TEST_EXPECT(value_of(std::string("JUUID(\"") + kGuidText + "\")", settings) == Value(expected));

  const auto hex = value_of(R"(HexData(3, "0102030405060708090a0b0c0d0e0f10"))", settings);
  TEST_EXPECT(hex.get_if<Binary>()->guid_representation() == GuidRepresentation::unspecified);

  const auto std_uuid = value_of(std::string("UUID(\"") + kGuidText + "\")", settings);
  TEST_EXPECT(std_uuid.get_if<Binary>()->subtype() == binary_subtype::uuid_standard);
  TEST_EXPECT(std_uuid.get_if<Binary>()->guid_representation() == GuidRepresentation::standard);
}

// ============================================================================
// 错误定位、深度
// ============================================================================

void test_error_positions() {
  auto result = parse(R"({ "a" : 1,, })");
  TEST_EXPECT_EQ(result.ec, make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(result.error_line, 1u);
  TEST_EXPECT_EQ(result.error_column, 11u);
  TEST_EXPECT_EQ(result.error_offset, 10u);
  TEST_EXPECT(!result.error_message.empty());
  TEST_EXPECT(result.document.empty());

  auto multi = parse("{\n  \"a\" : 1\n  \"b\" : 2\n}");
  TEST_EXPECT_EQ(multi.ec, make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(multi.error_line, 3u);
  TEST_EXPECT_EQ(multi.error_column, 3u);

  // 词法错误原样透传
  auto lexed = parse(R"({ "a)");
  TEST_EXPECT_EQ(lexed.ec, make_error_code(lexer_errc::unterminated_string));
  TEST_EXPECT_EQ(lexed.error_column, 3u);

  TEST_EXPECT_EQ(error_of("{ } x"), make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of("[1]"), make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of(""), make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of("{ a : 1 "), make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of("{ 1 : 1 }"), make_error_code(parser_errc::unexpected_token));
  TEST_EXPECT_EQ(error_of("{ a : [1 2] }"), make_error_code(parser_errc::unexpected_token));

  TEST_EXPECT_EQ(std::string(parser_error_category().name()), std::string("bsonx.json.parser"));
}

void test_depth_limit() {
  ReaderSettings settings;
  TEST_EXPECT_OK(settings.set_max_depth(2));

  TEST_EXPECT_OK(parse("{ a : { b : 1 } }", settings).ec);
  TEST_EXPECT_OK(parse("{ a : [1] }", settings).ec);
  TEST_EXPECT_EQ(parse("{ a : { b : { } } }", settings).ec, make_error_code(parser_errc::max_depth_exceeded));
  TEST_EXPECT_EQ(parse("{ a : [[1]] }", settings).ec, make_error_code(parser_errc::max_depth_exceeded));

  // $ 包装对象本身不增加文档层数
  TEST_EXPECT_OK(parse(R"({ a : { "$oid" : "0102030405060708090a0b0c" } })", settings).ec);

  const auto frozen = settings.frozen_copy();
  auto copy = frozen;
  TEST_EXPECT_EQ(copy.set_max_depth(10), bsonx::core::make_error_code(bsonx::core::errc::settings_frozen));
  TEST_EXPECT_EQ(copy.max_depth(), 2u);
}

// ============================================================================
// 与 writer 互通
// ============================================================================

void test_shell_round_trip() {
  bsonx::bson::ScopedGuidRepresentationMode mode(GuidRepresentationMode::v2, GuidRepresentation::csharp_legacy);

  bsonx::bson::ObjectId oid;
  TEST_EXPECT_OK(bsonx::bson::ObjectId::parse("5f1d7a8b9c0d1e2f30415263", oid));
  bsonx::bson::Decimal128 dec;
  TEST_EXPECT_OK(bsonx::bson::Decimal128::parse("-12.75", dec));
  Binary guid;
  TEST_EXPECT_OK(Binary::from_guid(sample_guid(), GuidRepresentation::csharp_legacy, guid));
  Document scope;
  scope.append("n", Value::int64(9000000000LL));

  Document doc;
  doc.append("d", Value::double_(2.0))
      .append("s", Value::string("line\n\"q\""))
      .append("oid", Value(oid))
      .append("b", Value::boolean(false))
      .append("dt", Value::date_time(1234567890123LL))
      .append("n", Value::null())
      .append("re", Value::regex("^a.*", "im"))
      .append("i", Value::int32(-3))
      .append("ts", Value(bsonx::bson::Timestamp(7, 8)))
      .append("l", Value::int64(42))
      .append("dec", Value(dec))
      .append("min", Value(bsonx::bson::MinKey{}))
      .append("max", Value(bsonx::bson::MaxKey{}))
      .append("u", Value(bsonx::bson::Undefined{}))
      .append("bin", Value(Binary(std::vector<byte>{0, 255, 16}, binary_subtype::user_defined)))
      .append("guid", Value(guid))
      .append("js", Value(bsonx::bson::JavaScript{"return 1;"}))
      .append("sym", Value(bsonx::bson::Symbol{"sym"}))
      .append("jsws", Value(bsonx::bson::JavaScriptWithScope{"f(n)", scope}))
      .append("arr", Value::array({Value::int32(1), Value::document(Document{})}));

  WriterSettings writer_settings;
  TEST_EXPECT_OK(writer_settings.set_indent(true));
  const auto text = to_json(doc, writer_settings);
  TEST_EXPECT(!text.empty());

  auto result = parse(text);
  TEST_EXPECT_OK(result.ec);
  TEST_EXPECT(result.document == doc);
}

void test_regex_and_unicode_round_trip() {
  Document doc;
  doc.append("slash", Value::regex("a/b", "i"))
      .append("escaped_backslash", Value::regex("a\\\\/b", ""))
      .append("escaped_slash", Value::regex("x\\/y", ""))
      .append("trailing_backslash", Value::regex("a\\", "m"))
      .append("newline", Value::regex("a\nb", ""))
      .append("empty", Value::regex("", ""))
      .append("separators", Value::string("a" "\xE2\x80\xA8" "b" "\xE2\x80\xA9"))
      .append("format", Value::string("\xEF\xBB\xBF" "x" "\xC2\x85"))
      .append("private_use", Value::string("\xEE\x80\x80" "\xF3\xB0\x80\x80"))
      .append("printable", Value::string("\xC3\xA9" "\xE4\xB8\xAD" "\xF0\x9F\x98\x80"));

  const auto text = to_json(doc);
  TEST_EXPECT(!text.empty());
  TEST_EXPECT(text.find(R"("slash" : /a\/b/i)") != std::string::npos);
  TEST_EXPECT(text.find(R"("separators" : "a\u2028b\u2029")") != std::string::npos);

  auto result = parse(text);
  TEST_EXPECT_OK(result.ec);
  TEST_EXPECT(result.document == doc);
}

}  // namespace

int main() {
  test_parse_plain_document();
  test_parse_numbers();
  test_parse_shell_literals();
  test_parse_constructors();
  test_parse_constructor_errors();
  test_parse_wrappers();
  test_query_operators_stay_documents();
  test_wrapper_errors();
  test_parse_guids_v2();
  test_parse_guids_v3();
  test_error_positions();
  test_depth_limit();
  test_shell_round_trip();
  test_regex_and_unicode_round_trip();
  return ::bsonx::tests::run_and_report();
}
