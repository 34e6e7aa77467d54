#include "bsonx/bson/decimal128.hpp"
#include "bsonx/bson/error.hpp"
#include "bsonx/bson/object_id.hpp"
#include "bsonx/bson/types.hpp"

#include "test_main.hpp"

#include <set>
#include <string>
#include <string_view>

namespace {

using bsonx::bson::bson_type;
using bsonx::bson::binary_subtype;
using bsonx::bson::Decimal128;
using bsonx::bson::ObjectId;
using bsonx::bson::errc;
using bsonx::bson::make_error_code;

void test_type_tags() {
  TEST_EXPECT_EQ(static_cast<int>(bson_type::double_), 0x01);
  TEST_EXPECT_EQ(static_cast<int>(bson_type::decimal128), 0x13);
  TEST_EXPECT_EQ(static_cast<int>(bson_type::max_key), 0x7F);
  TEST_EXPECT_EQ(static_cast<int>(bson_type::min_key), 0xFF);

  const auto& all = bsonx::bson::all_bson_types();
  std::set<bson_type> unique(all.begin(), all.end());
  TEST_EXPECT_EQ(unique.size(), all.size());

  for (const auto t : all) {
    const auto round = bsonx::bson::bson_type_from_byte(static_cast<bsonx::bson::byte>(t));
    TEST_EXPECT(round.has_value());
    TEST_EXPECT(round == t);
    TEST_EXPECT(bsonx::bson::bson_type_name(t) != "Unknown");
  }

  // 0x0C (DBPointer) 与 0x00 都不是合法的值标签
  TEST_EXPECT(!bsonx::bson::bson_type_from_byte(0x00).has_value());
  TEST_EXPECT(!bsonx::bson::bson_type_from_byte(0x0C).has_value());
  TEST_EXPECT(!bsonx::bson::bson_type_from_byte(0x14).has_value());
}

void test_type_names() {
  TEST_EXPECT_EQ(bsonx::bson::bson_type_name(bson_type::javascript_with_scope), "JavaScriptWithScope");
  TEST_EXPECT_EQ(bsonx::bson::bson_type_name(bson_type::end_of_document), "EndOfDocument");
  TEST_EXPECT_EQ(bsonx::bson::binary_subtype_name(binary_subtype::uuid_legacy), "UuidLegacy");
  TEST_EXPECT_EQ(bsonx::bson::binary_subtype_name(binary_subtype::user_defined), "UserDefined");
  TEST_EXPECT_EQ(bsonx::bson::binary_subtype_name(static_cast<binary_subtype>(0x42)), "Unknown");

  TEST_EXPECT(bsonx::bson::is_uuid_subtype(binary_subtype::uuid_legacy));
  TEST_EXPECT(bsonx::bson::is_uuid_subtype(binary_subtype::uuid_standard));
  TEST_EXPECT(!bsonx::bson::is_uuid_subtype(binary_subtype::old_binary));
}

void test_object_id() {
  ObjectId oid;
  TEST_EXPECT_OK(ObjectId::parse("5F1A2B3C4D5E6F7081920A0B", oid));
  TEST_EXPECT_EQ(oid.to_string(), "5f1a2b3c4d5e6f7081920a0b");
  TEST_EXPECT_EQ(oid.timestamp(), 0x5F1A2B3Cu);
  TEST_EXPECT_EQ(oid.bytes()[11], 0x0B);

  ObjectId other;
  TEST_EXPECT_OK(ObjectId::parse(oid.to_string(), other));
  TEST_EXPECT(oid == other);

  TEST_EXPECT_EQ(ObjectId::parse("5f1a", oid), make_error_code(errc::invalid_object_id));
  TEST_EXPECT_EQ(ObjectId::parse("zf1a2b3c4d5e6f7081920a0b", oid), make_error_code(errc::invalid_object_id));
  TEST_EXPECT_EQ(ObjectId().to_string(), std::string(24, '0'));
}

void test_decimal128_parse_bits() {
  Decimal128 d;
  TEST_EXPECT_OK(Decimal128::parse("0", d));
  TEST_EXPECT_EQ(d.high_bits(), 0x3040000000000000ull);
  TEST_EXPECT_EQ(d.low_bits(), 0ull);
  TEST_EXPECT(d == Decimal128{});

  TEST_EXPECT_OK(Decimal128::parse("-1", d));
  TEST_EXPECT_EQ(d.high_bits(), 0xB040000000000000ull);
  TEST_EXPECT_EQ(d.low_bits(), 1ull);
  TEST_EXPECT(d.is_negative());

  TEST_EXPECT_OK(Decimal128::parse("1.0", d));
  TEST_EXPECT_EQ(d.high_bits(), 0x303E000000000000ull);
  TEST_EXPECT_EQ(d.low_bits(), 10ull);

  TEST_EXPECT_OK(Decimal128::parse("Infinity", d));
  TEST_EXPECT(d.is_infinity());
  TEST_EXPECT_EQ(d.high_bits(), 0x7800000000000000ull);

  TEST_EXPECT_OK(Decimal128::parse("-inf", d));
  TEST_EXPECT(d.is_infinity());
  TEST_EXPECT(d.is_negative());

  TEST_EXPECT_OK(Decimal128::parse("NaN", d));
  TEST_EXPECT(d.is_nan());
  TEST_EXPECT_EQ(d.high_bits(), 0x7C00000000000000ull);
}

void test_decimal128_to_string() {
  struct Case {
    const char* in;
    const char* out;
  };
  const Case cases[] = {
    {"0", "0"},
    {"-0", "-0"},
    {"1", "1"},
    {"1.0", "1.0"},
    {"0.00", "0.00"},
    {"1E+3", "1E+3"},
    {"12345.678", "12345.678"},
    {"0.001234", "0.001234"},
    {"0.0000001234", "1.234E-7"},
    {"-12.5e2", "-1.25E+3"},
    {"1E-6176", "1E-6176"},
    {"9999999999999999999999999999999999", "9999999999999999999999999999999999"},
    {"-Infinity", "-Infinity"},
    {"nan", "NaN"},
  };
  for (const auto& c : cases) {
    Decimal128 d;
    TEST_EXPECT_OK(Decimal128::parse(c.in, d));
    TEST_EXPECT_EQ(d.to_string(), std::string(c.out));
  }
}

void test_decimal128_rejects_invalid() {
  Decimal128 d;
  const auto invalid = make_error_code(errc::invalid_decimal128);
  TEST_EXPECT_EQ(Decimal128::parse("", d), invalid);
  TEST_EXPECT_EQ(Decimal128::parse("abc", d), invalid);
  TEST_EXPECT_EQ(Decimal128::parse("1.2.3", d), invalid);
  TEST_EXPECT_EQ(Decimal128::parse("1e", d), invalid);
  TEST_EXPECT_EQ(Decimal128::parse("1x", d), invalid);
  // 35 位有效数字且末位非 0：无法无损表示
  TEST_EXPECT_EQ(Decimal128::parse("12345678901234567890123456789012345", d), invalid);
  TEST_EXPECT_EQ(Decimal128::parse("1E+7000", d), invalid);
}

void test_decimal128_equality_is_bitwise() {
  Decimal128 a;
  Decimal128 b;
  TEST_EXPECT_OK(Decimal128::parse("1.0", a));
  TEST_EXPECT_OK(Decimal128::parse("1.00", b));
  TEST_EXPECT(!(a == b));
}

}  // namespace

int main() {
  test_type_tags();
  test_type_names();
  test_object_id();
  test_decimal128_parse_bits();
  test_decimal128_to_string();
  test_decimal128_rejects_invalid();
  test_decimal128_equality_is_bitwise();
  return ::bsonx::tests::run_and_report();
}
