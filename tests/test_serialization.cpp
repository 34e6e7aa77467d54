/**
 * @file test_serialization.cpp
 * @brief 字段级 serializer 与 ClassMap 单元测试
 */

#include "bsonx/bson/defaults.hpp"
#include "bsonx/serialization/class_map.hpp"
#include "bsonx/serialization/serializers.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace bsonx::serialization;
using bsonx::bson::Binary;
using bsonx::bson::binary_subtype;
using bsonx::bson::Document;
using bsonx::bson::Guid;
using bsonx::bson::GuidRepresentation;
using bsonx::bson::GuidRepresentationMode;
using bsonx::bson::ScopedGuidRepresentationMode;
using bsonx::bson::Value;

Guid sample_guid() {
  Guid g;
  TEST_EXPECT_OK(Guid::parse("01020304-0506-0708-090a-0b0c0d0e0f10", g));
  return g;
}

// ============================================================================
// 基本类型
// ============================================================================

void test_scalar_serializers() {
  Value v;
  TEST_EXPECT_OK(Int32Serializer{}.serialize(5, v));
  TEST_EXPECT(v == Value::int32(5));

  std::int32_t i = 0;
  TEST_EXPECT_OK(Int32Serializer{}.deserialize(Value::int32(-7), i));
  TEST_EXPECT_EQ(i, -7);
  TEST_EXPECT_EQ(Int32Serializer{}.deserialize(Value::int64(1), i), make_error_code(errc::type_mismatch));

  std::int64_t l = 0;
  TEST_EXPECT_OK(Int64Serializer{}.serialize(1, v));
  TEST_EXPECT(v == Value::int64(1));
  TEST_EXPECT_OK(Int64Serializer{}.deserialize(Value::int32(3), l));
  TEST_EXPECT_EQ(l, 3);
  TEST_EXPECT_EQ(Int64Serializer{}.deserialize(Value::double_(1.0), l), make_error_code(errc::type_mismatch));

  double d = 0;
  TEST_EXPECT_OK(DoubleSerializer{}.deserialize(Value::int64(1LL << 40), d));
  TEST_EXPECT_EQ(d, 1099511627776.0);
  TEST_EXPECT_EQ(DoubleSerializer{}.deserialize(Value::string("1"), d), make_error_code(errc::type_mismatch));

  bool b = false;
  TEST_EXPECT_OK(BooleanSerializer{}.deserialize(Value::boolean(true), b));
  TEST_EXPECT(b);
  TEST_EXPECT_EQ(BooleanSerializer{}.deserialize(Value::int32(1), b), make_error_code(errc::type_mismatch));

  std::string s;
  TEST_EXPECT_OK(StringSerializer{}.serialize("x", v));
  TEST_EXPECT(v == Value::string("x"));
  TEST_EXPECT_EQ(StringSerializer{}.deserialize(Value::null(), s), make_error_code(errc::type_mismatch));
}

// ============================================================================
// Guid
// ============================================================================

void test_guid_serializer_explicit_representation() {
  ScopedGuidRepresentationMode mode(GuidRepresentationMode::v3);

  const GuidSerializer standard(GuidRepresentation::standard);
  Value v;
  TEST_EXPECT_OK(standard.serialize(sample_guid(), v));
  const auto* b = v.get_if<Binary>();
  TEST_EXPECT(b != nullptr);
  TEST_EXPECT(b->subtype() == binary_subtype::uuid_standard);
  TEST_EXPECT_EQ(b->bytes().front(), 0x01);

  Guid back;
  TEST_EXPECT_OK(standard.deserialize(v, back));
  TEST_EXPECT(back == sample_guid());

  // 子类型与 serializer 的表示法不一致
  const GuidSerializer csharp(GuidRepresentation::csharp_legacy);
  TEST_EXPECT_EQ(csharp.deserialize(v, back), make_error_code(errc::type_mismatch));

  TEST_EXPECT_OK(csharp.serialize(sample_guid(), v));
  TEST_EXPECT(v.get_if<Binary>()->subtype() == binary_subtype::uuid_legacy);
  TEST_EXPECT_EQ(v.get_if<Binary>()->bytes().front(), 0x04);
  TEST_EXPECT_OK(csharp.deserialize(v, back));
  TEST_EXPECT(back == sample_guid());

  TEST_EXPECT_EQ(csharp.deserialize(Value::string("x"), back), make_error_code(errc::type_mismatch));
  TEST_EXPECT_EQ(csharp.deserialize(Value(Binary(std::vector<bsonx::bson::byte>{1, 2})), back),
                 make_error_code(errc::type_mismatch));
}

void test_guid_serializer_unspecified() {
  Value v;
  Guid back;
  {
    ScopedGuidRepresentationMode mode(GuidRepresentationMode::v3);
    TEST_EXPECT_EQ(GuidSerializer{}.serialize(sample_guid(), v), make_error_code(errc::unspecified_guid_representation));
  }
  {
    // v2：退回进程默认表示法，读取时优先使用值上的标记
    ScopedGuidRepresentationMode mode(GuidRepresentationMode::v2, GuidRepresentation::java_legacy);
    TEST_EXPECT_OK(GuidSerializer{}.serialize(sample_guid(), v));
    TEST_EXPECT(v.get_if<Binary>()->guid_representation() == GuidRepresentation::java_legacy);
    TEST_EXPECT_OK(GuidSerializer{}.deserialize(v, back));
    TEST_EXPECT(back == sample_guid());
    TEST_EXPECT_OK(GuidSerializer(GuidRepresentation::python_legacy).deserialize(v, back));
    TEST_EXPECT(back == sample_guid());
  }
}

// ============================================================================
// 枚举
// ============================================================================

enum class Flags : std::uint32_t {
  none = 0,
  all = 0xFFFFFFFFu,
};

enum class Small : std::uint8_t {
  a = 1,
  b = 2,
};

enum class Wide : std::int64_t {
  big = 1LL << 40,
};

enum class Color : std::int32_t {
  red = 1,
  green = 2,
};

void test_enum_numeric() {
  Value v;
  TEST_EXPECT_OK(EnumSerializer<Flags>{}.serialize(Flags::all, v));
  TEST_EXPECT(v == Value::int32(-1));
  Flags f = Flags::none;
  TEST_EXPECT_OK(EnumSerializer<Flags>{}.deserialize(Value::int32(-1), f));
  TEST_EXPECT(f == Flags::all);
  TEST_EXPECT_OK(EnumSerializer<Flags>{}.deserialize(Value::int64(4294967295LL), f));
  TEST_EXPECT(f == Flags::all);
  TEST_EXPECT_EQ(EnumSerializer<Flags>{}.deserialize(Value::int64(4294967296LL), f),
                 make_error_code(errc::value_out_of_range));

  TEST_EXPECT_OK(EnumSerializer<Wide>{}.serialize(Wide::big, v));
  TEST_EXPECT(v == Value::int64(1LL << 40));
  TEST_EXPECT_EQ(EnumSerializer<Wide>(EnumRepresentation::int32).serialize(Wide::big, v),
                 make_error_code(errc::value_out_of_range));

  Small s = Small::a;
  TEST_EXPECT_EQ(EnumSerializer<Small>{}.deserialize(Value::int32(300), s), make_error_code(errc::value_out_of_range));
  TEST_EXPECT_OK(EnumSerializer<Small>{}.deserialize(Value::double_(2.9), s));
  TEST_EXPECT(s == Small::b);
  TEST_EXPECT_EQ(EnumSerializer<Small>{}.deserialize(Value::boolean(true), s), make_error_code(errc::type_mismatch));

  const auto as_int64 = EnumSerializer<Small>{}.with_representation(EnumRepresentation::int64);
  TEST_EXPECT(as_int64.representation() == EnumRepresentation::int64);
  TEST_EXPECT_OK(as_int64.serialize(Small::b, v));
  TEST_EXPECT(v == Value::int64(2));
}

void test_enum_names() {
  const EnumSerializer<Color> names(EnumRepresentation::string, {{Color::red, "red"}, {Color::green, "green"}});
  Value v;
  TEST_EXPECT_OK(names.serialize(Color::green, v));
  TEST_EXPECT(v == Value::string("green"));
  TEST_EXPECT_EQ(names.serialize(static_cast<Color>(9), v), make_error_code(errc::unknown_enum_name));

  Color c = Color::red;
  TEST_EXPECT_OK(names.deserialize(Value::string("green"), c));
  TEST_EXPECT(c == Color::green);
  TEST_EXPECT_OK(names.deserialize(Value::int32(1), c));
  TEST_EXPECT(c == Color::red);
  TEST_EXPECT_EQ(names.deserialize(Value::string("blue"), c), make_error_code(errc::unknown_enum_name));
}

// ============================================================================
// 容器
// ============================================================================

void test_vector_and_optional() {
  using IntVector = DefaultSerializer<std::vector<std::int32_t>>::type;
  Value v;
  TEST_EXPECT_OK(IntVector{}.serialize({1, 2, 3}, v));
  TEST_EXPECT(v == Value::array({Value::int32(1), Value::int32(2), Value::int32(3)}));

  std::vector<std::int32_t> out{9};
  TEST_EXPECT_OK(IntVector{}.deserialize(v, out));
  TEST_EXPECT(out == (std::vector<std::int32_t>{1, 2, 3}));

  // 元素失败时 out 保持原值
  std::vector<std::int32_t> kept{9};
  TEST_EXPECT_EQ(IntVector{}.deserialize(Value::array({Value::int32(1), Value::string("x")}), kept),
                 make_error_code(errc::type_mismatch));
  TEST_EXPECT(kept == (std::vector<std::int32_t>{9}));
  TEST_EXPECT_EQ(IntVector{}.deserialize(Value::int32(1), kept), make_error_code(errc::type_mismatch));

  using OptString = DefaultSerializer<std::optional<std::string>>::type;
  TEST_EXPECT_OK(OptString{}.serialize(std::nullopt, v));
  TEST_EXPECT(v == Value::null());
  std::optional<std::string> o = "old";
  TEST_EXPECT_OK(OptString{}.deserialize(Value::null(), o));
  TEST_EXPECT(!o.has_value());
  TEST_EXPECT_OK(OptString{}.deserialize(Value::string("s"), o));
  TEST_EXPECT(o == std::optional<std::string>("s"));
}

// ============================================================================
// ClassMap
// ============================================================================

struct Person {
  std::string name;
  std::int32_t age{0};
  Guid id;
  Color color{Color::red};
  std::vector<std::string> tags;
  std::string nickname{"none"};
};

ClassMap<Person> person_map() {
  ClassMap<Person> map;
  map.map("name", &Person::name)
      .map("age", &Person::age)
      .map("id", &Person::id, GuidSerializer(GuidRepresentation::standard))
      .map("color", &Person::color, EnumSerializer<Color>(EnumRepresentation::string, {{Color::red, "red"}, {Color::green, "green"}}))
      .map("tags", &Person::tags)
      .map_optional("nickname", &Person::nickname);
  return map;
}

void test_class_map_round_trip() {
  const auto map = person_map();
  TEST_EXPECT_EQ(map.member_count(), 6u);
  TEST_EXPECT(!map.ignore_extra_elements());

  Person p;
  p.name = "ada";
  p.age = 36;
  p.id = sample_guid();
  p.color = Color::green;
  p.tags = {"x", "y"};
  p.nickname = "a";

  Document doc;
  TEST_EXPECT_OK(map.to_document(p, doc));
  TEST_EXPECT_EQ(doc.size(), 6u);
  TEST_EXPECT_EQ(doc[0].name, "name");
  TEST_EXPECT_EQ(doc[5].name, "nickname");
  TEST_EXPECT(*doc.find("color") == Value::string("green"));

  Person back;
  TEST_EXPECT_OK(map.from_document(doc, back));
  TEST_EXPECT_EQ(back.name, p.name);
  TEST_EXPECT_EQ(back.age, p.age);
  TEST_EXPECT(back.id == p.id);
  TEST_EXPECT(back.color == p.color);
  TEST_EXPECT(back.tags == p.tags);
  TEST_EXPECT_EQ(back.nickname, p.nickname);
}

void test_class_map_missing_and_extra() {
  const auto map = person_map();

  Document doc;
  Binary id;
  TEST_EXPECT_OK(Binary::from_guid(sample_guid(), GuidRepresentation::standard, id));
  doc.append("name", Value::string("bob"))
      .append("age", Value::int32(5))
      .append("id", Value(id))
      .append("color", Value::string("red"))
      .append("tags", Value::array({}));

  // 可选成员缺失：保持原值
  Person p;
  TEST_EXPECT_OK(map.from_document(doc, p));
  TEST_EXPECT_EQ(p.nickname, std::string("none"));

  Document missing;
  missing.append("name", Value::string("bob"));
  TEST_EXPECT_EQ(map.from_document(missing, p), make_error_code(errc::missing_element));

  Document extra = doc;
  extra.append("unknown", Value::int32(1));
  TEST_EXPECT_EQ(map.from_document(extra, p), make_error_code(errc::unexpected_element));

  auto lenient = person_map();
  lenient.set_ignore_extra_elements(true);
  TEST_EXPECT_OK(lenient.from_document(extra, p));

  Document wrong = doc;
  wrong.append("nickname", Value::int32(1));
  TEST_EXPECT_EQ(map.from_document(wrong, p), make_error_code(errc::type_mismatch));
}

void test_class_map_serialize_failure_keeps_output() {
  const auto map = person_map();
  Person p;
  p.color = static_cast<Color>(42);

  Document out;
  out.append("keep", Value::int32(1));
  TEST_EXPECT_EQ(map.to_document(p, out), make_error_code(errc::unknown_enum_name));
  TEST_EXPECT_EQ(out.size(), 1u);
  TEST_EXPECT_EQ(std::string(error_category().name()), std::string("bsonx.serialization"));
}

}  // namespace

int main() {
  test_scalar_serializers();
  test_guid_serializer_explicit_representation();
  test_guid_serializer_unspecified();
  test_enum_numeric();
  test_enum_names();
  test_vector_and_optional();
  test_class_map_round_trip();
  test_class_map_missing_and_extra();
  test_class_map_serialize_failure_keeps_output();
  return ::bsonx::tests::run_and_report();
}
