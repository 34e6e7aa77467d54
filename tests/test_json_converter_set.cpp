/**
 * @file test_json_converter_set.cpp
 * @brief 转换器集合（槽位分派、替换、自定义转换器）单元测试
 */

#include "bsonx/json/converter_set.hpp"
#include "bsonx/json/converters.hpp"
#include "bsonx/json/writer.hpp"
#include "bsonx/json/writer_settings.hpp"

#include "test_main.hpp"

#include <memory>
#include <string>

namespace {

using namespace bsonx::json;
using bsonx::bson::bson_type;
using bsonx::bson::Document;
using bsonx::bson::Value;

// 所有字符串一律输出为 "***"
class RedactingStringConverter final : public Converter {
 public:
  std::error_code write(const Value& value, TextWriter& writer) const override {
    if (!value.is<bsonx::bson::String>()) {
      return make_error_code(writer_errc::invalid_converter_slot);
    }
    return writer.write_string_value("***");
  }
};

void test_builtin_sets_are_complete() {
  TEST_EXPECT(ConverterSet::shell().is_complete());
  TEST_EXPECT(ConverterSet::strict().is_complete());
  TEST_EXPECT(!ConverterSet{}.is_complete());

  for (const auto type : bsonx::bson::all_bson_types()) {
    const bool structural = type == bson_type::document || type == bson_type::array ||
                            type == bson_type::javascript_with_scope;
    TEST_EXPECT_EQ(ConverterSet::has_slot(type), !structural);
    TEST_EXPECT_EQ(ConverterSet::shell().find(type) != nullptr, !structural);
    TEST_EXPECT_EQ(ConverterSet::strict().find(type) != nullptr, !structural);
  }

  // 两种模式共用纯 JSON 形式的类型
  TEST_EXPECT(dynamic_cast<const converters::Int32Strict*>(ConverterSet::shell().find(bson_type::int32)) != nullptr);
  TEST_EXPECT(dynamic_cast<const converters::ObjectIdShell*>(ConverterSet::shell().find(bson_type::object_id)) !=
              nullptr);
  TEST_EXPECT(dynamic_cast<const converters::ObjectIdExtended*>(ConverterSet::strict().find(bson_type::object_id)) !=
              nullptr);
}

void test_create_requires_every_slot() {
  auto slots = ConverterSet::shell().slots();
  slots.timestamp.reset();

  ConverterSet out = ConverterSet::strict();
  TEST_EXPECT_EQ(ConverterSet::create(slots, out), make_error_code(writer_errc::missing_converter));
  // 失败时 out 不变
  TEST_EXPECT(out.find(bson_type::object_id) == ConverterSet::strict().find(bson_type::object_id));

  slots.timestamp = std::make_shared<const converters::TimestampExtended>();
  TEST_EXPECT_OK(ConverterSet::create(slots, out));
  TEST_EXPECT(out.is_complete());
  TEST_EXPECT(out.find(bson_type::object_id) == ConverterSet::shell().find(bson_type::object_id));
  TEST_EXPECT(dynamic_cast<const converters::TimestampExtended*>(out.find(bson_type::timestamp)) != nullptr);
}

void test_with_replaces_one_slot() {
  const auto custom = std::make_shared<const RedactingStringConverter>();

  ConverterSet out;
  TEST_EXPECT_OK(ConverterSet::shell().with(bson_type::string, custom, out));
  TEST_EXPECT(out.find(bson_type::string) == custom.get());
  TEST_EXPECT(out.get(bson_type::string) == custom);
  // 其余槽位共享同一转换器对象
  TEST_EXPECT(out.get(bson_type::int64) == ConverterSet::shell().get(bson_type::int64));
  // 原集合不受影响
  TEST_EXPECT(ConverterSet::shell().find(bson_type::string) != custom.get());

  ConverterSet unchanged = ConverterSet::shell();
  TEST_EXPECT_EQ(ConverterSet::shell().with(bson_type::document, custom, unchanged),
                 make_error_code(writer_errc::invalid_converter_slot));
  TEST_EXPECT_EQ(ConverterSet::shell().with(bson_type::javascript_with_scope, custom, unchanged),
                 make_error_code(writer_errc::invalid_converter_slot));
  TEST_EXPECT_EQ(ConverterSet::shell().with(bson_type::string, nullptr, unchanged),
                 make_error_code(writer_errc::missing_converter));
  TEST_EXPECT(unchanged.find(bson_type::string) == ConverterSet::shell().find(bson_type::string));
}

void test_custom_converter_in_writer() {
  ConverterSet set;
  TEST_EXPECT_OK(ConverterSet::strict().with(bson_type::string, std::make_shared<const RedactingStringConverter>(), set));

  WriterSettings settings;
  TEST_EXPECT_OK(settings.set_converters(set));

  Document doc;
  doc.append("user", Value::string("alice")).append("n", Value::int64(5));
  doc.append("nested", Value::array({Value::string("x")}));

  std::string out;
  TEST_EXPECT_OK(write(doc, settings, out));
  TEST_EXPECT_EQ(out, std::string(R"({ "user" : "***", "n" : 5, "nested" : ["***"] })"));
}

void test_converter_rejects_wrong_type() {
  WriterSettings settings;
  TextWriter writer(settings);
  const converters::ObjectIdShell converter;
  TEST_EXPECT_EQ(converter.write(Value::int32(1), writer), make_error_code(writer_errc::invalid_converter_slot));
  TEST_EXPECT(writer.str().empty());
}

}  // namespace

int main() {
  test_builtin_sets_are_complete();
  test_create_requires_every_slot();
  test_with_replaces_one_slot();
  test_custom_converter_in_writer();
  test_converter_rejects_wrong_type();
  return ::bsonx::tests::run_and_report();
}
