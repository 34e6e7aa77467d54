#include "bsonx/bson/error.hpp"
#include "bsonx/bson/guid.hpp"
#include "bsonx/core/error.hpp"
#include "bsonx/json/lexer.hpp"
#include "bsonx/json/parser.hpp"
#include "bsonx/json/text_writer.hpp"
#include "bsonx/serialization/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using bsonx::core::errc;
using bsonx::core::make_error_code;

void test_error_category_and_messages() {
  auto ec = make_error_code(errc::invalid_length);
  TEST_EXPECT(ec.category().name() != nullptr);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "bsonx.core");
  TEST_EXPECT(!ec.message().empty());

  TEST_EXPECT_EQ(make_error_code(errc::settings_frozen), make_error_code(errc::settings_frozen));
}

void test_all_error_codes() {
  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_argument).message(), "invalid argument");
  TEST_EXPECT_EQ(make_error_code(errc::out_of_range).message(), "read past end of buffer");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_length).message(), "invalid length prefix");
  TEST_EXPECT_EQ(make_error_code(errc::missing_terminator).message(), "missing null terminator");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_utf8).message(), "invalid utf-8 sequence");
  TEST_EXPECT_EQ(make_error_code(errc::settings_frozen).message(), "settings object is frozen");
}

void test_unknown_error_code() {
  std::error_code ec(9999, bsonx::core::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown bsonx.core error");
}

void test_module_categories_are_distinct() {
  // 各模块的错误码数值会重叠，区分依赖 category
  std::error_code core = bsonx::core::errc::invalid_argument;
  std::error_code bson = bsonx::bson::errc::invalid_type;
  std::error_code guid = bsonx::bson::guid_errc::unspecified_representation;
  std::error_code lexer = bsonx::json::lexer_errc::unterminated_string;
  std::error_code parser = bsonx::json::parser_errc::unexpected_token;
  std::error_code writer = bsonx::json::writer_errc::invalid_state;
  std::error_code serial = bsonx::serialization::errc::type_mismatch;

  TEST_EXPECT_EQ(std::string_view(bson.category().name()), "bsonx.bson");
  TEST_EXPECT_EQ(std::string_view(guid.category().name()), "bsonx.guid");
  TEST_EXPECT_EQ(std::string_view(lexer.category().name()), "bsonx.json.lexer");
  TEST_EXPECT_EQ(std::string_view(parser.category().name()), "bsonx.json.parser");
  TEST_EXPECT_EQ(std::string_view(writer.category().name()), "bsonx.json.writer");
  TEST_EXPECT_EQ(std::string_view(serial.category().name()), "bsonx.serialization");

  TEST_EXPECT_EQ(core.value(), bson.value());
  TEST_EXPECT(core != bson);
  TEST_EXPECT(lexer != parser);
  TEST_EXPECT(parser != writer);
  TEST_EXPECT(writer != serial);
  TEST_EXPECT(bson != guid);
}

void test_messages_are_readable() {
  TEST_EXPECT_EQ(make_error_code(bsonx::bson::errc::trailing_bytes).message(), "trailing bytes after document");
  TEST_EXPECT_EQ(make_error_code(bsonx::bson::guid_errc::invalid_length).message(), "guid bytes must be 16 bytes long");
  TEST_EXPECT_EQ(make_error_code(bsonx::json::parser_errc::unknown_constructor).message(), "unknown constructor");
  TEST_EXPECT_EQ(make_error_code(bsonx::serialization::errc::missing_element).message(),
                 "required element is missing");
}

}  // namespace

int main() {
  test_error_category_and_messages();
  test_all_error_codes();
  test_unknown_error_code();
  test_module_categories_are_distinct();
  test_messages_are_readable();
  return ::bsonx::tests::run_and_report();
}
