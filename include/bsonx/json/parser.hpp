#pragma once

#include "bsonx/bson/value.hpp"
#include "bsonx/json/reader_settings.hpp"
#include "bsonx/json/token.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonx::json {

/**
 * @brief 文本解析错误（"bsonx.json.parser" 错误域）。
 *
 * 说明：词法错误沿用 lexer_errc（"bsonx.json.lexer"），两者都与二进制解码错误（bsonx.bson）区分。
 */
enum class parser_errc : int {
  ok = 0,
  unexpected_token = 1,
  unknown_constructor = 2,
  invalid_literal = 3,
  max_depth_exceeded = 4,
};

const std::error_category& parser_error_category() noexcept;
std::error_code make_error_code(parser_errc e) noexcept;

struct ParseResult {
  bson::Document document;
  std::error_code ec;
  std::uint32_t error_line{0};
  std::uint32_t error_column{0};
  std::size_t error_offset{0};
  std::string error_message;
};

struct ValueParseResult {
  bson::Value value;
  std::error_code ec;
  std::uint32_t error_line{0};
  std::uint32_t error_column{0};
  std::size_t error_offset{0};
  std::string error_message;
};

/**
 * @brief 文本方言语法分析器
 *
 * 将 Token 序列转换为文档/值，使用递归下降解析。
 *
 * 接受的形式：
 * - JSON 对象、数组、字符串、数字、true / false / null；
 * - shell 构造函数（可带 new）：ObjectId、UUID/GUID、CSUUID/CSGUID、JUUID/JGUID、PYUUID/PYGUID、
 *   HexData、BinData、ISODate、Date、NumberLong、NumberInt、NumberDecimal、Timestamp、RegExp，
 *   以及 MinKey、MaxKey、undefined、/pattern/options；
 * - strict $ 包装对象：$oid、$binary、$uuid、$date、$numberLong、$numberInt、$numberDouble、
 *   $numberDecimal、$timestamp、$regex、$regularExpression、$minKey、$maxKey、$undefined、
 *   $symbol、$code（可带 $scope）。
 *
 * 错误分类：
 * - 未知构造函数 -> parser_errc::unknown_constructor；
 * - 字面量内容非法（hex/base64/日期/GUID/范围/子类型与表示法冲突）-> parser_errc::invalid_literal；
 * - 其它语法错误 -> parser_errc::unexpected_token；
 * - 嵌套超过 max_depth -> parser_errc::max_depth_exceeded。
 */
class Parser {
 public:
  Parser(std::vector<Token> tokens, const ReaderSettings& settings) noexcept;

  /**
   * @brief 解析根文档；根文档之后除 EOF 外不允许有其它记号。
   */
  [[nodiscard]] ParseResult parse() noexcept;

  /**
   * @brief 解析单个值（任意类型）；之后除 EOF 外不允许有其它记号。
   */
  [[nodiscard]] ValueParseResult parse_single_value() noexcept;

 private:
  [[nodiscard]] bool at_end() const noexcept;
  [[nodiscard]] const Token& peek(std::size_t ahead = 0) const noexcept;
  const Token& advance() noexcept;
  [[nodiscard]] bool check(TokenType type) const noexcept;
  bool match(TokenType type) noexcept;
  bool expect(TokenType type, std::string_view what) noexcept;

  // 解析规则
  bool parse_value(bson::Value& out, std::size_t depth) noexcept;
  bool parse_object(bson::Value& out, std::size_t depth) noexcept;
  bool parse_document_body(bson::Document& out, std::size_t depth) noexcept;
  bool parse_array(bson::Array& out, std::size_t depth) noexcept;
  bool parse_identifier(bson::Value& out) noexcept;
  bool parse_constructor(const Token& name, bson::Value& out) noexcept;

  // $ 包装对象（'{' 与键名之后，从冒号开始）
  [[nodiscard]] bool is_wrapper_start() const noexcept;
  bool parse_wrapper(std::string_view key, bson::Value& out, std::size_t depth) noexcept;
  bool parse_binary_wrapper(bson::Value& out) noexcept;
  bool parse_date_wrapper(bson::Value& out) noexcept;
  bool parse_timestamp_wrapper(bson::Value& out) noexcept;
  bool parse_regular_expression_wrapper(bson::Value& out) noexcept;
  bool parse_code_wrapper(bson::Value& out, std::size_t depth) noexcept;

  // 构造函数参数
  bool parse_string_argument(std::string& out) noexcept;
  bool parse_integer_argument(std::int64_t& out) noexcept;
  bool parse_key(std::string& out) noexcept;

  // 字面量 -> 值
  bool make_guid(const Token& at, std::string_view text, bson::GuidRepresentation representation, bson::Value& out) noexcept;
  bool make_binary(const Token& at, std::int64_t subtype, std::vector<bson::byte> bytes, bson::Value& out) noexcept;
  bool make_date(const Token& at, std::string_view iso, bson::Value& out) noexcept;
  bool make_timestamp(const Token& at, std::int64_t t, std::int64_t i, bson::Value& out) noexcept;

  // 错误处理
  bool error_at(parser_errc code, const Token& token, std::string_view message) noexcept;
  bool error(parser_errc code, std::string_view message) noexcept { return error_at(code, peek(), message); }
  bool unexpected(std::string_view expected) noexcept;

  std::vector<Token> tokens_;
  std::size_t current_{0};
  const ReaderSettings& settings_;

  std::error_code ec_;
  std::uint32_t error_line_{0};
  std::uint32_t error_column_{0};
  std::size_t error_offset_{0};
  std::string error_message_;
};

/**
 * @brief 文本 -> 文档（词法 + 语法）。
 *
 * 失败时 ec 为 lexer_errc 或 parser_errc，error_line / error_column（从 1 开始）与
 * error_offset（从 0 开始的字节偏移）指向出错记号的起点。
 */
[[nodiscard]] ParseResult parse(std::string_view text, const ReaderSettings& settings = ReaderSettings{});

/**
 * @brief 文本 -> 单个值（例如 "NumberLong(5)"、"[1, 2]"）。
 */
[[nodiscard]] ValueParseResult parse_value(std::string_view text, const ReaderSettings& settings = ReaderSettings{});

}  // namespace bsonx::json

namespace std {
template <>
struct is_error_code_enum<bsonx::json::parser_errc> : true_type {};
}  // namespace std
