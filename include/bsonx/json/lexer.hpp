#pragma once

#include "bsonx/json/token.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonx::json {

enum class lexer_errc : int {
  ok = 0,
  unterminated_string = 1,
  invalid_escape = 2,
  invalid_number = 3,
  invalid_character = 4,
  unterminated_regex = 5,
};

const std::error_category& lexer_error_category() noexcept;
std::error_code make_error_code(lexer_errc e) noexcept;

struct LexerResult {
  std::vector<Token> tokens;
  std::error_code ec;
  std::uint32_t error_line{0};
  std::uint32_t error_column{0};
  std::size_t error_offset{0};
  std::string error_message;
};

/**
 * @brief 文本方言词法分析器
 *
 * 将 JSON / shell 方言文本转换为 Token 序列。
 * 支持:
 * - 结构符号: { } [ ] ( ) : ,
 * - 字符串: "..." 或 '...'，转义 \" \' \\ \/ \b \f \n \r \t \uXXXX（代理对合并为一个码点）
 * - 数字: -?digits[.digits][(e|E)[+-]digits]，以及 NaN / Infinity / -Infinity
 * - 正则字面量: /pattern/options（pattern 内的反斜杠转义原样保留）
 * - 未加引号的标识符: [A-Za-z_$][A-Za-z0-9_$]*
 *
 * 注意：方言中 '/' 只可能出现在值的起始位置，因此无需语法上下文即可识别正则。
 */
class Lexer {
 public:
  explicit Lexer(std::string_view source) noexcept;

  [[nodiscard]] LexerResult tokenize() noexcept;

 private:
  [[nodiscard]] bool at_end() const noexcept;
  [[nodiscard]] char peek() const noexcept;
  [[nodiscard]] char peek_next() const noexcept;
  char advance() noexcept;
  void skip_whitespace() noexcept;

  Token scan_token() noexcept;
  Token scan_identifier() noexcept;
  Token scan_string(char quote) noexcept;
  Token scan_number() noexcept;
  Token scan_regex() noexcept;

  bool scan_unicode_escape(std::string& value) noexcept;
  bool read_hex4(std::uint32_t& out) noexcept;

  Token make_token(TokenType type) const noexcept;
  Token make_token(TokenType type, std::string value) const noexcept;
  Token make_error(lexer_errc kind, std::string_view message) noexcept;

  std::string_view source_;
  std::size_t current_{0};
  std::size_t token_start_{0};
  std::uint32_t line_{1};
  std::uint32_t column_{1};
  std::uint32_t token_line_{1};
  std::uint32_t token_column_{1};
  lexer_errc last_error_kind_{lexer_errc::invalid_character};
};

}  // namespace bsonx::json

namespace std {
template <>
struct is_error_code_enum<bsonx::json::lexer_errc> : true_type {};
}  // namespace std
