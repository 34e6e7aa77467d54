#include "bsonx/json/lexer.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace bsonx::json {

namespace {

class LexerErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "bsonx.json.lexer"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<lexer_errc>(ev)) {
      case lexer_errc::ok: return "success";
      case lexer_errc::unterminated_string: return "unterminated string literal";
      case lexer_errc::invalid_escape: return "invalid escape sequence";
      case lexer_errc::invalid_number: return "invalid number literal";
      case lexer_errc::invalid_character: return "invalid character";
      case lexer_errc::unterminated_regex: return "unterminated regular expression";
    }
    return "unknown lexer error";
  }
};

const LexerErrorCategory kLexerErrorCategory{};

[[nodiscard]] bool is_identifier_start(char c) noexcept {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

[[nodiscard]] bool is_identifier_part(char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

[[nodiscard]] bool is_digit(char c) noexcept {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace

const std::error_category& lexer_error_category() noexcept {
  return kLexerErrorCategory;
}

std::error_code make_error_code(lexer_errc e) noexcept {
  return {static_cast<int>(e), kLexerErrorCategory};
}

Lexer::Lexer(std::string_view source) noexcept : source_(source) {}

LexerResult Lexer::tokenize() noexcept {
  LexerResult result;

  while (!at_end()) {
    skip_whitespace();
    if (at_end()) break;

    token_start_ = current_;
    token_line_ = line_;
    token_column_ = column_;

    Token token = scan_token();
    if (token.type == TokenType::Error) {
      result.ec = make_error_code(last_error_kind_);
      result.error_line = token.line;
      result.error_column = token.column;
      result.error_offset = token.offset;
      result.error_message = token.value;
      return result;
    }

    result.tokens.push_back(std::move(token));
  }

  token_start_ = current_;
  token_line_ = line_;
  token_column_ = column_;
  result.tokens.push_back(make_token(TokenType::Eof, std::string{}));
  return result;
}

bool Lexer::at_end() const noexcept {
  return current_ >= source_.size();
}

char Lexer::peek() const noexcept {
  if (at_end()) return '\0';
  return source_[current_];
}

char Lexer::peek_next() const noexcept {
  if (current_ + 1 >= source_.size()) return '\0';
  return source_[current_ + 1];
}

char Lexer::advance() noexcept {
  char c = source_[current_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

void Lexer::skip_whitespace() noexcept {
  while (!at_end()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else {
      break;
    }
  }
}

Token Lexer::scan_token() noexcept {
  char c = advance();

  switch (c) {
    case '{': return make_token(TokenType::BeginObject);
    case '}': return make_token(TokenType::EndObject);
    case '[': return make_token(TokenType::BeginArray);
    case ']': return make_token(TokenType::EndArray);
    case '(': return make_token(TokenType::LParen);
    case ')': return make_token(TokenType::RParen);
    case ':': return make_token(TokenType::Colon);
    case ',': return make_token(TokenType::Comma);
    case '"':
    case '\'':
      return scan_string(c);
    case '/':
      return scan_regex();
    default:
      break;
  }

  if (is_identifier_start(c)) {
    --current_;
    --column_;
    return scan_identifier();
  }

  if (is_digit(c) || c == '-') {
    --current_;
    --column_;
    return scan_number();
  }

  return make_error(lexer_errc::invalid_character, std::string("unexpected character: ") + c);
}

Token Lexer::scan_identifier() noexcept {
  const std::size_t start = current_;
  while (!at_end() && is_identifier_part(peek())) {
    advance();
  }

  const std::string_view text = source_.substr(start, current_ - start);
  if (text == "NaN") {
    auto token = make_token(TokenType::Double, std::string(text));
    token.double_value = std::numeric_limits<double>::quiet_NaN();
    return token;
  }
  if (text == "Infinity") {
    auto token = make_token(TokenType::Double, std::string(text));
    token.double_value = std::numeric_limits<double>::infinity();
    return token;
  }
  return make_token(TokenType::UnquotedString, std::string(text));
}

Token Lexer::scan_string(char quote) noexcept {
  std::string value;
  while (!at_end() && peek() != quote) {
    if (peek() != '\\') {
      value += advance();
      continue;
    }

    advance();  // 反斜杠
    if (at_end()) {
      break;
    }
    const char escaped = advance();
    switch (escaped) {
      case '"': value += '"'; break;
      case '\'': value += '\''; break;
      case '\\': value += '\\'; break;
      case '/': value += '/'; break;
      case 'b': value += '\b'; break;
      case 'f': value += '\f'; break;
      case 'n': value += '\n'; break;
      case 'r': value += '\r'; break;
      case 't': value += '\t'; break;
      case 'u':
        if (!scan_unicode_escape(value)) {
          return make_error(lexer_errc::invalid_escape, "invalid \\u escape in string");
        }
        break;
      default:
        return make_error(lexer_errc::invalid_escape, std::string("invalid escape sequence: \\") + escaped);
    }
  }

  if (at_end()) {
    return make_error(lexer_errc::unterminated_string, "unterminated string");
  }

  advance();  // 结束引号
  return make_token(TokenType::String, std::move(value));
}

bool Lexer::read_hex4(std::uint32_t& out) noexcept {
  if (current_ + 4 > source_.size()) {
    return false;
  }
  const char* first = source_.data() + current_;
  std::uint32_t v = 0;
  auto [ptr, ec] = std::from_chars(first, first + 4, v, 16);
  if (ec != std::errc{} || ptr != first + 4) {
    return false;
  }
  for (int i = 0; i < 4; ++i) {
    advance();
  }
  out = v;
  return true;
}

bool Lexer::scan_unicode_escape(std::string& value) noexcept {
  std::uint32_t cp = 0;
  if (!read_hex4(cp)) {
    return false;
  }

  if (cp >= 0xDC00 && cp <= 0xDFFF) {
    return false;  // 孤立的低位代理
  }

  if (cp >= 0xD800 && cp <= 0xDBFF) {
    // 高位代理后必须紧跟 \uDC00-\uDFFF
    if (peek() != '\\' || peek_next() != 'u') {
      return false;
    }
    advance();
    advance();
    std::uint32_t low = 0;
    if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
      return false;
    }
    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
  }

  append_utf8(value, cp);
  return true;
}

Token Lexer::scan_number() noexcept {
  const std::size_t start = current_;

  if (peek() == '-') {
    advance();
    if (peek() == 'I') {
      const std::size_t ident_start = current_;
      while (!at_end() && is_identifier_part(peek())) {
        advance();
      }
      if (source_.substr(ident_start, current_ - ident_start) != "Infinity") {
        return make_error(lexer_errc::invalid_number, "invalid number literal");
      }
      auto token = make_token(TokenType::Double, std::string(source_.substr(start, current_ - start)));
      token.double_value = -std::numeric_limits<double>::infinity();
      return token;
    }
  }

  if (!is_digit(peek())) {
    return make_error(lexer_errc::invalid_number, "expected digit in number literal");
  }
  while (!at_end() && is_digit(peek())) {
    advance();
  }

  bool is_floating = false;
  if (peek() == '.') {
    is_floating = true;
    advance();
    if (!is_digit(peek())) {
      return make_error(lexer_errc::invalid_number, "expected digit after decimal point");
    }
    while (!at_end() && is_digit(peek())) {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    is_floating = true;
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!is_digit(peek())) {
      return make_error(lexer_errc::invalid_number, "expected digit in exponent");
    }
    while (!at_end() && is_digit(peek())) {
      advance();
    }
  }

  // 1abc 之类：数字后紧跟标识符字符
  if (!at_end() && is_identifier_part(peek())) {
    return make_error(lexer_errc::invalid_number, "invalid character after number literal");
  }

  const std::string_view text = source_.substr(start, current_ - start);
  const char* first = text.data();
  const char* last = text.data() + text.size();

  if (!is_floating) {
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec == std::errc{} && ptr == last) {
      const bool fits_int32 =
          v >= std::numeric_limits<std::int32_t>::min() && v <= std::numeric_limits<std::int32_t>::max();
      auto token = make_token(fits_int32 ? TokenType::Int32 : TokenType::Int64, std::string(text));
      token.int_value = v;
      return token;
    }
    // 超出 int64：按 double 处理
  }

  double d = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, d);
  if (ec != std::errc{} || ptr != last || !std::isfinite(d)) {
    return make_error(lexer_errc::invalid_number, "number literal out of range");
  }
  auto token = make_token(TokenType::Double, std::string(text));
  token.double_value = d;
  return token;
}

Token Lexer::scan_regex() noexcept {
  std::string pattern;
  while (true) {
    if (at_end() || peek() == '\n') {
      return make_error(lexer_errc::unterminated_regex, "unterminated regular expression");
    }
    const char c = advance();
    if (c == '/') {
      break;
    }
    if (c == '\\') {
      if (at_end()) {
        return make_error(lexer_errc::unterminated_regex, "unterminated regular expression");
      }
      // "\/" 还原为 '/'，其余转义原样保留
      const char next = advance();
      if (next != '/') {
        pattern += c;
      }
      pattern += next;
      continue;
    }
    pattern += c;
  }

  std::string options;
  while (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
    options += advance();
  }

  auto token = make_token(TokenType::RegularExpression, std::move(pattern));
  token.options = std::move(options);
  return token;
}

Token Lexer::make_token(TokenType type) const noexcept {
  return make_token(type, std::string(source_.substr(token_start_, current_ - token_start_)));
}

Token Lexer::make_token(TokenType type, std::string value) const noexcept {
  Token token;
  token.type = type;
  token.value = std::move(value);
  token.line = token_line_;
  token.column = token_column_;
  token.offset = token_start_;
  return token;
}

Token Lexer::make_error(lexer_errc kind, std::string_view message) noexcept {
  last_error_kind_ = kind;
  return make_token(TokenType::Error, std::string(message));
}

}  // namespace bsonx::json
