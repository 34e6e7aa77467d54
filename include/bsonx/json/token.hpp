#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bsonx::json {

enum class TokenType : std::uint8_t {
  // 结构符号
  BeginObject,  // {
  EndObject,    // }
  BeginArray,   // [
  EndArray,     // ]
  LParen,       // (
  RParen,       // )
  Colon,        // :
  Comma,        // ,

  // 字面量
  String,             // "..." 或 '...'
  RegularExpression,  // /pattern/options
  Int32,              // 落在 int32 范围内的整数
  Int64,              // 超出 int32 但落在 int64 范围内的整数
  Double,             // 1.5, 1e3, NaN, Infinity, -Infinity
  UnquotedString,     // true, null, ObjectId, new, 未加引号的字段名

  // 特殊
  Eof,
  Error,
};

struct Token {
  TokenType type{TokenType::Error};

  // String: 反转义后的内容；RegularExpression: pattern（"\/" 已还原为 '/'）；数字: 原始词素；其余: 原始文本
  std::string value{};

  // 仅 RegularExpression 使用
  std::string options{};

  std::int64_t int_value{0};
  double double_value{0.0};

  std::uint32_t line{1};
  std::uint32_t column{1};
  std::size_t offset{0};

  [[nodiscard]] bool is(TokenType t) const noexcept { return type == t; }
  [[nodiscard]] bool is_number() const noexcept {
    return type == TokenType::Int32 || type == TokenType::Int64 || type == TokenType::Double;
  }
  [[nodiscard]] bool is_integer() const noexcept {
    return type == TokenType::Int32 || type == TokenType::Int64;
  }
};

[[nodiscard]] constexpr std::string_view token_type_name(TokenType t) noexcept {
  switch (t) {
    case TokenType::BeginObject: return "{";
    case TokenType::EndObject: return "}";
    case TokenType::BeginArray: return "[";
    case TokenType::EndArray: return "]";
    case TokenType::LParen: return "(";
    case TokenType::RParen: return ")";
    case TokenType::Colon: return ":";
    case TokenType::Comma: return ",";
    case TokenType::String: return "String";
    case TokenType::RegularExpression: return "RegularExpression";
    case TokenType::Int32: return "Int32";
    case TokenType::Int64: return "Int64";
    case TokenType::Double: return "Double";
    case TokenType::UnquotedString: return "UnquotedString";
    case TokenType::Eof: return "EOF";
    case TokenType::Error: return "Error";
  }
  return "Unknown";
}

}  // namespace bsonx::json
