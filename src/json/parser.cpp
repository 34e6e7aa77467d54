#include "bsonx/json/parser.hpp"

#include "bsonx/json/lexer.hpp"
#include "bsonx/utils/base64.hpp"
#include "bsonx/utils/hex.hpp"
#include "iso_date.hpp"

#include "core/log_internal.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace bsonx::json {

namespace {

using bson::GuidRepresentation;
using bson::Value;

class ParserErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "bsonx.json.parser"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<parser_errc>(ev)) {
      case parser_errc::ok: return "success";
      case parser_errc::unexpected_token: return "unexpected token";
      case parser_errc::unknown_constructor: return "unknown constructor";
      case parser_errc::invalid_literal: return "invalid literal";
      case parser_errc::max_depth_exceeded: return "maximum nesting depth exceeded";
    }
    return "unknown parser error";
  }
};

const ParserErrorCategory kParserErrorCategory{};

// 首个键名为以下之一时，对象按 $ 包装形式解析
constexpr std::string_view kWrapperKeys[] = {
    "$oid",          "$binary",      "$uuid",      "$date",
    "$numberLong",   "$numberInt",   "$numberDouble", "$numberDecimal",
    "$timestamp",    "$regex",       "$regularExpression",
    "$minKey",       "$maxKey",      "$undefined", "$symbol",
    "$code",
};

struct GuidConstructor {
  std::string_view name;
  GuidRepresentation representation;
};

constexpr GuidConstructor kGuidConstructors[] = {
    {"UUID", GuidRepresentation::standard},
    {"GUID", GuidRepresentation::standard},
    {"CSUUID", GuidRepresentation::csharp_legacy},
    {"CSGUID", GuidRepresentation::csharp_legacy},
    {"JUUID", GuidRepresentation::java_legacy},
    {"JGUID", GuidRepresentation::java_legacy},
    {"PYUUID", GuidRepresentation::python_legacy},
    {"PYGUID", GuidRepresentation::python_legacy},
};

[[nodiscard]] bool is_key_token(const Token& t) noexcept {
  return t.type == TokenType::String || t.type == TokenType::UnquotedString;
}

[[nodiscard]] bool parse_int64_text(std::string_view text, std::int64_t& out) noexcept {
  if (text.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

[[nodiscard]] bool fits_int32(std::int64_t v) noexcept {
  return v >= std::numeric_limits<std::int32_t>::min() && v <= std::numeric_limits<std::int32_t>::max();
}

// 整数值的 double（如 Date(1.0e3)）-> int64
[[nodiscard]] bool integral_double(double d, std::int64_t& out) noexcept {
  if (!std::isfinite(d) || std::trunc(d) != d || d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
    return false;
  }
  out = static_cast<std::int64_t>(d);
  return true;
}

// "$type" / "subType"：1~2 位 hex
[[nodiscard]] bool parse_subtype_hex(std::string_view text, std::int64_t& out) noexcept {
  if (text.empty() || text.size() > 2) {
    return false;
  }
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v, 16);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return false;
  }
  out = v;
  return true;
}

[[nodiscard]] std::string describe(const Token& t) {
  if (t.type == TokenType::Eof) {
    return "end of input";
  }
  return "'" + t.value + "'";
}

}  // namespace

const std::error_category& parser_error_category() noexcept {
  return kParserErrorCategory;
}

std::error_code make_error_code(parser_errc e) noexcept {
  return {static_cast<int>(e), kParserErrorCategory};
}

Parser::Parser(std::vector<Token> tokens, const ReaderSettings& settings) noexcept
    : tokens_(std::move(tokens)), settings_(settings) {
  if (tokens_.empty() || tokens_.back().type != TokenType::Eof) {
    tokens_.push_back(Token{TokenType::Eof});
  }
}

ParseResult Parser::parse() noexcept {
  ParseResult result;

  if (expect(TokenType::BeginObject, "'{'") && parse_document_body(result.document, 1) && !check(TokenType::Eof)) {
    unexpected("end of input");
  }

  if (ec_) {
    result.document.clear();
    result.ec = ec_;
    result.error_line = error_line_;
    result.error_column = error_column_;
    result.error_offset = error_offset_;
    result.error_message = error_message_;
  }
  return result;
}

ValueParseResult Parser::parse_single_value() noexcept {
  ValueParseResult result;

  if (parse_value(result.value, 0) && !check(TokenType::Eof)) {
    unexpected("end of input");
  }

  if (ec_) {
    result.value = Value{};
    result.ec = ec_;
    result.error_line = error_line_;
    result.error_column = error_column_;
    result.error_offset = error_offset_;
    result.error_message = error_message_;
  }
  return result;
}

bool Parser::at_end() const noexcept {
  return peek().type == TokenType::Eof;
}

const Token& Parser::peek(std::size_t ahead) const noexcept {
  const std::size_t idx = current_ + ahead;
  return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
}

const Token& Parser::advance() noexcept {
  const Token& t = peek();
  if (!at_end()) {
    ++current_;
  }
  return t;
}

bool Parser::check(TokenType type) const noexcept {
  return peek().type == type;
}

bool Parser::match(TokenType type) noexcept {
  if (!check(type)) {
    return false;
  }
  advance();
  return true;
}

bool Parser::expect(TokenType type, std::string_view what) noexcept {
  if (match(type)) {
    return true;
  }
  return unexpected(what);
}

bool Parser::error_at(parser_errc code, const Token& token, std::string_view message) noexcept {
  // 只保留第一个错误
  if (!ec_) {
    ec_ = make_error_code(code);
    error_line_ = token.line;
    error_column_ = token.column;
    error_offset_ = token.offset;
    error_message_ = std::string(message);
  }
  return false;
}

bool Parser::unexpected(std::string_view expected) noexcept {
  std::string msg = "expected ";
  msg += expected;
  msg += ", found ";
  msg += describe(peek());
  return error(parser_errc::unexpected_token, msg);
}

// ---------------------------------------------------------------------------
// 结构
// ---------------------------------------------------------------------------

bool Parser::parse_value(Value& out, std::size_t depth) noexcept {
  const Token& t = peek();
  switch (t.type) {
    case TokenType::BeginObject:
      advance();
      return parse_object(out, depth + 1);
    case TokenType::BeginArray: {
      advance();
      bson::Array arr;
      if (!parse_array(arr, depth + 1)) {
        return false;
      }
      out = Value(std::move(arr));
      return true;
    }
    case TokenType::String:
      out = Value::string(advance().value);
      return true;
    case TokenType::Int32:
      out = Value::int32(static_cast<std::int32_t>(advance().int_value));
      return true;
    case TokenType::Int64:
      out = Value::int64(advance().int_value);
      return true;
    case TokenType::Double:
      out = Value::double_(advance().double_value);
      return true;
    case TokenType::RegularExpression: {
      const Token& re = advance();
      out = Value::regex(re.value, re.options);
      return true;
    }
    case TokenType::UnquotedString:
      return parse_identifier(out);
    default:
      return unexpected("value");
  }
}

bool Parser::parse_object(Value& out, std::size_t depth) noexcept {
  if (depth > settings_.max_depth()) {
    return error(parser_errc::max_depth_exceeded, "maximum nesting depth exceeded");
  }
  if (is_wrapper_start()) {
    const std::string key = advance().value;
    return parse_wrapper(key, out, depth);
  }
  bson::Document doc;
  if (!parse_document_body(doc, depth)) {
    return false;
  }
  out = Value(std::move(doc));
  return true;
}

bool Parser::parse_document_body(bson::Document& out, std::size_t depth) noexcept {
  if (depth > settings_.max_depth()) {
    return error(parser_errc::max_depth_exceeded, "maximum nesting depth exceeded");
  }
  if (match(TokenType::EndObject)) {
    return true;
  }
  while (true) {
    std::string name;
    if (!parse_key(name) || !expect(TokenType::Colon, "':'")) {
      return false;
    }
    Value v;
    if (!parse_value(v, depth)) {
      return false;
    }
    out.append(std::move(name), std::move(v));

    if (match(TokenType::Comma)) {
      continue;
    }
    if (match(TokenType::EndObject)) {
      return true;
    }
    return unexpected("',' or '}'");
  }
}

bool Parser::parse_array(bson::Array& out, std::size_t depth) noexcept {
  if (depth > settings_.max_depth()) {
    return error(parser_errc::max_depth_exceeded, "maximum nesting depth exceeded");
  }
  if (match(TokenType::EndArray)) {
    return true;
  }
  while (true) {
    Value v;
    if (!parse_value(v, depth)) {
      return false;
    }
    out.values.push_back(std::move(v));

    if (match(TokenType::Comma)) {
      continue;
    }
    if (match(TokenType::EndArray)) {
      return true;
    }
    return unexpected("',' or ']'");
  }
}

bool Parser::parse_key(std::string& out) noexcept {
  if (!is_key_token(peek())) {
    return unexpected("element name");
  }
  out = advance().value;
  return true;
}

// ---------------------------------------------------------------------------
// shell 标识符与构造函数
// ---------------------------------------------------------------------------

bool Parser::parse_identifier(Value& out) noexcept {
  const Token& t = advance();
  const std::string_view v = t.value;

  if (v == "true" || v == "false") {
    out = Value::boolean(v == "true");
    return true;
  }
  if (v == "null") {
    out = Value::null();
    return true;
  }
  if (v == "undefined") {
    out = Value(bson::Undefined{});
    return true;
  }
  if (v == "MinKey" || v == "MaxKey") {
    // MinKey 与 MinKey() 均可
    if (match(TokenType::LParen) && !expect(TokenType::RParen, "')'")) {
      return false;
    }
    out = v == "MinKey" ? Value(bson::MinKey{}) : Value(bson::MaxKey{});
    return true;
  }
  return parse_constructor(t, out);
}

bool Parser::parse_constructor(const Token& name_token, Value& out) noexcept {
  const Token* name = &name_token;
  if (name->value == "new") {
    if (!check(TokenType::UnquotedString)) {
      return unexpected("constructor name");
    }
    name = &advance();
  }
  const std::string_view fn = name->value;

  for (const auto& g : kGuidConstructors) {
    if (fn != g.name) {
      continue;
    }
    std::string text;
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    if (!parse_string_argument(text) || !expect(TokenType::RParen, "')'")) return false;
    return make_guid(arg, text, g.representation, out);
  }

  if (fn == "ObjectId") {
    std::string text;
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    if (!parse_string_argument(text) || !expect(TokenType::RParen, "')'")) return false;
    bson::ObjectId oid;
    if (bson::ObjectId::parse(text, oid)) {
      return error_at(parser_errc::invalid_literal, arg, "invalid ObjectId: " + text);
    }
    out = Value(oid);
    return true;
  }

  if (fn == "HexData" || fn == "BinData") {
    std::int64_t subtype = 0;
    std::string text;
    if (!expect(TokenType::LParen, "'('") || !parse_integer_argument(subtype) || !expect(TokenType::Comma, "','")) {
      return false;
    }
    const Token& arg = peek();
    if (!parse_string_argument(text) || !expect(TokenType::RParen, "')'")) return false;

    std::vector<bson::byte> bytes;
    const auto ec = fn == "HexData" ? utils::parse_hex(text, bytes) : utils::base64_decode(text, bytes);
    if (ec) {
      return error_at(parser_errc::invalid_literal, arg, std::string("invalid ") + std::string(fn) + " payload");
    }
    return make_binary(arg, subtype, std::move(bytes), out);
  }

  if (fn == "ISODate") {
    std::string text;
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    if (!parse_string_argument(text) || !expect(TokenType::RParen, "')'")) return false;
    return make_date(arg, text, out);
  }

  if (fn == "Date") {
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    if (arg.type == TokenType::RParen) {
      return error_at(parser_errc::invalid_literal, arg, "Date() without an argument is not supported");
    }
    if (arg.type == TokenType::String) {
      advance();
      if (!expect(TokenType::RParen, "')'")) return false;
      return make_date(arg, arg.value, out);
    }
    std::int64_t millis = 0;
    if (arg.is_integer()) {
      millis = arg.int_value;
    } else if (arg.type != TokenType::Double || !integral_double(arg.double_value, millis)) {
      if (arg.type == TokenType::Double) {
        return error_at(parser_errc::invalid_literal, arg, "Date() requires an integral millisecond value");
      }
      return unexpected("number or string");
    }
    advance();
    if (!expect(TokenType::RParen, "')'")) return false;
    out = Value::date_time(millis);
    return true;
  }

  if (fn == "NumberLong" || fn == "NumberInt") {
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    std::int64_t v = 0;
    if (arg.is_integer()) {
      v = arg.int_value;
    } else if (arg.type == TokenType::String) {
      if (!parse_int64_text(arg.value, v)) {
        return error_at(parser_errc::invalid_literal, arg, "invalid integer: " + arg.value);
      }
    } else {
      return unexpected("integer or string");
    }
    advance();
    if (!expect(TokenType::RParen, "')'")) return false;

    if (fn == "NumberInt") {
      if (!fits_int32(v)) {
        return error_at(parser_errc::invalid_literal, arg, "NumberInt value out of range");
      }
      out = Value::int32(static_cast<std::int32_t>(v));
    } else {
      out = Value::int64(v);
    }
    return true;
  }

  if (fn == "NumberDecimal") {
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    if (arg.type != TokenType::String && !arg.is_number()) {
      return unexpected("string or number");
    }
    advance();
    if (!expect(TokenType::RParen, "')'")) return false;
    bson::Decimal128 d;
    if (bson::Decimal128::parse(arg.value, d)) {
      return error_at(parser_errc::invalid_literal, arg, "invalid decimal128: " + arg.value);
    }
    out = Value(d);
    return true;
  }

  if (fn == "Timestamp") {
    std::int64_t t = 0;
    std::int64_t i = 0;
    if (!expect(TokenType::LParen, "'('")) return false;
    const Token& arg = peek();
    if (!parse_integer_argument(t) || !expect(TokenType::Comma, "','") || !parse_integer_argument(i) ||
        !expect(TokenType::RParen, "')'")) {
      return false;
    }
    return make_timestamp(arg, t, i, out);
  }

  if (fn == "RegExp") {
    std::string pattern;
    std::string options;
    if (!expect(TokenType::LParen, "'('") || !parse_string_argument(pattern)) return false;
    if (match(TokenType::Comma) && !parse_string_argument(options)) return false;
    if (!expect(TokenType::RParen, "')'")) return false;
    out = Value::regex(std::move(pattern), std::move(options));
    return true;
  }

  if (name != &name_token || check(TokenType::LParen)) {
    return error_at(parser_errc::unknown_constructor, *name, "unknown constructor: " + name->value);
  }
  return error_at(parser_errc::unexpected_token, *name, "unexpected identifier: " + name->value);
}

bool Parser::parse_string_argument(std::string& out) noexcept {
  if (!check(TokenType::String)) {
    return unexpected("string");
  }
  out = advance().value;
  return true;
}

bool Parser::parse_integer_argument(std::int64_t& out) noexcept {
  if (!peek().is_integer()) {
    return unexpected("integer");
  }
  out = advance().int_value;
  return true;
}

// ---------------------------------------------------------------------------
// $ 包装对象
// ---------------------------------------------------------------------------

bool Parser::is_wrapper_start() const noexcept {
  const Token& key = peek();
  if (!is_key_token(key) || key.value.empty() || key.value.front() != '$' || peek(1).type != TokenType::Colon) {
    return false;
  }
  for (const auto k : kWrapperKeys) {
    if (key.value != k) {
      continue;
    }
    // 查询里的 { $regex : /.../ } 之类按普通文档处理
    if (k == "$regex") {
      return peek(2).type == TokenType::String;
    }
    return true;
  }
  return false;
}

bool Parser::parse_wrapper(std::string_view key, Value& out, std::size_t depth) noexcept {
  if (!expect(TokenType::Colon, "':'")) {
    return false;
  }
  const Token& arg = peek();

  bool ok = false;
  if (key == "$oid") {
    std::string text;
    bson::ObjectId oid;
    ok = parse_string_argument(text);
    if (ok && bson::ObjectId::parse(text, oid)) {
      return error_at(parser_errc::invalid_literal, arg, "invalid $oid: " + text);
    }
    out = Value(oid);
  } else if (key == "$binary") {
    ok = parse_binary_wrapper(out);
  } else if (key == "$uuid") {
    std::string text;
    ok = parse_string_argument(text) && make_guid(arg, text, GuidRepresentation::standard, out);
  } else if (key == "$date") {
    ok = parse_date_wrapper(out);
  } else if (key == "$numberLong" || key == "$numberInt") {
    std::int64_t v = 0;
    if (arg.is_integer()) {
      v = arg.int_value;
    } else if (arg.type != TokenType::String) {
      return unexpected("string");
    } else if (!parse_int64_text(arg.value, v)) {
      return error_at(parser_errc::invalid_literal, arg, "invalid integer: " + arg.value);
    }
    advance();
    if (key == "$numberInt") {
      if (!fits_int32(v)) {
        return error_at(parser_errc::invalid_literal, arg, "$numberInt value out of range");
      }
      out = Value::int32(static_cast<std::int32_t>(v));
    } else {
      out = Value::int64(v);
    }
    ok = true;
  } else if (key == "$numberDouble") {
    std::string text;
    if (!parse_string_argument(text)) return false;
    double d = 0.0;
    if (text == "Infinity") {
      d = std::numeric_limits<double>::infinity();
    } else if (text == "-Infinity") {
      d = -std::numeric_limits<double>::infinity();
    } else if (text == "NaN") {
      d = std::numeric_limits<double>::quiet_NaN();
    } else {
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
      if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return error_at(parser_errc::invalid_literal, arg, "invalid $numberDouble: " + text);
      }
    }
    out = Value::double_(d);
    ok = true;
  } else if (key == "$numberDecimal") {
    std::string text;
    bson::Decimal128 d;
    if (!parse_string_argument(text)) return false;
    if (bson::Decimal128::parse(text, d)) {
      return error_at(parser_errc::invalid_literal, arg, "invalid $numberDecimal: " + text);
    }
    out = Value(d);
    ok = true;
  } else if (key == "$timestamp") {
    ok = parse_timestamp_wrapper(out);
  } else if (key == "$regex") {
    std::string pattern;
    std::string options;
    if (!parse_string_argument(pattern)) return false;
    if (match(TokenType::Comma)) {
      std::string k;
      const Token& key_token = peek();
      if (!parse_key(k)) return false;
      if (k != "$options") {
        return error_at(parser_errc::unexpected_token, key_token, "expected $options, found " + k);
      }
      if (!expect(TokenType::Colon, "':'") || !parse_string_argument(options)) return false;
    }
    out = Value::regex(std::move(pattern), std::move(options));
    ok = true;
  } else if (key == "$regularExpression") {
    ok = parse_regular_expression_wrapper(out);
  } else if (key == "$minKey" || key == "$maxKey") {
    if (!arg.is_integer() || arg.int_value != 1) {
      return error_at(parser_errc::invalid_literal, arg, std::string(key) + " value must be 1");
    }
    advance();
    out = key == "$minKey" ? Value(bson::MinKey{}) : Value(bson::MaxKey{});
    ok = true;
  } else if (key == "$undefined") {
    if (arg.type != TokenType::UnquotedString || arg.value != "true") {
      return error_at(parser_errc::invalid_literal, arg, "$undefined value must be true");
    }
    advance();
    out = Value(bson::Undefined{});
    ok = true;
  } else if (key == "$symbol") {
    std::string text;
    ok = parse_string_argument(text);
    out = Value(bson::Symbol{std::move(text)});
  } else if (key == "$code") {
    ok = parse_code_wrapper(out, depth);
  }

  return ok && expect(TokenType::EndObject, "'}'");
}

bool Parser::parse_binary_wrapper(Value& out) noexcept {
  std::string data;
  std::string type;
  const Token& arg = peek();

  if (arg.type == TokenType::String) {
    // { "$binary" : "<base64>", "$type" : "<hex>" }
    advance();
    data = arg.value;
    std::string k;
    if (!expect(TokenType::Comma, "','")) return false;
    const Token& key_token = peek();
    if (!parse_key(k)) return false;
    if (k != "$type") {
      return error_at(parser_errc::unexpected_token, key_token, "expected $type, found " + k);
    }
    if (!expect(TokenType::Colon, "':'") || !parse_string_argument(type)) return false;
  } else if (match(TokenType::BeginObject)) {
    // { "$binary" : { "base64" : "<base64>", "subType" : "<hex>" } }
    bool have_data = false;
    bool have_type = false;
    while (!have_data || !have_type) {
      std::string k;
      const Token& key_token = peek();
      if (!parse_key(k) || !expect(TokenType::Colon, "':'")) return false;
      if (k == "base64" && !have_data) {
        if (!parse_string_argument(data)) return false;
        have_data = true;
      } else if (k == "subType" && !have_type) {
        if (!parse_string_argument(type)) return false;
        have_type = true;
      } else {
        return error_at(parser_errc::unexpected_token, key_token, "unexpected key in $binary: " + k);
      }
      if (!have_data || !have_type) {
        if (!expect(TokenType::Comma, "','")) return false;
      }
    }
    if (!expect(TokenType::EndObject, "'}'")) return false;
  } else {
    return unexpected("string or object");
  }

  std::int64_t subtype = 0;
  if (!parse_subtype_hex(type, subtype)) {
    return error_at(parser_errc::invalid_literal, arg, "invalid binary subtype: " + type);
  }
  std::vector<bson::byte> bytes;
  if (utils::base64_decode(data, bytes)) {
    return error_at(parser_errc::invalid_literal, arg, "invalid base64 payload");
  }
  return make_binary(arg, subtype, std::move(bytes), out);
}

bool Parser::parse_date_wrapper(Value& out) noexcept {
  const Token& arg = peek();

  if (arg.is_integer()) {
    advance();
    out = Value::date_time(arg.int_value);
    return true;
  }
  if (arg.type == TokenType::Double) {
    std::int64_t millis = 0;
    if (!integral_double(arg.double_value, millis)) {
      return error_at(parser_errc::invalid_literal, arg, "$date requires an integral millisecond value");
    }
    advance();
    out = Value::date_time(millis);
    return true;
  }
  if (arg.type == TokenType::String) {
    advance();
    return make_date(arg, arg.value, out);
  }
  if (match(TokenType::BeginObject)) {
    // { "$date" : { "$numberLong" : "<millis>" } }
    std::string k;
    const Token& key_token = peek();
    if (!parse_key(k)) return false;
    if (k != "$numberLong") {
      return error_at(parser_errc::unexpected_token, key_token, "expected $numberLong, found " + k);
    }
    std::string text;
    if (!expect(TokenType::Colon, "':'")) return false;
    const Token& value_token = peek();
    if (!parse_string_argument(text) || !expect(TokenType::EndObject, "'}'")) return false;
    std::int64_t millis = 0;
    if (!parse_int64_text(text, millis)) {
      return error_at(parser_errc::invalid_literal, value_token, "invalid $numberLong: " + text);
    }
    out = Value::date_time(millis);
    return true;
  }
  return unexpected("date value");
}

bool Parser::parse_timestamp_wrapper(Value& out) noexcept {
  const Token& arg = peek();
  if (!expect(TokenType::BeginObject, "'{'")) {
    return false;
  }

  std::int64_t t = 0;
  std::int64_t i = 0;
  bool have_t = false;
  bool have_i = false;
  while (!have_t || !have_i) {
    std::string k;
    const Token& key_token = peek();
    if (!parse_key(k) || !expect(TokenType::Colon, "':'")) return false;
    if (k == "t" && !have_t) {
      if (!parse_integer_argument(t)) return false;
      have_t = true;
    } else if (k == "i" && !have_i) {
      if (!parse_integer_argument(i)) return false;
      have_i = true;
    } else {
      return error_at(parser_errc::unexpected_token, key_token, "unexpected key in $timestamp: " + k);
    }
    if (!have_t || !have_i) {
      if (!expect(TokenType::Comma, "','")) return false;
    }
  }
  if (!expect(TokenType::EndObject, "'}'")) {
    return false;
  }
  return make_timestamp(arg, t, i, out);
}

bool Parser::parse_regular_expression_wrapper(Value& out) noexcept {
  if (!expect(TokenType::BeginObject, "'{'")) {
    return false;
  }

  std::string pattern;
  std::string options;
  bool have_pattern = false;
  bool have_options = false;
  while (!have_pattern || !have_options) {
    std::string k;
    const Token& key_token = peek();
    if (!parse_key(k) || !expect(TokenType::Colon, "':'")) return false;
    if (k == "pattern" && !have_pattern) {
      if (!parse_string_argument(pattern)) return false;
      have_pattern = true;
    } else if (k == "options" && !have_options) {
      if (!parse_string_argument(options)) return false;
      have_options = true;
    } else {
      return error_at(parser_errc::unexpected_token, key_token, "unexpected key in $regularExpression: " + k);
    }
    if (!have_pattern || !have_options) {
      if (!expect(TokenType::Comma, "','")) return false;
    }
  }
  if (!expect(TokenType::EndObject, "'}'")) {
    return false;
  }
  out = Value::regex(std::move(pattern), std::move(options));
  return true;
}

bool Parser::parse_code_wrapper(Value& out, std::size_t depth) noexcept {
  std::string code;
  if (!parse_string_argument(code)) {
    return false;
  }
  if (!match(TokenType::Comma)) {
    out = Value(bson::JavaScript{std::move(code)});
    return true;
  }

  std::string k;
  const Token& key_token = peek();
  if (!parse_key(k)) return false;
  if (k != "$scope") {
    return error_at(parser_errc::unexpected_token, key_token, "expected $scope, found " + k);
  }
  bson::Document scope;
  if (!expect(TokenType::Colon, "':'") || !expect(TokenType::BeginObject, "'{'") ||
      !parse_document_body(scope, depth + 1)) {
    return false;
  }
  out = Value(bson::JavaScriptWithScope{std::move(code), std::move(scope)});
  return true;
}

// ---------------------------------------------------------------------------
// 字面量 -> 值
// ---------------------------------------------------------------------------

bool Parser::make_guid(const Token& at, std::string_view text, GuidRepresentation representation, Value& out) noexcept {
  bson::Guid guid;
  if (bson::Guid::parse(text, guid)) {
    return error_at(parser_errc::invalid_literal, at, "invalid GUID: " + std::string(text));
  }
  bson::Guid::bytes_type packed{};
  if (bson::guid_to_bytes(guid, representation, packed)) {
    return error_at(parser_errc::invalid_literal, at, "cannot pack GUID");
  }

  // legacy 表示法：v2 标记为该表示法，v3 不做标记
  auto tag = representation;
  if (representation != GuidRepresentation::standard &&
      settings_.guid_representation_mode() == bson::GuidRepresentationMode::v3) {
    tag = GuidRepresentation::unspecified;
  }

  bson::Binary b;
  if (bson::Binary::create(bson::subtype_for(representation),
                           std::vector<bson::byte>(packed.begin(), packed.end()),
                           tag,
                           b)) {
    return error_at(parser_errc::invalid_literal, at, "invalid GUID binary");
  }
  out = Value(std::move(b));
  return true;
}

bool Parser::make_binary(const Token& at, std::int64_t subtype, std::vector<bson::byte> bytes, Value& out) noexcept {
  if (subtype < 0 || subtype > 0xFF) {
    return error_at(parser_errc::invalid_literal, at, "binary subtype out of range");
  }
  const auto st = static_cast<bson::binary_subtype>(subtype);

  auto representation = GuidRepresentation::unspecified;
  if (st == bson::binary_subtype::uuid_standard) {
    representation = GuidRepresentation::standard;
  } else if (st == bson::binary_subtype::uuid_legacy &&
             settings_.guid_representation_mode() == bson::GuidRepresentationMode::v2 &&
             settings_.guid_representation() != GuidRepresentation::standard) {
    representation = settings_.guid_representation();
  }

  bson::Binary b;
  if (bson::Binary::create(st, std::move(bytes), representation, b)) {
    return error_at(parser_errc::invalid_literal, at, "invalid binary value for subtype " + std::to_string(subtype));
  }
  out = Value(std::move(b));
  return true;
}

bool Parser::make_date(const Token& at, std::string_view iso, Value& out) noexcept {
  std::int64_t millis = 0;
  if (!detail::parse_iso_date(iso, millis)) {
    return error_at(parser_errc::invalid_literal, at, "invalid date: " + std::string(iso));
  }
  out = Value::date_time(millis);
  return true;
}

bool Parser::make_timestamp(const Token& at, std::int64_t t, std::int64_t i, Value& out) noexcept {
  // 输出端按有符号 32 位写出，这里同时接受有符号与无符号范围
  constexpr std::int64_t kMin = std::numeric_limits<std::int32_t>::min();
  constexpr std::int64_t kMax = std::numeric_limits<std::uint32_t>::max();
  if (t < kMin || t > kMax || i < kMin || i > kMax) {
    return error_at(parser_errc::invalid_literal, at, "timestamp component out of range");
  }
  out = Value(bson::Timestamp(static_cast<std::uint32_t>(t), static_cast<std::uint32_t>(i)));
  return true;
}

// ---------------------------------------------------------------------------
// 入口
// ---------------------------------------------------------------------------

namespace {

template <class Result>
bool lex(std::string_view text, std::vector<Token>& tokens, Result& result) {
  Lexer lexer(text);
  auto lexed = lexer.tokenize();
  if (lexed.ec) {
    result.ec = lexed.ec;
    result.error_line = lexed.error_line;
    result.error_column = lexed.error_column;
    result.error_offset = lexed.error_offset;
    result.error_message = std::move(lexed.error_message);
    return false;
  }
  tokens = std::move(lexed.tokens);
  return true;
}

template <class Result>
void log_failure(const Result& result) {
  if (!result.ec) {
    return;
  }
  if (const auto& lg = core::detail::logger()) {
    lg->debug("text parse failed at {}:{} (offset {}): {} [{}]",
              result.error_line,
              result.error_column,
              result.error_offset,
              result.error_message,
              result.ec.category().name());
  }
}

}  // namespace

ParseResult parse(std::string_view text, const ReaderSettings& settings) {
  ParseResult result;
  std::vector<Token> tokens;
  if (lex(text, tokens, result)) {
    Parser parser(std::move(tokens), settings);
    result = parser.parse();
  }
  log_failure(result);
  return result;
}

ValueParseResult parse_value(std::string_view text, const ReaderSettings& settings) {
  ValueParseResult result;
  std::vector<Token> tokens;
  if (lex(text, tokens, result)) {
    Parser parser(std::move(tokens), settings);
    result = parser.parse_single_value();
  }
  log_failure(result);
  return result;
}

}  // namespace bsonx::json
