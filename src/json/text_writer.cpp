#include "bsonx/json/text_writer.hpp"

#include "bsonx/core/byte_cursor.hpp"
#include "bsonx/json/writer_settings.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace bsonx::json {

namespace {

class WriterErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "bsonx.json.writer"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<writer_errc>(ev)) {
      case writer_errc::ok: return "success";
      case writer_errc::invalid_state: return "writer method called in invalid state";
      case writer_errc::missing_converter: return "converter set is missing a converter";
      case writer_errc::invalid_converter_slot: return "value type has no converter slot";
      case writer_errc::guid_representation_mismatch: return "binary subtype does not match guid representation";
      case writer_errc::max_depth_exceeded: return "maximum serialization depth exceeded";
    }
    return "unknown writer error";
  }
};

const WriterErrorCategory kWriterErrorCategory{};

constexpr std::uint32_t kReplacementCharacter = 0xFFFDu;

struct CodePointRange {
  std::uint32_t first;
  std::uint32_t last;
};

// 需要 \uXXXX 输出的码点：控制字符 (Cc)、格式字符 (Cf)、行/段分隔符 (Zl/Zp)、
// 私用区 (Co) 与非字符。按 first 升序。
constexpr std::array<CodePointRange, 26> kEscapedRanges{{
    {0x0000, 0x001F},   {0x007F, 0x009F},   {0x00AD, 0x00AD},   {0x0600, 0x0605},
    {0x061C, 0x061C},   {0x06DD, 0x06DD},   {0x070F, 0x070F},   {0x0890, 0x0891},
    {0x08E2, 0x08E2},   {0x180E, 0x180E},   {0x200B, 0x200F},   {0x2028, 0x202E},
    {0x2060, 0x2064},   {0x2066, 0x206F},   {0xE000, 0xF8FF},   {0xFDD0, 0xFDEF},
    {0xFEFF, 0xFEFF},   {0xFFF9, 0xFFFB},   {0x110BD, 0x110BD}, {0x110CD, 0x110CD},
    {0x13430, 0x1343F}, {0x1BCA0, 0x1BCA3}, {0x1D173, 0x1D17A}, {0xE0001, 0xE0001},
    {0xE0020, 0xE007F}, {0xF0000, 0x10FFFF},
}};

bool needs_unicode_escape(std::uint32_t cp) noexcept {
  if (cp >= 0x20u && cp < 0x7Fu) {
    return false;
  }
  // 各平面末尾的非字符 U+nFFFE / U+nFFFF
  if ((cp & 0xFFFEu) == 0xFFFEu) {
    return true;
  }
  for (const auto& r : kEscapedRanges) {
    if (cp < r.first) {
      return false;
    }
    if (cp <= r.last) {
      return true;
    }
  }
  return false;
}

void append_unicode_escape(std::string& out, std::uint32_t unit) {
  std::array<char, 8> buf{};
  std::snprintf(buf.data(), buf.size(), "\\u%04x", static_cast<unsigned>(unit));
  out += buf.data();
}

}  // namespace

const std::error_category& writer_error_category() noexcept {
  return kWriterErrorCategory;
}

std::error_code make_error_code(writer_errc e) noexcept {
  return {static_cast<int>(e), kWriterErrorCategory};
}

std::string quote_string(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  std::size_t pos = 0;
  while (pos < value.size()) {
    const char c = value[pos];
    switch (c) {
      case '"': out += "\\\""; ++pos; continue;
      case '\\': out += "\\\\"; ++pos; continue;
      case '\b': out += "\\b"; ++pos; continue;
      case '\f': out += "\\f"; ++pos; continue;
      case '\n': out += "\\n"; ++pos; continue;
      case '\r': out += "\\r"; ++pos; continue;
      case '\t': out += "\\t"; ++pos; continue;
      default: break;
    }

    const auto start = pos;
    std::uint32_t cp = 0;
    if (!core::decode_utf8(value, pos, cp)) {
      // 非法字节逐个替换为 U+FFFD
      append_unicode_escape(out, kReplacementCharacter);
      ++pos;
      continue;
    }
    if (!needs_unicode_escape(cp)) {
      out.append(value.substr(start, pos - start));
    } else if (cp > 0xFFFFu) {
      const auto v = cp - 0x10000u;
      append_unicode_escape(out, 0xD800u + (v >> 10));
      append_unicode_escape(out, 0xDC00u + (v & 0x3FFu));
    } else {
      append_unicode_escape(out, cp);
    }
  }
  out.push_back('"');
  return out;
}

std::string format_double(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }

  std::array<char, 32> buf{};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
  if (ec != std::errc{}) {
    return "NaN";  // 32 字节足以容纳任意 double 的最短表示
  }
  std::string text(buf.data(), ptr);
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

bool name_needs_quotes(std::string_view name) noexcept {
  if (name.empty() || (name.front() >= '0' && name.front() <= '9')) {
    return true;
  }
  for (const char c : name) {
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (!alnum && c != '_') {
      return true;
    }
  }
  return false;
}

TextWriter::TextWriter(const WriterSettings& settings) : settings_(settings) {
  contexts_.push_back(Context{});
}

std::string TextWriter::release() noexcept {
  return std::move(out_);
}

void TextWriter::push_context(ContextType type) {
  Context ctx;
  ctx.type = type;
  ctx.indentation = contexts_.back().indentation + settings_.indent_chars();
  contexts_.push_back(std::move(ctx));
}

void TextWriter::pop_context() noexcept {
  contexts_.pop_back();
}

void TextWriter::prepare_to_write_value() {
  auto& ctx = contexts_.back();
  if (ctx.type == ContextType::array && ctx.has_elements) {
    out_ += ", ";
  }
  ctx.has_elements = true;
}

void TextWriter::after_value() noexcept {
  switch (contexts_.back().type) {
    case ContextType::document: state_ = State::name; break;
    case ContextType::array: state_ = State::value; break;
    case ContextType::top_level: state_ = State::done; break;
  }
}

std::error_code TextWriter::write_start_document() noexcept {
  if (state_ != State::value) {
    return make_error_code(writer_errc::invalid_state);
  }
  prepare_to_write_value();
  out_ += '{';
  push_context(ContextType::document);
  state_ = State::name;
  return {};
}

std::error_code TextWriter::write_end_document() noexcept {
  if (state_ != State::name || contexts_.back().type != ContextType::document) {
    return make_error_code(writer_errc::invalid_state);
  }
  const auto& ctx = contexts_.back();
  if (settings_.indent() && ctx.has_elements) {
    out_ += settings_.new_line_chars();
    out_ += contexts_[contexts_.size() - 2].indentation;
    out_ += '}';
  } else {
    out_ += " }";
  }
  pop_context();
  after_value();
  return {};
}

std::error_code TextWriter::write_start_array() noexcept {
  if (state_ != State::value) {
    return make_error_code(writer_errc::invalid_state);
  }
  prepare_to_write_value();
  out_ += '[';
  push_context(ContextType::array);
  state_ = State::value;
  return {};
}

std::error_code TextWriter::write_end_array() noexcept {
  if (state_ != State::value || contexts_.back().type != ContextType::array) {
    return make_error_code(writer_errc::invalid_state);
  }
  out_ += ']';
  pop_context();
  after_value();
  return {};
}

std::error_code TextWriter::write_name(std::string_view name) noexcept {
  if (state_ != State::name) {
    return make_error_code(writer_errc::invalid_state);
  }
  auto& ctx = contexts_.back();
  if (ctx.has_elements) {
    out_ += ',';
  }
  if (settings_.indent()) {
    out_ += settings_.new_line_chars();
    out_ += ctx.indentation;
  } else {
    out_ += ' ';
  }
  if (settings_.always_quote_names() || name_needs_quotes(name)) {
    out_ += quote_string(name);
  } else {
    out_ += name;
  }
  out_ += " : ";
  state_ = State::value;
  return {};
}

std::error_code TextWriter::write_raw_value(std::string_view representation) noexcept {
  if (state_ != State::value) {
    return make_error_code(writer_errc::invalid_state);
  }
  prepare_to_write_value();
  out_ += representation;
  after_value();
  return {};
}

std::error_code TextWriter::write_string_value(std::string_view value) noexcept {
  return write_raw_value(quote_string(value));
}

std::error_code TextWriter::write_int32_value(std::int32_t value) noexcept {
  return write_raw_value(std::to_string(value));
}

std::error_code TextWriter::write_int64_value(std::int64_t value) noexcept {
  return write_raw_value(std::to_string(value));
}

std::error_code TextWriter::write_double_value(double value) noexcept {
  return write_raw_value(format_double(value));
}

std::error_code TextWriter::write_boolean_value(bool value) noexcept {
  return write_raw_value(value ? "true" : "false");
}

std::error_code TextWriter::write_null_value() noexcept {
  return write_raw_value("null");
}

}  // namespace bsonx::json
