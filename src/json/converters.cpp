#include "bsonx/json/converters.hpp"

#include "bsonx/utils/base64.hpp"
#include "iso_date.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

namespace bsonx::json::converters {

namespace {

using bson::binary_subtype;
using bson::GuidRepresentation;

template <class T, class F>
std::error_code visit_as(const bson::Value& value, F&& f) {
  const auto* v = value.get_if<T>();
  if (v == nullptr) {
    return make_error_code(writer_errc::invalid_converter_slot);
  }
  return f(*v);
}

// { "<name>" : <value> }
template <class F>
std::error_code write_wrapped(TextWriter& writer, std::string_view name, F&& write_value) {
  auto ec = writer.write_start_document();
  if (ec) return ec;
  ec = writer.write_name(name);
  if (ec) return ec;
  ec = write_value();
  if (ec) return ec;
  return writer.write_end_document();
}

std::string call(std::string_view function, std::string_view quoted_argument) {
  std::string out(function);
  out += '(';
  out += quoted_argument;
  out += ')';
  return out;
}

[[nodiscard]] std::string_view guid_constructor_name(GuidRepresentation r) noexcept {
  switch (r) {
    case GuidRepresentation::csharp_legacy: return "CSUUID";
    case GuidRepresentation::java_legacy: return "JUUID";
    case GuidRepresentation::python_legacy: return "PYUUID";
    case GuidRepresentation::standard: return "UUID";
    case GuidRepresentation::unspecified: break;
  }
  return "HexData";
}

std::string subtype_hex(binary_subtype subtype) {
  std::array<char, 4> buf{};
  std::snprintf(buf.data(), buf.size(), "%02x", static_cast<unsigned>(subtype));
  return std::string(buf.data());
}

// /pattern/options 形式：'/' 写成 "\/"，lexer 读回时还原。
// 无法无损往返时返回 false（调用方改用 RegExp("p", "o")）：
// 模式含换行、已转义的 '/'、以未配对的 '\' 结尾，或选项含非字母字符。
bool shell_regex_literal(std::string_view pattern, std::string_view options, std::string& out) {
  std::string text = "/";
  text.reserve(pattern.size() + options.size() + 4);
  bool escaped = false;
  for (const char c : pattern) {
    if (c == '\n') {
      return false;
    }
    if (c == '/') {
      if (escaped) {
        return false;
      }
      text += '\\';
    }
    text += c;
    escaped = !escaped && c == '\\';
  }
  if (escaped) {
    return false;
  }
  for (const char c : options) {
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  text += '/';
  text += options;
  out = std::move(text);
  return true;
}

// 与历史输出保持一致：秒与序号都按有符号 32 位输出
[[nodiscard]] std::int32_t signed32(std::uint32_t v) noexcept {
  return static_cast<std::int32_t>(v);
}

}  // namespace

std::error_code BinaryShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Binary>(value, [&](const bson::Binary& b) -> std::error_code {
    const auto subtype = b.subtype();
    if (!bson::is_uuid_subtype(subtype)) {
      std::string text = "new BinData(";
      text += std::to_string(static_cast<unsigned>(subtype));
      text += ", ";
      text += quote_string(utils::base64_encode(b.bytes()));
      text += ')';
      return writer.write_raw_value(text);
    }

    if (b.bytes().size() != 16) {
      return make_error_code(bson::guid_errc::invalid_length);
    }
    const auto representation = b.guid_representation();
    const bool is_standard = representation == GuidRepresentation::standard;
    if ((subtype == binary_subtype::uuid_legacy && is_standard) ||
        (subtype == binary_subtype::uuid_standard && !is_standard)) {
      return make_error_code(writer_errc::guid_representation_mismatch);
    }

    if (representation == GuidRepresentation::unspecified) {
      // 字节按原样以 8-4-4-4-12 分组输出
      bson::Guid raw;
      auto ec = bson::guid_from_bytes(b.bytes(), GuidRepresentation::standard, raw);
      if (ec) return ec;
      std::string text = "HexData(";
      text += std::to_string(static_cast<unsigned>(subtype));
      text += ", ";
      text += quote_string(raw.to_string());
      text += ')';
      return writer.write_raw_value(text);
    }

    bson::Guid guid;
    auto ec = bson::guid_from_bytes(b.bytes(), representation, guid);
    if (ec) return ec;
    return writer.write_raw_value(call(guid_constructor_name(representation), quote_string(guid.to_string())));
  });
}

std::error_code BinaryExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Binary>(value, [&](const bson::Binary& b) -> std::error_code {
    auto ec = writer.write_start_document();
    if (ec) return ec;
    ec = writer.write_name("$binary");
    if (ec) return ec;
    ec = writer.write_string_value(utils::base64_encode(b.bytes()));
    if (ec) return ec;
    ec = writer.write_name("$type");
    if (ec) return ec;
    ec = writer.write_string_value(subtype_hex(b.subtype()));
    if (ec) return ec;
    return writer.write_end_document();
  });
}

std::error_code BooleanStrict::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Boolean>(value, [&](const bson::Boolean& v) { return writer.write_boolean_value(v.value); });
}

std::error_code DateTimeShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::DateTime>(value, [&](const bson::DateTime& v) {
    std::string iso;
    if (detail::format_iso_date(v.millis, iso)) {
      return writer.write_raw_value(call("ISODate", quote_string(iso)));
    }
    return writer.write_raw_value("new Date(" + std::to_string(v.millis) + ")");
  });
}

std::error_code DateTimeExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::DateTime>(value, [&](const bson::DateTime& v) {
    return write_wrapped(writer, "$date", [&] { return writer.write_int64_value(v.millis); });
  });
}

std::error_code Decimal128Shell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Decimal128>(value, [&](const bson::Decimal128& v) {
    return writer.write_raw_value(call("NumberDecimal", quote_string(v.to_string())));
  });
}

std::error_code Decimal128Extended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Decimal128>(value, [&](const bson::Decimal128& v) {
    return write_wrapped(writer, "$numberDecimal", [&] { return writer.write_string_value(v.to_string()); });
  });
}

std::error_code DoubleWithDecimalPoint::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Double>(value, [&](const bson::Double& v) { return writer.write_double_value(v.value); });
}

std::error_code Int32Strict::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Int32>(value, [&](const bson::Int32& v) { return writer.write_int32_value(v.value); });
}

std::error_code Int64Shell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Int64>(value, [&](const bson::Int64& v) {
    const bool fits_int32 = v.value >= std::numeric_limits<std::int32_t>::min() &&
                            v.value <= std::numeric_limits<std::int32_t>::max();
    const auto digits = std::to_string(v.value);
    return writer.write_raw_value(call("NumberLong", fits_int32 ? digits : quote_string(digits)));
  });
}

std::error_code Int64Strict::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Int64>(value, [&](const bson::Int64& v) { return writer.write_int64_value(v.value); });
}

std::error_code JavaScriptExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::JavaScript>(value, [&](const bson::JavaScript& v) {
    return write_wrapped(writer, "$code", [&] { return writer.write_string_value(v.code); });
  });
}

std::error_code MaxKeyShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::MaxKey>(value, [&](const bson::MaxKey&) { return writer.write_raw_value("MaxKey"); });
}

std::error_code MaxKeyExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::MaxKey>(value, [&](const bson::MaxKey&) {
    return write_wrapped(writer, "$maxKey", [&] { return writer.write_int32_value(1); });
  });
}

std::error_code MinKeyShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::MinKey>(value, [&](const bson::MinKey&) { return writer.write_raw_value("MinKey"); });
}

std::error_code MinKeyExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::MinKey>(value, [&](const bson::MinKey&) {
    return write_wrapped(writer, "$minKey", [&] { return writer.write_int32_value(1); });
  });
}

std::error_code NullStrict::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Null>(value, [&](const bson::Null&) { return writer.write_null_value(); });
}

std::error_code ObjectIdShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::ObjectId>(value, [&](const bson::ObjectId& v) {
    return writer.write_raw_value(call("ObjectId", quote_string(v.to_string())));
  });
}

std::error_code ObjectIdExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::ObjectId>(value, [&](const bson::ObjectId& v) {
    return write_wrapped(writer, "$oid", [&] { return writer.write_string_value(v.to_string()); });
  });
}

std::error_code RegularExpressionShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::RegularExpression>(value, [&](const bson::RegularExpression& v) {
    std::string text;
    if (!shell_regex_literal(v.pattern, v.options, text)) {
      text = "RegExp(" + quote_string(v.pattern) + ", " + quote_string(v.options) + ")";
    }
    return writer.write_raw_value(text);
  });
}

std::error_code RegularExpressionExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::RegularExpression>(value, [&](const bson::RegularExpression& v) -> std::error_code {
    auto ec = writer.write_start_document();
    if (ec) return ec;
    ec = writer.write_name("$regex");
    if (ec) return ec;
    ec = writer.write_string_value(v.pattern);
    if (ec) return ec;
    ec = writer.write_name("$options");
    if (ec) return ec;
    ec = writer.write_string_value(v.options);
    if (ec) return ec;
    return writer.write_end_document();
  });
}

std::error_code StringStrict::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::String>(value, [&](const bson::String& v) { return writer.write_string_value(v.value); });
}

std::error_code SymbolExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Symbol>(value, [&](const bson::Symbol& v) {
    return write_wrapped(writer, "$symbol", [&] { return writer.write_string_value(v.name); });
  });
}

std::error_code TimestampShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Timestamp>(value, [&](const bson::Timestamp& v) {
    std::string text = "Timestamp(";
    text += std::to_string(signed32(v.seconds()));
    text += ", ";
    text += std::to_string(signed32(v.increment()));
    text += ')';
    return writer.write_raw_value(text);
  });
}

std::error_code TimestampExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Timestamp>(value, [&](const bson::Timestamp& v) {
    return write_wrapped(writer, "$timestamp", [&]() -> std::error_code {
      auto ec = writer.write_start_document();
      if (ec) return ec;
      ec = writer.write_name("t");
      if (ec) return ec;
      ec = writer.write_int32_value(signed32(v.seconds()));
      if (ec) return ec;
      ec = writer.write_name("i");
      if (ec) return ec;
      ec = writer.write_int32_value(signed32(v.increment()));
      if (ec) return ec;
      return writer.write_end_document();
    });
  });
}

std::error_code UndefinedShell::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Undefined>(value, [&](const bson::Undefined&) { return writer.write_raw_value("undefined"); });
}

std::error_code UndefinedExtended::write(const bson::Value& value, TextWriter& writer) const {
  return visit_as<bson::Undefined>(value, [&](const bson::Undefined&) {
    return write_wrapped(writer, "$undefined", [&] { return writer.write_boolean_value(true); });
  });
}

}  // namespace bsonx::json::converters
