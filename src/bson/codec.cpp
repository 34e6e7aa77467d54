#include "bsonx/bson/codec.hpp"

#include "bsonx/core/byte_cursor.hpp"
#include "bsonx/utils/hex.hpp"

#include "core/log_internal.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <type_traits>

namespace bsonx::bson {
namespace {

using core::ByteReader;
using core::ByteWriter;

constexpr std::size_t kDocumentOverhead = 5;  // 长度前缀 + 结束符

/*
 * 解码状态机（每个文档）：
 *   Start -> 读长度 -> 读标签
 *     标签 == 0      -> Done（必须恰好落在长度边界）
 *     否则 -> 读名字 -> 按标签读值 -> 读标签 ...
 * 嵌入文档/数组/scope 递归进入，深度 + 1。
 */
class Decoder final {
 public:
  Decoder(bytes_view in, const ReaderSettings& settings) noexcept : r_(in), settings_(settings) {}

  std::error_code document(Document& out, std::size_t depth) noexcept;

  [[nodiscard]] std::size_t position() const noexcept { return r_.position(); }
  [[nodiscard]] std::size_t error_offset() const noexcept { return error_offset_; }
  [[nodiscard]] byte error_tag() const noexcept { return error_tag_; }

 private:
  std::error_code fail(std::error_code ec, std::size_t offset) noexcept {
    error_offset_ = offset;
    return ec;
  }

  // 读长度前缀并校验，返回文档结束位置
  std::error_code begin_document(std::size_t depth, std::size_t& end) noexcept;
  std::error_code elements(std::size_t end, std::size_t depth, Document* doc, Array* arr) noexcept;
  std::error_code value(bson_type type, Value& out, std::size_t depth) noexcept;
  std::error_code binary(Binary& out) noexcept;
  std::error_code javascript_with_scope(JavaScriptWithScope& out, std::size_t depth) noexcept;

  ByteReader r_;
  const ReaderSettings& settings_;
  std::size_t error_offset_{0};
  byte error_tag_{0};
};

std::error_code Decoder::begin_document(std::size_t depth, std::size_t& end) noexcept {
  const auto start = r_.position();
  if (depth > settings_.max_serialization_depth()) {
    return fail(make_error_code(errc::max_depth_exceeded), start);
  }

  std::int32_t length = 0;
  auto ec = r_.read_i32(length);
  if (ec) {
    return fail(ec, start);
  }
  if (length < static_cast<std::int32_t>(kDocumentOverhead) ||
      static_cast<std::size_t>(length) > r_.remaining() + 4 ||
      static_cast<std::size_t>(length) > settings_.max_document_size()) {
    return fail(make_error_code(errc::invalid_document_length), start);
  }
  end = start + static_cast<std::size_t>(length);
  return {};
}

std::error_code Decoder::document(Document& out, std::size_t depth) noexcept {
  std::size_t end = 0;
  auto ec = begin_document(depth, end);
  if (ec) {
    return ec;
  }
  return elements(end, depth, &out, nullptr);
}

std::error_code Decoder::elements(std::size_t end, std::size_t depth, Document* doc, Array* arr) noexcept {
  const bool validate = settings_.validate_utf8();
  while (true) {
    const auto tag_offset = r_.position();
    if (tag_offset >= end) {
      return fail(make_error_code(errc::missing_document_terminator), tag_offset);
    }

    byte tag = 0;
    auto ec = r_.read_u8(tag);
    if (ec) {
      return fail(ec, tag_offset);
    }
    if (tag == 0) {
      if (r_.position() != end) {
        return fail(make_error_code(errc::invalid_document_length), tag_offset);
      }
      return {};
    }

    const auto type = bson_type_from_byte(tag);
    if (!type) {
      error_tag_ = tag;
      return fail(make_error_code(errc::invalid_type), tag_offset);
    }

    std::string name;
    const auto name_offset = r_.position();
    ec = r_.read_cstring(name, validate);
    if (ec) {
      return fail(ec, name_offset);
    }

    Value v;
    ec = value(*type, v, depth);
    if (ec) {
      return ec;
    }
    if (r_.position() > end) {
      return fail(make_error_code(errc::invalid_document_length), tag_offset);
    }

    if (doc != nullptr) {
      doc->append(std::move(name), std::move(v));
    } else {
      arr->values.push_back(std::move(v));
    }
  }
}

std::error_code Decoder::binary(Binary& out) noexcept {
  const auto start = r_.position();
  std::int32_t length = 0;
  auto ec = r_.read_i32(length);
  if (ec) {
    return fail(ec, start);
  }
  byte subtype_byte = 0;
  ec = r_.read_u8(subtype_byte);
  if (ec) {
    return fail(ec, start);
  }
  if (length < 0 || static_cast<std::size_t>(length) > r_.remaining()) {
    return fail(make_error_code(errc::invalid_binary_length), start);
  }

  auto subtype = static_cast<binary_subtype>(subtype_byte);
  if (subtype == binary_subtype::old_binary) {
    // 子类型 2 历史上带两层长度：外层 = 内层 + 4
    std::int32_t inner = 0;
    ec = r_.read_i32(inner);
    if (ec) {
      return fail(ec, start);
    }
    if (inner != length - 4) {
      return fail(make_error_code(errc::invalid_binary_length), start);
    }
    length = inner;
    if (settings_.fix_old_binary_subtype_on_input()) {
      subtype = binary_subtype::binary;
      if (const auto& lg = core::detail::logger()) {
        lg->warn("old binary subtype 0x02 at offset {} normalized to 0x00", start);
      }
    }
  }

  bytes_view payload{};
  ec = r_.read_bytes(static_cast<std::size_t>(length), payload);
  if (ec) {
    return fail(ec, start);
  }

  auto representation = GuidRepresentation::unspecified;
  if (is_uuid_subtype(subtype)) {
    if (payload.size() != 16) {
      return fail(make_error_code(errc::invalid_binary_length), start);
    }
    const auto reader_repr = settings_.guid_representation();
    if (settings_.guid_representation_mode() == GuidRepresentationMode::v2 &&
        reader_repr != GuidRepresentation::unspecified) {
      if (subtype != subtype_for(reader_repr)) {
        return fail(make_error_code(errc::guid_representation_mismatch), start);
      }
      representation = reader_repr;
    } else if (subtype == binary_subtype::uuid_standard) {
      representation = GuidRepresentation::standard;
    }
  }

  ec = Binary::create(subtype, std::vector<byte>(payload.begin(), payload.end()), representation, out);
  if (ec) {
    return fail(ec, start);
  }
  return {};
}

std::error_code Decoder::javascript_with_scope(JavaScriptWithScope& out, std::size_t depth) noexcept {
  const auto start = r_.position();
  std::int32_t total = 0;
  auto ec = r_.read_i32(total);
  if (ec) {
    return fail(ec, start);
  }
  // 最小：4(total) + 5(空字符串) + 5(空文档)
  if (total < 14 || static_cast<std::size_t>(total) > r_.remaining() + 4) {
    return fail(make_error_code(errc::invalid_scope_length), start);
  }

  const auto code_offset = r_.position();
  ec = r_.read_string(out.code, settings_.validate_utf8());
  if (ec) {
    return fail(ec, code_offset);
  }
  ec = document(out.scope, depth + 1);
  if (ec) {
    return ec;
  }
  if (r_.position() - start != static_cast<std::size_t>(total)) {
    return fail(make_error_code(errc::invalid_scope_length), start);
  }
  return {};
}

std::error_code Decoder::value(bson_type type, Value& out, std::size_t depth) noexcept {
  const auto start = r_.position();
  const bool validate = settings_.validate_utf8();
  std::error_code ec;

  switch (type) {
    case bson_type::double_: {
      double v = 0.0;
      ec = r_.read_double(v);
      out = Value(Double{v});
      break;
    }
    case bson_type::string: {
      std::string s;
      ec = r_.read_string(s, validate);
      out = Value(String{std::move(s)});
      break;
    }
    case bson_type::document: {
      Document d;
      ec = document(d, depth + 1);
      if (ec) {
        return ec;
      }
      out = Value(std::move(d));
      return {};
    }
    case bson_type::array: {
      std::size_t end = 0;
      ec = begin_document(depth + 1, end);
      if (ec) {
        return ec;
      }
      Array a;
      ec = elements(end, depth + 1, nullptr, &a);
      if (ec) {
        return ec;
      }
      out = Value(std::move(a));
      return {};
    }
    case bson_type::binary: {
      Binary b;
      ec = binary(b);
      if (ec) {
        return ec;
      }
      out = Value(std::move(b));
      return {};
    }
    case bson_type::undefined:
      out = Value(Undefined{});
      break;
    case bson_type::object_id: {
      bytes_view raw{};
      ec = r_.read_bytes(12, raw);
      if (!ec) {
        ObjectId::bytes_type id{};
        std::copy(raw.begin(), raw.end(), id.begin());
        out = Value(ObjectId(id));
      }
      break;
    }
    case bson_type::boolean: {
      byte b = 0;
      ec = r_.read_u8(b);
      if (!ec && b > 1) {
        ec = make_error_code(errc::invalid_boolean);
      }
      out = Value(Boolean{b == 1});
      break;
    }
    case bson_type::date_time: {
      std::int64_t ms = 0;
      ec = r_.read_i64(ms);
      out = Value(DateTime{ms});
      break;
    }
    case bson_type::null:
      out = Value(Null{});
      break;
    case bson_type::regular_expression: {
      RegularExpression re;
      ec = r_.read_cstring(re.pattern, validate);
      if (!ec) {
        ec = r_.read_cstring(re.options, validate);
      }
      out = Value(std::move(re));
      break;
    }
    case bson_type::javascript: {
      JavaScript js;
      ec = r_.read_string(js.code, validate);
      out = Value(std::move(js));
      break;
    }
    case bson_type::symbol: {
      Symbol sym;
      ec = r_.read_string(sym.name, validate);
      out = Value(std::move(sym));
      break;
    }
    case bson_type::javascript_with_scope: {
      JavaScriptWithScope js;
      ec = javascript_with_scope(js, depth);
      if (ec) {
        return ec;
      }
      out = Value(std::move(js));
      return {};
    }
    case bson_type::int32: {
      std::int32_t v = 0;
      ec = r_.read_i32(v);
      out = Value(Int32{v});
      break;
    }
    case bson_type::timestamp: {
      std::uint64_t v = 0;
      ec = r_.read_u64(v);
      out = Value(Timestamp{v});
      break;
    }
    case bson_type::int64: {
      std::int64_t v = 0;
      ec = r_.read_i64(v);
      out = Value(Int64{v});
      break;
    }
    case bson_type::decimal128: {
      std::uint64_t low = 0;
      std::uint64_t high = 0;
      ec = r_.read_u64(low);
      if (!ec) {
        ec = r_.read_u64(high);
      }
      out = Value(Decimal128{high, low});
      break;
    }
    case bson_type::min_key:
      out = Value(MinKey{});
      break;
    case bson_type::max_key:
      out = Value(MaxKey{});
      break;
    case bson_type::end_of_document:
      ec = make_error_code(errc::invalid_type);
      break;
  }

  if (ec) {
    return fail(ec, start);
  }
  return {};
}

class Encoder final {
 public:
  Encoder(ByteWriter& w, const WriterSettings& settings) noexcept : w_(w), settings_(settings) {}

  std::error_code document(const Document& doc, std::size_t depth);
  std::error_code array(const Array& arr, std::size_t depth);

 private:
  std::error_code element(std::string_view name, const Value& v, std::size_t depth);
  std::error_code value(const Value& v, std::size_t depth);
  std::error_code binary(const Binary& b);
  std::error_code finish_document(std::size_t at);

  ByteWriter& w_;
  const WriterSettings& settings_;
};

std::error_code Encoder::finish_document(std::size_t at) {
  w_.write_u8(0);
  if (w_.position() - at > settings_.max_document_size()) {
    return make_error_code(errc::document_too_large);
  }
  return w_.patch_length(at);
}

std::error_code Encoder::document(const Document& doc, std::size_t depth) {
  if (depth > settings_.max_serialization_depth()) {
    return make_error_code(errc::max_depth_exceeded);
  }
  const auto at = w_.reserve_length();
  for (const auto& e : doc) {
    auto ec = element(e.name, e.value, depth);
    if (ec) {
      return ec;
    }
  }
  return finish_document(at);
}

std::error_code Encoder::array(const Array& arr, std::size_t depth) {
  if (depth > settings_.max_serialization_depth()) {
    return make_error_code(errc::max_depth_exceeded);
  }
  const auto at = w_.reserve_length();
  for (std::size_t i = 0; i < arr.values.size(); ++i) {
    auto ec = element(std::to_string(i), arr.values[i], depth);
    if (ec) {
      return ec;
    }
  }
  return finish_document(at);
}

std::error_code Encoder::element(std::string_view name, const Value& v, std::size_t depth) {
  w_.write_u8(static_cast<byte>(v.type()));
  auto ec = w_.write_cstring(name);
  if (ec) {
    return ec;
  }
  return value(v, depth);
}

std::error_code Encoder::binary(const Binary& b) {
  auto subtype = b.subtype();
  const auto& bytes = b.bytes();

  if (is_uuid_subtype(subtype) && settings_.guid_representation_mode() == GuidRepresentationMode::v2 &&
      settings_.check_guid_representation()) {
    const auto writer_repr = settings_.guid_representation();
    if (writer_repr != GuidRepresentation::unspecified) {
      if (subtype != subtype_for(writer_repr)) {
        return make_error_code(errc::guid_representation_mismatch);
      }
      if (b.guid_representation() != GuidRepresentation::unspecified && b.guid_representation() != writer_repr) {
        return make_error_code(errc::guid_representation_mismatch);
      }
    }
  }

  if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()) - 4) {
    return make_error_code(errc::invalid_binary_length);
  }
  const auto length = static_cast<std::int32_t>(bytes.size());

  if (subtype == binary_subtype::old_binary && settings_.fix_old_binary_subtype_on_output()) {
    subtype = binary_subtype::binary;
  }
  if (subtype == binary_subtype::old_binary) {
    w_.write_i32(length + 4);
    w_.write_u8(static_cast<byte>(subtype));
    w_.write_i32(length);
  } else {
    w_.write_i32(length);
    w_.write_u8(static_cast<byte>(subtype));
  }
  w_.write_bytes(bytes_view{bytes.data(), bytes.size()});
  return {};
}

std::error_code Encoder::value(const Value& v, std::size_t depth) {
  return std::visit(
    [&](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Double>) {
        w_.write_double(x.value);
        return {};
      } else if constexpr (std::is_same_v<T, String>) {
        return w_.write_string(x.value);
      } else if constexpr (std::is_same_v<T, Document>) {
        return document(x, depth + 1);
      } else if constexpr (std::is_same_v<T, Array>) {
        return array(x, depth + 1);
      } else if constexpr (std::is_same_v<T, Binary>) {
        return binary(x);
      } else if constexpr (std::is_same_v<T, ObjectId>) {
        w_.write_bytes(bytes_view{x.bytes().data(), x.bytes().size()});
        return {};
      } else if constexpr (std::is_same_v<T, Boolean>) {
        w_.write_u8(x.value ? 1 : 0);
        return {};
      } else if constexpr (std::is_same_v<T, DateTime>) {
        w_.write_i64(x.millis);
        return {};
      } else if constexpr (std::is_same_v<T, RegularExpression>) {
        auto ec = w_.write_cstring(x.pattern);
        if (ec) {
          return ec;
        }
        return w_.write_cstring(x.options);
      } else if constexpr (std::is_same_v<T, JavaScript>) {
        return w_.write_string(x.code);
      } else if constexpr (std::is_same_v<T, Symbol>) {
        return w_.write_string(x.name);
      } else if constexpr (std::is_same_v<T, JavaScriptWithScope>) {
        const auto at = w_.reserve_length();
        auto ec = w_.write_string(x.code);
        if (ec) {
          return ec;
        }
        ec = document(x.scope, depth + 1);
        if (ec) {
          return ec;
        }
        return w_.patch_length(at);
      } else if constexpr (std::is_same_v<T, Int32>) {
        w_.write_i32(x.value);
        return {};
      } else if constexpr (std::is_same_v<T, Timestamp>) {
        w_.write_u64(x.value());
        return {};
      } else if constexpr (std::is_same_v<T, Int64>) {
        w_.write_i64(x.value);
        return {};
      } else if constexpr (std::is_same_v<T, Decimal128>) {
        w_.write_u64(x.low_bits());
        w_.write_u64(x.high_bits());
        return {};
      } else {
        // Undefined / Null / MinKey / MaxKey：无负载
        return {};
      }
    },
    v.storage());
}

// ---- 长度计算（不落地写入） ----

std::size_t string_size(const std::string& s) noexcept { return 4 + s.size() + 1; }

std::error_code value_size(const Value& v, std::size_t depth, const WriterSettings& settings, std::size_t& out) noexcept;

std::error_code elements_size(const Document* doc,
                              const Array* arr,
                              std::size_t depth,
                              const WriterSettings& settings,
                              std::size_t& out) noexcept {
  if (depth > settings.max_serialization_depth()) {
    return make_error_code(errc::max_depth_exceeded);
  }
  std::size_t total = kDocumentOverhead;
  const std::size_t n = doc != nullptr ? doc->size() : arr->values.size();
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t name_len = doc != nullptr ? (*doc)[i].name.size() : std::to_string(i).size();
    const Value& v = doc != nullptr ? (*doc)[i].value : arr->values[i];
    std::size_t vs = 0;
    auto ec = value_size(v, depth, settings, vs);
    if (ec) {
      return ec;
    }
    total += 1 + name_len + 1 + vs;
  }
  out = total;
  return {};
}

std::error_code value_size(const Value& v, std::size_t depth, const WriterSettings& settings, std::size_t& out) noexcept {
  return std::visit(
    [&](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Double> || std::is_same_v<T, DateTime> || std::is_same_v<T, Int64> ||
                    std::is_same_v<T, Timestamp>) {
        out = 8;
      } else if constexpr (std::is_same_v<T, String>) {
        out = string_size(x.value);
      } else if constexpr (std::is_same_v<T, JavaScript>) {
        out = string_size(x.code);
      } else if constexpr (std::is_same_v<T, Symbol>) {
        out = string_size(x.name);
      } else if constexpr (std::is_same_v<T, Document>) {
        return elements_size(&x, nullptr, depth + 1, settings, out);
      } else if constexpr (std::is_same_v<T, Array>) {
        return elements_size(nullptr, &x, depth + 1, settings, out);
      } else if constexpr (std::is_same_v<T, Binary>) {
        const bool inner_length =
          x.subtype() == binary_subtype::old_binary && !settings.fix_old_binary_subtype_on_output();
        out = 4 + 1 + (inner_length ? 4 : 0) + x.bytes().size();
      } else if constexpr (std::is_same_v<T, ObjectId>) {
        out = 12;
      } else if constexpr (std::is_same_v<T, Boolean>) {
        out = 1;
      } else if constexpr (std::is_same_v<T, RegularExpression>) {
        out = x.pattern.size() + 1 + x.options.size() + 1;
      } else if constexpr (std::is_same_v<T, JavaScriptWithScope>) {
        std::size_t scope = 0;
        auto ec = elements_size(&x.scope, nullptr, depth + 1, settings, scope);
        if (ec) {
          return ec;
        }
        out = 4 + string_size(x.code) + scope;
      } else if constexpr (std::is_same_v<T, Int32>) {
        out = 4;
      } else if constexpr (std::is_same_v<T, Decimal128>) {
        out = 16;
      } else {
        out = 0;
      }
      return {};
    },
    v.storage());
}

void log_decode_failure(bytes_view in, const std::error_code& ec, std::size_t offset) {
  const auto& lg = core::detail::logger();
  if (!lg) {
    return;
  }
  lg->debug("bson decode failed at offset {}: [{}] {}", offset, ec.category().name(), ec.message());
  if (lg->should_log(spdlog::level::trace)) {
    const auto from = offset > 16 ? offset - 16 : 0;
    const auto n = std::min<std::size_t>(in.size() - std::min(from, in.size()), 48);
    lg->trace("bytes near failure (from offset {}):\n{}", from, utils::hex_dump(in.subspan(std::min(from, in.size()), n)));
  }
}

}  // namespace

DecodeResult decode(bytes_view in, const ReaderSettings& settings) {
  DecodeResult result;
  Decoder d(in, settings);
  result.ec = d.document(result.document, 1);
  if (!result.ec && d.position() != in.size()) {
    result.ec = make_error_code(errc::trailing_bytes);
    result.error_offset = d.position();
  } else if (result.ec) {
    result.error_offset = d.error_offset();
    result.error_tag = d.error_tag();
  }
  if (result.ec) {
    log_decode_failure(in, result.ec, result.error_offset);
    result.document.clear();
  }
  return result;
}

std::error_code decode_one(bytes_view in,
                           Document& out,
                           std::size_t& consumed,
                           std::size_t& error_offset,
                           const ReaderSettings& settings) noexcept {
  Decoder d(in, settings);
  Document doc;
  auto ec = d.document(doc, 1);
  if (ec) {
    consumed = 0;
    error_offset = d.error_offset();
    log_decode_failure(in, ec, error_offset);
    return ec;
  }
  consumed = d.position();
  error_offset = 0;
  out = std::move(doc);
  return {};
}

std::error_code encode(const Document& doc, std::vector<byte>& out, const WriterSettings& settings) noexcept {
  const auto offset = out.size();
  std::size_t expected = 0;
  auto ec = encoded_size(doc, expected, settings);
  if (ec) {
    return ec;
  }

  ByteWriter w(std::move(out));
  w.reserve(offset + expected);
  Encoder e(w, settings);
  ec = e.document(doc, 1);
  if (ec) {
    w.truncate(offset);
  }
  out = w.release();
  return ec;
}

std::error_code encoded_size(const Document& doc, std::size_t& out_size, const WriterSettings& settings) noexcept {
  return elements_size(&doc, nullptr, 1, settings, out_size);
}

}  // namespace bsonx::bson
