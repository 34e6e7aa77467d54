#include "bsonx/json/writer.hpp"

#include "bsonx/json/text_writer.hpp"

#include "core/log_internal.hpp"

#include <type_traits>
#include <variant>

namespace bsonx::json {

namespace {

using bson::GuidRepresentation;

class DocumentWriter {
 public:
  DocumentWriter(const WriterSettings& settings, TextWriter& writer) noexcept
      : settings_(settings), writer_(writer) {}

  std::error_code document(const bson::Document& doc);

 private:
  std::error_code check_depth() const noexcept;
  std::error_code array(const bson::Array& arr);
  std::error_code javascript_with_scope(const bson::JavaScriptWithScope& js);
  std::error_code binary(const bson::Value& value, const bson::Binary& b);
  std::error_code converted(const bson::Value& value);
  std::error_code value(const bson::Value& v);

  const WriterSettings& settings_;
  TextWriter& writer_;
};

std::error_code DocumentWriter::check_depth() const noexcept {
  // 即将进入的层数 = 当前层数 + 1
  if (writer_.depth() + 1 > settings_.max_serialization_depth()) {
    return make_error_code(writer_errc::max_depth_exceeded);
  }
  return {};
}

std::error_code DocumentWriter::document(const bson::Document& doc) {
  auto ec = check_depth();
  if (ec) return ec;
  ec = writer_.write_start_document();
  if (ec) return ec;
  for (const auto& e : doc) {
    ec = writer_.write_name(e.name);
    if (ec) return ec;
    ec = value(e.value);
    if (ec) return ec;
  }
  return writer_.write_end_document();
}

std::error_code DocumentWriter::array(const bson::Array& arr) {
  auto ec = check_depth();
  if (ec) return ec;
  ec = writer_.write_start_array();
  if (ec) return ec;
  for (const auto& v : arr.values) {
    ec = value(v);
    if (ec) return ec;
  }
  return writer_.write_end_array();
}

std::error_code DocumentWriter::javascript_with_scope(const bson::JavaScriptWithScope& js) {
  auto ec = check_depth();
  if (ec) return ec;
  ec = writer_.write_start_document();
  if (ec) return ec;
  ec = writer_.write_name("$code");
  if (ec) return ec;
  ec = writer_.write_string_value(js.code);
  if (ec) return ec;
  ec = writer_.write_name("$scope");
  if (ec) return ec;
  ec = document(js.scope);
  if (ec) return ec;
  return writer_.write_end_document();
}

std::error_code DocumentWriter::binary(const bson::Value& value, const bson::Binary& b) {
  const auto representation = settings_.guid_representation();
  const bool substitute = b.subtype() == bson::binary_subtype::uuid_legacy &&
                          b.guid_representation() == GuidRepresentation::unspecified &&
                          settings_.guid_representation_mode() == bson::GuidRepresentationMode::v2 &&
                          representation != GuidRepresentation::unspecified &&
                          representation != GuidRepresentation::standard;
  if (!substitute) {
    return converted(value);
  }

  bson::Binary tagged;
  if (bson::Binary::create(b.subtype(), b.bytes(), representation, tagged)) {
    // 长度不合法：交给转换器报告
    return converted(value);
  }
  return converted(bson::Value(std::move(tagged)));
}

std::error_code DocumentWriter::converted(const bson::Value& value) {
  const auto* converter = settings_.converters().find(value.type());
  if (converter == nullptr) {
    return make_error_code(writer_errc::missing_converter);
  }
  return converter->write(value, writer_);
}

std::error_code DocumentWriter::value(const bson::Value& v) {
  return std::visit(
      [&](const auto& x) -> std::error_code {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bson::Document>) {
          return document(x);
        } else if constexpr (std::is_same_v<T, bson::Array>) {
          return array(x);
        } else if constexpr (std::is_same_v<T, bson::JavaScriptWithScope>) {
          return javascript_with_scope(x);
        } else if constexpr (std::is_same_v<T, bson::Binary>) {
          return binary(v, x);
        } else {
          return converted(v);
        }
      },
      v.storage());
}

}  // namespace

std::error_code write(const bson::Document& doc, const WriterSettings& settings, std::string& out) noexcept {
  TextWriter writer(settings);
  DocumentWriter dw(settings, writer);
  const auto ec = dw.document(doc);
  if (ec) {
    return ec;
  }
  out += writer.str();
  return {};
}

std::string to_json(const bson::Document& doc, const WriterSettings& settings) {
  std::string out;
  const auto ec = write(doc, settings, out);
  if (ec) {
    if (const auto& lg = core::detail::logger()) {
      lg->debug("to_json failed: {} ({})", ec.message(), ec.category().name());
    }
    return {};
  }
  return out;
}

}  // namespace bsonx::json
