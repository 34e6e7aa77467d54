#include "bsonx/json/writer_settings.hpp"

#include <utility>

namespace bsonx::json {

std::string_view output_mode_name(OutputMode mode) noexcept {
  switch (mode) {
    case OutputMode::shell: return "shell";
    case OutputMode::strict: return "strict";
  }
  return "unknown";
}

WriterSettings::WriterSettings()
    : converters_(ConverterSet::shell()),
      guid_representation_(bson::defaults::guid_representation()),
      guid_representation_mode_(bson::defaults::guid_representation_mode()),
      max_serialization_depth_(bson::defaults::max_serialization_depth()) {}

std::error_code WriterSettings::set_always_quote_names(bool v) noexcept {
  if (auto ec = check_mutable()) return ec;
  always_quote_names_ = v;
  return {};
}

std::error_code WriterSettings::set_indent(bool v) noexcept {
  if (auto ec = check_mutable()) return ec;
  indent_ = v;
  return {};
}

std::error_code WriterSettings::set_indent_chars(std::string v) noexcept {
  if (auto ec = check_mutable()) return ec;
  indent_chars_ = std::move(v);
  return {};
}

std::error_code WriterSettings::set_new_line_chars(std::string v) noexcept {
  if (auto ec = check_mutable()) return ec;
  new_line_chars_ = std::move(v);
  return {};
}

std::error_code WriterSettings::set_output_mode(OutputMode v) noexcept {
  if (auto ec = check_mutable()) return ec;
  output_mode_ = v;
  converters_ = v == OutputMode::strict ? ConverterSet::strict() : ConverterSet::shell();
  return {};
}

std::error_code WriterSettings::set_converters(ConverterSet v) noexcept {
  if (auto ec = check_mutable()) return ec;
  if (!v.is_complete()) {
    return make_error_code(writer_errc::missing_converter);
  }
  converters_ = std::move(v);
  return {};
}

std::error_code WriterSettings::set_guid_representation(bson::GuidRepresentation v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_ = v;
  return {};
}

std::error_code WriterSettings::set_guid_representation_mode(bson::GuidRepresentationMode v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_mode_ = v;
  return {};
}

std::error_code WriterSettings::set_max_serialization_depth(std::size_t v) noexcept {
  if (auto ec = check_mutable()) return ec;
  max_serialization_depth_ = v;
  return {};
}

WriterSettings WriterSettings::clone() const {
  WriterSettings copy(*this);
  copy.unfreeze_copy();
  return copy;
}

WriterSettings WriterSettings::frozen_copy() const {
  if (is_frozen()) {
    return *this;
  }
  auto copy = clone();
  copy.freeze();
  return copy;
}

}  // namespace bsonx::json
