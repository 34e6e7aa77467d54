#include "bsonx/bson/settings.hpp"

namespace bsonx::bson {

ReaderSettings::ReaderSettings() noexcept
    : max_document_size_(defaults::max_document_size()),
      max_serialization_depth_(defaults::max_serialization_depth()),
      guid_representation_(defaults::guid_representation()),
      guid_representation_mode_(defaults::guid_representation_mode()) {}

std::error_code ReaderSettings::set_max_document_size(std::size_t v) noexcept {
  if (auto ec = check_mutable()) return ec;
  max_document_size_ = v;
  return {};
}

std::error_code ReaderSettings::set_max_serialization_depth(std::size_t v) noexcept {
  if (auto ec = check_mutable()) return ec;
  max_serialization_depth_ = v;
  return {};
}

std::error_code ReaderSettings::set_guid_representation(GuidRepresentation v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_ = v;
  return {};
}

std::error_code ReaderSettings::set_guid_representation_mode(GuidRepresentationMode v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_mode_ = v;
  return {};
}

std::error_code ReaderSettings::set_fix_old_binary_subtype_on_input(bool v) noexcept {
  if (auto ec = check_mutable()) return ec;
  fix_old_binary_subtype_on_input_ = v;
  return {};
}

std::error_code ReaderSettings::set_validate_utf8(bool v) noexcept {
  if (auto ec = check_mutable()) return ec;
  validate_utf8_ = v;
  return {};
}

ReaderSettings ReaderSettings::clone() const noexcept {
  ReaderSettings copy(*this);
  copy.unfreeze_copy();
  return copy;
}

ReaderSettings ReaderSettings::frozen_copy() const noexcept {
  if (is_frozen()) {
    return *this;
  }
  auto copy = clone();
  copy.freeze();
  return copy;
}

WriterSettings::WriterSettings() noexcept
    : max_document_size_(defaults::max_document_size()),
      max_serialization_depth_(defaults::max_serialization_depth()),
      guid_representation_(defaults::guid_representation()),
      guid_representation_mode_(defaults::guid_representation_mode()) {}

std::error_code WriterSettings::set_max_document_size(std::size_t v) noexcept {
  if (auto ec = check_mutable()) return ec;
  max_document_size_ = v;
  return {};
}

std::error_code WriterSettings::set_max_serialization_depth(std::size_t v) noexcept {
  if (auto ec = check_mutable()) return ec;
  max_serialization_depth_ = v;
  return {};
}

std::error_code WriterSettings::set_guid_representation(GuidRepresentation v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_ = v;
  return {};
}

std::error_code WriterSettings::set_guid_representation_mode(GuidRepresentationMode v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_mode_ = v;
  return {};
}

std::error_code WriterSettings::set_fix_old_binary_subtype_on_output(bool v) noexcept {
  if (auto ec = check_mutable()) return ec;
  fix_old_binary_subtype_on_output_ = v;
  return {};
}

std::error_code WriterSettings::set_check_guid_representation(bool v) noexcept {
  if (auto ec = check_mutable()) return ec;
  check_guid_representation_ = v;
  return {};
}

WriterSettings WriterSettings::clone() const noexcept {
  WriterSettings copy(*this);
  copy.unfreeze_copy();
  return copy;
}

WriterSettings WriterSettings::frozen_copy() const noexcept {
  if (is_frozen()) {
    return *this;
  }
  auto copy = clone();
  copy.freeze();
  return copy;
}

}  // namespace bsonx::bson
