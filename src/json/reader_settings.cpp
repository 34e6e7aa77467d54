#include "bsonx/json/reader_settings.hpp"

namespace bsonx::json {

ReaderSettings::ReaderSettings() noexcept
    : guid_representation_(bson::defaults::guid_representation()),
      guid_representation_mode_(bson::defaults::guid_representation_mode()),
      max_depth_(bson::defaults::max_serialization_depth()) {}

std::error_code ReaderSettings::set_guid_representation(bson::GuidRepresentation v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_ = v;
  return {};
}

std::error_code ReaderSettings::set_guid_representation_mode(bson::GuidRepresentationMode v) noexcept {
  if (auto ec = check_mutable()) return ec;
  guid_representation_mode_ = v;
  return {};
}

std::error_code ReaderSettings::set_max_depth(std::size_t v) noexcept {
  if (auto ec = check_mutable()) return ec;
  max_depth_ = v;
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

}  // namespace bsonx::json
