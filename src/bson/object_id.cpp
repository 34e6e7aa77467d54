#include "bsonx/bson/object_id.hpp"

#include "bsonx/bson/error.hpp"
#include "bsonx/utils/hex.hpp"

namespace bsonx::bson {

std::error_code ObjectId::parse(std::string_view hex, ObjectId& out) noexcept {
  if (hex.size() != 24) {
    return make_error_code(errc::invalid_object_id);
  }
  bytes_type bytes{};
  if (!utils::decode_hex_exact(hex, mutable_bytes_view{bytes.data(), bytes.size()})) {
    return make_error_code(errc::invalid_object_id);
  }
  out = ObjectId(bytes);
  return {};
}

std::string ObjectId::to_string() const { return utils::to_hex(bytes_view{bytes_.data(), bytes_.size()}); }

std::uint32_t ObjectId::timestamp() const noexcept {
  return (static_cast<std::uint32_t>(bytes_[0]) << 24) | (static_cast<std::uint32_t>(bytes_[1]) << 16) |
         (static_cast<std::uint32_t>(bytes_[2]) << 8) | static_cast<std::uint32_t>(bytes_[3]);
}

}  // namespace bsonx::bson
