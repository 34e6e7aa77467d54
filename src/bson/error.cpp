#include "bsonx/bson/error.hpp"

#include <string>

namespace bsonx::bson {
namespace {

class bson_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonx.bson"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_type:
        return "invalid element type";
      case errc::invalid_document_length:
        return "invalid document length";
      case errc::missing_document_terminator:
        return "missing document terminator";
      case errc::invalid_boolean:
        return "invalid boolean value";
      case errc::invalid_binary_length:
        return "invalid binary data length";
      case errc::guid_representation_mismatch:
        return "binary subtype does not match guid representation";
      case errc::max_depth_exceeded:
        return "maximum serialization depth exceeded";
      case errc::document_too_large:
        return "document exceeds maximum size";
      case errc::invalid_decimal128:
        return "invalid decimal128 value";
      case errc::invalid_object_id:
        return "invalid object id";
      case errc::trailing_bytes:
        return "trailing bytes after document";
      case errc::invalid_scope_length:
        return "invalid javascript with scope length";
      default:
        return "unknown bsonx.bson error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static bson_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace bsonx::bson
