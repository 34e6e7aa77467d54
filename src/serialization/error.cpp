#include "bsonx/serialization/error.hpp"

#include <string>

namespace bsonx::serialization {
namespace {

class serialization_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonx.serialization"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::type_mismatch:
        return "value type does not match serializer";
      case errc::missing_element:
        return "required element is missing";
      case errc::unexpected_element:
        return "element is not mapped";
      case errc::value_out_of_range:
        return "value out of range for target type";
      case errc::unknown_enum_name:
        return "unknown enum name";
      case errc::unspecified_guid_representation:
        return "guid representation is unspecified";
      default:
        return "unknown bsonx.serialization error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static serialization_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace bsonx::serialization
