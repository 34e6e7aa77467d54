#pragma once

#include <system_error>

namespace bsonx::serialization {

/**
 * @brief 字段级序列化错误（"bsonx.serialization" 错误域）。
 */
enum class errc : int {
  ok = 0,
  type_mismatch = 1,
  missing_element = 2,
  unexpected_element = 3,
  value_out_of_range = 4,
  unknown_enum_name = 5,
  unspecified_guid_representation = 6,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonx::serialization

namespace std {
template <>
struct is_error_code_enum<bsonx::serialization::errc> : true_type {};
}  // namespace std
