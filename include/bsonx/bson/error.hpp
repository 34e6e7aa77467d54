#pragma once

#include <system_error>

namespace bsonx::bson {

/**
 * @brief 二进制文档编解码错误（"bsonx.bson" 错误域）。
 *
 * 说明：
 * - 字节游标层面的错误（截断、长度非法、缺少 NUL、非法 UTF-8）沿用 core::errc；
 * - 调用方可按错误域区分二进制解码失败与文本解析失败（后者属于 bsonx.json.*）。
 */
enum class errc : int {
  ok = 0,
  invalid_type = 1,
  invalid_document_length = 2,
  missing_document_terminator = 3,
  invalid_boolean = 4,
  invalid_binary_length = 5,
  guid_representation_mismatch = 6,
  max_depth_exceeded = 7,
  document_too_large = 8,
  invalid_decimal128 = 9,
  invalid_object_id = 10,
  trailing_bytes = 11,
  invalid_scope_length = 12,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonx::bson

namespace std {
template <>
struct is_error_code_enum<bsonx::bson::errc> : true_type {};
}  // namespace std
