#pragma once

#include <system_error>

namespace bsonx::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有编解码接口返回 std::error_code，不走异常路径。
 * - out_of_range/invalid_length/missing_terminator/invalid_utf8 由字节游标产生，
 *   属于二进制解码错误的一部分；
 * - settings_frozen 是配置错误：冻结后的 settings 不允许再修改。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  out_of_range = 2,
  invalid_length = 3,
  missing_terminator = 4,
  invalid_utf8 = 5,
  settings_frozen = 6,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonx::core

namespace std {
template <>
struct is_error_code_enum<bsonx::core::errc> : true_type {};
}  // namespace std
