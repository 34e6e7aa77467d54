#pragma once

#include "bsonx/core/common.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonx::utils {

/**
 * @brief 标准 base64（RFC 4648，带 '=' 填充）。
 */
[[nodiscard]] std::string base64_encode(bsonx::core::bytes_view bytes);

/**
 * @brief 解码标准 base64；长度不是 4 的倍数、非法字符或填充位置错误返回 core::errc::invalid_argument。
 */
std::error_code base64_decode(std::string_view text, std::vector<bsonx::core::byte>& out) noexcept;

}  // namespace bsonx::utils
