#pragma once

#include "bsonx/core/common.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bsonx::bson {

using byte = bsonx::core::byte;
using bytes_view = bsonx::core::bytes_view;
using mutable_bytes_view = bsonx::core::mutable_bytes_view;

/**
 * @brief 元素类型标签（线上 1 字节）。
 *
 * 说明：
 * - 0x00 仅作为文档结束符出现，不对应任何值；
 * - 0x0C（DBPointer）已废弃，本库不支持，解码时视为非法标签。
 */
enum class bson_type : std::uint8_t {
  end_of_document = 0x00,
  double_ = 0x01,
  string = 0x02,
  document = 0x03,
  array = 0x04,
  binary = 0x05,
  undefined = 0x06,
  object_id = 0x07,
  boolean = 0x08,
  date_time = 0x09,
  null = 0x0A,
  regular_expression = 0x0B,
  javascript = 0x0D,
  symbol = 0x0E,
  javascript_with_scope = 0x0F,
  int32 = 0x10,
  timestamp = 0x11,
  int64 = 0x12,
  decimal128 = 0x13,
  max_key = 0x7F,
  min_key = 0xFF,
};

/**
 * @brief binary 值的子类型字节。
 *
 * 0x03/0x04 两种子类型承载 16 字节标识符（见 guid.hpp）。
 */
enum class binary_subtype : std::uint8_t {
  binary = 0x00,
  function = 0x01,
  old_binary = 0x02,
  uuid_legacy = 0x03,
  uuid_standard = 0x04,
  md5 = 0x05,
  encrypted = 0x06,
  column = 0x07,
  sensitive = 0x08,
  user_defined = 0x80,
};

inline constexpr std::size_t kBsonTypeCount = 20;

/**
 * @brief 所有值类型（不含 end_of_document），按标签值升序。
 */
[[nodiscard]] const std::array<bson_type, kBsonTypeCount>& all_bson_types() noexcept;

/**
 * @brief 标签字节 -> bson_type；未知标签（含 0x00 与 0x0C）返回 nullopt。
 */
[[nodiscard]] std::optional<bson_type> bson_type_from_byte(byte b) noexcept;

[[nodiscard]] std::string_view bson_type_name(bson_type t) noexcept;
[[nodiscard]] std::string_view binary_subtype_name(binary_subtype s) noexcept;

[[nodiscard]] constexpr bool is_uuid_subtype(binary_subtype s) noexcept {
  return s == binary_subtype::uuid_legacy || s == binary_subtype::uuid_standard;
}

}  // namespace bsonx::bson
