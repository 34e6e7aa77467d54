#pragma once

#include "bsonx/bson/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace bsonx::bson {

/**
 * @brief 12 字节对象标识（4 字节大端秒级时间戳 + 5 字节随机值 + 3 字节计数器）。
 *
 * 本库只做承载与格式转换，不负责生成。
 */
class ObjectId final {
 public:
  using bytes_type = std::array<byte, 12>;

  ObjectId() noexcept = default;
  explicit ObjectId(const bytes_type& bytes) noexcept : bytes_(bytes) {}

  /**
   * @brief 从 24 位 hex 字符串解析（大小写均可），失败返回 errc::invalid_object_id。
   */
  static std::error_code parse(std::string_view hex, ObjectId& out) noexcept;

  [[nodiscard]] const bytes_type& bytes() const noexcept { return bytes_; }
  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] std::uint32_t timestamp() const noexcept;

  friend bool operator==(const ObjectId&, const ObjectId&) = default;

 private:
  bytes_type bytes_{};
};

}  // namespace bsonx::bson
