#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace bsonx::bson {

/**
 * @brief IEEE 754-2008 decimal128（BID 编码）。
 *
 * 本库只负责承载与字符串互转，不提供算术。
 *
 * 约定：
 * - 线上布局：低 8 字节 low_bits，高 8 字节 high_bits（均为小端）；
 * - 相等比较按位进行（1.0 与 1.00 不相等）。
 */
class Decimal128 final {
 public:
  Decimal128() noexcept = default;
  Decimal128(std::uint64_t high, std::uint64_t low) noexcept : high_(high), low_(low) {}

  /**
   * @brief 解析十进制字符串。
   *
   * 支持：[+-]digits[.digits][(e|E)[+-]digits]、Infinity/Inf/NaN（大小写不敏感）。
   * 有效数字超过 34 位且无法无损截去、或指数越界时返回 errc::invalid_decimal128。
   */
  static std::error_code parse(std::string_view text, Decimal128& out) noexcept;

  [[nodiscard]] std::uint64_t high_bits() const noexcept { return high_; }
  [[nodiscard]] std::uint64_t low_bits() const noexcept { return low_; }

  [[nodiscard]] bool is_negative() const noexcept { return (high_ >> 63) != 0; }
  [[nodiscard]] bool is_nan() const noexcept;
  [[nodiscard]] bool is_infinity() const noexcept;

  /**
   * @brief 规范字符串形式（指数 > 0 或调整后指数 < -6 时使用科学计数法）。
   */
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Decimal128&, const Decimal128&) = default;

 private:
  std::uint64_t high_{0x3040000000000000ull};  // 0
  std::uint64_t low_{0};
};

}  // namespace bsonx::bson
