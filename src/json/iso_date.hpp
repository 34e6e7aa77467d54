#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bsonx::json::detail {

// ISODate(...) 形式可表示的毫秒范围：0001-01-01T00:00:00.000Z .. 9999-12-31T23:59:59.999Z
inline constexpr std::int64_t kIsoDateMinMillis = -62135596800000LL;
inline constexpr std::int64_t kIsoDateMaxMillis = 253402300799999LL;

/**
 * @brief 毫秒 -> "yyyy-MM-ddTHH:mm:ss[.FFF]Z"（毫秒部分去掉尾随 0，全 0 时省略小数点）。
 *
 * millis 超出 [kIsoDateMinMillis, kIsoDateMaxMillis] 时返回 false。
 */
bool format_iso_date(std::int64_t millis, std::string& out);

/**
 * @brief "yyyy-MM-ddTHH:mm[:ss[.fff]]" + ("Z" | "±HH:MM" | "±HHMM") -> 毫秒。
 *
 * 小数秒超过 3 位时截断到毫秒。
 */
bool parse_iso_date(std::string_view text, std::int64_t& out) noexcept;

}  // namespace bsonx::json::detail
