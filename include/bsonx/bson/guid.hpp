#pragma once

#include "bsonx/bson/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace bsonx::bson {

/**
 * @brief 16 字节标识符与 binary 字节之间的字节序约定。
 *
 * | 表示法        | 与 Guid 规范字节序的关系                    | 子类型 |
 * |---------------|---------------------------------------------|--------|
 * | standard      | 原样                                        | 4      |
 * | csharp_legacy | [0,4) [4,6) [6,8) 三段各自反转（字段小端）  | 3      |
 * | java_legacy   | [0,8) [8,16) 两段各自反转                   | 3      |
 * | python_legacy | 原样                                        | 3      |
 * | unspecified   | 无定义，转换必然失败                        | -      |
 *
 * 注意：同一段字节按不同表示法解读会得到不同的 Guid，这是历史上各驱动不兼容的结果，
 * 必须原样保留。
 */
enum class GuidRepresentation : std::uint8_t {
  unspecified = 0,
  csharp_legacy = 1,
  java_legacy = 2,
  python_legacy = 3,
  standard = 4,
};

enum class guid_errc : int {
  ok = 0,
  unspecified_representation = 1,
  invalid_length = 2,
  invalid_format = 3,
};

const std::error_category& guid_error_category() noexcept;
std::error_code make_error_code(guid_errc e) noexcept;

[[nodiscard]] std::string_view guid_representation_name(GuidRepresentation r) noexcept;

/**
 * @brief 表示法对应的 binary 子类型：standard -> 4，其余 legacy -> 3。
 *
 * unspecified 没有对应子类型，返回 uuid_legacy（调用方应先排除）。
 */
[[nodiscard]] constexpr binary_subtype subtype_for(GuidRepresentation r) noexcept {
  return r == GuidRepresentation::standard ? binary_subtype::uuid_standard : binary_subtype::uuid_legacy;
}

/**
 * @brief 128-bit 标识符（字节按规范字符串顺序存放，即 RFC 4122 网络序）。
 */
class Guid final {
 public:
  using bytes_type = std::array<byte, 16>;

  Guid() noexcept = default;
  explicit Guid(const bytes_type& bytes) noexcept : bytes_(bytes) {}

  /**
   * @brief 解析字符串形式。
   *
   * 支持：
   * - 带连字符：00112233-4455-6677-8899-aabbccddeeff
   * - 32 位连续 hex：00112233445566778899aabbccddeeff
   * - 花括号包裹的带连字符形式：{00112233-...}
   *
   * 失败返回 guid_errc::invalid_format。
   */
  static std::error_code parse(std::string_view text, Guid& out) noexcept;

  [[nodiscard]] const bytes_type& bytes() const noexcept { return bytes_; }

  /**
   * @brief 小写带连字符形式。
   */
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool is_empty() const noexcept;

  friend bool operator==(const Guid&, const Guid&) = default;

 private:
  bytes_type bytes_{};
};

/**
 * @brief Guid -> 16 字节（按表示法排列）。
 *
 * representation 为 unspecified 时返回 guid_errc::unspecified_representation：
 * 这是调用方的编程错误（没有可用的字节序定义），不会被静默兜底。
 */
std::error_code guid_to_bytes(const Guid& guid,
                              GuidRepresentation representation,
                              Guid::bytes_type& out) noexcept;

/**
 * @brief 16 字节 -> Guid（按表示法解读）。
 *
 * bytes 长度必须为 16（否则 guid_errc::invalid_length）。
 */
std::error_code guid_from_bytes(bytes_view bytes,
                                GuidRepresentation representation,
                                Guid& out) noexcept;

}  // namespace bsonx::bson

namespace std {
template <>
struct is_error_code_enum<bsonx::bson::guid_errc> : true_type {};
}  // namespace std
