#pragma once

#include "bsonx/bson/guid.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace bsonx::bson {

/**
 * @brief 标识符表示法的管理模式。
 *
 * - v2：由 reader/writer settings 上的 guid_representation 统一决定（旧行为）；
 * - v3：reader/writer 层不做标记，原样透传子类型与字节，表示法由字段级 serializer 指定。
 */
enum class GuidRepresentationMode : std::uint8_t {
  v2 = 2,
  v3 = 3,
};

/**
 * @brief 进程级默认值（旧 API 兼容层）。
 *
 * 说明：
 * - 仅在 settings 对象默认构造时读取一次（即“最外层 API 边界”），编解码核心只看 settings；
 * - 这些全局量不加锁：并发修改属于数据竞争，新代码应使用 v3 + 字段级表示法；
 * - 旧代码的典型用法是“修改 -> 执行 -> 恢复”，见 ScopedGuidRepresentationMode。
 */
namespace defaults {

[[nodiscard]] GuidRepresentationMode guid_representation_mode() noexcept;
void set_guid_representation_mode(GuidRepresentationMode mode) noexcept;

/**
 * @brief v2 模式下的默认表示法（初始为 csharp_legacy）。
 */
[[nodiscard]] GuidRepresentation guid_representation() noexcept;

/**
 * @brief 修改 v2 默认表示法；v3 模式下调用返回 core::errc::invalid_argument。
 */
std::error_code set_guid_representation(GuidRepresentation representation) noexcept;

[[nodiscard]] std::size_t max_document_size() noexcept;
void set_max_document_size(std::size_t size) noexcept;

[[nodiscard]] std::size_t max_serialization_depth() noexcept;
void set_max_serialization_depth(std::size_t depth) noexcept;

}  // namespace defaults

/**
 * @brief 临时切换表示法模式（RAII，析构时恢复模式与默认表示法）。
 *
 * 用法：
 *   {
 *     ScopedGuidRepresentationMode scope(GuidRepresentationMode::v3);
 *     ...  // 此处创建的 settings 使用 v3
 *   }
 */
class ScopedGuidRepresentationMode final {
 public:
  explicit ScopedGuidRepresentationMode(GuidRepresentationMode mode) noexcept;
  ScopedGuidRepresentationMode(GuidRepresentationMode mode, GuidRepresentation representation) noexcept;
  ~ScopedGuidRepresentationMode();

  ScopedGuidRepresentationMode(const ScopedGuidRepresentationMode&) = delete;
  ScopedGuidRepresentationMode& operator=(const ScopedGuidRepresentationMode&) = delete;

 private:
  GuidRepresentationMode saved_mode_;
  GuidRepresentation saved_representation_;
};

}  // namespace bsonx::bson
