#pragma once

#include "bsonx/bson/defaults.hpp"
#include "bsonx/bson/guid.hpp"
#include "bsonx/core/freezable.hpp"

#include <cstddef>
#include <system_error>

namespace bsonx::json {

/**
 * @brief 文本解析配置。
 *
 * guid_representation 只在 v2 模式下生效：HexData / BinData / $binary 给出的子类型 3 值
 * 会被标记为该表示法；v3 模式下不做标记。
 */
class ReaderSettings final : public core::Freezable {
 public:
  ReaderSettings() noexcept;

  [[nodiscard]] bson::GuidRepresentation guid_representation() const noexcept { return guid_representation_; }
  [[nodiscard]] bson::GuidRepresentationMode guid_representation_mode() const noexcept {
    return guid_representation_mode_;
  }
  [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

  std::error_code set_guid_representation(bson::GuidRepresentation v) noexcept;
  std::error_code set_guid_representation_mode(bson::GuidRepresentationMode v) noexcept;
  std::error_code set_max_depth(std::size_t v) noexcept;

  [[nodiscard]] ReaderSettings clone() const noexcept;
  [[nodiscard]] ReaderSettings frozen_copy() const noexcept;

 private:
  bson::GuidRepresentation guid_representation_;
  bson::GuidRepresentationMode guid_representation_mode_;
  std::size_t max_depth_;
};

}  // namespace bsonx::json
