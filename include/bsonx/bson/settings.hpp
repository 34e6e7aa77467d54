#pragma once

#include "bsonx/bson/defaults.hpp"
#include "bsonx/bson/guid.hpp"
#include "bsonx/core/freezable.hpp"

#include <cstddef>
#include <system_error>

namespace bsonx::bson {

/**
 * @brief 二进制 reader 配置。
 *
 * 默认值来自 defaults（构造时读取一次），之后与全局状态无关：
 * 编解码核心只看 settings，不再读取进程级全局量。
 */
class ReaderSettings final : public core::Freezable {
 public:
  ReaderSettings() noexcept;

  [[nodiscard]] std::size_t max_document_size() const noexcept { return max_document_size_; }
  [[nodiscard]] std::size_t max_serialization_depth() const noexcept { return max_serialization_depth_; }
  [[nodiscard]] GuidRepresentation guid_representation() const noexcept { return guid_representation_; }
  [[nodiscard]] GuidRepresentationMode guid_representation_mode() const noexcept { return guid_representation_mode_; }
  [[nodiscard]] bool fix_old_binary_subtype_on_input() const noexcept { return fix_old_binary_subtype_on_input_; }
  [[nodiscard]] bool validate_utf8() const noexcept { return validate_utf8_; }

  std::error_code set_max_document_size(std::size_t v) noexcept;
  std::error_code set_max_serialization_depth(std::size_t v) noexcept;
  std::error_code set_guid_representation(GuidRepresentation v) noexcept;
  std::error_code set_guid_representation_mode(GuidRepresentationMode v) noexcept;
  std::error_code set_fix_old_binary_subtype_on_input(bool v) noexcept;
  std::error_code set_validate_utf8(bool v) noexcept;

  /**
   * @brief 未冻结的独立副本（字段值相同）。
   */
  [[nodiscard]] ReaderSettings clone() const noexcept;

  /**
   * @brief 已冻结则返回自身副本，否则返回冻结后的 clone。
   */
  [[nodiscard]] ReaderSettings frozen_copy() const noexcept;

 private:
  std::size_t max_document_size_;
  std::size_t max_serialization_depth_;
  GuidRepresentation guid_representation_;
  GuidRepresentationMode guid_representation_mode_;
  bool fix_old_binary_subtype_on_input_{true};
  bool validate_utf8_{true};
};

/**
 * @brief 二进制 writer 配置。
 *
 * check_guid_representation=false 时，writer 不再校验 binary 值上的表示法标记
 * 是否与 guid_representation 一致（显式关闭校验）。
 */
class WriterSettings final : public core::Freezable {
 public:
  WriterSettings() noexcept;

  [[nodiscard]] std::size_t max_document_size() const noexcept { return max_document_size_; }
  [[nodiscard]] std::size_t max_serialization_depth() const noexcept { return max_serialization_depth_; }
  [[nodiscard]] GuidRepresentation guid_representation() const noexcept { return guid_representation_; }
  [[nodiscard]] GuidRepresentationMode guid_representation_mode() const noexcept { return guid_representation_mode_; }
  [[nodiscard]] bool fix_old_binary_subtype_on_output() const noexcept { return fix_old_binary_subtype_on_output_; }
  [[nodiscard]] bool check_guid_representation() const noexcept { return check_guid_representation_; }

  std::error_code set_max_document_size(std::size_t v) noexcept;
  std::error_code set_max_serialization_depth(std::size_t v) noexcept;
  std::error_code set_guid_representation(GuidRepresentation v) noexcept;
  std::error_code set_guid_representation_mode(GuidRepresentationMode v) noexcept;
  std::error_code set_fix_old_binary_subtype_on_output(bool v) noexcept;
  std::error_code set_check_guid_representation(bool v) noexcept;

  [[nodiscard]] WriterSettings clone() const noexcept;
  [[nodiscard]] WriterSettings frozen_copy() const noexcept;

 private:
  std::size_t max_document_size_;
  std::size_t max_serialization_depth_;
  GuidRepresentation guid_representation_;
  GuidRepresentationMode guid_representation_mode_;
  bool fix_old_binary_subtype_on_output_{true};
  bool check_guid_representation_{true};
};

}  // namespace bsonx::bson
