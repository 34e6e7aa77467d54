#pragma once

#include "bsonx/bson/defaults.hpp"
#include "bsonx/bson/guid.hpp"
#include "bsonx/core/freezable.hpp"
#include "bsonx/json/converter_set.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace bsonx::json {

/**
 * @brief 文本输出模式：决定默认安装哪一套内置转换器。
 *
 * - shell：mongo shell 可直接求值的形式（ObjectId(...)、ISODate(...)、NumberLong(...)）；
 * - strict：纯 JSON，非 JSON 类型以 $ 包装对象表示（{ "$oid" : ... }、{ "$date" : ms }）。
 */
enum class OutputMode : std::uint8_t {
  shell = 0,
  strict = 1,
};

[[nodiscard]] std::string_view output_mode_name(OutputMode mode) noexcept;

/**
 * @brief 文本 writer 配置。
 *
 * 约定：
 * - 默认：always_quote_names=true、indent=false、indent_chars="  "、new_line_chars="\r\n"、
 *   output_mode=shell（对应 ConverterSet::shell()）；
 * - set_output_mode 同时安装该模式的内置转换器集合；之后可用 set_converters 覆盖；
 * - guid_representation / guid_representation_mode 构造时取自 bson::defaults，
 *   v2 模式下用于给未标记表示法的子类型 3 值补上表示法；
 * - 冻结后所有 setter 返回 core::errc::settings_frozen。
 */
class WriterSettings final : public core::Freezable {
 public:
  WriterSettings();

  [[nodiscard]] bool always_quote_names() const noexcept { return always_quote_names_; }
  [[nodiscard]] bool indent() const noexcept { return indent_; }
  [[nodiscard]] const std::string& indent_chars() const noexcept { return indent_chars_; }
  [[nodiscard]] const std::string& new_line_chars() const noexcept { return new_line_chars_; }
  [[nodiscard]] OutputMode output_mode() const noexcept { return output_mode_; }
  [[nodiscard]] const ConverterSet& converters() const noexcept { return converters_; }
  [[nodiscard]] bson::GuidRepresentation guid_representation() const noexcept { return guid_representation_; }
  [[nodiscard]] bson::GuidRepresentationMode guid_representation_mode() const noexcept {
    return guid_representation_mode_;
  }
  [[nodiscard]] std::size_t max_serialization_depth() const noexcept { return max_serialization_depth_; }

  std::error_code set_always_quote_names(bool v) noexcept;
  std::error_code set_indent(bool v) noexcept;
  std::error_code set_indent_chars(std::string v) noexcept;
  std::error_code set_new_line_chars(std::string v) noexcept;
  std::error_code set_output_mode(OutputMode v) noexcept;

  /**
   * @brief 安装自定义转换器集合；不完整的集合返回 writer_errc::missing_converter。
   */
  std::error_code set_converters(ConverterSet v) noexcept;

  std::error_code set_guid_representation(bson::GuidRepresentation v) noexcept;
  std::error_code set_guid_representation_mode(bson::GuidRepresentationMode v) noexcept;
  std::error_code set_max_serialization_depth(std::size_t v) noexcept;

  [[nodiscard]] WriterSettings clone() const;
  [[nodiscard]] WriterSettings frozen_copy() const;

 private:
  bool always_quote_names_{true};
  bool indent_{false};
  std::string indent_chars_{"  "};
  std::string new_line_chars_{"\r\n"};
  OutputMode output_mode_{OutputMode::shell};
  ConverterSet converters_;
  bson::GuidRepresentation guid_representation_;
  bson::GuidRepresentationMode guid_representation_mode_;
  std::size_t max_serialization_depth_;
};

}  // namespace bsonx::json
