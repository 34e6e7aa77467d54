#pragma once

#include "bsonx/bson/types.hpp"
#include "bsonx/json/converter.hpp"

#include <memory>
#include <system_error>

namespace bsonx::json {

/**
 * @brief 按值类型分派的转换器集合（不可变；复制时共享转换器对象）。
 *
 * 槽位覆盖除结构类型（document / array / javascript_with_scope）外的全部 17 种值类型，
 * 结构类型由 writer 自身输出。
 *
 * 约定：
 * - create() 要求每个槽位非空，否则返回 writer_errc::missing_converter；
 * - with() 生成“替换一个槽位”的新集合，其余槽位与原集合共享同一转换器对象；
 * - shell() / strict() 为进程生命周期内的内置集合。
 */
class ConverterSet final {
 public:
  struct Slots {
    std::shared_ptr<const Converter> binary;
    std::shared_ptr<const Converter> boolean;
    std::shared_ptr<const Converter> date_time;
    std::shared_ptr<const Converter> decimal128;
    std::shared_ptr<const Converter> double_;
    std::shared_ptr<const Converter> int32;
    std::shared_ptr<const Converter> int64;
    std::shared_ptr<const Converter> javascript;
    std::shared_ptr<const Converter> max_key;
    std::shared_ptr<const Converter> min_key;
    std::shared_ptr<const Converter> null;
    std::shared_ptr<const Converter> object_id;
    std::shared_ptr<const Converter> regular_expression;
    std::shared_ptr<const Converter> string;
    std::shared_ptr<const Converter> symbol;
    std::shared_ptr<const Converter> timestamp;
    std::shared_ptr<const Converter> undefined;
  };

  /**
   * @brief 空集合（is_complete() == false）；用于 out 参数占位。
   */
  ConverterSet() = default;

  static std::error_code create(Slots slots, ConverterSet& out) noexcept;

  [[nodiscard]] static const ConverterSet& shell() noexcept;
  [[nodiscard]] static const ConverterSet& strict() noexcept;

  /**
   * @brief 类型是否有转换器槽位。
   */
  [[nodiscard]] static bool has_slot(bson::bson_type type) noexcept;

  /**
   * @brief 复制并替换 type 对应的槽位。
   *
   * 失败：converter 为空 -> writer_errc::missing_converter；
   * type 无槽位 -> writer_errc::invalid_converter_slot。失败时 out 不变。
   */
  std::error_code with(bson::bson_type type,
                       std::shared_ptr<const Converter> converter,
                       ConverterSet& out) const noexcept;

  /**
   * @brief type 对应的转换器；无槽位或槽位为空时返回 nullptr。
   */
  [[nodiscard]] const Converter* find(bson::bson_type type) const noexcept;

  [[nodiscard]] std::shared_ptr<const Converter> get(bson::bson_type type) const noexcept;

  [[nodiscard]] bool is_complete() const noexcept;

  [[nodiscard]] const Slots& slots() const noexcept { return slots_; }

 private:
  explicit ConverterSet(Slots slots) noexcept : slots_(std::move(slots)) {}

  Slots slots_;
};

}  // namespace bsonx::json
