#pragma once

#include "bsonx/bson/value.hpp"
#include "bsonx/json/text_writer.hpp"

#include <system_error>

namespace bsonx::json {

/**
 * @brief 单一值类型的文本转换器（输出方向）。
 *
 * 约定：
 * - writer 处于“期待值”状态时被调用，必须恰好写出一个值
 *   （write_raw_value 一次，或一对 start/end 包裹的完整文档/数组）；
 * - value 的类型与转换器所在的槽位一致（由 ConverterSet 分派保证）；
 * - 转换器本身无状态、只读，可在多个 ConverterSet 之间共享。
 */
class Converter {
 public:
  virtual ~Converter() = default;

  virtual std::error_code write(const bson::Value& value, TextWriter& writer) const = 0;

 protected:
  Converter() = default;
  Converter(const Converter&) = default;
  Converter& operator=(const Converter&) = default;
};

}  // namespace bsonx::json
