#pragma once

#include "bsonx/json/converter.hpp"

#include <memory>

namespace bsonx::json::converters {

/**
 * @brief 内置转换器。
 *
 * 命名约定：
 * - Strict*：两种输出模式共用的纯 JSON 形式（数字、字符串、布尔、null）；
 * - Shell*：shell 构造函数形式，如 ObjectId("...")、NumberLong(...)；
 * - Extended*：$ 包装对象形式，如 { "$oid" : "..." }。
 */

class BinaryShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class BinaryExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class BooleanStrict final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class DateTimeShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class DateTimeExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class Decimal128Shell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class Decimal128Extended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class DoubleWithDecimalPoint final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class Int32Strict final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class Int64Shell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class Int64Strict final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class JavaScriptExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class MaxKeyShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class MaxKeyExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class MinKeyShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class MinKeyExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class NullStrict final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class ObjectIdShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class ObjectIdExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

// /pattern/options（'/' 写成 "\/"）；无法无损读回的模式写成 RegExp("p", "o")
class RegularExpressionShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class RegularExpressionExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class StringStrict final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class SymbolExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class TimestampShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class TimestampExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class UndefinedShell final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

class UndefinedExtended final : public Converter {
 public:
  std::error_code write(const bson::Value& value, TextWriter& writer) const override;
};

}  // namespace bsonx::json::converters
