#pragma once

#include "bsonx/bson/decimal128.hpp"
#include "bsonx/bson/guid.hpp"
#include "bsonx/bson/object_id.hpp"
#include "bsonx/bson/types.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace bsonx::bson {

class Value;
struct Element;

/**
 * @brief 文档：有序的 (name, value) 序列。
 *
 * 约定：
 * - 保持插入顺序（线上顺序即此顺序）；
 * - 允许重名（线上合法），find() 返回第一个匹配项；
 * - 根文档在线上带总长度前缀，嵌入文档同理。
 */
class Document final {
 public:
  using container_type = std::vector<Element>;
  using const_iterator = container_type::const_iterator;

  Document() = default;
  Document(std::initializer_list<Element> elements);

  Document& append(std::string name, Value value);

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;
  [[nodiscard]] const Element& operator[](std::size_t index) const noexcept;
  [[nodiscard]] const container_type& elements() const noexcept { return elements_; }

  [[nodiscard]] const Value* find(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

  void clear() noexcept;

  friend bool operator==(const Document& lhs, const Document& rhs) noexcept;

 private:
  container_type elements_;
};

/**
 * @brief 数组：线上是名字为 "0","1",... 的文档；解码时不保留线上名字。
 */
struct Array final {
  std::vector<Value> values;

  friend bool operator==(const Array& lhs, const Array& rhs) noexcept;
};

struct Double final {
  double value{0.0};

  // 按位比较：NaN == NaN、0.0 != -0.0（往返一致性关注的是位模式）
  friend bool operator==(const Double& lhs, const Double& rhs) noexcept;
};

struct String final {
  std::string value;
  friend bool operator==(const String&, const String&) = default;
};

struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};

struct Boolean final {
  bool value{false};
  friend bool operator==(const Boolean&, const Boolean&) = default;
};

/**
 * @brief UTC 时间：自 Unix 纪元起的毫秒数（有符号）。
 */
struct DateTime final {
  std::int64_t millis{0};
  friend bool operator==(const DateTime&, const DateTime&) = default;
};

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct RegularExpression final {
  std::string pattern;
  std::string options;
  friend bool operator==(const RegularExpression&, const RegularExpression&) = default;
};

struct JavaScript final {
  std::string code;
  friend bool operator==(const JavaScript&, const JavaScript&) = default;
};

struct Symbol final {
  std::string name;
  friend bool operator==(const Symbol&, const Symbol&) = default;
};

struct JavaScriptWithScope final {
  std::string code;
  Document scope;

  friend bool operator==(const JavaScriptWithScope& lhs, const JavaScriptWithScope& rhs) noexcept;
};

struct Int32 final {
  std::int32_t value{0};
  friend bool operator==(const Int32&, const Int32&) = default;
};

struct Int64 final {
  std::int64_t value{0};
  friend bool operator==(const Int64&, const Int64&) = default;
};

struct MinKey final {
  friend bool operator==(const MinKey&, const MinKey&) = default;
};

struct MaxKey final {
  friend bool operator==(const MaxKey&, const MaxKey&) = default;
};

/**
 * @brief 时间戳：高 32 位为秒，低 32 位为自增序号。
 */
class Timestamp final {
 public:
  Timestamp() noexcept = default;
  explicit Timestamp(std::uint64_t value) noexcept : value_(value) {}
  Timestamp(std::uint32_t seconds, std::uint32_t increment) noexcept
      : value_((static_cast<std::uint64_t>(seconds) << 32) | increment) {}

  [[nodiscard]] std::uint64_t value() const noexcept { return value_; }
  [[nodiscard]] std::uint32_t seconds() const noexcept { return static_cast<std::uint32_t>(value_ >> 32); }
  [[nodiscard]] std::uint32_t increment() const noexcept { return static_cast<std::uint32_t>(value_); }

  friend bool operator==(const Timestamp&, const Timestamp&) = default;

 private:
  std::uint64_t value_{0};
};

/**
 * @brief binary 值：子类型 + 原始字节 + （子类型 3/4 时）标识符表示法标记。
 *
 * 约束（由 create() 检查）：
 * - 子类型 3/4 的字节长度必须为 16；
 * - 子类型 4 只能标记 standard；子类型 3 不能标记 standard；
 * - 其它子类型只能是 unspecified。
 * 不一致时报错，不做静默修正。
 */
class Binary final {
 public:
  Binary() = default;

  /**
   * @brief 便捷构造：按子类型推导表示法标记（不做长度检查）。
   *
   * - 子类型 4 -> standard；
   * - 子类型 3 -> v2 模式下取进程默认表示法，v3 模式下为 unspecified；
   * - 其它 -> unspecified。
   */
  explicit Binary(std::vector<byte> bytes, binary_subtype subtype = binary_subtype::binary);

  static std::error_code create(binary_subtype subtype,
                                std::vector<byte> bytes,
                                GuidRepresentation representation,
                                Binary& out) noexcept;

  /**
   * @brief 按表示法打包 Guid（子类型由表示法决定，见 subtype_for）。
   */
  static std::error_code from_guid(const Guid& guid, GuidRepresentation representation, Binary& out) noexcept;

  /**
   * @brief 按自身的表示法标记解包；未标记（unspecified）时返回 guid_errc::unspecified_representation。
   */
  std::error_code to_guid(Guid& out) const noexcept;

  /**
   * @brief 按显式指定的表示法解包（要求子类型为 3/4 且与表示法匹配）。
   */
  std::error_code to_guid(GuidRepresentation representation, Guid& out) const noexcept;

  [[nodiscard]] binary_subtype subtype() const noexcept { return subtype_; }
  [[nodiscard]] const std::vector<byte>& bytes() const noexcept { return bytes_; }
  [[nodiscard]] GuidRepresentation guid_representation() const noexcept { return representation_; }

  friend bool operator==(const Binary&, const Binary&) = default;

 private:
  binary_subtype subtype_{binary_subtype::binary};
  std::vector<byte> bytes_;
  GuidRepresentation representation_{GuidRepresentation::unspecified};
};

/**
 * @brief 值（强类型 tagged union）。
 *
 * 每种线上类型对应 variant 的一个分支；编解码按 std::visit 分派，
 * 新增类型时编译器会在 if constexpr 链中暴露遗漏。
 */
class Value final {
 public:
  using storage_type = std::variant<Double,
                                    String,
                                    Document,
                                    Array,
                                    Binary,
                                    Undefined,
                                    ObjectId,
                                    Boolean,
                                    DateTime,
                                    Null,
                                    RegularExpression,
                                    JavaScript,
                                    Symbol,
                                    JavaScriptWithScope,
                                    Int32,
                                    Timestamp,
                                    Int64,
                                    Decimal128,
                                    MinKey,
                                    MaxKey>;

  Value() noexcept : storage_(Null{}) {}

  explicit Value(Double v) : storage_(v) {}
  explicit Value(String v) : storage_(std::move(v)) {}
  explicit Value(Document v) : storage_(std::move(v)) {}
  explicit Value(Array v) : storage_(std::move(v)) {}
  explicit Value(Binary v) : storage_(std::move(v)) {}
  explicit Value(Undefined v) : storage_(v) {}
  explicit Value(ObjectId v) : storage_(v) {}
  explicit Value(Boolean v) : storage_(v) {}
  explicit Value(DateTime v) : storage_(v) {}
  explicit Value(Null v) : storage_(v) {}
  explicit Value(RegularExpression v) : storage_(std::move(v)) {}
  explicit Value(JavaScript v) : storage_(std::move(v)) {}
  explicit Value(Symbol v) : storage_(std::move(v)) {}
  explicit Value(JavaScriptWithScope v) : storage_(std::move(v)) {}
  explicit Value(Int32 v) : storage_(v) {}
  explicit Value(Timestamp v) : storage_(v) {}
  explicit Value(Int64 v) : storage_(v) {}
  explicit Value(Decimal128 v) : storage_(v) {}
  explicit Value(MinKey v) : storage_(v) {}
  explicit Value(MaxKey v) : storage_(v) {}

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  [[nodiscard]] bson_type type() const noexcept;

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  static Value double_(double v) { return Value(Double{v}); }
  static Value string(std::string v) { return Value(String{std::move(v)}); }
  static Value document(Document v) { return Value(std::move(v)); }
  static Value array(std::vector<Value> values);
  static Value boolean(bool v) { return Value(Boolean{v}); }
  static Value date_time(std::int64_t millis) { return Value(DateTime{millis}); }
  static Value null() { return Value(Null{}); }
  static Value int32(std::int32_t v) { return Value(Int32{v}); }
  static Value int64(std::int64_t v) { return Value(Int64{v}); }
  static Value regex(std::string pattern, std::string options) {
    return Value(RegularExpression{std::move(pattern), std::move(options)});
  }

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct Element final {
  std::string name;
  Value value;

  friend bool operator==(const Element&, const Element&) = default;
};

}  // namespace bsonx::bson
