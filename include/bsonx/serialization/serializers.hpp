#pragma once

#include "bsonx/bson/defaults.hpp"
#include "bsonx/bson/guid.hpp"
#include "bsonx/bson/value.hpp"
#include "bsonx/serialization/error.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace bsonx::serialization {

/**
 * @brief 字段级 serializer 约定（duck typing，无公共基类）：
 *
 *   using value_type = T;
 *   std::error_code serialize(const T& v, bson::Value& out) const;
 *   std::error_code deserialize(const bson::Value& in, T& out) const;
 *
 * 失败时 out 不保证保持原值；ClassMap 只在整体成功后才认为对象有效。
 */

class Int32Serializer {
 public:
  using value_type = std::int32_t;
  std::error_code serialize(const std::int32_t& v, bson::Value& out) const;
  std::error_code deserialize(const bson::Value& in, std::int32_t& out) const;
};

/**
 * @brief 接受 Int32 / Int64。
 */
class Int64Serializer {
 public:
  using value_type = std::int64_t;
  std::error_code serialize(const std::int64_t& v, bson::Value& out) const;
  std::error_code deserialize(const bson::Value& in, std::int64_t& out) const;
};

/**
 * @brief 接受 Int32 / Int64 / Double。
 */
class DoubleSerializer {
 public:
  using value_type = double;
  std::error_code serialize(const double& v, bson::Value& out) const;
  std::error_code deserialize(const bson::Value& in, double& out) const;
};

class BooleanSerializer {
 public:
  using value_type = bool;
  std::error_code serialize(const bool& v, bson::Value& out) const;
  std::error_code deserialize(const bson::Value& in, bool& out) const;
};

class StringSerializer {
 public:
  using value_type = std::string;
  std::error_code serialize(const std::string& v, bson::Value& out) const;
  std::error_code deserialize(const bson::Value& in, std::string& out) const;
};

/**
 * @brief Guid 字段 serializer（字段级表示法，v3 风格）。
 *
 * 序列化：
 * - 指定了表示法：按该表示法打包（子类型由表示法决定）；
 * - 未指定：v2 模式退回进程默认表示法，v3 模式返回 errc::unspecified_guid_representation。
 *
 * 反序列化（值必须是子类型 3/4 的 binary，否则 errc::type_mismatch）：
 * - v3：子类型必须与本 serializer 的表示法一致，按该表示法解包；
 * - v2：优先使用值上的表示法标记，未标记时用本 serializer 的表示法；两者都未指定则失败。
 */
class GuidSerializer {
 public:
  using value_type = bson::Guid;

  GuidSerializer() noexcept = default;
  explicit GuidSerializer(bson::GuidRepresentation representation) noexcept : representation_(representation) {}

  [[nodiscard]] bson::GuidRepresentation representation() const noexcept { return representation_; }

  std::error_code serialize(const bson::Guid& v, bson::Value& out) const;
  std::error_code deserialize(const bson::Value& in, bson::Guid& out) const;

 private:
  bson::GuidRepresentation representation_{bson::GuidRepresentation::unspecified};
};

/**
 * @brief 枚举的线上表示。
 *
 * underlying：底层类型为 64 位时写 Int64，否则写 Int32。
 */
enum class EnumRepresentation : std::uint8_t {
  underlying = 0,
  int32 = 1,
  int64 = 2,
  string = 3,
};

/**
 * @brief 枚举 serializer。
 *
 * 约定：
 * - string 表示需要提供 (值, 名字) 表；没有名字的值序列化失败（errc::unknown_enum_name）；
 * - 反序列化接受 Int32 / Int64 / Double（向零截断）/ String（按名字查找），与当前表示无关；
 * - 32 位底层类型与 Int32 之间按位互转（uint32 最大值写作 -1 并可读回）；
 *   其它情况超出底层类型范围返回 errc::value_out_of_range。
 */
template <class E>
class EnumSerializer {
  static_assert(std::is_enum_v<E>, "EnumSerializer requires an enum type");

 public:
  using value_type = E;
  using underlying_type = std::underlying_type_t<E>;

  EnumSerializer() = default;
  explicit EnumSerializer(EnumRepresentation representation, std::vector<std::pair<E, std::string>> names = {})
      : representation_(representation), names_(std::move(names)) {}

  [[nodiscard]] EnumRepresentation representation() const noexcept { return representation_; }

  [[nodiscard]] EnumSerializer with_representation(EnumRepresentation representation) const {
    return EnumSerializer(representation, names_);
  }

  std::error_code serialize(const E& v, bson::Value& out) const {
    switch (effective_representation()) {
      case EnumRepresentation::int32: {
        std::int32_t i = 0;
        if (auto ec = to_int32(v, i)) return ec;
        out = bson::Value::int32(i);
        return {};
      }
      case EnumRepresentation::int64:
        out = bson::Value::int64(static_cast<std::int64_t>(static_cast<underlying_type>(v)));
        return {};
      case EnumRepresentation::string:
        for (const auto& [value, name] : names_) {
          if (value == v) {
            out = bson::Value::string(name);
            return {};
          }
        }
        return make_error_code(errc::unknown_enum_name);
      case EnumRepresentation::underlying:
        break;
    }
    return make_error_code(errc::type_mismatch);
  }

  std::error_code deserialize(const bson::Value& in, E& out) const {
    if (const auto* i = in.get_if<bson::Int32>()) {
      return from_int32(i->value, out);
    }
    if (const auto* l = in.get_if<bson::Int64>()) {
      return from_int64(l->value, out);
    }
    if (const auto* d = in.get_if<bson::Double>()) {
      const double t = std::trunc(d->value);
      if (!std::isfinite(t) || t < -9.2233720368547758e18 || t >= 9.2233720368547758e18) {
        return make_error_code(errc::value_out_of_range);
      }
      return from_int64(static_cast<std::int64_t>(t), out);
    }
    if (const auto* s = in.get_if<bson::String>()) {
      for (const auto& [value, name] : names_) {
        if (name == s->value) {
          out = value;
          return {};
        }
      }
      return make_error_code(errc::unknown_enum_name);
    }
    return make_error_code(errc::type_mismatch);
  }

 private:
  [[nodiscard]] EnumRepresentation effective_representation() const noexcept {
    if (representation_ != EnumRepresentation::underlying) {
      return representation_;
    }
    return sizeof(underlying_type) == 8 ? EnumRepresentation::int64 : EnumRepresentation::int32;
  }

  static std::error_code to_int32(E v, std::int32_t& out) {
    const auto u = static_cast<underlying_type>(v);
    if constexpr (sizeof(underlying_type) <= 4) {
      out = static_cast<std::int32_t>(u);
    } else if constexpr (std::is_signed_v<underlying_type>) {
      if (!std::in_range<std::int32_t>(u)) return make_error_code(errc::value_out_of_range);
      out = static_cast<std::int32_t>(u);
    } else {
      if (!std::in_range<std::uint32_t>(u)) return make_error_code(errc::value_out_of_range);
      out = static_cast<std::int32_t>(static_cast<std::uint32_t>(u));
    }
    return {};
  }

  static std::error_code from_int32(std::int32_t v, E& out) {
    if constexpr (sizeof(underlying_type) == 4) {
      out = static_cast<E>(static_cast<underlying_type>(v));
      return {};
    } else {
      return from_int64(v, out);
    }
  }

  static std::error_code from_int64(std::int64_t v, E& out) {
    if constexpr (sizeof(underlying_type) == 8) {
      out = static_cast<E>(static_cast<underlying_type>(v));
    } else {
      if (!std::in_range<underlying_type>(v)) return make_error_code(errc::value_out_of_range);
      out = static_cast<E>(static_cast<underlying_type>(v));
    }
    return {};
  }

  EnumRepresentation representation_{EnumRepresentation::underlying};
  std::vector<std::pair<E, std::string>> names_;
};

/**
 * @brief std::vector<T> <-> Array，元素交给 S。
 */
template <class T, class S>
class VectorSerializer {
 public:
  using value_type = std::vector<T>;

  VectorSerializer() = default;
  explicit VectorSerializer(S element) : element_(std::move(element)) {}

  std::error_code serialize(const std::vector<T>& v, bson::Value& out) const {
    bson::Array arr;
    arr.values.reserve(v.size());
    for (const auto& item : v) {
      bson::Value element;
      if (auto ec = element_.serialize(item, element)) return ec;
      arr.values.push_back(std::move(element));
    }
    out = bson::Value(std::move(arr));
    return {};
  }

  std::error_code deserialize(const bson::Value& in, std::vector<T>& out) const {
    const auto* arr = in.get_if<bson::Array>();
    if (arr == nullptr) {
      return make_error_code(errc::type_mismatch);
    }
    std::vector<T> result;
    result.reserve(arr->values.size());
    for (const auto& element : arr->values) {
      T item{};
      if (auto ec = element_.deserialize(element, item)) return ec;
      result.push_back(std::move(item));
    }
    out = std::move(result);
    return {};
  }

 private:
  S element_{};
};

/**
 * @brief std::optional<T> <-> (Null | S 的表示)。
 */
template <class T, class S>
class OptionalSerializer {
 public:
  using value_type = std::optional<T>;

  OptionalSerializer() = default;
  explicit OptionalSerializer(S inner) : inner_(std::move(inner)) {}

  std::error_code serialize(const std::optional<T>& v, bson::Value& out) const {
    if (!v.has_value()) {
      out = bson::Value::null();
      return {};
    }
    return inner_.serialize(*v, out);
  }

  std::error_code deserialize(const bson::Value& in, std::optional<T>& out) const {
    if (in.is<bson::Null>()) {
      out.reset();
      return {};
    }
    T value{};
    if (auto ec = inner_.deserialize(in, value)) return ec;
    out = std::move(value);
    return {};
  }

 private:
  S inner_{};
};

/**
 * @brief 成员类型 -> 默认 serializer（ClassMap::map(name, member) 使用）。
 */
template <class T>
struct DefaultSerializer;

template <>
struct DefaultSerializer<std::int32_t> {
  using type = Int32Serializer;
};
template <>
struct DefaultSerializer<std::int64_t> {
  using type = Int64Serializer;
};
template <>
struct DefaultSerializer<double> {
  using type = DoubleSerializer;
};
template <>
struct DefaultSerializer<bool> {
  using type = BooleanSerializer;
};
template <>
struct DefaultSerializer<std::string> {
  using type = StringSerializer;
};
template <class T>
struct DefaultSerializer<std::vector<T>> {
  using type = VectorSerializer<T, typename DefaultSerializer<T>::type>;
};
template <class T>
struct DefaultSerializer<std::optional<T>> {
  using type = OptionalSerializer<T, typename DefaultSerializer<T>::type>;
};

}  // namespace bsonx::serialization
