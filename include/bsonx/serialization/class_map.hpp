#pragma once

#include "bsonx/bson/value.hpp"
#include "bsonx/serialization/error.hpp"
#include "bsonx/serialization/serializers.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace bsonx::serialization {

namespace detail {

// 成员级失败的 debug 日志（实现位于 .cpp，避免 public header 依赖 spdlog）
void log_member_failure(std::string_view operation, std::string_view member, const std::error_code& ec) noexcept;

}  // namespace detail

/**
 * @brief 类型 T 与文档之间的成员映射。
 *
 * 用法：
 *   ClassMap<Person> map;
 *   map.map("name", &Person::name)
 *      .map("id", &Person::id, GuidSerializer(GuidRepresentation::standard))
 *      .map_optional("nickname", &Person::nickname);
 *
 * 约定：
 * - to_document 按声明顺序输出全部成员；
 * - from_document：未映射的元素默认返回 errc::unexpected_element（set_ignore_extra_elements(true) 时跳过）；
 *   必选成员缺失返回 errc::missing_element；map_optional 声明的成员缺失时保持原值；
 * - 任一成员失败时返回该成员 serializer 的错误码，out 中已赋值的成员不回滚。
 */
template <class T>
class ClassMap {
 public:
  template <class M, class S>
  ClassMap& map(std::string name, M T::*member, S serializer) {
    return add(std::move(name), member, std::move(serializer), true);
  }

  template <class M>
  ClassMap& map(std::string name, M T::*member) {
    return add(std::move(name), member, typename DefaultSerializer<M>::type{}, true);
  }

  template <class M, class S>
  ClassMap& map_optional(std::string name, M T::*member, S serializer) {
    return add(std::move(name), member, std::move(serializer), false);
  }

  template <class M>
  ClassMap& map_optional(std::string name, M T::*member) {
    return add(std::move(name), member, typename DefaultSerializer<M>::type{}, false);
  }

  ClassMap& set_ignore_extra_elements(bool v) noexcept {
    ignore_extra_elements_ = v;
    return *this;
  }

  [[nodiscard]] bool ignore_extra_elements() const noexcept { return ignore_extra_elements_; }
  [[nodiscard]] std::size_t member_count() const noexcept { return members_.size(); }

  std::error_code to_document(const T& obj, bson::Document& out) const {
    bson::Document doc;
    for (const auto& m : members_) {
      bson::Value v;
      if (auto ec = m.serialize(obj, v)) {
        detail::log_member_failure("serialize", m.name, ec);
        return ec;
      }
      doc.append(m.name, std::move(v));
    }
    out = std::move(doc);
    return {};
  }

  std::error_code from_document(const bson::Document& doc, T& out) const {
    std::vector<bool> seen(members_.size(), false);

    for (const auto& e : doc) {
      const auto idx = index_of(e.name);
      if (idx == members_.size()) {
        if (ignore_extra_elements_) {
          continue;
        }
        detail::log_member_failure("deserialize", e.name, make_error_code(errc::unexpected_element));
        return make_error_code(errc::unexpected_element);
      }
      if (auto ec = members_[idx].deserialize(e.value, out)) {
        detail::log_member_failure("deserialize", e.name, ec);
        return ec;
      }
      seen[idx] = true;
    }

    for (std::size_t i = 0; i < members_.size(); ++i) {
      if (!seen[i] && members_[i].required) {
        detail::log_member_failure("deserialize", members_[i].name, make_error_code(errc::missing_element));
        return make_error_code(errc::missing_element);
      }
    }
    return {};
  }

 private:
  struct MemberMap {
    std::string name;
    bool required{true};
    std::function<std::error_code(const T&, bson::Value&)> serialize;
    std::function<std::error_code(const bson::Value&, T&)> deserialize;
  };

  template <class M, class S>
  ClassMap& add(std::string name, M T::*member, S serializer, bool required) {
    MemberMap m;
    m.name = std::move(name);
    m.required = required;
    m.serialize = [member, serializer](const T& obj, bson::Value& out) {
      return serializer.serialize(obj.*member, out);
    };
    m.deserialize = [member, serializer](const bson::Value& in, T& obj) {
      return serializer.deserialize(in, obj.*member);
    };
    members_.push_back(std::move(m));
    return *this;
  }

  [[nodiscard]] std::size_t index_of(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < members_.size(); ++i) {
      if (members_[i].name == name) {
        return i;
      }
    }
    return members_.size();
  }

  std::vector<MemberMap> members_;
  bool ignore_extra_elements_{false};
};

}  // namespace bsonx::serialization
