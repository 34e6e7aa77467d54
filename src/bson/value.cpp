#include "bsonx/bson/value.hpp"

#include "bsonx/bson/defaults.hpp"
#include "bsonx/bson/error.hpp"

#include <algorithm>
#include <bit>
#include <type_traits>

namespace bsonx::bson {

Document::Document(std::initializer_list<Element> elements) : elements_(elements) {}

Document& Document::append(std::string name, Value value) {
  elements_.push_back(Element{std::move(name), std::move(value)});
  return *this;
}

std::size_t Document::size() const noexcept { return elements_.size(); }

bool Document::empty() const noexcept { return elements_.empty(); }

Document::const_iterator Document::begin() const noexcept { return elements_.begin(); }

Document::const_iterator Document::end() const noexcept { return elements_.end(); }

const Element& Document::operator[](std::size_t index) const noexcept { return elements_[index]; }

const Value* Document::find(std::string_view name) const noexcept {
  auto it = std::find_if(elements_.begin(), elements_.end(), [&](const Element& e) { return e.name == name; });
  return it == elements_.end() ? nullptr : &it->value;
}

void Document::clear() noexcept { elements_.clear(); }

bool operator==(const Document& lhs, const Document& rhs) noexcept { return lhs.elements_ == rhs.elements_; }

bool operator==(const Array& lhs, const Array& rhs) noexcept { return lhs.values == rhs.values; }

bool operator==(const Double& lhs, const Double& rhs) noexcept {
  return std::bit_cast<std::uint64_t>(lhs.value) == std::bit_cast<std::uint64_t>(rhs.value);
}

bool operator==(const JavaScriptWithScope& lhs, const JavaScriptWithScope& rhs) noexcept {
  return lhs.code == rhs.code && lhs.scope == rhs.scope;
}

Binary::Binary(std::vector<byte> bytes, binary_subtype subtype) : subtype_(subtype), bytes_(std::move(bytes)) {
  if (subtype_ == binary_subtype::uuid_standard) {
    representation_ = GuidRepresentation::standard;
  } else if (subtype_ == binary_subtype::uuid_legacy &&
             defaults::guid_representation_mode() == GuidRepresentationMode::v2 &&
             defaults::guid_representation() != GuidRepresentation::standard) {
    representation_ = defaults::guid_representation();
  }
}

std::error_code Binary::create(binary_subtype subtype,
                               std::vector<byte> bytes,
                               GuidRepresentation representation,
                               Binary& out) noexcept {
  if (is_uuid_subtype(subtype)) {
    if (bytes.size() != 16) {
      return make_error_code(errc::invalid_binary_length);
    }
    if (subtype == binary_subtype::uuid_standard && representation != GuidRepresentation::standard) {
      return make_error_code(errc::guid_representation_mismatch);
    }
    if (subtype == binary_subtype::uuid_legacy && representation == GuidRepresentation::standard) {
      return make_error_code(errc::guid_representation_mismatch);
    }
  } else if (representation != GuidRepresentation::unspecified) {
    return make_error_code(errc::guid_representation_mismatch);
  }

  Binary b;
  b.subtype_ = subtype;
  b.bytes_ = std::move(bytes);
  b.representation_ = representation;
  out = std::move(b);
  return {};
}

std::error_code Binary::from_guid(const Guid& guid, GuidRepresentation representation, Binary& out) noexcept {
  Guid::bytes_type raw{};
  auto ec = guid_to_bytes(guid, representation, raw);
  if (ec) {
    return ec;
  }
  return create(subtype_for(representation), std::vector<byte>(raw.begin(), raw.end()), representation, out);
}

std::error_code Binary::to_guid(Guid& out) const noexcept { return to_guid(representation_, out); }

std::error_code Binary::to_guid(GuidRepresentation representation, Guid& out) const noexcept {
  if (!is_uuid_subtype(subtype_)) {
    return make_error_code(errc::guid_representation_mismatch);
  }
  if (representation == GuidRepresentation::unspecified) {
    return make_error_code(guid_errc::unspecified_representation);
  }
  if (subtype_ != subtype_for(representation)) {
    return make_error_code(errc::guid_representation_mismatch);
  }
  return guid_from_bytes(bytes_view{bytes_.data(), bytes_.size()}, representation, out);
}

bson_type Value::type() const noexcept {
  return std::visit(
    [](const auto& v) -> bson_type {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Double>) {
        return bson_type::double_;
      } else if constexpr (std::is_same_v<T, String>) {
        return bson_type::string;
      } else if constexpr (std::is_same_v<T, Document>) {
        return bson_type::document;
      } else if constexpr (std::is_same_v<T, Array>) {
        return bson_type::array;
      } else if constexpr (std::is_same_v<T, Binary>) {
        return bson_type::binary;
      } else if constexpr (std::is_same_v<T, Undefined>) {
        return bson_type::undefined;
      } else if constexpr (std::is_same_v<T, ObjectId>) {
        return bson_type::object_id;
      } else if constexpr (std::is_same_v<T, Boolean>) {
        return bson_type::boolean;
      } else if constexpr (std::is_same_v<T, DateTime>) {
        return bson_type::date_time;
      } else if constexpr (std::is_same_v<T, Null>) {
        return bson_type::null;
      } else if constexpr (std::is_same_v<T, RegularExpression>) {
        return bson_type::regular_expression;
      } else if constexpr (std::is_same_v<T, JavaScript>) {
        return bson_type::javascript;
      } else if constexpr (std::is_same_v<T, Symbol>) {
        return bson_type::symbol;
      } else if constexpr (std::is_same_v<T, JavaScriptWithScope>) {
        return bson_type::javascript_with_scope;
      } else if constexpr (std::is_same_v<T, Int32>) {
        return bson_type::int32;
      } else if constexpr (std::is_same_v<T, Timestamp>) {
        return bson_type::timestamp;
      } else if constexpr (std::is_same_v<T, Int64>) {
        return bson_type::int64;
      } else if constexpr (std::is_same_v<T, Decimal128>) {
        return bson_type::decimal128;
      } else if constexpr (std::is_same_v<T, MinKey>) {
        return bson_type::min_key;
      } else {
        static_assert(std::is_same_v<T, MaxKey>, "unhandled value kind");
        return bson_type::max_key;
      }
    },
    storage_);
}

Value Value::array(std::vector<Value> values) { return Value(Array{std::move(values)}); }

bool operator==(const Value& lhs, const Value& rhs) noexcept { return lhs.storage_ == rhs.storage_; }

}  // namespace bsonx::bson
