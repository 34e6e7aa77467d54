#include "bsonx/serialization/serializers.hpp"

#include "core/log_internal.hpp"

namespace bsonx::serialization {

using bson::GuidRepresentation;
using bson::GuidRepresentationMode;

std::error_code Int32Serializer::serialize(const std::int32_t& v, bson::Value& out) const {
  out = bson::Value::int32(v);
  return {};
}

std::error_code Int32Serializer::deserialize(const bson::Value& in, std::int32_t& out) const {
  const auto* i = in.get_if<bson::Int32>();
  if (i == nullptr) {
    return make_error_code(errc::type_mismatch);
  }
  out = i->value;
  return {};
}

std::error_code Int64Serializer::serialize(const std::int64_t& v, bson::Value& out) const {
  out = bson::Value::int64(v);
  return {};
}

std::error_code Int64Serializer::deserialize(const bson::Value& in, std::int64_t& out) const {
  if (const auto* i = in.get_if<bson::Int32>()) {
    out = i->value;
    return {};
  }
  if (const auto* l = in.get_if<bson::Int64>()) {
    out = l->value;
    return {};
  }
  return make_error_code(errc::type_mismatch);
}

std::error_code DoubleSerializer::serialize(const double& v, bson::Value& out) const {
  out = bson::Value::double_(v);
  return {};
}

std::error_code DoubleSerializer::deserialize(const bson::Value& in, double& out) const {
  if (const auto* d = in.get_if<bson::Double>()) {
    out = d->value;
    return {};
  }
  if (const auto* i = in.get_if<bson::Int32>()) {
    out = i->value;
    return {};
  }
  if (const auto* l = in.get_if<bson::Int64>()) {
    out = static_cast<double>(l->value);
    return {};
  }
  return make_error_code(errc::type_mismatch);
}

std::error_code BooleanSerializer::serialize(const bool& v, bson::Value& out) const {
  out = bson::Value::boolean(v);
  return {};
}

std::error_code BooleanSerializer::deserialize(const bson::Value& in, bool& out) const {
  const auto* b = in.get_if<bson::Boolean>();
  if (b == nullptr) {
    return make_error_code(errc::type_mismatch);
  }
  out = b->value;
  return {};
}

std::error_code StringSerializer::serialize(const std::string& v, bson::Value& out) const {
  out = bson::Value::string(v);
  return {};
}

std::error_code StringSerializer::deserialize(const bson::Value& in, std::string& out) const {
  const auto* s = in.get_if<bson::String>();
  if (s == nullptr) {
    return make_error_code(errc::type_mismatch);
  }
  out = s->value;
  return {};
}

std::error_code GuidSerializer::serialize(const bson::Guid& v, bson::Value& out) const {
  auto representation = representation_;
  if (representation == GuidRepresentation::unspecified) {
    if (bson::defaults::guid_representation_mode() == GuidRepresentationMode::v3) {
      return make_error_code(errc::unspecified_guid_representation);
    }
    representation = bson::defaults::guid_representation();
    if (representation == GuidRepresentation::unspecified) {
      return make_error_code(errc::unspecified_guid_representation);
    }
  }

  bson::Binary b;
  if (auto ec = bson::Binary::from_guid(v, representation, b)) {
    return ec;
  }
  out = bson::Value(std::move(b));
  return {};
}

std::error_code GuidSerializer::deserialize(const bson::Value& in, bson::Guid& out) const {
  const auto* b = in.get_if<bson::Binary>();
  if (b == nullptr || !bson::is_uuid_subtype(b->subtype())) {
    return make_error_code(errc::type_mismatch);
  }

  GuidRepresentation representation = representation_;
  if (bson::defaults::guid_representation_mode() == GuidRepresentationMode::v2 &&
      b->guid_representation() != GuidRepresentation::unspecified) {
    representation = b->guid_representation();
  }
  if (representation == GuidRepresentation::unspecified) {
    return make_error_code(errc::unspecified_guid_representation);
  }
  if (b->subtype() != bson::subtype_for(representation)) {
    if (const auto& lg = core::detail::logger()) {
      lg->debug("guid subtype {} does not match representation {}",
                static_cast<unsigned>(b->subtype()),
                bson::guid_representation_name(representation));
    }
    return make_error_code(errc::type_mismatch);
  }
  return b->to_guid(representation, out);
}

}  // namespace bsonx::serialization
