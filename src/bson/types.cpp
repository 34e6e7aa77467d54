#include "bsonx/bson/types.hpp"

namespace bsonx::bson {
namespace {

constexpr std::array<bson_type, kBsonTypeCount> kAllTypes = {
  bson_type::double_,
  bson_type::string,
  bson_type::document,
  bson_type::array,
  bson_type::binary,
  bson_type::undefined,
  bson_type::object_id,
  bson_type::boolean,
  bson_type::date_time,
  bson_type::null,
  bson_type::regular_expression,
  bson_type::javascript,
  bson_type::symbol,
  bson_type::javascript_with_scope,
  bson_type::int32,
  bson_type::timestamp,
  bson_type::int64,
  bson_type::decimal128,
  bson_type::max_key,
  bson_type::min_key,
};

}  // namespace

const std::array<bson_type, kBsonTypeCount>& all_bson_types() noexcept { return kAllTypes; }

std::optional<bson_type> bson_type_from_byte(byte b) noexcept {
  switch (static_cast<bson_type>(b)) {
    case bson_type::double_:
    case bson_type::string:
    case bson_type::document:
    case bson_type::array:
    case bson_type::binary:
    case bson_type::undefined:
    case bson_type::object_id:
    case bson_type::boolean:
    case bson_type::date_time:
    case bson_type::null:
    case bson_type::regular_expression:
    case bson_type::javascript:
    case bson_type::symbol:
    case bson_type::javascript_with_scope:
    case bson_type::int32:
    case bson_type::timestamp:
    case bson_type::int64:
    case bson_type::decimal128:
    case bson_type::max_key:
    case bson_type::min_key:
      return static_cast<bson_type>(b);
    default:
      return std::nullopt;
  }
}

std::string_view bson_type_name(bson_type t) noexcept {
  switch (t) {
    case bson_type::end_of_document: return "EndOfDocument";
    case bson_type::double_: return "Double";
    case bson_type::string: return "String";
    case bson_type::document: return "Document";
    case bson_type::array: return "Array";
    case bson_type::binary: return "Binary";
    case bson_type::undefined: return "Undefined";
    case bson_type::object_id: return "ObjectId";
    case bson_type::boolean: return "Boolean";
    case bson_type::date_time: return "DateTime";
    case bson_type::null: return "Null";
    case bson_type::regular_expression: return "RegularExpression";
    case bson_type::javascript: return "JavaScript";
    case bson_type::symbol: return "Symbol";
    case bson_type::javascript_with_scope: return "JavaScriptWithScope";
    case bson_type::int32: return "Int32";
    case bson_type::timestamp: return "Timestamp";
    case bson_type::int64: return "Int64";
    case bson_type::decimal128: return "Decimal128";
    case bson_type::max_key: return "MaxKey";
    case bson_type::min_key: return "MinKey";
  }
  return "Unknown";
}

std::string_view binary_subtype_name(binary_subtype s) noexcept {
  switch (s) {
    case binary_subtype::binary: return "Binary";
    case binary_subtype::function: return "Function";
    case binary_subtype::old_binary: return "OldBinary";
    case binary_subtype::uuid_legacy: return "UuidLegacy";
    case binary_subtype::uuid_standard: return "UuidStandard";
    case binary_subtype::md5: return "MD5";
    case binary_subtype::encrypted: return "Encrypted";
    case binary_subtype::column: return "Column";
    case binary_subtype::sensitive: return "Sensitive";
    case binary_subtype::user_defined: return "UserDefined";
  }
  return "Unknown";
}

}  // namespace bsonx::bson
