#include "bsonx/json/converter_set.hpp"

#include "bsonx/json/converters.hpp"

#include "core/log_internal.hpp"

namespace bsonx::json {

namespace {

using Member = std::shared_ptr<const Converter> ConverterSet::Slots::*;

// bson_type -> Slots 成员；结构类型返回 nullptr
[[nodiscard]] Member slot_member(bson::bson_type type) noexcept {
  using bson::bson_type;
  using S = ConverterSet::Slots;
  switch (type) {
    case bson_type::binary: return &S::binary;
    case bson_type::boolean: return &S::boolean;
    case bson_type::date_time: return &S::date_time;
    case bson_type::decimal128: return &S::decimal128;
    case bson_type::double_: return &S::double_;
    case bson_type::int32: return &S::int32;
    case bson_type::int64: return &S::int64;
    case bson_type::javascript: return &S::javascript;
    case bson_type::max_key: return &S::max_key;
    case bson_type::min_key: return &S::min_key;
    case bson_type::null: return &S::null;
    case bson_type::object_id: return &S::object_id;
    case bson_type::regular_expression: return &S::regular_expression;
    case bson_type::string: return &S::string;
    case bson_type::symbol: return &S::symbol;
    case bson_type::timestamp: return &S::timestamp;
    case bson_type::undefined: return &S::undefined;
    default: break;
  }
  return nullptr;
}

template <class T>
std::shared_ptr<const Converter> make() {
  return std::make_shared<const T>();
}

ConverterSet::Slots shell_slots() {
  using namespace converters;
  ConverterSet::Slots s;
  s.binary = make<BinaryShell>();
  s.boolean = make<BooleanStrict>();
  s.date_time = make<DateTimeShell>();
  s.decimal128 = make<Decimal128Shell>();
  s.double_ = make<DoubleWithDecimalPoint>();
  s.int32 = make<Int32Strict>();
  s.int64 = make<Int64Shell>();
  s.javascript = make<JavaScriptExtended>();
  s.max_key = make<MaxKeyShell>();
  s.min_key = make<MinKeyShell>();
  s.null = make<NullStrict>();
  s.object_id = make<ObjectIdShell>();
  s.regular_expression = make<RegularExpressionShell>();
  s.string = make<StringStrict>();
  s.symbol = make<SymbolExtended>();
  s.timestamp = make<TimestampShell>();
  s.undefined = make<UndefinedShell>();
  return s;
}

ConverterSet::Slots strict_slots() {
  using namespace converters;
  ConverterSet::Slots s;
  s.binary = make<BinaryExtended>();
  s.boolean = make<BooleanStrict>();
  s.date_time = make<DateTimeExtended>();
  s.decimal128 = make<Decimal128Extended>();
  s.double_ = make<DoubleWithDecimalPoint>();
  s.int32 = make<Int32Strict>();
  s.int64 = make<Int64Strict>();
  s.javascript = make<JavaScriptExtended>();
  s.max_key = make<MaxKeyExtended>();
  s.min_key = make<MinKeyExtended>();
  s.null = make<NullStrict>();
  s.object_id = make<ObjectIdExtended>();
  s.regular_expression = make<RegularExpressionExtended>();
  s.string = make<StringStrict>();
  s.symbol = make<SymbolExtended>();
  s.timestamp = make<TimestampExtended>();
  s.undefined = make<UndefinedExtended>();
  return s;
}

}  // namespace

std::error_code ConverterSet::create(Slots slots, ConverterSet& out) noexcept {
  ConverterSet candidate(std::move(slots));
  if (!candidate.is_complete()) {
    return make_error_code(writer_errc::missing_converter);
  }
  out = std::move(candidate);
  return {};
}

const ConverterSet& ConverterSet::shell() noexcept {
  static const ConverterSet instance(shell_slots());
  return instance;
}

const ConverterSet& ConverterSet::strict() noexcept {
  static const ConverterSet instance(strict_slots());
  return instance;
}

bool ConverterSet::has_slot(bson::bson_type type) noexcept {
  return slot_member(type) != nullptr;
}

std::error_code ConverterSet::with(bson::bson_type type,
                                   std::shared_ptr<const Converter> converter,
                                   ConverterSet& out) const noexcept {
  const auto member = slot_member(type);
  if (member == nullptr) {
    if (const auto& lg = core::detail::logger()) {
      lg->debug("converter override rejected: type {} has no converter slot", bson::bson_type_name(type));
    }
    return make_error_code(writer_errc::invalid_converter_slot);
  }
  if (!converter) {
    return make_error_code(writer_errc::missing_converter);
  }

  Slots slots = slots_;
  slots.*member = std::move(converter);
  out = ConverterSet(std::move(slots));
  return {};
}

const Converter* ConverterSet::find(bson::bson_type type) const noexcept {
  const auto member = slot_member(type);
  return member == nullptr ? nullptr : (slots_.*member).get();
}

std::shared_ptr<const Converter> ConverterSet::get(bson::bson_type type) const noexcept {
  const auto member = slot_member(type);
  return member == nullptr ? nullptr : slots_.*member;
}

bool ConverterSet::is_complete() const noexcept {
  for (const auto type : bson::all_bson_types()) {
    const auto member = slot_member(type);
    if (member != nullptr && !(slots_.*member)) {
      return false;
    }
  }
  return true;
}

}  // namespace bsonx::json
