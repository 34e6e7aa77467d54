#include "bsonx/serialization/class_map.hpp"

#include "core/log_internal.hpp"

namespace bsonx::serialization::detail {

void log_member_failure(std::string_view operation, std::string_view member, const std::error_code& ec) noexcept {
  if (const auto& lg = core::detail::logger()) {
    lg->debug("class map {} failed on member '{}': {} [{}]", operation, member, ec.message(), ec.category().name());
  }
}

}  // namespace bsonx::serialization::detail
