#include "bsonx/bson/defaults.hpp"

#include "bsonx/core/common.hpp"
#include "bsonx/core/error.hpp"

namespace bsonx::bson {
namespace {

struct Globals final {
  GuidRepresentationMode mode{GuidRepresentationMode::v2};
  GuidRepresentation representation{GuidRepresentation::csharp_legacy};
  std::size_t max_document_size{core::kDefaultMaxDocumentSize};
  std::size_t max_serialization_depth{core::kDefaultMaxSerializationDepth};
};

Globals& globals() noexcept {
  static Globals g;
  return g;
}

}  // namespace

namespace defaults {

GuidRepresentationMode guid_representation_mode() noexcept { return globals().mode; }

void set_guid_representation_mode(GuidRepresentationMode mode) noexcept { globals().mode = mode; }

GuidRepresentation guid_representation() noexcept { return globals().representation; }

std::error_code set_guid_representation(GuidRepresentation representation) noexcept {
  if (globals().mode != GuidRepresentationMode::v2) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  globals().representation = representation;
  return {};
}

std::size_t max_document_size() noexcept { return globals().max_document_size; }

void set_max_document_size(std::size_t size) noexcept { globals().max_document_size = size; }

std::size_t max_serialization_depth() noexcept { return globals().max_serialization_depth; }

void set_max_serialization_depth(std::size_t depth) noexcept { globals().max_serialization_depth = depth; }

}  // namespace defaults

ScopedGuidRepresentationMode::ScopedGuidRepresentationMode(GuidRepresentationMode mode) noexcept
    : saved_mode_(globals().mode), saved_representation_(globals().representation) {
  globals().mode = mode;
}

ScopedGuidRepresentationMode::ScopedGuidRepresentationMode(GuidRepresentationMode mode,
                                                           GuidRepresentation representation) noexcept
    : saved_mode_(globals().mode), saved_representation_(globals().representation) {
  globals().mode = mode;
  globals().representation = representation;
}

ScopedGuidRepresentationMode::~ScopedGuidRepresentationMode() {
  globals().mode = saved_mode_;
  globals().representation = saved_representation_;
}

}  // namespace bsonx::bson
