#include "bsonx/bson/guid.hpp"

#include "bsonx/utils/hex.hpp"

#include <algorithm>
#include <array>

namespace bsonx::bson {
namespace {

class guid_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonx.guid"; }

  std::string message(int ev) const override {
    switch (static_cast<guid_errc>(ev)) {
      case guid_errc::ok:
        return "ok";
      case guid_errc::unspecified_representation:
        return "guid representation is unspecified";
      case guid_errc::invalid_length:
        return "guid bytes must be 16 bytes long";
      case guid_errc::invalid_format:
        return "invalid guid string";
      default:
        return "unknown bsonx.guid error";
    }
  }
};

// 三种 legacy 表示法与规范字节序之间都是“分段反转”，且反转是自逆的：
// 同一个函数既用于编码也用于解码。
void reorder(Guid::bytes_type& b, GuidRepresentation r) noexcept {
  switch (r) {
    case GuidRepresentation::csharp_legacy:
      std::reverse(b.begin(), b.begin() + 4);
      std::reverse(b.begin() + 4, b.begin() + 6);
      std::reverse(b.begin() + 6, b.begin() + 8);
      break;
    case GuidRepresentation::java_legacy:
      std::reverse(b.begin(), b.begin() + 8);
      std::reverse(b.begin() + 8, b.end());
      break;
    case GuidRepresentation::python_legacy:
    case GuidRepresentation::standard:
    case GuidRepresentation::unspecified:
      break;
  }
}

}  // namespace

const std::error_category& guid_error_category() noexcept {
  static guid_category category;
  return category;
}

std::error_code make_error_code(guid_errc e) noexcept {
  return {static_cast<int>(e), guid_error_category()};
}

std::string_view guid_representation_name(GuidRepresentation r) noexcept {
  switch (r) {
    case GuidRepresentation::unspecified: return "Unspecified";
    case GuidRepresentation::csharp_legacy: return "CSharpLegacy";
    case GuidRepresentation::java_legacy: return "JavaLegacy";
    case GuidRepresentation::python_legacy: return "PythonLegacy";
    case GuidRepresentation::standard: return "Standard";
  }
  return "Unknown";
}

std::error_code Guid::parse(std::string_view text, Guid& out) noexcept {
  if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
    text = text.substr(1, 36);
  }

  // 带连字符形式：8-4-4-4-12
  std::array<char, 32> digits{};
  if (text.size() == 36) {
    std::size_t n = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
      const bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
      if (dash_position != (text[i] == '-')) {
        return make_error_code(guid_errc::invalid_format);
      }
      if (!dash_position) {
        digits[n++] = text[i];
      }
    }
    text = std::string_view(digits.data(), digits.size());
  }

  bytes_type bytes{};
  if (!utils::decode_hex_exact(text, core::mutable_bytes_view{bytes.data(), bytes.size()})) {
    return make_error_code(guid_errc::invalid_format);
  }
  out = Guid(bytes);
  return {};
}

std::string Guid::to_string() const {
  const auto hex = utils::to_hex(core::bytes_view{bytes_.data(), bytes_.size()});
  std::string s;
  s.reserve(36);
  s.append(hex, 0, 8).append(1, '-');
  s.append(hex, 8, 4).append(1, '-');
  s.append(hex, 12, 4).append(1, '-');
  s.append(hex, 16, 4).append(1, '-');
  s.append(hex, 20, 12);
  return s;
}

bool Guid::is_empty() const noexcept {
  return std::all_of(bytes_.begin(), bytes_.end(), [](byte b) { return b == 0; });
}

std::error_code guid_to_bytes(const Guid& guid,
                              GuidRepresentation representation,
                              Guid::bytes_type& out) noexcept {
  if (representation == GuidRepresentation::unspecified) {
    return make_error_code(guid_errc::unspecified_representation);
  }
  out = guid.bytes();
  reorder(out, representation);
  return {};
}

std::error_code guid_from_bytes(bytes_view bytes,
                                GuidRepresentation representation,
                                Guid& out) noexcept {
  if (bytes.size() != 16) {
    return make_error_code(guid_errc::invalid_length);
  }
  if (representation == GuidRepresentation::unspecified) {
    return make_error_code(guid_errc::unspecified_representation);
  }
  Guid::bytes_type b{};
  std::copy(bytes.begin(), bytes.end(), b.begin());
  reorder(b, representation);
  out = Guid(b);
  return {};
}

}  // namespace bsonx::bson
