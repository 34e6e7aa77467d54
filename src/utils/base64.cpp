#include "bsonx/utils/base64.hpp"

#include "bsonx/core/error.hpp"

#include <array>
#include <cstdint>

namespace bsonx::utils {
namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> make_decode_table() noexcept {
  std::array<int, 256> t{};
  for (auto& v : t) {
    v = -1;
  }
  for (int i = 0; i < 64; ++i) {
    t[static_cast<unsigned char>(kAlphabet[i])] = i;
  }
  return t;
}

constexpr auto kDecodeTable = make_decode_table();

}  // namespace

std::string base64_encode(bsonx::core::bytes_view bytes) {
  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= bytes.size(); i += 3) {
    const std::uint32_t v = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8) | bytes[i + 2];
    out.push_back(kAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kAlphabet[(v >> 12) & 0x3F]);
    out.push_back(kAlphabet[(v >> 6) & 0x3F]);
    out.push_back(kAlphabet[v & 0x3F]);
  }
  const auto rest = bytes.size() - i;
  if (rest == 1) {
    const std::uint32_t v = std::uint32_t{bytes[i]} << 16;
    out.push_back(kAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kAlphabet[(v >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    const std::uint32_t v = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8);
    out.push_back(kAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kAlphabet[(v >> 12) & 0x3F]);
    out.push_back(kAlphabet[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::error_code base64_decode(std::string_view text, std::vector<bsonx::core::byte>& out) noexcept {
  out.clear();
  if (text.size() % 4 != 0) {
    return bsonx::core::make_error_code(bsonx::core::errc::invalid_argument);
  }
  out.reserve(text.size() / 4 * 3);

  for (std::size_t i = 0; i < text.size(); i += 4) {
    const bool last = (i + 4 == text.size());
    int vals[4] = {0, 0, 0, 0};
    int pad = 0;
    for (int k = 0; k < 4; ++k) {
      const auto c = static_cast<unsigned char>(text[i + static_cast<std::size_t>(k)]);
      if (c == '=') {
        // 填充只允许出现在最后一组的末尾 1~2 位
        if (!last || k < 2) {
          return bsonx::core::make_error_code(bsonx::core::errc::invalid_argument);
        }
        ++pad;
        continue;
      }
      if (pad > 0 || kDecodeTable[c] < 0) {
        return bsonx::core::make_error_code(bsonx::core::errc::invalid_argument);
      }
      vals[k] = kDecodeTable[c];
    }

    const std::uint32_t v = (static_cast<std::uint32_t>(vals[0]) << 18) | (static_cast<std::uint32_t>(vals[1]) << 12) |
                            (static_cast<std::uint32_t>(vals[2]) << 6) | static_cast<std::uint32_t>(vals[3]);
    out.push_back(static_cast<bsonx::core::byte>((v >> 16) & 0xFF));
    if (pad < 2) {
      out.push_back(static_cast<bsonx::core::byte>((v >> 8) & 0xFF));
    }
    if (pad < 1) {
      out.push_back(static_cast<bsonx::core::byte>(v & 0xFF));
    }
  }
  return {};
}

}  // namespace bsonx::utils
