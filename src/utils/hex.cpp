#include "bsonx/utils/hex.hpp"

#include <algorithm>
#include <cstdio>

namespace bsonx::utils {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
    case '(':
    case ')':
    case '{':
    case '}':
    case '"':
        return true;
    default:
        return false;
    }
}

void append_byte_(std::string &out, bsonx::core::byte b) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0F]);
}

} // namespace

std::string hex_dump(bsonx::core::bytes_view bytes, HexDumpOptions options) {
    std::string out;
    const std::size_t total = bytes.size();
    const std::size_t limit =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < limit; offset += per_line) {
        const std::size_t line_n = std::min(per_line, limit - offset);

        if (options.show_offset) {
            char prefix[16];
            std::snprintf(prefix, sizeof(prefix), "%04zx: ", offset);
            out += prefix;
        }

        for (std::size_t i = 0; i < line_n; ++i) {
            append_byte_(out, bytes[offset + i]);
            if (i + 1 != line_n) {
                out.push_back(' ');
            }
        }

        if (options.show_ascii) {
            // 补齐短行，保证 ASCII 列对齐。
            out.append((per_line - line_n) * 3 + 2, ' ');
            for (std::size_t i = 0; i < line_n; ++i) {
                const auto c = bytes[offset + i];
                out.push_back((c >= 0x20 && c <= 0x7E) ? static_cast<char>(c) : '.');
            }
        }
        out.push_back('\n');
    }

    if (limit < total) {
        out += "... (truncated, total=" + std::to_string(total) + " bytes)\n";
    }
    return out;
}

std::string to_hex(bsonx::core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        append_byte_(out, b);
    }
    return out;
}

bool decode_hex_exact(std::string_view text,
                      bsonx::core::mutable_bytes_view out) noexcept {
    if (text.size() != out.size() * 2) {
        return false;
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        const int hi = hex_value_(static_cast<unsigned char>(text[2 * i]));
        const int lo = hex_value_(static_cast<unsigned char>(text[2 * i + 1]));
        if (hi < 0 || lo < 0) {
            return false;
        }
        out[i] = static_cast<bsonx::core::byte>((hi << 4) | lo);
    }
    return true;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<bsonx::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 支持可选 0x/0X 前缀（仅在一个字节的起始位置识别）。
        if (c == '0' && hi_nibble < 0 && (i + 1) < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = hex_value_(c);
        if (v < 0) {
            return bsonx::core::make_error_code(bsonx::core::errc::invalid_argument);
        }
        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }

        out.push_back(static_cast<bsonx::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 必须是偶数个 nibble。
    if (hi_nibble >= 0) {
        return bsonx::core::make_error_code(bsonx::core::errc::invalid_argument);
    }

    return {};
}

} // namespace bsonx::utils
