#pragma once

#include "bsonx/core/common.hpp"
#include "bsonx/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonx::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - ObjectId / HexData / $binary.$type 等文本字面量与字节的互转；
 * - 解码失败时把出错附近的字节以 hexdump 形式写进日志；
 * - 测试里用 “05 00 00 00 00” 这样的字符串描述线上字节。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};
};

/**
 * @brief 将 bytes 以 hexdump 形式格式化为字符串（多行）。
 */
[[nodiscard]] std::string hex_dump(bsonx::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 小写连续 hex（无分隔符），例如 ObjectId 的 24 位文本形式。
 */
[[nodiscard]] std::string to_hex(bsonx::core::bytes_view bytes);

/**
 * @brief 严格解析：text 必须恰好是 out.size() * 2 个 hex 字符，不允许分隔符/前缀。
 */
[[nodiscard]] bool decode_hex_exact(std::string_view text,
                                    bsonx::core::mutable_bytes_view out) noexcept;

/**
 * @brief 宽松解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<bsonx::core::byte> &out) noexcept;

} // namespace bsonx::utils
