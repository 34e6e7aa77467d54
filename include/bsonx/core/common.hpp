#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace bsonx::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 单个文档默认最大字节数（与服务端 16MB 上限一致）。
inline constexpr std::size_t kDefaultMaxDocumentSize = 16 * 1024 * 1024;  // 16MB

// 默认最大嵌套深度：防止恶意输入构造极深嵌套导致栈溢出。
inline constexpr std::size_t kDefaultMaxSerializationDepth = 100;

// 文档最小长度：4 字节长度前缀 + 1 字节结束符。
inline constexpr std::size_t kMinDocumentSize = 5;

}  // 命名空间 bsonx::core
