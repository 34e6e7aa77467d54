#pragma once

#include "bsonx/bson/error.hpp"
#include "bsonx/bson/settings.hpp"
#include "bsonx/bson/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace bsonx::bson {

/**
 * @brief 二进制解码结果。
 *
 * 失败时：
 * - ec 非零（core::errc 或 bson::errc）；
 * - error_offset 为检测到错误时的字节偏移（相对输入起点）；
 * - error_tag 在 ec == errc::invalid_type 时为非法的标签字节。
 */
struct DecodeResult {
  Document document;
  std::error_code ec;
  std::size_t error_offset{0};
  byte error_tag{0};
};

/**
 * @brief 解码一个完整文档；输入必须恰好是一个文档（多余字节返回 errc::trailing_bytes）。
 */
[[nodiscard]] DecodeResult decode(bytes_view in, const ReaderSettings& settings = ReaderSettings{});

/**
 * @brief 从输入起点解码一个文档（流式 API）。
 *
 * 成功时 consumed 为该文档的字节数；失败时 consumed 为 0，error_offset 为出错偏移。
 */
std::error_code decode_one(bytes_view in,
                           Document& out,
                           std::size_t& consumed,
                           std::size_t& error_offset,
                           const ReaderSettings& settings) noexcept;

/**
 * @brief 编码文档并追加到 out；失败时 out 保持调用前的内容。
 *
 * 约定：
 * - 先写占位长度，正文写完后回填（每个嵌入文档同理）；
 * - 数组元素名为 "0","1",...；
 * - 任一文档超过 max_document_size 返回 errc::document_too_large。
 */
std::error_code encode(const Document& doc,
                       std::vector<byte>& out,
                       const WriterSettings& settings = WriterSettings{}) noexcept;

/**
 * @brief 计算文档编码后的字节数（与 encode 使用同一 settings 时结果一致）。
 */
std::error_code encoded_size(const Document& doc,
                             std::size_t& out_size,
                             const WriterSettings& settings = WriterSettings{}) noexcept;

}  // namespace bsonx::bson
