#pragma once

#include "bsonx/bson/value.hpp"
#include "bsonx/json/writer_settings.hpp"

#include <string>
#include <system_error>

namespace bsonx::json {

/**
 * @brief 文档 -> 文本，结果追加到 out。
 *
 * 说明：
 * - document / array / string / javascript_with_scope 由 writer 直接输出，
 *   其余类型交给 settings.converters() 对应槽位的转换器；
 * - javascript_with_scope 输出为 { "$code" : "...", "$scope" : { ... } }；
 * - v2 模式下，未标记表示法的子类型 3 值按 settings.guid_representation() 解读
 *   （该表示法为 unspecified 或 standard 时保持未标记，输出 HexData）；
 * - 嵌套层数超过 max_serialization_depth 返回 writer_errc::max_depth_exceeded；
 * - 失败时 out 保持调用前的内容。
 */
std::error_code write(const bson::Document& doc, const WriterSettings& settings, std::string& out) noexcept;

/**
 * @brief 便捷接口：失败时返回空串（原因以 debug 级别写入日志）。
 */
[[nodiscard]] std::string to_json(const bson::Document& doc, const WriterSettings& settings = WriterSettings{});

}  // namespace bsonx::json
