#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace bsonx::core::detail {

/**
 * @brief 库内专用 logger（名称 "bsonx"）。
 *
 * 说明：
 * - 由默认 logger clone 而来，沿用业务侧已配置的 sink；
 * - 级别由 core::set_log_level 控制，不影响业务侧其它 logger。
 */
[[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() noexcept;

}  // namespace bsonx::core::detail
