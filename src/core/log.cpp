#include "bsonx/core/log.hpp"

#include "log_internal.hpp"

#include <array>

namespace bsonx::core {
namespace {

// 下标与 LogLevel 数值一一对应。
constexpr std::array<spdlog::level::level_enum, 7> kLevelTable = {
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kLevelTable.size(); ++i) {
        if (kLevelTable[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

std::shared_ptr<spdlog::logger> make_library_logger() {
    auto base = spdlog::default_logger();
    auto lg = base ? base->clone("bsonx") : std::shared_ptr<spdlog::logger>{};
    if (lg) {
        // 默认只输出 warn 以上，避免库内 debug 日志淹没业务日志。
        lg->set_level(spdlog::level::warn);
    }
    return lg;
}

} // namespace

namespace detail {

const std::shared_ptr<spdlog::logger>& logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance = make_library_logger();
    return instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    const auto idx = static_cast<std::size_t>(level);
    const auto lvl = idx < kLevelTable.size() ? kLevelTable[idx] : spdlog::level::off;
    if (const auto& lg = detail::logger()) {
        lg->set_level(lvl);
    }
}

LogLevel log_level() noexcept {
    const auto& lg = detail::logger();
    if (!lg) {
        return LogLevel::off;
    }
    return from_spdlog_level(lg->level());
}

} // namespace bsonx::core
