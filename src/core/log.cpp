#include "blobspec/core/log.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <string_view>

namespace blobspec::core {
namespace {

// 下标即 LogLevel 的数值；两边的枚举顺序一致。
constexpr std::array<spdlog::level::level_enum, 7> kSpdlogLevels{
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

constexpr std::array<std::string_view, 7> kLevelNames{
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index >= kSpdlogLevels.size()) {
        return spdlog::level::off;
    }
    return kSpdlogLevels[index];
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kSpdlogLevels.size(); ++i) {
        if (kSpdlogLevels[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    // 只调整全局级别；sink / pattern 由业务侧自行配置。
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(spdlog::get_level()); }

std::string_view log_level_name(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index >= kLevelNames.size()) {
        return "unknown";
    }
    return kLevelNames[index];
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "warning") {
        return LogLevel::warn;
    }
    if (name == "err") {
        return LogLevel::error;
    }
    for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
        if (kLevelNames[i] == name) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

} // namespace blobspec::core
