#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace blobspec::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 解码成功路径不打日志，仅在注册自定义类型、字段解码失败时输出 debug；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

// "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"
[[nodiscard]] std::string_view log_level_name(LogLevel level) noexcept;

/**
 * @brief 按名称解析日志级别（大小写敏感，另接受 "warning" 与 "err"）。
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

} // namespace blobspec::core
