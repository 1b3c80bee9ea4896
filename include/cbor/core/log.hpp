#pragma once

#include <cstdint>

namespace cbor::core {

/**
 * @brief 日志级别（控制库内 "cbor" logger 的输出）。
 *
 * 说明：
 * - 解码失败时会以 debug 级别记录操作名、引导字节、偏移与原因；
 * - 库内使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 默认级别为 warn，即解码诊断默认不输出。
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

} // namespace cbor::core
