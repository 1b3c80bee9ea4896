#include "cbor/core/log.hpp"

#include "core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace cbor::core {
namespace {

constexpr const char *kLoggerName = "cbor";

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    default:
        return LogLevel::off;
    }
}

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能已用同名 logger 注册了自己的 sink，此时直接复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::logger &logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

void set_log_level(LogLevel level) noexcept {
    logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(logger().level()); }

} // namespace cbor::core
