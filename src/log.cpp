#include "pmx/log.hpp"

#include <spdlog/spdlog.h>

namespace pmx {
namespace {

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
        case spdlog::level::off:
            return LogLevel::off;
        default:
            return LogLevel::off;
    }
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept {
    return from_spdlog_level(spdlog::get_level());
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "trace") {
        return LogLevel::trace;
    }
    if (name == "debug") {
        return LogLevel::debug;
    }
    if (name == "info") {
        return LogLevel::info;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::warn;
    }
    if (name == "error") {
        return LogLevel::error;
    }
    if (name == "critical") {
        return LogLevel::critical;
    }
    if (name == "off") {
        return LogLevel::off;
    }
    return std::nullopt;
}

} // namespace pmx
