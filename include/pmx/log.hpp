#pragma once

#include <optional>
#include <string_view>

#include <cstdint>

namespace pmx {

/**
 * @brief Log level for the library's internal diagnostics
 *
 * The library logs through spdlog without exposing spdlog types in public
 * headers. Applications adjust the global level with set_log_level().
 */
enum class LogLevel : uint8_t {
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

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 *        "critical", "off")
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

} // namespace pmx
