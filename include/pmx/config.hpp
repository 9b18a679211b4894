#pragma once

#include <string>
#include <string_view>

#include "errors/output_error.hpp"
#include "expected.hpp"
#include "log.hpp"

namespace pmx {

/// Exit status used when presenting a failure unless configured otherwise
inline constexpr int kFailureExitCode = 1;

/// Largest exit status the process can report; std::exit keeps only the low 8 bits
inline constexpr int kMaxExitCode = 255;

/**
 * @brief True for exit statuses that reach the parent process as non-zero
 */
[[nodiscard]] constexpr bool is_failure_exit_code(int code) noexcept {
    return code >= 1 && code <= kMaxExitCode;
}

/**
 * @brief Settings for the presentation layer
 *
 * Loaded from the `presentation:` mapping of a YAML file:
 * @code
 *   presentation:
 *     exit_code: 2      # 1..255
 *     log_level: warn
 * @endcode
 */
struct PresentationConfig {
    int exit_code{kFailureExitCode}; ///< Process exit status, 1..255
    LogLevel log_level{LogLevel::warn};

    bool operator==(const PresentationConfig&) const = default;
};

/**
 * @brief Parse a presentation config from YAML text
 *
 * Missing keys keep their defaults; unknown keys are logged and ignored.
 *
 * @return The config, or OutputError::FormattingFailed describing the problem
 */
[[nodiscard]] expected<PresentationConfig, OutputError>
parse_presentation_config(std::string_view yaml_text);

/**
 * @brief Load a presentation config from a YAML file
 *
 * @return The config, or OutputError::FormattingFailed naming the file
 */
[[nodiscard]] expected<PresentationConfig, OutputError>
load_presentation_config(const std::string& path);

} // namespace pmx
