#pragma once

#include <array>
#include <iosfwd>
#include <string>
#include <string_view>

#include "app_error.hpp"
#include "config.hpp"
#include "types.hpp"

namespace pmx {

namespace detail {

// Indexed by Stage; immutable for the life of the process
inline constexpr std::array<std::string_view, stage_count> stage_tips = {
    "check connectivity and URL correctness",                // http
    "verify the identifier exists at the remote source",     // data_source
    "the remote response shape may have changed",            // parse
    "source data failed a consistency check",                // normalization
    "insufficient or stale data for the requested analysis", // analysis
    "local output/formatting environment issue",             // output
};

} // namespace detail

/**
 * @brief Remediation tip for failures of a stage
 */
[[nodiscard]] constexpr std::string_view tip_for(Stage stage) noexcept {
    const auto index = static_cast<std::size_t>(stage);
    return index < detail::stage_tips.size() ? detail::stage_tips[index] : std::string_view{};
}

/**
 * @brief Everything the outermost boundary shows for one terminal failure
 */
struct Report {
    std::string message;  ///< Rendered AppError::message()
    Stage stage;          ///< Top-level tag the tip was selected by
    std::string_view tip; ///< Entry of the tip table (static storage)
    int exit_code;        ///< Process exit status, 1..255

    bool operator==(const Report&) const = default;
};

/**
 * @brief Build the report for a terminal failure
 *
 * The tip is chosen by the top-level stage tag only; nested variants are not
 * inspected. Deterministic: equal failures give equal reports.
 */
[[nodiscard]] Report make_report(const AppError& error, const PresentationConfig& config = {});

/**
 * @brief Text written to the terminal for a report
 *
 * "Error: <message>\n" followed by "Tip: <tip>\n".
 */
[[nodiscard]] std::string format_report(const Report& report);

/**
 * @brief Render a terminal failure to @p out
 *
 * @return The exit status the process should terminate with (1..255)
 */
int present(const AppError& error, std::ostream& out, const PresentationConfig& config = {});

/**
 * @brief Render a terminal failure to std::cerr and terminate the process
 */
[[noreturn]] void present_and_exit(const AppError& error, const PresentationConfig& config = {});

} // namespace pmx
