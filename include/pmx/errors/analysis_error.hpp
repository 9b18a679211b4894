#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

#include "../detail/variant_names.hpp"

namespace pmx {

namespace analysis {

struct InsufficientData {
    static constexpr std::string_view name = "InsufficientData";

    std::string analysis_type;
    std::string reason;

    bool operator==(const InsufficientData&) const = default;
};

struct CalculationFailed {
    static constexpr std::string_view name = "CalculationFailed";

    std::string analysis_type;
    std::string reason;

    bool operator==(const CalculationFailed&) const = default;
};

struct InvalidPosition {
    static constexpr std::string_view name = "InvalidPosition";

    std::string position_id;
    std::string reason;

    bool operator==(const InvalidPosition&) const = default;
};

struct StatisticalError {
    static constexpr std::string_view name = "StatisticalError";

    std::string analysis_type;
    std::string reason;

    bool operator==(const StatisticalError&) const = default;
};

/**
 * @brief Input data is older than the analysis allows
 *
 * Carries both the observed age and the configured limit so the message
 * needs no external lookup.
 */
struct StaleData {
    static constexpr std::string_view name = "StaleData";

    std::string analysis_type;
    std::chrono::seconds age{0};
    std::chrono::seconds max_age{0};

    bool operator==(const StaleData&) const = default;
};

} // namespace analysis

/**
 * @brief Analysis failure: errors raised by the analytical engine
 */
using AnalysisError =
    std::variant<analysis::InsufficientData, analysis::CalculationFailed,
                 analysis::InvalidPosition, analysis::StatisticalError, analysis::StaleData>;

static_assert(std::variant_size_v<AnalysisError> == 5, "analysis taxonomy changed");

[[nodiscard]] inline std::string_view kind_name(const AnalysisError& e) noexcept {
    return detail::held_name(e);
}

[[nodiscard]] std::string error_message(const AnalysisError& e);

} // namespace pmx
