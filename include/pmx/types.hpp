#pragma once

#include <array>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace pmx {

/**
 * @brief Pipeline stage that produced a failure
 *
 * The numeric value of each enumerator is the index of the corresponding
 * stage failure type inside AppError, so it doubles as the top-level tag.
 */
enum class Stage : uint8_t {
    http = 0,          ///< Network/transport layer (HttpError)
    data_source = 1,   ///< Remote API domain layer (DataSourceError)
    parse = 2,         ///< Raw text to typed structures (ParseError)
    normalization = 3, ///< Canonical schema standardization (NormalizationError)
    analysis = 4,      ///< Analytical engine (AnalysisError)
    output = 5         ///< Formatting and output (OutputError)
};

/// Number of pipeline stages
inline constexpr std::size_t stage_count = 6;

/// All stages in pipeline order
inline constexpr std::array<Stage, stage_count> all_stages = {
    Stage::http,          Stage::data_source, Stage::parse,
    Stage::normalization, Stage::analysis,    Stage::output};

/**
 * @brief Stable identifier for a stage ("http", "data_source", ...)
 */
constexpr std::string_view stage_name(Stage stage) noexcept {
    switch (stage) {
        case Stage::http:
            return "http";
        case Stage::data_source:
            return "data_source";
        case Stage::parse:
            return "parse";
        case Stage::normalization:
            return "normalization";
        case Stage::analysis:
            return "analysis";
        case Stage::output:
            return "output";
    }
    return "unknown";
}

/**
 * @brief Prefix used when rendering a top-level failure of this stage
 */
constexpr std::string_view stage_label(Stage stage) noexcept {
    switch (stage) {
        case Stage::http:
            return "HTTP Error";
        case Stage::data_source:
            return "Data Source Error";
        case Stage::parse:
            return "Parse Error";
        case Stage::normalization:
            return "Normalization Error";
        case Stage::analysis:
            return "Analysis Error";
        case Stage::output:
            return "Output Error";
    }
    return "Error";
}

} // namespace pmx
