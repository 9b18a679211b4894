#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../detail/variant_names.hpp"

namespace pmx {

namespace normalize {

// Every normalization failure is scoped to exactly one market.

struct TokenIdExtractionFailed {
    static constexpr std::string_view name = "TokenIdExtractionFailed";

    std::string market_slug;
    std::string reason;

    bool operator==(const TokenIdExtractionFailed&) const = default;
};

struct OutcomeMappingFailed {
    static constexpr std::string_view name = "OutcomeMappingFailed";

    std::string market_slug;
    std::vector<std::string> outcomes; ///< Outcome labels as received (may be empty)
    std::string reason;

    bool operator==(const OutcomeMappingFailed&) const = default;
};

struct InvalidPriceData {
    static constexpr std::string_view name = "InvalidPriceData";

    std::string market_slug;
    std::string field_name;
    std::string reason;

    bool operator==(const InvalidPriceData&) const = default;
};

struct InvalidVolumeData {
    static constexpr std::string_view name = "InvalidVolumeData";

    std::string market_slug;
    std::string field_name;
    std::string reason;

    bool operator==(const InvalidVolumeData&) const = default;
};

struct ValidationFailed {
    static constexpr std::string_view name = "ValidationFailed";

    std::string market_slug;
    std::string reason;

    bool operator==(const ValidationFailed&) const = default;
};

struct EmptyRequiredField {
    static constexpr std::string_view name = "EmptyRequiredField";

    std::string market_slug;
    std::string field_name;

    bool operator==(const EmptyRequiredField&) const = default;
};

} // namespace normalize

/**
 * @brief Normalization failure: standardizing source data into the canonical schema
 */
using NormalizationError =
    std::variant<normalize::TokenIdExtractionFailed, normalize::OutcomeMappingFailed,
                 normalize::InvalidPriceData, normalize::InvalidVolumeData,
                 normalize::ValidationFailed, normalize::EmptyRequiredField>;

static_assert(std::variant_size_v<NormalizationError> == 6, "normalization taxonomy changed");

/**
 * @brief Market the failure is scoped to
 */
[[nodiscard]] inline const std::string& market_slug_of(const NormalizationError& e) noexcept {
    return std::visit(
        [](const auto& err) noexcept -> const std::string& { return err.market_slug; }, e);
}

[[nodiscard]] inline std::string_view kind_name(const NormalizationError& e) noexcept {
    return detail::held_name(e);
}

/**
 * @brief Human-readable description; always contains the market slug verbatim
 */
[[nodiscard]] std::string error_message(const NormalizationError& e);

} // namespace pmx
