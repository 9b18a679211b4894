#include "pmx/errors/normalization_error.hpp"

#include <sstream>
#include <type_traits>

namespace pmx {

namespace {

void write_outcomes(std::ostringstream& oss, const std::vector<std::string>& outcomes) {
    oss << "[";
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "\"" << outcomes[i] << "\"";
    }
    oss << "]";
}

} // namespace

std::string error_message(const NormalizationError& e) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& err) {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, normalize::TokenIdExtractionFailed>) {
                oss << "Failed to extract token IDs for market '" << err.market_slug
                    << "': " << err.reason;
            } else if constexpr (std::is_same_v<T, normalize::OutcomeMappingFailed>) {
                oss << "Failed to map outcomes for market '" << err.market_slug << "'";
                if (!err.outcomes.empty()) {
                    oss << " (outcomes: ";
                    write_outcomes(oss, err.outcomes);
                    oss << ")";
                }
                oss << ": " << err.reason;
            } else if constexpr (std::is_same_v<T, normalize::InvalidPriceData>) {
                oss << "Invalid price data in market '" << err.market_slug << "' for field '"
                    << err.field_name << "': " << err.reason;
            } else if constexpr (std::is_same_v<T, normalize::InvalidVolumeData>) {
                oss << "Invalid volume data in market '" << err.market_slug << "' for field '"
                    << err.field_name << "': " << err.reason;
            } else if constexpr (std::is_same_v<T, normalize::ValidationFailed>) {
                oss << "Validation failed for market '" << err.market_slug << "': " << err.reason;
            } else if constexpr (std::is_same_v<T, normalize::EmptyRequiredField>) {
                oss << "Required field '" << err.field_name << "' is empty in market '"
                    << err.market_slug << "'";
            }
        },
        e);
    return oss.str();
}

} // namespace pmx
