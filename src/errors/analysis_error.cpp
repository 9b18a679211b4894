#include "pmx/errors/analysis_error.hpp"

#include <sstream>
#include <type_traits>

namespace pmx {

std::string error_message(const AnalysisError& e) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& err) {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, analysis::InsufficientData>) {
                oss << "Insufficient data for " << err.analysis_type << " analysis: " << err.reason;
            } else if constexpr (std::is_same_v<T, analysis::CalculationFailed>) {
                oss << err.analysis_type << " calculation failed: " << err.reason;
            } else if constexpr (std::is_same_v<T, analysis::InvalidPosition>) {
                oss << "Invalid position '" << err.position_id << "': " << err.reason;
            } else if constexpr (std::is_same_v<T, analysis::StatisticalError>) {
                oss << "Statistical error in " << err.analysis_type << " analysis: " << err.reason;
            } else if constexpr (std::is_same_v<T, analysis::StaleData>) {
                oss << "Data for " << err.analysis_type << " analysis is stale: age "
                    << err.age.count() << " seconds exceeds maximum of " << err.max_age.count()
                    << " seconds";
            }
        },
        e);
    return oss.str();
}

} // namespace pmx
