#include "pmx/errors/output_error.hpp"

#include <sstream>
#include <type_traits>

namespace pmx {

std::string error_message(const OutputError& e) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& err) {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, output::FormattingFailed>) {
                oss << "Failed to format " << err.data_type << " for output: " << err.reason;
            } else if constexpr (std::is_same_v<T, output::WriteFailed>) {
                oss << "Failed to write output to " << err.target << ": " << err.reason;
            }
        },
        e);
    return oss.str();
}

} // namespace pmx
