#include "pmx/errors/http_error.hpp"

#include <sstream>
#include <type_traits>

#include "pmx/context_format.hpp"

namespace pmx {

std::string error_message(const HttpError& e) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& err) {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, http::RequestFailed>) {
                oss << "HTTP request failed with status " << err.status << ": " << err.url
                    << "\nResponse: " << truncate_for_display(err.body, kMaxBodyDisplayLength);
            } else if constexpr (std::is_same_v<T, http::ConnectionFailed>) {
                oss << "Failed to connect to " << err.url << ": " << err.reason;
            } else if constexpr (std::is_same_v<T, http::Timeout>) {
                oss << "Request to " << err.url << " timed out after " << err.duration.count()
                    << " seconds";
            } else if constexpr (std::is_same_v<T, http::InvalidUrl>) {
                oss << "Invalid URL '" << err.url << "': " << err.reason;
            } else if constexpr (std::is_same_v<T, http::ResponseReadError>) {
                oss << "Failed to read response from " << err.url << ": " << err.reason;
            }
        },
        e);
    return oss.str();
}

} // namespace pmx
