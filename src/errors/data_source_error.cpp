#include "pmx/errors/data_source_error.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

#include "pmx/context_format.hpp"

namespace pmx {

source::InvalidApiResponse invalid_api_response(std::string endpoint, std::string reason,
                                                std::string_view raw_body) {
    return source::InvalidApiResponse{
        .endpoint = std::move(endpoint),
        .reason = std::move(reason),
        .raw_snippet = json_error_snippet(raw_body, kDefaultSnippetLength),
    };
}

std::string error_message(const DataSourceError& e) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& err) {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, source::MarketGroupNotFound>) {
                oss << "Market group '" << err.slug << "' not found";
            } else if constexpr (std::is_same_v<T, source::MarketNotFound>) {
                oss << "Market '" << err.market_slug << "' not found in group '" << err.group_slug
                    << "'";
            } else if constexpr (std::is_same_v<T, source::InvalidApiResponse>) {
                oss << "API endpoint '" << err.endpoint
                    << "' returned invalid response: " << err.reason;
                if (!err.raw_snippet.empty()) {
                    // Snippets built by hand may skip invalid_api_response()
                    oss << "\nSnippet: "
                        << truncate_for_display(err.raw_snippet, kDefaultSnippetLength);
                }
            } else if constexpr (std::is_same_v<T, source::RateLimitExceeded>) {
                oss << "API rate limit exceeded";
                if (err.retry_after) {
                    oss << ". Retry after " << err.retry_after->count() << " seconds";
                }
            } else if constexpr (std::is_same_v<T, source::AuthenticationFailed>) {
                oss << "API authentication failed: " << err.reason;
            } else if constexpr (std::is_same_v<T, source::ApiUnavailable>) {
                oss << err.service_name << " API is unavailable: " << err.reason;
            }
        },
        e);
    return oss.str();
}

} // namespace pmx
