#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../detail/variant_names.hpp"

namespace pmx {

namespace source {

/**
 * @brief No market group exists under the requested slug
 */
struct MarketGroupNotFound {
    static constexpr std::string_view name = "MarketGroupNotFound";

    std::string slug;

    bool operator==(const MarketGroupNotFound&) const = default;
};

/**
 * @brief Group exists but does not contain the requested market
 */
struct MarketNotFound {
    static constexpr std::string_view name = "MarketNotFound";

    std::string group_slug;
    std::string market_slug;

    bool operator==(const MarketNotFound&) const = default;
};

/**
 * @brief Remote API answered with a structure the tool does not understand
 *
 * @p raw_snippet is always bounded; build through invalid_api_response().
 */
struct InvalidApiResponse {
    static constexpr std::string_view name = "InvalidApiResponse";

    std::string endpoint;
    std::string reason;
    std::string raw_snippet;

    bool operator==(const InvalidApiResponse&) const = default;
};

struct RateLimitExceeded {
    static constexpr std::string_view name = "RateLimitExceeded";

    std::optional<std::chrono::seconds> retry_after; ///< Server hint, when sent

    bool operator==(const RateLimitExceeded&) const = default;
};

struct AuthenticationFailed {
    static constexpr std::string_view name = "AuthenticationFailed";

    std::string reason;

    bool operator==(const AuthenticationFailed&) const = default;
};

struct ApiUnavailable {
    static constexpr std::string_view name = "ApiUnavailable";

    std::string service_name;
    std::string reason;

    bool operator==(const ApiUnavailable&) const = default;
};

} // namespace source

/**
 * @brief Source failure: domain-level interpretation of a remote API response
 *
 * The not-found alternatives describe absence and never carry response data.
 */
using DataSourceError =
    std::variant<source::MarketGroupNotFound, source::MarketNotFound, source::InvalidApiResponse,
                 source::RateLimitExceeded, source::AuthenticationFailed, source::ApiUnavailable>;

static_assert(std::variant_size_v<DataSourceError> == 6, "source taxonomy changed");

/**
 * @brief Build InvalidApiResponse with a bounded snippet of the raw body
 *
 * @param endpoint API endpoint that answered
 * @param reason What was wrong with the answer
 * @param raw_body Complete raw response; reduced with json_error_snippet()
 */
[[nodiscard]] source::InvalidApiResponse invalid_api_response(std::string endpoint,
                                                              std::string reason,
                                                              std::string_view raw_body);

/**
 * @brief True for MarketGroupNotFound and MarketNotFound
 */
[[nodiscard]] inline bool is_not_found(const DataSourceError& e) noexcept {
    return std::holds_alternative<source::MarketGroupNotFound>(e) ||
           std::holds_alternative<source::MarketNotFound>(e);
}

[[nodiscard]] inline std::string_view kind_name(const DataSourceError& e) noexcept {
    return detail::held_name(e);
}

[[nodiscard]] std::string error_message(const DataSourceError& e);

} // namespace pmx
