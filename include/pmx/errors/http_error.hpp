#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

#include <cstdint>

#include "../detail/variant_names.hpp"

namespace pmx {

namespace http {

/**
 * @brief Server answered with a non-success HTTP status
 */
struct RequestFailed {
    static constexpr std::string_view name = "RequestFailed";

    uint16_t status{0}; ///< HTTP status code (100-599)
    std::string url;    ///< Exact URL attempted
    std::string body;   ///< Response body as received (bounded when rendered)

    bool operator==(const RequestFailed&) const = default;
};

/**
 * @brief Connection could not be established
 */
struct ConnectionFailed {
    static constexpr std::string_view name = "ConnectionFailed";

    std::string url;
    std::string reason;

    bool operator==(const ConnectionFailed&) const = default;
};

/**
 * @brief Request did not complete within the transport's time limit
 */
struct Timeout {
    static constexpr std::string_view name = "Timeout";

    std::string url;
    std::chrono::seconds duration{0}; ///< Time limit that was exceeded

    bool operator==(const Timeout&) const = default;
};

/**
 * @brief URL rejected before any request was sent
 */
struct InvalidUrl {
    static constexpr std::string_view name = "InvalidUrl";

    std::string url;
    std::string reason;

    bool operator==(const InvalidUrl&) const = default;
};

/**
 * @brief Response arrived but its body could not be read
 */
struct ResponseReadError {
    static constexpr std::string_view name = "ResponseReadError";

    std::string url;
    std::string reason;

    bool operator==(const ResponseReadError&) const = default;
};

} // namespace http

/**
 * @brief Transport failure: network and HTTP layer
 *
 * Constructed only by the transport collaborator. Every alternative carries
 * the exact URL that was attempted.
 */
using HttpError = std::variant<http::RequestFailed, http::ConnectionFailed, http::Timeout,
                               http::InvalidUrl, http::ResponseReadError>;

static_assert(std::variant_size_v<HttpError> == 5, "transport taxonomy changed");

/**
 * @brief Check that a status code is a well-formed HTTP status (100-599)
 */
[[nodiscard]] constexpr bool is_valid_http_status(uint16_t status) noexcept {
    return status >= 100 && status <= 599;
}

/**
 * @brief URL attempted by any transport failure
 */
[[nodiscard]] inline const std::string& url_of(const HttpError& e) noexcept {
    return std::visit([](const auto& err) noexcept -> const std::string& { return err.url; }, e);
}

/**
 * @brief Name of the held alternative ("Timeout", "InvalidUrl", ...)
 */
[[nodiscard]] inline std::string_view kind_name(const HttpError& e) noexcept {
    return detail::held_name(e);
}

/**
 * @brief Human-readable description of a transport failure
 *
 * Response bodies are bounded to kMaxBodyDisplayLength.
 */
[[nodiscard]] std::string error_message(const HttpError& e);

} // namespace pmx
