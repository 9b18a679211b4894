#include "pmx/adapters/curl_transport.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace pmx::adapters {

namespace {

unexpected<HttpError> request_failed(long response_code, std::string url, std::string body) {
    return unexpected<HttpError>(HttpError{http::RequestFailed{
        .status = static_cast<uint16_t>(response_code),
        .url = std::move(url),
        .body = std::move(body),
    }});
}

} // namespace

expected<void, HttpError> classify_curl_result(CURLcode code, std::string url, long response_code,
                                               std::string body, std::chrono::seconds timeout) {
    if (code == CURLE_OK) {
        // Non-HTTP schemes report 0
        if (response_code == 0 || (response_code >= 200 && response_code < 300)) {
            return {};
        }
        spdlog::debug("[pmx] {} answered with status {}", url, response_code);
        if (response_code >= 100 && response_code <= 599) {
            return request_failed(response_code, std::move(url), std::move(body));
        }
        return unexpected<HttpError>(HttpError{http::ResponseReadError{
            .url = std::move(url),
            .reason = "malformed HTTP status " + std::to_string(response_code),
        }});
    }

    std::string reason = curl_easy_strerror(code);
    spdlog::debug("[pmx] transfer to {} failed: {} ({})", url, reason, static_cast<int>(code));

    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return unexpected<HttpError>(
                HttpError{http::Timeout{.url = std::move(url), .duration = timeout}});

        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return unexpected<HttpError>(
                HttpError{http::InvalidUrl{.url = std::move(url), .reason = std::move(reason)}});

        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
            return unexpected<HttpError>(HttpError{
                http::ConnectionFailed{.url = std::move(url), .reason = std::move(reason)}});

        case CURLE_HTTP_RETURNED_ERROR:
            if (response_code >= 100 && response_code <= 599) {
                return request_failed(response_code, std::move(url), std::move(body));
            }
            break;

        default:
            break;
    }

    return unexpected<HttpError>(
        HttpError{http::ResponseReadError{.url = std::move(url), .reason = std::move(reason)}});
}

} // namespace pmx::adapters
