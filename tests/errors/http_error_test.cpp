#include <chrono>
#include <string>

#include <gtest/gtest.h>
#include <pmx/context_format.hpp>
#include <pmx/errors/http_error.hpp>

using namespace pmx;
using namespace std::chrono_literals;

// =============================================================================
// Taxonomy
// =============================================================================

TEST(HttpErrorTest, AlternativeNames) {
    constexpr auto names = detail::alternative_names<HttpError>();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names[0], "RequestFailed");
    EXPECT_EQ(names[1], "ConnectionFailed");
    EXPECT_EQ(names[2], "Timeout");
    EXPECT_EQ(names[3], "InvalidUrl");
    EXPECT_EQ(names[4], "ResponseReadError");
}

TEST(HttpErrorTest, KindName) {
    HttpError e = http::Timeout{.url = "https://example.com", .duration = 30s};
    EXPECT_EQ(kind_name(e), "Timeout");
}

TEST(HttpErrorTest, StatusRange) {
    EXPECT_FALSE(is_valid_http_status(0));
    EXPECT_FALSE(is_valid_http_status(99));
    EXPECT_TRUE(is_valid_http_status(100));
    EXPECT_TRUE(is_valid_http_status(404));
    EXPECT_TRUE(is_valid_http_status(599));
    EXPECT_FALSE(is_valid_http_status(600));
}

TEST(HttpErrorTest, EveryAlternativeCarriesUrl) {
    const std::string url = "https://gamma-api.polymarket.com/events?slug=x";

    EXPECT_EQ(url_of(HttpError{http::RequestFailed{.status = 500, .url = url, .body = ""}}), url);
    EXPECT_EQ(url_of(HttpError{http::ConnectionFailed{.url = url, .reason = "refused"}}), url);
    EXPECT_EQ(url_of(HttpError{http::Timeout{.url = url, .duration = 5s}}), url);
    EXPECT_EQ(url_of(HttpError{http::InvalidUrl{.url = url, .reason = "bad"}}), url);
    EXPECT_EQ(url_of(HttpError{http::ResponseReadError{.url = url, .reason = "eof"}}), url);
}

// =============================================================================
// Messages
// =============================================================================

TEST(HttpErrorTest, RequestFailedMessage) {
    HttpError e = http::RequestFailed{
        .status = 503, .url = "https://clob.polymarket.com/book", .body = "upstream down"};
    EXPECT_EQ(error_message(e),
              "HTTP request failed with status 503: https://clob.polymarket.com/book\n"
              "Response: upstream down");
}

TEST(HttpErrorTest, RequestFailedBodyIsBounded) {
    const std::string body(5000, 'x');
    HttpError e = http::RequestFailed{.status = 500, .url = "https://a.b", .body = body};
    auto msg = error_message(e);

    EXPECT_NE(msg.find(std::string(kTruncationMarker)), std::string::npos);
    EXPECT_LT(msg.size(), 500 + kTruncationMarker.size() + 100);

    // The stored body is untouched
    EXPECT_EQ(std::get<http::RequestFailed>(e).body.size(), 5000u);
}

TEST(HttpErrorTest, ConnectionFailedMessage) {
    HttpError e = http::ConnectionFailed{.url = "https://a.b", .reason = "connection refused"};
    EXPECT_EQ(error_message(e), "Failed to connect to https://a.b: connection refused");
}

TEST(HttpErrorTest, TimeoutMessage) {
    HttpError e = http::Timeout{.url = "https://a.b/markets", .duration = 30s};
    EXPECT_EQ(error_message(e), "Request to https://a.b/markets timed out after 30 seconds");
}

TEST(HttpErrorTest, InvalidUrlMessage) {
    HttpError e = http::InvalidUrl{.url = "htp:/broken", .reason = "unsupported scheme"};
    EXPECT_EQ(error_message(e), "Invalid URL 'htp:/broken': unsupported scheme");
}

TEST(HttpErrorTest, ResponseReadErrorMessage) {
    HttpError e = http::ResponseReadError{.url = "https://a.b", .reason = "connection reset"};
    EXPECT_EQ(error_message(e), "Failed to read response from https://a.b: connection reset");
}

TEST(HttpErrorTest, Equality) {
    HttpError a = http::Timeout{.url = "https://a.b", .duration = 30s};
    HttpError b = http::Timeout{.url = "https://a.b", .duration = 30s};
    HttpError c = http::Timeout{.url = "https://a.b", .duration = 31s};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
