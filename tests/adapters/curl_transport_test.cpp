#include <chrono>
#include <string>

#include <gtest/gtest.h>
#include <pmx/adapters/curl_transport.hpp>
#include <pmx/app_error.hpp>

using namespace pmx;
using namespace std::chrono_literals;
using pmx::adapters::classify_curl_result;

namespace {

constexpr const char* kUrl = "https://gamma-api.polymarket.com/events?slug=us-election";

} // namespace

// =============================================================================
// Completed transfers
// =============================================================================

TEST(CurlTransportTest, SuccessStatuses) {
    EXPECT_TRUE(classify_curl_result(CURLE_OK, kUrl, 200, "[]", 30s).has_value());
    EXPECT_TRUE(classify_curl_result(CURLE_OK, kUrl, 204, "", 30s).has_value());
    EXPECT_TRUE(classify_curl_result(CURLE_OK, "file:///tmp/x.json", 0, "{}", 30s).has_value());
}

TEST(CurlTransportTest, ErrorStatusBecomesRequestFailed) {
    auto r = classify_curl_result(CURLE_OK, kUrl, 404, R"({"error":"not found"})", 30s);
    ASSERT_FALSE(r.has_value());

    const auto* failed = std::get_if<http::RequestFailed>(&r.error());
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, 404);
    EXPECT_EQ(failed->url, kUrl);
    EXPECT_EQ(failed->body, R"({"error":"not found"})");
}

TEST(CurlTransportTest, MalformedStatusBecomesReadError) {
    auto r = classify_curl_result(CURLE_OK, kUrl, 999, "", 30s);
    ASSERT_FALSE(r.has_value());

    const auto* read = std::get_if<http::ResponseReadError>(&r.error());
    ASSERT_NE(read, nullptr);
    EXPECT_EQ(read->reason, "malformed HTTP status 999");
}

// =============================================================================
// Failed transfers
// =============================================================================

TEST(CurlTransportTest, TimeoutKeepsConfiguredLimit) {
    auto r = classify_curl_result(CURLE_OPERATION_TIMEDOUT, kUrl, 0, "", 30s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), (HttpError{http::Timeout{.url = kUrl, .duration = 30s}}));
}

TEST(CurlTransportTest, UrlProblems) {
    for (auto code : {CURLE_URL_MALFORMAT, CURLE_UNSUPPORTED_PROTOCOL}) {
        auto r = classify_curl_result(code, "htp:/x", 0, "", 30s);
        ASSERT_FALSE(r.has_value());
        ASSERT_TRUE(std::holds_alternative<http::InvalidUrl>(r.error())) << code;
        EXPECT_EQ(std::get<http::InvalidUrl>(r.error()).reason, curl_easy_strerror(code));
    }
}

TEST(CurlTransportTest, ConnectionProblems) {
    for (auto code : {CURLE_COULDNT_RESOLVE_HOST, CURLE_COULDNT_RESOLVE_PROXY,
                      CURLE_COULDNT_CONNECT, CURLE_SSL_CONNECT_ERROR}) {
        auto r = classify_curl_result(code, kUrl, 0, "", 30s);
        ASSERT_FALSE(r.has_value());
        EXPECT_TRUE(std::holds_alternative<http::ConnectionFailed>(r.error())) << code;
        EXPECT_EQ(url_of(r.error()), kUrl);
    }
}

TEST(CurlTransportTest, HttpReturnedError) {
    auto r = classify_curl_result(CURLE_HTTP_RETURNED_ERROR, kUrl, 503, "busy", 30s);
    ASSERT_FALSE(r.has_value());
    ASSERT_TRUE(std::holds_alternative<http::RequestFailed>(r.error()));
    EXPECT_EQ(std::get<http::RequestFailed>(r.error()).status, 503);
}

TEST(CurlTransportTest, OtherCodesBecomeReadError) {
    auto r = classify_curl_result(CURLE_RECV_ERROR, kUrl, 200, "partial", 30s);
    ASSERT_FALSE(r.has_value());
    ASSERT_TRUE(std::holds_alternative<http::ResponseReadError>(r.error()));
    EXPECT_EQ(std::get<http::ResponseReadError>(r.error()).reason,
              curl_easy_strerror(CURLE_RECV_ERROR));
}

TEST(CurlTransportTest, PromotesToHttpStage) {
    auto r = classify_curl_result(CURLE_COULDNT_CONNECT, kUrl, 0, "", 30s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(promote(r.error()).stage(), Stage::http);
}
