#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <pmx/context_format.hpp>

using pmx::kTruncationMarker;
using pmx::truncate_for_display;

// =============================================================================
// truncate_for_display
// =============================================================================

TEST(TruncateForDisplayTest, ShortTextUnchanged) {
    EXPECT_EQ(truncate_for_display("abc", 10), "abc");
    EXPECT_EQ(truncate_for_display("", 4), "");
}

TEST(TruncateForDisplayTest, TextAtBoundUnchanged) {
    EXPECT_EQ(truncate_for_display("abcd", 4), "abcd");
}

TEST(TruncateForDisplayTest, LongTextCutWithMarker) {
    auto out = truncate_for_display("abcdefghij", 4);
    EXPECT_EQ(out, std::string("abcd") + std::string(kTruncationMarker));
}

TEST(TruncateForDisplayTest, MarkerIsVisible) {
    EXPECT_EQ(kTruncationMarker, "... (truncated)");
    auto out = truncate_for_display(std::string(1000, 'x'), 10);
    EXPECT_NE(out.find("(truncated)"), std::string::npos);
}

TEST(TruncateForDisplayTest, BoundHoldsForManyLengths) {
    const std::string text =
        R"({"slug":"will-it-rain","outcomes":"[\"Yes\", \"No\"]","volume":"12345.6"})";
    for (std::size_t max_len = 4; max_len < text.size() + 5; ++max_len) {
        auto out = truncate_for_display(text, max_len);
        EXPECT_LE(out.size(), max_len + kTruncationMarker.size()) << "max_len=" << max_len;
        if (text.size() <= max_len) {
            EXPECT_EQ(out, text) << "max_len=" << max_len;
        } else {
            EXPECT_EQ(out.substr(0, out.size() - kTruncationMarker.size()),
                      text.substr(0, out.size() - kTruncationMarker.size()));
        }
    }
}

TEST(TruncateForDisplayTest, DoesNotSplitUtf8CodePoint) {
    // "é" is two bytes (0xC3 0xA9); cutting at 2 would split it
    const std::string text = "aé tail";
    auto out = truncate_for_display(text, 2);
    EXPECT_EQ(out, std::string("a") + std::string(kTruncationMarker));
}

TEST(TruncateForDisplayTest, ZeroBound) {
    EXPECT_EQ(truncate_for_display("abc", 0), std::string(kTruncationMarker));
}

// =============================================================================
// collapse_whitespace
// =============================================================================

TEST(CollapseWhitespaceTest, JoinsTrimmedLines) {
    EXPECT_EQ(pmx::collapse_whitespace("{\n  \"a\": 1,\n  \"b\": 2\n}"),
              "{ \"a\": 1, \"b\": 2 }");
}

TEST(CollapseWhitespaceTest, DropsBlankLines) {
    EXPECT_EQ(pmx::collapse_whitespace("\n\n  x  \r\n\t\n y\n"), "x y");
}

TEST(CollapseWhitespaceTest, SingleLineKeepsInnerSpaces) {
    EXPECT_EQ(pmx::collapse_whitespace("[\"YES\", \"NO\""), "[\"YES\", \"NO\"");
}

TEST(CollapseWhitespaceTest, EmptyInput) {
    EXPECT_EQ(pmx::collapse_whitespace(""), "");
    EXPECT_EQ(pmx::collapse_whitespace("   \n \t "), "");
}
