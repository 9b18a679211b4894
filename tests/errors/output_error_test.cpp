#include <gtest/gtest.h>
#include <pmx/errors/output_error.hpp>

using namespace pmx;

TEST(OutputErrorTest, AlternativeNames) {
    constexpr auto names = detail::alternative_names<OutputError>();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "FormattingFailed");
    EXPECT_EQ(names[1], "WriteFailed");
}

TEST(OutputErrorTest, FormattingFailedMessage) {
    OutputError e =
        output::FormattingFailed{.data_type = "market table", .reason = "column overflow"};
    EXPECT_EQ(kind_name(e), "FormattingFailed");
    EXPECT_EQ(error_message(e), "Failed to format market table for output: column overflow");
}

TEST(OutputErrorTest, WriteFailedMessage) {
    OutputError e = output::WriteFailed{.target = "stdout", .reason = "broken pipe"};
    EXPECT_EQ(kind_name(e), "WriteFailed");
    EXPECT_EQ(error_message(e), "Failed to write output to stdout: broken pipe");
}
