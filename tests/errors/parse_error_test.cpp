#include <limits>
#include <string>

#include <gtest/gtest.h>
#include <pmx/context_format.hpp>
#include <pmx/errors/parse_error.hpp>

using namespace pmx;

TEST(ParseErrorTest, AlternativeNames) {
    constexpr auto names = detail::alternative_names<ParseError>();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names[0], "JsonDeserializationFailed");
    EXPECT_EQ(names[1], "MissingField");
    EXPECT_EQ(names[2], "InvalidFieldFormat");
    EXPECT_EQ(names[3], "InvalidArrayLength");
    EXPECT_EQ(names[4], "InvalidNumber");
}

TEST(ParseErrorTest, FieldOf) {
    auto missing =
        field_of(ParseError{parse::MissingField{.field_name = "slug", .parent_type = ""}});
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(*missing, "slug");

    auto length = field_of(ParseError{parse::InvalidArrayLength{
        .field_name = "outcomes", .expected = 2, .actual = 3}});
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(*length, "outcomes");

    auto whole_payload =
        field_of(ParseError{json_deserialization_failed(std::nullopt, "Event", "{", "eof")});
    EXPECT_FALSE(whole_payload.has_value());
}

// =============================================================================
// Messages
// =============================================================================

TEST(ParseErrorTest, DeserializationMessageWithField) {
    ParseError e = parse::JsonDeserializationFailed{.field_name = "outcomes",
                                                    .expected_type = "Vec<String>",
                                                    .json_snippet = R"(["YES", "NO")",
                                                    .reason = "EOF while parsing a list"};
    EXPECT_EQ(error_message(e),
              "Failed to deserialize JSON for field 'outcomes': Expected type 'Vec<String>'\n"
              "Reason: EOF while parsing a list\n"
              "JSON: [\"YES\", \"NO\"");
}

TEST(ParseErrorTest, DeserializationMessageWithoutField) {
    ParseError e = parse::JsonDeserializationFailed{
        .field_name = std::nullopt, .expected_type = "Event", .json_snippet = "{", .reason = "eof"};
    EXPECT_EQ(error_message(e),
              "Failed to deserialize JSON: Expected type 'Event'\nReason: eof\nJSON: {");
}

TEST(ParseErrorTest, MissingFieldMessage) {
    EXPECT_EQ(error_message(ParseError{parse::MissingField{.field_name = "clobTokenIds",
                                                           .parent_type = ""}}),
              "Required field 'clobTokenIds' is missing");
    EXPECT_EQ(error_message(ParseError{parse::MissingField{.field_name = "clobTokenIds",
                                                           .parent_type = "Market"}}),
              "Required field 'clobTokenIds' is missing from Market");
}

TEST(ParseErrorTest, InvalidFieldFormatMessage) {
    ParseError e = parse::InvalidFieldFormat{
        .field_name = "endDate", .expected_format = "ISO 8601", .actual = "tomorrow"};
    EXPECT_EQ(error_message(e),
              "Field 'endDate' has invalid format. Expected: ISO 8601, Got: tomorrow");
}

TEST(ParseErrorTest, InvalidArrayLengthMessage) {
    ParseError e =
        parse::InvalidArrayLength{.field_name = "outcomePrices", .expected = 2, .actual = 3};
    EXPECT_EQ(error_message(e), "Array 'outcomePrices' has invalid length. Expected: 2, Got: 3");
}

TEST(ParseErrorTest, InvalidNumberMessage) {
    ParseError e =
        parse::InvalidNumber{
            .field_name = "volume", .raw_value = "12,5", .reason = "invalid digit"};
    EXPECT_EQ(error_message(e), "Field 'volume' has invalid number '12,5': invalid digit");
}

// =============================================================================
// Factories
// =============================================================================

TEST(ParseErrorTest, DeserializationFactoryBoundsSnippet) {
    std::string raw = R"({"markets": [)";
    for (int i = 0; i < 300; ++i) {
        raw += R"({"id": )" + std::to_string(i) + "}, ";
    }

    auto err = json_deserialization_failed("markets", "Vec<Market>", raw, "EOF while parsing");

    ASSERT_TRUE(err.field_name.has_value());
    EXPECT_EQ(*err.field_name, "markets");
    EXPECT_EQ(err.expected_type, "Vec<Market>");
    EXPECT_LE(err.json_snippet.size(), kDefaultSnippetLength);
    EXPECT_FALSE(err.json_snippet.empty());
}

TEST(ParseErrorTest, DeserializationFactoryKeepsShortPayload) {
    auto err = json_deserialization_failed("outcomes", "Vec<String>", R"(["YES", "NO")",
                                           "EOF while parsing a list");
    EXPECT_EQ(err.json_snippet, R"(["YES", "NO")");
}

TEST(ParseErrorTest, SyntaxErrorCentresOnPosition) {
    std::string raw;
    for (int i = 0; i < 40; ++i) {
        raw += R"(  {"id": 1, "ok": true},)" "\n";
    }
    raw += R"(  {"id": 2, "ok": tru@},)" "\n";
    for (int i = 0; i < 40; ++i) {
        raw += R"(  {"id": 3, "ok": false},)" "\n";
    }

    // '@' sits on line 41, column 22
    auto err = json_syntax_error(raw, 41, 22, "expected value");

    EXPECT_FALSE(err.field_name.has_value());
    EXPECT_EQ(err.expected_type, "JSON");
    EXPECT_EQ(err.reason, "expected value at line 41, column 22");
    EXPECT_LE(err.json_snippet.size(), kDefaultSnippetLength);
    EXPECT_NE(err.json_snippet.find('@'), std::string::npos) << err.json_snippet;
}

TEST(ParseErrorTest, SyntaxErrorPositionPastEnd) {
    auto err = json_syntax_error("{\"a\": 1", 99, 99, "EOF while parsing an object");
    EXPECT_EQ(err.json_snippet, "{\"a\": 1");
    EXPECT_EQ(err.reason, "EOF while parsing an object at line 99, column 99");
}

TEST(ParseErrorTest, SyntaxErrorHugeColumnClampsToEnd) {
    std::string raw = "[\n";
    for (int i = 0; i < 150; ++i) {
        raw += "1, ";
    }
    raw += "\"END\"";

    // Line 2 starts at offset 2; a column near SIZE_MAX must not wrap back to the start
    const auto column = std::numeric_limits<std::size_t>::max();
    auto err = json_syntax_error(raw, 2, column, "EOF while parsing a list");

    EXPECT_LE(err.json_snippet.size(), kDefaultSnippetLength);
    EXPECT_NE(err.json_snippet.find("END"), std::string::npos) << err.json_snippet;
    EXPECT_EQ(err.json_snippet.find('['), std::string::npos) << err.json_snippet;
}

TEST(ParseErrorTest, ValueFactoriesBoundRawText) {
    const std::string huge(1000, '9');

    auto fmt = invalid_field_format("endDate", "ISO 8601", huge);
    EXPECT_LE(fmt.actual.size(), kMaxValueDisplayLength + kTruncationMarker.size());

    auto num = invalid_number("volume", huge, "number too large");
    EXPECT_LE(num.raw_value.size(), kMaxValueDisplayLength + kTruncationMarker.size());
    EXPECT_EQ(num.reason, "number too large");

    auto small = invalid_number("volume", "abc", "invalid digit");
    EXPECT_EQ(small.raw_value, "abc");
}
