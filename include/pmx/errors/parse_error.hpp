#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <cstddef>

#include "../detail/variant_names.hpp"

namespace pmx {

namespace parse {

/**
 * @brief Raw text could not be deserialized into the expected type
 *
 * @p field_name is empty only for whole-payload failures. @p json_snippet is
 * bounded by json_error_snippet(); use json_deserialization_failed() or
 * json_syntax_error() to build one.
 */
struct JsonDeserializationFailed {
    static constexpr std::string_view name = "JsonDeserializationFailed";

    std::optional<std::string> field_name;
    std::string expected_type;
    std::string json_snippet;
    std::string reason;

    bool operator==(const JsonDeserializationFailed&) const = default;
};

struct MissingField {
    static constexpr std::string_view name = "MissingField";

    std::string field_name;
    std::string parent_type; ///< Structure the field belongs to (may be empty)

    bool operator==(const MissingField&) const = default;
};

struct InvalidFieldFormat {
    static constexpr std::string_view name = "InvalidFieldFormat";

    std::string field_name;
    std::string expected_format;
    std::string actual; ///< Offending value, bounded

    bool operator==(const InvalidFieldFormat&) const = default;
};

struct InvalidArrayLength {
    static constexpr std::string_view name = "InvalidArrayLength";

    std::string field_name;
    std::size_t expected{0};
    std::size_t actual{0};

    bool operator==(const InvalidArrayLength&) const = default;
};

struct InvalidNumber {
    static constexpr std::string_view name = "InvalidNumber";

    std::string field_name;
    std::string raw_value; ///< Offending text, bounded
    std::string reason;

    bool operator==(const InvalidNumber&) const = default;
};

} // namespace parse

/**
 * @brief Parse failure: translating raw text into typed structures
 */
using ParseError =
    std::variant<parse::JsonDeserializationFailed, parse::MissingField, parse::InvalidFieldFormat,
                 parse::InvalidArrayLength, parse::InvalidNumber>;

static_assert(std::variant_size_v<ParseError> == 5, "parse taxonomy changed");

/**
 * @brief Build JsonDeserializationFailed from the complete raw payload
 *
 * The payload is reduced to kDefaultSnippetLength bytes with
 * json_error_snippet().
 */
[[nodiscard]] parse::JsonDeserializationFailed
json_deserialization_failed(std::optional<std::string> field_name, std::string expected_type,
                            std::string_view raw_json, std::string reason);

/**
 * @brief Build JsonDeserializationFailed from a parser's syntax error position
 *
 * Used when a JSON library reports a whole-payload syntax error with a 1-based
 * line and column. The snippet is centred on that position and the position is
 * appended to @p reason.
 */
[[nodiscard]] parse::JsonDeserializationFailed json_syntax_error(std::string_view raw_json,
                                                                 std::size_t line,
                                                                 std::size_t column,
                                                                 std::string_view reason);

/**
 * @brief Build InvalidFieldFormat, bounding the offending value
 */
[[nodiscard]] parse::InvalidFieldFormat invalid_field_format(std::string field_name,
                                                             std::string expected_format,
                                                             std::string_view raw_actual);

/**
 * @brief Build InvalidNumber, bounding the offending text
 */
[[nodiscard]] parse::InvalidNumber invalid_number(std::string field_name,
                                                  std::string_view raw_value, std::string reason);

/**
 * @brief Field name of a field-scoped failure, std::nullopt for whole-payload ones
 */
[[nodiscard]] std::optional<std::string> field_of(const ParseError& e);

[[nodiscard]] inline std::string_view kind_name(const ParseError& e) noexcept {
    return detail::held_name(e);
}

[[nodiscard]] std::string error_message(const ParseError& e);

} // namespace pmx
