#include "pmx/errors/parse_error.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <utility>

#include "pmx/context_format.hpp"

namespace pmx {

namespace {

// Byte offset of a 1-based line/column, clamped to the text
std::size_t offset_of(std::string_view text, std::size_t line, std::size_t column) noexcept {
    std::size_t offset = 0;
    for (std::size_t current = 1; current < line; ++current) {
        auto nl = text.find('\n', offset);
        if (nl == std::string_view::npos) {
            return text.size();
        }
        offset = nl + 1;
    }
    if (column > 1) {
        offset += std::min(column - 1, text.size() - offset);
    }
    return offset;
}

} // namespace

parse::JsonDeserializationFailed json_deserialization_failed(std::optional<std::string> field_name,
                                                             std::string expected_type,
                                                             std::string_view raw_json,
                                                             std::string reason) {
    return parse::JsonDeserializationFailed{
        .field_name = std::move(field_name),
        .expected_type = std::move(expected_type),
        .json_snippet = json_error_snippet(raw_json, kDefaultSnippetLength),
        .reason = std::move(reason),
    };
}

parse::JsonDeserializationFailed json_syntax_error(std::string_view raw_json, std::size_t line,
                                                   std::size_t column, std::string_view reason) {
    std::ostringstream why;
    why << reason << " at line " << line << ", column " << column;

    return parse::JsonDeserializationFailed{
        .field_name = std::nullopt,
        .expected_type = "JSON",
        .json_snippet =
            json_error_snippet(raw_json, offset_of(raw_json, line, column), kDefaultSnippetLength),
        .reason = why.str(),
    };
}

parse::InvalidFieldFormat invalid_field_format(std::string field_name, std::string expected_format,
                                               std::string_view raw_actual) {
    return parse::InvalidFieldFormat{
        .field_name = std::move(field_name),
        .expected_format = std::move(expected_format),
        .actual = truncate_for_display(raw_actual, kMaxValueDisplayLength),
    };
}

parse::InvalidNumber invalid_number(std::string field_name, std::string_view raw_value,
                                    std::string reason) {
    return parse::InvalidNumber{
        .field_name = std::move(field_name),
        .raw_value = truncate_for_display(raw_value, kMaxValueDisplayLength),
        .reason = std::move(reason),
    };
}

std::optional<std::string> field_of(const ParseError& e) {
    // Only JsonDeserializationFailed may lack a field
    return std::visit([](const auto& err) -> std::optional<std::string> { return err.field_name; },
                      e);
}

std::string error_message(const ParseError& e) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& err) {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, parse::JsonDeserializationFailed>) {
                oss << "Failed to deserialize JSON";
                if (err.field_name) {
                    oss << " for field '" << *err.field_name << "'";
                }
                oss << ": Expected type '" << err.expected_type << "'\nReason: " << err.reason
                    << "\nJSON: " << truncate_for_display(err.json_snippet, kDefaultSnippetLength);
            } else if constexpr (std::is_same_v<T, parse::MissingField>) {
                oss << "Required field '" << err.field_name << "' is missing";
                if (!err.parent_type.empty()) {
                    oss << " from " << err.parent_type;
                }
            } else if constexpr (std::is_same_v<T, parse::InvalidFieldFormat>) {
                oss << "Field '" << err.field_name
                    << "' has invalid format. Expected: " << err.expected_format
                    << ", Got: " << truncate_for_display(err.actual, kMaxValueDisplayLength);
            } else if constexpr (std::is_same_v<T, parse::InvalidArrayLength>) {
                oss << "Array '" << err.field_name
                    << "' has invalid length. Expected: " << err.expected
                    << ", Got: " << err.actual;
            } else if constexpr (std::is_same_v<T, parse::InvalidNumber>) {
                oss << "Field '" << err.field_name << "' has invalid number '"
                    << truncate_for_display(err.raw_value, kMaxValueDisplayLength)
                    << "': " << err.reason;
            }
        },
        e);
    return oss.str();
}

} // namespace pmx
