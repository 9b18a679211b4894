#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "../detail/variant_names.hpp"

namespace pmx {

namespace output {

struct FormattingFailed {
    static constexpr std::string_view name = "FormattingFailed";

    std::string data_type;
    std::string reason;

    bool operator==(const FormattingFailed&) const = default;
};

struct WriteFailed {
    static constexpr std::string_view name = "WriteFailed";

    std::string target; ///< Output destination (stream name, file path)
    std::string reason;

    bool operator==(const WriteFailed&) const = default;
};

} // namespace output

/**
 * @brief Presentation failure: the terminal formatting/output step
 *
 * Holds no nested failure, so an OutputError can never wrap another one.
 */
using OutputError = std::variant<output::FormattingFailed, output::WriteFailed>;

static_assert(std::variant_size_v<OutputError> == 2, "output taxonomy changed");

[[nodiscard]] inline std::string_view kind_name(const OutputError& e) noexcept {
    return detail::held_name(e);
}

[[nodiscard]] std::string error_message(const OutputError& e);

} // namespace pmx
