#pragma once

#include <array>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <cstddef>

namespace pmx::detail {

/**
 * @brief Name of the alternative currently held by a failure variant
 *
 * Every failure struct carries `static constexpr std::string_view name`.
 */
template <typename Variant>
[[nodiscard]] constexpr std::string_view held_name(const Variant& v) noexcept {
    return std::visit([](const auto& alt) noexcept { return std::decay_t<decltype(alt)>::name; },
                      v);
}

template <typename Variant, std::size_t... I>
constexpr auto alternative_names_impl(std::index_sequence<I...>) noexcept {
    return std::array<std::string_view, sizeof...(I)>{
        std::variant_alternative_t<I, Variant>::name...};
}

/**
 * @brief Names of every alternative of a failure variant, in declaration order
 */
template <typename Variant>
[[nodiscard]] constexpr auto alternative_names() noexcept {
    return alternative_names_impl<Variant>(
        std::make_index_sequence<std::variant_size_v<Variant>>{});
}

} // namespace pmx::detail
