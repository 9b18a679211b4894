#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "errors/analysis_error.hpp"
#include "errors/data_source_error.hpp"
#include "errors/http_error.hpp"
#include "errors/normalization_error.hpp"
#include "errors/output_error.hpp"
#include "errors/parse_error.hpp"
#include "expected.hpp"
#include "types.hpp"

namespace pmx {

/**
 * @brief True for the six stage failure types that AppError can hold
 */
template <typename E>
inline constexpr bool is_stage_error_v =
    std::is_same_v<E, HttpError> || std::is_same_v<E, DataSourceError> ||
    std::is_same_v<E, ParseError> || std::is_same_v<E, NormalizationError> ||
    std::is_same_v<E, AnalysisError> || std::is_same_v<E, OutputError>;

template <typename E>
concept StageError = is_stage_error_v<E>;

/**
 * @brief Stage that produces failures of type E
 */
template <StageError E>
inline constexpr Stage stage_of_v = std::is_same_v<E, HttpError>         ? Stage::http
                                    : std::is_same_v<E, DataSourceError> ? Stage::data_source
                                    : std::is_same_v<E, ParseError>      ? Stage::parse
                                    : std::is_same_v<E, NormalizationError>
                                        ? Stage::normalization
                                    : std::is_same_v<E, AnalysisError> ? Stage::analysis
                                                                       : Stage::output;

/**
 * @brief Top-level failure: exactly one stage failure, tagged by its stage
 *
 * AppError is the only failure type that crosses stage boundaries. It is built
 * once by promote() (or fail()) from the stage failure that was detected, holds
 * it unchanged, and offers read-only access afterwards. There is no default
 * state and no way to replace the held failure.
 *
 * The index of the held alternative equals the Stage value, so stage() is the
 * tag that the presentation layer dispatches on.
 *
 * Usage:
 * @code
 *   pmx::AppError err = pmx::promote(pmx::DataSourceError{
 *       pmx::source::MarketGroupNotFound{.slug = "non-existent-market"}});
 *
 *   if (auto* src = err.get_if<pmx::DataSourceError>()) {
 *       // inspect the nested variant
 *   }
 *   std::cerr << err.message() << "\n";
 * @endcode
 */
class AppError {
public:
    using Storage = std::variant<HttpError, DataSourceError, ParseError, NormalizationError,
                                 AnalysisError, OutputError>;

    static_assert(std::variant_size_v<Storage> == stage_count);

    /**
     * @brief Wrap a stage failure
     *
     * Callers normally go through promote() at a stage boundary.
     */
    template <StageError E>
    explicit AppError(E error) noexcept(std::is_nothrow_move_constructible_v<E>)
        : storage_(std::in_place_type<E>, std::move(error)) {}

    /// Stage that produced the held failure
    [[nodiscard]] Stage stage() const noexcept { return static_cast<Stage>(storage_.index()); }

    /// Name of the nested stage variant ("Timeout", "MissingField", ...)
    [[nodiscard]] std::string_view kind() const noexcept {
        return std::visit([](const auto& e) noexcept { return kind_name(e); }, storage_);
    }

    template <StageError E>
    [[nodiscard]] bool holds() const noexcept {
        return std::holds_alternative<E>(storage_);
    }

    /**
     * @brief Held stage failure, or nullptr when another stage is held
     */
    template <StageError E>
    [[nodiscard]] const E* get_if() const noexcept {
        return std::get_if<E>(&storage_);
    }

    /**
     * @brief Held stage failure
     * @throws std::bad_variant_access if another stage is held
     */
    template <StageError E>
    [[nodiscard]] const E& get() const {
        return std::get<E>(storage_);
    }

    /// Visit the held stage failure
    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), storage_);
    }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    /**
     * @brief Rendered message: "<stage label>: <stage message>"
     *
     * Deterministic for a given value.
     */
    [[nodiscard]] std::string message() const;

    bool operator==(const AppError&) const = default;

private:
    Storage storage_;
};

/**
 * @brief Result type for operations that cross stage boundaries
 *
 * Alias for expected<T, AppError>.
 */
template <typename T>
using Result = expected<T, AppError>;

// ==========
// Promotion
// ==========

/**
 * @brief Promote a stage failure into the top-level failure
 *
 * One overload per stage, so a bare variant struct converts to its own stage
 * type first:
 * @code
 *   auto err = pmx::promote(pmx::http::Timeout{.url = url, .duration = 30s});
 * @endcode
 *
 * Total and lossless: the stage failure is stored unchanged.
 */
[[nodiscard]] inline AppError promote(HttpError error) noexcept {
    return AppError(std::move(error));
}

[[nodiscard]] inline AppError promote(DataSourceError error) noexcept {
    return AppError(std::move(error));
}

[[nodiscard]] inline AppError promote(ParseError error) noexcept {
    return AppError(std::move(error));
}

[[nodiscard]] inline AppError promote(NormalizationError error) noexcept {
    return AppError(std::move(error));
}

[[nodiscard]] inline AppError promote(AnalysisError error) noexcept {
    return AppError(std::move(error));
}

[[nodiscard]] inline AppError promote(OutputError error) noexcept {
    return AppError(std::move(error));
}

/**
 * @brief Promote a stage result at a stage boundary
 *
 * Values pass through untouched; a stage failure is wrapped into AppError.
 *
 * @code
 *   pmx::Result<Market> load(std::string_view slug) {
 *       return pmx::promote(fetch_group(slug))        // expected<Group, HttpError>
 *           .and_then([&](const Group& g) {
 *               return pmx::promote(select_market(g, slug)); // expected<Market, DataSourceError>
 *           });
 *   }
 * @endcode
 */
template <typename T, StageError E>
[[nodiscard]] Result<T> promote(expected<T, E> result) {
    return std::move(result).map_error([](E&& e) { return AppError(std::move(e)); });
}

/**
 * @brief Return a promoted failure from a function returning Result<T>
 *
 * @code
 *   if (!response_ok) {
 *       return pmx::fail(pmx::http::Timeout{.url = url, .duration = 30s});
 *   }
 * @endcode
 */
[[nodiscard]] inline unexpected<AppError> fail(HttpError error) {
    return unexpected<AppError>(promote(std::move(error)));
}

[[nodiscard]] inline unexpected<AppError> fail(DataSourceError error) {
    return unexpected<AppError>(promote(std::move(error)));
}

[[nodiscard]] inline unexpected<AppError> fail(ParseError error) {
    return unexpected<AppError>(promote(std::move(error)));
}

[[nodiscard]] inline unexpected<AppError> fail(NormalizationError error) {
    return unexpected<AppError>(promote(std::move(error)));
}

[[nodiscard]] inline unexpected<AppError> fail(AnalysisError error) {
    return unexpected<AppError>(promote(std::move(error)));
}

[[nodiscard]] inline unexpected<AppError> fail(OutputError error) {
    return unexpected<AppError>(promote(std::move(error)));
}

/**
 * @brief Rendered message of a stage failure (without the stage label)
 */
[[nodiscard]] std::string stage_message(const AppError& e);

} // namespace pmx
