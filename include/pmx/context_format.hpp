#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <cstddef>

namespace pmx {

/// Appended by truncate_for_display() when text was cut
inline constexpr std::string_view kTruncationMarker = "... (truncated)";

/// Marks elided text on either side of a json_error_snippet() window
inline constexpr std::string_view kSnippetEllipsis = "...";

/// Default bound for JSON / raw payload snippets stored in failures
inline constexpr std::size_t kDefaultSnippetLength = 200;

/// Bound for HTTP response bodies embedded in rendered messages
inline constexpr std::size_t kMaxBodyDisplayLength = 500;

/// Bound for raw scalar values (numbers, field contents) stored in failures
inline constexpr std::size_t kMaxValueDisplayLength = 80;

/**
 * @brief Bound a string for display in a failure message
 *
 * Returns @p text unchanged when it is at most @p max_len bytes. Otherwise
 * returns the first @p max_len bytes followed by kTruncationMarker. The cut
 * never splits a UTF-8 code point, so the kept prefix may be a few bytes
 * shorter than @p max_len.
 *
 * The result is never longer than max_len + kTruncationMarker.size().
 */
[[nodiscard]] std::string truncate_for_display(std::string_view text, std::size_t max_len);

/**
 * @brief Extract the most useful region of a raw JSON payload
 *
 * Whitespace is collapsed first (lines trimmed, joined by one space). If the
 * collapsed text fits in @p max_len it is returned whole. Otherwise a window
 * is taken around the first structural fault found by
 * detail::locate_json_fault(); text elided on either side is marked with
 * kSnippetEllipsis. Without a fault the prefix is kept.
 *
 * The result is never longer than @p max_len bytes. Never throws on any input.
 */
[[nodiscard]] std::string json_error_snippet(std::string_view text, std::size_t max_len);

/**
 * @brief Extract a JSON snippet centred on a parser-reported byte offset
 *
 * Same contract as json_error_snippet(text, max_len), but the window is
 * placed around @p error_offset (clamped to the text) instead of a located
 * fault.
 */
[[nodiscard]] std::string json_error_snippet(std::string_view text, std::size_t error_offset,
                                             std::size_t max_len);

/**
 * @brief Trim each line and join the non-empty ones with a single space
 */
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

namespace detail {

/**
 * @brief Byte offset of the first structural anomaly in raw JSON text
 *
 * In priority order: a closing bracket that does not match its opener, the
 * opening quote of an unterminated string, the end of the text while brackets
 * remain open, or the first non-space byte after a complete top-level
 * container. Returns std::nullopt when the text shows none of these.
 */
[[nodiscard]] std::optional<std::size_t> locate_json_fault(std::string_view text) noexcept;

/**
 * @brief Largest cut position <= @p pos that does not split a UTF-8 sequence
 */
[[nodiscard]] std::size_t utf8_floor(std::string_view text, std::size_t pos) noexcept;

} // namespace detail

} // namespace pmx
