#include "pmx/context_format.hpp"

#include <algorithm>
#include <new>
#include <vector>

namespace pmx {

namespace {

constexpr bool is_utf8_continuation(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

constexpr bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

// Smallest cut position >= pos that does not split a UTF-8 sequence
std::size_t utf8_ceil(std::string_view text, std::size_t pos) noexcept {
    pos = std::min(pos, text.size());
    while (pos < text.size() && is_utf8_continuation(text[pos])) {
        ++pos;
    }
    return pos;
}

// Keep a prefix of at most max_len bytes, ending in an ellipsis when cut
std::string prefix_snippet(std::string_view text, std::size_t max_len) {
    if (text.size() <= max_len) {
        return std::string(text);
    }
    if (max_len <= kSnippetEllipsis.size()) {
        return std::string(text.substr(0, detail::utf8_floor(text, max_len)));
    }
    auto cut = detail::utf8_floor(text, max_len - kSnippetEllipsis.size());
    std::string out(text.substr(0, cut));
    out += kSnippetEllipsis;
    return out;
}

// Minimum bound for which a two-sided window is worth taking
constexpr std::size_t kMinWindowLength = 2 * kSnippetEllipsis.size() + 2;

std::string window_snippet(std::string_view text, std::size_t focus, std::size_t max_len) {
    focus = std::min(focus, text.size());

    const std::size_t budget = max_len - 2 * kSnippetEllipsis.size();

    // Two thirds of the window before the fault
    const std::size_t before = budget * 2 / 3;
    std::size_t start = focus > before ? focus - before : 0;
    std::size_t end = std::min(text.size(), start + budget);
    if (end - start < budget) {
        start = end > budget ? end - budget : 0;
    }

    start = utf8_ceil(text, start);
    end = detail::utf8_floor(text, end);
    if (end < start) {
        end = start;
    }

    std::string out;
    out.reserve(max_len);
    if (start > 0) {
        out += kSnippetEllipsis;
    }
    out += collapse_whitespace(text.substr(start, end - start));
    if (end < text.size()) {
        out += kSnippetEllipsis;
    }
    return out;
}

std::string bounded_snippet(std::string_view text, std::size_t focus, std::size_t max_len) {
    auto collapsed = collapse_whitespace(text);
    if (collapsed.size() <= max_len) {
        return collapsed;
    }
    if (max_len < kMinWindowLength) {
        return prefix_snippet(collapsed, max_len);
    }
    return window_snippet(text, focus, max_len);
}

} // namespace

std::string truncate_for_display(std::string_view text, std::size_t max_len) {
    if (text.size() <= max_len) {
        return std::string(text);
    }
    auto cut = detail::utf8_floor(text, max_len);
    std::string out;
    out.reserve(cut + kTruncationMarker.size());
    out.append(text.substr(0, cut));
    out.append(kTruncationMarker);
    return out;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            nl = text.size();
        }
        auto line = text.substr(pos, nl - pos);

        std::size_t first = 0;
        while (first < line.size() && is_blank(line[first])) {
            ++first;
        }
        std::size_t last = line.size();
        while (last > first && is_blank(line[last - 1])) {
            --last;
        }

        if (last > first) {
            if (!out.empty()) {
                out += ' ';
            }
            out.append(line.substr(first, last - first));
        }
        pos = nl + 1;
    }
    return out;
}

std::string json_error_snippet(std::string_view text, std::size_t max_len) {
    auto collapsed = collapse_whitespace(text);
    if (collapsed.size() <= max_len) {
        return collapsed;
    }

    auto fault = detail::locate_json_fault(text);
    if (!fault || max_len < kMinWindowLength) {
        return prefix_snippet(collapsed, max_len);
    }
    return window_snippet(text, *fault, max_len);
}

std::string json_error_snippet(std::string_view text, std::size_t error_offset,
                               std::size_t max_len) {
    return bounded_snippet(text, error_offset, max_len);
}

namespace detail {

std::size_t utf8_floor(std::string_view text, std::size_t pos) noexcept {
    pos = std::min(pos, text.size());
    while (pos > 0 && pos < text.size() && is_utf8_continuation(text[pos])) {
        --pos;
    }
    return pos;
}

std::optional<std::size_t> locate_json_fault(std::string_view text) noexcept {
    // Expected closers of the currently open containers; depth is bounded by
    // the input length, the vector only grows for deeply nested payloads.
    std::vector<char> open;
    bool in_string = false;
    bool escaped = false;
    std::size_t string_start = 0;
    bool seen_container = false;

    try {
        for (std::size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];

            if (in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            switch (c) {
                case '"':
                    if (seen_container && open.empty()) {
                        return i;
                    }
                    in_string = true;
                    string_start = i;
                    break;
                case '{':
                case '[':
                    if (seen_container && open.empty()) {
                        return i;
                    }
                    open.push_back(c == '{' ? '}' : ']');
                    seen_container = true;
                    break;
                case '}':
                case ']':
                    if (open.empty() || open.back() != c) {
                        return i;
                    }
                    open.pop_back();
                    break;
                default:
                    if (seen_container && open.empty() && !is_blank(c) && c != '\n') {
                        return i;
                    }
                    break;
            }
        }
    } catch (const std::bad_alloc&) {
        // Nesting too deep to track: no usable cue
        return std::nullopt;
    }

    if (in_string) {
        return string_start;
    }
    if (!open.empty()) {
        return text.size();
    }
    return std::nullopt;
}

} // namespace detail

} // namespace pmx
