#pragma once

#include <cstddef>
#include <sift/core/sift_types.hpp>
#include <string_view>

namespace Sift {

/// @cond INTERNAL
namespace detail {

[[nodiscard]] constexpr bool IsBlank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
           c == '\v';
}

[[nodiscard]] constexpr std::string_view Trim(std::string_view text) noexcept {
    while (!text.empty() && IsBlank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && IsBlank(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * @brief A `key: value` line: an unquoted key followed by a colon that ends
 * the line or is followed by a space or tab.
 */
[[nodiscard]] constexpr bool IsKeyValueLine(std::string_view line) noexcept {
    if (line.empty() || line.front() == '"' || line.front() == '\'' ||
        line.front() == '#') {
        return false;
    }
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == ':') {
            if (i == 0) {
                return false;
            }
            return i + 1 == line.size() || line[i + 1] == ' ' ||
                   line[i + 1] == '\t';
        }
    }
    return false;
}

[[nodiscard]] constexpr bool IsListItemLine(std::string_view line) noexcept {
    return line == "-" || (line.size() > 1 && line[0] == '-' &&
                           (line[1] == ' ' || line[1] == '\t'));
}

}  // namespace detail
/// @endcond

/**
 * @brief Classifies a buffer as JSON or YAML without parsing it.
 *
 * - Leading `{` or `[` (after whitespace) is JSON.
 * - A leading `---` document marker is YAML.
 * - Otherwise up to five non-empty lines are inspected: any `- ` list item,
 *   or `key: value` lines on at least half (rounded down) of the inspected
 *   lines, classify as YAML.
 * - Anything else, including empty input, is DefaultFormat.
 */
[[nodiscard]] constexpr Format DetectFormat(std::string_view bytes) noexcept {
    const auto trimmed = detail::Trim(bytes);
    if (trimmed.empty()) {
        return DefaultFormat;
    }
    if (trimmed.front() == '{' || trimmed.front() == '[') {
        return Format::JSON;
    }
    if (trimmed.starts_with("---")) {
        return Format::YAML;
    }

    constexpr std::size_t MaxLines = 5;
    std::size_t lines = 0;
    std::size_t key_value_lines = 0;
    std::string_view rest = trimmed;
    while (!rest.empty() && lines < MaxLines) {
        const auto eol = rest.find('\n');
        const auto line = detail::Trim(rest.substr(0, eol));
        rest = eol == std::string_view::npos ? std::string_view{}
                                             : rest.substr(eol + 1);
        if (line.empty()) {
            continue;
        }
        ++lines;
        if (detail::IsListItemLine(line)) {
            return Format::YAML;
        }
        if (detail::IsKeyValueLine(line)) {
            ++key_value_lines;
        }
    }
    if (lines > 1 && key_value_lines >= lines / 2) {
        return Format::YAML;
    }
    // A lone `key: value` line is still a mapping.
    if (lines == 1 && key_value_lines == 1) {
        return Format::YAML;
    }
    return DefaultFormat;
}

}  // namespace Sift
