#pragma once

#include <fmt/core.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sift/core/sift_types.hpp>
#include <string>
#include <string_view>

/**
 * @brief Timestamp parsing and formatting.
 *
 * Accepted textual layouts, tried in order:
 * - `2006-01-02T15:04:05.999999999Z07:00` (RFC3339 with fraction)
 * - `2006-01-02T15:04:05Z07:00` (RFC3339)
 * - `2006-01-02T15:04:05` (no zone, read as UTC)
 * - `2006-01-02 15:04:05`
 * - `2006-01-02`
 * - `15:04:05` (time of day on January 1st of year 0)
 */
namespace Sift::time {

/**
 * @brief Unix seconds of 0000-01-01T00:00:00Z and 9999-12-31T23:59:59Z, the
 * bounds of the representable range.
 */
inline constexpr int64_t MinUnixSeconds = -62'167'219'200;
inline constexpr int64_t MaxUnixSeconds = 253'402'300'799;

/// @cond INTERNAL
namespace detail {

class Cursor {
   public:
    explicit constexpr Cursor(std::string_view text) noexcept : text_{text} {}

    [[nodiscard]] constexpr bool digits(std::size_t count, int& out) noexcept {
        if (pos_ + count > text_.size()) {
            return false;
        }
        int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            const char c = text_[pos_ + i];
            if (c < '0' || c > '9') {
                return false;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        out = value;
        return true;
    }

    [[nodiscard]] constexpr bool consume(char c) noexcept {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] constexpr std::optional<char> peek() const noexcept {
        if (pos_ < text_.size()) {
            return text_[pos_];
        }
        return std::nullopt;
    }

    [[nodiscard]] constexpr bool done() const noexcept {
        return pos_ == text_.size();
    }

   private:
    std::string_view text_;
    std::size_t pos_{0};
};

struct Clock {
    int hour{0};
    int minute{0};
    int second{0};
    int64_t nanos{0};
};

[[nodiscard]] constexpr bool ParseDate(Cursor& cur,
                                       std::chrono::sys_days& out) noexcept {
    int y = 0;
    int m = 0;
    int d = 0;
    if (!cur.digits(4, y) || !cur.consume('-') || !cur.digits(2, m) ||
        !cur.consume('-') || !cur.digits(2, d)) {
        return false;
    }
    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return false;
    }
    out = std::chrono::sys_days{ymd};
    return true;
}

// Fractional seconds are optional after the seconds field, up to nine digits.
[[nodiscard]] constexpr bool ParseClock(Cursor& cur, Clock& out) noexcept {
    if (!cur.digits(2, out.hour) || !cur.consume(':') ||
        !cur.digits(2, out.minute) || !cur.consume(':') ||
        !cur.digits(2, out.second)) {
        return false;
    }
    if (out.hour > 23 || out.minute > 59 || out.second > 59) {
        return false;
    }
    out.nanos = 0;
    if (cur.consume('.')) {
        int digit = 0;
        std::size_t count = 0;
        while (cur.digits(1, digit)) {
            if (count == 9) {
                return false;
            }
            out.nanos = out.nanos * 10 + digit;
            ++count;
        }
        if (count == 0) {
            return false;
        }
        for (; count < 9; ++count) {
            out.nanos *= 10;
        }
    }
    return true;
}

// Zone designator: `Z` or `+hh:mm` / `-hh:mm`. Returns the offset east of UTC.
[[nodiscard]] constexpr bool ParseZone(Cursor& cur,
                                       std::chrono::minutes& out) noexcept {
    if (cur.consume('Z') || cur.consume('z')) {
        out = std::chrono::minutes{0};
        return true;
    }
    int sign = 0;
    if (cur.consume('+')) {
        sign = 1;
    } else if (cur.consume('-')) {
        sign = -1;
    } else {
        return false;
    }
    int hh = 0;
    int mm = 0;
    if (!cur.digits(2, hh) || !cur.consume(':') || !cur.digits(2, mm) ||
        hh > 23 || mm > 59) {
        return false;
    }
    out = std::chrono::minutes{sign * (hh * 60 + mm)};
    return true;
}

[[nodiscard]] constexpr Timestamp Compose(std::chrono::sys_days date,
                                          const Clock& clock,
                                          std::chrono::minutes offset) noexcept {
    const std::chrono::sys_seconds seconds =
        date + std::chrono::hours{clock.hour} +
        std::chrono::minutes{clock.minute} +
        std::chrono::seconds{clock.second} - offset;
    return Timestamp{seconds, static_cast<int32_t>(clock.nanos)};
}

}  // namespace detail
/// @endcond

/**
 * @brief Parses a timestamp from one of the supported textual layouts.
 * @return The instant in UTC, or std::nullopt when no layout matches.
 */
[[nodiscard]] constexpr std::optional<Timestamp> ParseTimestamp(
    std::string_view text) noexcept {
    // Date-based layouts.
    {
        detail::Cursor cur{text};
        std::chrono::sys_days date{};
        if (detail::ParseDate(cur, date)) {
            if (cur.done()) {
                return Timestamp{date, 0};
            }
            detail::Clock clock{};
            if (cur.consume('T') || cur.consume('t')) {
                if (!detail::ParseClock(cur, clock)) {
                    return std::nullopt;
                }
                std::chrono::minutes offset{0};
                if (!cur.done() && !detail::ParseZone(cur, offset)) {
                    return std::nullopt;
                }
                if (!cur.done()) {
                    return std::nullopt;
                }
                return detail::Compose(date, clock, offset);
            }
            if (cur.consume(' ') && detail::ParseClock(cur, clock) &&
                cur.done()) {
                return detail::Compose(date, clock, std::chrono::minutes{0});
            }
            return std::nullopt;
        }
    }

    // Time of day only.
    detail::Cursor cur{text};
    detail::Clock clock{};
    if (detail::ParseClock(cur, clock) && cur.done()) {
        const std::chrono::sys_days year_zero{std::chrono::year{0} /
                                              std::chrono::January / 1};
        return detail::Compose(year_zero, clock, std::chrono::minutes{0});
    }
    return std::nullopt;
}

/**
 * @brief Builds a timestamp from whole seconds and a nanosecond offset of
 * either sign, carrying the offset into the seconds.
 */
[[nodiscard]] constexpr Timestamp FromSeconds(std::chrono::sys_seconds seconds,
                                              int64_t nanos = 0) noexcept {
    constexpr int64_t NanosPerSecond = 1'000'000'000;
    int64_t carry = nanos / NanosPerSecond;
    nanos %= NanosPerSecond;
    if (nanos < 0) {
        nanos += NanosPerSecond;
        --carry;
    }
    return Timestamp{seconds + std::chrono::seconds{carry},
                     static_cast<int32_t>(nanos)};
}

/**
 * @brief Interprets an integer as whole seconds since the Unix epoch.
 */
[[nodiscard]] constexpr Timestamp FromUnixSeconds(int64_t seconds) noexcept {
    return Timestamp{std::chrono::sys_seconds{std::chrono::seconds{seconds}}, 0};
}

/**
 * @brief Interprets a float as seconds since the Unix epoch.
 *
 * The whole part becomes seconds and the remainder is scaled to nanoseconds
 * with binary floating arithmetic and truncated, so `1703505045.123` yields
 * `122999906` nanoseconds rather than `123000000`.
 */
[[nodiscard]] inline Timestamp FromUnixSeconds(double seconds) noexcept {
    const auto whole = static_cast<int64_t>(seconds);
    const auto nanos =
        static_cast<int64_t>((seconds - static_cast<double>(whole)) * 1e9);
    return FromSeconds(std::chrono::sys_seconds{std::chrono::seconds{whole}},
                       nanos);
}

/**
 * @brief Formats an instant as RFC3339 in UTC, trimming trailing zeros from
 * the fractional seconds (omitted entirely when zero).
 */
[[nodiscard]] inline std::string FormatTimestamp(Timestamp ts) {
    const auto days = std::chrono::floor<std::chrono::days>(ts.seconds);
    const std::chrono::year_month_day ymd{days};
    const std::chrono::hh_mm_ss hms{ts.seconds - days};
    std::string out = fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
        hms.hours().count(), hms.minutes().count(), hms.seconds().count());
    if (ts.nanos != 0) {
        std::string fraction = fmt::format("{:09}", ts.nanos);
        while (!fraction.empty() && fraction.back() == '0') {
            fraction.pop_back();
        }
        out += '.';
        out += fraction;
    }
    out += 'Z';
    return out;
}

/**
 * @brief The zero timestamp is the default-constructed value.
 */
[[nodiscard]] constexpr bool IsZero(Timestamp ts) noexcept {
    return ts == Timestamp{};
}

}  // namespace Sift::time
