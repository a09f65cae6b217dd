#pragma once

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/validators/sift_validator.hpp>
#include <string>
#include <string_view>

/**
 * @brief Built-in validators.
 *
 * Except for Required, every built-in passes Null and leaves presence checks
 * to `required`. String rules also pass the empty string.
 */
namespace Sift::validators {

/// @cond INTERNAL
namespace detail {

[[nodiscard]] inline std::string_view KindName(const Value& value) noexcept {
    switch (value.kind()) {
        case Value::Kind::Null:
            return "null";
        case Value::Kind::Bool:
            return "bool";
        case Value::Kind::Int:
        case Value::Kind::Uint:
            return "integer";
        case Value::Kind::Float:
            return "float";
        case Value::Kind::String:
            return "string";
        case Value::Kind::Time:
            return "timestamp";
        case Value::Kind::Sequence:
            return "array";
        case Value::Kind::Mapping:
            return "object";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool IsAsciiAlpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr bool IsAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/**
 * @brief Shared base for rules that carry their name.
 */
class NamedValidator : public Validator {
   public:
    explicit NamedValidator(std::string name) : name_{std::move(name)} {}

    [[nodiscard]] const std::string& name() const noexcept override {
        return name_;
    }

   private:
    std::string name_;
};

}  // namespace detail
/// @endcond

/**
 * @brief Fails on the type's zero value: Null, numeric zero, empty strings
 * and containers, the zero timestamp. `false` is a valid present value.
 */
class Required final : public detail::NamedValidator {
   public:
    Required() : NamedValidator{"required"} {}

    using Validator::validate;
    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        if (value.is_zero()) {
            return Error::validation(field, name(), "field is required", value);
        }
        return std::nullopt;
    }
};

/**
 * @brief Lower (Min) or upper (Max) bound on a number, or on the length of
 * a string or array.
 */
template <bool IsMin>
class Bound final : public detail::NamedValidator {
   public:
    explicit Bound(double limit)
        : NamedValidator{IsMin ? "min" : "max"}, limit_{limit} {}

    [[nodiscard]] double limit() const noexcept { return limit_; }

    using Validator::validate;
    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        constexpr std::string_view Word = IsMin ? "least" : "most";
        switch (value.kind()) {
            case Value::Kind::Null:
                return std::nullopt;
            case Value::Kind::String:
                if (violates(static_cast<double>(*value.length()))) {
                    return fail(field, value,
                                fmt::format("string length must be at {} {:.0f} "
                                            "characters",
                                            Word, limit_));
                }
                return std::nullopt;
            case Value::Kind::Int:
            case Value::Kind::Uint:
                if (violates(*value.as_double())) {
                    return fail(field, value,
                                fmt::format("value must be at {} {:.0f}", Word,
                                            limit_));
                }
                return std::nullopt;
            case Value::Kind::Float:
                if (violates(*value.as_double())) {
                    return fail(field, value,
                                fmt::format("value must be at {} {:g}", Word,
                                            limit_));
                }
                return std::nullopt;
            case Value::Kind::Sequence:
                if (violates(static_cast<double>(*value.length()))) {
                    return fail(field, value,
                                fmt::format("array length must be at {} {:.0f}",
                                            Word, limit_));
                }
                return std::nullopt;
            case Value::Kind::Bool:
            case Value::Kind::Time:
            case Value::Kind::Mapping:
                break;
        }
        return Error::validation(
            field, name(),
            fmt::format("{} validation not supported for type {}", name(),
                        detail::KindName(value)),
            value);
    }

   private:
    [[nodiscard]] bool violates(double actual) const noexcept {
        return IsMin ? actual < limit_ : actual > limit_;
    }

    [[nodiscard]] Error fail(std::string_view field, const Value& value,
                             std::string message) const {
        auto err = Error::validation(field, name(), std::move(message), value);
        err.details.emplace(name(), limit_);
        return err;
    }

    double limit_;
};

using Min = Bound<true>;
using Max = Bound<false>;

/**
 * @brief Structural e-mail address check.
 *
 * Requires a single `@` between a local part of `[A-Za-z0-9._%+-]` and a
 * domain of `[A-Za-z0-9.-]` ending in an alphabetic label of at least two
 * letters, with no leading, trailing or consecutive dots and the usual
 * length caps (254 overall, 64 local, 253 domain).
 */
class Email final : public detail::NamedValidator {
   public:
    Email() : NamedValidator{"email"} {}

    using Validator::validate;
    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        if (value.is_null()) {
            return std::nullopt;
        }
        const auto* text = value.get_if<std::string>();
        if (text == nullptr) {
            return fail(field, value, "value must be a string");
        }
        const std::string_view email = *text;
        if (email.empty()) {
            return std::nullopt;
        }
        if (email.size() > 254) {
            return fail(field, value, "email address is too long");
        }
        if (!WellFormed(email)) {
            return fail(field, value, "invalid email address format");
        }
        if (email.find("..") != std::string_view::npos) {
            return fail(field, value,
                        "email address cannot contain consecutive dots");
        }
        if (email.front() == '.' || email.back() == '.') {
            return fail(field, value,
                        "email address cannot start or end with a dot");
        }
        const auto at = email.find('@');
        const auto local = email.substr(0, at);
        const auto domain = email.substr(at + 1);
        if (local.empty() || local.size() > 64) {
            return fail(field, value, "email local part must be 1-64 characters");
        }
        if (local.front() == '.' || local.back() == '.') {
            return fail(field, value,
                        "email local part cannot start or end with a dot");
        }
        if (domain.empty() || domain.size() > 253) {
            return fail(field, value, "email domain must be 1-253 characters");
        }
        if (domain.front() == '.' || domain.back() == '.') {
            return fail(field, value,
                        "email domain cannot start or end with a dot");
        }
        return std::nullopt;
    }

   private:
    [[nodiscard]] static bool WellFormed(std::string_view email) noexcept {
        const auto at = email.find('@');
        if (at == std::string_view::npos || at == 0 ||
            email.find('@', at + 1) != std::string_view::npos) {
            return false;
        }
        const auto local = email.substr(0, at);
        const auto domain = email.substr(at + 1);
        const bool local_ok = std::all_of(local.begin(), local.end(), [](char c) {
            return detail::IsAsciiAlpha(c) || detail::IsAsciiDigit(c) ||
                   c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
        });
        const bool domain_ok =
            std::all_of(domain.begin(), domain.end(), [](char c) {
                return detail::IsAsciiAlpha(c) || detail::IsAsciiDigit(c) ||
                       c == '.' || c == '-';
            });
        if (!local_ok || !domain_ok) {
            return false;
        }
        const auto dot = domain.rfind('.');
        if (dot == std::string_view::npos || dot == 0) {
            return false;
        }
        const auto tld = domain.substr(dot + 1);
        return tld.size() >= 2 &&
               std::all_of(tld.begin(), tld.end(), detail::IsAsciiAlpha);
    }

    [[nodiscard]] std::optional<Error> fail(std::string_view field,
                                            const Value& value,
                                            std::string_view message) const {
        return Error::validation(field, name(), std::string{message}, value);
    }
};

/**
 * @brief Exact length of a string (in bytes) or array.
 */
class Length final : public detail::NamedValidator {
   public:
    explicit Length(int64_t length) : NamedValidator{"length"}, length_{length} {}

    using Validator::validate;
    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        if (value.is_null()) {
            return std::nullopt;
        }
        if (!value.is_string() && value.kind() != Value::Kind::Sequence) {
            return Error::validation(
                field, name(),
                fmt::format("length validation not supported for type {}",
                            detail::KindName(value)),
                value);
        }
        const auto actual = static_cast<int64_t>(*value.length());
        if (actual != length_) {
            auto err = Error::validation(
                field, name(), fmt::format("length must be exactly {}", length_),
                value);
            err.details.emplace("expected", length_);
            err.details.emplace("actual", actual);
            return err;
        }
        return std::nullopt;
    }

   private:
    int64_t length_;
};

/**
 * @brief ASCII character-class check on strings: letters only (Alpha) or
 * letters and digits (Alphanum).
 */
template <bool AllowDigits>
class CharClass final : public detail::NamedValidator {
   public:
    CharClass() : NamedValidator{AllowDigits ? "alphanum" : "alpha"} {}

    using Validator::validate;
    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        if (value.is_null()) {
            return std::nullopt;
        }
        const auto* text = value.get_if<std::string>();
        if (text == nullptr) {
            return Error::validation(field, name(), "value must be a string",
                                     value);
        }
        const bool ok = std::all_of(text->begin(), text->end(), [](char c) {
            return detail::IsAsciiAlpha(c) ||
                   (AllowDigits && detail::IsAsciiDigit(c));
        });
        if (!ok) {
            return Error::validation(
                field, name(),
                AllowDigits ? "value must contain only alphanumeric characters"
                            : "value must contain only alphabetic characters",
                value);
        }
        return std::nullopt;
    }
};

using Alpha = CharClass<false>;
using Alphanum = CharClass<true>;

}  // namespace Sift::validators
