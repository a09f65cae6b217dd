#pragma once

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/core/sift_value.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Sift {

/**
 * @brief Structured, rule-specific information attached to an error.
 */
using Details = std::map<std::string, Value, std::less<>>;

/// @cond INTERNAL
namespace detail {

/**
 * @brief Splits a dotted path such as `items[2].sku` into member names
 * (`items`, `sku`), dropping index suffixes.
 */
[[nodiscard]] inline std::vector<std::string_view> PathSegments(
    std::string_view path) {
    std::vector<std::string_view> segments;
    while (!path.empty()) {
        const auto dot = path.find('.');
        std::string_view segment = path.substr(0, dot);
        if (const auto bracket = segment.find('[');
            bracket != std::string_view::npos) {
            segment = segment.substr(0, bracket);
        }
        if (!segment.empty()) {
            segments.push_back(segment);
        }
        if (dot == std::string_view::npos) {
            break;
        }
        path.remove_prefix(dot + 1);
    }
    return segments;
}

[[nodiscard]] inline std::string LeafName(std::string_view path) {
    const auto segments = PathSegments(path);
    return segments.empty() ? std::string{} : std::string{segments.back()};
}

}  // namespace detail
/// @endcond

/**
 * @brief A single failure produced by the pipeline.
 *
 * Decode errors describe the input as a whole and carry the tokenizer's byte
 * offset when one is known. Coercion, depth and validation errors are bound
 * to a field: `field` is the member name and `field_path` the dotted path
 * from the top-level record (`address.city`, `tags[1]`).
 *
 * @note `value` holds the offending value as-is. Read it through
 * sanitized_value() before showing or serializing it.
 */
struct Error {
    ErrorCode code{ErrorCode::UNKNOWN};  ///< The error code.
    // cppcheck-suppress unusedStructMember
    std::string field{};  ///< Member name, empty when not field-bound.
    // cppcheck-suppress unusedStructMember
    std::string field_path{};  ///< Dotted path of the field.
    // cppcheck-suppress unusedStructMember
    Value value{};  ///< Offending value (unredacted).
    // cppcheck-suppress unusedStructMember
    std::string rule{};  ///< Failing rule for validation errors.
    // cppcheck-suppress unusedStructMember
    std::string message{};  ///< Human-readable description.
    // cppcheck-suppress unusedStructMember
    Details details{};  ///< Optional structured information.
    // cppcheck-suppress unusedStructMember
    std::optional<std::size_t> offset{};  ///< Byte offset for decode errors.
    // cppcheck-suppress unusedStructMember
    std::optional<Format> format{};  ///< Format of a decode error.

    /**
     * @brief Creates an error for malformed input bytes.
     * @param fmt The format that failed to decode.
     * @param msg Tokenizer description of the failure.
     * @param at Byte offset of the failure, when known.
     */
    [[nodiscard]] static Error decode(
        Format fmt, std::string msg,
        std::optional<std::size_t> at = std::nullopt) {
        Error err{.code = ErrorCode::DecodeError, .message = std::move(msg)};
        err.offset = at;
        err.format = fmt;
        return err;
    }

    /**
     * @brief Creates an error for a value that cannot become the target type.
     * @param path Dotted path of the field, empty for the top-level value.
     * @param msg Description of the mismatch.
     */
    [[nodiscard]] static Error coercion(std::string_view path, std::string msg,
                                        Value offending = {}) {
        return {.code = ErrorCode::CoercionError,
                .field = detail::LeafName(path),
                .field_path = std::string{path},
                .value = std::move(offending),
                .message = std::move(msg)};
    }

    /**
     * @brief Creates an error for nesting beyond a configured depth limit.
     */
    [[nodiscard]] static Error depth_exceeded(std::string_view path,
                                              std::string msg) {
        return {.code = ErrorCode::DepthExceeded,
                .field = detail::LeafName(path),
                .field_path = std::string{path},
                .message = std::move(msg)};
    }

    [[nodiscard]] static Error input_too_large(std::size_t size,
                                               int64_t limit) {
        return {.code = ErrorCode::InputTooLarge,
                .message = fmt::format(
                    "input size {} bytes exceeds maximum allowed size {} bytes",
                    size, limit)};
    }

    /**
     * @brief Creates an error for a declared rule that a value violates.
     * @param path Dotted path of the field.
     * @param rule_name The failing rule.
     * @param msg The failure description.
     * @param offending The value that was checked.
     */
    [[nodiscard]] static Error validation(std::string_view path,
                                          std::string rule_name,
                                          std::string msg,
                                          Value offending = {}) {
        return {.code = ErrorCode::ValidationFailed,
                .field = detail::LeafName(path),
                .field_path = std::string{path},
                .value = std::move(offending),
                .rule = std::move(rule_name),
                .message = std::move(msg)};
    }

    /**
     * @brief Creates an error for an invalid registry or record setup.
     */
    [[nodiscard]] static Error configuration(std::string msg) {
        return {.code = ErrorCode::ConfigurationError,
                .message = std::move(msg)};
    }

    /**
     * @brief Whether the field name or any segment of its path matches a
     * sensitive-field pattern.
     */
    [[nodiscard]] bool is_sensitive() const {
        if (!field.empty() && IsSensitiveField(field)) {
            return true;
        }
        for (const auto segment : detail::PathSegments(field_path)) {
            if (IsSensitiveField(segment)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief The offending value, or the redaction placeholder when the field
     * is sensitive. Non-sensitive values keep their type.
     */
    [[nodiscard]] Value sanitized_value() const {
        if (is_sensitive()) {
            return Value{RedactedValue};
        }
        return value;
    }

    /**
     * @brief Path used for display and grouping: the dotted path, or the
     * field name when no path was recorded.
     */
    [[nodiscard]] const std::string& display_path() const noexcept {
        return field_path.empty() ? field : field_path;
    }

    [[nodiscard]] std::string what() const {
        switch (code) {
            case ErrorCode::DecodeError: {
                const auto name = FormatName(format.value_or(DefaultFormat));
                if (offset) {
                    return fmt::format("{} parse error at offset {}: {}", name,
                                       *offset, message);
                }
                return fmt::format("{} parse error: {}", name, message);
            }
            case ErrorCode::CoercionError:
            case ErrorCode::DepthExceeded:
                if (!display_path().empty()) {
                    return fmt::format("parse error on field \"{}\": {}",
                                       display_path(), message);
                }
                return fmt::format("parse error: {}", message);
            case ErrorCode::ValidationFailed:
                if (!display_path().empty()) {
                    return fmt::format("validation error on field \"{}\": {}",
                                       display_path(), message);
                }
                return fmt::format("validation error: {}", message);
            case ErrorCode::InputTooLarge:
            case ErrorCode::ConfigurationError:
            case ErrorCode::UNKNOWN:
                break;
        }
        return message;
    }

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }
};

/**
 * @brief Serializable, redacted summary of the validation failures of one
 * call, grouped by field path in first-seen order.
 */
struct StructuredReport {
    struct RuleFailure {
        std::string rule;
        std::string message;
        Details details;
    };

    struct FieldEntry {
        std::string field;
        std::string field_path;
        Value value;  ///< Already redacted.
        std::vector<RuleFailure> failures;
    };

    std::vector<FieldEntry> errors;

    [[nodiscard]] std::size_t count() const noexcept { return errors.size(); }

    [[nodiscard]] nlohmann::ordered_json to_json() const {
        nlohmann::ordered_json entries = nlohmann::ordered_json::array();
        for (const auto& entry : errors) {
            nlohmann::ordered_json item;
            item["field"] = entry.field;
            item["field_path"] = entry.field_path;
            if (!entry.value.is_null()) {
                item["value"] = entry.value;
            }
            nlohmann::ordered_json failures = nlohmann::ordered_json::array();
            for (const auto& failure : entry.failures) {
                nlohmann::ordered_json f;
                f["rule"] = failure.rule;
                f["message"] = failure.message;
                if (!failure.details.empty()) {
                    nlohmann::ordered_json details =
                        nlohmann::ordered_json::object();
                    for (const auto& [key, detail] : failure.details) {
                        details[key] = detail;
                    }
                    f["details"] = std::move(details);
                }
                failures.push_back(std::move(f));
            }
            item["validation_errors"] = std::move(failures);
            entries.push_back(std::move(item));
        }
        nlohmann::ordered_json report;
        report["errors"] = std::move(entries);
        report["count"] = count();
        return report;
    }
};

/**
 * @brief Ordered collection of every failure of one pipeline call.
 *
 * Never shared between calls. Grouping and reporting consider validation
 * failures only; decode and coercion failures remain available through
 * iteration and what().
 */
class ErrorList {
   public:
    using const_iterator = std::vector<Error>::const_iterator;

    ErrorList() = default;
    explicit ErrorList(Error error) { errors_.push_back(std::move(error)); }

    void add(Error error) { errors_.push_back(std::move(error)); }

    void append(ErrorList&& other) {
        for (auto& error : other.errors_) {
            errors_.push_back(std::move(error));
        }
        other.errors_.clear();
    }

    [[nodiscard]] bool empty() const noexcept { return errors_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return errors_.size(); }
    [[nodiscard]] const Error& operator[](std::size_t i) const noexcept {
        return errors_[i];
    }
    [[nodiscard]] const Error& front() const noexcept {
        return errors_.front();
    }
    [[nodiscard]] const_iterator begin() const noexcept {
        return errors_.begin();
    }
    [[nodiscard]] const_iterator end() const noexcept { return errors_.end(); }

    [[nodiscard]] bool contains(ErrorCode code) const noexcept {
        for (const auto& error : errors_) {
            if (error == code) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Human-readable text. More than one error is joined with "; "
     * behind a "multiple errors: " prefix.
     */
    [[nodiscard]] std::string what() const {
        if (errors_.empty()) {
            return {};
        }
        if (errors_.size() == 1) {
            return errors_.front().what();
        }
        std::string out = "multiple errors: ";
        for (std::size_t i = 0; i < errors_.size(); ++i) {
            if (i != 0) {
                out += "; ";
            }
            out += errors_[i].what();
        }
        return out;
    }

    [[nodiscard]] std::vector<Error> validation_errors() const {
        std::vector<Error> out;
        for (const auto& error : errors_) {
            if (error == ErrorCode::ValidationFailed) {
                out.push_back(error);
            }
        }
        return out;
    }

    /**
     * @brief Validation errors keyed by field path.
     */
    [[nodiscard]] std::map<std::string, std::vector<Error>> group_by_field()
        const {
        std::map<std::string, std::vector<Error>> groups;
        for (const auto& error : errors_) {
            if (error == ErrorCode::ValidationFailed) {
                groups[error.display_path()].push_back(error);
            }
        }
        return groups;
    }

    [[nodiscard]] StructuredReport to_structured_report() const {
        StructuredReport report;
        for (const auto& error : errors_) {
            if (error != ErrorCode::ValidationFailed) {
                continue;
            }
            StructuredReport::FieldEntry* entry = nullptr;
            for (auto& existing : report.errors) {
                if (existing.field_path == error.display_path()) {
                    entry = &existing;
                    break;
                }
            }
            if (entry == nullptr) {
                entry = &report.errors.emplace_back(StructuredReport::FieldEntry{
                    .field = error.field,
                    .field_path = error.display_path(),
                    .value = error.sanitized_value(),
                    .failures = {}});
            }
            entry->failures.push_back(
                {.rule = error.rule,
                 .message = error.message,
                 .details = error.details});
        }
        return report;
    }

    /**
     * @brief The structured report serialized as compact JSON.
     */
    [[nodiscard]] std::string to_json() const {
        return to_structured_report().to_json().dump();
    }

   private:
    std::vector<Error> errors_;
};

}  // namespace Sift
