#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Sift {

/**
 * @brief Textual serialization formats understood by the decoders.
 */
enum class Format : uint8_t {
    JSON = 0x01,  ///< Bracket-delimited format.
    YAML = 0x02,  ///< Indentation-based format.
};

/**
 * @brief Format chosen when detection is ambiguous or the input is empty.
 */
static constexpr Format DefaultFormat = Format::JSON;

[[nodiscard]] constexpr std::string_view FormatName(Format format) noexcept {
    switch (format) {
        case Format::YAML:
            return "yaml";
        case Format::JSON:
            return "json";
    }
    return "unknown";
}

/**
 * @brief Point in time with nanosecond resolution, always expressed in UTC.
 *
 * Whole seconds and the sub-second remainder are held apart so that every
 * instant of years 0000 to 9999 is representable. The default-constructed
 * value, 0001-01-01T00:00:00Z, is the zero timestamp.
 */
struct Timestamp {
    std::chrono::sys_seconds seconds{
        std::chrono::sys_days{std::chrono::year{1} / std::chrono::January / 1}};
    int32_t nanos{0};  ///< Always in [0, 999999999].

    auto operator<=>(const Timestamp&) const = default;
};

/**
 * @brief Default process-wide limits.
 */
static constexpr int64_t DefaultMaxInputSize = 10 * 1024 * 1024;
static constexpr int64_t DefaultMaxCacheSize = 1000;
static constexpr int64_t DefaultMaxValidationDepth = 32;
static constexpr int64_t DefaultMaxStructureDepth = 64;

/**
 * @brief Placeholder substituted for values of sensitive fields.
 */
static constexpr std::string_view RedactedValue = "[REDACTED]";

/**
 * @brief Error codes representing the failure classes of the pipeline.
 */
enum class ErrorCode : uint8_t {
    UNKNOWN = 0,         ///< Unknown error.
    DecodeError,         ///< Malformed bytes for the selected format.
    CoercionError,       ///< Well-formed value incompatible with the target
                         ///< field (type mismatch, range, bad timestamp).
    DepthExceeded,       ///< Nesting exceeded the configured depth limit.
    InputTooLarge,       ///< Input exceeded the configured size limit.
    ValidationFailed,    ///< Well-typed value violated a declared rule.
    ConfigurationError,  ///< Invalid registry or record setup.
};

[[nodiscard]] constexpr std::string_view ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DecodeError:
            return "decode";
        case ErrorCode::CoercionError:
            return "coercion";
        case ErrorCode::DepthExceeded:
            return "depth_exceeded";
        case ErrorCode::InputTooLarge:
            return "input_too_large";
        case ErrorCode::ValidationFailed:
            return "validation";
        case ErrorCode::ConfigurationError:
            return "configuration";
        case ErrorCode::UNKNOWN:
            break;
    }
    return "unknown";
}

}  // namespace Sift
