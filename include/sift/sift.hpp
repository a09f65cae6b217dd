#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <sift/coerce/sift_reflect.hpp>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/core/sift_time.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/decode/sift_decode.hpp>
#include <sift/decode/sift_detect.hpp>
#include <sift/decode/sift_encode.hpp>
#include <sift/decode/sift_node.hpp>
#include <sift/fields/sift_raw.hpp>
#include <sift/messages/sift_record.hpp>
#include <sift/sift_detail.hpp>
#include <sift/validators/sift_registry.hpp>
#include <sift/validators/sift_validator.hpp>
#include <string>
#include <string_view>

/**
 * @brief The public API for Sift.
 *
 * Transitively provides everything needed to declare records, register
 * validators and inspect errors.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b DetectFormat: Classifies input bytes as JSON or YAML.
 * - @b Decode: Parses input bytes into an untyped Node tree.
 * - @b ParseInto: Decodes, coerces into a typed value and validates it in one
 *   call, reporting every failure.
 * - @b Validate: Runs the declared rules on an already populated value.
 * - @b Serialize: Renders a typed value as JSON or YAML.
 * - @b CheckRecord: Reports a malformed rule string of a record type before
 *   its first parse.
 * - @b Parser: The same pipeline bound to a private validator registry.
 */
namespace Sift {

using messages::CheckRecord;
using validators::CrossFieldFunc;
using validators::Factory;
using validators::RecordView;
using validators::RegisterGlobalCrossField;
using validators::RegisterGlobalFunc;
using validators::Registry;
using validators::Validator;
using validators::ValidatorFunc;
using validators::ValidatorPtr;

/**
 * @brief Decodes, coerces and validates @p bytes into a @p T.
 *
 * The format is detected from the input. Rules resolve through the default
 * registry.
 *
 * @tparam T A record, a container of records or scalars, or Node.
 * @return The populated value, or every error of the first failing stage.
 */
template <typename T>
[[nodiscard]] std::expected<T, ErrorList> ParseInto(std::string_view bytes) {
    return detail::ParseInto<T>(bytes, std::nullopt, Registry::Default());
}

/**
 * @brief As ParseInto(bytes), with the format given explicitly.
 */
template <typename T>
[[nodiscard]] std::expected<T, ErrorList> ParseInto(std::string_view bytes,
                                                    Format format) {
    return detail::ParseInto<T>(bytes, format, Registry::Default());
}

/**
 * @brief Validates a value obtained outside the pipeline.
 *
 * Nested records are validated recursively and reported with dotted paths.
 *
 * @return std::nullopt when every rule passes, or all failures.
 */
template <typename T>
[[nodiscard]] std::optional<ErrorList> Validate(const T& value) {
    return detail::Validate(value, Registry::Default());
}

/**
 * @brief Renders @p value in @p format using its per-format member keys.
 *
 * The output parses back into an equal value.
 */
template <typename T>
[[nodiscard]] std::expected<std::string, Error> Serialize(
    const T& value, Format format = Format::JSON) {
    return Encode(coerce::ToNode(value, format), format);
}

/**
 * @brief Pipeline bound to its own validator registry.
 *
 * The registry starts with the built-in validators; registrations on it are
 * invisible to the default registry and to other parsers.
 */
class Parser {
   public:
    Parser() : registry_{std::make_shared<Registry>()} {}

    [[nodiscard]] Registry& registry() noexcept { return *registry_; }
    [[nodiscard]] const Registry& registry() const noexcept {
        return *registry_;
    }

    template <typename T>
    [[nodiscard]] std::expected<T, ErrorList> ParseInto(
        std::string_view bytes) const {
        return detail::ParseInto<T>(bytes, std::nullopt, *registry_);
    }

    template <typename T>
    [[nodiscard]] std::expected<T, ErrorList> ParseInto(std::string_view bytes,
                                                        Format format) const {
        return detail::ParseInto<T>(bytes, format, *registry_);
    }

    template <typename T>
    [[nodiscard]] std::optional<ErrorList> Validate(const T& value) const {
        return detail::Validate(value, *registry_);
    }

   private:
    std::shared_ptr<Registry> registry_;
};

}  // namespace Sift
