#pragma once

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <expected>
#include <optional>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/decode/sift_detect.hpp>
#include <sift/fields/sift_traits.hpp>
#include <sift/messages/sift_record.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace Sift::messages {

/**
 * @brief One parsed entry of a rule string: `min=3` becomes
 * `{"min", {"value": 3.0}}`.
 */
struct Rule {
    std::string name;
    Params params;

    bool operator==(const Rule&) const = default;
};

struct RecordMetadata;

/**
 * @brief Resolved description of one record member.
 */
struct FieldMetadata {
    std::string name;
    std::string json_key;
    std::string yaml_key;
    fields::FieldKind kind{fields::FieldKind::Unsupported};
    bool skip{false};      ///< Excluded with the `-` key.
    bool optional{false};  ///< Optional or pointer member.
    bool raw{false};       ///< Raw passthrough capture.
    std::vector<Rule> rules;
    /// Metadata of the record reached through this member, if any. Resolved
    /// lazily so that self-referential records are supported.
    const RecordMetadata& (*nested)() = nullptr;

    [[nodiscard]] const std::string& key(Format format) const noexcept {
        return format == Format::YAML ? yaml_key : json_key;
    }
};

/**
 * @brief Resolved description of a record type, in member declaration order.
 */
struct RecordMetadata {
    std::vector<FieldMetadata> fields;
    /// Set when a member's rule string is malformed.
    std::optional<Error> error;

    [[nodiscard]] const FieldMetadata* find(std::string_view name) const noexcept {
        for (const auto& field : fields) {
            if (field.name == name) {
                return &field;
            }
        }
        return nullptr;
    }
};

/**
 * @brief Parses a comma-separated rule string.
 *
 * Whitespace around rules is ignored and empty entries are skipped. An
 * argument after `=` is stored under "value", as a float when it parses as
 * one and as a string otherwise.
 *
 * @return The rules, or a ConfigurationError for an entry without a name.
 */
[[nodiscard]] inline std::expected<std::vector<Rule>, Error> ParseRules(
    std::string_view tag) {
    std::vector<Rule> rules;
    while (!tag.empty()) {
        const auto comma = tag.find(',');
        const auto part = Sift::detail::Trim(tag.substr(0, comma));
        tag = comma == std::string_view::npos ? std::string_view{}
                                              : tag.substr(comma + 1);
        if (part.empty()) {
            continue;
        }
        Rule rule;
        if (const auto eq = part.find('='); eq != std::string_view::npos) {
            rule.name = std::string{Sift::detail::Trim(part.substr(0, eq))};
            const auto arg = Sift::detail::Trim(part.substr(eq + 1));
            double number = 0.0;
            const auto [ptr, ec] =
                std::from_chars(arg.data(), arg.data() + arg.size(), number);
            if (!arg.empty() && ec == std::errc{} &&
                ptr == arg.data() + arg.size()) {
                rule.params.emplace("value", number);
            } else {
                rule.params.emplace("value", arg);
            }
        } else {
            rule.name = std::string{part};
        }
        if (rule.name.empty()) {
            return std::unexpected(Error::configuration(
                fmt::format("malformed validation rule \"{}\"", part)));
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

template <fields::Record T>
const RecordMetadata& Metadata();

/// @cond INTERNAL
namespace detail {

template <typename T>
[[nodiscard]] constexpr auto NestedResolver() noexcept
    -> const RecordMetadata& (*)() {
    using Inner = fields::innermost_t<T>;
    if constexpr (fields::Record<Inner>) {
        return &Metadata<Inner>;
    } else {
        return nullptr;
    }
}

template <typename Binding>
[[nodiscard]] FieldMetadata Resolve(const Binding& binding,
                                    std::optional<Error>& error) {
    using FieldT = typename Binding::FieldType;
    static_assert(fields::SupportedField<FieldT>,
                  "unsupported record member type");

    FieldMetadata field;
    field.name = std::string{binding.name};
    field.json_key = binding.json_key.empty() ? field.name
                                              : std::string{binding.json_key};
    field.yaml_key = binding.yaml_key.empty() ? field.json_key
                                              : std::string{binding.yaml_key};
    field.kind = fields::KindOf<FieldT>();
    field.skip = binding.json_key == SkipKey;
    field.optional = fields::is_optional_v<FieldT> ||
                     fields::is_unique_ptr_v<FieldT>;
    field.raw = std::is_same_v<FieldT, RawMessage>;
    field.nested = NestedResolver<FieldT>();

    if (auto rules = ParseRules(binding.rules); rules) {
        field.rules = std::move(*rules);
    } else if (!error) {
        auto err = std::move(rules.error());
        err.message += fmt::format(" on field \"{}\"", field.name);
        err.field = field.name;
        err.field_path = field.name;
        error = std::move(err);
    }
    return field;
}

template <fields::Record T>
[[nodiscard]] RecordMetadata Build() {
    RecordMetadata meta;
    const T prototype{};
    std::apply(
        [&](const auto&... bindings) {
            (meta.fields.push_back(Resolve(bindings, meta.error)), ...);
        },
        prototype.sift_fields());
    if (meta.error) {
        SIFT_LOG_ERROR("record rules rejected: {}", meta.error->message);
    }
    return meta;
}

[[nodiscard]] inline std::optional<Error> CheckReachable(
    const RecordMetadata& meta, std::vector<const RecordMetadata*>& seen) {
    for (const auto* visited : seen) {
        if (visited == &meta) {
            return std::nullopt;
        }
    }
    seen.push_back(&meta);
    if (meta.error) {
        return meta.error;
    }
    for (const auto& field : meta.fields) {
        if (field.nested == nullptr || field.skip) {
            continue;
        }
        if (auto err = CheckReachable(field.nested(), seen)) {
            return err;
        }
    }
    return std::nullopt;
}

}  // namespace detail
/// @endcond

/**
 * @brief Field metadata of a record type, computed once on first use and
 * shared read-only afterwards.
 */
template <fields::Record T>
const RecordMetadata& Metadata() {
    static const RecordMetadata meta = detail::Build<T>();
    return meta;
}

/**
 * @brief Resolves the metadata of @p T and of every record reachable through
 * its members.
 *
 * A malformed rule string otherwise surfaces as a ConfigurationError on each
 * parse or validation of the record; calling this once at startup reports it
 * up front.
 *
 * @return The first configuration error found, or std::nullopt.
 */
template <fields::Record T>
[[nodiscard]] std::optional<Error> CheckRecord() {
    std::vector<const RecordMetadata*> seen;
    return detail::CheckReachable(Metadata<T>(), seen);
}

}  // namespace Sift::messages
