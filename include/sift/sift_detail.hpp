#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <sift/coerce/sift_coerce.hpp>
#include <sift/coerce/sift_reflect.hpp>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/decode/sift_decode.hpp>
#include <sift/decode/sift_detect.hpp>
#include <sift/fields/sift_traits.hpp>
#include <sift/messages/sift_metadata.hpp>
#include <sift/validators/sift_registry.hpp>
#include <sift/validators/sift_validator.hpp>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

/**
 * @brief Internal implementation details for Sift's public API.
 */
namespace Sift::detail {

/**
 * @brief State of one validation pass.
 */
struct ValidationState {
    const validators::Registry& registry;
    int64_t max_depth;
    ErrorList errors{};
};

/**
 * @brief Forward declaration of ValidateRecord to enable recursion in
 * ValidateNested.
 */
template <fields::Record T>
void ValidateRecord(const T& record, std::string_view path, int64_t depth,
                    ValidationState& state);

/**
 * @brief Descends into the records reachable through a member: directly,
 * through an optional or pointer, or as elements of a container.
 */
template <typename T>
void ValidateNested(const T& value, std::string_view path, int64_t depth,
                    ValidationState& state) {
    constexpr auto Kind = fields::KindOf<T>();
    using fields::FieldKind;

    if constexpr (Kind == FieldKind::Record) {
        ValidateRecord(value, path, depth, state);
    } else if constexpr (Kind == FieldKind::Optional ||
                         Kind == FieldKind::Pointer) {
        if (value) {
            ValidateNested(*value, path, depth, state);
        }
    } else if constexpr (Kind == FieldKind::Sequence ||
                         Kind == FieldKind::FixedArray) {
        std::size_t index = 0;
        for (const auto& item : value) {
            ValidateNested(item, coerce::detail::IndexPath(path, index++),
                           depth + 1, state);
        }
    } else if constexpr (Kind == FieldKind::Map) {
        for (const auto& [key, item] : value) {
            ValidateNested(item, coerce::detail::JoinPath(path, key), depth + 1,
                           state);
        }
    }
}

/**
 * @brief Binds a validator's error to the member it was declared on.
 */
inline void Attach(Error& err, const messages::FieldMetadata& field,
                   const messages::Rule& rule, std::string_view path,
                   const Value& value) {
    err.code = ErrorCode::ValidationFailed;
    err.field = field.name;
    err.field_path = coerce::detail::JoinPath(path, field.name);
    if (err.rule.empty()) {
        err.rule = rule.name;
    }
    if (err.value.is_null()) {
        err.value = value;
    }
}

/**
 * @brief Runs every declared rule of every member of @p record, then
 * descends into nested records. Never stops at the first failure.
 *
 * Rules naming an unknown validator are skipped; the first one seen for a
 * record type is logged.
 */
template <fields::Record T>
void ValidateRecord(const T& record, std::string_view path, int64_t depth,
                    ValidationState& state) {
    const auto& meta = messages::Metadata<T>();
    if (meta.error) {
        state.errors.add(*meta.error);
        return;
    }
    if (depth > state.max_depth) {
        SIFT_LOG_DEBUG("validation stopped at depth {}", depth);
        state.errors.add(Error::depth_exceeded(
            path, fmt::format("maximum validation depth {} exceeded",
                              state.max_depth)));
        return;
    }

    const Value snapshot = coerce::ToValue(record, depth, state.max_depth);
    const validators::RecordView view{snapshot};
    static std::atomic<bool> warned{false};

    std::size_t index = 0;
    std::apply(
        [&](const auto&... bindings) {
            (
                [&](const auto& binding) {
                    const auto& field = meta.fields[index++];
                    if (field.skip) {
                        return;
                    }
                    const Value* value = snapshot.find(field.name);
                    const Value empty{};
                    const Value& current = value != nullptr ? *value : empty;
                    for (const auto& rule : field.rules) {
                        const auto validator =
                            state.registry.create(rule.name, rule.params);
                        if (!validator) {
                            if (!warned.exchange(true)) {
                                SIFT_LOG_WARN(
                                    "unknown validator \"{}\" on field \"{}\" "
                                    "ignored",
                                    rule.name, field.name);
                            }
                            continue;
                        }
                        auto err =
                            validator->validate(field.name, current, view);
                        if (err) {
                            Attach(*err, field, rule, path, current);
                            state.errors.add(std::move(*err));
                        }
                    }
                    using FieldT =
                        typename std::decay_t<decltype(binding)>::FieldType;
                    if constexpr (fields::contains_record_v<FieldT>) {
                        ValidateNested(
                            binding.value,
                            coerce::detail::JoinPath(path, field.name),
                            depth + 1, state);
                    }
                }(bindings),
                ...);
        },
        record.sift_fields());
}

/**
 * @brief Validation Engine entry point for any supported top-level type.
 */
template <typename T>
[[nodiscard]] std::optional<ErrorList> Validate(
    const T& value, const validators::Registry& registry) {
    if constexpr (fields::contains_record_v<T>) {
        ValidationState state{.registry = registry,
                              .max_depth = GetMaxValidationDepth()};
        ValidateNested(value, "", 0, state);
        if (!state.errors.empty()) {
            return std::move(state.errors);
        }
    }
    return std::nullopt;
}

/**
 * @brief The decode, coerce and validate pipeline.
 *
 * @param bytes The input document.
 * @param format The format, or std::nullopt to detect it.
 * @param registry Registry resolving rule names.
 */
template <typename T>
[[nodiscard]] std::expected<T, ErrorList> ParseInto(
    std::string_view bytes, std::optional<Format> format,
    const validators::Registry& registry) {
    static_assert(fields::SupportedField<T>, "unsupported target type");

    if (const auto limit = GetMaxInputSize();
        limit > 0 && bytes.size() > static_cast<std::size_t>(limit)) {
        SIFT_LOG_DEBUG("rejected input of {} bytes", bytes.size());
        return std::unexpected(
            ErrorList{Error::input_too_large(bytes.size(), limit)});
    }

    const Format resolved = format.value_or(DetectFormat(bytes));
    auto tree = Sift::Decode(bytes, resolved);
    if (!tree) {
        SIFT_LOG_DEBUG("{} decode failed", FormatName(resolved));
        return std::unexpected(ErrorList{std::move(tree.error())});
    }

    T out{};
    coerce::Context ctx{.format = resolved,
                        .source = bytes,
                        .max_depth = GetMaxValidationDepth()};
    coerce::Coerce(*tree, out, "", 0, ctx);
    if (!ctx.errors.empty()) {
        return std::unexpected(std::move(ctx.errors));
    }

    if (auto errors = Validate(out, registry)) {
        return std::unexpected(std::move(*errors));
    }
    return out;
}

}  // namespace Sift::detail
