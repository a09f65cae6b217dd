#pragma once

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/core/sift_time.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/decode/sift_encode.hpp>
#include <sift/decode/sift_node.hpp>
#include <sift/fields/sift_raw.hpp>
#include <sift/fields/sift_traits.hpp>
#include <sift/messages/sift_metadata.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

/**
 * @brief Type Coercion Engine: populates typed values from a Node tree.
 *
 * Coercion is lenient across kinds (strings to numbers, numbers to booleans,
 * numbers and strings to timestamps) but every lenient path has a single
 * failure condition. Failures are collected per field into the Context so
 * that independent fields are all reported in one pass.
 */
namespace Sift::coerce {

/**
 * @brief State of one coercion call.
 */
struct Context {
    Format format{DefaultFormat};  ///< Selects the per-format member keys.
    std::string_view source{};     ///< Decoded input, for raw captures.
    int64_t max_depth{DefaultMaxValidationDepth};
    ErrorList errors{};
};

/// @cond INTERNAL
namespace detail {

[[nodiscard]] inline std::string JoinPath(std::string_view parent,
                                          std::string_view child) {
    if (parent.empty()) {
        return std::string{child};
    }
    return fmt::format("{}.{}", parent, child);
}

[[nodiscard]] inline std::string IndexPath(std::string_view parent,
                                           std::size_t index) {
    return fmt::format("{}[{}]", parent, index);
}

[[nodiscard]] inline bool PathIsSensitive(std::string_view path) {
    for (const auto segment : Sift::detail::PathSegments(path)) {
        if (IsSensitiveField(segment)) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Quotes offending input for a message, or hides it when the field is
 * sensitive.
 */
[[nodiscard]] inline std::string Shown(std::string_view path,
                                       std::string_view text) {
    if (PathIsSensitive(path)) {
        return std::string{RedactedValue};
    }
    return fmt::format("\"{}\"", text);
}

/**
 * @brief Scalar snapshot of an offending node, attached to coercion errors.
 * Containers are not copied.
 */
[[nodiscard]] inline Value NodeValue(const Node& node) {
    switch (node.kind()) {
        case Node::Kind::Bool:
            return Value{*node.get_if<bool>()};
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            if (n.as_int) {
                return Value{*n.as_int};
            }
            if (n.as_uint) {
                return Value{*n.as_uint};
            }
            return Value{n.value};
        }
        case Node::Kind::String:
            return Value{*node.get_if<std::string>()};
        case Node::Kind::Null:
        case Node::Kind::Array:
        case Node::Kind::Object:
            break;
    }
    return Value{};
}

[[nodiscard]] inline std::string Lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

template <typename T>
using Result = std::expected<T, std::string>;

[[nodiscard]] inline Result<bool> ToBool(const Node& node,
                                         std::string_view path) {
    switch (node.kind()) {
        case Node::Kind::Bool:
            return *node.get_if<bool>();
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            if (n.as_int && (*n.as_int == 0 || *n.as_int == 1)) {
                return *n.as_int == 1;
            }
            if (!n.is_integer() && (n.value == 0.0 || n.value == 1.0)) {
                return n.value == 1.0;
            }
            return std::unexpected(fmt::format(
                "cannot coerce number {} to bool", Shown(path, n.text)));
        }
        case Node::Kind::String: {
            const auto& s = *node.get_if<std::string>();
            const auto lowered = Lower(s);
            if (lowered == "true" || lowered == "1" || lowered == "yes") {
                return true;
            }
            if (lowered == "false" || lowered == "0" || lowered == "no") {
                return false;
            }
            return std::unexpected(fmt::format("cannot parse string {} as bool",
                                               Shown(path, s)));
        }
        case Node::Kind::Null:
        case Node::Kind::Array:
        case Node::Kind::Object:
            break;
    }
    return std::unexpected(
        fmt::format("cannot coerce {} to bool", KindName(node.kind())));
}

template <fields::Integer I>
[[nodiscard]] Result<I> NarrowSigned(int64_t v, std::string_view path) {
    if constexpr (std::is_signed_v<I>) {
        if (v < std::numeric_limits<I>::min() ||
            v > std::numeric_limits<I>::max()) {
            return std::unexpected(
                fmt::format("value {} out of range for {}",
                            Shown(path, fmt::format("{}", v)),
                            fields::TypeName<I>()));
        }
    } else {
        if (v < 0) {
            return std::unexpected(fmt::format(
                "negative value cannot be coerced to {}", fields::TypeName<I>()));
        }
        if (static_cast<uint64_t>(v) > std::numeric_limits<I>::max()) {
            return std::unexpected(
                fmt::format("value {} out of range for {}",
                            Shown(path, fmt::format("{}", v)),
                            fields::TypeName<I>()));
        }
    }
    return static_cast<I>(v);
}

template <fields::Integer I>
[[nodiscard]] Result<I> NarrowUnsigned(uint64_t v, std::string_view path) {
    if (v > static_cast<uint64_t>(std::numeric_limits<I>::max())) {
        return std::unexpected(fmt::format("value {} out of range for {}",
                                           Shown(path, fmt::format("{}", v)),
                                           fields::TypeName<I>()));
    }
    return static_cast<I>(v);
}

/**
 * @brief Truncates a float toward zero into an integer type, failing on
 * non-finite and out-of-range values.
 */
template <fields::Integer I>
[[nodiscard]] Result<I> Truncate(double v, std::string_view text,
                                 std::string_view path) {
    if (!std::isfinite(v)) {
        return std::unexpected(
            fmt::format("cannot coerce non-finite number to {}",
                        fields::TypeName<I>()));
    }
    const double limit = std::ldexp(1.0, std::numeric_limits<I>::digits);
    if constexpr (std::is_signed_v<I>) {
        if (std::trunc(v) < -limit || v >= limit) {
            return std::unexpected(
                fmt::format("value {} out of range for {}", Shown(path, text),
                            fields::TypeName<I>()));
        }
    } else {
        if (v < 0) {
            return std::unexpected(fmt::format(
                "negative value cannot be coerced to {}", fields::TypeName<I>()));
        }
        if (v >= limit) {
            return std::unexpected(
                fmt::format("value {} out of range for {}", Shown(path, text),
                            fields::TypeName<I>()));
        }
    }
    return static_cast<I>(std::trunc(v));
}

template <fields::Integer I>
[[nodiscard]] Result<I> ParseInteger(std::string_view s,
                                     std::string_view path) {
    std::string_view digits = s;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    if (!digits.empty() && digits.front() == '-') {
        int64_t v = 0;
        const auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec == std::errc{} && ptr == last) {
            return NarrowSigned<I>(v, path);
        }
        if (ec == std::errc::result_out_of_range && ptr == last) {
            return std::unexpected(
                fmt::format("value {} out of range for {}", Shown(path, s),
                            fields::TypeName<I>()));
        }
    } else if (!digits.empty()) {
        uint64_t v = 0;
        const auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec == std::errc{} && ptr == last) {
            return NarrowUnsigned<I>(v, path);
        }
        if (ec == std::errc::result_out_of_range && ptr == last) {
            return std::unexpected(
                fmt::format("value {} out of range for {}", Shown(path, s),
                            fields::TypeName<I>()));
        }
    }
    return std::unexpected(
        fmt::format("cannot parse string {} as integer", Shown(path, s)));
}

template <fields::Integer I>
[[nodiscard]] Result<I> ToInteger(const Node& node, std::string_view path) {
    switch (node.kind()) {
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            if (n.as_int) {
                return NarrowSigned<I>(*n.as_int, path);
            }
            if (n.as_uint) {
                return NarrowUnsigned<I>(*n.as_uint, path);
            }
            return Truncate<I>(n.value, n.text, path);
        }
        case Node::Kind::String:
            return ParseInteger<I>(*node.get_if<std::string>(), path);
        case Node::Kind::Bool:
            return static_cast<I>(*node.get_if<bool>() ? 1 : 0);
        case Node::Kind::Null:
        case Node::Kind::Array:
        case Node::Kind::Object:
            break;
    }
    return std::unexpected(fmt::format("cannot coerce {} to {}",
                                       KindName(node.kind()),
                                       fields::TypeName<I>()));
}

template <std::floating_point F>
[[nodiscard]] Result<F> NarrowFloat(double v, std::string_view text,
                                    std::string_view path) {
    if constexpr (sizeof(F) < sizeof(double)) {
        if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<F>::max()) {
            return std::unexpected(
                fmt::format("value {} out of range for {}", Shown(path, text),
                            fields::TypeName<F>()));
        }
    }
    return static_cast<F>(v);
}

/**
 * @brief Parses a floating literal. `NaN`, `Inf` and `Infinity` (any case,
 * optionally signed) are accepted as their non-finite values.
 */
template <std::floating_point F>
[[nodiscard]] Result<F> ParseFloat(std::string_view s, std::string_view path) {
    std::string_view digits = s;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    double v = 0.0;
    const char* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), last, v,
                                           std::chars_format::general);
    if (!digits.empty() && ec == std::errc{} && ptr == last) {
        return NarrowFloat<F>(v, s, path);
    }
    if (ec == std::errc::result_out_of_range && ptr == last) {
        return std::unexpected(
            fmt::format("value {} out of range for {}", Shown(path, s),
                        fields::TypeName<F>()));
    }
    return std::unexpected(
        fmt::format("cannot parse string {} as float", Shown(path, s)));
}

template <std::floating_point F>
[[nodiscard]] Result<F> ToFloat(const Node& node, std::string_view path) {
    switch (node.kind()) {
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            return NarrowFloat<F>(n.value, n.text, path);
        }
        case Node::Kind::String:
            return ParseFloat<F>(*node.get_if<std::string>(), path);
        case Node::Kind::Bool:
            return static_cast<F>(*node.get_if<bool>() ? 1.0 : 0.0);
        case Node::Kind::Null:
        case Node::Kind::Array:
        case Node::Kind::Object:
            break;
    }
    return std::unexpected(fmt::format("cannot coerce {} to {}",
                                       KindName(node.kind()),
                                       fields::TypeName<F>()));
}

/**
 * @brief Canonical text of a number: decimal for integers, the shortest
 * round-tripping form for floats.
 */
[[nodiscard]] inline std::string NumberText(const Number& n) {
    if (n.as_int) {
        return fmt::format("{}", *n.as_int);
    }
    if (n.as_uint) {
        return fmt::format("{}", *n.as_uint);
    }
    return fmt::format("{}", n.value);
}

[[nodiscard]] inline Result<std::string> ToString(const Node& node) {
    switch (node.kind()) {
        case Node::Kind::String:
            return *node.get_if<std::string>();
        case Node::Kind::Number:
            return NumberText(*node.get_if<Number>());
        case Node::Kind::Bool:
            return std::string{*node.get_if<bool>() ? "true" : "false"};
        case Node::Kind::Null:
        case Node::Kind::Array:
        case Node::Kind::Object:
            break;
    }
    return std::unexpected(
        fmt::format("cannot coerce {} to string", KindName(node.kind())));
}

[[nodiscard]] inline Result<Timestamp> ToTimestamp(const Node& node,
                                                   std::string_view path) {
    switch (node.kind()) {
        case Node::Kind::String: {
            const auto& s = *node.get_if<std::string>();
            if (auto ts = time::ParseTimestamp(s)) {
                return *ts;
            }
            return std::unexpected(fmt::format(
                "cannot parse string {} as timestamp using standard formats",
                Shown(path, s)));
        }
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            if (n.as_int && *n.as_int >= time::MinUnixSeconds &&
                *n.as_int <= time::MaxUnixSeconds) {
                return time::FromUnixSeconds(*n.as_int);
            }
            if (!n.is_integer() && std::isfinite(n.value) &&
                n.value >= static_cast<double>(time::MinUnixSeconds) &&
                n.value < static_cast<double>(time::MaxUnixSeconds + 1)) {
                return time::FromUnixSeconds(n.value);
            }
            return std::unexpected(
                fmt::format("value {} out of range for timestamp",
                            Shown(path, n.text)));
        }
        case Node::Kind::Bool:
        case Node::Kind::Null:
        case Node::Kind::Array:
        case Node::Kind::Object:
            break;
    }
    return std::unexpected(
        fmt::format("cannot coerce {} to timestamp", KindName(node.kind())));
}

inline void Fail(Context& ctx, std::string_view path, const Node& node,
                 std::string message) {
    ctx.errors.add(Error::coercion(path, std::move(message), NodeValue(node)));
}

[[nodiscard]] inline bool CheckDepth(Context& ctx, std::string_view path,
                                     int64_t depth) {
    if (depth > ctx.max_depth) {
        SIFT_LOG_DEBUG("coercion stopped at depth {}", depth);
        ctx.errors.add(Error::depth_exceeded(
            path,
            fmt::format("maximum validation depth {} exceeded", ctx.max_depth)));
        return false;
    }
    return true;
}

/**
 * @brief Stores a scalar result or records its failure.
 */
template <typename T>
bool Assign(Result<T>&& result, T& out, Context& ctx, std::string_view path,
            const Node& node) {
    if (!result) {
        Fail(ctx, path, node, std::move(result.error()));
        return false;
    }
    out = std::move(*result);
    return true;
}

}  // namespace detail
/// @endcond

template <typename T>
bool Coerce(const Node& node, T& out, std::string_view path, int64_t depth,
            Context& ctx);

/**
 * @brief Populates a record from an object node, one member at a time.
 *
 * Missing keys leave members at their default value. Every member is
 * attempted even after a failure so that all errors are reported.
 */
template <fields::Record T>
bool CoerceRecord(const Node& node, T& out, std::string_view path,
                  int64_t depth, Context& ctx) {
    const auto& meta = messages::Metadata<T>();
    if (meta.error) {
        ctx.errors.add(*meta.error);
        return false;
    }
    if (!detail::CheckDepth(ctx, path, depth)) {
        return false;
    }
    if (!node.is_object()) {
        detail::Fail(ctx, path, node,
                     "cannot parse non-object data into record");
        return false;
    }
    bool ok = true;
    std::size_t index = 0;
    std::apply(
        [&](const auto&... bindings) {
            (
                [&](const auto& binding) {
                    const auto& field = meta.fields[index++];
                    if (field.skip) {
                        return;
                    }
                    const Node* child = node.find(field.key(ctx.format));
                    if (child == nullptr) {
                        return;
                    }
                    if (!Coerce(*child, binding.value,
                                detail::JoinPath(path, field.name), depth + 1,
                                ctx)) {
                        ok = false;
                    }
                }(bindings),
                ...);
        },
        out.sift_fields());
    return ok;
}

/**
 * @brief Converts @p node into @p out.
 *
 * @param node Source node.
 * @param out Destination, expected to hold its default value.
 * @param path Dotted path of the destination, used in errors.
 * @param depth Nesting depth of the destination.
 * @param ctx Call state collecting errors.
 * @return false if any error was recorded for this value or its children.
 */
template <typename T>
bool Coerce(const Node& node, T& out, std::string_view path, int64_t depth,
            Context& ctx) {
    constexpr auto Kind = fields::KindOf<T>();
    using fields::FieldKind;

    if constexpr (Kind == FieldKind::Bool || Kind == FieldKind::Int ||
                  Kind == FieldKind::Uint || Kind == FieldKind::Float ||
                  Kind == FieldKind::String || Kind == FieldKind::Time) {
        if (node.is_null()) {
            out = T{};
            return true;
        }
    }

    if constexpr (Kind == FieldKind::Bool) {
        return detail::Assign(detail::ToBool(node, path), out, ctx, path, node);
    } else if constexpr (Kind == FieldKind::Int || Kind == FieldKind::Uint) {
        return detail::Assign(detail::ToInteger<T>(node, path), out, ctx, path,
                              node);
    } else if constexpr (Kind == FieldKind::Float) {
        return detail::Assign(detail::ToFloat<T>(node, path), out, ctx, path,
                              node);
    } else if constexpr (Kind == FieldKind::String) {
        return detail::Assign(detail::ToString(node), out, ctx, path, node);
    } else if constexpr (Kind == FieldKind::Time) {
        return detail::Assign(detail::ToTimestamp(node, path), out, ctx, path,
                              node);
    } else if constexpr (Kind == FieldKind::Optional) {
        if (node.is_null()) {
            out.reset();
            return true;
        }
        typename T::value_type inner{};
        const bool ok = Coerce(node, inner, path, depth, ctx);
        out = std::move(inner);
        return ok;
    } else if constexpr (Kind == FieldKind::Pointer) {
        if (node.is_null()) {
            out.reset();
            return true;
        }
        auto inner = std::make_unique<typename T::element_type>();
        const bool ok = Coerce(node, *inner, path, depth, ctx);
        out = std::move(inner);
        return ok;
    } else if constexpr (Kind == FieldKind::Sequence) {
        if (node.is_null()) {
            out.clear();
            return true;
        }
        if (!detail::CheckDepth(ctx, path, depth)) {
            return false;
        }
        const auto* items = node.get_if<Node::Array>();
        if (items == nullptr) {
            detail::Fail(ctx, path, node,
                         "cannot parse non-array data into sequence");
            return false;
        }
        out.clear();
        out.reserve(items->size());
        bool ok = true;
        for (std::size_t i = 0; i < items->size(); ++i) {
            typename T::value_type item{};
            if (!Coerce((*items)[i], item, detail::IndexPath(path, i),
                        depth + 1, ctx)) {
                ok = false;
            }
            out.push_back(std::move(item));
        }
        return ok;
    } else if constexpr (Kind == FieldKind::FixedArray) {
        if (node.is_null()) {
            return true;
        }
        if (!detail::CheckDepth(ctx, path, depth)) {
            return false;
        }
        const auto* items = node.get_if<Node::Array>();
        if (items == nullptr) {
            detail::Fail(ctx, path, node,
                         "cannot parse non-array data into sequence");
            return false;
        }
        if (items->size() != out.size()) {
            detail::Fail(ctx, path, node,
                         fmt::format("array length mismatch: expected {} "
                                     "elements, got {}",
                                     out.size(), items->size()));
            return false;
        }
        bool ok = true;
        for (std::size_t i = 0; i < items->size(); ++i) {
            if (!Coerce((*items)[i], out[i], detail::IndexPath(path, i),
                        depth + 1, ctx)) {
                ok = false;
            }
        }
        return ok;
    } else if constexpr (Kind == FieldKind::Map) {
        if (node.is_null()) {
            out.clear();
            return true;
        }
        if (!detail::CheckDepth(ctx, path, depth)) {
            return false;
        }
        const auto* members = node.get_if<Node::Object>();
        if (members == nullptr) {
            detail::Fail(ctx, path, node,
                         "cannot parse non-object data into map");
            return false;
        }
        out.clear();
        bool ok = true;
        for (const auto& [key, value] : *members) {
            typename T::mapped_type item{};
            if (!Coerce(value, item, detail::JoinPath(path, key), depth + 1,
                        ctx)) {
                ok = false;
            }
            out.insert_or_assign(key, std::move(item));
        }
        return ok;
    } else if constexpr (Kind == FieldKind::Record) {
        if (node.is_null()) {
            return true;
        }
        return CoerceRecord(node, out, path, depth, ctx);
    } else if constexpr (Kind == FieldKind::Raw) {
        if (const auto& span = node.span();
            span && span->end <= ctx.source.size()) {
            out.assign(ctx.source.substr(span->begin, span->end - span->begin));
            return true;
        }
        auto encoded = Encode(node, Format::JSON);
        if (!encoded) {
            ctx.errors.add(std::move(encoded.error()));
            return false;
        }
        out.assign(*encoded);
        return true;
    } else if constexpr (Kind == FieldKind::Node) {
        out = node;
        return true;
    } else {
        static_assert(fields::SupportedField<T>, "unsupported member type");
        return false;
    }
}

}  // namespace Sift::coerce
