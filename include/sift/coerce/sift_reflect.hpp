#pragma once

#include <cstdint>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_time.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/decode/sift_json.hpp>
#include <sift/decode/sift_node.hpp>
#include <sift/fields/sift_raw.hpp>
#include <sift/fields/sift_traits.hpp>
#include <sift/messages/sift_metadata.hpp>
#include <string>
#include <tuple>
#include <utility>

/**
 * @brief Reverse direction of the coercion engine: typed values back into
 * Values (for validation and reports) and Nodes (for serialization).
 */
namespace Sift::coerce {

/// @cond INTERNAL
namespace detail {

[[nodiscard]] inline Value NodeToValue(const Node& node) {
    switch (node.kind()) {
        case Node::Kind::Null:
            return Value{};
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
        case Node::Kind::Array: {
            Value::Sequence seq;
            for (const auto& item : *node.get_if<Node::Array>()) {
                seq.push_back(NodeToValue(item));
            }
            return Value{std::move(seq)};
        }
        case Node::Kind::Object: {
            Value::Mapping map;
            for (const auto& [key, item] : *node.get_if<Node::Object>()) {
                map.emplace_back(key, NodeToValue(item));
            }
            return Value{std::move(map)};
        }
    }
    return Value{};
}

}  // namespace detail
/// @endcond

/**
 * @brief Snapshot of a typed value as a Value.
 *
 * Records become mappings keyed by member name. Nesting deeper than
 * @p max_depth is cut off as Null.
 */
template <typename T>
[[nodiscard]] Value ToValue(const T& v, int64_t depth, int64_t max_depth) {
    constexpr auto Kind = fields::KindOf<T>();
    using fields::FieldKind;

    if constexpr (Kind == FieldKind::Bool || Kind == FieldKind::Int ||
                  Kind == FieldKind::Uint || Kind == FieldKind::Float ||
                  Kind == FieldKind::String || Kind == FieldKind::Time) {
        return Value{v};
    } else if constexpr (Kind == FieldKind::Optional ||
                         Kind == FieldKind::Pointer) {
        if (!v) {
            return Value{};
        }
        return ToValue(*v, depth, max_depth);
    } else if constexpr (Kind == FieldKind::Raw) {
        return Value{v.bytes()};
    } else if constexpr (Kind == FieldKind::Node) {
        return detail::NodeToValue(v);
    } else {
        if (depth > max_depth) {
            return Value{};
        }
        if constexpr (Kind == FieldKind::Sequence ||
                      Kind == FieldKind::FixedArray) {
            Value::Sequence seq;
            seq.reserve(v.size());
            for (const auto& item : v) {
                seq.push_back(ToValue(item, depth + 1, max_depth));
            }
            return Value{std::move(seq)};
        } else if constexpr (Kind == FieldKind::Map) {
            Value::Mapping map;
            map.reserve(v.size());
            for (const auto& [key, item] : v) {
                map.emplace_back(key, ToValue(item, depth + 1, max_depth));
            }
            return Value{std::move(map)};
        } else {
            static_assert(Kind == FieldKind::Record, "unsupported member type");
            Value::Mapping map;
            std::apply(
                [&](const auto&... bindings) {
                    (map.emplace_back(std::string{bindings.name},
                                      ToValue(bindings.value, depth + 1,
                                              max_depth)),
                     ...);
                },
                v.sift_fields());
            return Value{std::move(map)};
        }
    }
}

template <typename T>
[[nodiscard]] Value ToValue(const T& v) {
    return ToValue(v, 0, GetMaxValidationDepth());
}

/**
 * @brief Builds the Node tree a typed value serializes to, using the member
 * keys of @p format. Timestamps become RFC3339 strings and raw captures are
 * re-parsed as JSON (an empty or unparseable capture becomes null).
 */
template <typename T>
[[nodiscard]] Node ToNode(const T& v, Format format) {
    constexpr auto Kind = fields::KindOf<T>();
    using fields::FieldKind;

    if constexpr (Kind == FieldKind::Bool || Kind == FieldKind::Int ||
                  Kind == FieldKind::Uint || Kind == FieldKind::Float ||
                  Kind == FieldKind::String) {
        return Node{v};
    } else if constexpr (Kind == FieldKind::Time) {
        return Node{time::FormatTimestamp(v)};
    } else if constexpr (Kind == FieldKind::Optional ||
                         Kind == FieldKind::Pointer) {
        if (!v) {
            return Node{};
        }
        return ToNode(*v, format);
    } else if constexpr (Kind == FieldKind::Sequence ||
                         Kind == FieldKind::FixedArray) {
        Node out = Node::array();
        for (const auto& item : v) {
            out.push_back(ToNode(item, format));
        }
        return out;
    } else if constexpr (Kind == FieldKind::Map) {
        Node out = Node::object();
        for (const auto& [key, item] : v) {
            out.set(key, ToNode(item, format));
        }
        return out;
    } else if constexpr (Kind == FieldKind::Raw) {
        if (v.empty()) {
            return Node{};
        }
        auto parsed = json::Decode(v.view(), 0);
        return parsed ? std::move(*parsed) : Node{};
    } else if constexpr (Kind == FieldKind::Node) {
        return v;
    } else {
        static_assert(Kind == FieldKind::Record, "unsupported member type");
        const auto& meta = messages::Metadata<T>();
        Node out = Node::object();
        std::size_t index = 0;
        std::apply(
            [&](const auto&... bindings) {
                (
                    [&](const auto& binding) {
                        const auto& field = meta.fields[index++];
                        if (!field.skip) {
                            out.set(field.key(format),
                                    ToNode(binding.value, format));
                        }
                    }(bindings),
                    ...);
            },
            v.sift_fields());
        return out;
    }
}

}  // namespace Sift::coerce
