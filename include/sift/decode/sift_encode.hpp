#pragma once

#include <yaml-cpp/yaml.h>

#include <fmt/core.h>

#include <cmath>
#include <expected>
#include <nlohmann/json.hpp>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/decode/sift_node.hpp>
#include <string>
#include <utility>

namespace Sift {

/// @cond INTERNAL
namespace detail {

[[nodiscard]] inline nlohmann::ordered_json ToJson(const Node& node) {
    switch (node.kind()) {
        case Node::Kind::Null:
            return nullptr;
        case Node::Kind::Bool:
            return *node.get_if<bool>();
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            if (n.as_int) {
                return *n.as_int;
            }
            if (n.as_uint) {
                return *n.as_uint;
            }
            return n.value;
        }
        case Node::Kind::String:
            return *node.get_if<std::string>();
        case Node::Kind::Array: {
            auto out = nlohmann::ordered_json::array();
            for (const auto& item : *node.get_if<Node::Array>()) {
                out.push_back(ToJson(item));
            }
            return out;
        }
        case Node::Kind::Object: {
            auto out = nlohmann::ordered_json::object();
            for (const auto& [key, item] : *node.get_if<Node::Object>()) {
                out[key] = ToJson(item);
            }
            return out;
        }
    }
    return nullptr;
}

inline void EmitYaml(YAML::Emitter& out, const Node& node) {
    switch (node.kind()) {
        case Node::Kind::Null:
            out << YAML::Null;
            return;
        case Node::Kind::Bool:
            out << *node.get_if<bool>();
            return;
        case Node::Kind::Number: {
            const auto& n = *node.get_if<Number>();
            if (n.is_integer()) {
                out << n.text;
            } else if (std::isnan(n.value)) {
                out << ".nan";
            } else if (std::isinf(n.value)) {
                out << (n.value > 0 ? ".inf" : "-.inf");
            } else {
                // Shortest text that reads back as the same double.
                out << fmt::format("{}", n.value);
            }
            return;
        }
        case Node::Kind::String:
            out << YAML::DoubleQuoted << *node.get_if<std::string>();
            return;
        case Node::Kind::Array:
            out << YAML::BeginSeq;
            for (const auto& item : *node.get_if<Node::Array>()) {
                EmitYaml(out, item);
            }
            out << YAML::EndSeq;
            return;
        case Node::Kind::Object:
            out << YAML::BeginMap;
            for (const auto& [key, item] : *node.get_if<Node::Object>()) {
                out << YAML::Key << key << YAML::Value;
                EmitYaml(out, item);
            }
            out << YAML::EndMap;
            return;
    }
}

}  // namespace detail
/// @endcond

/**
 * @brief Renders a Node tree as text in the given format.
 *
 * JSON output is compact. YAML output uses block style with plain keys and
 * every string value double-quoted, so strings that look like numbers or
 * booleans read back as strings.
 */
[[nodiscard]] inline std::expected<std::string, Error> Encode(const Node& node,
                                                              Format format) {
    if (format == Format::YAML) {
        YAML::Emitter out;
        detail::EmitYaml(out, node);
        if (!out.good()) {
            return std::unexpected(Error::decode(
                Format::YAML, fmt::format("cannot emit document: {}",
                                          out.GetLastError())));
        }
        return std::string{out.c_str(), out.size()};
    }
    return detail::ToJson(node).dump();
}

}  // namespace Sift
