#pragma once

#include <yaml-cpp/yaml.h>

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/decode/sift_node.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace Sift::yaml {

/// @cond INTERNAL
namespace detail {

inline constexpr std::string_view StrTag = "tag:yaml.org,2002:str";

// Aliases are shared by yaml-cpp but expanded on conversion, so the number of
// converted nodes is bounded by the larger of these two.
inline constexpr std::size_t MinNodeBudget = 400'000;
inline constexpr std::size_t NodesPerInputByte = 16;

[[nodiscard]] constexpr std::size_t NodeBudget(std::size_t input_size) noexcept {
    return std::max(MinNodeBudget, input_size * NodesPerInputByte);
}

[[nodiscard]] inline bool IsNullLiteral(std::string_view s) noexcept {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

/**
 * @brief Resolves a scalar the way the YAML 1.2 core schema does: quoted or
 * explicitly `!!str`-tagged scalars stay strings, plain scalars may be null,
 * booleans or numbers.
 */
[[nodiscard]] inline Node ResolveScalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    const std::string& tag = node.Tag();
    if (tag == "!" || tag == StrTag) {
        return Node{text};
    }
    if (IsNullLiteral(text)) {
        return Node{};
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return Node{true};
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return Node{false};
    }
    if (auto number = Number::parse(text)) {
        return Node{std::move(*number)};
    }
    return Node{text};
}

[[nodiscard]] inline std::optional<std::size_t> Offset(const YAML::Mark& mark) {
    if (mark.is_null() || mark.pos < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(mark.pos);
}

/**
 * @brief Converts a yaml-cpp node tree into a Node tree.
 *
 * Fails once more than @p max_nodes nodes have been produced, which only an
 * alias-heavy document can reach.
 */
class Converter {
   public:
    Converter(int64_t max_depth, std::size_t max_nodes) noexcept
        : max_depth_{max_depth}, max_nodes_{max_nodes} {}

    [[nodiscard]] std::expected<Node, Error> convert(const YAML::Node& node,
                                                     int64_t depth) {
        if (++nodes_ > max_nodes_) {
            SIFT_LOG_DEBUG("yaml document rejected: more than {} nodes",
                           max_nodes_);
            return std::unexpected(
                Error::decode(Format::YAML, "document contains excessive aliasing",
                              Offset(node.Mark())));
        }
        switch (node.Type()) {
            case YAML::NodeType::Undefined:
            case YAML::NodeType::Null:
                return Node{};
            case YAML::NodeType::Scalar:
                return ResolveScalar(node);
            case YAML::NodeType::Sequence: {
                if (auto err = enter(depth, node)) {
                    return std::unexpected(std::move(*err));
                }
                Node out = Node::array();
                for (const auto& item : node) {
                    auto child = convert(item, depth + 1);
                    if (!child) {
                        return child;
                    }
                    out.push_back(std::move(*child));
                }
                return out;
            }
            case YAML::NodeType::Map: {
                if (auto err = enter(depth, node)) {
                    return std::unexpected(std::move(*err));
                }
                Node out = Node::object();
                for (const auto& entry : node) {
                    if (!entry.first.IsScalar()) {
                        return std::unexpected(Error::decode(
                            Format::YAML, "mapping keys must be scalars",
                            Offset(entry.first.Mark())));
                    }
                    auto child = convert(entry.second, depth + 1);
                    if (!child) {
                        return child;
                    }
                    out.set(entry.first.Scalar(), std::move(*child));
                }
                return out;
            }
        }
        return Node{};
    }

   private:
    [[nodiscard]] std::optional<Error> enter(int64_t depth,
                                             const YAML::Node& node) const {
        if (max_depth_ > 0 && depth + 1 > max_depth_) {
            SIFT_LOG_DEBUG("yaml document rejected: structure depth over {}",
                           max_depth_);
            auto err = Error::depth_exceeded(
                "",
                fmt::format("maximum structure depth {} exceeded", max_depth_));
            err.offset = Offset(node.Mark());
            return err;
        }
        return std::nullopt;
    }

    int64_t max_depth_;
    std::size_t max_nodes_;
    std::size_t nodes_{0};
};

}  // namespace detail
/// @endcond

/**
 * @brief Decodes the first YAML document in @p bytes into a Node tree.
 *
 * Tokenizer exceptions are converted into DecodeErrors carrying the byte
 * offset reported by yaml-cpp. An empty document decodes to Null.
 *
 * @note YAML nodes carry no source span, so raw captures of YAML input are
 * re-encoded as JSON.
 */
[[nodiscard]] inline std::expected<Node, Error> Decode(std::string_view bytes,
                                                       int64_t max_depth) {
    YAML::Node document;
    try {
        document = YAML::Load(std::string{bytes});
    } catch (const YAML::Exception& ex) {
        SIFT_LOG_DEBUG("yaml decode failed: {}", ex.msg);
        return std::unexpected(
            Error::decode(Format::YAML, ex.msg, detail::Offset(ex.mark)));
    }
    try {
        return detail::Converter{max_depth, detail::NodeBudget(bytes.size())}
            .convert(document, 0);
    } catch (const YAML::Exception& ex) {
        return std::unexpected(
            Error::decode(Format::YAML, ex.msg, detail::Offset(ex.mark)));
    }
}

[[nodiscard]] inline std::expected<Node, Error> Decode(std::string_view bytes) {
    return Decode(bytes, GetMaxStructureDepth());
}

}  // namespace Sift::yaml
