#pragma once

#include <expected>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_types.hpp>
#include <sift/decode/sift_detect.hpp>
#include <sift/decode/sift_json.hpp>
#include <sift/decode/sift_node.hpp>
#include <sift/decode/sift_yaml.hpp>
#include <string_view>

namespace Sift {

/**
 * @brief Decodes @p bytes in the given format into a Decoded Value Tree.
 *
 * The structure depth limit is read from GetMaxStructureDepth().
 */
[[nodiscard]] inline std::expected<Node, Error> Decode(std::string_view bytes,
                                                       Format format) {
    switch (format) {
        case Format::YAML:
            return yaml::Decode(bytes);
        case Format::JSON:
            return json::Decode(bytes);
    }
    return std::unexpected(Error::decode(format, "unsupported format"));
}

/**
 * @brief Decodes @p bytes in the format reported by DetectFormat().
 */
[[nodiscard]] inline std::expected<Node, Error> Decode(std::string_view bytes) {
    return Decode(bytes, DetectFormat(bytes));
}

}  // namespace Sift
