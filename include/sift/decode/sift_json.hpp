#pragma once

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <sift/core/sift_config.hpp>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/decode/sift_node.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Sift::json {

/// @cond INTERNAL
namespace detail {

/**
 * @brief Keeps the last value of every duplicated key at the position of its
 * first occurrence.
 */
inline void DedupeLastWins(Node::Object& object) {
    if (object.size() < 2) {
        return;
    }
    std::unordered_map<std::string_view, std::size_t> first_seen;
    first_seen.reserve(object.size());
    bool duplicates = false;
    for (std::size_t i = 0; i < object.size(); ++i) {
        auto [it, inserted] = first_seen.try_emplace(object[i].first, i);
        if (!inserted) {
            duplicates = true;
        }
    }
    if (!duplicates) {
        return;
    }
    Node::Object unique;
    unique.reserve(first_seen.size());
    std::unordered_map<std::string, std::size_t> slot;
    for (auto& [key, value] : object) {
        if (auto it = slot.find(key); it != slot.end()) {
            unique[it->second].second = std::move(value);
        } else {
            slot.emplace(key, unique.size());
            unique.emplace_back(std::move(key), std::move(value));
        }
    }
    object = std::move(unique);
}

/**
 * @brief SAX consumer building a Node tree and enforcing the structure depth
 * limit while the document is tokenized.
 */
class TreeBuilder {
   public:
    using number_integer_t = nlohmann::json::number_integer_t;
    using number_unsigned_t = nlohmann::json::number_unsigned_t;
    using number_float_t = nlohmann::json::number_float_t;
    using string_t = nlohmann::json::string_t;
    using binary_t = nlohmann::json::binary_t;

    explicit TreeBuilder(int64_t max_depth) noexcept : max_depth_{max_depth} {}

    bool null() { return emit(Node{}); }
    bool boolean(bool b) { return emit(Node{b}); }
    bool number_integer(number_integer_t i) {
        return emit(Node{Number::from_int(i)});
    }
    bool number_unsigned(number_unsigned_t u) {
        return emit(Node{Number::from_uint(u)});
    }
    bool number_float(number_float_t f, const string_t& text) {
        return emit(Node{Number::from_double(f, text)});
    }
    bool string(string_t& s) { return emit(Node{std::move(s)}); }
    bool binary(binary_t& /*unused*/) {
        error_ = Error::decode(Format::JSON, "binary values are not supported");
        return false;
    }

    bool start_object(std::size_t /*unused*/) {
        return open(Node::object());
    }
    bool key(string_t& k) {
        pending_keys_.push_back(std::move(k));
        return true;
    }
    bool end_object() {
        if (auto* obj = stack_.back().get_if<Node::Object>()) {
            DedupeLastWins(*obj);
        }
        return close();
    }
    bool start_array(std::size_t /*unused*/) { return open(Node::array()); }
    bool end_array() { return close(); }

    bool parse_error(std::size_t position, const std::string& /*last_token*/,
                     const nlohmann::detail::exception& ex) {
        error_ = Error::decode(Format::JSON, Describe(ex.what()), position);
        return false;
    }

    [[nodiscard]] std::optional<Error>& error() noexcept { return error_; }
    [[nodiscard]] Node& root() noexcept { return root_; }

   private:
    /**
     * @brief Strips the exception id, location prefix and the echoed input
     * token from a tokenizer message.
     */
    [[nodiscard]] static std::string Describe(std::string_view what) {
        if (const auto bracket = what.find("] "); bracket != std::string_view::npos) {
            what.remove_prefix(bracket + 2);
        }
        if (what.starts_with("parse error")) {
            if (const auto colon = what.find(": ");
                colon != std::string_view::npos) {
                what.remove_prefix(colon + 2);
            }
        }
        if (const auto echo = what.find("; last read");
            echo != std::string_view::npos) {
            what = what.substr(0, echo);
        }
        return std::string{what};
    }

    bool emit(Node node) {
        if (stack_.empty()) {
            root_ = std::move(node);
            return true;
        }
        Node& parent = stack_.back();
        if (parent.is_object()) {
            parent.get_if<Node::Object>()->emplace_back(
                std::move(pending_keys_.back()), std::move(node));
            pending_keys_.pop_back();
        } else {
            parent.get_if<Node::Array>()->push_back(std::move(node));
        }
        return true;
    }

    bool open(Node container) {
        if (max_depth_ > 0 &&
            static_cast<int64_t>(stack_.size()) + 1 > max_depth_) {
            error_ = Error::depth_exceeded(
                "", fmt::format("maximum structure depth {} exceeded",
                                max_depth_));
            SIFT_LOG_DEBUG("json document rejected: structure depth over {}",
                           max_depth_);
            return false;
        }
        stack_.push_back(std::move(container));
        return true;
    }

    bool close() {
        Node done = std::move(stack_.back());
        stack_.pop_back();
        return emit(std::move(done));
    }

    int64_t max_depth_;
    std::vector<Node> stack_;
    std::vector<std::string> pending_keys_;
    Node root_;
    std::optional<Error> error_;
};

/**
 * @brief Walks already validated JSON text alongside its tree, recording the
 * byte span of every node.
 *
 * @p node may be null while skipping over a value that did not survive into
 * the tree (an earlier occurrence of a duplicated key).
 */
class SpanScanner {
   public:
    explicit SpanScanner(std::string_view text) noexcept : text_{text} {}

    void scan(Node* node) {
        skip_ws();
        const std::size_t begin = pos_;
        if (pos_ >= text_.size()) {
            return;
        }
        switch (text_[pos_]) {
            case '{':
                scan_object(node && node->is_object() ? node : nullptr);
                break;
            case '[':
                scan_array(node && node->is_array() ? node : nullptr);
                break;
            case '"':
                skip_string();
                break;
            default:
                skip_scalar();
                break;
        }
        if (node != nullptr) {
            node->set_span({begin, pos_});
        }
    }

   private:
    void skip_ws() noexcept {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    std::string_view skip_string() noexcept {
        const std::size_t begin = ++pos_;
        while (pos_ < text_.size() && text_[pos_] != '"') {
            pos_ += text_[pos_] == '\\' ? 2 : 1;
        }
        const auto body = text_.substr(begin, pos_ - begin);
        ++pos_;
        return body;
    }

    // The tree stores keys unescaped, so `"\u0061"` must be looked up as `a`.
    [[nodiscard]] static std::string unescape(std::string_view quoted) {
        const auto end = quoted.find_last_of('"');
        const auto key = nlohmann::json::parse(quoted.substr(0, end + 1),
                                               nullptr, false);
        if (!key.is_string()) {
            return {};
        }
        return key.get<std::string>();
    }

    void skip_scalar() noexcept {
        while (pos_ < text_.size() && text_[pos_] != ',' &&
               text_[pos_] != ']' && text_[pos_] != '}' &&
               text_[pos_] != ' ' && text_[pos_] != '\t' &&
               text_[pos_] != '\n' && text_[pos_] != '\r') {
            ++pos_;
        }
    }

    void scan_object(Node* node) {
        ++pos_;
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return;
        }
        while (pos_ < text_.size()) {
            skip_ws();
            const std::size_t key_begin = pos_;
            const auto raw_key = skip_string();
            skip_ws();
            ++pos_;  // ':'
            Node* child = nullptr;
            if (node != nullptr) {
                if (raw_key.find('\\') == std::string_view::npos) {
                    child = node->find(raw_key);
                } else {
                    child = node->find(
                        unescape(text_.substr(key_begin, pos_ - key_begin - 1)));
                }
            }
            scan(child);
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            ++pos_;  // '}'
            return;
        }
    }

    void scan_array(Node* node) {
        ++pos_;
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return;
        }
        auto* elements = node ? node->get_if<Node::Array>() : nullptr;
        std::size_t index = 0;
        while (pos_ < text_.size()) {
            Node* child = nullptr;
            if (elements != nullptr && index < elements->size()) {
                child = &(*elements)[index];
            }
            scan(child);
            ++index;
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            ++pos_;  // ']'
            return;
        }
    }

    std::string_view text_;
    std::size_t pos_{0};
};

}  // namespace detail
/// @endcond

/**
 * @brief Decodes JSON text into a Node tree.
 *
 * Every node of the result carries its byte span within @p bytes.
 *
 * @param bytes The JSON document.
 * @param max_depth Structure depth limit, `0` for none.
 * @return The tree, or a DecodeError (with byte offset) for malformed input,
 * or a DepthExceeded error for documents nested deeper than @p max_depth.
 */
[[nodiscard]] inline std::expected<Node, Error> Decode(std::string_view bytes,
                                                       int64_t max_depth) {
    detail::TreeBuilder builder{max_depth};
    const bool ok =
        nlohmann::json::sax_parse(bytes.begin(), bytes.end(), &builder);
    if (!ok || builder.error()) {
        auto err = builder.error().value_or(
            Error::decode(Format::JSON, "invalid document"));
        SIFT_LOG_DEBUG("json decode failed: {}", err.message);
        return std::unexpected(std::move(err));
    }
    Node root = std::move(builder.root());
    detail::SpanScanner{bytes}.scan(&root);
    return root;
}

[[nodiscard]] inline std::expected<Node, Error> Decode(std::string_view bytes) {
    return Decode(bytes, GetMaxStructureDepth());
}

}  // namespace Sift::json
