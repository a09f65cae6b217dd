#pragma once

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace Sift {

/**
 * @brief A decoded number.
 *
 * Keeps the exact integer when the source literal is integral and fits in
 * 64 bits, so later widening or narrowing never goes through a float.
 */
struct Number {
    std::string text{};                  ///< Canonical textual form.
    double value{0.0};                   ///< Floating view of the number.
    std::optional<int64_t> as_int{};     ///< Set for integers in int64 range.
    std::optional<uint64_t> as_uint{};   ///< Set for integers above int64 max.

    [[nodiscard]] static Number from_int(int64_t i) {
        return {.text = fmt::format("{}", i),
                .value = static_cast<double>(i),
                .as_int = i};
    }

    [[nodiscard]] static Number from_uint(uint64_t u) {
        if (u <= static_cast<uint64_t>(INT64_MAX)) {
            return from_int(static_cast<int64_t>(u));
        }
        return {.text = fmt::format("{}", u),
                .value = static_cast<double>(u),
                .as_uint = u};
    }

    [[nodiscard]] static Number from_double(double d) {
        return {.text = fmt::format("{}", d), .value = d};
    }

    [[nodiscard]] static Number from_double(double d, std::string text) {
        return {.text = std::move(text), .value = d};
    }

    /**
     * @brief Parses a plain decimal literal (optionally signed, with fraction
     * and exponent) or one of `.inf`, `-.inf`, `.nan`.
     */
    [[nodiscard]] static std::optional<Number> parse(std::string_view text) {
        if (text.empty()) {
            return std::nullopt;
        }
        if (text == ".inf" || text == ".Inf" || text == ".INF" ||
            text == "+.inf" || text == "+.Inf" || text == "+.INF") {
            return from_double(HUGE_VAL, std::string{text});
        }
        if (text == "-.inf" || text == "-.Inf" || text == "-.INF") {
            return from_double(-HUGE_VAL, std::string{text});
        }
        if (text == ".nan" || text == ".NaN" || text == ".NAN") {
            return from_double(std::nan(""), std::string{text});
        }
        std::string_view digits = text;
        if (digits.front() == '+') {
            digits.remove_prefix(1);
        }
        if (digits.empty() ||
            !(std::isdigit(static_cast<unsigned char>(digits.front())) ||
              digits.front() == '-' || digits.front() == '.')) {
            return std::nullopt;
        }
        const char* first = digits.data();
        const char* last = digits.data() + digits.size();

        int64_t i = 0;
        if (auto [ptr, ec] = std::from_chars(first, last, i);
            ec == std::errc{} && ptr == last) {
            return from_int(i);
        }
        uint64_t u = 0;
        if (auto [ptr, ec] = std::from_chars(first, last, u);
            ec == std::errc{} && ptr == last) {
            return from_uint(u);
        }
        double d = 0.0;
        if (auto [ptr, ec] = std::from_chars(first, last, d,
                                             std::chars_format::general);
            ec == std::errc{} && ptr == last && std::isfinite(d)) {
            return from_double(d, std::string{text});
        }
        return std::nullopt;
    }

    [[nodiscard]] bool is_integer() const noexcept {
        return as_int.has_value() || as_uint.has_value();
    }

    /**
     * @brief Numbers compare by exact integer when both are integral,
     * otherwise by floating value.
     */
    [[nodiscard]] bool operator==(const Number& other) const noexcept {
        if (as_int && other.as_int) {
            return *as_int == *other.as_int;
        }
        if (as_uint && other.as_uint) {
            return *as_uint == *other.as_uint;
        }
        return value == other.value;
    }
};

/**
 * @brief A node of the Decoded Value Tree.
 *
 * Format independent: every decoder produces Nodes, and the coercion engine
 * consumes them. Objects keep insertion order with unique keys. Nodes built
 * by the JSON decoder remember the byte span they were decoded from so that
 * raw sub-documents can be captured verbatim.
 */
class Node {
   public:
    using Array = std::vector<Node>;
    using Member = std::pair<std::string, Node>;
    using Object = std::vector<Member>;

    enum class Kind : uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    /**
     * @brief Half-open byte range `[begin, end)` within the decoded input.
     */
    struct Span {
        std::size_t begin{0};
        std::size_t end{0};
    };

    Node() = default;
    Node(std::nullptr_t) noexcept {}
    Node(bool b) : data_{b} {}
    Node(Number n) : data_{std::move(n)} {}

    template <std::integral I>
        requires(!std::same_as<I, bool> && !std::same_as<I, char>)
    Node(I i) {
        if constexpr (std::is_signed_v<I>) {
            data_ = Number::from_int(static_cast<int64_t>(i));
        } else {
            data_ = Number::from_uint(static_cast<uint64_t>(i));
        }
    }

    template <std::floating_point F>
    Node(F f) : data_{Number::from_double(static_cast<double>(f))} {}

    Node(std::string s) : data_{std::move(s)} {}
    Node(std::string_view s) : data_{std::string{s}} {}
    Node(const char* s) : data_{std::string{s}} {}
    Node(Array a) : data_{std::move(a)} {}
    Node(Object o) : data_{std::move(o)} {}

    [[nodiscard]] static Node array() { return Node{Array{}}; }
    [[nodiscard]] static Node object() { return Node{Object{}}; }

    [[nodiscard]] Kind kind() const noexcept {
        return static_cast<Kind>(data_.index());
    }

    [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::Null; }
    [[nodiscard]] bool is_array() const noexcept {
        return kind() == Kind::Array;
    }
    [[nodiscard]] bool is_object() const noexcept {
        return kind() == Kind::Object;
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data_);
    }

    template <typename T>
    [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&data_);
    }

    /**
     * @brief Looks up an object member. Returns nullptr for other kinds.
     */
    [[nodiscard]] const Node* find(std::string_view key) const noexcept {
        if (const auto* obj = get_if<Object>()) {
            for (const auto& [k, v] : *obj) {
                if (k == key) {
                    return &v;
                }
            }
        }
        return nullptr;
    }

    [[nodiscard]] Node* find(std::string_view key) noexcept {
        return const_cast<Node*>(std::as_const(*this).find(key));
    }

    /**
     * @brief Sets an object member, replacing an existing value under the
     * same key in place. Converts a Null node into an empty object first.
     */
    Node& set(std::string key, Node value) {
        if (is_null()) {
            data_ = Object{};
        }
        auto& obj = std::get<Object>(data_);
        for (auto& [k, v] : obj) {
            if (k == key) {
                v = std::move(value);
                return v;
            }
        }
        return obj.emplace_back(std::move(key), std::move(value)).second;
    }

    /**
     * @brief Appends an array element. Converts a Null node into an empty
     * array first.
     */
    Node& push_back(Node value) {
        if (is_null()) {
            data_ = Array{};
        }
        return std::get<Array>(data_).emplace_back(std::move(value));
    }

    [[nodiscard]] std::size_t size() const noexcept {
        if (const auto* arr = get_if<Array>()) {
            return arr->size();
        }
        if (const auto* obj = get_if<Object>()) {
            return obj->size();
        }
        return 0;
    }

    [[nodiscard]] const std::optional<Span>& span() const noexcept {
        return span_;
    }
    void set_span(Span span) noexcept { span_ = span; }

    /**
     * @brief Structural equality. Source spans are not compared.
     */
    [[nodiscard]] bool operator==(const Node& other) const {
        return data_ == other.data_;
    }

   private:
    std::variant<std::monostate, bool, Number, std::string, Array, Object>
        data_;
    std::optional<Span> span_;
};

[[nodiscard]] constexpr std::string_view KindName(Node::Kind kind) noexcept {
    switch (kind) {
        case Node::Kind::Null:
            return "null";
        case Node::Kind::Bool:
            return "boolean";
        case Node::Kind::Number:
            return "number";
        case Node::Kind::String:
            return "string";
        case Node::Kind::Array:
            return "array";
        case Node::Kind::Object:
            return "object";
    }
    return "unknown";
}

}  // namespace Sift
