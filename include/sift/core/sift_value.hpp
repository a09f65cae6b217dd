#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <sift/core/sift_time.hpp>
#include <sift/core/sift_types.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Sift {

/**
 * @brief Type-erased snapshot of a coerced field value.
 *
 * Validators, cross-field validators and error reports work on Values so
 * that a rule can be written once for every member type. Records and keyed
 * containers become mappings; optional and pointer members become the
 * pointee's Value or Null when unset.
 */
class Value {
   public:
    using Sequence = std::vector<Value>;
    using Entry = std::pair<std::string, Value>;
    using Mapping = std::vector<Entry>;

    enum class Kind : uint8_t {
        Null,
        Bool,
        Int,
        Uint,
        Float,
        String,
        Time,
        Sequence,
        Mapping,
    };

    Value() = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) : data_{b} {}

    template <std::integral I>
        requires(!std::same_as<I, bool> && !std::same_as<I, char>)
    Value(I i) {
        if constexpr (std::is_signed_v<I>) {
            data_ = static_cast<int64_t>(i);
        } else {
            data_ = static_cast<uint64_t>(i);
        }
    }

    template <std::floating_point F>
    Value(F f) : data_{static_cast<double>(f)} {}

    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(Timestamp t) : data_{t} {}
    Value(Sequence s) : data_{std::move(s)} {}
    Value(Mapping m) : data_{std::move(m)} {}

    [[nodiscard]] Kind kind() const noexcept {
        return static_cast<Kind>(data_.index());
    }

    [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::Null; }
    [[nodiscard]] bool is_string() const noexcept {
        return kind() == Kind::String;
    }
    [[nodiscard]] bool is_number() const noexcept {
        return kind() == Kind::Int || kind() == Kind::Uint ||
               kind() == Kind::Float;
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data_);
    }

    /**
     * @brief Numeric view of Int, Uint and Float values.
     */
    [[nodiscard]] std::optional<double> as_double() const noexcept {
        if (const auto* i = get_if<int64_t>()) {
            return static_cast<double>(*i);
        }
        if (const auto* u = get_if<uint64_t>()) {
            return static_cast<double>(*u);
        }
        if (const auto* d = get_if<double>()) {
            return *d;
        }
        return std::nullopt;
    }

    /**
     * @brief Length of a String (bytes), Sequence or Mapping.
     */
    [[nodiscard]] std::optional<std::size_t> length() const noexcept {
        if (const auto* s = get_if<std::string>()) {
            return s->size();
        }
        if (const auto* seq = get_if<Sequence>()) {
            return seq->size();
        }
        if (const auto* map = get_if<Mapping>()) {
            return map->size();
        }
        return std::nullopt;
    }

    /**
     * @brief True for Null, numeric zero, empty strings and containers, and
     * the zero timestamp. `false` is a present value and is not zero.
     */
    [[nodiscard]] bool is_zero() const noexcept {
        switch (kind()) {
            case Kind::Null:
                return true;
            case Kind::Bool:
                return false;
            case Kind::Int:
                return *get_if<int64_t>() == 0;
            case Kind::Uint:
                return *get_if<uint64_t>() == 0;
            case Kind::Float:
                return *get_if<double>() == 0.0;
            case Kind::Time:
                return time::IsZero(*get_if<Timestamp>());
            case Kind::String:
            case Kind::Sequence:
            case Kind::Mapping:
                return length().value_or(0) == 0;
        }
        return false;
    }

    /**
     * @brief Looks up an entry of a Mapping by key.
     */
    [[nodiscard]] const Value* find(std::string_view key) const noexcept {
        if (const auto* map = get_if<Mapping>()) {
            for (const auto& [k, v] : *map) {
                if (k == key) {
                    return &v;
                }
            }
        }
        return nullptr;
    }

    [[nodiscard]] bool operator==(const Value& other) const = default;

   private:
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string,
                 Timestamp, Sequence, Mapping>
        data_;
};

/**
 * @brief Validator parameters keyed by name. Rule strings store their
 * argument under "value".
 */
using Params = std::map<std::string, Value, std::less<>>;

/**
 * @brief Renders a Value as JSON. Timestamps become RFC3339 strings and
 * non-finite floats become null.
 */
inline void to_json(nlohmann::ordered_json& j, const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            j = nullptr;
            return;
        case Value::Kind::Bool:
            j = *value.get_if<bool>();
            return;
        case Value::Kind::Int:
            j = *value.get_if<int64_t>();
            return;
        case Value::Kind::Uint:
            j = *value.get_if<uint64_t>();
            return;
        case Value::Kind::Float:
            j = *value.get_if<double>();
            return;
        case Value::Kind::String:
            j = *value.get_if<std::string>();
            return;
        case Value::Kind::Time:
            j = time::FormatTimestamp(*value.get_if<Timestamp>());
            return;
        case Value::Kind::Sequence: {
            j = nlohmann::ordered_json::array();
            for (const auto& item : *value.get_if<Value::Sequence>()) {
                nlohmann::ordered_json element;
                to_json(element, item);
                j.push_back(std::move(element));
            }
            return;
        }
        case Value::Kind::Mapping: {
            j = nlohmann::ordered_json::object();
            for (const auto& [key, item] : *value.get_if<Value::Mapping>()) {
                to_json(j[key], item);
            }
            return;
        }
    }
}

}  // namespace Sift
