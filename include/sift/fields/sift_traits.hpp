#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <sift/core/sift_types.hpp>
#include <sift/decode/sift_node.hpp>
#include <sift/fields/sift_raw.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace Sift::fields {

/**
 * @brief Concept identifying a record type: default constructible with
 * `sift_fields()` accessors generated by SIFT_RECORD_FIELDS.
 */
template <typename T>
concept Record = std::default_initializable<T> && requires(T& t, const T& c) {
    t.sift_fields();
    c.sift_fields();
};

template <typename T>
concept Integer = std::integral<T> && !std::same_as<T, bool> &&
                  !std::same_as<T, char> && !std::same_as<T, char8_t> &&
                  !std::same_as<T, char16_t> && !std::same_as<T, char32_t> &&
                  !std::same_as<T, wchar_t>;

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T>
struct is_unique_ptr : std::false_type {};

template <typename T>
struct is_unique_ptr<std::unique_ptr<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_unique_ptr_v = is_unique_ptr<T>::value;

template <typename T>
struct is_vector : std::false_type {};

template <typename T>
struct is_vector<std::vector<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

template <typename T>
struct is_std_array : std::false_type {};

template <typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T>
inline constexpr bool is_std_array_v = is_std_array<T>::value;

/**
 * @brief Keyed containers with string keys.
 */
template <typename T>
struct is_string_map : std::false_type {};

template <typename T>
struct is_string_map<std::map<std::string, T>> : std::true_type {};

template <typename T>
struct is_string_map<std::unordered_map<std::string, T>> : std::true_type {};

template <typename T>
inline constexpr bool is_string_map_v = is_string_map<T>::value;

/**
 * @brief The element type reached by unwrapping optionals, pointers and
 * containers.
 */
template <typename T>
struct innermost {
    using type = T;
};

template <typename T>
struct innermost<std::optional<T>> : innermost<T> {};

template <typename T>
struct innermost<std::unique_ptr<T>> : innermost<T> {};

template <typename T>
struct innermost<std::vector<T>> : innermost<T> {};

template <typename T, std::size_t N>
struct innermost<std::array<T, N>> : innermost<T> {};

template <typename T>
struct innermost<std::map<std::string, T>> : innermost<T> {};

template <typename T>
struct innermost<std::unordered_map<std::string, T>> : innermost<T> {};

template <typename T>
using innermost_t = typename innermost<T>::type;

/**
 * @brief Whether a member of type T may hold a nested record.
 */
template <typename T>
inline constexpr bool contains_record_v = Record<innermost_t<T>>;

/**
 * @brief Shape of a member type as seen by the coercion engine.
 */
enum class FieldKind : uint8_t {
    Unsupported = 0,
    Bool,
    Int,
    Uint,
    Float,
    String,
    Time,
    Optional,
    Pointer,
    Sequence,
    FixedArray,
    Map,
    Record,
    Raw,
    Node,
};

template <typename T>
[[nodiscard]] consteval FieldKind KindOf() noexcept {
    if constexpr (std::same_as<T, bool>) {
        return FieldKind::Bool;
    } else if constexpr (Integer<T> && std::is_signed_v<T>) {
        return FieldKind::Int;
    } else if constexpr (Integer<T>) {
        return FieldKind::Uint;
    } else if constexpr (std::floating_point<T>) {
        return FieldKind::Float;
    } else if constexpr (std::same_as<T, std::string>) {
        return FieldKind::String;
    } else if constexpr (std::same_as<T, Timestamp>) {
        return FieldKind::Time;
    } else if constexpr (is_optional_v<T>) {
        return FieldKind::Optional;
    } else if constexpr (is_unique_ptr_v<T>) {
        return FieldKind::Pointer;
    } else if constexpr (is_vector_v<T>) {
        return FieldKind::Sequence;
    } else if constexpr (is_std_array_v<T>) {
        return FieldKind::FixedArray;
    } else if constexpr (is_string_map_v<T>) {
        return FieldKind::Map;
    } else if constexpr (std::same_as<T, RawMessage>) {
        return FieldKind::Raw;
    } else if constexpr (std::same_as<T, Node>) {
        return FieldKind::Node;
    } else if constexpr (Record<T>) {
        return FieldKind::Record;
    } else {
        return FieldKind::Unsupported;
    }
}

/**
 * @brief Concept for member types the coercion engine can populate.
 */
template <typename T>
concept SupportedField = (KindOf<T>() != FieldKind::Unsupported);

/**
 * @brief Display name of a scalar member type, used in range errors.
 */
template <typename T>
[[nodiscard]] consteval std::string_view TypeName() noexcept {
    if constexpr (std::same_as<T, bool>) {
        return "bool";
    } else if constexpr (std::floating_point<T>) {
        return sizeof(T) == 4 ? "float32" : "float64";
    } else if constexpr (Integer<T> && std::is_signed_v<T>) {
        switch (sizeof(T)) {
            case 1:
                return "int8";
            case 2:
                return "int16";
            case 4:
                return "int32";
            default:
                return "int64";
        }
    } else if constexpr (Integer<T>) {
        switch (sizeof(T)) {
            case 1:
                return "uint8";
            case 2:
                return "uint16";
            case 4:
                return "uint32";
            default:
                return "uint64";
        }
    } else if constexpr (std::same_as<T, std::string>) {
        return "string";
    } else if constexpr (std::same_as<T, Timestamp>) {
        return "timestamp";
    } else {
        return "value";
    }
}

}  // namespace Sift::fields
