#pragma once

#include <sift/fields/sift_traits.hpp>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace Sift::messages {

/**
 * @brief Binding of one record member to its source keys and rule string.
 *
 * Produced by SIFT_FIELD / SIFT_FIELD_YAML inside SIFT_RECORD_FIELDS. Holds a
 * reference to the member, so bindings are only valid while the record is.
 *
 * @tparam T The member type, const-qualified for const records.
 */
template <typename T>
struct FieldRef {
    using FieldType = std::remove_const_t<T>;

    T& value;
    std::string_view name;      ///< Member identifier.
    std::string_view json_key;  ///< Key in JSON input. Empty means `name`.
    std::string_view yaml_key;  ///< Key in YAML input. Empty means json_key.
    std::string_view rules;     ///< Comma-separated validation rules.
};

template <typename T>
[[nodiscard]] constexpr FieldRef<T> Bind(T& member, std::string_view name,
                                         std::string_view key,
                                         std::string_view rules = {}) noexcept {
    return {member, name, key, {}, rules};
}

template <typename T>
[[nodiscard]] constexpr FieldRef<T> BindYaml(T& member, std::string_view name,
                                             std::string_view json_key,
                                             std::string_view yaml_key,
                                             std::string_view rules = {}) noexcept {
    return {member, name, json_key, yaml_key, rules};
}

/**
 * @brief Key marking a member as excluded from decoding and validation.
 */
inline constexpr std::string_view SkipKey = "-";

}  // namespace Sift::messages

/**
 * @brief Binds a member: `SIFT_FIELD(member, "key")` or
 * `SIFT_FIELD(member, "key", "required,min=3")`.
 */
#define SIFT_FIELD(member, ...) \
    ::Sift::messages::Bind(member, #member, __VA_ARGS__)

/**
 * @brief Binds a member with a distinct YAML key:
 * `SIFT_FIELD_YAML(member, "json_key", "yaml_key", "rules")`.
 */
#define SIFT_FIELD_YAML(member, ...) \
    ::Sift::messages::BindYaml(member, #member, __VA_ARGS__)

/**
 * @brief Macro to declare the reflected members of a record.
 *
 * Generates `sift_fields()` methods (const and non-const) returning a tuple
 * of member bindings, in declaration order.
 *
 * @param ... SIFT_FIELD / SIFT_FIELD_YAML bindings.
 */
#define SIFT_RECORD_FIELDS(...)                                           \
    auto sift_fields() const { return std::make_tuple(__VA_ARGS__); }     \
    auto sift_fields() { return std::make_tuple(__VA_ARGS__); }
