#pragma once

#include <fmt/core.h>

#include <charconv>
#include <functional>
#include <memory>
#include <optional>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_value.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace Sift::validators {

/**
 * @brief Read-only view of the record that encloses a validated field.
 */
class RecordView {
   public:
    explicit RecordView(const Value& record) noexcept : record_{record} {}

    /**
     * @brief A sibling member by name, or nullptr if the record has none.
     */
    [[nodiscard]] const Value* field(std::string_view name) const noexcept {
        return record_.find(name);
    }

    [[nodiscard]] const Value& record() const noexcept { return record_; }

   private:
    const Value& record_;
};

/**
 * @brief A named, parameterized rule.
 *
 * Parameters are bound when the validator is created; a Validator holds no
 * per-call state and may be shared across threads.
 */
class Validator {
   public:
    virtual ~Validator() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    /**
     * @brief Checks a single value.
     * @param field Member name of the value.
     * @param value The value.
     * @return std::nullopt on success, or a validation Error.
     */
    [[nodiscard]] virtual std::optional<Error> validate(
        std::string_view field, const Value& value) const = 0;

    /**
     * @brief Checks a value with access to its enclosing record. Single-field
     * validators ignore the record.
     */
    [[nodiscard]] virtual std::optional<Error> validate(
        std::string_view field, const Value& value,
        const RecordView& /*record*/) const {
        return validate(field, value);
    }

    /**
     * @brief Whether the validator needs the enclosing record.
     */
    [[nodiscard]] virtual bool requires_record() const noexcept {
        return false;
    }
};

using ValidatorPtr = std::shared_ptr<const Validator>;

/**
 * @brief Builds a validator from rule parameters.
 */
using Factory = std::function<ValidatorPtr(const Params&)>;

/**
 * @brief Single-field custom rule.
 */
using ValidatorFunc = std::function<std::optional<Error>(
    std::string_view field, const Value& value, const Params& params)>;

/**
 * @brief Cross-field custom rule, given read access to the whole record.
 */
using CrossFieldFunc = std::function<std::optional<Error>(
    std::string_view field, const Value& value, const RecordView& record,
    const Params& params)>;

/**
 * @brief Validator backed by a registered single-field function.
 */
class FuncValidator final : public Validator {
   public:
    FuncValidator(std::string name, ValidatorFunc fn, Params params)
        : name_{std::move(name)},
          fn_{std::move(fn)},
          params_{std::move(params)} {}

    [[nodiscard]] const std::string& name() const noexcept override {
        return name_;
    }

    using Validator::validate;
    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        return fn_(field, value, params_);
    }

   private:
    std::string name_;
    ValidatorFunc fn_;
    Params params_;
};

/**
 * @brief Validator backed by a registered cross-field function.
 *
 * Called without a record it fails rather than passing.
 */
class CrossFieldValidator final : public Validator {
   public:
    CrossFieldValidator(std::string name, CrossFieldFunc fn, Params params)
        : name_{std::move(name)},
          fn_{std::move(fn)},
          params_{std::move(params)} {}

    [[nodiscard]] const std::string& name() const noexcept override {
        return name_;
    }

    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value) const override {
        return Error::validation(
            field, name_,
            fmt::format("cross-field validator \"{}\" requires full record "
                        "context and cannot validate a single field",
                        name_),
            value);
    }

    [[nodiscard]] std::optional<Error> validate(
        std::string_view field, const Value& value,
        const RecordView& record) const override {
        return fn_(field, value, record, params_);
    }

    [[nodiscard]] bool requires_record() const noexcept override {
        return true;
    }

   private:
    std::string name_;
    CrossFieldFunc fn_;
    Params params_;
};

/**
 * @brief Numeric rule parameter, or @p fallback when it is missing or not
 * numeric. String parameters that parse as numbers are accepted.
 */
[[nodiscard]] inline double NumericParam(const Params& params,
                                         std::string_view key = "value",
                                         double fallback = 0.0) {
    const auto it = params.find(key);
    if (it == params.end()) {
        return fallback;
    }
    if (auto d = it->second.as_double()) {
        return *d;
    }
    if (const auto* s = it->second.get_if<std::string>()) {
        double d = 0.0;
        const char* last = s->data() + s->size();
        const auto [ptr, ec] = std::from_chars(s->data(), last, d);
        if (!s->empty() && ec == std::errc{} && ptr == last) {
            return d;
        }
    }
    return fallback;
}

/**
 * @brief String rule parameter, or an empty string.
 */
[[nodiscard]] inline std::string StringParam(const Params& params,
                                             std::string_view key = "value") {
    const auto it = params.find(key);
    if (it == params.end()) {
        return {};
    }
    if (const auto* s = it->second.get_if<std::string>()) {
        return *s;
    }
    if (auto d = it->second.as_double()) {
        return fmt::format("{}", *d);
    }
    return {};
}

}  // namespace Sift::validators
