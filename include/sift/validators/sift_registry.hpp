#pragma once

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sift/core/sift_error.hpp>
#include <sift/core/sift_log.hpp>
#include <sift/core/sift_value.hpp>
#include <sift/validators/sift_validator.hpp>
#include <sift/validators/sift_validators.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Sift::validators {

/**
 * @brief Name-keyed table of validators.
 *
 * Each name holds up to three entries, one per registration class. Lookup
 * prefers a cross-field function, then a single-field function, then a
 * factory; within a class the latest registration replaces the previous one.
 * Registration and lookup may run concurrently.
 */
class Registry {
   public:
    /**
     * @brief Creates a registry holding the built-in validators.
     */
    Registry() {
        (void)register_factory("required", [](const Params&) {
            return std::make_shared<const Required>();
        });
        (void)register_factory("min", [](const Params& params) {
            return std::make_shared<const Min>(NumericParam(params));
        });
        (void)register_factory("max", [](const Params& params) {
            return std::make_shared<const Max>(NumericParam(params));
        });
        (void)register_factory("email", [](const Params&) {
            return std::make_shared<const Email>();
        });
        (void)register_factory("length", [](const Params& params) {
            return std::make_shared<const Length>(
                static_cast<int64_t>(NumericParam(params)));
        });
        (void)register_factory("alpha", [](const Params&) {
            return std::make_shared<const Alpha>();
        });
        (void)register_factory("alphanum", [](const Params&) {
            return std::make_shared<const Alphanum>();
        });
    }

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief The process-wide registry used by the free pipeline functions.
     */
    [[nodiscard]] static Registry& Default() {
        static Registry registry;
        return registry;
    }

    [[nodiscard]] std::optional<Error> register_factory(std::string name,
                                                        Factory factory) {
        if (auto err = check(name, static_cast<bool>(factory))) {
            return err;
        }
        SIFT_LOG_DEBUG("registered validator factory \"{}\"", name);
        std::unique_lock lock{mutex_};
        entries_[std::move(name)].factory = std::move(factory);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Error> register_func(std::string name,
                                                     ValidatorFunc fn) {
        if (auto err = check(name, static_cast<bool>(fn))) {
            return err;
        }
        SIFT_LOG_DEBUG("registered validator function \"{}\"", name);
        std::unique_lock lock{mutex_};
        entries_[std::move(name)].func = std::move(fn);
        return std::nullopt;
    }

    /**
     * @brief Registers a cross-field function. It shadows any factory or
     * single-field function of the same name.
     */
    [[nodiscard]] std::optional<Error> register_cross_field(std::string name,
                                                            CrossFieldFunc fn) {
        if (auto err = check(name, static_cast<bool>(fn))) {
            return err;
        }
        SIFT_LOG_DEBUG("registered cross-field validator \"{}\"", name);
        std::unique_lock lock{mutex_};
        entries_[std::move(name)].cross = std::move(fn);
        return std::nullopt;
    }

    /**
     * @brief Instantiates the validator registered under @p name.
     * @return The validator, or nullptr when the name is unknown.
     */
    [[nodiscard]] ValidatorPtr create(std::string_view name,
                                      const Params& params = {}) const {
        Entry entry;
        {
            std::shared_lock lock{mutex_};
            const auto it = entries_.find(name);
            if (it == entries_.end()) {
                return nullptr;
            }
            entry = it->second;
        }
        if (entry.cross) {
            return std::make_shared<const CrossFieldValidator>(
                std::string{name}, std::move(entry.cross), params);
        }
        if (entry.func) {
            return std::make_shared<const FuncValidator>(
                std::string{name}, std::move(entry.func), params);
        }
        return entry.factory(params);
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        std::shared_lock lock{mutex_};
        return entries_.find(name) != entries_.end();
    }

    /**
     * @brief Registered names in ascending order.
     */
    [[nodiscard]] std::vector<std::string> list() const {
        std::shared_lock lock{mutex_};
        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            names.push_back(name);
        }
        return names;
    }

   private:
    struct Entry {
        Factory factory;
        ValidatorFunc func;
        CrossFieldFunc cross;
    };

    [[nodiscard]] static std::optional<Error> check(std::string_view name,
                                                    bool callable) {
        if (name.empty()) {
            return Error::configuration("validator name cannot be empty");
        }
        if (!callable) {
            return Error::configuration(
                fmt::format("validator \"{}\" has no callable", name));
        }
        return std::nullopt;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry, std::less<>> entries_;
};

/**
 * @brief Registers a single-field function on the default registry.
 */
[[nodiscard]] inline std::optional<Error> RegisterGlobalFunc(std::string name,
                                                             ValidatorFunc fn) {
    return Registry::Default().register_func(std::move(name), std::move(fn));
}

/**
 * @brief Registers a cross-field function on the default registry.
 */
[[nodiscard]] inline std::optional<Error> RegisterGlobalCrossField(
    std::string name, CrossFieldFunc fn) {
    return Registry::Default().register_cross_field(std::move(name),
                                                    std::move(fn));
}

}  // namespace Sift::validators
