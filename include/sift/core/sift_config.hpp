#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <sift/core/sift_log.hpp>
#include <sift/core/sift_types.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Sift {

/**
 * @brief Process-wide tunables shared by every pipeline call.
 *
 * Integer limits are atomics, so a read racing a write observes either the
 * old or the new value. The sensitive-field pattern list is guarded by a
 * reader/writer lock and handed out by copy. Changes apply to calls that
 * start after the write.
 */
class Settings {
   public:
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    [[nodiscard]] static Settings& Instance() {
        static Settings settings;
        return settings;
    }

    // cppcheck-suppress unusedStructMember
    std::atomic<int64_t> max_input_size{DefaultMaxInputSize};
    // cppcheck-suppress unusedStructMember
    std::atomic<int64_t> max_cache_size{DefaultMaxCacheSize};
    // cppcheck-suppress unusedStructMember
    std::atomic<int64_t> max_validation_depth{DefaultMaxValidationDepth};
    // cppcheck-suppress unusedStructMember
    std::atomic<int64_t> max_structure_depth{DefaultMaxStructureDepth};

    [[nodiscard]] std::vector<std::string> patterns() const {
        const std::shared_lock lock{mutex_};
        return patterns_;
    }

    void set_patterns(std::vector<std::string> patterns) {
        const std::unique_lock lock{mutex_};
        patterns_ = std::move(patterns);
    }

    void add_pattern(std::string pattern) {
        const std::unique_lock lock{mutex_};
        patterns_.push_back(std::move(pattern));
    }

    /**
     * @brief Case-insensitive substring match of @p name against every
     * pattern. Empty patterns never match.
     */
    [[nodiscard]] bool matches(std::string_view name) const {
        const std::string lowered = Lower(name);
        const std::shared_lock lock{mutex_};
        return std::any_of(patterns_.begin(), patterns_.end(),
                           [&](const std::string& pattern) {
                               return !pattern.empty() &&
                                      lowered.find(Lower(pattern)) !=
                                          std::string::npos;
                           });
    }

    [[nodiscard]] static std::vector<std::string> DefaultPatterns() {
        return {"password", "passwd",  "secret",  "token",
                "key",      "credential", "auth", "api_key",
                "apikey",   "private", "bearer"};
    }

   private:
    Settings() : patterns_{DefaultPatterns()} {}

    [[nodiscard]] static std::string Lower(std::string_view text) {
        std::string out{text};
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    mutable std::shared_mutex mutex_;
    std::vector<std::string> patterns_;
};

/**
 * @brief Maximum accepted input length in bytes. `0` disables the check.
 */
[[nodiscard]] inline int64_t GetMaxInputSize() noexcept {
    return Settings::Instance().max_input_size.load();
}

inline void SetMaxInputSize(int64_t size) {
    Settings::Instance().max_input_size.store(size);
    SIFT_LOG_DEBUG("max input size set to {} bytes", size);
}

/**
 * @brief Capacity hint for result caches layered above the pipeline.
 */
[[nodiscard]] inline int64_t GetMaxCacheSize() noexcept {
    return Settings::Instance().max_cache_size.load();
}

inline void SetMaxCacheSize(int64_t size) {
    Settings::Instance().max_cache_size.store(size);
    SIFT_LOG_DEBUG("max cache size set to {}", size);
}

/**
 * @brief Bound on coercion and validation recursion through nested records
 * and containers.
 */
[[nodiscard]] inline int64_t GetMaxValidationDepth() noexcept {
    return Settings::Instance().max_validation_depth.load();
}

inline void SetMaxValidationDepth(int64_t depth) {
    Settings::Instance().max_validation_depth.store(depth);
    SIFT_LOG_DEBUG("max validation depth set to {}", depth);
}

/**
 * @brief Bound on the nesting of decoded documents. `0` disables the check.
 */
[[nodiscard]] inline int64_t GetMaxStructureDepth() noexcept {
    return Settings::Instance().max_structure_depth.load();
}

inline void SetMaxStructureDepth(int64_t depth) {
    Settings::Instance().max_structure_depth.store(depth);
    SIFT_LOG_DEBUG("max structure depth set to {}", depth);
}

[[nodiscard]] inline std::vector<std::string> GetSensitiveFieldPatterns() {
    return Settings::Instance().patterns();
}

/**
 * @brief Replaces the sensitive-field patterns. An empty list disables
 * redaction.
 */
inline void SetSensitiveFieldPatterns(std::vector<std::string> patterns) {
    SIFT_LOG_DEBUG("sensitive field patterns replaced ({} patterns)",
                   patterns.size());
    Settings::Instance().set_patterns(std::move(patterns));
}

inline void AddSensitiveFieldPattern(std::string pattern) {
    Settings::Instance().add_pattern(std::move(pattern));
}

/**
 * @brief Checks a field name against the sensitive-field patterns.
 */
[[nodiscard]] inline bool IsSensitiveField(std::string_view name) {
    return Settings::Instance().matches(name);
}

}  // namespace Sift
