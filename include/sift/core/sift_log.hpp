#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

/**
 * @brief Minimal leveled logger used by the library internals.
 *
 * Messages below the process-wide threshold are dropped before formatting.
 * The sink can be replaced to route library diagnostics into an
 * application's own logging. Field values are never passed to the logger.
 */
namespace Sift::log {

enum class Level : uint8_t {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

[[nodiscard]] constexpr std::string_view LevelName(Level level) noexcept {
    switch (level) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Off:
            break;
    }
    return "off";
}

using Sink = std::function<void(Level, std::string_view)>;

namespace detail {

inline std::atomic<Level>& Threshold() noexcept {
    static std::atomic<Level> threshold{Level::Warn};
    return threshold;
}

inline void StderrSink(Level level, std::string_view message) {
    std::fprintf(stderr, "[sift] [%.*s] %.*s\n",
                 static_cast<int>(LevelName(level).size()),
                 LevelName(level).data(), static_cast<int>(message.size()),
                 message.data());
}

struct SinkSlot {
    std::mutex mutex;
    Sink sink{StderrSink};
};

inline SinkSlot& Slot() {
    static SinkSlot slot;
    return slot;
}

}  // namespace detail

[[nodiscard]] inline Level GetLevel() noexcept {
    return detail::Threshold().load(std::memory_order_relaxed);
}

inline void SetLevel(Level level) noexcept {
    detail::Threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool Enabled(Level level) noexcept {
    return level != Level::Off && level >= GetLevel();
}

/**
 * @brief Replaces the sink. An empty sink restores the stderr default.
 */
inline void SetSink(Sink sink) {
    auto& slot = detail::Slot();
    const std::lock_guard lock{slot.mutex};
    slot.sink = sink ? std::move(sink) : Sink{detail::StderrSink};
}

/**
 * @brief Hands @p message to the current sink. The sink runs without the slot
 * lock held, so it may log or replace itself.
 */
inline void Write(Level level, std::string_view message) {
    Sink sink;
    {
        auto& slot = detail::Slot();
        const std::lock_guard lock{slot.mutex};
        sink = slot.sink;
    }
    sink(level, message);
}

template <typename... Args>
void Log(Level level, fmt::format_string<Args...> format, Args&&... args) {
    if (!Enabled(level)) {
        return;
    }
    Write(level, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace Sift::log

#define SIFT_LOG_TRACE(...) ::Sift::log::Log(::Sift::log::Level::Trace, __VA_ARGS__)
#define SIFT_LOG_DEBUG(...) ::Sift::log::Log(::Sift::log::Level::Debug, __VA_ARGS__)
#define SIFT_LOG_INFO(...) ::Sift::log::Log(::Sift::log::Level::Info, __VA_ARGS__)
#define SIFT_LOG_WARN(...) ::Sift::log::Log(::Sift::log::Level::Warn, __VA_ARGS__)
#define SIFT_LOG_ERROR(...) ::Sift::log::Log(::Sift::log::Level::Error, __VA_ARGS__)
