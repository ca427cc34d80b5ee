#pragma once

/// @file log.hpp
/// @brief Process-wide logger used by the engine and the runtime
///
/// Messages are formatted with fmt and serialized through one mutex.
/// Usage:
///   actor_synth::log::info("generated {} with {} operations", name, count);

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace actor_synth { namespace log {

    enum class level : uint8_t {
        trace = 0,
        debug,
        info,
        warn,
        error,
        off
    };

    const char* to_string(level lvl) noexcept;

    using sink_t = std::function<void(level, std::string_view)>;

    class logger_t final {
    public:
        logger_t();
        logger_t(const logger_t&) = delete;
        logger_t& operator=(const logger_t&) = delete;

        void set_level(level lvl) noexcept {
            threshold_.store(lvl, std::memory_order_relaxed);
        }

        level threshold() const noexcept {
            return threshold_.load(std::memory_order_relaxed);
        }

        bool enabled(level lvl) const noexcept {
            return lvl != level::off && lvl >= threshold();
        }

        /// @brief Replace the output sink; an empty sink restores stderr output
        void set_sink(sink_t sink);

        void write(level lvl, std::string_view message);

    private:
        std::mutex mutex_;
        std::atomic<level> threshold_;
        sink_t sink_;
    };

    logger_t& instance() noexcept;

    template<typename... Args>
    void emit(level lvl, fmt::format_string<Args...> format, Args&&... args) {
        auto& logger = instance();
        if (!logger.enabled(lvl)) {
            return;
        }
        logger.write(lvl, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        emit(level::trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        emit(level::debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        emit(level::info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        emit(level::warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        emit(level::error, format, std::forward<Args>(args)...);
    }

}} // namespace actor_synth::log
