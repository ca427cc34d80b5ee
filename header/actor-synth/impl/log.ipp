#pragma once

#include <cstdio>
#include <sstream>
#include <thread>

#include <actor-synth/log.hpp>

namespace actor_synth { namespace log {

    namespace {

        std::string thread_id_str() {
            std::ostringstream oss;
            oss << std::this_thread::get_id();
            return oss.str();
        }

        void stderr_sink(level lvl, std::string_view message) {
            fmt::print(stderr, "[actor-synth] [{:<5}] [{}] {}\n", to_string(lvl), thread_id_str(), message);
        }

    } // namespace

    const char* to_string(level lvl) noexcept {
        switch (lvl) {
            case level::trace:
                return "trace";
            case level::debug:
                return "debug";
            case level::info:
                return "info";
            case level::warn:
                return "warn";
            case level::error:
                return "error";
            case level::off:
                return "off";
        }
        return "?";
    }

    logger_t::logger_t()
        : threshold_(level::warn)
        , sink_(&stderr_sink) {
    }

    void logger_t::set_sink(sink_t sink) {
        std::lock_guard<std::mutex> guard(mutex_);
        if (sink) {
            sink_ = std::move(sink);
        } else {
            sink_ = &stderr_sink;
        }
    }

    void logger_t::write(level lvl, std::string_view message) {
        std::lock_guard<std::mutex> guard(mutex_);
        sink_(lvl, message);
    }

    logger_t& instance() noexcept {
        static logger_t logger;
        return logger;
    }

}} // namespace actor_synth::log
