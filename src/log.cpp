#include <jot-cpp/log.hpp>

#include "logger.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace jot_cpp {

namespace detail {

auto logger() -> spdlog::logger& {
    static auto instance = [] {
        auto existing = spdlog::get(logger_name);
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        // Honour SPDLOG_LEVEL for the freshly registered logger.
        spdlog::cfg::load_env_levels();
        return created;
    }();
    return *instance;
}

}  // namespace detail

namespace {

auto to_spdlog(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::trace: return spdlog::level::trace;
        case LogLevel::debug: return spdlog::level::debug;
        case LogLevel::info:  return spdlog::level::info;
        case LogLevel::warn:  return spdlog::level::warn;
        case LogLevel::error: return spdlog::level::err;
        case LogLevel::off:   return spdlog::level::off;
    }
    return spdlog::level::warn;
}

auto from_spdlog(spdlog::level::level_enum level) -> LogLevel {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::trace;
        case spdlog::level::debug:    return LogLevel::debug;
        case spdlog::level::info:     return LogLevel::info;
        case spdlog::level::warn:     return LogLevel::warn;
        case spdlog::level::err:      return LogLevel::error;
        case spdlog::level::critical: return LogLevel::error;
        case spdlog::level::off:      return LogLevel::off;
        default:                      return LogLevel::warn;
    }
}

}  // anonymous namespace

void set_log_level(LogLevel level) {
    detail::logger().set_level(to_spdlog(level));
}

auto log_level() -> LogLevel {
    return from_spdlog(detail::logger().level());
}

}  // namespace jot_cpp
