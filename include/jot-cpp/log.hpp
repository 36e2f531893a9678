/// @file log.hpp
/// @brief Logging configuration for the jot-cpp library.
///
/// The library logs through a single spdlog logger named "jot-cpp" that
/// writes to stderr. Its level defaults to `warn` and can be set with the
/// SPDLOG_LEVEL environment variable (e.g. `SPDLOG_LEVEL=jot-cpp=debug`)
/// or programmatically with set_log_level().

#pragma once

#include <cstdint>
#include <string_view>

namespace jot_cpp {

/// Severity threshold for library log messages.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    off,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace: return "trace";
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
        case LogLevel::off:   return "off";
    }
    return "unknown";
}

/// Set the threshold of the library logger.
void set_log_level(LogLevel level);

/// The current threshold of the library logger.
auto log_level() -> LogLevel;

}  // namespace jot_cpp
