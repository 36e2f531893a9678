#pragma once

// Library-wide spdlog logger.
//
// Created on first use and registered with spdlog under the name "jot-cpp",
// so applications can reconfigure it through spdlog::get("jot-cpp").
//
// Internal header, not installed.

#include <spdlog/spdlog.h>

namespace jot_cpp::detail {

inline constexpr auto logger_name = "jot-cpp";

// Process-global logger. Created on first use.
auto logger() -> spdlog::logger&;

}  // namespace jot_cpp::detail
