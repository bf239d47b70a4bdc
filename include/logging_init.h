// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief Sets up the spdlog default logger the engine writes to
 *
 * The engine logs through spdlog's default logger with "[Component]"
 * prefixes. Hosts that already configure spdlog can skip init(); hosts that
 * don't can call it once at startup with values read by NavConfig.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace wayfinder {
namespace logging {

enum class LogTarget {
    Auto,    ///< File when a path is configured, otherwise console only
    Console, ///< Console sink only
    Syslog,  ///< Console plus syslog (Linux only; console elsewhere)
    File     ///< Console plus rotating file
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Empty selects the default under XDG_DATA_HOME
    bool enable_console = true;
};

/**
 * @brief Install the "wayfinder" logger as spdlog's default
 *
 * Safe to call again; the previous default logger is replaced.
 */
void init(const LogConfig& config);

/**
 * @brief Level name ("trace" ... "off", "warning" alias) to spdlog level
 * @return @p default_level for empty or unknown names (case sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// Unknown names map to LogTarget::Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// Explicit path if given, else $XDG_DATA_HOME/wayfinder/wayfinder.log
std::string resolve_log_file_path(const std::string& override_path);

} // namespace logging
} // namespace wayfinder
