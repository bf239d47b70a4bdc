// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace wayfinder {
namespace logging {

namespace {

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

// "warning" is accepted as an alias of "warn"
constexpr LevelName kLevelNames[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
    {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
};

struct TargetName {
    const char* name;
    LogTarget target;
};

constexpr TargetName kTargetNames[] = {
    {"auto", LogTarget::Auto},
    {"console", LogTarget::Console},
    {"syslog", LogTarget::Syslog},
    {"file", LogTarget::File},
};

/// $XDG_DATA_HOME if set, else $HOME/.local/share, else /tmp
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

LogTarget resolve_target(const LogConfig& config) {
    if (config.target != LogTarget::Auto) {
        return config.target;
    }
    return config.file_path.empty() ? LogTarget::Console : LogTarget::File;
}

void add_target_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    case LogTarget::Syslog:
#ifdef __linux__
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("wayfinder", LOG_PID, LOG_USER, false));
#endif
        break;
    case LogTarget::Console:
    case LogTarget::Auto:
        // Auto has been resolved already; console needs no extra sink
        break;
    }
}

} // namespace

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::filesystem::path dir = std::filesystem::path(get_xdg_data_home()) / "wayfinder";
    std::error_code ec;
    if (!std::filesystem::create_directories(dir, ec) && ec) {
        spdlog::warn("[Logging] Cannot create log directory {}: {}", dir.string(), ec.message());
    }
    return (dir / "wayfinder.log").string();
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target = resolve_target(config);
    add_target_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("wayfinder", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(std::move(logger));

    spdlog::debug("[Logging] Default logger installed: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& entry : kLevelNames) {
        if (str == entry.name) {
            return entry.level;
        }
    }
    return default_level;
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : kTargetNames) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : kTargetNames) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace wayfinder
