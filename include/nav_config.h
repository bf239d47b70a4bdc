// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_config.h
 * @brief JSON navigation configuration: logging, navigator policy, routing tables
 *
 * @pattern Parsed once at startup; builders produce the immutable registries
 *          a Navigator is constructed with.
 * @threading Not thread-safe. Load and build on one thread, then share the
 *            built registries read-only.
 *
 * Example:
 * ```cpp
 * auto cfg = wayfinder::NavConfig::from_file("/etc/app/navigation.json");
 * wayfinder::logging::init(cfg.log_config());
 * wayfinder::Navigator nav(nullptr, cfg.navigator_options());
 * ```
 *
 * Document layout:
 * ```json
 * {
 *   "logging":    {"level": "debug", "target": "console", "file": ""},
 *   "navigator":  {"compact": true, "key_length": 8},
 *   "scopes":     {"main_tabs": ["Home", "Search", "Profile"]},
 *   "pane_roles": {"mail_panes": {"Inbox": "primary", "Message": "supporting"}},
 *   "containers": [
 *     {"kind": "tabs", "trigger": "Home", "scope_key": "main_tabs", "initial_tab": 0,
 *      "wrapper_key": "bottom_bar", "tabs": [{"root": "Home"}, {"root": "Search"}]},
 *     {"kind": "panes", "trigger": "Inbox", "scope_key": "mail_panes",
 *      "back_behavior": "pop_latest", "initial_pane": "primary",
 *      "panes": {"primary": {"root": "Inbox"}, "supporting": {"root": "Empty", "adapt": "levitate"}}}
 *   ]
 * }
 * ```
 */

#pragma once

#include "logging_init.h"
#include "nav_destination.h"
#include "nav_registries.h"
#include "navigator.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace wayfinder {

/**
 * @brief Configuration value missing, mistyped or unparseable
 */
class ConfigError : public std::runtime_error {
  public:
    ConfigError(std::string pointer, const std::string& message)
        : std::runtime_error(pointer.empty() ? message : pointer + ": " + message),
          pointer_(std::move(pointer)) {}

    /// JSON pointer of the offending value, empty for document-level errors
    const std::string& pointer() const {
        return pointer_;
    }

  private:
    std::string pointer_;
};

class NavConfig {
  public:
    NavConfig() : data_(json::object()) {}
    explicit NavConfig(json data);

    /// @throws ConfigError if @p text is not a JSON object
    static NavConfig from_string(const std::string& text);

    /// @throws ConfigError if the file cannot be read or parsed
    static NavConfig from_file(const std::string& path);

    /**
     * @brief Value at JSON pointer @p json_ptr
     * @throws ConfigError if the path is absent or has the wrong type
     */
    template <typename T> T get(const std::string& json_ptr) const {
        try {
            return data_.at(json::json_pointer(json_ptr)).template get<T>();
        } catch (const json::exception& e) {
            throw ConfigError(json_ptr, e.what());
        }
    }

    /**
     * @brief Value at @p json_ptr, or @p default_value if the path is absent
     * @throws ConfigError if the path exists with the wrong type
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (!data_.contains(ptr)) {
            return default_value;
        }
        return get<T>(json_ptr);
    }

    const json& data() const {
        return data_;
    }

    logging::LogConfig log_config() const;

    /// Registries and key generator built from this document
    NavigatorOptions navigator_options() const;

    std::shared_ptr<const ScopeRegistry> build_scope_registry() const;
    std::shared_ptr<const ContainerRegistry> build_container_registry() const;
    std::shared_ptr<const PaneRoleRegistry> build_pane_role_registry() const;

  private:
    json data_;
};

} // namespace wayfinder
