// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_config.h"

#include "key_generator.h"
#include "nav_error.h"

#include <spdlog/spdlog.h>

#include <fstream>

namespace wayfinder {

namespace {

Destination parse_root(const json& entry, const std::string& pointer) {
    auto it = entry.find("root");
    if (it == entry.end() || !it->is_string()) {
        throw ConfigError(pointer + "/root", "expected a destination type name");
    }
    return Destination(it->get<std::string>(), entry.value("arguments", json::object()));
}

template <typename Enum>
Enum parse_named(const json& object, const char* field, const std::string& pointer, Enum fallback,
                 std::optional<Enum> (*parse)(const std::string&)) {
    auto it = object.find(field);
    if (it == object.end()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ConfigError(pointer + "/" + field, "expected a string");
    }
    auto value = parse(it->get<std::string>());
    if (!value) {
        throw ConfigError(pointer + "/" + field, "unknown value '" + it->get<std::string>() + "'");
    }
    return *value;
}

ContainerInfo parse_tab_container(const json& def, const std::string& pointer,
                                  const std::string& scope_key) {
    auto tabs_it = def.find("tabs");
    if (tabs_it == def.end() || !tabs_it->is_array() || tabs_it->empty()) {
        throw ConfigError(pointer + "/tabs", "expected a non-empty array");
    }
    std::vector<Destination> roots;
    for (size_t i = 0; i < tabs_it->size(); ++i) {
        roots.push_back(parse_root((*tabs_it)[i], pointer + "/tabs/" + std::to_string(i)));
    }
    std::optional<std::string> wrapper_key;
    if (def.contains("wrapper_key") && !def["wrapper_key"].is_null()) {
        wrapper_key = def["wrapper_key"].get<std::string>();
    }
    int initial_tab = def.value("initial_tab", 0);
    try {
        return make_tab_container(scope_key, std::move(roots), initial_tab, wrapper_key);
    } catch (const NavigationError& e) {
        throw ConfigError(pointer, e.what());
    }
}

ContainerInfo parse_pane_container(const json& def, const std::string& pointer,
                                   const std::string& scope_key) {
    auto panes_it = def.find("panes");
    if (panes_it == def.end() || !panes_it->is_object()) {
        throw ConfigError(pointer + "/panes", "expected an object of role -> pane");
    }
    std::map<PaneRole, PaneSlot> slots;
    for (const auto& [role_name, pane_def] : panes_it->items()) {
        auto role = parse_pane_role(role_name);
        auto pane_pointer = pointer + "/panes/" + role_name;
        if (!role) {
            throw ConfigError(pane_pointer, "unknown pane role");
        }
        slots[*role] = PaneSlot{parse_root(pane_def, pane_pointer),
                                parse_named(pane_def, "adapt", pane_pointer, AdaptStrategy::HIDE,
                                            &parse_adapt_strategy)};
    }
    auto back_behavior =
        parse_named(def, "back_behavior", pointer, PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE,
                    &parse_pane_back_behavior);
    auto initial_pane =
        parse_named(def, "initial_pane", pointer, PaneRole::PRIMARY, &parse_pane_role);
    try {
        return make_pane_container(scope_key, std::move(slots), back_behavior, initial_pane);
    } catch (const NavigationError& e) {
        throw ConfigError(pointer, e.what());
    }
}

} // namespace

NavConfig::NavConfig(json data) : data_(std::move(data)) {
    if (!data_.is_object()) {
        throw ConfigError("", "navigation config must be a JSON object");
    }
}

NavConfig NavConfig::from_string(const std::string& text) {
    try {
        return NavConfig(json::parse(text));
    } catch (const json::parse_error& e) {
        throw ConfigError("", std::string("parse error: ") + e.what());
    }
}

NavConfig NavConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("[NavConfig] Cannot open {}", path);
        throw ConfigError("", "cannot open " + path);
    }
    try {
        auto config = NavConfig(json::parse(in));
        spdlog::info("[NavConfig] Loaded {}", path);
        return config;
    } catch (const json::parse_error& e) {
        spdlog::error("[NavConfig] Failed to parse {}: {}", path, e.what());
        throw ConfigError("", std::string("parse error: ") + e.what());
    }
}

logging::LogConfig NavConfig::log_config() const {
    logging::LogConfig config;
    config.level = logging::parse_level(get<std::string>("/logging/level", ""), config.level);
    config.target = logging::parse_log_target(get<std::string>("/logging/target", "auto"));
    config.file_path = get<std::string>("/logging/file", "");
    config.enable_console = get<bool>("/logging/console", true);
    return config;
}

NavigatorOptions NavConfig::navigator_options() const {
    NavigatorOptions options;
    options.scopes = build_scope_registry();
    options.containers = build_container_registry();
    options.pane_roles = build_pane_role_registry();
    options.compact = get<bool>("/navigator/compact", true);

    int key_length = get<int>("/navigator/key_length", 8);
    if (key_length < 4 || key_length > 64) {
        throw ConfigError("/navigator/key_length", "must be between 4 and 64");
    }
    options.key_generator = make_random_key_generator(static_cast<size_t>(key_length));
    return options;
}

std::shared_ptr<const ScopeRegistry> NavConfig::build_scope_registry() const {
    auto scopes = get<json>("/scopes", json::object());
    if (!scopes.is_object()) {
        throw ConfigError("/scopes", "expected an object of scope -> destination types");
    }
    if (scopes.empty()) {
        return ScopeRegistry::empty();
    }
    TableScopeRegistry::ScopeTable table;
    for (const auto& [scope_key, members] : scopes.items()) {
        table[scope_key] = get<std::set<std::string>>("/scopes/" + scope_key);
    }
    spdlog::debug("[NavConfig] {} scopes", table.size());
    return std::make_shared<TableScopeRegistry>(std::move(table));
}

std::shared_ptr<const ContainerRegistry> NavConfig::build_container_registry() const {
    auto containers = get<json>("/containers", json::array());
    if (!containers.is_array()) {
        throw ConfigError("/containers", "expected an array of container definitions");
    }
    if (containers.empty()) {
        return ContainerRegistry::empty();
    }

    std::map<std::string, ContainerInfo> table;
    for (size_t i = 0; i < containers.size(); ++i) {
        const auto& def = containers[i];
        auto pointer = "/containers/" + std::to_string(i);
        auto trigger = get<std::string>(pointer + "/trigger");
        auto scope_key = get<std::string>(pointer + "/scope_key");
        auto kind = get<std::string>(pointer + "/kind");

        ContainerInfo info;
        if (kind == "tabs") {
            info = parse_tab_container(def, pointer, scope_key);
        } else if (kind == "panes") {
            info = parse_pane_container(def, pointer, scope_key);
        } else {
            throw ConfigError(pointer + "/kind", "expected \"tabs\" or \"panes\"");
        }
        if (table.count(trigger) > 0) {
            spdlog::warn("[NavConfig] Container trigger '{}' defined twice, keeping the last", trigger);
        }
        table[trigger] = std::move(info);
    }
    spdlog::debug("[NavConfig] {} containers", table.size());
    return std::make_shared<TableContainerRegistry>(std::move(table));
}

std::shared_ptr<const PaneRoleRegistry> NavConfig::build_pane_role_registry() const {
    auto roles = get<json>("/pane_roles", json::object());
    if (!roles.is_object()) {
        throw ConfigError("/pane_roles", "expected an object of scope -> {type: role}");
    }
    if (roles.empty()) {
        return PaneRoleRegistry::empty();
    }
    TablePaneRoleRegistry::RoleTable table;
    for (const auto& [scope_key, mapping] : roles.items()) {
        auto scope_pointer = "/pane_roles/" + scope_key;
        if (!mapping.is_object()) {
            throw ConfigError(scope_pointer, "expected an object of destination type -> role");
        }
        for (const auto& [type, role_name] : mapping.items()) {
            auto role = role_name.is_string() ? parse_pane_role(role_name.get<std::string>())
                                              : std::nullopt;
            if (!role) {
                throw ConfigError(scope_pointer + "/" + type, "expected a pane role name");
            }
            table[scope_key][type] = *role;
        }
    }
    return std::make_shared<TablePaneRoleRegistry>(std::move(table));
}

} // namespace wayfinder
