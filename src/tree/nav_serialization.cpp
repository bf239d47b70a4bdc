// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_serialization.h"

#include "nav_error.h"

#include <spdlog/spdlog.h>

namespace wayfinder {

namespace {

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_from_json(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

template <typename Enum>
Enum parse_enum_field(const json& j, const char* field, Enum fallback,
                      std::optional<Enum> (*parse)(const std::string&)) {
    auto it = j.find(field);
    if (it == j.end()) {
        return fallback;
    }
    auto name = it->get<std::string>();
    auto value = parse(name);
    if (!value) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              std::string("Unknown ") + field + " '" + name + "'");
    }
    return *value;
}

} // namespace

// ============================================================================
// Destination
// ============================================================================

json destination_to_json(const Destination& destination) {
    json j = {{"type", destination.type}, {"arguments", destination.arguments}};
    if (destination.transition) {
        j["transition"] = {{"type", transition_type_name(destination.transition->type)},
                           {"duration_ms", destination.transition->duration_ms}};
    }
    return j;
}

Destination destination_from_json(const json& j) {
    std::optional<NavigationTransition> transition;
    if (auto it = j.find("transition"); it != j.end() && !it->is_null()) {
        NavigationTransition t;
        t.type = parse_enum_field(*it, "type", TransitionType::NONE, &parse_transition_type);
        t.duration_ms = it->value("duration_ms", t.duration_ms);
        transition = t;
    }
    return Destination(j.at("type").get<std::string>(), j.value("arguments", json::object()),
                       transition);
}

// ============================================================================
// Nodes
// ============================================================================

json nav_node_to_json(const NavNodePtr& node) {
    if (!node) {
        return nullptr;
    }
    return node->visit(Overloaded{
        [](const ScreenNode& screen) -> json {
            return {{"_type", "screen"},
                    {"key", screen.key},
                    {"parent_key", optional_to_json(screen.parent_key)},
                    {"destination", destination_to_json(screen.destination)}};
        },
        [](const StackNode& stack) -> json {
            json children = json::array();
            for (const auto& child : stack.children) {
                children.push_back(nav_node_to_json(child));
            }
            return {{"_type", "stack"},
                    {"key", stack.key},
                    {"parent_key", optional_to_json(stack.parent_key)},
                    {"children", children},
                    {"scope_key", optional_to_json(stack.scope_key)}};
        },
        [](const TabNode& tab) -> json {
            json stacks = json::array();
            for (const auto& stack : tab.stacks) {
                stacks.push_back(nav_node_to_json(stack));
            }
            return {{"_type", "tab"},
                    {"key", tab.key},
                    {"parent_key", optional_to_json(tab.parent_key)},
                    {"stacks", stacks},
                    {"active_index", tab.active_index},
                    {"scope_key", optional_to_json(tab.scope_key)},
                    {"wrapper_key", optional_to_json(tab.wrapper_key)}};
        },
        [](const PaneNode& pane) -> json {
            json panes = json::object();
            for (const auto& [role, config] : pane.panes) {
                panes[pane_role_name(role)] = {
                    {"content", nav_node_to_json(config.content)},
                    {"adapt_strategy", adapt_strategy_name(config.adapt_strategy)}};
            }
            return {{"_type", "pane"},
                    {"key", pane.key},
                    {"parent_key", optional_to_json(pane.parent_key)},
                    {"panes", panes},
                    {"active_role", pane_role_name(pane.active_role)},
                    {"back_behavior", pane_back_behavior_name(pane.back_behavior)},
                    {"scope_key", optional_to_json(pane.scope_key)}};
        },
    });
}

NavNodePtr nav_node_from_json(const json& j) {
    const auto type = j.at("_type").get<std::string>();
    auto key = j.at("key").get<NodeKey>();
    auto parent_key = optional_from_json(j, "parent_key");

    if (type == "screen") {
        return make_screen(std::move(key), std::move(parent_key),
                           destination_from_json(j.at("destination")));
    }
    if (type == "stack") {
        StackNode stack{std::move(key), std::move(parent_key), {}, optional_from_json(j, "scope_key")};
        for (const auto& child : j.value("children", json::array())) {
            stack.children.push_back(nav_node_from_json(child));
        }
        return make_node(std::move(stack));
    }
    if (type == "tab") {
        TabNode tab;
        tab.key = std::move(key);
        tab.parent_key = std::move(parent_key);
        for (const auto& stack : j.at("stacks")) {
            tab.stacks.push_back(nav_node_from_json(stack));
        }
        tab.active_index = j.value("active_index", 0);
        tab.scope_key = optional_from_json(j, "scope_key");
        tab.wrapper_key = optional_from_json(j, "wrapper_key");
        return make_node(std::move(tab));
    }
    if (type == "pane") {
        PaneNode pane;
        pane.key = std::move(key);
        pane.parent_key = std::move(parent_key);
        for (const auto& [role_name, config] : j.at("panes").items()) {
            auto role = parse_pane_role(role_name);
            if (!role) {
                throw NavigationError(NavErrorType::INVALID_NODE,
                                      "Unknown pane role '" + role_name + "'");
            }
            pane.panes[*role] = PaneConfiguration{
                nav_node_from_json(config.at("content")),
                parse_enum_field(config, "adapt_strategy", AdaptStrategy::HIDE,
                                 &parse_adapt_strategy)};
        }
        pane.active_role = parse_enum_field(j, "active_role", PaneRole::PRIMARY, &parse_pane_role);
        pane.back_behavior =
            parse_enum_field(j, "back_behavior", PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE,
                             &parse_pane_back_behavior);
        pane.scope_key = optional_from_json(j, "scope_key");
        return make_node(std::move(pane));
    }
    throw NavigationError(NavErrorType::INVALID_NODE, "Unknown node _type '" + type + "'");
}

NavNodePtr nav_node_from_json_string(const std::string& text) {
    try {
        return nav_node_from_json(json::parse(text));
    } catch (const json::exception& e) {
        spdlog::warn("[NavSerialization] Malformed tree JSON: {}", e.what());
    } catch (const NavigationError& e) {
        spdlog::warn("[NavSerialization] Invalid tree ({}): {}", e.get_type_string(), e.what());
    }
    return nullptr;
}

} // namespace wayfinder
