// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_registries.h"

#include "nav_error.h"

#include <spdlog/spdlog.h>

namespace wayfinder {

namespace {

class EmptyScopeRegistry : public ScopeRegistry {
  public:
    bool is_in_scope(const std::string&, const Destination&) const override {
        return true;
    }
    std::optional<std::string> get_scope_key(const Destination&) const override {
        return std::nullopt;
    }
};

class EmptyContainerRegistry : public ContainerRegistry {
  public:
    std::optional<ContainerInfo> get_container_info(const Destination&) const override {
        return std::nullopt;
    }
};

class EmptyPaneRoleRegistry : public PaneRoleRegistry {
  public:
    std::optional<PaneRole> get_pane_role(const std::string&, const Destination&) const override {
        return std::nullopt;
    }
};

} // namespace

// ============================================================================
// ScopeRegistry
// ============================================================================

std::shared_ptr<const ScopeRegistry> ScopeRegistry::empty() {
    static const auto instance = std::make_shared<const EmptyScopeRegistry>();
    return instance;
}

TableScopeRegistry::TableScopeRegistry(ScopeTable scopes) : scopes_(std::move(scopes)) {
    for (const auto& [scope_key, members] : scopes_) {
        for (const auto& type : members) {
            auto inserted = destination_to_scope_.emplace(type, scope_key);
            if (!inserted.second) {
                spdlog::warn("[ScopeRegistry] Destination '{}' is in scopes '{}' and '{}', "
                             "get_scope_key() reports '{}'",
                             type, inserted.first->second, scope_key, inserted.first->second);
            }
        }
    }
    spdlog::debug("[ScopeRegistry] {} scopes, {} scoped destinations", scopes_.size(),
                  destination_to_scope_.size());
}

bool TableScopeRegistry::is_in_scope(const std::string& scope_key,
                                     const Destination& destination) const {
    auto it = scopes_.find(scope_key);
    if (it == scopes_.end()) {
        return false;
    }
    return it->second.count(destination.type) > 0;
}

std::optional<std::string> TableScopeRegistry::get_scope_key(const Destination& destination) const {
    auto it = destination_to_scope_.find(destination.type);
    if (it == destination_to_scope_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// ContainerRegistry
// ============================================================================

std::shared_ptr<const ContainerRegistry> ContainerRegistry::empty() {
    static const auto instance = std::make_shared<const EmptyContainerRegistry>();
    return instance;
}

TableContainerRegistry::TableContainerRegistry(std::map<std::string, ContainerInfo> containers)
    : containers_(std::move(containers)) {}

std::optional<ContainerInfo>
TableContainerRegistry::get_container_info(const Destination& destination) const {
    auto it = containers_.find(destination.type);
    if (it == containers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ContainerInfo make_tab_container(std::string scope_key, std::vector<Destination> tab_roots,
                                 int initial_tab_index, std::optional<std::string> wrapper_key) {
    if (tab_roots.empty()) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              "Tab container '" + scope_key + "' needs at least one tab");
    }
    if (initial_tab_index < 0 || static_cast<size_t>(initial_tab_index) >= tab_roots.size()) {
        throw NavigationError::index_out_of_bounds(initial_tab_index, tab_roots.size());
    }

    ContainerInfo info;
    info.kind = ContainerKind::TABS;
    info.scope_key = scope_key;
    info.initial_tab_index = initial_tab_index;
    info.builder = [scope_key, tab_roots = std::move(tab_roots), wrapper_key](
                       const NodeKey& key, const std::optional<NodeKey>& parent_key,
                       int initial_index) {
        TabNode tab;
        tab.key = key;
        tab.parent_key = parent_key;
        tab.scope_key = scope_key;
        tab.wrapper_key = wrapper_key;
        tab.active_index = initial_index;
        for (size_t i = 0; i < tab_roots.size(); ++i) {
            NodeKey stack_key = key + "/tab" + std::to_string(i);
            tab.stacks.push_back(
                make_stack(stack_key, key, {make_screen(stack_key + "/root", stack_key, tab_roots[i])}));
        }
        return make_node(std::move(tab));
    };
    return info;
}

ContainerInfo make_pane_container(std::string scope_key, std::map<PaneRole, PaneSlot> slots,
                                  PaneBackBehavior back_behavior, PaneRole initial_pane) {
    if (slots.count(PaneRole::PRIMARY) == 0) {
        throw NavigationError(NavErrorType::PRIMARY_PANE_REQUIRED,
                              "Pane container '" + scope_key + "' needs a primary pane");
    }
    if (slots.count(initial_pane) == 0) {
        throw NavigationError::role_not_configured(scope_key, pane_role_name(initial_pane));
    }

    ContainerInfo info;
    info.kind = ContainerKind::PANES;
    info.scope_key = scope_key;
    info.initial_pane = initial_pane;
    info.builder = [scope_key, slots = std::move(slots), back_behavior, initial_pane](
                       const NodeKey& key, const std::optional<NodeKey>& parent_key, int) {
        PaneNode pane;
        pane.key = key;
        pane.parent_key = parent_key;
        pane.scope_key = scope_key;
        pane.back_behavior = back_behavior;
        pane.active_role = initial_pane;
        for (const auto& [role, slot] : slots) {
            NodeKey stack_key = key + "/" + pane_role_name(role);
            pane.panes[role] = PaneConfiguration{
                make_stack(stack_key, key, {make_screen(stack_key + "/root", stack_key, slot.root)}),
                slot.adapt_strategy};
        }
        return make_node(std::move(pane));
    };
    return info;
}

// ============================================================================
// PaneRoleRegistry
// ============================================================================

std::shared_ptr<const PaneRoleRegistry> PaneRoleRegistry::empty() {
    static const auto instance = std::make_shared<const EmptyPaneRoleRegistry>();
    return instance;
}

TablePaneRoleRegistry::TablePaneRoleRegistry(RoleTable roles) : roles_(std::move(roles)) {}

std::optional<PaneRole> TablePaneRoleRegistry::get_pane_role(const std::string& scope_key,
                                                             const Destination& destination) const {
    auto scope = roles_.find(scope_key);
    if (scope == roles_.end()) {
        return std::nullopt;
    }
    auto role = scope->second.find(destination.type);
    if (role == scope->second.end()) {
        return std::nullopt;
    }
    return role->second;
}

} // namespace wayfinder
