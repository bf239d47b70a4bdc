// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "test_fixtures.h"

#include "nav_tree.h"

#include <set>

namespace wayfinder {
namespace test {

Destination dest(const std::string& type, json arguments) {
    return Destination(type, std::move(arguments));
}

NavNodePtr screen(const NodeKey& key, const std::optional<NodeKey>& parent, const std::string& type) {
    return make_screen(key, parent, dest(type));
}

NavNodePtr stack_of(const NodeKey& key, const std::optional<NodeKey>& parent,
                    const std::vector<std::string>& types, std::optional<std::string> scope_key) {
    std::vector<NavNodePtr> children;
    for (size_t i = 0; i < types.size(); ++i) {
        children.push_back(screen(key + "-" + std::to_string(i), key, types[i]));
    }
    return make_stack(key, parent, std::move(children), std::move(scope_key));
}

NavNodePtr tab_node(const NodeKey& key, const std::optional<NodeKey>& parent,
                    std::vector<NavNodePtr> stacks, int active_index,
                    std::optional<std::string> scope_key) {
    TabNode tab;
    tab.key = key;
    tab.parent_key = parent;
    tab.stacks = std::move(stacks);
    tab.active_index = active_index;
    tab.scope_key = std::move(scope_key);
    return make_node(std::move(tab));
}

NavNodePtr pane_node(const NodeKey& key, const std::optional<NodeKey>& parent,
                     std::map<PaneRole, NavNodePtr> contents, PaneRole active,
                     PaneBackBehavior behavior, std::optional<std::string> scope_key) {
    PaneNode pane;
    pane.key = key;
    pane.parent_key = parent;
    for (auto& [role, content] : contents) {
        pane.panes[role] = PaneConfiguration{content};
    }
    pane.active_role = active;
    pane.back_behavior = behavior;
    pane.scope_key = std::move(scope_key);
    return make_node(std::move(pane));
}

NavNodePtr sample_tab_tree() {
    auto tabs = tab_node("tabs", "root",
                         {stack_of("home", "tabs", {"Home"}), stack_of("search", "tabs", {"Search"}),
                          stack_of("profile", "tabs", {"Profile"})},
                         0, "main_tabs");
    return make_stack("root", std::nullopt, {tabs});
}

NavNodePtr sample_pane_tree(PaneRole active, PaneBackBehavior behavior) {
    auto panes = pane_node("panes", "root",
                           {{PaneRole::PRIMARY, stack_of("list", "panes", {"Inbox"})},
                            {PaneRole::SUPPORTING, stack_of("detail", "panes", {"Message"})}},
                           active, behavior, "mail");
    return make_stack("root", std::nullopt, {panes});
}

std::vector<std::string> screen_types(const NavNodePtr& stack) {
    std::vector<std::string> types;
    if (!stack || !stack->is_stack()) {
        return types;
    }
    for (const auto& child : stack->as_stack()->children) {
        if (const auto* s = child->as_screen()) {
            types.push_back(s->destination.type);
        }
    }
    return types;
}

std::string leaf_type(const NavNodePtr& tree) {
    auto destination = active_destination(tree);
    return destination ? destination->type : std::string();
}

bool parent_keys_consistent(const NavNodePtr& tree) {
    bool ok = true;
    for_each_node(tree, [&](const NavNodePtr& node) {
        for (const auto& child : node->children()) {
            if (child->parent_key() != node->key()) {
                ok = false;
            }
        }
    });
    return ok;
}

bool keys_unique(const NavNodePtr& tree) {
    std::set<NodeKey> seen;
    bool ok = true;
    for_each_node(tree, [&](const NavNodePtr& node) {
        if (!seen.insert(node->key()).second) {
            ok = false;
        }
    });
    return ok;
}

} // namespace test
} // namespace wayfinder
