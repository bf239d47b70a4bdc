// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file tree_mutator_internal.h
 * @brief Internal helpers shared across the tree_mutator_*.cpp files
 *
 * This header is NOT part of the public API.
 */

#include "nav_error.h"
#include "nav_tree.h"
#include "tree_mutator.h"

#include <string>
#include <vector>

namespace wayfinder {
namespace mutator_internal {

/// Look up a node or throw KEY_NOT_FOUND
inline NavNodePtr require_node(const NavNodePtr& tree, const NodeKey& key) {
    auto node = find_by_key(tree, key);
    if (!node) {
        throw NavigationError::key_not_found(key);
    }
    return node;
}

inline const StackNode& require_stack(const NavNodePtr& node) {
    const auto* stack = node->as_stack();
    if (!stack) {
        throw NavigationError::wrong_node_type(node->key(), "Stack");
    }
    return *stack;
}

inline const TabNode& require_tab(const NavNodePtr& node) {
    const auto* tab = node->as_tab();
    if (!tab) {
        throw NavigationError::wrong_node_type(node->key(), "Tab");
    }
    return *tab;
}

inline const PaneNode& require_pane(const NavNodePtr& node) {
    const auto* pane = node->as_pane();
    if (!pane) {
        throw NavigationError::wrong_node_type(node->key(), "Pane");
    }
    return *pane;
}

inline const PaneConfiguration& require_role(const PaneNode& pane, PaneRole role) {
    auto it = pane.panes.find(role);
    if (it == pane.panes.end()) {
        throw NavigationError::role_not_configured(pane.key, pane_role_name(role));
    }
    return it->second;
}

/// Copy of a Stack node with new children (same key, parent and scope)
inline NavNodePtr with_children(const NavNodePtr& stack_node, std::vector<NavNodePtr> children) {
    StackNode copy = require_stack(stack_node);
    copy.children = std::move(children);
    return make_node(std::move(copy));
}

/// Copy of a Stack node with a new Screen appended
inline NavNodePtr append_screen(const NavNodePtr& stack_node, const Destination& destination,
                                const NodeKey& screen_key) {
    StackNode copy = require_stack(stack_node);
    copy.children.push_back(make_screen(screen_key, copy.key, destination));
    return make_node(std::move(copy));
}

inline NavNodePtr with_active_role(const NavNodePtr& pane_node, PaneRole role) {
    PaneNode copy = require_pane(pane_node);
    copy.active_role = role;
    return make_node(std::move(copy));
}

/// The stack that receives entries for a pane role: the content itself if it is a Stack
inline NavNodePtr stack_for_role(const PaneNode& pane, PaneRole role) {
    auto content = pane.content(role);
    if (!content) {
        return nullptr;
    }
    if (content->is_stack()) {
        return content;
    }
    return active_stack(content);
}

inline size_t stack_size(const NavNodePtr& stack_node) {
    return stack_node ? require_stack(stack_node).children.size() : 0;
}

/// Parent by parent_key; nullptr for the root
inline NavNodePtr parent_of(const NavNodePtr& tree, const NavNodePtr& node) {
    const auto& parent_key = node->parent_key();
    if (!parent_key) {
        return nullptr;
    }
    return find_by_key(tree, *parent_key);
}

} // namespace mutator_internal
} // namespace wayfinder
