// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_tree.h
 * @brief Read-only queries over a navigation tree
 *
 * All functions are pure and accept a null tree (returning empty results).
 */

#pragma once

#include "nav_node.h"

#include <functional>
#include <vector>

namespace wayfinder {

/**
 * @brief Depth-first search for a node by key
 * @return The node, or nullptr if no node has that key
 */
NavNodePtr find_by_key(const NavNodePtr& tree, const NodeKey& key);

/**
 * @brief Find the node that structurally contains the node with @p key
 * @return Parent node, or nullptr for the root or an unknown key
 */
NavNodePtr find_parent(const NavNodePtr& tree, const NodeKey& key);

/**
 * @brief Nodes from the root down to the focused leaf
 *
 * Each level follows its active child (Stack -> last child, Tab -> active
 * stack, Pane -> active role content). The path ends at a Screen or at a
 * Stack without children.
 */
std::vector<NavNodePtr> active_path_to_leaf(const NavNodePtr& tree);

/**
 * @brief The focused Screen node, or nullptr if the active path ends in an empty stack
 */
NavNodePtr active_leaf(const NavNodePtr& tree);

/**
 * @brief Deepest Stack on the active path; receiver of ordinary push/pop
 */
NavNodePtr active_stack(const NavNodePtr& tree);

/**
 * @brief Destination of the focused screen
 */
std::optional<Destination> active_destination(const NavNodePtr& tree);

std::vector<NavNodePtr> all_screens(const NavNodePtr& tree);
std::vector<NavNodePtr> all_stack_nodes(const NavNodePtr& tree);
std::vector<NavNodePtr> all_tab_nodes(const NavNodePtr& tree);
std::vector<NavNodePtr> all_pane_nodes(const NavNodePtr& tree);

/// Every key in the tree, in depth-first pre-order
std::vector<NodeKey> all_keys(const NavNodePtr& tree);

/**
 * @brief True when popping this node's own state is meaningful
 *
 * Stack with more than one child; Tab whose active stack can go back or that
 * is not on its initial tab; Pane where any role's active stack has more than
 * one child. Screens never handle back.
 */
bool can_handle_back_internally(const NavNodePtr& node);

/// Number of nodes on the longest root-to-leaf path (0 for a null tree)
size_t tree_depth(const NavNodePtr& tree);

size_t node_count(const NavNodePtr& tree);

/// Visit every node depth-first, parents before children
void for_each_node(const NavNodePtr& tree, const std::function<void(const NavNodePtr&)>& fn);

/**
 * @brief First node of a given kind in depth-first pre-order
 */
NavNodePtr find_first(const NavNodePtr& tree, NavNodeKind kind);

/**
 * @brief Shallowest (or deepest) node of a kind on the active path
 */
NavNodePtr find_on_active_path(const NavNodePtr& tree, NavNodeKind kind, bool deepest = false);

/// Content of @p role in @p pane; null if the role is not configured or @p pane is not a Pane
NavNodePtr pane_content(const NavNodePtr& pane, PaneRole role);

NavNodePtr active_pane_content(const NavNodePtr& pane);

} // namespace wayfinder
