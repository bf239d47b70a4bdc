// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nav_node.h"

#include <set>

namespace wayfinder {

/**
 * @brief Keys that appeared or disappeared between two tree versions
 *
 * Screens are tracked separately from containers (Stack/Tab/Pane) because
 * pending results belong to screens while lifecycle bookkeeping covers both.
 */
struct TreeDiff {
    std::set<NodeKey> removed_screen_keys;
    std::set<NodeKey> added_screen_keys;
    std::set<NodeKey> removed_container_keys;
    std::set<NodeKey> added_container_keys;

    bool empty() const {
        return removed_screen_keys.empty() && added_screen_keys.empty() &&
               removed_container_keys.empty() && added_container_keys.empty();
    }
};

/**
 * @brief Compare the node keys of @p old_tree and @p new_tree
 *
 * Subtrees shared by pointer are skipped.
 */
TreeDiff compute_tree_diff(const NavNodePtr& old_tree, const NavNodePtr& new_tree);

} // namespace wayfinder
