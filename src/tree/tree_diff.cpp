// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tree_diff.h"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace wayfinder {

namespace {

struct KeySets {
    std::set<NodeKey> screens;
    std::set<NodeKey> containers;
};

void collect_keys(const NavNodePtr& node, const std::unordered_set<const NavNode*>& skip,
                  KeySets& out) {
    if (!node || skip.count(node.get()) > 0) {
        return;
    }
    if (node->is_screen()) {
        out.screens.insert(node->key());
    } else {
        out.containers.insert(node->key());
    }
    for (const auto& child : node->children()) {
        collect_keys(child, skip, out);
    }
}

void collect_pointers(const NavNodePtr& node, std::unordered_set<const NavNode*>& out) {
    if (!node || !out.insert(node.get()).second) {
        return;
    }
    for (const auto& child : node->children()) {
        collect_pointers(child, out);
    }
}

std::set<NodeKey> difference(const std::set<NodeKey>& a, const std::set<NodeKey>& b) {
    std::set<NodeKey> out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::inserter(out, out.end()));
    return out;
}

} // namespace

TreeDiff compute_tree_diff(const NavNodePtr& old_tree, const NavNodePtr& new_tree) {
    TreeDiff diff;
    if (old_tree == new_tree) {
        return diff;
    }

    // Nodes reachable from both trees by pointer are identical subtrees and cannot differ
    std::unordered_set<const NavNode*> old_nodes;
    std::unordered_set<const NavNode*> new_nodes;
    collect_pointers(old_tree, old_nodes);
    collect_pointers(new_tree, new_nodes);
    std::unordered_set<const NavNode*> shared;
    for (const NavNode* ptr : old_nodes) {
        if (new_nodes.count(ptr) > 0) {
            shared.insert(ptr);
        }
    }

    KeySets old_keys;
    KeySets new_keys;
    collect_keys(old_tree, shared, old_keys);
    collect_keys(new_tree, shared, new_keys);

    diff.removed_screen_keys = difference(old_keys.screens, new_keys.screens);
    diff.added_screen_keys = difference(new_keys.screens, old_keys.screens);
    diff.removed_container_keys = difference(old_keys.containers, new_keys.containers);
    diff.added_container_keys = difference(new_keys.containers, old_keys.containers);
    return diff;
}

} // namespace wayfinder
