// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_tree.h"

#include <algorithm>

namespace wayfinder {

namespace {

void collect_kind(const NavNodePtr& node, NavNodeKind kind, std::vector<NavNodePtr>& out) {
    if (!node) {
        return;
    }
    if (node->kind() == kind) {
        out.push_back(node);
    }
    for (const auto& child : node->children()) {
        collect_kind(child, kind, out);
    }
}

} // namespace

NavNodePtr find_by_key(const NavNodePtr& tree, const NodeKey& key) {
    if (!tree) {
        return nullptr;
    }
    if (tree->key() == key) {
        return tree;
    }
    for (const auto& child : tree->children()) {
        if (auto found = find_by_key(child, key)) {
            return found;
        }
    }
    return nullptr;
}

NavNodePtr find_parent(const NavNodePtr& tree, const NodeKey& key) {
    if (!tree) {
        return nullptr;
    }
    for (const auto& child : tree->children()) {
        if (child->key() == key) {
            return tree;
        }
        if (auto found = find_parent(child, key)) {
            return found;
        }
    }
    return nullptr;
}

std::vector<NavNodePtr> active_path_to_leaf(const NavNodePtr& tree) {
    std::vector<NavNodePtr> path;
    NavNodePtr current = tree;
    while (current) {
        path.push_back(current);
        current = current->active_child();
    }
    return path;
}

NavNodePtr active_leaf(const NavNodePtr& tree) {
    auto path = active_path_to_leaf(tree);
    if (path.empty() || !path.back()->is_screen()) {
        return nullptr;
    }
    return path.back();
}

NavNodePtr active_stack(const NavNodePtr& tree) {
    if (!tree) {
        return nullptr;
    }
    return tree->visit(Overloaded{
        [](const ScreenNode&) -> NavNodePtr { return nullptr; },
        [&](const StackNode& s) -> NavNodePtr {
            auto deeper = active_stack(s.active_child());
            return deeper ? deeper : tree;
        },
        [](const TabNode& t) -> NavNodePtr {
            auto stack = t.active_stack_node();
            auto deeper = active_stack(stack);
            return deeper ? deeper : stack;
        },
        [](const PaneNode& p) -> NavNodePtr { return active_stack(p.active_content()); },
    });
}

std::optional<Destination> active_destination(const NavNodePtr& tree) {
    auto leaf = active_leaf(tree);
    if (!leaf) {
        return std::nullopt;
    }
    return leaf->as_screen()->destination;
}

std::vector<NavNodePtr> all_screens(const NavNodePtr& tree) {
    std::vector<NavNodePtr> out;
    collect_kind(tree, NavNodeKind::SCREEN, out);
    return out;
}

std::vector<NavNodePtr> all_stack_nodes(const NavNodePtr& tree) {
    std::vector<NavNodePtr> out;
    collect_kind(tree, NavNodeKind::STACK, out);
    return out;
}

std::vector<NavNodePtr> all_tab_nodes(const NavNodePtr& tree) {
    std::vector<NavNodePtr> out;
    collect_kind(tree, NavNodeKind::TAB, out);
    return out;
}

std::vector<NavNodePtr> all_pane_nodes(const NavNodePtr& tree) {
    std::vector<NavNodePtr> out;
    collect_kind(tree, NavNodeKind::PANE, out);
    return out;
}

std::vector<NodeKey> all_keys(const NavNodePtr& tree) {
    std::vector<NodeKey> keys;
    for_each_node(tree, [&](const NavNodePtr& node) { keys.push_back(node->key()); });
    return keys;
}

bool can_handle_back_internally(const NavNodePtr& node) {
    if (!node) {
        return false;
    }
    return node->visit(Overloaded{
        [](const ScreenNode&) { return false; },
        [](const StackNode& s) { return s.children.size() > 1; },
        [](const TabNode& t) {
            return can_handle_back_internally(t.active_stack_node()) || t.active_index != 0;
        },
        [](const PaneNode& p) {
            return std::any_of(p.panes.begin(), p.panes.end(), [](const auto& entry) {
                auto stack = active_stack(entry.second.content);
                return stack && stack->as_stack()->children.size() > 1;
            });
        },
    });
}

size_t tree_depth(const NavNodePtr& tree) {
    if (!tree) {
        return 0;
    }
    size_t deepest = 0;
    for (const auto& child : tree->children()) {
        deepest = std::max(deepest, tree_depth(child));
    }
    return deepest + 1;
}

size_t node_count(const NavNodePtr& tree) {
    size_t count = 0;
    for_each_node(tree, [&](const NavNodePtr&) { ++count; });
    return count;
}

void for_each_node(const NavNodePtr& tree, const std::function<void(const NavNodePtr&)>& fn) {
    if (!tree) {
        return;
    }
    fn(tree);
    for (const auto& child : tree->children()) {
        for_each_node(child, fn);
    }
}

NavNodePtr find_first(const NavNodePtr& tree, NavNodeKind kind) {
    if (!tree) {
        return nullptr;
    }
    if (tree->kind() == kind) {
        return tree;
    }
    for (const auto& child : tree->children()) {
        if (auto found = find_first(child, kind)) {
            return found;
        }
    }
    return nullptr;
}

NavNodePtr find_on_active_path(const NavNodePtr& tree, NavNodeKind kind, bool deepest) {
    NavNodePtr match;
    for (const auto& node : active_path_to_leaf(tree)) {
        if (node->kind() == kind) {
            if (!deepest) {
                return node;
            }
            match = node;
        }
    }
    return match;
}

NavNodePtr pane_content(const NavNodePtr& pane, PaneRole role) {
    const auto* node = pane ? pane->as_pane() : nullptr;
    return node ? node->content(role) : nullptr;
}

NavNodePtr active_pane_content(const NavNodePtr& pane) {
    const auto* node = pane ? pane->as_pane() : nullptr;
    return node ? node->active_content() : nullptr;
}

} // namespace wayfinder
