// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tree_mutator.h"

#include "tree_mutator_internal.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wayfinder {

using namespace mutator_internal;

namespace {

// Back resolution walks upward from the active stack. Each handler receives the
// container that ran out of history and decides whether its parent can drop it.

BackResult handle_tab_back(const NavNodePtr& tree, const NavNodePtr& tab);
BackResult handle_nested_stack_back(const NavNodePtr& tree, const NavNodePtr& parent_stack,
                                    const NavNodePtr& child);
BackResult handle_pane_back(const NavNodePtr& tree, const NavNodePtr& pane, bool is_compact);

BackResult remove_from_parent(const NavNodePtr& tree, const NavNodePtr& node) {
    auto result = TreeMutator::remove_node(tree, node->key());
    if (!result) {
        return BackResult::cannot_handle();
    }
    return BackResult::handled(result);
}

/// Continue resolution one level above @p stack, which holds a single exhausted child
BackResult cascade_above(const NavNodePtr& tree, const NavNodePtr& stack) {
    auto grandparent = parent_of(tree, stack);
    if (!grandparent) {
        return BackResult::delegate_to_system();
    }
    switch (grandparent->kind()) {
    case NavNodeKind::STACK:
        return handle_nested_stack_back(tree, grandparent, stack);
    case NavNodeKind::TAB:
        return handle_tab_back(tree, grandparent);
    case NavNodeKind::PANE:
        return handle_pane_back(tree, grandparent, true);
    case NavNodeKind::SCREEN:
        break;
    }
    return BackResult::delegate_to_system();
}

/**
 * @brief Drop @p container from its parent stack, or cascade if it is the only child
 */
BackResult pop_container(const NavNodePtr& tree, const NavNodePtr& container,
                         const NavNodePtr& parent_stack) {
    if (stack_size(parent_stack) > 1) {
        return remove_from_parent(tree, container);
    }
    if (!parent_stack->parent_key()) {
        return BackResult::delegate_to_system();
    }
    return cascade_above(tree, parent_stack);
}

BackResult handle_root_stack_back(const NavNodePtr& tree, const NavNodePtr& stack) {
    if (stack_size(stack) <= 1) {
        return BackResult::delegate_to_system();
    }
    auto popped = TreeMutator::pop(tree);
    return popped ? BackResult::handled(popped) : BackResult::cannot_handle();
}

BackResult handle_tab_back(const NavNodePtr& tree, const NavNodePtr& tab) {
    auto parent = parent_of(tree, tab);
    if (!parent) {
        return BackResult::delegate_to_system();
    }
    if (parent->is_stack()) {
        return pop_container(tree, tab, parent);
    }
    if (parent->is_tab()) {
        return handle_tab_back(tree, parent);
    }
    return BackResult::delegate_to_system();
}

BackResult handle_nested_stack_back(const NavNodePtr& tree, const NavNodePtr& parent_stack,
                                    const NavNodePtr& child) {
    return pop_container(tree, child, parent_stack);
}

BackResult pop_entire_pane(const NavNodePtr& tree, const NavNodePtr& pane_node) {
    auto parent = parent_of(tree, pane_node);
    if (!parent) {
        return BackResult::delegate_to_system();
    }

    switch (parent->kind()) {
    case NavNodeKind::STACK:
        return pop_container(tree, pane_node, parent);
    case NavNodeKind::TAB:
    case NavNodeKind::PANE: {
        if (!active_stack(pane_node->as_pane()->active_content())) {
            return BackResult::delegate_to_system();
        }
        return parent->is_tab() ? handle_tab_back(tree, parent)
                                : handle_pane_back(tree, parent, true);
    }
    case NavNodeKind::SCREEN:
        break;
    }
    return BackResult::delegate_to_system();
}

BackResult handle_pane_back(const NavNodePtr& tree, const NavNodePtr& pane, bool is_compact) {
    // Expanded layouts leave the whole pane view on back
    if (!is_compact) {
        return pop_entire_pane(tree, pane);
    }

    auto result = TreeMutator::pop_with_pane_behavior(tree);
    switch (result.type) {
    case PopResult::Type::POPPED:
        return BackResult::handled(result.new_state);
    case PopResult::Type::CANNOT_POP:
    case PopResult::Type::PANE_EMPTY:
        return pop_entire_pane(tree, pane);
    case PopResult::Type::REQUIRES_SCAFFOLD_CHANGE:
        return BackResult::cannot_handle();
    }
    return BackResult::cannot_handle();
}

bool parent_stack_has_siblings(const NavNodePtr& tree, const NavNodePtr& node) {
    auto parent = parent_of(tree, node);
    return parent && parent->is_stack() && stack_size(parent) > 1;
}

} // namespace

BackResult TreeMutator::pop_with_tab_behavior(const NavNodePtr& tree, bool is_compact) {
    auto stack = active_stack(tree);
    if (!stack) {
        return BackResult::cannot_handle();
    }

    if (stack_size(stack) > 1) {
        auto popped = pop(tree);
        return popped ? BackResult::handled(popped) : BackResult::cannot_handle();
    }

    auto parent = parent_of(tree, stack);
    if (!parent) {
        if (stack->parent_key()) {
            return BackResult::cannot_handle();
        }
        return handle_root_stack_back(tree, stack);
    }

    BackResult result = BackResult::cannot_handle();
    switch (parent->kind()) {
    case NavNodeKind::TAB:
        result = handle_tab_back(tree, parent);
        break;
    case NavNodeKind::STACK:
        result = handle_nested_stack_back(tree, parent, stack);
        break;
    case NavNodeKind::PANE:
        result = handle_pane_back(tree, parent, is_compact);
        break;
    case NavNodeKind::SCREEN:
        break;
    }
    spdlog::trace("[TreeMutator] back from '{}' via {} -> {}", stack->key(),
                  nav_node_kind_name(parent->kind()), back_result_name(result.type));
    return result;
}

bool TreeMutator::can_handle_back_navigation(const NavNodePtr& tree) {
    auto stack = active_stack(tree);
    if (!stack) {
        return false;
    }
    if (stack_size(stack) > 1) {
        return true;
    }

    auto parent = parent_of(tree, stack);
    if (!parent) {
        return false;
    }

    switch (parent->kind()) {
    case NavNodeKind::TAB:
        return parent_stack_has_siblings(tree, parent);
    case NavNodeKind::STACK:
        return stack_size(parent) > 1;
    case NavNodeKind::PANE: {
        const auto& pane = *parent->as_pane();
        bool any_pane_can_go_back =
            std::any_of(pane.panes.begin(), pane.panes.end(), [](const auto& entry) {
                return stack_size(active_stack(entry.second.content)) > 1;
            });
        return any_pane_can_go_back || parent_stack_has_siblings(tree, parent);
    }
    case NavNodeKind::SCREEN:
        break;
    }
    return false;
}

} // namespace wayfinder
