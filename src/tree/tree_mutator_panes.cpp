// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tree_mutator.h"

#include "tree_mutator_internal.h"

#include <spdlog/spdlog.h>

namespace wayfinder {

using namespace mutator_internal;

namespace {

PopResult pop_or_cannot(const NavNodePtr& tree) {
    auto popped = TreeMutator::pop(tree);
    return popped ? PopResult::popped(popped) : PopResult::cannot_pop();
}

/// Clear @p role's stack and move focus back to Primary
NavNodePtr clear_and_refocus_primary(const NavNodePtr& tree, const NodeKey& pane_key,
                                     PaneRole role) {
    auto cleared = TreeMutator::clear_pane_stack(tree, pane_key, role);
    return TreeMutator::switch_active_pane(cleared, pane_key, PaneRole::PRIMARY);
}

PopResult pop_until_content_change(const NavNodePtr& tree, const PaneNode& pane) {
    std::vector<PaneRole> poppable;
    for (const auto& [role, config] : pane.panes) {
        auto stack = active_stack(config.content);
        if (stack && stack_size(stack) > 1) {
            poppable.push_back(role);
        }
    }

    if (poppable.empty()) {
        if (pane.active_role != PaneRole::PRIMARY) {
            return PopResult::popped(clear_and_refocus_primary(tree, pane.key, pane.active_role));
        }
        return PopResult::pane_empty(pane.active_role);
    }

    PaneRole target = poppable.front();
    for (PaneRole role : poppable) {
        if (role == pane.active_role) {
            target = role;
            break;
        }
    }

    auto popped = TreeMutator::pop_pane(tree, pane.key, target);
    if (!popped) {
        return PopResult::pane_empty(pane.active_role);
    }

    // A secondary pane back at its root is cleared so it does not stay pinned open
    if (target != PaneRole::PRIMARY) {
        const auto& updated = require_pane(require_node(popped, pane.key));
        auto stack = active_stack(updated.content(target));
        if (stack && stack_size(stack) <= 1) {
            return PopResult::popped(clear_and_refocus_primary(popped, pane.key, target));
        }
    }
    return PopResult::popped(popped);
}

/// Compact-layout pop: the active role behaves like a plain stack
PopResult pop_from_active_pane(const NavNodePtr& tree, const PaneNode& pane) {
    auto stack = active_stack(pane.active_content());
    if (!stack) {
        return PopResult::pane_empty(pane.active_role);
    }

    const auto& children = require_stack(stack).children;
    if (children.size() <= 1) {
        if (pane.active_role != PaneRole::PRIMARY) {
            return PopResult::popped(clear_and_refocus_primary(tree, pane.key, pane.active_role));
        }
        return PopResult::pane_empty(pane.active_role);
    }

    std::vector<NavNodePtr> remaining(children.begin(), children.end() - 1);
    return PopResult::popped(
        TreeMutator::replace_node(tree, stack->key(), with_children(stack, std::move(remaining))));
}

} // namespace

// ============================================================================
// Pane mutations
// ============================================================================

NavNodePtr TreeMutator::navigate_to_pane(const NavNodePtr& tree, const NodeKey& pane_key,
                                         PaneRole role, const Destination& destination,
                                         bool switch_focus, const KeyGenerator& key_gen) {
    auto node = require_node(tree, pane_key);
    const auto& pane = require_pane(node);
    require_role(pane, role);

    auto target = stack_for_role(pane, role);
    if (!target) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK,
                              std::string("No stack found in pane role ") + pane_role_name(role) +
                                  " of '" + pane_key + "'");
    }

    auto result = replace_node(tree, target->key(), append_screen(target, destination, key_gen()));
    if (switch_focus && pane.active_role != role) {
        result = switch_active_pane(result, pane_key, role);
    }
    return result;
}

NavNodePtr TreeMutator::switch_active_pane(const NavNodePtr& tree, const NodeKey& pane_key,
                                           PaneRole role) {
    auto node = require_node(tree, pane_key);
    const auto& pane = require_pane(node);
    require_role(pane, role);

    if (pane.active_role == role) {
        return tree;
    }
    return replace_node(tree, pane_key, with_active_role(node, role));
}

NavNodePtr TreeMutator::pop_pane(const NavNodePtr& tree, const NodeKey& pane_key, PaneRole role) {
    auto node = require_node(tree, pane_key);
    const auto& pane = require_pane(node);
    require_role(pane, role);

    auto target = stack_for_role(pane, role);
    if (!target) {
        return nullptr;
    }
    const auto& children = require_stack(target).children;
    if (children.size() <= 1) {
        return nullptr;
    }

    std::vector<NavNodePtr> remaining(children.begin(), children.end() - 1);
    return replace_node(tree, target->key(), with_children(target, std::move(remaining)));
}

NavNodePtr TreeMutator::set_pane_configuration(const NavNodePtr& tree, const NodeKey& pane_key,
                                               PaneRole role, PaneConfiguration config) {
    auto node = require_node(tree, pane_key);
    PaneNode copy = require_pane(node);
    if (config.content) {
        config.content = with_parent_key(config.content, pane_key);
    }
    copy.panes[role] = std::move(config);
    return replace_node(tree, pane_key, make_node(std::move(copy)));
}

NavNodePtr TreeMutator::remove_pane_configuration(const NavNodePtr& tree, const NodeKey& pane_key,
                                                  PaneRole role) {
    if (role == PaneRole::PRIMARY) {
        throw NavigationError(NavErrorType::PRIMARY_PANE_REQUIRED,
                              "Cannot remove the primary pane of '" + pane_key + "'");
    }

    auto node = require_node(tree, pane_key);
    PaneNode copy = require_pane(node);
    copy.panes.erase(role);
    if (copy.active_role == role) {
        copy.active_role = PaneRole::PRIMARY;
    }
    return replace_node(tree, pane_key, make_node(std::move(copy)));
}

NavNodePtr TreeMutator::clear_pane_stack(const NavNodePtr& tree, const NodeKey& pane_key,
                                         PaneRole role) {
    auto node = require_node(tree, pane_key);
    const auto& pane = require_pane(node);
    auto target = stack_for_role(pane, role);
    if (!target || require_stack(target).children.empty()) {
        return tree;
    }
    return replace_node(tree, target->key(), with_children(target, {}));
}

// ============================================================================
// Pane back resolution
// ============================================================================

PopResult TreeMutator::pop_with_pane_behavior(const NavNodePtr& tree) {
    auto pane_node = find_on_active_path(tree, NavNodeKind::PANE, true);
    if (!pane_node) {
        return pop_or_cannot(tree);
    }

    auto stack = active_stack(tree);
    if (!stack) {
        return PopResult::cannot_pop();
    }
    if (stack_size(stack) > 1) {
        return pop_or_cannot(tree);
    }

    const auto& pane = *pane_node->as_pane();
    spdlog::trace("[TreeMutator] pane '{}' at root of {}, applying {}", pane.key,
                  pane_role_name(pane.active_role), pane_back_behavior_name(pane.back_behavior));

    switch (pane.back_behavior) {
    case PaneBackBehavior::POP_LATEST:
        return pop_or_cannot(tree);

    case PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE:
        if (pane.active_role != PaneRole::PRIMARY) {
            return PopResult::popped(switch_active_pane(tree, pane.key, PaneRole::PRIMARY));
        }
        return PopResult::requires_scaffold_change();

    case PaneBackBehavior::POP_UNTIL_CURRENT_DESTINATION_CHANGE:
        for (const auto& [role, config] : pane.panes) {
            if (role == pane.active_role) {
                continue;
            }
            auto candidate = active_stack(config.content);
            if (candidate && stack_size(candidate) > 0) {
                return PopResult::popped(switch_active_pane(tree, pane.key, role));
            }
        }
        return PopResult::pane_empty(pane.active_role);

    case PaneBackBehavior::POP_UNTIL_CONTENT_CHANGE:
        return pop_until_content_change(tree, pane);
    }
    return PopResult::cannot_pop();
}

PopResult TreeMutator::pop_pane_adaptive(const NavNodePtr& tree, bool is_compact) {
    auto pane_node = find_on_active_path(tree, NavNodeKind::PANE);
    if (!pane_node) {
        return pop_or_cannot(tree);
    }
    if (is_compact) {
        return pop_from_active_pane(tree, *pane_node->as_pane());
    }
    return pop_with_pane_behavior(tree);
}

} // namespace wayfinder
