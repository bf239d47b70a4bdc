// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tree_mutator.h"

#include "tree_mutator_internal.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wayfinder {

using namespace mutator_internal;

namespace {

/// Rebuild @p node with @p key swapped for @p replacement; nullptr if @p key is not below @p node
NavNodePtr replace_in(const NavNodePtr& node, const NodeKey& key, const NavNodePtr& replacement) {
    if (node->key() == key) {
        return replacement;
    }
    return node->visit(Overloaded{
        [](const ScreenNode&) -> NavNodePtr { return nullptr; },
        [&](const StackNode& s) -> NavNodePtr {
            for (size_t i = 0; i < s.children.size(); ++i) {
                if (auto rebuilt = replace_in(s.children[i], key, replacement)) {
                    StackNode copy = s;
                    copy.children[i] = std::move(rebuilt);
                    return make_node(std::move(copy));
                }
            }
            return nullptr;
        },
        [&](const TabNode& t) -> NavNodePtr {
            for (size_t i = 0; i < t.stacks.size(); ++i) {
                if (auto rebuilt = replace_in(t.stacks[i], key, replacement)) {
                    TabNode copy = t;
                    copy.stacks[i] = std::move(rebuilt);
                    return make_node(std::move(copy));
                }
            }
            return nullptr;
        },
        [&](const PaneNode& p) -> NavNodePtr {
            for (const auto& [role, config] : p.panes) {
                if (auto rebuilt = replace_in(config.content, key, replacement)) {
                    PaneNode copy = p;
                    copy.panes[role].content = std::move(rebuilt);
                    return make_node(std::move(copy));
                }
            }
            return nullptr;
        },
    });
}

/// Index of the first tab whose stack directly holds a screen of the destination's type
int find_tab_with_destination(const TabNode& tab, const Destination& destination) {
    for (size_t i = 0; i < tab.stacks.size(); ++i) {
        const auto& children = tab.stacks[i]->as_stack()->children;
        bool found = std::any_of(children.begin(), children.end(), [&](const NavNodePtr& child) {
            const auto* screen = child->as_screen();
            return screen && screen->destination.type == destination.type;
        });
        if (found) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

/// Parent stack of an out-of-scope container, or nullptr when it is not held by a stack
NavNodePtr out_of_scope_parent(const NavNodePtr& tree, const NavNodePtr& container) {
    auto parent = parent_of(tree, container);
    if (parent && parent->is_stack()) {
        return parent;
    }
    return nullptr;
}

} // namespace

const char* push_strategy_name(PushStrategy::Type type) {
    switch (type) {
    case PushStrategy::Type::PUSH_TO_STACK:
        return "PushToStack";
    case PushStrategy::Type::SWITCH_TO_TAB:
        return "SwitchToTab";
    case PushStrategy::Type::PUSH_OUT_OF_SCOPE:
        return "PushOutOfScope";
    case PushStrategy::Type::PUSH_TO_PANE_STACK:
        return "PushToPaneStack";
    }
    return "PushToStack";
}

const char* pop_result_name(PopResult::Type type) {
    switch (type) {
    case PopResult::Type::POPPED:
        return "Popped";
    case PopResult::Type::PANE_EMPTY:
        return "PaneEmpty";
    case PopResult::Type::CANNOT_POP:
        return "CannotPop";
    case PopResult::Type::REQUIRES_SCAFFOLD_CHANGE:
        return "RequiresScaffoldChange";
    }
    return "CannotPop";
}

const char* back_result_name(BackResult::Type type) {
    switch (type) {
    case BackResult::Type::HANDLED:
        return "Handled";
    case BackResult::Type::DELEGATE_TO_SYSTEM:
        return "DelegateToSystem";
    case BackResult::Type::CANNOT_HANDLE:
        return "CannotHandle";
    }
    return "CannotHandle";
}

// ============================================================================
// Structural primitives
// ============================================================================

NavNodePtr TreeMutator::replace_node(const NavNodePtr& tree, const NodeKey& key,
                                     const NavNodePtr& new_node) {
    if (!new_node) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              "Replacement for '" + key + "' must not be null");
    }
    if (!tree) {
        throw NavigationError::key_not_found(key);
    }
    auto rebuilt = replace_in(tree, key, new_node);
    if (!rebuilt) {
        throw NavigationError::key_not_found(key);
    }
    return rebuilt;
}

NavNodePtr TreeMutator::remove_node(const NavNodePtr& tree, const NodeKey& key) {
    if (!tree) {
        throw NavigationError::key_not_found(key);
    }
    if (tree->key() == key) {
        return nullptr;
    }

    auto parent = find_parent(tree, key);
    if (!parent) {
        throw NavigationError::key_not_found(key);
    }

    if (parent->is_tab()) {
        throw NavigationError(NavErrorType::INVALID_REMOVAL,
                              "Cannot remove stack '" + key + "' from Tab '" + parent->key() +
                                  "'; use switch_tab instead");
    }
    if (parent->is_pane()) {
        throw NavigationError(NavErrorType::INVALID_REMOVAL,
                              "Cannot remove content '" + key + "' from Pane '" + parent->key() +
                                  "'; use remove_pane_configuration instead");
    }

    const auto& stack = require_stack(parent);
    std::vector<NavNodePtr> remaining;
    remaining.reserve(stack.children.size());
    for (const auto& child : stack.children) {
        if (child->key() != key) {
            remaining.push_back(child);
        }
    }
    return replace_node(tree, parent->key(), with_children(parent, std::move(remaining)));
}

// ============================================================================
// Push
// ============================================================================

NavNodePtr TreeMutator::push(const NavNodePtr& tree, const Destination& destination,
                             const KeyGenerator& key_gen) {
    auto target = active_stack(tree);
    if (!target) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK, "No active stack found in tree");
    }
    return replace_node(tree, target->key(), append_screen(target, destination, key_gen()));
}

NavNodePtr TreeMutator::push(const NavNodePtr& tree, const Destination& destination,
                             const ScopeRegistry& scopes, const KeyGenerator& key_gen) {
    return push(tree, destination, scopes, *PaneRoleRegistry::empty(), key_gen);
}

NavNodePtr TreeMutator::push(const NavNodePtr& tree, const Destination& destination,
                             const ScopeRegistry& scopes, const PaneRoleRegistry& pane_roles,
                             const KeyGenerator& key_gen) {
    // Empty registries impose no routing, including tab matching
    if (&scopes == ScopeRegistry::empty().get() && &pane_roles == PaneRoleRegistry::empty().get()) {
        return push(tree, destination, key_gen);
    }

    auto strategy = resolve_push_strategy(tree, destination, scopes, pane_roles);
    spdlog::debug("[TreeMutator] push {} -> {} ({})", destination.type,
                  push_strategy_name(strategy.type), strategy.target->key());

    switch (strategy.type) {
    case PushStrategy::Type::PUSH_TO_STACK:
    case PushStrategy::Type::PUSH_OUT_OF_SCOPE:
        return replace_node(tree, strategy.target->key(),
                            append_screen(strategy.target, destination, key_gen()));
    case PushStrategy::Type::SWITCH_TO_TAB:
        return switch_tab(tree, strategy.target->key(), strategy.tab_index);
    case PushStrategy::Type::PUSH_TO_PANE_STACK:
        return navigate_to_pane(tree, strategy.target->key(), strategy.pane_role, destination, true,
                                key_gen);
    }
    return tree;
}

PushStrategy TreeMutator::resolve_push_strategy(const NavNodePtr& tree,
                                                const Destination& destination,
                                                const ScopeRegistry& scopes,
                                                const PaneRoleRegistry& pane_roles) {
    auto deepest_stack = active_stack(tree);
    if (!deepest_stack) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK, "No active stack found in tree");
    }

    auto path = active_path_to_leaf(tree);
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        const NavNodePtr& node = *it;
        if (node->is_screen()) {
            continue;
        }

        const auto& scope_key = node->scope_key();
        if (scope_key && !scopes.is_in_scope(*scope_key, destination)) {
            if (auto parent = out_of_scope_parent(tree, node)) {
                return PushStrategy::push_out_of_scope(parent);
            }
            continue;
        }

        if (const auto* tab = node->as_tab()) {
            int existing = find_tab_with_destination(*tab, destination);
            if (existing >= 0 && existing != tab->active_index) {
                return PushStrategy::switch_to_tab(node, existing);
            }
        } else if (const auto* pane = node->as_pane()) {
            if (scope_key) {
                auto role = pane_roles.get_pane_role(*scope_key, destination);
                if (role && pane->has_role(*role) && stack_for_role(*pane, *role)) {
                    return PushStrategy::push_to_pane_stack(node, *role);
                }
            }
        }
    }

    return PushStrategy::push_to_stack(deepest_stack);
}

NavNodePtr TreeMutator::push_to_stack(const NavNodePtr& tree, const NodeKey& stack_key,
                                      const Destination& destination, const KeyGenerator& key_gen) {
    auto target = require_node(tree, stack_key);
    require_stack(target);
    return replace_node(tree, stack_key, append_screen(target, destination, key_gen()));
}

NavNodePtr TreeMutator::push_all(const NavNodePtr& tree, const std::vector<Destination>& destinations,
                                 const KeyGenerator& key_gen) {
    if (destinations.empty()) {
        return tree;
    }
    auto target = active_stack(tree);
    if (!target) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK, "No active stack found in tree");
    }
    StackNode copy = require_stack(target);
    for (const auto& destination : destinations) {
        copy.children.push_back(make_screen(key_gen(), copy.key, destination));
    }
    return replace_node(tree, target->key(), make_node(std::move(copy)));
}

NavNodePtr TreeMutator::clear_and_push(const NavNodePtr& tree, const Destination& destination,
                                       const KeyGenerator& key_gen) {
    auto target = active_stack(tree);
    if (!target) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK, "No active stack found in tree");
    }
    return replace_node(tree, target->key(),
                        with_children(target, {make_screen(key_gen(), target->key(), destination)}));
}

NavNodePtr TreeMutator::clear_stack_and_push(const NavNodePtr& tree, const NodeKey& stack_key,
                                             const Destination& destination,
                                             const KeyGenerator& key_gen) {
    auto target = require_node(tree, stack_key);
    require_stack(target);
    return replace_node(tree, stack_key,
                        with_children(target, {make_screen(key_gen(), stack_key, destination)}));
}

NavNodePtr TreeMutator::replace_current(const NavNodePtr& tree, const Destination& destination,
                                        const KeyGenerator& key_gen) {
    auto target = active_stack(tree);
    if (!target) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK, "No active stack found in tree");
    }
    auto children = require_stack(target).children;
    if (children.empty()) {
        throw NavigationError(NavErrorType::EMPTY_STACK,
                              "Cannot replace in empty stack '" + target->key() + "'");
    }
    children.back() = make_screen(key_gen(), target->key(), destination);
    return replace_node(tree, target->key(), with_children(target, std::move(children)));
}

// ============================================================================
// Tabs
// ============================================================================

NavNodePtr TreeMutator::switch_tab(const NavNodePtr& tree, const NodeKey& tab_key, int index) {
    auto node = require_node(tree, tab_key);
    const auto& tab = require_tab(node);

    if (index < 0 || static_cast<size_t>(index) >= tab.stacks.size()) {
        throw NavigationError::index_out_of_bounds(index, tab.stacks.size());
    }
    if (tab.active_index == index) {
        return tree;
    }

    TabNode copy = tab;
    copy.active_index = index;
    return replace_node(tree, tab_key, make_node(std::move(copy)));
}

NavNodePtr TreeMutator::switch_active_tab(const NavNodePtr& tree, int index) {
    auto tab = find_on_active_path(tree, NavNodeKind::TAB);
    if (!tab) {
        throw NavigationError(NavErrorType::NO_TAB_NODE, "No Tab node on the active path");
    }
    return switch_tab(tree, tab->key(), index);
}

} // namespace wayfinder
