// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tree_mutator.h"

#include "tree_mutator_internal.h"

#include <spdlog/spdlog.h>

namespace wayfinder {

using namespace mutator_internal;

namespace {

/**
 * @brief Remove an emptied stack, walking up while each parent stack would empty too
 *
 * @p emptied is the stack as it exists in @p tree (still holding its last
 * child); the result never contains it. Tab and Pane parents keep the stack,
 * cleared, since they cannot lose a child.
 */
NavNodePtr cascade_empty_stack(const NavNodePtr& tree, const NavNodePtr& emptied) {
    NavNodePtr current = emptied;
    while (true) {
        if (!current->parent_key()) {
            spdlog::trace("[TreeMutator] cascade reached root '{}', nothing to pop", current->key());
            return nullptr;
        }
        auto parent = find_by_key(tree, *current->parent_key());
        if (!parent) {
            return nullptr;
        }

        if (parent->is_tab() || parent->is_pane()) {
            return TreeMutator::replace_node(tree, current->key(), with_children(current, {}));
        }

        if (parent->is_stack()) {
            if (require_stack(parent).children.size() > 1) {
                spdlog::trace("[TreeMutator] cascade removes '{}' from '{}'", current->key(),
                              parent->key());
                return TreeMutator::remove_node(tree, current->key());
            }
            // Parent only holds the emptied node, so it empties as well
            current = parent;
            continue;
        }

        return nullptr;
    }
}

} // namespace

NavNodePtr TreeMutator::pop(const NavNodePtr& tree, PopBehavior behavior) {
    auto target = active_stack(tree);
    if (!target) {
        return nullptr;
    }

    auto children = require_stack(target).children;
    if (children.empty()) {
        return nullptr;
    }
    children.pop_back();

    if (!children.empty() || behavior == PopBehavior::PRESERVE_EMPTY) {
        return replace_node(tree, target->key(), with_children(target, std::move(children)));
    }
    return cascade_empty_stack(tree, target);
}

NavNodePtr TreeMutator::pop_to(const NavNodePtr& tree, const NodePredicate& predicate,
                               bool inclusive) {
    auto target = active_stack(tree);
    if (!target) {
        return tree;
    }

    const auto& children = require_stack(target).children;
    int match = -1;
    for (int i = static_cast<int>(children.size()) - 1; i >= 0; --i) {
        if (predicate(children[static_cast<size_t>(i)])) {
            match = i;
            break;
        }
    }
    if (match < 0) {
        return tree;
    }

    size_t keep = static_cast<size_t>(inclusive ? match : match + 1);
    if (keep == 0) {
        return tree;
    }
    if (keep == children.size()) {
        return tree;
    }

    std::vector<NavNodePtr> kept(children.begin(), children.begin() + static_cast<long>(keep));
    return replace_node(tree, target->key(), with_children(target, std::move(kept)));
}

NavNodePtr TreeMutator::pop_to_key(const NavNodePtr& tree, const NodeKey& key, bool inclusive) {
    return pop_to(
        tree, [&key](const NavNodePtr& node) { return node->key() == key; }, inclusive);
}

NavNodePtr TreeMutator::pop_to_route(const NavNodePtr& tree, const std::string& route,
                                     bool inclusive) {
    return pop_to(
        tree,
        [&route](const NavNodePtr& node) {
            const auto* screen = node->as_screen();
            return screen && screen->destination.type == route;
        },
        inclusive);
}

} // namespace wayfinder
