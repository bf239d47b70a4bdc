// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file tree_mutator.h
 * @brief Pure reducer operations over the navigation tree
 *
 * @pattern Static functions (tree, args) -> new tree. Only the ancestor chain
 *          of a changed node is rebuilt; every other subtree is shared with
 *          the input tree.
 * @threading Stateless; safe from any thread.
 * @gotchas "Nothing to do" is reported with a null NavNodePtr, PopResult or
 *          BackResult. NavigationError is thrown only for caller mistakes
 *          (unknown key, wrong node type, unconfigured role, bad index).
 */

#pragma once

#include "key_generator.h"
#include "nav_node.h"
#include "nav_registries.h"

#include <functional>
#include <vector>

namespace wayfinder {

/**
 * @brief What pop does when it empties a stack
 */
enum class PopBehavior {
    PRESERVE_EMPTY, // Leave the empty stack in place
    CASCADE         // Remove the empty stack from a parent stack, recursively
};

/**
 * @brief Where a scope-aware push lands
 */
struct PushStrategy {
    enum class Type {
        PUSH_TO_STACK,      // Append to target (the deepest active stack)
        SWITCH_TO_TAB,      // Select tab_index on target (a Tab); no new screen
        PUSH_OUT_OF_SCOPE,  // Append to target, the stack holding an out-of-scope container
        PUSH_TO_PANE_STACK  // Append to pane_role's stack on target (a Pane) and focus it
    };

    Type type = Type::PUSH_TO_STACK;
    NavNodePtr target;
    int tab_index = -1;
    PaneRole pane_role = PaneRole::PRIMARY;

    static PushStrategy push_to_stack(NavNodePtr stack) {
        return {Type::PUSH_TO_STACK, std::move(stack), -1, PaneRole::PRIMARY};
    }
    static PushStrategy switch_to_tab(NavNodePtr tab, int index) {
        return {Type::SWITCH_TO_TAB, std::move(tab), index, PaneRole::PRIMARY};
    }
    static PushStrategy push_out_of_scope(NavNodePtr parent_stack) {
        return {Type::PUSH_OUT_OF_SCOPE, std::move(parent_stack), -1, PaneRole::PRIMARY};
    }
    static PushStrategy push_to_pane_stack(NavNodePtr pane, PaneRole role) {
        return {Type::PUSH_TO_PANE_STACK, std::move(pane), -1, role};
    }
};

const char* push_strategy_name(PushStrategy::Type type);

/**
 * @brief Outcome of pane-aware pop operations
 */
struct PopResult {
    enum class Type {
        POPPED,                  // new_state holds the resulting tree
        PANE_EMPTY,              // pane_role has nothing left to pop
        CANNOT_POP,              // no pop possible at all
        REQUIRES_SCAFFOLD_CHANGE // only the presentation layer can resolve this back
    };

    Type type = Type::CANNOT_POP;
    NavNodePtr new_state;
    PaneRole pane_role = PaneRole::PRIMARY;

    bool is_popped() const {
        return type == Type::POPPED;
    }

    static PopResult popped(NavNodePtr tree) {
        return {Type::POPPED, std::move(tree), PaneRole::PRIMARY};
    }
    static PopResult pane_empty(PaneRole role) {
        return {Type::PANE_EMPTY, nullptr, role};
    }
    static PopResult cannot_pop() {
        return {Type::CANNOT_POP, nullptr, PaneRole::PRIMARY};
    }
    static PopResult requires_scaffold_change() {
        return {Type::REQUIRES_SCAFFOLD_CHANGE, nullptr, PaneRole::PRIMARY};
    }
};

/**
 * @brief Outcome of tree-aware back resolution
 */
struct BackResult {
    enum class Type {
        HANDLED,            // new_state holds the resulting tree
        DELEGATE_TO_SYSTEM, // nothing left to go back to; host decides (e.g. exit)
        CANNOT_HANDLE       // caller should fall back to another strategy
    };

    Type type = Type::CANNOT_HANDLE;
    NavNodePtr new_state;

    bool is_handled() const {
        return type == Type::HANDLED;
    }

    static BackResult handled(NavNodePtr tree) {
        return {Type::HANDLED, std::move(tree)};
    }
    static BackResult delegate_to_system() {
        return {Type::DELEGATE_TO_SYSTEM, nullptr};
    }
    static BackResult cannot_handle() {
        return {Type::CANNOT_HANDLE, nullptr};
    }
};

const char* pop_result_name(PopResult::Type type);
const char* back_result_name(BackResult::Type type);

using NodePredicate = std::function<bool(const NavNodePtr&)>;

class TreeMutator {
  public:
    TreeMutator() = delete;

    // ========================================================================
    // Push
    // ========================================================================

    /**
     * @brief Append a screen for @p destination to the active stack
     * @throws NavigationError NO_ACTIVE_STACK if the tree has no stack on its active path
     */
    static NavNodePtr push(const NavNodePtr& tree, const Destination& destination,
                           const KeyGenerator& key_gen);

    /**
     * @brief Scope-aware push
     *
     * Walks the active path deepest to shallowest and picks exactly one
     * PushStrategy (see resolve_push_strategy()). With the empty registries
     * this behaves like the plain push.
     */
    static NavNodePtr push(const NavNodePtr& tree, const Destination& destination,
                           const ScopeRegistry& scopes, const KeyGenerator& key_gen);

    static NavNodePtr push(const NavNodePtr& tree, const Destination& destination,
                           const ScopeRegistry& scopes, const PaneRoleRegistry& pane_roles,
                           const KeyGenerator& key_gen);

    /**
     * @brief Decide where a scope-aware push of @p destination lands
     *
     * - a scoped Stack/Tab/Pane that rejects the destination, with a Stack
     *   parent: PUSH_OUT_OF_SCOPE onto that parent
     * - an in-scope Tab where another tab's stack already holds a screen of the
     *   same destination type: SWITCH_TO_TAB
     * - an in-scope scoped Pane with a configured role for the destination:
     *   PUSH_TO_PANE_STACK
     * - otherwise PUSH_TO_STACK on the active stack
     *
     * @throws NavigationError NO_ACTIVE_STACK
     */
    static PushStrategy resolve_push_strategy(const NavNodePtr& tree, const Destination& destination,
                                              const ScopeRegistry& scopes,
                                              const PaneRoleRegistry& pane_roles);

    /// Append to a specific stack. @throws NavigationError KEY_NOT_FOUND / WRONG_NODE_TYPE
    static NavNodePtr push_to_stack(const NavNodePtr& tree, const NodeKey& stack_key,
                                    const Destination& destination, const KeyGenerator& key_gen);

    /// Append several screens to the active stack in order; empty list returns @p tree
    static NavNodePtr push_all(const NavNodePtr& tree, const std::vector<Destination>& destinations,
                               const KeyGenerator& key_gen);

    /// Active stack becomes exactly one screen for @p destination
    static NavNodePtr clear_and_push(const NavNodePtr& tree, const Destination& destination,
                                     const KeyGenerator& key_gen);

    static NavNodePtr clear_stack_and_push(const NavNodePtr& tree, const NodeKey& stack_key,
                                           const Destination& destination,
                                           const KeyGenerator& key_gen);

    /**
     * @brief Swap the top screen of the active stack for a new one
     * @throws NavigationError EMPTY_STACK if the active stack has no children
     */
    static NavNodePtr replace_current(const NavNodePtr& tree, const Destination& destination,
                                      const KeyGenerator& key_gen);

    // ========================================================================
    // Pop
    // ========================================================================

    /**
     * @brief Remove the last child of the active stack
     * @return New tree, or nullptr when there is nothing to pop (no active
     *         stack, empty stack, or a cascade that reaches the root)
     */
    static NavNodePtr pop(const NavNodePtr& tree, PopBehavior behavior = PopBehavior::PRESERVE_EMPTY);

    /**
     * @brief Truncate the active stack after the topmost child matching @p predicate
     *
     * With @p inclusive the match is removed too. Returns @p tree unchanged if
     * nothing matches or if the stack would end up empty.
     */
    static NavNodePtr pop_to(const NavNodePtr& tree, const NodePredicate& predicate,
                             bool inclusive = false);

    static NavNodePtr pop_to_key(const NavNodePtr& tree, const NodeKey& key, bool inclusive = false);

    /// pop_to() matching screens whose destination type equals @p route
    static NavNodePtr pop_to_route(const NavNodePtr& tree, const std::string& route,
                                   bool inclusive = false);

    // ========================================================================
    // Tabs
    // ========================================================================

    /**
     * @brief Select tab @p index on the Tab node @p tab_key
     * @return Same tree object if the tab is already selected
     * @throws NavigationError KEY_NOT_FOUND, WRONG_NODE_TYPE, INDEX_OUT_OF_BOUNDS
     */
    static NavNodePtr switch_tab(const NavNodePtr& tree, const NodeKey& tab_key, int index);

    /**
     * @brief switch_tab() on the first Tab of the active path
     * @throws NavigationError NO_TAB_NODE if the active path has no Tab
     */
    static NavNodePtr switch_active_tab(const NavNodePtr& tree, int index);

    // ========================================================================
    // Panes
    // ========================================================================

    /**
     * @brief Append a screen to @p role's stack in pane @p pane_key
     * @param switch_focus Also make @p role the active role
     * @throws NavigationError KEY_NOT_FOUND, WRONG_NODE_TYPE, ROLE_NOT_CONFIGURED
     */
    static NavNodePtr navigate_to_pane(const NavNodePtr& tree, const NodeKey& pane_key,
                                       PaneRole role, const Destination& destination,
                                       bool switch_focus, const KeyGenerator& key_gen);

    /// @return Same tree object if @p role is already active
    static NavNodePtr switch_active_pane(const NavNodePtr& tree, const NodeKey& pane_key,
                                         PaneRole role);

    /**
     * @brief Pop @p role's stack inside pane @p pane_key
     * @return nullptr when that stack has one entry or fewer
     */
    static NavNodePtr pop_pane(const NavNodePtr& tree, const NodeKey& pane_key, PaneRole role);

    /// Add or replace the configuration for @p role
    static NavNodePtr set_pane_configuration(const NavNodePtr& tree, const NodeKey& pane_key,
                                             PaneRole role, PaneConfiguration config);

    /**
     * @brief Drop @p role from the pane; focus moves to Primary if @p role was active
     * @throws NavigationError PRIMARY_PANE_REQUIRED for PaneRole::PRIMARY
     */
    static NavNodePtr remove_pane_configuration(const NavNodePtr& tree, const NodeKey& pane_key,
                                                PaneRole role);

    /// Remove every entry from @p role's stack; unchanged if the role is not configured
    static NavNodePtr clear_pane_stack(const NavNodePtr& tree, const NodeKey& pane_key,
                                       PaneRole role);

    /**
     * @brief Back inside the deepest Pane on the active path, honoring its PaneBackBehavior
     */
    static PopResult pop_with_pane_behavior(const NavNodePtr& tree);

    /**
     * @brief Back inside the shallowest Pane on the active path
     *
     * Compact layouts pop the active role's stack like a plain stack (a
     * secondary role at its root is cleared and focus returns to Primary).
     * Expanded layouts use pop_with_pane_behavior().
     */
    static PopResult pop_pane_adaptive(const NavNodePtr& tree, bool is_compact);

    // ========================================================================
    // Back resolution
    // ========================================================================

    /**
     * @brief Resolve the default back action against the whole tree
     *
     * Pops the active stack when it has history; otherwise removes the
     * enclosing Tab/Stack/Pane from its parent stack, cascading upwards while
     * parents hold a single child. A root with nothing left delegates to the
     * system.
     */
    static BackResult pop_with_tab_behavior(const NavNodePtr& tree, bool is_compact = true);

    /// Whether pop_with_tab_behavior() could produce a Handled result
    static bool can_handle_back_navigation(const NavNodePtr& tree);

    // ========================================================================
    // Structural primitives
    // ========================================================================

    /**
     * @brief Replace the node with @p key by @p new_node
     *
     * Rebuilds only the ancestors of the replaced node.
     * @throws NavigationError KEY_NOT_FOUND
     */
    static NavNodePtr replace_node(const NavNodePtr& tree, const NodeKey& key,
                                   const NavNodePtr& new_node);

    /**
     * @brief Remove the node with @p key from its parent stack
     * @return New tree, or nullptr when @p key is the root
     * @throws NavigationError KEY_NOT_FOUND, or INVALID_REMOVAL for a Tab's
     *         stack or a Pane's content
     */
    static NavNodePtr remove_node(const NavNodePtr& tree, const NodeKey& key);
};

} // namespace wayfinder
