// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file navigator.h
 * @brief Public entry point: holds the tree, applies intents, publishes snapshots
 *
 * @pattern Facade over TreeMutator + TransitionStateManager. Every mutation
 *          replaces the held tree, recomputes the derived projections, cancels
 *          results of screens that left the tree and updates the transition
 *          state, in that order.
 * @threading Single writer: call mutating methods from one thread. Snapshot
 *            getters may be called from any thread.
 * @gotchas Predictive back never touches the held tree until
 *          commit_predictive_back(); cancelling restores nothing because
 *          nothing was changed.
 */

#pragma once

#include "key_generator.h"
#include "nav_registries.h"
#include "navigation_result_manager.h"
#include "state_cell.h"
#include "transition_state.h"
#include "tree_diff.h"
#include "tree_mutator.h"

#include <memory>
#include <optional>
#include <string>

namespace wayfinder {

/**
 * @brief Collaborators and policy for a Navigator
 *
 * Unset registries fall back to the permissive empty() instances; an unset
 * key generator falls back to make_random_key_generator().
 */
struct NavigatorOptions {
    std::shared_ptr<const ScopeRegistry> scopes;
    std::shared_ptr<const ContainerRegistry> containers;
    std::shared_ptr<const PaneRoleRegistry> pane_roles;
    KeyGenerator key_generator;
    bool compact = true; ///< Single-surface layout; affects pane back handling
};

class Navigator {
  public:
    /**
     * @brief Create a navigator resting on @p initial_state
     *
     * A root Stack (no parent) is used as-is. Anything else is wrapped in a
     * new root Stack and re-parented. A null state starts as an empty root
     * Stack.
     */
    explicit Navigator(NavNodePtr initial_state = nullptr, NavigatorOptions options = {});

    /// Cancels any pending results
    ~Navigator();

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    // ========================================================================
    // Snapshots and projections
    // ========================================================================

    NavNodePtr state() const {
        return state_.get();
    }

    TransitionState transition_state() const {
        return transitions_.state();
    }

    /// Destination of the focused screen
    std::optional<Destination> current_destination() const {
        return current_destination_.get();
    }

    /// Destination that back would reveal within the active stack
    std::optional<Destination> previous_destination() const {
        return previous_destination_.get();
    }

    bool can_navigate_back() const {
        return can_navigate_back_.get();
    }

    bool is_compact() const {
        return options_.compact;
    }

    /// Layout signal from the presentation layer; recomputes can_navigate_back
    void set_compact(bool compact);

    StateCell<NavNodePtr>::Subscription
    subscribe_state(StateCell<NavNodePtr>::Callback callback, bool notify_now = false) {
        return state_.subscribe(std::move(callback), notify_now);
    }

    StateCell<TransitionState>::Subscription
    subscribe_transition(StateCell<TransitionState>::Callback callback, bool notify_now = false) {
        return transitions_.subscribe(std::move(callback), notify_now);
    }

    StateCell<std::optional<Destination>>::Subscription
    subscribe_current_destination(StateCell<std::optional<Destination>>::Callback callback,
                                  bool notify_now = false) {
        return current_destination_.subscribe(std::move(callback), notify_now);
    }

    StateCell<bool>::Subscription subscribe_can_navigate_back(StateCell<bool>::Callback callback,
                                                              bool notify_now = false) {
        return can_navigate_back_.subscribe(std::move(callback), notify_now);
    }

    /**
     * @brief Keys added/removed by each mutation, for lifecycle bookkeeping
     */
    StateCell<TreeDiff>::Subscription subscribe_tree_diff(StateCell<TreeDiff>::Callback callback) {
        return last_diff_.subscribe(std::move(callback));
    }

    // ========================================================================
    // Navigation
    // ========================================================================

    /**
     * @brief Navigate to @p destination
     *
     * If the ContainerRegistry wraps the destination in a Tab/Pane container
     * and the active path is not already inside a container of that scope,
     * the container is created and pushed onto the stack holding the current
     * container. Otherwise this is a scope-aware push.
     *
     * @param transition Animation to record; defaults to the destination's own
     */
    void navigate(const Destination& destination,
                  std::optional<NavigationTransition> transition = std::nullopt);

    /**
     * @brief Default back action
     * @return false when back is delegated to the system (nothing left to pop)
     */
    bool navigate_back();

    /// Replace the focused screen. @throws NavigationError EMPTY_STACK
    void navigate_and_replace(const Destination& destination,
                              std::optional<NavigationTransition> transition = std::nullopt);

    /// Active stack becomes exactly [destination]
    void navigate_and_clear_all(const Destination& destination);

    /**
     * @brief Pop back to the topmost screen of type @p clear_route, then navigate
     */
    void navigate_and_clear_to(const Destination& destination,
                               const std::optional<std::string>& clear_route, bool inclusive = false);

    /**
     * @brief navigate() and wait for the focused screen to report a result
     *
     * @p callback receives the value passed to complete_result(), or
     * std::nullopt if the screen leaves the tree first.
     * @return Key of the screen whose result is awaited
     */
    NodeKey navigate_for_result(const Destination& destination,
                                NavigationResultManager::ResultCallback callback,
                                std::optional<NavigationTransition> transition = std::nullopt);

    /// Deliver a result from screen @p screen_key; false if nobody waits for it
    bool complete_result(const NodeKey& screen_key, const json& result);

    /**
     * @brief Replace the whole tree (restoration, external reducers)
     */
    void update_state(NavNodePtr new_state,
                      std::optional<NavigationTransition> transition = std::nullopt);

    // ========================================================================
    // Tabs
    // ========================================================================

    /// Select @p index on the first Tab of the active path. @throws NavigationError NO_TAB_NODE
    void switch_tab(int index);

    void switch_tab(const NodeKey& tab_key, int index);

    /// Active index of the first Tab on the active path
    std::optional<int> active_tab_index() const;

    // ========================================================================
    // Panes (first Pane in the tree)
    // ========================================================================

    /**
     * @brief Push @p destination onto @p role's stack
     *
     * An unconfigured role is added with a fresh stack holding the screen.
     * @throws NavigationError NO_PANE_NODE if the tree has no Pane
     */
    void navigate_to_pane(const Destination& destination, PaneRole role, bool switch_focus = true);

    void switch_pane(PaneRole role);

    /// Pop @p role's stack; false when it is at its root
    bool navigate_back_in_pane(PaneRole role);

    /// Drop everything above @p role's root screen
    void clear_pane(PaneRole role);

    bool is_pane_available(PaneRole role) const;

    NavNodePtr pane_content(PaneRole role) const;

    // ========================================================================
    // Predictive back and transitions
    // ========================================================================

    /**
     * @brief Begin a back gesture, previewing what back would produce
     * @return false (and stays Idle) when back would not change the tree
     *         or a transition is already in flight
     */
    bool start_predictive_back();

    void update_predictive_back(float progress);

    /// Abandon the gesture; the held tree was never changed
    void cancel_predictive_back();

    /// Apply the previewed tree and animate the rest of the way back
    void commit_predictive_back();

    void update_transition_progress(float progress);

    /// Finish an animation; no-op while Idle
    void complete_transition();

    NavigationResultManager& result_manager() {
        return results_;
    }

  private:
    NavNodePtr create_root_stack(NavNodePtr initial);
    NavNodePtr push_container(const NavNodePtr& root, const ContainerInfo& info);
    NavNodePtr require_pane_node() const;

    /// Publish @p new_state and settle the transition state for it
    void commit_state(NavNodePtr new_state, std::optional<NavigationTransition> transition,
                      TransitionDirection direction);

    /// Publish @p new_state without touching the transition state
    void apply_state(const NavNodePtr& new_state);

    void update_derived_state(const NavNodePtr& tree);

    NavigatorOptions options_;
    StateCell<NavNodePtr> state_;
    TransitionStateManager transitions_;
    StateCell<std::optional<Destination>> current_destination_;
    StateCell<std::optional<Destination>> previous_destination_;
    StateCell<bool> can_navigate_back_;
    StateCell<TreeDiff> last_diff_;
    NavigationResultManager results_;
};

/**
 * @brief Scope key of the container the active path currently sits in
 *
 * Follows the root's active children through Stacks and stops at the first
 * Tab or Pane.
 */
std::optional<std::string> current_scope_key(const NavNodePtr& tree);

/**
 * @brief Stack that should receive a newly created container
 *
 * The stack directly holding the current Tab/Pane, the innermost stack of a
 * chain of nested stacks, or the root.
 */
NavNodePtr find_container_parent_stack(const NavNodePtr& tree);

/// Second-to-last entry of the active stack, resolved to its focused screen
std::optional<Destination> compute_previous_destination(const NavNodePtr& tree);

} // namespace wayfinder
