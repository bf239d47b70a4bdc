// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file transition_state.h
 * @brief Gesture/animation state consumed by the presentation layer
 *
 * @pattern Immutable TransitionState snapshots published through a StateCell.
 *          TransitionStateManager is the only writer and enforces the
 *          Idle -> Proposed/Animating -> Idle protocol.
 * @threading Manager calls from the navigator's thread; snapshots readable anywhere.
 * @gotchas Calling an operation from the wrong state throws NavigationError
 *          (INVALID_TRANSITION). update_progress() while Idle is ignored.
 */

#pragma once

#include "nav_node.h"
#include "state_cell.h"

#include <optional>

namespace wayfinder {

enum class TransitionDirection {
    FORWARD,
    BACKWARD,
    NONE
};

const char* transition_direction_name(TransitionDirection direction);

/**
 * @brief One of Idle(current), Proposed(current, proposed, progress) or
 *        Animating(current, target, progress, direction)
 *
 * For Proposed, target holds the proposed tree. Idle has no target.
 */
struct TransitionState {
    enum class Kind {
        IDLE,
        PROPOSED,
        ANIMATING
    };

    Kind kind = Kind::IDLE;
    NavNodePtr current;
    NavNodePtr target;
    float progress = 0.0f;
    TransitionDirection direction = TransitionDirection::NONE;
    std::optional<NavigationTransition> transition; ///< Animation requested by the caller

    static TransitionState idle(NavNodePtr current);
    static TransitionState proposed(NavNodePtr current, NavNodePtr proposed, float progress = 0.0f);
    static TransitionState animating(NavNodePtr current, NavNodePtr target, float progress,
                                     TransitionDirection direction,
                                     std::optional<NavigationTransition> transition = std::nullopt);

    bool is_idle() const {
        return kind == Kind::IDLE;
    }
    bool is_proposed() const {
        return kind == Kind::PROPOSED;
    }
    bool is_animating() const {
        return kind == Kind::ANIMATING;
    }

    /// Progress of a Proposed/Animating state; 0 when Idle
    float progress_value() const {
        return is_idle() ? 0.0f : progress;
    }

    /// Proposed tree, animation target, or current tree when Idle
    const NavNodePtr& effective_target() const {
        return is_idle() ? current : target;
    }

    /// Proposed transitions are always backward
    TransitionDirection effective_direction() const;

    /**
     * @brief Whether the stack @p stack_key changes size or top between current and target
     */
    bool affects_stack(const NodeKey& stack_key) const;

    /// Whether the Tab @p tab_key changes its active index
    bool affects_tab(const NodeKey& tab_key) const;

    /**
     * @brief Child of @p stack_key that the renderer should show underneath
     *
     * Proposed and forward animations: the current top child. Backward
     * animations: the current second-to-last child.
     */
    NavNodePtr previous_child_of(const NodeKey& stack_key) const;

    /// Active index of @p tab_key in the current tree while transitioning
    std::optional<int> previous_tab_index(const NodeKey& tab_key) const;

    /// Tab @p tab_key keeps its active index across the transition
    bool is_intra_tab_navigation(const NodeKey& tab_key) const;

    /// Pane @p pane_key exists on both sides of the transition
    bool is_intra_pane_navigation(const NodeKey& pane_key) const;

    /// Root node variant differs between current and target
    bool is_cross_node_type_navigation() const;

    std::string describe() const;
};

const char* transition_kind_name(TransitionState::Kind kind);

/**
 * @brief Enforces the transition protocol and publishes each state
 *
 * ```
 * Idle      --start_animation-->  Animating
 * Idle      --start_proposed--->  Proposed
 * Proposed  --commit_proposed-->  Animating (BACKWARD, progress carried over)
 * Proposed  --cancel_proposed-->  Idle (pre-gesture tree)
 * Animating --complete_animation-> Idle (target)
 * ```
 */
class TransitionStateManager {
  public:
    explicit TransitionStateManager(NavNodePtr initial);

    TransitionState state() const {
        return cell_.get();
    }

    void start_animation(NavNodePtr target, TransitionDirection direction,
                         std::optional<NavigationTransition> transition = std::nullopt);
    void start_proposed(NavNodePtr proposed);

    /// Clamp @p progress to [0,1] and store it; ignored while Idle
    void update_progress(float progress);

    void commit_proposed();
    void cancel_proposed();
    void complete_animation();

    /// Drop whatever is in flight and rest on @p tree
    void force_idle(NavNodePtr tree);

    StateCell<TransitionState>::Subscription subscribe(StateCell<TransitionState>::Callback callback,
                                                       bool notify_now = false) {
        return cell_.subscribe(std::move(callback), notify_now);
    }

  private:
    [[noreturn]] static void throw_invalid(const char* operation, const TransitionState& state);

    StateCell<TransitionState> cell_;
};

} // namespace wayfinder
