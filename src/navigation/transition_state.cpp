// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "transition_state.h"

#include "nav_error.h"
#include "nav_tree.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace wayfinder {

namespace {

float clamp_progress(float progress) {
    return std::clamp(progress, 0.0f, 1.0f);
}

/// Stacks (matched by key along both active paths) whose size or top child differ
void collect_changed_stacks(const NavNodePtr& from, const NavNodePtr& to,
                            std::set<NodeKey>& changed) {
    if (!from || !to || from->key() != to->key() || from->kind() != to->kind()) {
        return;
    }
    if (from == to) {
        return;
    }

    from->visit(Overloaded{
        [](const ScreenNode&) {},
        [&](const StackNode& a) {
            const auto& b = *to->as_stack();
            auto a_top = a.active_child();
            auto b_top = b.active_child();
            bool top_changed = (a_top ? a_top->key() : "") != (b_top ? b_top->key() : "");
            if (a.children.size() != b.children.size() || top_changed) {
                changed.insert(a.key);
            }
            collect_changed_stacks(a_top, b_top, changed);
        },
        [&](const TabNode& a) {
            const auto& b = *to->as_tab();
            size_t n = std::min(a.stacks.size(), b.stacks.size());
            for (size_t i = 0; i < n; ++i) {
                collect_changed_stacks(a.stacks[i], b.stacks[i], changed);
            }
        },
        [&](const PaneNode& a) {
            const auto& b = *to->as_pane();
            for (const auto& [role, config] : a.panes) {
                collect_changed_stacks(config.content, b.content(role), changed);
            }
        },
    });
}

const TabNode* find_tab(const NavNodePtr& tree, const NodeKey& key) {
    auto node = find_by_key(tree, key);
    return node ? node->as_tab() : nullptr;
}

const StackNode* find_stack(const NavNodePtr& tree, const NodeKey& key) {
    auto node = find_by_key(tree, key);
    return node ? node->as_stack() : nullptr;
}

} // namespace

const char* transition_direction_name(TransitionDirection direction) {
    switch (direction) {
    case TransitionDirection::FORWARD:
        return "forward";
    case TransitionDirection::BACKWARD:
        return "backward";
    case TransitionDirection::NONE:
        return "none";
    }
    return "none";
}

const char* transition_kind_name(TransitionState::Kind kind) {
    switch (kind) {
    case TransitionState::Kind::IDLE:
        return "Idle";
    case TransitionState::Kind::PROPOSED:
        return "Proposed";
    case TransitionState::Kind::ANIMATING:
        return "Animating";
    }
    return "Idle";
}

// ============================================================================
// TransitionState
// ============================================================================

TransitionState TransitionState::idle(NavNodePtr current) {
    TransitionState state;
    state.kind = Kind::IDLE;
    state.current = std::move(current);
    return state;
}

TransitionState TransitionState::proposed(NavNodePtr current, NavNodePtr proposed, float progress) {
    TransitionState state;
    state.kind = Kind::PROPOSED;
    state.current = std::move(current);
    state.target = std::move(proposed);
    state.progress = clamp_progress(progress);
    state.direction = TransitionDirection::BACKWARD;
    return state;
}

TransitionState TransitionState::animating(NavNodePtr current, NavNodePtr target, float progress,
                                           TransitionDirection direction,
                                           std::optional<NavigationTransition> transition) {
    TransitionState state;
    state.kind = Kind::ANIMATING;
    state.current = std::move(current);
    state.target = std::move(target);
    state.progress = clamp_progress(progress);
    state.direction = direction;
    state.transition = transition;
    return state;
}

TransitionDirection TransitionState::effective_direction() const {
    switch (kind) {
    case Kind::IDLE:
        return TransitionDirection::NONE;
    case Kind::PROPOSED:
        return TransitionDirection::BACKWARD;
    case Kind::ANIMATING:
        return direction;
    }
    return TransitionDirection::NONE;
}

bool TransitionState::affects_stack(const NodeKey& stack_key) const {
    if (is_idle()) {
        return false;
    }
    std::set<NodeKey> changed;
    collect_changed_stacks(current, target, changed);
    return changed.count(stack_key) > 0;
}

bool TransitionState::affects_tab(const NodeKey& tab_key) const {
    if (is_idle()) {
        return false;
    }
    const auto* from = find_tab(current, tab_key);
    const auto* to = find_tab(target, tab_key);
    return from && to && from->active_index != to->active_index;
}

NavNodePtr TransitionState::previous_child_of(const NodeKey& stack_key) const {
    if (is_idle()) {
        return nullptr;
    }
    const auto* stack = find_stack(current, stack_key);
    if (!stack) {
        return nullptr;
    }
    switch (effective_direction()) {
    case TransitionDirection::FORWARD:
        return stack->active_child();
    case TransitionDirection::BACKWARD:
        if (is_proposed()) {
            return stack->active_child();
        }
        return stack->children.size() >= 2 ? stack->children[stack->children.size() - 2] : nullptr;
    case TransitionDirection::NONE:
        break;
    }
    return nullptr;
}

std::optional<int> TransitionState::previous_tab_index(const NodeKey& tab_key) const {
    if (is_idle()) {
        return std::nullopt;
    }
    const auto* tab = find_tab(current, tab_key);
    if (!tab) {
        return std::nullopt;
    }
    return tab->active_index;
}

bool TransitionState::is_intra_tab_navigation(const NodeKey& tab_key) const {
    if (is_idle()) {
        return false;
    }
    const auto* from = find_tab(current, tab_key);
    const auto* to = find_tab(target, tab_key);
    return from && to && from->active_index == to->active_index;
}

bool TransitionState::is_intra_pane_navigation(const NodeKey& pane_key) const {
    if (is_idle()) {
        return false;
    }
    auto from = find_by_key(current, pane_key);
    auto to = find_by_key(target, pane_key);
    return from && to && from->is_pane() && to->is_pane();
}

bool TransitionState::is_cross_node_type_navigation() const {
    if (is_idle() || !current || !target) {
        return false;
    }
    return current->kind() != target->kind();
}

std::string TransitionState::describe() const {
    std::string out = transition_kind_name(kind);
    if (!is_idle()) {
        out += "(progress=" + std::to_string(progress) +
               ", direction=" + transition_direction_name(effective_direction()) + ")";
    }
    return out;
}

// ============================================================================
// TransitionStateManager
// ============================================================================

TransitionStateManager::TransitionStateManager(NavNodePtr initial)
    : cell_(TransitionState::idle(std::move(initial))) {}

void TransitionStateManager::throw_invalid(const char* operation, const TransitionState& state) {
    spdlog::error("[TransitionStateManager] {} called while {}", operation,
                  transition_kind_name(state.kind));
    throw NavigationError(NavErrorType::INVALID_TRANSITION,
                          std::string("Cannot ") + operation + " from state " +
                              transition_kind_name(state.kind));
}

void TransitionStateManager::start_animation(NavNodePtr target, TransitionDirection direction,
                                             std::optional<NavigationTransition> transition) {
    auto current = cell_.get();
    if (!current.is_idle()) {
        throw_invalid("start animation", current);
    }
    spdlog::trace("[TransitionStateManager] Idle -> Animating ({})",
                  transition_direction_name(direction));
    cell_.set(TransitionState::animating(current.current, std::move(target), 0.0f, direction,
                                         transition));
}

void TransitionStateManager::start_proposed(NavNodePtr proposed) {
    auto current = cell_.get();
    if (!current.is_idle()) {
        throw_invalid("start proposed", current);
    }
    spdlog::trace("[TransitionStateManager] Idle -> Proposed");
    cell_.set(TransitionState::proposed(current.current, std::move(proposed), 0.0f));
}

void TransitionStateManager::update_progress(float progress) {
    auto state = cell_.get();
    if (state.is_idle()) {
        spdlog::trace("[TransitionStateManager] progress {} ignored while Idle", progress);
        return;
    }
    state.progress = clamp_progress(progress);
    cell_.set(std::move(state));
}

void TransitionStateManager::commit_proposed() {
    auto current = cell_.get();
    if (!current.is_proposed()) {
        throw_invalid("commit", current);
    }
    spdlog::trace("[TransitionStateManager] Proposed -> Animating at {:.2f}", current.progress);
    cell_.set(TransitionState::animating(current.current, current.target, current.progress,
                                         TransitionDirection::BACKWARD));
}

void TransitionStateManager::cancel_proposed() {
    auto current = cell_.get();
    if (!current.is_proposed()) {
        throw_invalid("cancel", current);
    }
    spdlog::trace("[TransitionStateManager] Proposed -> Idle (cancelled)");
    cell_.set(TransitionState::idle(current.current));
}

void TransitionStateManager::complete_animation() {
    auto current = cell_.get();
    if (!current.is_animating()) {
        throw_invalid("complete", current);
    }
    spdlog::trace("[TransitionStateManager] Animating -> Idle");
    cell_.set(TransitionState::idle(current.target));
}

void TransitionStateManager::force_idle(NavNodePtr tree) {
    cell_.set(TransitionState::idle(std::move(tree)));
}

} // namespace wayfinder
