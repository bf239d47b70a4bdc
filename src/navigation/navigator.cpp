// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigator.h"

#include "nav_error.h"
#include "nav_tree.h"

#include <spdlog/spdlog.h>

namespace wayfinder {

namespace {

NavigatorOptions with_defaults(NavigatorOptions options) {
    if (!options.scopes) {
        options.scopes = ScopeRegistry::empty();
    }
    if (!options.containers) {
        options.containers = ContainerRegistry::empty();
    }
    if (!options.pane_roles) {
        options.pane_roles = PaneRoleRegistry::empty();
    }
    if (!options.key_generator) {
        options.key_generator = make_random_key_generator();
    }
    return options;
}

bool back_would_change(const NavNodePtr& tree, bool compact) {
    auto result = TreeMutator::pop_with_tab_behavior(tree, compact);
    if (result.is_handled()) {
        return true;
    }
    if (result.type == BackResult::Type::CANNOT_HANDLE) {
        return TreeMutator::pop_pane_adaptive(tree, compact).is_popped();
    }
    return false;
}

/// Tree that the default back action would produce, or nullptr
NavNodePtr resolve_back(const NavNodePtr& tree, bool compact) {
    auto result = TreeMutator::pop_with_tab_behavior(tree, compact);
    switch (result.type) {
    case BackResult::Type::HANDLED:
        return result.new_state;
    case BackResult::Type::DELEGATE_TO_SYSTEM:
        return nullptr;
    case BackResult::Type::CANNOT_HANDLE:
        break;
    }
    auto pane_result = TreeMutator::pop_pane_adaptive(tree, compact);
    return pane_result.is_popped() ? pane_result.new_state : nullptr;
}

} // namespace

// ============================================================================
// Free helpers
// ============================================================================

std::optional<std::string> current_scope_key(const NavNodePtr& tree) {
    auto node = tree;
    while (node) {
        if (node->is_tab() || node->is_pane()) {
            return node->scope_key();
        }
        if (!node->is_stack()) {
            return std::nullopt;
        }
        node = node->active_child();
    }
    return std::nullopt;
}

NavNodePtr find_container_parent_stack(const NavNodePtr& tree) {
    if (!tree || !tree->is_stack()) {
        return nullptr;
    }
    auto stack = tree;
    while (true) {
        auto child = stack->active_child();
        if (!child || !child->is_stack()) {
            // Either the stack holding the current Tab/Pane, or the innermost stack
            return stack;
        }
        stack = child;
    }
}

std::optional<Destination> compute_previous_destination(const NavNodePtr& tree) {
    auto stack = active_stack(tree);
    if (!stack) {
        return std::nullopt;
    }
    const auto& children = stack->as_stack()->children;
    if (children.size() < 2) {
        return std::nullopt;
    }
    return active_destination(children[children.size() - 2]);
}

// ============================================================================
// Construction
// ============================================================================

Navigator::Navigator(NavNodePtr initial_state, NavigatorOptions options)
    : options_(with_defaults(std::move(options))), state_(create_root_stack(std::move(initial_state))),
      transitions_(state_.get()), current_destination_(std::nullopt),
      previous_destination_(std::nullopt), can_navigate_back_(false), last_diff_(TreeDiff{}) {
    update_derived_state(state_.get());
    spdlog::info("[Navigator] Created with root '{}' ({} nodes, {})", state_.get()->key(),
                 node_count(state_.get()), options_.compact ? "compact" : "expanded");
}

Navigator::~Navigator() {
    if (results_.pending_count() > 0) {
        spdlog::debug("[Navigator] Cancelling {} pending results", results_.pending_count());
    }
    results_.cancel_all();
}

NavNodePtr Navigator::create_root_stack(NavNodePtr initial) {
    if (!initial) {
        return make_stack(options_.key_generator(), std::nullopt);
    }
    if (initial->is_stack() && !initial->parent_key()) {
        return initial;
    }
    auto root_key = options_.key_generator();
    spdlog::debug("[Navigator] Wrapping initial {} '{}' in root stack '{}'",
                  nav_node_kind_name(initial->kind()), initial->key(), root_key);
    return make_stack(root_key, std::nullopt, {with_parent_key(initial, root_key)});
}

void Navigator::set_compact(bool compact) {
    if (options_.compact == compact) {
        return;
    }
    options_.compact = compact;
    spdlog::debug("[Navigator] Layout now {}", compact ? "compact" : "expanded");
    can_navigate_back_.set(back_would_change(state_.get(), compact));
}

// ============================================================================
// State publication
// ============================================================================

void Navigator::update_derived_state(const NavNodePtr& tree) {
    current_destination_.set(active_destination(tree));
    previous_destination_.set(compute_previous_destination(tree));
    can_navigate_back_.set(back_would_change(tree, options_.compact));
}

void Navigator::apply_state(const NavNodePtr& new_state) {
    auto old_state = state_.get();
    state_.set(new_state);
    update_derived_state(new_state);

    auto diff = compute_tree_diff(old_state, new_state);
    if (diff.empty()) {
        return;
    }
    for (const auto& key : diff.removed_screen_keys) {
        if (results_.cancel_result(key)) {
            spdlog::debug("[Navigator] Screen '{}' left the tree, result cancelled", key);
        }
    }
    last_diff_.set(diff);
}

void Navigator::commit_state(NavNodePtr new_state, std::optional<NavigationTransition> transition,
                             TransitionDirection direction) {
    auto old_state = state_.get();
    if (new_state == old_state) {
        spdlog::trace("[Navigator] Tree unchanged");
        return;
    }

    auto in_flight = transitions_.state();
    if (!in_flight.is_idle()) {
        spdlog::debug("[Navigator] Interrupting {} transition", transition_kind_name(in_flight.kind));
        transitions_.force_idle(old_state);
    }

    apply_state(new_state);

    if (transition && transition->type != TransitionType::NONE) {
        transitions_.start_animation(std::move(new_state), direction, transition);
    } else {
        transitions_.force_idle(std::move(new_state));
    }
}

// ============================================================================
// Navigation
// ============================================================================

NavNodePtr Navigator::push_container(const NavNodePtr& root, const ContainerInfo& info) {
    auto container_key = options_.key_generator();
    auto target = find_container_parent_stack(root);
    auto parent_key = target ? target->key() : options_.key_generator();

    auto container = info.builder(container_key, parent_key, info.initial_tab_index);
    if (!container) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              "Container builder for scope '" + info.scope_key + "' returned null");
    }

    if (!target) {
        spdlog::debug("[Navigator] No stack for container '{}', new root '{}'", container_key,
                      parent_key);
        return make_stack(parent_key, std::nullopt, {container});
    }

    spdlog::debug("[Navigator] Pushing {} container '{}' (scope '{}') onto '{}'",
                  info.kind == ContainerKind::TABS ? "tab" : "pane", container_key, info.scope_key,
                  target->key());
    auto stack = *target->as_stack();
    stack.children.push_back(container);
    return TreeMutator::replace_node(root, target->key(), make_node(std::move(stack)));
}

void Navigator::navigate(const Destination& destination,
                         std::optional<NavigationTransition> transition) {
    auto tree = state_.get();
    auto effective = transition ? transition : destination.transition;
    spdlog::debug("[Navigator] navigate {}", destination.describe());

    NavNodePtr new_tree;
    auto info = options_.containers->get_container_info(destination);
    if (info && current_scope_key(tree) != info->scope_key) {
        new_tree = push_container(tree, *info);
    } else if (!active_stack(tree)) {
        auto root_key = options_.key_generator();
        auto screen = make_screen(options_.key_generator(), root_key, destination);
        new_tree = make_stack(root_key, std::nullopt, {screen});
    } else {
        new_tree = TreeMutator::push(tree, destination, *options_.scopes, *options_.pane_roles,
                                     options_.key_generator);
    }
    commit_state(std::move(new_tree), effective, TransitionDirection::FORWARD);
}

bool Navigator::navigate_back() {
    auto new_tree = resolve_back(state_.get(), options_.compact);
    if (!new_tree) {
        spdlog::debug("[Navigator] Back delegated to system");
        return false;
    }
    commit_state(std::move(new_tree), std::nullopt, TransitionDirection::BACKWARD);
    return true;
}

void Navigator::navigate_and_replace(const Destination& destination,
                                     std::optional<NavigationTransition> transition) {
    auto effective = transition ? transition : destination.transition;
    spdlog::debug("[Navigator] replace with {}", destination.describe());
    commit_state(TreeMutator::replace_current(state_.get(), destination, options_.key_generator),
                 effective, TransitionDirection::FORWARD);
}

void Navigator::navigate_and_clear_all(const Destination& destination) {
    spdlog::debug("[Navigator] clear all and push {}", destination.describe());
    commit_state(TreeMutator::clear_and_push(state_.get(), destination, options_.key_generator),
                 destination.transition, TransitionDirection::FORWARD);
}

void Navigator::navigate_and_clear_to(const Destination& destination,
                                      const std::optional<std::string>& clear_route,
                                      bool inclusive) {
    auto tree = state_.get();
    if (clear_route) {
        tree = TreeMutator::pop_to_route(tree, *clear_route, inclusive);
    }
    spdlog::debug("[Navigator] clear to '{}' and push {}", clear_route.value_or(""),
                  destination.describe());
    auto new_tree = TreeMutator::push(tree, destination, *options_.scopes, *options_.pane_roles,
                                      options_.key_generator);
    commit_state(std::move(new_tree), destination.transition, TransitionDirection::FORWARD);
}

NodeKey Navigator::navigate_for_result(const Destination& destination,
                                       NavigationResultManager::ResultCallback callback,
                                       std::optional<NavigationTransition> transition) {
    navigate(destination, std::move(transition));
    auto leaf = active_leaf(state_.get());
    if (!leaf) {
        throw NavigationError(NavErrorType::NO_ACTIVE_STACK,
                              "No screen to await a result from after navigating to '" +
                                  destination.type + "'");
    }
    results_.request_result(leaf->key(), std::move(callback));
    return leaf->key();
}

bool Navigator::complete_result(const NodeKey& screen_key, const json& result) {
    return results_.complete_result(screen_key, result);
}

void Navigator::update_state(NavNodePtr new_state, std::optional<NavigationTransition> transition) {
    if (!new_state) {
        throw NavigationError(NavErrorType::INVALID_NODE, "update_state() requires a tree");
    }
    spdlog::debug("[Navigator] External state update to root '{}'", new_state->key());
    commit_state(std::move(new_state), transition, TransitionDirection::NONE);
}

// ============================================================================
// Tabs
// ============================================================================

void Navigator::switch_tab(int index) {
    commit_state(TreeMutator::switch_active_tab(state_.get(), index), std::nullopt,
                 TransitionDirection::NONE);
}

void Navigator::switch_tab(const NodeKey& tab_key, int index) {
    commit_state(TreeMutator::switch_tab(state_.get(), tab_key, index), std::nullopt,
                 TransitionDirection::NONE);
}

std::optional<int> Navigator::active_tab_index() const {
    auto tab = find_on_active_path(state_.get(), NavNodeKind::TAB);
    if (!tab) {
        return std::nullopt;
    }
    return tab->as_tab()->active_index;
}

// ============================================================================
// Panes
// ============================================================================

NavNodePtr Navigator::require_pane_node() const {
    auto pane = find_first(state_.get(), NavNodeKind::PANE);
    if (!pane) {
        throw NavigationError(NavErrorType::NO_PANE_NODE, "No Pane node in the navigation tree");
    }
    return pane;
}

void Navigator::navigate_to_pane(const Destination& destination, PaneRole role, bool switch_focus) {
    auto tree = state_.get();
    auto pane = require_pane_node();
    const auto& pane_key = pane->key();

    NavNodePtr new_tree;
    if (pane->as_pane()->has_role(role)) {
        new_tree = TreeMutator::navigate_to_pane(tree, pane_key, role, destination, switch_focus,
                                                 options_.key_generator);
    } else {
        auto stack_key = options_.key_generator();
        auto screen = make_screen(options_.key_generator(), stack_key, destination);
        auto stack = make_stack(stack_key, pane_key, {screen});
        spdlog::debug("[Navigator] Configuring {} role on '{}' for {}", pane_role_name(role),
                      pane_key, destination.describe());
        new_tree = TreeMutator::set_pane_configuration(tree, pane_key, role, PaneConfiguration{stack});
        if (switch_focus) {
            new_tree = TreeMutator::switch_active_pane(new_tree, pane_key, role);
        }
    }
    commit_state(std::move(new_tree), destination.transition, TransitionDirection::FORWARD);
}

void Navigator::switch_pane(PaneRole role) {
    auto pane = require_pane_node();
    commit_state(TreeMutator::switch_active_pane(state_.get(), pane->key(), role), std::nullopt,
                 TransitionDirection::NONE);
}

bool Navigator::navigate_back_in_pane(PaneRole role) {
    auto pane = require_pane_node();
    auto new_tree = TreeMutator::pop_pane(state_.get(), pane->key(), role);
    if (!new_tree) {
        return false;
    }
    commit_state(std::move(new_tree), std::nullopt, TransitionDirection::BACKWARD);
    return true;
}

void Navigator::clear_pane(PaneRole role) {
    auto pane = require_pane_node();
    const auto* data = pane->as_pane();
    if (!data->has_role(role)) {
        throw NavigationError::role_not_configured(pane->key(), pane_role_name(role));
    }
    auto content = data->content(role);
    const auto* stack = content->as_stack();
    if (!stack || stack->size() <= 1) {
        return;
    }
    auto trimmed = *stack;
    trimmed.children.resize(1);
    commit_state(TreeMutator::replace_node(state_.get(), content->key(), make_node(std::move(trimmed))),
                 std::nullopt, TransitionDirection::BACKWARD);
}

bool Navigator::is_pane_available(PaneRole role) const {
    auto pane = find_first(state_.get(), NavNodeKind::PANE);
    return pane && pane->as_pane()->has_role(role);
}

NavNodePtr Navigator::pane_content(PaneRole role) const {
    auto pane = find_first(state_.get(), NavNodeKind::PANE);
    if (!pane) {
        return nullptr;
    }
    return pane->as_pane()->content(role);
}

// ============================================================================
// Predictive back and transitions
// ============================================================================

bool Navigator::start_predictive_back() {
    auto current = transitions_.state();
    if (!current.is_idle()) {
        spdlog::debug("[Navigator] Predictive back ignored, {} transition in flight",
                      transition_kind_name(current.kind));
        return false;
    }
    auto proposed = resolve_back(state_.get(), options_.compact);
    if (!proposed) {
        return false;
    }
    spdlog::debug("[Navigator] Predictive back started");
    transitions_.start_proposed(std::move(proposed));
    return true;
}

void Navigator::update_predictive_back(float progress) {
    transitions_.update_progress(progress);
}

void Navigator::cancel_predictive_back() {
    spdlog::debug("[Navigator] Predictive back cancelled");
    transitions_.cancel_proposed();
}

void Navigator::commit_predictive_back() {
    transitions_.commit_proposed();
    auto target = transitions_.state().target;
    spdlog::debug("[Navigator] Predictive back committed");
    apply_state(target);
}

void Navigator::update_transition_progress(float progress) {
    transitions_.update_progress(progress);
}

void Navigator::complete_transition() {
    if (transitions_.state().is_idle()) {
        return;
    }
    transitions_.complete_animation();
}

} // namespace wayfinder
