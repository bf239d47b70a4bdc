// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_transition_state.cpp
 * @brief TransitionStateManager protocol and TransitionState tree queries
 */

#include "nav_error.h"
#include "transition_state.h"
#include "tree_mutator.h"

#include "../test_fixtures.h"

#include <catch2/catch.hpp>

#include <functional>
#include <vector>

using namespace wayfinder;
using namespace wayfinder::test;

namespace {

NavErrorType error_type_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const NavigationError& e) {
        return e.type();
    }
    FAIL("expected NavigationError");
    return NavErrorType::INVALID_NODE;
}

} // namespace

// ============================================================================
// Protocol
// ============================================================================

TEST_CASE_METHOD(NavTestFixture, "TransitionStateManager: animation lifecycle", "[transition]") {
    auto before = stack_of("root", std::nullopt, {"Home"});
    auto after = TreeMutator::push(before, dest("Detail"), keys);
    TransitionStateManager manager(before);

    REQUIRE(manager.state().is_idle());
    REQUIRE(manager.state().current == before);
    REQUIRE(manager.state().effective_target() == before);

    manager.start_animation(after, TransitionDirection::FORWARD, NavigationTransition::fade(200));
    auto animating = manager.state();
    REQUIRE(animating.is_animating());
    REQUIRE(animating.current == before);
    REQUIRE(animating.target == after);
    REQUIRE(animating.progress == 0.0f);
    REQUIRE(animating.effective_direction() == TransitionDirection::FORWARD);
    REQUIRE(animating.transition == NavigationTransition::fade(200));

    manager.update_progress(0.5f);
    REQUIRE(manager.state().progress == 0.5f);

    manager.complete_animation();
    REQUIRE(manager.state().is_idle());
    REQUIRE(manager.state().current == after);
}

TEST_CASE("TransitionStateManager: predictive gesture commit and cancel", "[transition]") {
    auto before = stack_of("root", std::nullopt, {"Home", "Detail"});
    auto proposed = TreeMutator::pop(before);
    TransitionStateManager manager(before);

    manager.start_proposed(proposed);
    REQUIRE(manager.state().is_proposed());
    REQUIRE(manager.state().effective_direction() == TransitionDirection::BACKWARD);
    REQUIRE(manager.state().effective_target() == proposed);

    SECTION("cancel returns to the pre-gesture tree") {
        manager.update_progress(0.4f);
        manager.cancel_proposed();
        REQUIRE(manager.state().is_idle());
        REQUIRE(manager.state().current == before);

        // A second gesture can start from the restored state
        manager.start_proposed(proposed);
        REQUIRE(manager.state().progress == 0.0f);
    }

    SECTION("commit carries the gesture progress into the animation") {
        manager.update_progress(0.7f);
        manager.commit_proposed();
        auto state = manager.state();
        REQUIRE(state.is_animating());
        REQUIRE(state.progress == 0.7f);
        REQUIRE(state.direction == TransitionDirection::BACKWARD);

        manager.complete_animation();
        REQUIRE(manager.state().current == proposed);
    }
}

TEST_CASE("TransitionStateManager: progress is clamped and ignored while idle", "[transition]") {
    auto tree = stack_of("root", std::nullopt, {"Home", "Detail"});
    TransitionStateManager manager(tree);

    manager.update_progress(0.3f);
    REQUIRE(manager.state().is_idle());
    REQUIRE(manager.state().progress_value() == 0.0f);

    manager.start_proposed(TreeMutator::pop(tree));
    manager.update_progress(1.8f);
    REQUIRE(manager.state().progress == 1.0f);
    manager.update_progress(-2.0f);
    REQUIRE(manager.state().progress == 0.0f);
}

TEST_CASE("TransitionStateManager: invalid operations throw", "[transition]") {
    auto tree = stack_of("root", std::nullopt, {"Home", "Detail"});
    auto popped = TreeMutator::pop(tree);
    TransitionStateManager manager(tree);

    SECTION("from idle") {
        CHECK(error_type_of([&] { manager.commit_proposed(); }) == NavErrorType::INVALID_TRANSITION);
        CHECK(error_type_of([&] { manager.cancel_proposed(); }) == NavErrorType::INVALID_TRANSITION);
        CHECK(error_type_of([&] { manager.complete_animation(); }) ==
              NavErrorType::INVALID_TRANSITION);
    }

    SECTION("from proposed") {
        manager.start_proposed(popped);
        CHECK(error_type_of([&] { manager.start_proposed(popped); }) ==
              NavErrorType::INVALID_TRANSITION);
        CHECK(error_type_of([&] {
                  manager.start_animation(popped, TransitionDirection::BACKWARD);
              }) == NavErrorType::INVALID_TRANSITION);
        CHECK(error_type_of([&] { manager.complete_animation(); }) ==
              NavErrorType::INVALID_TRANSITION);
        REQUIRE(manager.state().is_proposed());
    }

    SECTION("from animating") {
        manager.start_animation(popped, TransitionDirection::BACKWARD);
        CHECK(error_type_of([&] { manager.commit_proposed(); }) == NavErrorType::INVALID_TRANSITION);
        CHECK(error_type_of([&] { manager.cancel_proposed(); }) == NavErrorType::INVALID_TRANSITION);
        CHECK(error_type_of([&] { manager.start_proposed(popped); }) ==
              NavErrorType::INVALID_TRANSITION);
        REQUIRE(manager.state().is_animating());
    }
}

TEST_CASE("TransitionStateManager: force_idle and subscriptions", "[transition]") {
    auto tree = stack_of("root", std::nullopt, {"Home", "Detail"});
    auto popped = TreeMutator::pop(tree);
    TransitionStateManager manager(tree);

    std::vector<TransitionState::Kind> seen;
    auto sub = manager.subscribe([&](const TransitionState& s) { seen.push_back(s.kind); });

    manager.start_animation(popped, TransitionDirection::BACKWARD);
    manager.force_idle(popped);

    REQUIRE(manager.state().is_idle());
    REQUIRE(manager.state().current == popped);
    REQUIRE(seen == std::vector<TransitionState::Kind>{TransitionState::Kind::ANIMATING,
                                                       TransitionState::Kind::IDLE});
}

// ============================================================================
// Tree queries
// ============================================================================

TEST_CASE_METHOD(NavTestFixture, "TransitionState: stack queries", "[transition]") {
    auto two = stack_of("root", std::nullopt, {"Home", "Detail"});
    auto one = TreeMutator::pop(two);

    SECTION("idle answers nothing") {
        auto idle = TransitionState::idle(two);
        CHECK_FALSE(idle.affects_stack("root"));
        CHECK(idle.previous_child_of("root") == nullptr);
        CHECK_FALSE(idle.previous_tab_index("root").has_value());
    }

    SECTION("backward animation shows the entry below the top") {
        auto back = TransitionState::animating(two, one, 0.2f, TransitionDirection::BACKWARD);
        CHECK(back.affects_stack("root"));
        REQUIRE(back.previous_child_of("root"));
        CHECK(back.previous_child_of("root")->key() == "root-0");
    }

    SECTION("proposed shows the current top") {
        auto proposed = TransitionState::proposed(two, one, 0.1f);
        REQUIRE(proposed.previous_child_of("root"));
        CHECK(proposed.previous_child_of("root")->key() == "root-1");
    }

    SECTION("forward animation shows the current top") {
        auto pushed = TreeMutator::push(one, dest("Other"), keys);
        auto fwd = TransitionState::animating(one, pushed, 0.0f, TransitionDirection::FORWARD);
        CHECK(fwd.affects_stack("root"));
        REQUIRE(fwd.previous_child_of("root"));
        CHECK(fwd.previous_child_of("root")->key() == "root-0");
    }

    SECTION("unknown stack") {
        auto back = TransitionState::animating(two, one, 0.0f, TransitionDirection::BACKWARD);
        CHECK_FALSE(back.affects_stack("missing"));
        CHECK(back.previous_child_of("missing") == nullptr);
    }
}

TEST_CASE_METHOD(NavTestFixture, "TransitionState: tab queries", "[transition][tabs]") {
    auto tree = sample_tab_tree();

    SECTION("tab switch") {
        auto switched = TreeMutator::switch_tab(tree, "tabs", 2);
        auto state = TransitionState::animating(tree, switched, 0.0f, TransitionDirection::FORWARD);
        CHECK(state.affects_tab("tabs"));
        CHECK(state.previous_tab_index("tabs") == std::optional<int>(0));
        CHECK_FALSE(state.is_intra_tab_navigation("tabs"));
        CHECK_FALSE(state.affects_stack("home"));
    }

    SECTION("push inside a tab") {
        auto pushed = TreeMutator::push(tree, dest("HomeDetail"), keys);
        auto state = TransitionState::animating(tree, pushed, 0.0f, TransitionDirection::FORWARD);
        CHECK_FALSE(state.affects_tab("tabs"));
        CHECK(state.is_intra_tab_navigation("tabs"));
        CHECK(state.affects_stack("home"));
        CHECK_FALSE(state.affects_stack("search"));
        CHECK_FALSE(state.is_cross_node_type_navigation());
    }
}

TEST_CASE("TransitionState: pane and root-type queries", "[transition][panes]") {
    auto panes = sample_pane_tree();
    auto focused = TreeMutator::switch_active_pane(panes, "panes", PaneRole::SUPPORTING);
    auto state = TransitionState::animating(panes, focused, 0.0f, TransitionDirection::NONE);
    CHECK(state.is_intra_pane_navigation("panes"));
    CHECK_FALSE(state.is_intra_pane_navigation("list"));

    auto flat = stack_of("root", std::nullopt, {"Home"});
    auto other_root = screen("only", std::nullopt, "Solo");
    CHECK(TransitionState::animating(flat, other_root, 0.0f, TransitionDirection::FORWARD)
              .is_cross_node_type_navigation());
}
