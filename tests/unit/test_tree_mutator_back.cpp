// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_tree_mutator_back.cpp
 * @brief Tree-aware back resolution (pop_with_tab_behavior) and its predicate
 */

#include "nav_tree.h"
#include "tree_mutator.h"

#include "../test_fixtures.h"

#include <catch2/catch.hpp>

using namespace wayfinder;
using namespace wayfinder::test;

namespace {

NavNodePtr main_tabs(const std::vector<std::string>& home_types = {"Home"}) {
    return tab_node("tabs", "root",
                    {stack_of("home", "tabs", home_types), stack_of("search", "tabs", {"Search"})},
                    0, std::string("main_tabs"));
}

/// root [Home screen, panes]
NavNodePtr pane_behind_screen(PaneRole active, PaneBackBehavior behavior,
                              const std::vector<std::string>& supporting = {"Message"}) {
    auto panes = pane_node("panes", "root",
                           {{PaneRole::PRIMARY, stack_of("list", "panes", {"Inbox"})},
                            {PaneRole::SUPPORTING, stack_of("detail", "panes", supporting)}},
                           active, behavior, std::string("mail"));
    return make_stack("root", std::nullopt, {screen("root-0", "root", "Home"), panes});
}

} // namespace

TEST_CASE("Back: plain stacks", "[tree_mutator][back]") {
    SECTION("root with history pops") {
        auto result = TreeMutator::pop_with_tab_behavior(stack_of("root", std::nullopt, {"A", "B"}));
        REQUIRE(result.is_handled());
        REQUIRE(screen_types(result.new_state) == std::vector<std::string>{"A"});
    }

    SECTION("root with a single screen delegates to the system") {
        auto result = TreeMutator::pop_with_tab_behavior(stack_of("root", std::nullopt, {"A"}));
        REQUIRE(result.type == BackResult::Type::DELEGATE_TO_SYSTEM);
        REQUIRE(result.new_state == nullptr);
    }

    SECTION("empty tree cannot be handled") {
        auto result = TreeMutator::pop_with_tab_behavior(screen("s", std::nullopt, "Lonely"));
        REQUIRE(result.type == BackResult::Type::CANNOT_HANDLE);
    }
}

TEST_CASE("Back: tabs", "[tree_mutator][back][tabs]") {
    SECTION("tab at root with one entry delegates to the system") {
        auto result = TreeMutator::pop_with_tab_behavior(sample_tab_tree());
        REQUIRE(result.type == BackResult::Type::DELEGATE_TO_SYSTEM);
    }

    SECTION("tab stack with history pops inside the tab") {
        auto tree = make_stack("root", std::nullopt, {main_tabs({"Home", "Detail"})});
        auto result = TreeMutator::pop_with_tab_behavior(tree);
        REQUIRE(result.is_handled());
        REQUIRE(screen_types(find_by_key(result.new_state, "home")) ==
                std::vector<std::string>{"Home"});
    }

    SECTION("exhausted tab is removed when the parent stack has history") {
        auto tree = make_stack("root", std::nullopt, {screen("root-0", "root", "Welcome"), main_tabs()});
        auto result = TreeMutator::pop_with_tab_behavior(tree);
        REQUIRE(result.is_handled());
        REQUIRE(find_by_key(result.new_state, "tabs") == nullptr);
        REQUIRE(screen_types(result.new_state) == std::vector<std::string>{"Welcome"});
    }
}

TEST_CASE("Back: nested stacks", "[tree_mutator][back]") {
    SECTION("exhausted inner stack is removed") {
        auto tree = make_stack("root", std::nullopt,
                               {screen("root-0", "root", "Home"), stack_of("inner", "root", {"Wizard"})});
        auto result = TreeMutator::pop_with_tab_behavior(tree);
        REQUIRE(result.is_handled());
        REQUIRE(screen_types(result.new_state) == std::vector<std::string>{"Home"});
    }

    SECTION("only child of the root delegates") {
        auto tree = make_stack("root", std::nullopt, {stack_of("inner", "root", {"Wizard"})});
        auto result = TreeMutator::pop_with_tab_behavior(tree);
        REQUIRE(result.type == BackResult::Type::DELEGATE_TO_SYSTEM);
    }

    SECTION("cascades through single-child stacks") {
        auto middle = make_stack("middle", "root", {stack_of("inner", "middle", {"Step"})});
        auto tree = make_stack("root", std::nullopt, {screen("root-0", "root", "Home"), middle});
        auto result = TreeMutator::pop_with_tab_behavior(tree);
        REQUIRE(result.is_handled());
        REQUIRE(find_by_key(result.new_state, "middle") == nullptr);
        REQUIRE(leaf_type(result.new_state) == "Home");
    }
}

TEST_CASE("Back: panes", "[tree_mutator][back][panes]") {
    SECTION("expanded layout leaves the whole pane") {
        auto tree = pane_behind_screen(PaneRole::PRIMARY,
                                       PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE);
        auto result = TreeMutator::pop_with_tab_behavior(tree, false);
        REQUIRE(result.is_handled());
        REQUIRE(find_by_key(result.new_state, "panes") == nullptr);
        REQUIRE(leaf_type(result.new_state) == "Home");
    }

    SECTION("compact secondary role returns focus to primary") {
        auto tree = pane_behind_screen(PaneRole::SUPPORTING,
                                       PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE);
        auto result = TreeMutator::pop_with_tab_behavior(tree, true);
        REQUIRE(result.is_handled());
        REQUIRE(leaf_type(result.new_state) == "Inbox");
    }

    SECTION("compact primary needing a scaffold change is left to the caller") {
        auto tree = pane_behind_screen(PaneRole::PRIMARY,
                                       PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE);
        auto result = TreeMutator::pop_with_tab_behavior(tree, true);
        REQUIRE(result.type == BackResult::Type::CANNOT_HANDLE);
    }

    SECTION("compact empty pane is removed from its parent") {
        auto tree = pane_behind_screen(PaneRole::PRIMARY,
                                       PaneBackBehavior::POP_UNTIL_CURRENT_DESTINATION_CHANGE, {});
        auto result = TreeMutator::pop_with_tab_behavior(tree, true);
        REQUIRE(result.is_handled());
        REQUIRE(find_by_key(result.new_state, "panes") == nullptr);
    }
}

TEST_CASE("can_handle_back_navigation", "[tree_mutator][back]") {
    CHECK(TreeMutator::can_handle_back_navigation(stack_of("root", std::nullopt, {"A", "B"})));
    CHECK_FALSE(TreeMutator::can_handle_back_navigation(stack_of("root", std::nullopt, {"A"})));
    CHECK_FALSE(TreeMutator::can_handle_back_navigation(sample_tab_tree()));
    CHECK_FALSE(TreeMutator::can_handle_back_navigation(sample_pane_tree()));

    auto tabs_behind_screen =
        make_stack("root", std::nullopt, {screen("root-0", "root", "Welcome"), main_tabs()});
    CHECK(TreeMutator::can_handle_back_navigation(tabs_behind_screen));

    auto nested = make_stack("root", std::nullopt,
                             {screen("root-0", "root", "Home"), stack_of("inner", "root", {"Wizard"})});
    CHECK(TreeMutator::can_handle_back_navigation(nested));

    auto deep_detail = pane_behind_screen(PaneRole::PRIMARY, PaneBackBehavior::POP_LATEST,
                                          {"Message", "Attachment"});
    CHECK(TreeMutator::can_handle_back_navigation(deep_detail));
}
