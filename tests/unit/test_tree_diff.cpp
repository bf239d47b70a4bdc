// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tree_diff.h"
#include "tree_mutator.h"

#include "../test_fixtures.h"

#include <catch2/catch.hpp>

using namespace wayfinder;
using namespace wayfinder::test;

TEST_CASE("compute_tree_diff: identical trees", "[tree_diff]") {
    auto tree = sample_tab_tree();
    REQUIRE(compute_tree_diff(tree, tree).empty());
}

TEST_CASE_METHOD(NavTestFixture, "compute_tree_diff: push and pop", "[tree_diff]") {
    auto tree = stack_of("root", std::nullopt, {"Home", "Detail"});

    auto pushed = TreeMutator::push(tree, dest("Edit"), keys);
    auto added = compute_tree_diff(tree, pushed);
    REQUIRE(added.added_screen_keys == std::set<NodeKey>{"k1"});
    REQUIRE(added.removed_screen_keys.empty());
    REQUIRE(added.added_container_keys.empty());
    REQUIRE(added.removed_container_keys.empty());

    auto popped = TreeMutator::pop(tree);
    auto removed = compute_tree_diff(tree, popped);
    REQUIRE(removed.removed_screen_keys == std::set<NodeKey>{"root-1"});
    REQUIRE(removed.added_screen_keys.empty());
}

TEST_CASE("compute_tree_diff: container removal lists every descendant", "[tree_diff]") {
    auto tabs = tab_node("tabs", "root",
                         {stack_of("home", "tabs", {"Home", "HomeDetail"}),
                          stack_of("search", "tabs", {"Search"})});
    auto tree = make_stack("root", std::nullopt, {screen("root-0", "root", "Welcome"), tabs});

    auto after = TreeMutator::remove_node(tree, "tabs");
    auto diff = compute_tree_diff(tree, after);
    REQUIRE(diff.removed_container_keys == std::set<NodeKey>{"tabs", "home", "search"});
    REQUIRE(diff.removed_screen_keys == std::set<NodeKey>{"home-0", "home-1", "search-0"});
    REQUIRE(diff.added_screen_keys.empty());
}

TEST_CASE("compute_tree_diff: null trees", "[tree_diff]") {
    auto tree = stack_of("root", std::nullopt, {"Home"});

    auto from_null = compute_tree_diff(nullptr, tree);
    REQUIRE(from_null.added_container_keys == std::set<NodeKey>{"root"});
    REQUIRE(from_null.added_screen_keys == std::set<NodeKey>{"root-0"});

    auto to_null = compute_tree_diff(tree, nullptr);
    REQUIRE(to_null.removed_screen_keys == std::set<NodeKey>{"root-0"});
    REQUIRE(compute_tree_diff(nullptr, nullptr).empty());
}

TEST_CASE("compute_tree_diff: tab switch adds and removes nothing", "[tree_diff][tabs]") {
    auto tree = sample_tab_tree();
    REQUIRE(compute_tree_diff(tree, TreeMutator::switch_tab(tree, "tabs", 1)).empty());
}
