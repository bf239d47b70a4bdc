// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Tree builders and sample trees shared by the wayfinder unit tests
 *
 * Builders take explicit keys so assertions can name nodes. Sample trees:
 * - sample_tab_tree():  root -> tabs(main_tabs) -> home[Home] | search[Search] | profile[Profile]
 * - sample_pane_tree(): root -> panes(mail) -> primary: list[Inbox], supporting: detail[Message]
 *
 * Usage:
 * @code
 * TEST_CASE_METHOD(NavTestFixture, "push adds a screen", "[tree_mutator]") {
 *     auto tree = stack_of("root", std::nullopt, {"Home"});
 *     auto next = TreeMutator::push(tree, dest("Detail"), keys);
 * }
 * @endcode
 */

#include "key_generator.h"
#include "nav_node.h"
#include "nav_registries.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wayfinder {
namespace test {

Destination dest(const std::string& type, json arguments = json::object());

NavNodePtr screen(const NodeKey& key, const std::optional<NodeKey>& parent, const std::string& type);

/// Stack whose screens are keyed "<key>-0", "<key>-1", ...
NavNodePtr stack_of(const NodeKey& key, const std::optional<NodeKey>& parent,
                    const std::vector<std::string>& types,
                    std::optional<std::string> scope_key = std::nullopt);

NavNodePtr tab_node(const NodeKey& key, const std::optional<NodeKey>& parent,
                    std::vector<NavNodePtr> stacks, int active_index = 0,
                    std::optional<std::string> scope_key = std::nullopt);

NavNodePtr pane_node(const NodeKey& key, const std::optional<NodeKey>& parent,
                     std::map<PaneRole, NavNodePtr> contents, PaneRole active = PaneRole::PRIMARY,
                     PaneBackBehavior behavior = PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE,
                     std::optional<std::string> scope_key = std::nullopt);

NavNodePtr sample_tab_tree();
NavNodePtr sample_pane_tree(PaneRole active = PaneRole::PRIMARY,
                            PaneBackBehavior behavior =
                                PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE);

/// Destination types of a Stack's screen children, bottom to top
std::vector<std::string> screen_types(const NavNodePtr& stack);

/// Destination type of the active leaf, empty if none
std::string leaf_type(const NavNodePtr& tree);

/// True if every child's parent_key names the node holding it
bool parent_keys_consistent(const NavNodePtr& tree);

/// True if no key occurs twice
bool keys_unique(const NavNodePtr& tree);

} // namespace test
} // namespace wayfinder

// ============================================================================
// NavTestFixture - deterministic keys for mutation tests
// ============================================================================

/**
 * @brief Sequential key generator ("k1", "k2", ...) fresh for every test
 */
class NavTestFixture {
  protected:
    wayfinder::KeyGenerator keys = wayfinder::make_sequential_key_generator("k");
};
