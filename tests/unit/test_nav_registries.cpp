// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_error.h"
#include "nav_registries.h"
#include "nav_tree.h"

#include "../test_fixtures.h"

#include <catch2/catch.hpp>

using namespace wayfinder;
using namespace wayfinder::test;

TEST_CASE("Registries: empty instances are permissive singletons", "[registries]") {
    REQUIRE(ScopeRegistry::empty() == ScopeRegistry::empty());
    REQUIRE(ScopeRegistry::empty()->is_in_scope("anything", dest("X")));
    REQUIRE_FALSE(ScopeRegistry::empty()->get_scope_key(dest("X")));
    REQUIRE_FALSE(ContainerRegistry::empty()->get_container_info(dest("X")));
    REQUIRE_FALSE(PaneRoleRegistry::empty()->has_pane_role("mail", dest("X")));
}

TEST_CASE("TableScopeRegistry", "[registries]") {
    TableScopeRegistry scopes({{"main_tabs", {"Home", "Search"}}, {"settings", {"General"}}});

    REQUIRE(scopes.scope_count() == 2);
    REQUIRE(scopes.is_in_scope("main_tabs", dest("Home")));
    REQUIRE_FALSE(scopes.is_in_scope("main_tabs", dest("General")));
    REQUIRE_FALSE(scopes.is_in_scope("unregistered", dest("Home")));
    REQUIRE(scopes.get_scope_key(dest("General")) == std::optional<std::string>("settings"));
    REQUIRE_FALSE(scopes.get_scope_key(dest("Detail")));
}

TEST_CASE("TablePaneRoleRegistry", "[registries][panes]") {
    TablePaneRoleRegistry roles({{"mail", {{"Inbox", PaneRole::PRIMARY}, {"Message", PaneRole::SUPPORTING}}}});

    REQUIRE(roles.get_pane_role("mail", dest("Message")) ==
            std::optional<PaneRole>(PaneRole::SUPPORTING));
    REQUIRE_FALSE(roles.get_pane_role("mail", dest("Compose")));
    REQUIRE_FALSE(roles.get_pane_role("other", dest("Message")));
}

TEST_CASE("make_tab_container builds keyed tabs", "[registries][tabs]") {
    auto info = make_tab_container("main_tabs", {dest("Home"), dest("Search"), dest("Profile")}, 2,
                                   std::string("bottom_bar"));
    REQUIRE(info.kind == ContainerKind::TABS);
    REQUIRE(info.scope_key == "main_tabs");
    REQUIRE(info.initial_tab_index == 2);

    auto node = info.builder("t", std::string("root"), info.initial_tab_index);
    const auto* tab = node->as_tab();
    REQUIRE(tab);
    REQUIRE(node->parent_key() == std::optional<NodeKey>("root"));
    REQUIRE(tab->scope_key == std::optional<std::string>("main_tabs"));
    REQUIRE(tab->wrapper_key == std::optional<std::string>("bottom_bar"));
    REQUIRE(tab->active_index == 2);
    REQUIRE(tab->stacks[1]->key() == "t/tab1");
    REQUIRE(find_by_key(node, "t/tab1/root")->as_screen()->destination.type == "Search");
    REQUIRE(parent_keys_consistent(node));

    REQUIRE_THROWS_AS(make_tab_container("empty", {}), NavigationError);
    REQUIRE_THROWS_AS(make_tab_container("one", {dest("A")}, 1), NavigationError);
}

TEST_CASE("make_pane_container builds keyed panes", "[registries][panes]") {
    auto info = make_pane_container(
        "mail",
        {{PaneRole::PRIMARY, PaneSlot{dest("Inbox")}},
         {PaneRole::SUPPORTING, PaneSlot{dest("Empty"), AdaptStrategy::LEVITATE}}},
        PaneBackBehavior::POP_UNTIL_CONTENT_CHANGE, PaneRole::SUPPORTING);
    REQUIRE(info.kind == ContainerKind::PANES);
    REQUIRE(info.initial_pane == PaneRole::SUPPORTING);

    auto node = info.builder("p", std::string("root"), 0);
    const auto* pane = node->as_pane();
    REQUIRE(pane);
    REQUIRE(pane->active_role == PaneRole::SUPPORTING);
    REQUIRE(pane->back_behavior == PaneBackBehavior::POP_UNTIL_CONTENT_CHANGE);
    REQUIRE(pane->content(PaneRole::SUPPORTING)->key() == "p/supporting");
    REQUIRE(find_by_key(node, "p/primary/root")->as_screen()->destination.type == "Inbox");
    REQUIRE(parent_keys_consistent(node));

    try {
        make_pane_container("mail", {{PaneRole::SUPPORTING, PaneSlot{dest("Empty")}}});
        FAIL("expected NavigationError");
    } catch (const NavigationError& e) {
        REQUIRE(e.type() == NavErrorType::PRIMARY_PANE_REQUIRED);
    }
    REQUIRE_THROWS_AS(make_pane_container("mail", {{PaneRole::PRIMARY, PaneSlot{dest("Inbox")}}},
                                          PaneBackBehavior::POP_LATEST, PaneRole::EXTRA),
                      NavigationError);
}

TEST_CASE("TableContainerRegistry looks up by trigger type", "[registries]") {
    TableContainerRegistry registry(
        {{"Home", make_tab_container("main_tabs", {dest("Home"), dest("Search")})}});
    REQUIRE(registry.container_count() == 1);
    REQUIRE(registry.get_container_info(dest("Home", {{"ignored", true}})));
    REQUIRE_FALSE(registry.get_container_info(dest("Search")));
}
