// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_error.h"
#include "nav_serialization.h"
#include "nav_tree.h"

#include "../test_fixtures.h"

#include <catch2/catch.hpp>

using namespace wayfinder;
using namespace wayfinder::test;

TEST_CASE("Serialization: destination fields", "[serialization]") {
    Destination plain("Detail", {{"id", 42}});
    auto j = destination_to_json(plain);
    REQUIRE(j["type"] == "Detail");
    REQUIRE(j["arguments"]["id"] == 42);
    REQUIRE_FALSE(j.contains("transition"));

    Destination animated("Sheet", json::object(), NavigationTransition::slide_vertical(120));
    auto aj = destination_to_json(animated);
    REQUIRE(aj["transition"]["type"] == "slide_vertical");
    REQUIRE(aj["transition"]["duration_ms"] == 120);

    auto decoded = destination_from_json(aj);
    REQUIRE(decoded == animated);
    REQUIRE(decoded.transition == NavigationTransition::slide_vertical(120));
}

TEST_CASE("Serialization: missing optional fields take defaults", "[serialization]") {
    auto d = destination_from_json(json{{"type", "Home"}});
    REQUIRE(d.type == "Home");
    REQUIRE(d.arguments == json::object());
    REQUIRE_FALSE(d.transition);

    auto tree = nav_node_from_json(json::parse(R"({
        "_type": "pane", "key": "p",
        "panes": {"primary": {"content": {"_type": "stack", "key": "s", "parent_key": "p"}}}
    })"));
    const auto* pane = tree->as_pane();
    REQUIRE(pane);
    REQUIRE(pane->active_role == PaneRole::PRIMARY);
    REQUIRE(pane->back_behavior == PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE);
    REQUIRE(pane->panes.at(PaneRole::PRIMARY).adapt_strategy == AdaptStrategy::HIDE);
    REQUIRE(pane->content(PaneRole::PRIMARY)->as_stack()->empty());
}

TEST_CASE("Serialization: node layout", "[serialization]") {
    auto j = nav_node_to_json(sample_tab_tree());
    REQUIRE(j["_type"] == "stack");
    REQUIRE(j["parent_key"].is_null());

    const auto& tab = j["children"][0];
    REQUIRE(tab["_type"] == "tab");
    REQUIRE(tab["scope_key"] == "main_tabs");
    REQUIRE(tab["active_index"] == 0);
    REQUIRE(tab["stacks"].size() == 3);
    REQUIRE(tab["stacks"][1]["children"][0]["destination"]["type"] == "Search");

    auto pj = nav_node_to_json(sample_pane_tree(PaneRole::SUPPORTING, PaneBackBehavior::POP_LATEST));
    const auto& pane = pj["children"][0];
    REQUIRE(pane["_type"] == "pane");
    REQUIRE(pane["active_role"] == "supporting");
    REQUIRE(pane["back_behavior"] == "pop_latest");
    REQUIRE(pane["panes"]["primary"]["adapt_strategy"] == "hide");
    REQUIRE(pane["panes"]["supporting"]["content"]["key"] == "detail");

    REQUIRE(nav_node_to_json(nullptr).is_null());
}

TEST_CASE("Serialization: trees survive a save and restore", "[serialization]") {
    for (const auto& tree : {sample_tab_tree(), sample_pane_tree(PaneRole::SUPPORTING)}) {
        auto text = nav_node_to_json(tree).dump();
        auto restored = nav_node_from_json_string(text);
        REQUIRE(restored);
        REQUIRE(nodes_equal(tree, restored));
        REQUIRE(parent_keys_consistent(restored));
    }
}

TEST_CASE("Serialization: invalid input", "[serialization]") {
    SECTION("unknown node type") {
        try {
            nav_node_from_json(json{{"_type", "carousel"}, {"key", "x"}});
            FAIL("expected NavigationError");
        } catch (const NavigationError& e) {
            REQUIRE(e.type() == NavErrorType::INVALID_NODE);
        }
    }

    SECTION("unknown enum name") {
        auto j = nav_node_to_json(sample_pane_tree());
        j["children"][0]["back_behavior"] = "pop_everything";
        REQUIRE_THROWS_AS(nav_node_from_json(j), NavigationError);
    }

    SECTION("missing required field") {
        REQUIRE_THROWS_AS(nav_node_from_json(json{{"_type", "screen"}, {"key", "s"}}),
                          json::exception);
    }

    SECTION("string restore returns null instead of throwing") {
        REQUIRE(nav_node_from_json_string("{not json") == nullptr);
        REQUIRE(nav_node_from_json_string(R"({"_type":"carousel","key":"x"})") == nullptr);
        // Tab with an out-of-range active index fails node validation
        REQUIRE(nav_node_from_json_string(R"({"_type":"tab","key":"t","active_index":3,
            "stacks":[{"_type":"stack","key":"s","parent_key":"t"}]})") == nullptr);
        // Pane without a primary role
        REQUIRE(nav_node_from_json_string(R"({"_type":"pane","key":"p","panes":{}})") == nullptr);
    }
}
