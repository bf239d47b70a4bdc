// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_result_manager.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

using namespace wayfinder;

namespace {

/// Records every resolution delivered to one callback
struct ResultRecorder {
    std::vector<std::optional<json>> results;

    NavigationResultManager::ResultCallback callback() {
        return [this](const std::optional<json>& r) { results.push_back(r); };
    }
};

} // namespace

TEST_CASE("NavigationResultManager: complete delivers once", "[results]") {
    NavigationResultManager manager;
    ResultRecorder recorder;

    manager.request_result("picker", recorder.callback());
    REQUIRE(manager.has_pending_result("picker"));

    REQUIRE(manager.complete_result("picker", json{{"color", "red"}}));
    REQUIRE(recorder.results.size() == 1);
    REQUIRE(recorder.results[0] == json{{"color", "red"}});
    REQUIRE_FALSE(manager.has_pending_result("picker"));

    REQUIRE_FALSE(manager.complete_result("picker", json(1)));
    REQUIRE(recorder.results.size() == 1);
}

TEST_CASE("NavigationResultManager: cancel delivers nullopt", "[results]") {
    NavigationResultManager manager;
    ResultRecorder recorder;

    manager.request_result("picker", recorder.callback());
    REQUIRE(manager.cancel_result("picker"));
    REQUIRE(recorder.results.size() == 1);
    REQUIRE_FALSE(recorder.results[0].has_value());
    REQUIRE_FALSE(manager.cancel_result("picker"));
}

TEST_CASE("NavigationResultManager: repeat request cancels the earlier one", "[results]") {
    NavigationResultManager manager;
    ResultRecorder first;
    ResultRecorder second;

    manager.request_result("picker", first.callback());
    manager.request_result("picker", second.callback());
    REQUIRE(manager.pending_count() == 1);
    REQUIRE(first.results.size() == 1);
    REQUIRE_FALSE(first.results[0].has_value());

    manager.complete_result("picker", json("ok"));
    REQUIRE(second.results.size() == 1);
    REQUIRE(second.results[0] == json("ok"));
}

TEST_CASE("NavigationResultManager: cancel_all", "[results]") {
    NavigationResultManager manager;
    ResultRecorder a;
    ResultRecorder b;

    manager.request_result("a", a.callback());
    manager.request_result("b", b.callback());
    manager.cancel_all();

    REQUIRE(manager.pending_count() == 0);
    REQUIRE(a.results.size() == 1);
    REQUIRE(b.results.size() == 1);
    REQUIRE_FALSE(a.results[0].has_value());
    REQUIRE_FALSE(b.results[0].has_value());
}

TEST_CASE("NavigationResultManager: cancel_all survives a throwing callback", "[results]") {
    NavigationResultManager manager;
    ResultRecorder later;

    manager.request_result("a_first", [](const std::optional<json>&) {
        throw std::runtime_error("picker already gone");
    });
    manager.request_result("b_second", later.callback());

    REQUIRE_NOTHROW(manager.cancel_all());
    REQUIRE(manager.pending_count() == 0);
    REQUIRE(later.results.size() == 1);
    REQUIRE_FALSE(later.results[0].has_value());
}

TEST_CASE("NavigationResultManager: callback may request again for the same key", "[results]") {
    NavigationResultManager manager;
    int deliveries = 0;

    manager.request_result("picker", [&](const std::optional<json>&) {
        ++deliveries;
        if (deliveries == 1) {
            manager.request_result("picker", [&](const std::optional<json>&) { ++deliveries; });
        }
    });

    manager.complete_result("picker", json(1));
    REQUIRE(manager.has_pending_result("picker"));
    manager.complete_result("picker", json(2));
    REQUIRE(deliveries == 2);
}
