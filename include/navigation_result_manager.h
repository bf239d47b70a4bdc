// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file navigation_result_manager.h
 * @brief Pending "navigate and await a result" requests keyed by screen key
 *
 * @pattern Callback per request. A request resolves exactly once: with a value
 *          via complete_result(), or with std::nullopt via cancel_result()
 *          (the Navigator cancels when the screen leaves the tree).
 * @threading Called from the navigator's thread.
 */

#pragma once

#include "nav_node.h"

#include <functional>
#include <map>
#include <optional>

namespace wayfinder {

class NavigationResultManager {
  public:
    using ResultCallback = std::function<void(const std::optional<json>& result)>;

    /**
     * @brief Register interest in the result produced by screen @p screen_key
     *
     * A second request for the same key cancels the first one.
     */
    void request_result(const NodeKey& screen_key, ResultCallback callback);

    /**
     * @brief Deliver @p result to the waiter for @p screen_key
     * @return false if nobody was waiting
     */
    bool complete_result(const NodeKey& screen_key, const json& result);

    /**
     * @brief Resolve the waiter for @p screen_key with no value
     * @return false if nobody was waiting
     */
    bool cancel_result(const NodeKey& screen_key);

    /// Cancel every pending request (navigator teardown). Callback exceptions are logged.
    void cancel_all();

    bool has_pending_result(const NodeKey& screen_key) const {
        return pending_.count(screen_key) > 0;
    }

    size_t pending_count() const {
        return pending_.size();
    }

  private:
    std::map<NodeKey, ResultCallback> pending_;
};

} // namespace wayfinder
