// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_result_manager.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace wayfinder {

void NavigationResultManager::request_result(const NodeKey& screen_key, ResultCallback callback) {
    cancel_result(screen_key);
    pending_.emplace(screen_key, std::move(callback));
    spdlog::debug("[NavigationResultManager] Awaiting result from '{}' ({} pending)", screen_key,
                  pending_.size());
}

bool NavigationResultManager::complete_result(const NodeKey& screen_key, const json& result) {
    auto it = pending_.find(screen_key);
    if (it == pending_.end()) {
        spdlog::warn("[NavigationResultManager] Result for '{}' has no waiter", screen_key);
        return false;
    }
    // Erase before invoking so the callback may start a new request for the same key
    auto callback = std::move(it->second);
    pending_.erase(it);
    if (callback) {
        callback(result);
    }
    return true;
}

bool NavigationResultManager::cancel_result(const NodeKey& screen_key) {
    auto it = pending_.find(screen_key);
    if (it == pending_.end()) {
        return false;
    }
    auto callback = std::move(it->second);
    pending_.erase(it);
    spdlog::debug("[NavigationResultManager] Cancelled result for '{}'", screen_key);
    if (callback) {
        callback(std::nullopt);
    }
    return true;
}

void NavigationResultManager::cancel_all() {
    auto pending = std::move(pending_);
    pending_.clear();
    // Every waiter is resolved even when an earlier callback throws
    for (auto& [key, callback] : pending) {
        if (!callback) {
            continue;
        }
        try {
            callback(std::nullopt);
        } catch (const std::exception& e) {
            spdlog::error("[NavigationResultManager] Cancel callback for '{}' threw: {}", key,
                          e.what());
        }
    }
}

} // namespace wayfinder
