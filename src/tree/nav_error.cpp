// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_error.h"

namespace wayfinder {

const char* nav_error_type_name(NavErrorType type) {
    switch (type) {
    case NavErrorType::KEY_NOT_FOUND:
        return "KEY_NOT_FOUND";
    case NavErrorType::WRONG_NODE_TYPE:
        return "WRONG_NODE_TYPE";
    case NavErrorType::INDEX_OUT_OF_BOUNDS:
        return "INDEX_OUT_OF_BOUNDS";
    case NavErrorType::ROLE_NOT_CONFIGURED:
        return "ROLE_NOT_CONFIGURED";
    case NavErrorType::PRIMARY_PANE_REQUIRED:
        return "PRIMARY_PANE_REQUIRED";
    case NavErrorType::NO_ACTIVE_STACK:
        return "NO_ACTIVE_STACK";
    case NavErrorType::NO_TAB_NODE:
        return "NO_TAB_NODE";
    case NavErrorType::NO_PANE_NODE:
        return "NO_PANE_NODE";
    case NavErrorType::EMPTY_STACK:
        return "EMPTY_STACK";
    case NavErrorType::INVALID_REMOVAL:
        return "INVALID_REMOVAL";
    case NavErrorType::INVALID_NODE:
        return "INVALID_NODE";
    case NavErrorType::INVALID_TRANSITION:
        return "INVALID_TRANSITION";
    }
    return "UNKNOWN";
}

NavigationError::NavigationError(NavErrorType type, const std::string& message)
    : std::logic_error(message), type_(type) {}

NavigationError NavigationError::key_not_found(const std::string& key) {
    return NavigationError(NavErrorType::KEY_NOT_FOUND, "Node with key '" + key + "' not found");
}

NavigationError NavigationError::wrong_node_type(const std::string& key,
                                                 const std::string& expected) {
    return NavigationError(NavErrorType::WRONG_NODE_TYPE,
                           "Node '" + key + "' is not a " + expected);
}

NavigationError NavigationError::index_out_of_bounds(int index, size_t size) {
    return NavigationError(NavErrorType::INDEX_OUT_OF_BOUNDS,
                           "Index " + std::to_string(index) + " out of bounds (size " +
                               std::to_string(size) + ")");
}

NavigationError NavigationError::role_not_configured(const std::string& pane_key,
                                                     const std::string& role) {
    return NavigationError(NavErrorType::ROLE_NOT_CONFIGURED,
                           "Pane role " + role + " not configured on pane '" + pane_key + "'");
}

} // namespace wayfinder
