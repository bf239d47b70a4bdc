// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_error.h
 * @brief Programmer-error exceptions raised by tree and transition operations
 *
 * @pattern Typed error enum + exception carrying it. Expected "cannot proceed"
 *          outcomes are never reported through these; see PopResult/BackResult.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace wayfinder {

/**
 * @brief Classes of caller errors detected by the navigation engine
 */
enum class NavErrorType {
    KEY_NOT_FOUND,         // No node with the requested key exists in the tree
    WRONG_NODE_TYPE,       // Node exists but is not the variant the operation needs
    INDEX_OUT_OF_BOUNDS,   // Tab index or list index outside valid range
    ROLE_NOT_CONFIGURED,   // Pane role not present in the pane's configuration map
    PRIMARY_PANE_REQUIRED, // Attempted to build or leave a pane without Primary
    NO_ACTIVE_STACK,       // Tree has no stack to receive a push
    NO_TAB_NODE,           // Operation needs a Tab on the active path
    NO_PANE_NODE,          // Operation needs a Pane in the tree
    EMPTY_STACK,           // Operation needs at least one entry in the stack
    INVALID_REMOVAL,       // Removal would break a container's required shape
    INVALID_NODE,          // Node constructed with invalid fields
    INVALID_TRANSITION     // Transition state machine precondition violated
};

/**
 * @brief Get string representation of an error type
 */
const char* nav_error_type_name(NavErrorType type);

/**
 * @brief Exception thrown for navigation programmer errors
 *
 * These indicate a mismatch between the caller's assumptions and the tree
 * shape. They are not meant to be caught routinely.
 */
class NavigationError : public std::logic_error {
  public:
    NavigationError(NavErrorType type, const std::string& message);

    NavErrorType type() const {
        return type_;
    }

    std::string get_type_string() const {
        return nav_error_type_name(type_);
    }

    static NavigationError key_not_found(const std::string& key);
    static NavigationError wrong_node_type(const std::string& key, const std::string& expected);
    static NavigationError index_out_of_bounds(int index, size_t size);
    static NavigationError role_not_configured(const std::string& pane_key, const std::string& role);

  private:
    NavErrorType type_;
};

} // namespace wayfinder
