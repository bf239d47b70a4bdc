// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_serialization.h
 * @brief JSON persistence of navigation trees
 *
 * Every node object carries a "_type" discriminator ("screen", "stack",
 * "tab", "pane"). Enum values are written by name. Destination arguments are
 * stored as-is, so they must already be JSON.
 */

#pragma once

#include "nav_node.h"

#include <string>

namespace wayfinder {

json destination_to_json(const Destination& destination);

/// @throws nlohmann::json::exception on missing or mistyped fields
Destination destination_from_json(const json& j);

json nav_node_to_json(const NavNodePtr& node);

/**
 * @brief Rebuild a tree from nav_node_to_json() output
 *
 * @throws nlohmann::json::exception on missing or mistyped fields
 * @throws NavigationError if the decoded nodes violate tree invariants
 */
NavNodePtr nav_node_from_json(const json& j);

/**
 * @brief Parse and decode, for restoring saved state
 * @return nullptr (logged at warn) if the text is not a valid tree
 */
NavNodePtr nav_node_from_json_string(const std::string& text);

} // namespace wayfinder
