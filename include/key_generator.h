// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nav_node.h"

#include <functional>
#include <string>

namespace wayfinder {

/**
 * @brief Source of fresh node keys
 *
 * Every operation that creates nodes takes one of these so tests can supply
 * deterministic keys.
 */
using KeyGenerator = std::function<NodeKey()>;

/**
 * @brief Random lowercase hex keys of @p length characters
 *
 * Each generator owns its own engine seeded from std::random_device.
 */
KeyGenerator make_random_key_generator(size_t length = 8);

/**
 * @brief Keys "<prefix>1", "<prefix>2", ... in call order
 */
KeyGenerator make_sequential_key_generator(std::string prefix = "k");

} // namespace wayfinder
