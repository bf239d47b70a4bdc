// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "key_generator.h"

#include <memory>
#include <random>

namespace wayfinder {

KeyGenerator make_random_key_generator(size_t length) {
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    return [engine, length]() {
        static constexpr char HEX[] = "0123456789abcdef";
        std::uniform_int_distribution<int> dist(0, 15);
        NodeKey key;
        key.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            key.push_back(HEX[dist(*engine)]);
        }
        return key;
    };
}

KeyGenerator make_sequential_key_generator(std::string prefix) {
    auto counter = std::make_shared<unsigned long>(0);
    return [counter, prefix = std::move(prefix)]() {
        return prefix + std::to_string(++*counter);
    };
}

} // namespace wayfinder
