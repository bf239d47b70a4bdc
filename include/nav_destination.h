// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace wayfinder {

using json = nlohmann::json;

/**
 * @brief Animation family a renderer should use for a navigation change
 *
 * The engine never animates; it only records which transition the caller asked
 * for so the presentation layer can pick it up from TransitionState.
 */
enum class TransitionType {
    NONE,
    FADE,
    SLIDE_HORIZONTAL,
    SLIDE_VERTICAL,
    SCALE_IN
};

const char* transition_type_name(TransitionType type);

/**
 * @brief Parse a transition type name ("fade", "slide_horizontal", ...)
 * @return Parsed type, or std::nullopt for unknown names
 */
std::optional<TransitionType> parse_transition_type(const std::string& name);

struct NavigationTransition {
    TransitionType type = TransitionType::NONE;
    uint32_t duration_ms = 300;

    static NavigationTransition none() {
        return {TransitionType::NONE, 0};
    }
    static NavigationTransition fade(uint32_t ms = 300) {
        return {TransitionType::FADE, ms};
    }
    static NavigationTransition slide_horizontal(uint32_t ms = 300) {
        return {TransitionType::SLIDE_HORIZONTAL, ms};
    }
    static NavigationTransition slide_vertical(uint32_t ms = 300) {
        return {TransitionType::SLIDE_VERTICAL, ms};
    }
    static NavigationTransition scale_in(uint32_t ms = 300) {
        return {TransitionType::SCALE_IN, ms};
    }

    bool operator==(const NavigationTransition& o) const {
        return type == o.type && duration_ms == o.duration_ms;
    }
    bool operator!=(const NavigationTransition& o) const {
        return !(*this == o);
    }
};

/**
 * @brief What a screen shows: a route type name plus typed arguments
 *
 * The type name is what scope membership, tab matching and pop_to_route
 * compare against. Two destinations are equal when type and arguments match;
 * the default transition is presentation metadata and does not take part.
 */
struct Destination {
    std::string type;
    json arguments = json::object();
    std::optional<NavigationTransition> transition;

    Destination() = default;
    explicit Destination(std::string type_name, json args = json::object(),
                         std::optional<NavigationTransition> default_transition = std::nullopt)
        : type(std::move(type_name)), arguments(std::move(args)),
          transition(default_transition) {}

    bool operator==(const Destination& o) const {
        return type == o.type && arguments == o.arguments;
    }
    bool operator!=(const Destination& o) const {
        return !(*this == o);
    }

    /// "Type" or "Type{...args}" for log output
    std::string describe() const;
};

} // namespace wayfinder
