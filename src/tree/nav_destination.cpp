// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_destination.h"

namespace wayfinder {

const char* transition_type_name(TransitionType type) {
    switch (type) {
    case TransitionType::NONE:
        return "none";
    case TransitionType::FADE:
        return "fade";
    case TransitionType::SLIDE_HORIZONTAL:
        return "slide_horizontal";
    case TransitionType::SLIDE_VERTICAL:
        return "slide_vertical";
    case TransitionType::SCALE_IN:
        return "scale_in";
    }
    return "none";
}

std::optional<TransitionType> parse_transition_type(const std::string& name) {
    if (name == "none")
        return TransitionType::NONE;
    if (name == "fade")
        return TransitionType::FADE;
    if (name == "slide_horizontal")
        return TransitionType::SLIDE_HORIZONTAL;
    if (name == "slide_vertical")
        return TransitionType::SLIDE_VERTICAL;
    if (name == "scale_in")
        return TransitionType::SCALE_IN;
    return std::nullopt;
}

std::string Destination::describe() const {
    if (arguments.is_null() || arguments.empty()) {
        return type;
    }
    return type + arguments.dump();
}

} // namespace wayfinder
