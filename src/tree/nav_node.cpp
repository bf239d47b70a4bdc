// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_node.h"

#include "nav_error.h"

#include <sstream>

namespace wayfinder {

namespace {

const std::optional<std::string> NO_SCOPE;

bool child_lists_equal(const std::vector<NavNodePtr>& a, const std::vector<NavNodePtr>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!nodes_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

void describe_into(std::ostringstream& out, const NavNodePtr& node) {
    if (!node) {
        out << "null";
        return;
    }
    node->visit(Overloaded{
        [&](const ScreenNode& s) { out << "Screen(" << s.key << ":" << s.destination.type << ")"; },
        [&](const StackNode& s) {
            out << "Stack(" << s.key << ")[";
            for (size_t i = 0; i < s.children.size(); ++i) {
                if (i > 0)
                    out << ", ";
                describe_into(out, s.children[i]);
            }
            out << "]";
        },
        [&](const TabNode& t) {
            out << "Tab(" << t.key << ", active=" << t.active_index << ")[";
            for (size_t i = 0; i < t.stacks.size(); ++i) {
                if (i > 0)
                    out << ", ";
                describe_into(out, t.stacks[i]);
            }
            out << "]";
        },
        [&](const PaneNode& p) {
            out << "Pane(" << p.key << ", active=" << pane_role_name(p.active_role) << "){";
            bool first = true;
            for (const auto& [role, config] : p.panes) {
                if (!first)
                    out << ", ";
                first = false;
                out << pane_role_name(role) << ": ";
                describe_into(out, config.content);
            }
            out << "}";
        },
    });
}

} // namespace

// ============================================================================
// Enum names
// ============================================================================

const char* pane_role_name(PaneRole role) {
    switch (role) {
    case PaneRole::PRIMARY:
        return "primary";
    case PaneRole::SUPPORTING:
        return "supporting";
    case PaneRole::EXTRA:
        return "extra";
    }
    return "primary";
}

const char* adapt_strategy_name(AdaptStrategy strategy) {
    switch (strategy) {
    case AdaptStrategy::HIDE:
        return "hide";
    case AdaptStrategy::LEVITATE:
        return "levitate";
    case AdaptStrategy::REFLOW:
        return "reflow";
    }
    return "hide";
}

const char* pane_back_behavior_name(PaneBackBehavior behavior) {
    switch (behavior) {
    case PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE:
        return "pop_until_scaffold_value_change";
    case PaneBackBehavior::POP_UNTIL_CURRENT_DESTINATION_CHANGE:
        return "pop_until_current_destination_change";
    case PaneBackBehavior::POP_UNTIL_CONTENT_CHANGE:
        return "pop_until_content_change";
    case PaneBackBehavior::POP_LATEST:
        return "pop_latest";
    }
    return "pop_until_scaffold_value_change";
}

const char* nav_node_kind_name(NavNodeKind kind) {
    switch (kind) {
    case NavNodeKind::SCREEN:
        return "screen";
    case NavNodeKind::STACK:
        return "stack";
    case NavNodeKind::TAB:
        return "tab";
    case NavNodeKind::PANE:
        return "pane";
    }
    return "screen";
}

std::optional<PaneRole> parse_pane_role(const std::string& name) {
    for (PaneRole role : ALL_PANE_ROLES) {
        if (name == pane_role_name(role)) {
            return role;
        }
    }
    return std::nullopt;
}

std::optional<AdaptStrategy> parse_adapt_strategy(const std::string& name) {
    for (AdaptStrategy s : {AdaptStrategy::HIDE, AdaptStrategy::LEVITATE, AdaptStrategy::REFLOW}) {
        if (name == adapt_strategy_name(s)) {
            return s;
        }
    }
    return std::nullopt;
}

std::optional<PaneBackBehavior> parse_pane_back_behavior(const std::string& name) {
    for (PaneBackBehavior b : {PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE,
                               PaneBackBehavior::POP_UNTIL_CURRENT_DESTINATION_CHANGE,
                               PaneBackBehavior::POP_UNTIL_CONTENT_CHANGE,
                               PaneBackBehavior::POP_LATEST}) {
        if (name == pane_back_behavior_name(b)) {
            return b;
        }
    }
    return std::nullopt;
}

std::vector<PaneRole> PaneNode::configured_roles() const {
    std::vector<PaneRole> roles;
    roles.reserve(panes.size());
    for (const auto& entry : panes) {
        roles.push_back(entry.first);
    }
    return roles;
}

// ============================================================================
// NavNode construction and validation
// ============================================================================

NavNode::NavNode(ScreenNode screen) : data_(std::move(screen)) {}

NavNode::NavNode(StackNode stack) : data_(std::move(stack)) {
    for (const auto& child : std::get<StackNode>(data_).children) {
        if (!child) {
            throw NavigationError(NavErrorType::INVALID_NODE,
                                  "Stack '" + key() + "' contains a null child");
        }
    }
}

NavNode::NavNode(TabNode tab) : data_(std::move(tab)) {
    const auto& t = std::get<TabNode>(data_);
    if (t.stacks.empty()) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              "Tab '" + t.key + "' must have at least one stack");
    }
    if (t.active_index < 0 || static_cast<size_t>(t.active_index) >= t.stacks.size()) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              "Tab '" + t.key + "' active index " + std::to_string(t.active_index) +
                                  " out of bounds (" + std::to_string(t.stacks.size()) + " stacks)");
    }
    for (const auto& stack : t.stacks) {
        if (!stack || !stack->is_stack()) {
            throw NavigationError(NavErrorType::INVALID_NODE,
                                  "Tab '" + t.key + "' children must all be stacks");
        }
    }
}

NavNode::NavNode(PaneNode pane) : data_(std::move(pane)) {
    const auto& p = std::get<PaneNode>(data_);
    if (!p.has_role(PaneRole::PRIMARY)) {
        throw NavigationError(NavErrorType::PRIMARY_PANE_REQUIRED,
                              "Pane '" + p.key + "' must have a primary pane");
    }
    if (!p.has_role(p.active_role)) {
        throw NavigationError(NavErrorType::INVALID_NODE,
                              std::string("Pane '") + p.key + "' active role " +
                                  pane_role_name(p.active_role) + " is not configured");
    }
    for (const auto& [role, config] : p.panes) {
        if (!config.content) {
            throw NavigationError(NavErrorType::INVALID_NODE,
                                  std::string("Pane '") + p.key + "' role " + pane_role_name(role) +
                                      " has no content");
        }
    }
}

const NodeKey& NavNode::key() const {
    return std::visit([](const auto& n) -> const NodeKey& { return n.key; }, data_);
}

const std::optional<NodeKey>& NavNode::parent_key() const {
    return std::visit([](const auto& n) -> const std::optional<NodeKey>& { return n.parent_key; },
                      data_);
}

NavNodeKind NavNode::kind() const {
    return visit(Overloaded{
        [](const ScreenNode&) { return NavNodeKind::SCREEN; },
        [](const StackNode&) { return NavNodeKind::STACK; },
        [](const TabNode&) { return NavNodeKind::TAB; },
        [](const PaneNode&) { return NavNodeKind::PANE; },
    });
}

std::vector<NavNodePtr> NavNode::children() const {
    return visit(Overloaded{
        [](const ScreenNode&) { return std::vector<NavNodePtr>{}; },
        [](const StackNode& s) { return s.children; },
        [](const TabNode& t) { return t.stacks; },
        [](const PaneNode& p) {
            std::vector<NavNodePtr> contents;
            for (const auto& entry : p.panes) {
                contents.push_back(entry.second.content);
            }
            return contents;
        },
    });
}

NavNodePtr NavNode::active_child() const {
    return visit(Overloaded{
        [](const ScreenNode&) -> NavNodePtr { return nullptr; },
        [](const StackNode& s) { return s.active_child(); },
        [](const TabNode& t) { return t.active_stack_node(); },
        [](const PaneNode& p) { return p.active_content(); },
    });
}

const std::optional<std::string>& NavNode::scope_key() const {
    return visit(Overloaded{
        [](const ScreenNode&) -> const std::optional<std::string>& { return NO_SCOPE; },
        [](const StackNode& s) -> const std::optional<std::string>& { return s.scope_key; },
        [](const TabNode& t) -> const std::optional<std::string>& { return t.scope_key; },
        [](const PaneNode& p) -> const std::optional<std::string>& { return p.scope_key; },
    });
}

bool NavNode::operator==(const NavNode& other) const {
    if (this == &other) {
        return true;
    }
    if (data_.index() != other.data_.index()) {
        return false;
    }
    return visit(Overloaded{
        [&](const ScreenNode& a) {
            const auto& b = std::get<ScreenNode>(other.data_);
            return a.key == b.key && a.parent_key == b.parent_key && a.destination == b.destination;
        },
        [&](const StackNode& a) {
            const auto& b = std::get<StackNode>(other.data_);
            return a.key == b.key && a.parent_key == b.parent_key && a.scope_key == b.scope_key &&
                   child_lists_equal(a.children, b.children);
        },
        [&](const TabNode& a) {
            const auto& b = std::get<TabNode>(other.data_);
            return a.key == b.key && a.parent_key == b.parent_key &&
                   a.active_index == b.active_index && a.scope_key == b.scope_key &&
                   a.wrapper_key == b.wrapper_key && child_lists_equal(a.stacks, b.stacks);
        },
        [&](const PaneNode& a) {
            const auto& b = std::get<PaneNode>(other.data_);
            if (a.key != b.key || a.parent_key != b.parent_key || a.active_role != b.active_role ||
                a.back_behavior != b.back_behavior || a.scope_key != b.scope_key ||
                a.panes.size() != b.panes.size()) {
                return false;
            }
            for (const auto& [role, config] : a.panes) {
                auto it = b.panes.find(role);
                if (it == b.panes.end() || it->second.adapt_strategy != config.adapt_strategy ||
                    !nodes_equal(config.content, it->second.content)) {
                    return false;
                }
            }
            return true;
        },
    });
}

// ============================================================================
// Helpers
// ============================================================================

NavNodePtr make_screen(NodeKey key, std::optional<NodeKey> parent_key, Destination destination) {
    return make_node(ScreenNode{std::move(key), std::move(parent_key), std::move(destination)});
}

NavNodePtr make_stack(NodeKey key, std::optional<NodeKey> parent_key,
                      std::vector<NavNodePtr> children, std::optional<std::string> scope_key) {
    return make_node(
        StackNode{std::move(key), std::move(parent_key), std::move(children), std::move(scope_key)});
}

NavNodePtr with_parent_key(const NavNodePtr& node, std::optional<NodeKey> parent_key) {
    if (!node || node->parent_key() == parent_key) {
        return node;
    }
    return node->visit([&](auto payload) -> NavNodePtr {
        payload.parent_key = std::move(parent_key);
        return make_node(std::move(payload));
    });
}

bool nodes_equal(const NavNodePtr& a, const NavNodePtr& b) {
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return *a == *b;
}

std::string describe_tree(const NavNodePtr& node) {
    std::ostringstream out;
    describe_into(out, node);
    return out.str();
}

} // namespace wayfinder
