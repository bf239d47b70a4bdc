// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_node.h
 * @brief Immutable navigation tree: Screen, Stack, Tab and Pane nodes
 *
 * @pattern Closed variant set held in std::variant; nodes are shared as
 *          shared_ptr<const NavNode> so unchanged subtrees are reused by
 *          reference across tree versions.
 * @threading Nodes are immutable once built and may be read from any thread.
 * @gotchas TabNode and PaneNode invariants are checked when the NavNode is
 *          constructed, not when the payload struct is filled in.
 */

#pragma once

#include "nav_destination.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wayfinder {

using NodeKey = std::string;

class NavNode;
using NavNodePtr = std::shared_ptr<const NavNode>;

/**
 * @brief Logical role of a pane within an adaptive layout
 */
enum class PaneRole {
    PRIMARY,    // Main content, always present
    SUPPORTING, // Detail/secondary content
    EXTRA       // Optional tertiary content
};

/**
 * @brief How a pane adapts when there is not enough room to show it
 */
enum class AdaptStrategy {
    HIDE,
    LEVITATE,
    REFLOW
};

/**
 * @brief What back does inside a PaneNode once the active role is at its root
 */
enum class PaneBackBehavior {
    POP_UNTIL_SCAFFOLD_VALUE_CHANGE,
    POP_UNTIL_CURRENT_DESTINATION_CHANGE,
    POP_UNTIL_CONTENT_CHANGE,
    POP_LATEST
};

enum class NavNodeKind {
    SCREEN,
    STACK,
    TAB,
    PANE
};

const char* pane_role_name(PaneRole role);
const char* adapt_strategy_name(AdaptStrategy strategy);
const char* pane_back_behavior_name(PaneBackBehavior behavior);
const char* nav_node_kind_name(NavNodeKind kind);

std::optional<PaneRole> parse_pane_role(const std::string& name);
std::optional<AdaptStrategy> parse_adapt_strategy(const std::string& name);
std::optional<PaneBackBehavior> parse_pane_back_behavior(const std::string& name);

/// Roles in the order back resolution and focus fallback consider them
constexpr PaneRole ALL_PANE_ROLES[] = {PaneRole::PRIMARY, PaneRole::SUPPORTING, PaneRole::EXTRA};

// ============================================================================
// Node payloads
// ============================================================================

struct ScreenNode {
    NodeKey key;
    std::optional<NodeKey> parent_key;
    Destination destination;
};

struct StackNode {
    NodeKey key;
    std::optional<NodeKey> parent_key;
    std::vector<NavNodePtr> children;
    std::optional<std::string> scope_key;

    /// Last child, or nullptr when the stack is empty
    NavNodePtr active_child() const {
        return children.empty() ? nullptr : children.back();
    }
    bool empty() const {
        return children.empty();
    }
    size_t size() const {
        return children.size();
    }
    bool can_go_back() const {
        return children.size() > 1;
    }
};

struct TabNode {
    NodeKey key;
    std::optional<NodeKey> parent_key;
    std::vector<NavNodePtr> stacks; ///< Every element is a Stack node
    int active_index = 0;
    std::optional<std::string> scope_key;
    std::optional<std::string> wrapper_key; ///< Presentation wrapper lookup key

    NavNodePtr active_stack_node() const {
        return stacks.at(static_cast<size_t>(active_index));
    }
    size_t tab_count() const {
        return stacks.size();
    }
};

struct PaneConfiguration {
    NavNodePtr content;
    AdaptStrategy adapt_strategy = AdaptStrategy::HIDE;
};

struct PaneNode {
    NodeKey key;
    std::optional<NodeKey> parent_key;
    std::map<PaneRole, PaneConfiguration> panes;
    PaneRole active_role = PaneRole::PRIMARY;
    PaneBackBehavior back_behavior = PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE;
    std::optional<std::string> scope_key;

    bool has_role(PaneRole role) const {
        return panes.count(role) > 0;
    }

    /// Content node for a role, or nullptr if the role is not configured
    NavNodePtr content(PaneRole role) const {
        auto it = panes.find(role);
        return it == panes.end() ? nullptr : it->second.content;
    }

    NavNodePtr active_content() const {
        return content(active_role);
    }

    std::vector<PaneRole> configured_roles() const;
};

/**
 * @brief Lambda overload set for NavNode::visit
 *
 * ```cpp
 * node->visit(Overloaded{[](const ScreenNode&) {...}, [](const StackNode&) {...}, ...});
 * ```
 */
template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// ============================================================================
// NavNode
// ============================================================================

/**
 * @brief One node of the navigation tree
 *
 * Construction validates the variant's invariants and throws NavigationError
 * (INVALID_NODE / PRIMARY_PANE_REQUIRED) on violation. A constructed node is
 * never modified; operations build new nodes that share untouched children.
 */
class NavNode {
  public:
    using Variant = std::variant<ScreenNode, StackNode, TabNode, PaneNode>;

    explicit NavNode(ScreenNode screen);
    explicit NavNode(StackNode stack);
    explicit NavNode(TabNode tab);
    explicit NavNode(PaneNode pane);

    const NodeKey& key() const;
    const std::optional<NodeKey>& parent_key() const;
    NavNodeKind kind() const;

    bool is_screen() const {
        return std::holds_alternative<ScreenNode>(data_);
    }
    bool is_stack() const {
        return std::holds_alternative<StackNode>(data_);
    }
    bool is_tab() const {
        return std::holds_alternative<TabNode>(data_);
    }
    bool is_pane() const {
        return std::holds_alternative<PaneNode>(data_);
    }

    /// Typed access; nullptr when the node is another variant
    const ScreenNode* as_screen() const {
        return std::get_if<ScreenNode>(&data_);
    }
    const StackNode* as_stack() const {
        return std::get_if<StackNode>(&data_);
    }
    const TabNode* as_tab() const {
        return std::get_if<TabNode>(&data_);
    }
    const PaneNode* as_pane() const {
        return std::get_if<PaneNode>(&data_);
    }

    const Variant& data() const {
        return data_;
    }

    template <typename Visitor> decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), data_);
    }

    /**
     * @brief Direct children in order
     *
     * Stack children, Tab stacks, or Pane contents in role order. Screens
     * have none.
     */
    std::vector<NavNodePtr> children() const;

    /**
     * @brief The child the active path continues through
     *
     * Stack -> last child, Tab -> active stack, Pane -> active role content,
     * Screen -> nullptr.
     */
    NavNodePtr active_child() const;

    /// Scope key of a Stack/Tab/Pane, nullopt for Screens or unscoped containers
    const std::optional<std::string>& scope_key() const;

    bool operator==(const NavNode& other) const;
    bool operator!=(const NavNode& other) const {
        return !(*this == other);
    }

  private:
    Variant data_;
};

// ============================================================================
// Construction helpers
// ============================================================================

template <typename Payload> NavNodePtr make_node(Payload payload) {
    return std::make_shared<const NavNode>(std::move(payload));
}

NavNodePtr make_screen(NodeKey key, std::optional<NodeKey> parent_key, Destination destination);

NavNodePtr make_stack(NodeKey key, std::optional<NodeKey> parent_key,
                      std::vector<NavNodePtr> children = {},
                      std::optional<std::string> scope_key = std::nullopt);

/**
 * @brief Copy of a node with a different parent key
 *
 * Only the node itself is rebuilt; its children keep pointing at it by key,
 * which does not change.
 */
NavNodePtr with_parent_key(const NavNodePtr& node, std::optional<NodeKey> parent_key);

/**
 * @brief Structural equality of two possibly-null trees
 */
bool nodes_equal(const NavNodePtr& a, const NavNodePtr& b);

/**
 * @brief Compact one-line rendering, e.g. Stack(root)[Screen(s0:Home)]
 */
std::string describe_tree(const NavNodePtr& node);

} // namespace wayfinder
