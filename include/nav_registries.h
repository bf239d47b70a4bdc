// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_registries.h
 * @brief Routing policy collaborators: scopes, containers and pane roles
 *
 * @pattern Abstract lookup interface + permissive empty() instance + table
 *          implementation built once at startup (see NavConfig) and shared
 *          read-only afterwards.
 * @threading Immutable after construction; safe to share across readers.
 */

#pragma once

#include "nav_node.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wayfinder {

// ============================================================================
// ScopeRegistry
// ============================================================================

/**
 * @brief Decides whether a destination belongs inside a scoped container
 */
class ScopeRegistry {
  public:
    virtual ~ScopeRegistry() = default;

    /**
     * @brief Whether @p destination may be shown inside the container scoped @p scope_key
     */
    virtual bool is_in_scope(const std::string& scope_key, const Destination& destination) const = 0;

    /**
     * @brief Scope the destination is registered under, if any
     */
    virtual std::optional<std::string> get_scope_key(const Destination& destination) const = 0;

    /// Registry that treats every destination as in scope
    static std::shared_ptr<const ScopeRegistry> empty();
};

/**
 * @brief Scope membership from a fixed table of scope key -> destination types
 *
 * Unknown scope keys contain nothing, so a scoped container whose key is not
 * registered routes every destination out of scope.
 */
class TableScopeRegistry : public ScopeRegistry {
  public:
    using ScopeTable = std::map<std::string, std::set<std::string>>;

    explicit TableScopeRegistry(ScopeTable scopes);

    bool is_in_scope(const std::string& scope_key, const Destination& destination) const override;
    std::optional<std::string> get_scope_key(const Destination& destination) const override;

    size_t scope_count() const {
        return scopes_.size();
    }

  private:
    ScopeTable scopes_;
    std::map<std::string, std::string> destination_to_scope_;
};

// ============================================================================
// ContainerRegistry
// ============================================================================

enum class ContainerKind {
    TABS,
    PANES
};

/**
 * @brief Builds a container node
 *
 * @param key Key for the container node itself
 * @param parent_key Key of the stack that will hold it
 * @param initial_index Initial tab index (ignored for panes)
 */
using ContainerBuilder = std::function<NavNodePtr(
    const NodeKey& key, const std::optional<NodeKey>& parent_key, int initial_index)>;

struct ContainerInfo {
    ContainerKind kind = ContainerKind::TABS;
    std::string scope_key;
    ContainerBuilder builder;
    int initial_tab_index = 0;
    PaneRole initial_pane = PaneRole::PRIMARY;
};

/**
 * @brief Supplies the container a destination must be wrapped in on first entry
 */
class ContainerRegistry {
  public:
    virtual ~ContainerRegistry() = default;

    virtual std::optional<ContainerInfo> get_container_info(const Destination& destination) const = 0;

    /// Registry where no destination needs a container
    static std::shared_ptr<const ContainerRegistry> empty();
};

/**
 * @brief Container lookup keyed by the destination type that triggers it
 */
class TableContainerRegistry : public ContainerRegistry {
  public:
    TableContainerRegistry() = default;
    explicit TableContainerRegistry(std::map<std::string, ContainerInfo> containers);

    std::optional<ContainerInfo> get_container_info(const Destination& destination) const override;

    size_t container_count() const {
        return containers_.size();
    }

  private:
    std::map<std::string, ContainerInfo> containers_;
};

/**
 * @brief Tab container whose tab i starts with a single screen of @p tab_roots[i]
 *
 * Inner keys derive from the container key ("<key>/tab<i>", "<key>/tab<i>/root")
 * so the builder needs no key generator.
 */
ContainerInfo make_tab_container(std::string scope_key, std::vector<Destination> tab_roots,
                                 int initial_tab_index = 0,
                                 std::optional<std::string> wrapper_key = std::nullopt);

struct PaneSlot {
    Destination root;
    AdaptStrategy adapt_strategy = AdaptStrategy::HIDE;
};

/**
 * @brief Pane container with one single-screen stack per configured role
 *
 * Inner keys derive from the container key ("<key>/<role>", "<key>/<role>/root").
 */
ContainerInfo make_pane_container(std::string scope_key, std::map<PaneRole, PaneSlot> slots,
                                  PaneBackBehavior back_behavior =
                                      PaneBackBehavior::POP_UNTIL_SCAFFOLD_VALUE_CHANGE,
                                  PaneRole initial_pane = PaneRole::PRIMARY);

// ============================================================================
// PaneRoleRegistry
// ============================================================================

/**
 * @brief Maps destinations to the pane role they open in, per pane scope
 */
class PaneRoleRegistry {
  public:
    virtual ~PaneRoleRegistry() = default;

    virtual std::optional<PaneRole> get_pane_role(const std::string& scope_key,
                                                  const Destination& destination) const = 0;

    bool has_pane_role(const std::string& scope_key, const Destination& destination) const {
        return get_pane_role(scope_key, destination).has_value();
    }

    static std::shared_ptr<const PaneRoleRegistry> empty();
};

class TablePaneRoleRegistry : public PaneRoleRegistry {
  public:
    /// scope key -> (destination type -> role)
    using RoleTable = std::map<std::string, std::map<std::string, PaneRole>>;

    explicit TablePaneRoleRegistry(RoleTable roles);

    std::optional<PaneRole> get_pane_role(const std::string& scope_key,
                                          const Destination& destination) const override;

  private:
    RoleTable roles_;
};

} // namespace wayfinder
