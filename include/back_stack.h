// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file back_stack.h
 * @brief Flat, mutable list of destinations for single-stack hosts
 *
 * @pattern Entries are edited in place; each edit publishes a new snapshot
 *          through a StateCell so observers see whole-list values.
 *          to_stack_node() converts the list into a tree Stack for hosts that
 *          migrate to Navigator.
 * @threading Single writer, same as Navigator.
 */

#pragma once

#include "key_generator.h"
#include "nav_node.h"
#include "state_cell.h"

#include <functional>
#include <string>
#include <vector>

namespace wayfinder {

struct BackStackEntry {
    std::string id;
    Destination destination;
    json saved_state = json::object();
    std::optional<NavigationTransition> transition;
    bool is_popping = false;
};

class BackStack {
  public:
    using Entries = std::vector<BackStackEntry>;
    using DestinationPredicate = std::function<bool(const Destination&)>;

    /// @param id_generator Source of entry ids; defaults to random 16-char keys
    explicit BackStack(KeyGenerator id_generator = make_random_key_generator(16));

    const Entries& entries() const {
        return entries_;
    }
    size_t size() const {
        return entries_.size();
    }
    bool empty() const {
        return entries_.empty();
    }

    /// Top entry, nullptr if empty
    const BackStackEntry* current() const;

    /// Entry below the top, nullptr with fewer than two entries
    const BackStackEntry* previous() const;

    bool can_go_back() const {
        return entries_.size() > 1;
    }

    void push(const Destination& destination,
              std::optional<NavigationTransition> transition = std::nullopt);

    /// @return false if empty
    bool pop();

    /**
     * @brief Drop everything above the topmost entry matching @p predicate
     * @return false (and nothing changes) when no entry matches
     */
    bool pop_until(const DestinationPredicate& predicate);

    /// @return false with one entry or fewer
    bool pop_to_root();

    /// Swap the top entry; pushes when empty
    void replace(const Destination& destination,
                 std::optional<NavigationTransition> transition = std::nullopt);

    void replace_all(const std::vector<Destination>& destinations);
    void replace_all_with_entries(Entries entries);
    void clear();

    /// @throws NavigationError INDEX_OUT_OF_BOUNDS unless 0 <= index <= size()
    void insert(int index, const Destination& destination,
                std::optional<NavigationTransition> transition = std::nullopt);

    /// @throws NavigationError INDEX_OUT_OF_BOUNDS
    BackStackEntry remove_at(int index);

    bool remove_by_id(const std::string& id);

    /// @throws NavigationError INDEX_OUT_OF_BOUNDS
    void swap(int index_a, int index_b);

    /// Remove at @p from_index and reinsert at @p to_index. @throws NavigationError INDEX_OUT_OF_BOUNDS
    void move(int from_index, int to_index);

    /**
     * @brief Tree Stack with one Screen per entry, entry ids as screen keys
     */
    NavNodePtr to_stack_node(const NodeKey& stack_key,
                             std::optional<NodeKey> parent_key = std::nullopt) const;

    StateCell<Entries>::Subscription subscribe(StateCell<Entries>::Callback callback,
                                               bool notify_now = false) {
        return snapshot_.subscribe(std::move(callback), notify_now);
    }

  private:
    BackStackEntry make_entry(const Destination& destination,
                              std::optional<NavigationTransition> transition) const;
    void check_index(int index, size_t limit) const;
    void publish();

    KeyGenerator id_generator_;
    Entries entries_;
    StateCell<Entries> snapshot_;
};

} // namespace wayfinder
