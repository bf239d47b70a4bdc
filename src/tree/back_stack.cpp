// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "back_stack.h"

#include "nav_error.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wayfinder {

BackStack::BackStack(KeyGenerator id_generator)
    : id_generator_(std::move(id_generator)), snapshot_(Entries{}) {}

const BackStackEntry* BackStack::current() const {
    return entries_.empty() ? nullptr : &entries_.back();
}

const BackStackEntry* BackStack::previous() const {
    return entries_.size() > 1 ? &entries_[entries_.size() - 2] : nullptr;
}

BackStackEntry BackStack::make_entry(const Destination& destination,
                                     std::optional<NavigationTransition> transition) const {
    BackStackEntry entry{id_generator_(), destination};
    entry.transition = transition;
    return entry;
}

void BackStack::check_index(int index, size_t limit) const {
    if (index < 0 || static_cast<size_t>(index) >= limit) {
        throw NavigationError::index_out_of_bounds(index, entries_.size());
    }
}

void BackStack::publish() {
    snapshot_.set(entries_);
}

void BackStack::push(const Destination& destination,
                     std::optional<NavigationTransition> transition) {
    entries_.push_back(make_entry(destination, transition));
    publish();
}

bool BackStack::pop() {
    if (entries_.empty()) {
        return false;
    }
    entries_.pop_back();
    publish();
    return true;
}

bool BackStack::pop_until(const DestinationPredicate& predicate) {
    auto it = std::find_if(entries_.rbegin(), entries_.rend(),
                           [&](const BackStackEntry& e) { return predicate(e.destination); });
    if (it == entries_.rend()) {
        return false;
    }
    entries_.erase(it.base(), entries_.end());
    publish();
    return true;
}

bool BackStack::pop_to_root() {
    if (entries_.size() <= 1) {
        return false;
    }
    entries_.resize(1);
    publish();
    return true;
}

void BackStack::replace(const Destination& destination,
                        std::optional<NavigationTransition> transition) {
    if (entries_.empty()) {
        push(destination, transition);
        return;
    }
    entries_.back() = make_entry(destination, transition);
    publish();
}

void BackStack::replace_all(const std::vector<Destination>& destinations) {
    entries_.clear();
    for (const auto& destination : destinations) {
        entries_.push_back(make_entry(destination, std::nullopt));
    }
    publish();
}

void BackStack::replace_all_with_entries(Entries entries) {
    entries_ = std::move(entries);
    publish();
}

void BackStack::clear() {
    entries_.clear();
    publish();
}

void BackStack::insert(int index, const Destination& destination,
                       std::optional<NavigationTransition> transition) {
    check_index(index, entries_.size() + 1);
    entries_.insert(entries_.begin() + index, make_entry(destination, transition));
    publish();
}

BackStackEntry BackStack::remove_at(int index) {
    check_index(index, entries_.size());
    auto entry = std::move(entries_[static_cast<size_t>(index)]);
    entries_.erase(entries_.begin() + index);
    publish();
    return entry;
}

bool BackStack::remove_by_id(const std::string& id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const BackStackEntry& e) { return e.id == id; });
    if (it == entries_.end()) {
        spdlog::trace("[BackStack] remove_by_id: no entry '{}'", id);
        return false;
    }
    entries_.erase(it);
    publish();
    return true;
}

void BackStack::swap(int index_a, int index_b) {
    check_index(index_a, entries_.size());
    check_index(index_b, entries_.size());
    std::swap(entries_[static_cast<size_t>(index_a)], entries_[static_cast<size_t>(index_b)]);
    publish();
}

void BackStack::move(int from_index, int to_index) {
    if (from_index == to_index) {
        return;
    }
    check_index(from_index, entries_.size());
    check_index(to_index, entries_.size());
    auto entry = std::move(entries_[static_cast<size_t>(from_index)]);
    entries_.erase(entries_.begin() + from_index);
    entries_.insert(entries_.begin() + to_index, std::move(entry));
    publish();
}

NavNodePtr BackStack::to_stack_node(const NodeKey& stack_key,
                                    std::optional<NodeKey> parent_key) const {
    std::vector<NavNodePtr> children;
    children.reserve(entries_.size());
    for (const auto& entry : entries_) {
        auto destination = entry.destination;
        if (entry.transition) {
            destination.transition = entry.transition;
        }
        children.push_back(make_screen(entry.id, stack_key, std::move(destination)));
    }
    return make_stack(stack_key, std::move(parent_key), std::move(children));
}

} // namespace wayfinder
