// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file state_cell.h
 * @brief Latest-value holder with change subscriptions
 *
 * @pattern set() stores a new snapshot and notifies subscribers synchronously.
 *          subscribe() returns a move-only Subscription that unsubscribes on
 *          destruction; release() detaches without unsubscribing.
 * @threading One writer. get() may be called from any thread; callbacks run
 *            on the writer's thread.
 * @gotchas A Subscription may outlive its cell; reset() then does nothing.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace wayfinder {

template <typename T> class StateCell {
    struct Shared {
        mutable std::mutex mutex;
        T value;
        std::map<uint64_t, std::function<void(const T&)>> subscribers;
        uint64_t next_id = 1;

        explicit Shared(T initial) : value(std::move(initial)) {}
    };

  public:
    using Callback = std::function<void(const T&)>;

    /**
     * @brief RAII handle for one subscriber
     */
    class Subscription {
      public:
        Subscription() = default;

        Subscription(std::weak_ptr<Shared> cell, uint64_t id) : cell_(std::move(cell)), id_(id) {}

        ~Subscription() {
            reset();
        }

        Subscription(Subscription&& other) noexcept
            : cell_(std::move(other.cell_)), id_(std::exchange(other.id_, 0)) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                cell_ = std::move(other.cell_);
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset() {
            if (id_ != 0) {
                if (auto cell = cell_.lock()) {
                    std::lock_guard<std::mutex> lock(cell->mutex);
                    cell->subscribers.erase(id_);
                }
                id_ = 0;
                cell_.reset();
            }
        }

        /// Stop tracking without unsubscribing
        void release() {
            id_ = 0;
            cell_.reset();
        }

        explicit operator bool() const {
            return id_ != 0;
        }

      private:
        std::weak_ptr<Shared> cell_;
        uint64_t id_ = 0;
    };

    explicit StateCell(T initial) : shared_(std::make_shared<Shared>(std::move(initial))) {}

    StateCell(const StateCell&) = delete;
    StateCell& operator=(const StateCell&) = delete;

    /// Copy of the latest value
    T get() const {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        return shared_->value;
    }

    /**
     * @brief Publish a new value and notify every subscriber with it
     */
    void set(T value) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->value = value;
            callbacks.reserve(shared_->subscribers.size());
            for (const auto& entry : shared_->subscribers) {
                callbacks.push_back(entry.second);
            }
        }
        // Snapshot so callbacks may subscribe or unsubscribe while being notified
        for (const auto& callback : callbacks) {
            callback(value);
        }
    }

    /**
     * @brief Register @p callback for future values
     * @param notify_now Also invoke it once with the current value
     */
    Subscription subscribe(Callback callback, bool notify_now = false) {
        uint64_t id = 0;
        std::optional<T> current;
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            id = shared_->next_id++;
            shared_->subscribers.emplace(id, callback);
            if (notify_now) {
                current = shared_->value;
            }
        }
        if (current) {
            callback(*current);
        }
        return Subscription(shared_, id);
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        return shared_->subscribers.size();
    }

  private:
    std::shared_ptr<Shared> shared_;
};

} // namespace wayfinder
