/**
 * @file pending_queue.hpp
 * @brief FIFO queue of WAITING actions with per-target ordering and backoff.
 * @author Dimitris Kafetzis
 *
 * Entries are ordered by enqueue sequence. An entry is eligible for pop()
 * when its backoff has elapsed, no earlier entry for the same target is still
 * queued, and no worker currently holds an entry for that target. A popped
 * entry keeps its target claimed until the worker calls requeue() or
 * release(), so same-target actions leave the queue strictly in order.
 */

#pragma once

#include "core/types.hpp"
#include "model/action.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <unordered_set>
#include <vector>

namespace cluster_pilot {

struct PendingEntry {
    ActionPtr action;
    uint64_t sequence = 0;
    uint32_t attempts = 0;                 ///< Failed lock acquisitions so far
    SteadyTime not_before{};
};

class PendingQueue {
public:
    PendingQueue() = default;

    PendingQueue(const PendingQueue&) = delete;
    PendingQueue& operator=(const PendingQueue&) = delete;

    /// Append an action. Returns false once the queue is closed.
    bool push(ActionPtr action);

    /// Put a popped entry back at its original position, eligible after `backoff`.
    void requeue(PendingEntry entry, std::chrono::milliseconds backoff);

    /// Drop the claim a popped entry holds on its target.
    void release(const TargetId& target);

    /**
     * @brief Block until an entry is eligible and claim it.
     *
     * Returns nullopt when stop is requested, or when the queue is closed and
     * holds nothing.
     */
    std::optional<PendingEntry> pop(std::stop_token stop);

    /// Remove a queued (not popped) action. Returns the entry if it was queued.
    std::optional<PendingEntry> remove(const ActionId& action_id);

    /// Reject further pushes; pop() returns nullopt once empty.
    void close();

    /// Remove and return every queued entry.
    std::vector<PendingEntry> drain();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t claimed() const;
    [[nodiscard]] bool closed() const;

    /// Block until nothing is queued or claimed, or the deadline passes.
    bool wait_idle(SteadyTime deadline) const;

private:
    std::map<uint64_t, PendingEntry>::iterator find_eligible(SteadyTime now,
                                                             std::optional<SteadyTime>& next_due);

    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;
    std::map<uint64_t, PendingEntry> entries_;
    std::unordered_set<TargetId> claimed_;
    uint64_t next_sequence_ = 1;
    uint64_t generation_ = 0;              ///< Bumped on every change pop() waits for
    bool closed_ = false;
};

}  // namespace cluster_pilot
