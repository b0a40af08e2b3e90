/**
 * @file pending_queue.cpp
 * @brief PendingQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/pending_queue.hpp"

namespace cluster_pilot {

bool PendingQueue::push(ActionPtr action) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        const uint64_t seq = next_sequence_++;
        entries_.emplace(seq, PendingEntry{
            .action = std::move(action),
            .sequence = seq,
            .attempts = 0,
            .not_before = std::chrono::steady_clock::now()
        });
        ++generation_;
    }
    cv_.notify_all();
    return true;
}

void PendingQueue::requeue(PendingEntry entry, std::chrono::milliseconds backoff) {
    {
        std::lock_guard lock(mutex_);
        claimed_.erase(entry.action->target());
        entry.not_before = std::chrono::steady_clock::now() + backoff;
        const uint64_t seq = entry.sequence;
        entries_.insert_or_assign(seq, std::move(entry));
        ++generation_;
    }
    cv_.notify_all();
}

void PendingQueue::release(const TargetId& target) {
    {
        std::lock_guard lock(mutex_);
        claimed_.erase(target);
        ++generation_;
    }
    cv_.notify_all();
}

std::map<uint64_t, PendingEntry>::iterator PendingQueue::find_eligible(
    SteadyTime now, std::optional<SteadyTime>& next_due) {
    std::unordered_set<TargetId> blocked;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        const auto& target = it->second.action->target();
        if (claimed_.contains(target) || blocked.contains(target)) continue;

        if (it->second.not_before > now) {
            if (!next_due || it->second.not_before < *next_due) next_due = it->second.not_before;
            blocked.insert(target);
            continue;
        }
        return it;
    }
    return entries_.end();
}

std::optional<PendingEntry> PendingQueue::pop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (closed_ && entries_.empty()) return std::nullopt;

        std::optional<SteadyTime> next_due;
        auto it = find_eligible(std::chrono::steady_clock::now(), next_due);
        if (it != entries_.end()) {
            PendingEntry entry = std::move(it->second);
            entries_.erase(it);
            claimed_.insert(entry.action->target());
            return entry;
        }

        const uint64_t seen = generation_;
        const bool was_closed = closed_;
        auto changed = [&] { return generation_ != seen || closed_ != was_closed; };
        if (next_due) {
            cv_.wait_until(lock, stop, *next_due, changed);
        } else {
            cv_.wait(lock, stop, changed);
        }
    }
    return std::nullopt;
}

std::optional<PendingEntry> PendingQueue::remove(const ActionId& action_id) {
    std::optional<PendingEntry> removed;
    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.action->id() == action_id) {
                removed = std::move(it->second);
                entries_.erase(it);
                ++generation_;
                break;
            }
        }
    }
    if (removed) cv_.notify_all();
    return removed;
}

void PendingQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::vector<PendingEntry> PendingQueue::drain() {
    std::vector<PendingEntry> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(entries_.size());
        for (auto& [seq, entry] : entries_) out.push_back(std::move(entry));
        entries_.clear();
        ++generation_;
    }
    cv_.notify_all();
    return out;
}

size_t PendingQueue::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

size_t PendingQueue::claimed() const {
    std::lock_guard lock(mutex_);
    return claimed_.size();
}

bool PendingQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool PendingQueue::wait_idle(SteadyTime deadline) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] {
        return entries_.empty() && claimed_.empty();
    });
}

}  // namespace cluster_pilot
