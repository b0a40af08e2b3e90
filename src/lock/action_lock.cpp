/**
 * @file action_lock.cpp
 * @brief ActionLockManager implementation.
 * @author Dimitris Kafetzis
 */

#include "lock/action_lock.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace cluster_pilot {

namespace {
constexpr std::string_view kComponent = "lock";
}

std::chrono::milliseconds LockRetry::delay_after(uint32_t attempts) const noexcept {
    const uint32_t shift = std::min<uint32_t>(attempts > 0 ? attempts - 1 : 0, 20);
    const std::chrono::milliseconds delay = base_backoff * (int64_t{1} << shift);
    return std::min(delay, max_backoff);
}

ActionLockManager::ActionLockManager(Logger& logger, size_t shard_count)
    : logger_(logger) {
    if (shard_count == 0) shard_count = 1;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

ActionLockManager::Shard& ActionLockManager::shard_for(const TargetId& target_id) {
    return *shards_[std::hash<TargetId>{}(target_id) % shards_.size()];
}

const ActionLockManager::Shard& ActionLockManager::shard_for(const TargetId& target_id) const {
    return *shards_[std::hash<TargetId>{}(target_id) % shards_.size()];
}

Result<void> ActionLockManager::acquire(const TargetId& target_id, const ActionId& action_id,
                                        const WorkerId& worker_id) {
    auto& shard = shard_for(target_id);
    std::lock_guard lock(shard.mutex);

    auto [it, inserted] = shard.records.try_emplace(target_id);
    if (inserted) {
        it->second = LockRecord{
            .target_id = target_id,
            .action_id = action_id,
            .worker_id = worker_id,
            .acquired_at = std::chrono::system_clock::now()
        };
        return {};
    }

    if (it->second.action_id == action_id) {
        // Re-entrant retry by the same action.
        it->second.worker_id = worker_id;
        return {};
    }

    return Error{ErrorCode::LockBusy,
                 std::format("Target {} is locked by action {}", target_id, it->second.action_id)};
}

Result<void> ActionLockManager::release(const TargetId& target_id, const ActionId& action_id) {
    std::string holder;
    {
        auto& shard = shard_for(target_id);
        std::lock_guard lock(shard.mutex);

        auto it = shard.records.find(target_id);
        if (it != shard.records.end() && it->second.action_id == action_id) {
            shard.records.erase(it);
            return {};
        }
        holder = it == shard.records.end() ? std::string{"<none>"} : it->second.action_id;
    }

    auto message = std::format("Release of {} by {} rejected; holder is {}",
                               target_id, action_id, holder);
    logger_.critical(kComponent, message);
    return Error{ErrorCode::InconsistentLockRelease, std::move(message)};
}

std::optional<LockRecord> ActionLockManager::is_locked(const TargetId& target_id) const {
    const auto& shard = shard_for(target_id);
    std::lock_guard lock(shard.mutex);
    auto it = shard.records.find(target_id);
    if (it == shard.records.end()) return std::nullopt;
    return it->second;
}

std::optional<LockRecord> ActionLockManager::steal(const TargetId& target_id) {
    std::optional<LockRecord> previous;
    {
        auto& shard = shard_for(target_id);
        std::lock_guard lock(shard.mutex);
        auto it = shard.records.find(target_id);
        if (it == shard.records.end()) return std::nullopt;
        previous = std::move(it->second);
        shard.records.erase(it);
    }

    logger_.warn(kComponent, std::format("Lock on {} stolen from action {} (worker {})",
                                         target_id, previous->action_id, previous->worker_id));
    return previous;
}

size_t ActionLockManager::purge(const ActionId& action_id) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        removed += std::erase_if(shard->records, [&](const auto& entry) {
            return entry.second.action_id == action_id;
        });
    }
    if (removed > 0) {
        logger_.warn(kComponent, std::format("Purged {} lock record(s) of action {}",
                                             removed, action_id));
    }
    return removed;
}

size_t ActionLockManager::release_worker(const WorkerId& worker_id) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        removed += std::erase_if(shard->records, [&](const auto& entry) {
            return entry.second.worker_id == worker_id;
        });
    }
    if (removed > 0) {
        logger_.warn(kComponent, std::format("Released {} lock record(s) of dead worker {}",
                                             removed, worker_id));
    }
    return removed;
}

size_t ActionLockManager::lock_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        total += shard->records.size();
    }
    return total;
}

std::vector<LockRecord> ActionLockManager::snapshot() const {
    std::vector<LockRecord> result;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        for (const auto& [target, record] : shard->records) {
            result.push_back(record);
        }
    }
    return result;
}

}  // namespace cluster_pilot
