/**
 * @file action_lock.hpp
 * @brief Action Lock Manager: exclusive execution rights over targets.
 * @author Dimitris Kafetzis
 *
 * A lock record maps target_id → (action_id, worker_id, acquired_at). There is
 * at most one record per target. The table is split into shards selected by
 * target hash; each shard has its own mutex, so acquisitions on distinct
 * targets rarely contend.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cluster_pilot {

struct LockRecord {
    TargetId target_id;
    ActionId action_id;
    WorkerId worker_id;
    Timestamp acquired_at;
};

/**
 * @brief How long to keep trying a busy lock.
 *
 * The delay after the n-th failed attempt is base_backoff * 2^(n-1), capped
 * at max_backoff. After max_attempts failures the caller gives up with LockBusy.
 */
struct LockRetry {
    uint32_t max_attempts = 10;
    std::chrono::milliseconds base_backoff{20};
    std::chrono::milliseconds max_backoff{2000};

    [[nodiscard]] std::chrono::milliseconds delay_after(uint32_t attempts) const noexcept;
};

class ActionLockManager {
public:
    explicit ActionLockManager(Logger& logger, size_t shard_count = 16);

    ActionLockManager(const ActionLockManager&) = delete;
    ActionLockManager& operator=(const ActionLockManager&) = delete;

    /**
     * @brief Atomic test-and-set on the record for target_id.
     *
     * Succeeds idempotently when the record already belongs to action_id.
     * Fails with LockBusy when another action holds the target.
     */
    Result<void> acquire(const TargetId& target_id, const ActionId& action_id,
                         const WorkerId& worker_id);

    /**
     * @brief Remove the record if owned by action_id.
     *
     * A release by a non-owner (or of an unlocked target) changes nothing and
     * returns InconsistentLockRelease; the anomaly is logged at critical level.
     */
    Result<void> release(const TargetId& target_id, const ActionId& action_id);

    [[nodiscard]] std::optional<LockRecord> is_locked(const TargetId& target_id) const;

    /**
     * @brief Administrative override: drop the record regardless of owner.
     *
     * Only for use once the owning worker is known to be dead. Returns the
     * previous owner, if any.
     */
    std::optional<LockRecord> steal(const TargetId& target_id);

    /// Force-clear every record held by action_id. Returns the number removed.
    size_t purge(const ActionId& action_id);

    /// Force-clear every record held by a dead worker. Returns the number removed.
    size_t release_worker(const WorkerId& worker_id);

    [[nodiscard]] size_t lock_count() const;
    [[nodiscard]] std::vector<LockRecord> snapshot() const;
    [[nodiscard]] size_t shard_count() const noexcept { return shards_.size(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<TargetId, LockRecord> records;
    };

    Shard& shard_for(const TargetId& target_id);
    const Shard& shard_for(const TargetId& target_id) const;

    Logger& logger_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace cluster_pilot
