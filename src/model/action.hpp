/**
 * @file action.hpp
 * @brief The Action: one requested operation against a cluster or node.
 * @author Dimitris Kafetzis
 *
 * Lifecycle: INIT → WAITING → RUNNING → SUCCEEDED | FAILED | CANCELLED.
 * Terminal states are final; later transition attempts are ignored.
 *
 * Thread-safety: status, owner, reason, timestamps and outputs are guarded by
 * an internal mutex and may be read from any thread. Inputs belong to the
 * worker currently executing the action (policies mutate them in place).
 * Cancellation uses a std::stop_source and is safe from any thread.
 */

#pragma once

#include "core/params.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace cluster_pilot {

/// Cancellation query handed to drivers; returns true once cancellation is requested.
using CancelQuery = std::function<bool()>;

/**
 * @brief Structured reason recorded with a terminal status.
 */
struct ActionReason {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    PolicyId policy_id;             ///< Set when a policy rejected the action
};

/**
 * @brief Read-only copy of an action's observable state.
 *
 * Inputs are excluded: they are owned by the executing worker.
 */
struct ActionSnapshot {
    ActionId id;
    ActionType type;
    TargetId target;
    ActionStatus status;
    WorkerId owner;
    ActionReason reason;
    Params outputs;
    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> ended_at;
    bool cancel_requested = false;
};

class Action {
public:
    Action(ActionType type, TargetId target, Params inputs = {},
           ActionCause cause = ActionCause::User);

    Action(const Action&) = delete;
    Action& operator=(const Action&) = delete;

    static std::shared_ptr<Action> create(ActionType type, TargetId target,
                                          Params inputs = {},
                                          ActionCause cause = ActionCause::User);

    // ── Identity ─────────────────────────────
    [[nodiscard]] const ActionId& id() const noexcept { return id_; }
    [[nodiscard]] ActionType type() const noexcept { return type_; }
    [[nodiscard]] const TargetId& target() const noexcept { return target_; }
    [[nodiscard]] TargetKind target_kind() const noexcept { return target_kind_of(type_); }
    [[nodiscard]] ActionCause cause() const noexcept { return cause_; }
    [[nodiscard]] const ActionId& parent_id() const noexcept { return parent_id_; }
    [[nodiscard]] Timestamp created_at() const noexcept { return created_at_; }

    /**
     * @brief Link this action to a parent; cancelling the parent cancels this one too.
     *
     * Must be called before the action is submitted.
     */
    void set_parent(const ActionId& parent_id, std::stop_token parent_token);

    // ── Lifecycle ────────────────────────────
    [[nodiscard]] ActionStatus status() const;
    [[nodiscard]] WorkerId owner() const;
    [[nodiscard]] ActionReason reason() const;
    [[nodiscard]] std::optional<Timestamp> started_at() const;
    [[nodiscard]] std::optional<Timestamp> ended_at() const;
    [[nodiscard]] bool is_finished() const { return is_terminal(status()); }

    /// INIT → WAITING. Returns false if the action was already submitted or finished.
    bool mark_waiting();

    /// WAITING → RUNNING, recording the owning worker.
    bool mark_running(const WorkerId& worker);

    /// Any non-terminal → terminal. Returns false if already terminal.
    bool finish(ActionStatus terminal, ActionReason reason = {});

    /// Block until terminal or timeout; returns the terminal status if reached.
    std::optional<ActionStatus> wait_for_terminal(std::chrono::milliseconds timeout) const;

    // ── Cancellation ─────────────────────────

    /// Request cooperative cancellation. Returns true for the first request.
    bool request_cancel();

    /// True once this action or its parent has been asked to cancel.
    [[nodiscard]] bool cancel_requested() const noexcept;

    /// Token tied to this action's own cancellation (not the parent's).
    [[nodiscard]] std::stop_token stop_token() const noexcept { return stop_source_.get_token(); }

    /// Query function suitable for drivers; safe to call after the action is destroyed.
    [[nodiscard]] CancelQuery cancel_query() const;

    // ── Data ─────────────────────────────────
    [[nodiscard]] Params& inputs() noexcept { return inputs_; }
    [[nodiscard]] const Params& inputs() const noexcept { return inputs_; }

    void set_output(std::string key, ParamValue value);
    void append_output(const std::string& key, std::string item);
    [[nodiscard]] Params outputs() const;

    [[nodiscard]] ActionSnapshot snapshot() const;

private:
    ActionId id_;
    ActionType type_;
    TargetId target_;
    ActionCause cause_;
    ActionId parent_id_;
    Timestamp created_at_;

    Params inputs_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_cv_;
    ActionStatus status_ = ActionStatus::Init;
    WorkerId owner_;
    ActionReason reason_;
    Params outputs_;
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> ended_at_;

    std::stop_source stop_source_;
    std::stop_token parent_token_;
};

using ActionPtr = std::shared_ptr<Action>;

}  // namespace cluster_pilot
