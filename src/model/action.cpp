/**
 * @file action.cpp
 * @brief Action state machine.
 * @author Dimitris Kafetzis
 */

#include "model/action.hpp"
#include "core/ids.hpp"

namespace cluster_pilot {

Action::Action(ActionType type, TargetId target, Params inputs, ActionCause cause)
    : id_(generate_id("act"))
    , type_(type)
    , target_(std::move(target))
    , cause_(cause)
    , created_at_(std::chrono::system_clock::now())
    , inputs_(std::move(inputs)) {}

std::shared_ptr<Action> Action::create(ActionType type, TargetId target,
                                       Params inputs, ActionCause cause) {
    return std::make_shared<Action>(type, std::move(target), std::move(inputs), cause);
}

void Action::set_parent(const ActionId& parent_id, std::stop_token parent_token) {
    parent_id_ = parent_id;
    parent_token_ = std::move(parent_token);
}

ActionStatus Action::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

WorkerId Action::owner() const {
    std::lock_guard lock(mutex_);
    return owner_;
}

ActionReason Action::reason() const {
    std::lock_guard lock(mutex_);
    return reason_;
}

std::optional<Timestamp> Action::started_at() const {
    std::lock_guard lock(mutex_);
    return started_at_;
}

std::optional<Timestamp> Action::ended_at() const {
    std::lock_guard lock(mutex_);
    return ended_at_;
}

bool Action::mark_waiting() {
    std::lock_guard lock(mutex_);
    if (status_ != ActionStatus::Init) return false;
    status_ = ActionStatus::Waiting;
    return true;
}

bool Action::mark_running(const WorkerId& worker) {
    std::lock_guard lock(mutex_);
    if (status_ != ActionStatus::Waiting) return false;
    status_ = ActionStatus::Running;
    owner_ = worker;
    started_at_ = std::chrono::system_clock::now();
    return true;
}

bool Action::finish(ActionStatus terminal, ActionReason reason) {
    if (!is_terminal(terminal)) return false;
    {
        std::lock_guard lock(mutex_);
        if (is_terminal(status_)) return false;
        status_ = terminal;
        reason_ = std::move(reason);
        owner_.clear();
        ended_at_ = std::chrono::system_clock::now();
    }
    terminal_cv_.notify_all();
    return true;
}

std::optional<ActionStatus> Action::wait_for_terminal(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    bool done = terminal_cv_.wait_for(lock, timeout, [this] { return is_terminal(status_); });
    if (!done) return std::nullopt;
    return status_;
}

bool Action::request_cancel() {
    return stop_source_.request_stop();
}

bool Action::cancel_requested() const noexcept {
    return stop_source_.stop_requested() || parent_token_.stop_requested();
}

CancelQuery Action::cancel_query() const {
    return [own = stop_source_.get_token(), parent = parent_token_] {
        return own.stop_requested() || parent.stop_requested();
    };
}

void Action::set_output(std::string key, ParamValue value) {
    std::lock_guard lock(mutex_);
    outputs_.set(std::move(key), std::move(value));
}

void Action::append_output(const std::string& key, std::string item) {
    std::lock_guard lock(mutex_);
    outputs_.append(key, std::move(item));
}

Params Action::outputs() const {
    std::lock_guard lock(mutex_);
    return outputs_;
}

ActionSnapshot Action::snapshot() const {
    std::lock_guard lock(mutex_);
    return ActionSnapshot{
        .id = id_,
        .type = type_,
        .target = target_,
        .status = status_,
        .owner = owner_,
        .reason = reason_,
        .outputs = outputs_,
        .created_at = created_at_,
        .started_at = started_at_,
        .ended_at = ended_at_,
        .cancel_requested = cancel_requested()
    };
}

}  // namespace cluster_pilot
