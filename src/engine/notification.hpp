/**
 * @file notification.hpp
 * @brief Action state-transition events and the sink contract that receives them.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/params.hpp"
#include "core/types.hpp"
#include "model/action.hpp"

#include <string>

namespace cluster_pilot {

struct ActionEvent {
    ActionId action_id;
    ActionId parent_id;
    ActionType type;
    TargetId target;
    ActionStatus status;
    WorkerId worker;
    ActionReason reason;
    Params outputs;                 ///< Filled for terminal transitions only
    Timestamp at;
};

/// Build an event from the action's current observable state.
[[nodiscard]] inline ActionEvent make_event(const Action& action) {
    auto snap = action.snapshot();
    ActionEvent event{
        .action_id = snap.id,
        .parent_id = action.parent_id(),
        .type = snap.type,
        .target = snap.target,
        .status = snap.status,
        .worker = snap.owner,
        .reason = snap.reason,
        .outputs = {},
        .at = std::chrono::system_clock::now()
    };
    if (is_terminal(snap.status)) event.outputs = std::move(snap.outputs);
    return event;
}

/**
 * @brief Receives action events (runtime polymorphism).
 *
 * emit() is called from the dispatcher's notification thread, never from a
 * worker, so a slow sink does not delay action execution.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void emit(const ActionEvent& event) = 0;
};

}  // namespace cluster_pilot
