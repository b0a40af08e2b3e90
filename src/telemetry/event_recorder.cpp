/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/event_recorder.hpp"

#include <chrono>
#include <sstream>

namespace cluster_pilot {

namespace {
int64_t epoch_ms(Timestamp at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}
}  // namespace

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventRecorder::emit(const ActionEvent& event) {
    std::ostringstream oss;
    oss << R"({"event":"action_state_change")"
        << R"(,"action":")" << event.action_id << "\""
        << R"(,"type":")" << to_string(event.type) << "\""
        << R"(,"target":")" << json_escape(event.target) << "\""
        << R"(,"status":")" << to_string(event.status) << "\""
        << R"(,"ts_ms":)" << epoch_ms(event.at);
    if (!event.parent_id.empty()) {
        oss << R"(,"parent":")" << event.parent_id << "\"";
    }
    if (!event.worker.empty()) {
        oss << R"(,"worker":")" << json_escape(event.worker) << "\"";
    }
    if (is_terminal(event.status)) {
        if (event.status != ActionStatus::Succeeded) {
            oss << R"(,"code":")" << to_string(event.reason.code) << "\""
                << R"(,"reason":")" << json_escape(event.reason.message) << "\"";
        }
        if (!event.reason.policy_id.empty()) {
            oss << R"(,"policy":")" << event.reason.policy_id << "\"";
        }
        oss << R"(,"outputs":)" << event.outputs.to_json();
    }
    oss << "}";
    write(oss.str());
}

void EventRecorder::record_lock_steal(const TargetId& target, const ActionId& previous_owner) {
    std::ostringstream oss;
    oss << R"({"event":"lock_stolen")"
        << R"(,"target":")" << json_escape(target) << "\""
        << R"(,"previous_owner":")" << previous_owner << "\""
        << "}";
    write(oss.str());
}

void EventRecorder::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    write(oss.str());
}

void EventRecorder::write(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace cluster_pilot
