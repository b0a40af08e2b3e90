/**
 * @file event_recorder.hpp
 * @brief Structured action-event recording for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "engine/notification.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

namespace cluster_pilot {

/**
 * @brief Writes action state transitions and engine events as NDJSON.
 *
 * Implements the notification sink, so the dispatcher can fan events out to
 * it from its notification thread.
 */
class EventRecorder : public INotificationSink {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink);

    void emit(const ActionEvent& event) override;

    void record_lock_steal(const TargetId& target, const ActionId& previous_owner);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t event_count() const noexcept { return events_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void write(std::string_view json_line);
};

}  // namespace cluster_pilot
