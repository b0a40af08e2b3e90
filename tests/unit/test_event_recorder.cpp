/**
 * @file test_event_recorder.cpp
 * @brief Unit tests for NDJSON action-event recording.
 * @author Dimitris Kafetzis
 */

#include "model/action_keys.hpp"
#include "telemetry/event_recorder.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cluster_pilot;

namespace {

/// Keeps written lines in memory; the test holds a raw pointer to it.
class CaptureLogSink : public ILogSink {
public:
    void write(std::string_view json_line) override { lines.emplace_back(json_line); }
    void flush() override { ++flushes; }

    std::vector<std::string> lines;
    int flushes = 0;
};

ActionEvent make_test_event(ActionStatus status) {
    return ActionEvent{
        .action_id = "act-1",
        .parent_id = {},
        .type = ActionType::ClusterScaleIn,
        .target = "c-1",
        .status = status,
        .worker = "engine-01-w00",
        .reason = {},
        .outputs = {},
        .at = std::chrono::system_clock::now()
    };
}

bool contains(const std::string& line, const std::string& fragment) {
    return line.find(fragment) != std::string::npos;
}

}  // namespace

class EventRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<CaptureLogSink>();
        sink_ = sink.get();
        recorder_ = std::make_unique<EventRecorder>(std::move(sink));
    }

    CaptureLogSink* sink_ = nullptr;
    std::unique_ptr<EventRecorder> recorder_;
};

TEST_F(EventRecorderTest, RecordsRunningTransition) {
    recorder_->emit(make_test_event(ActionStatus::Running));

    ASSERT_EQ(sink_->lines.size(), 1u);
    const auto& line = sink_->lines[0];
    EXPECT_TRUE(contains(line, R"("event":"action_state_change")"));
    EXPECT_TRUE(contains(line, R"("type":"CLUSTER_SCALE_IN")"));
    EXPECT_TRUE(contains(line, R"("status":"RUNNING")"));
    EXPECT_TRUE(contains(line, R"("worker":"engine-01-w00")"));
    EXPECT_FALSE(contains(line, R"("outputs")"));
    EXPECT_FALSE(contains(line, R"("parent")"));
    EXPECT_EQ(recorder_->event_count(), 1u);
}

TEST_F(EventRecorderTest, TerminalEventCarriesOutputs) {
    auto event = make_test_event(ActionStatus::Succeeded);
    event.outputs.set(keys::kDeletionRemoved, int64_t{2});
    recorder_->emit(event);

    ASSERT_EQ(sink_->lines.size(), 1u);
    const auto& line = sink_->lines[0];
    EXPECT_TRUE(contains(line, R"("status":"SUCCEEDED")"));
    EXPECT_TRUE(contains(line, std::string(R"("outputs":{")") + keys::kDeletionRemoved + "\":2}"));
    EXPECT_FALSE(contains(line, R"("code")"));
}

TEST_F(EventRecorderTest, FailedEventCarriesReason) {
    auto event = make_test_event(ActionStatus::Failed);
    event.parent_id = "act-0";
    event.reason = ActionReason{
        .code = ErrorCode::PolicyRejected,
        .message = "count \"-1\" rejected",
        .policy_id = "pol-7"
    };
    recorder_->emit(event);

    const auto& line = sink_->lines.at(0);
    EXPECT_TRUE(contains(line, R"("code":"PolicyRejected")"));
    EXPECT_TRUE(contains(line, R"("reason":"count \"-1\" rejected")"));
    EXPECT_TRUE(contains(line, R"("policy":"pol-7")"));
    EXPECT_TRUE(contains(line, R"("parent":"act-0")"));
}

TEST_F(EventRecorderTest, LockStealAndCustomEvents) {
    recorder_->record_lock_steal("n-3", "act-9");
    recorder_->record_custom("engine_started", R"({"workers":4})");
    recorder_->flush();

    ASSERT_EQ(sink_->lines.size(), 2u);
    EXPECT_EQ(sink_->lines[0], R"({"event":"lock_stolen","target":"n-3","previous_owner":"act-9"})");
    EXPECT_EQ(sink_->lines[1], R"({"event":"engine_started","data":{"workers":4}})");
    EXPECT_EQ(sink_->flushes, 1);
    EXPECT_EQ(recorder_->event_count(), 2u);
}
