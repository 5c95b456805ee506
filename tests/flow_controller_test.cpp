// SPDX-License-Identifier: MIT

// tests/flow_controller_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "src/flow_controller.hpp"
#include "tests/mock_session_observer.hpp"
#include "tests/session_harness.hpp"
#include "tests/virtual_event_loop.hpp"

using namespace chunk_pipe;
using namespace chunk_pipe::test;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::NiceMock;

namespace {

struct Outcome {
    std::optional<SessionStats> stats;
    std::optional<Error> error;
    int completions = 0;
    int errors = 0;
};

// Run a manual-mode session to completion on a fresh virtual loop.
Outcome RunManual(SessionHarness& h, VirtualEventLoop& loop, SessionObserver& observer,
                  std::shared_ptr<FlowController>* out = nullptr) {
    Outcome outcome;
    auto controller = FlowController::Create(loop, h.counted_source, h.counted_sink,
                                             observer, h.stage);
    controller->OnComplete([&outcome](const SessionStats& s) {
        outcome.stats = s;
        ++outcome.completions;
    });
    controller->OnError([&outcome](const Error& e) {
        outcome.error = e;
        ++outcome.errors;
    });
    auto started = controller->Start();
    EXPECT_TRUE(started.has_value());
    loop.RunUntilIdle();
    if (out) *out = controller;
    return outcome;
}

}  // namespace

TEST(FlowControllerTest, CopiesSmallInput) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 200 * 1024;
    SessionHarness h(loop, options);
    RecordingObserver observer;

    std::shared_ptr<FlowController> controller;
    auto outcome = RunManual(h, loop, observer, &controller);

    ASSERT_TRUE(outcome.stats.has_value());
    EXPECT_EQ(outcome.completions, 1);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.stats->bytes_produced, 200 * 1024u);
    EXPECT_EQ(outcome.stats->bytes_consumed, 200 * 1024u);
    EXPECT_EQ(h.writer_tally->bytes, 200 * 1024u);
    EXPECT_TRUE(h.writer_tally->pattern_ok);
    EXPECT_EQ(controller->GetState(), FlowController::State::Finished);
    ASSERT_EQ(observer.completed.size(), 1u);
    EXPECT_TRUE(observer.errors.empty());
}

TEST(FlowControllerTest, ChunkAtCapacitySaturatesSink) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 4 * 64 * 1024;
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto outcome = RunManual(h, loop, observer);

    ASSERT_TRUE(outcome.stats.has_value());
    // Every 64 KiB chunk fills a 64 KiB sink
    EXPECT_EQ(outcome.stats->backpressure_events, 4u);
    EXPECT_EQ(h.counted_source->suspend_calls, 4);
    ASSERT_EQ(observer.backpressure.size(), 4u);
    EXPECT_EQ(observer.backpressure[0].offset, 64 * 1024u);
    EXPECT_EQ(observer.backpressure[0].count, 1u);
    EXPECT_EQ(observer.backpressure[3].offset, 4 * 64 * 1024u);
    EXPECT_EQ(observer.backpressure[3].count, 4u);
}

TEST(FlowControllerTest, StartTwiceIsInvalidState) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 10;
    SessionHarness h(loop, options);
    NullObserver observer;

    auto controller = FlowController::Create(loop, h.source, h.sink, observer);
    ASSERT_TRUE(controller->Start().has_value());
    auto again = controller->Start();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);

    loop.RunUntilIdle();
    EXPECT_EQ(controller->GetState(), FlowController::State::Finished);
}

TEST(FlowControllerTest, IdleUntilStarted) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 1024;
    SessionHarness h(loop, options);
    NullObserver observer;

    auto controller = FlowController::Create(loop, h.source, h.sink, observer);
    loop.RunUntilIdle();
    EXPECT_EQ(controller->GetState(), FlowController::State::Idle);
    EXPECT_EQ(h.reader_tally->io_calls, 0u);
}

// Peak buffered bytes stay within capacity plus one chunk for any size.
TEST(FlowControllerTest, PeakBufferedIsBoundedBySinkCapacity) {
    const std::uint64_t sizes[] = {0, 1, 1000, 64 * 1024 + 1, 3 * 1024 * 1024 + 17};
    const std::size_t capacities[] = {16 * 1024, 64 * 1024, 200 * 1024};
    const std::size_t chunk = 64 * 1024;

    for (auto size : sizes) {
        for (auto capacity : capacities) {
            for (bool latency : {false, true}) {
                SCOPED_TRACE(testing::Message() << "size=" << size << " capacity="
                             << capacity << " latency=" << latency);
                VirtualEventLoop loop;
                HarnessOptions options;
                options.input_size = size;
                options.config.chunk_size = chunk;
                options.config.high_water_mark = capacity;
                options.config.latency_enabled = latency;
                SessionHarness h(loop, options);
                NullObserver observer;

                auto outcome = RunManual(h, loop, observer);
                ASSERT_TRUE(outcome.stats.has_value());
                EXPECT_LE(outcome.stats->peak_buffered_bytes, capacity + chunk);
                // Summed over every buffering component
                EXPECT_LE(h.peak_total_buffered, (latency ? 2 : 1) * (capacity + chunk));
                EXPECT_EQ(outcome.stats->bytes_consumed, size);
                EXPECT_TRUE(h.writer_tally->pattern_ok);
            }
        }
    }
}

TEST(FlowControllerTest, BackpressureCountIsDeterministic) {
    auto run = []() {
        VirtualEventLoop loop;
        HarnessOptions options;
        options.input_size = 5 * 1024 * 1024 + 123;
        options.config = TransferConfig::SlowConsumer();
        options.config.low_water_mark = 16 * 1024;
        SessionHarness h(loop, options);
        NullObserver observer;
        auto outcome = RunManual(h, loop, observer);
        return outcome.stats.value_or(SessionStats{}).backpressure_events;
    };
    auto first = run();
    EXPECT_GT(first, 0u);
    EXPECT_EQ(run(), first);
}

TEST(FlowControllerTest, ResumeOnlyAfterBackpressure) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 2 * 1024 * 1024;
    options.config = TransferConfig::SlowConsumer();
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto outcome = RunManual(h, loop, observer);
    ASSERT_TRUE(outcome.stats.has_value());

    // One resume per saturation period, reported with that period's count
    ASSERT_FALSE(observer.resumes.empty());
    EXPECT_LE(observer.resumes.size(), observer.backpressure.size());
    for (std::size_t i = 0; i < observer.resumes.size(); ++i) {
        EXPECT_EQ(observer.resumes[i], i + 1);
    }
}

TEST(FlowControllerTest, SlowConsumerScenario) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 100 * 1024 * 1024;
    options.config = TransferConfig::SlowConsumer();
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto outcome = RunManual(h, loop, observer);

    ASSERT_TRUE(outcome.stats.has_value()) << outcome.error.value_or(Error{}).message;
    EXPECT_GT(outcome.stats->backpressure_events, 0u);
    EXPECT_EQ(outcome.stats->bytes_consumed, 104857600u);
    EXPECT_EQ(outcome.stats->bytes_produced, 104857600u);
    EXPECT_LE(outcome.stats->peak_buffered_bytes, 128 * 1024u);
    EXPECT_GT(h.peak_total_buffered, 0u);
    EXPECT_LE(h.peak_total_buffered, 128 * 1024u);
    EXPECT_TRUE(h.writer_tally->pattern_ok);

    // Progress ticks every 10 MiB produced
    EXPECT_EQ(observer.progress.size(), 10u);
    EXPECT_EQ(observer.progress.front(), 10 * 1024 * 1024u);
}

TEST(FlowControllerTest, EmptyInputScenario) {
    VirtualEventLoop loop;
    HarnessOptions options;
    SessionHarness h(loop, options);
    NiceMock<MockSessionObserver> observer;

    EXPECT_CALL(observer, OnBackpressure(_)).Times(0);
    EXPECT_CALL(observer, OnSessionError(_)).Times(0);
    EXPECT_CALL(observer, OnSessionComplete(AllOf(
                              Field(&SessionStats::bytes_consumed, 0u),
                              Field(&SessionStats::backpressure_events, 0u))))
        .Times(1);

    auto outcome = RunManual(h, loop, observer);
    ASSERT_TRUE(outcome.stats.has_value());
    EXPECT_TRUE(h.source->IsEnded());
    EXPECT_TRUE(h.sink->IsFinished());
    EXPECT_EQ(h.writer_tally->io_calls, 0u);
    EXPECT_EQ(h.counted_sink->accept_calls, 0u);
}

TEST(FlowControllerTest, EmptyInputThroughLatencyStage) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.config = TransferConfig::SlowConsumer();
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto outcome = RunManual(h, loop, observer);
    ASSERT_TRUE(outcome.stats.has_value());
    EXPECT_EQ(outcome.stats->bytes_consumed, 0u);
    EXPECT_TRUE(h.stage->IsEnded());
    EXPECT_TRUE(h.sink->IsFinished());
}

TEST(FlowControllerTest, SinkWriteFailureScenario) {
    for (bool latency : {false, true}) {
        SCOPED_TRACE(testing::Message() << "latency=" << latency);
        VirtualEventLoop loop;
        HarnessOptions options;
        options.input_size = 100 * 1024 * 1024;
        options.config.latency_enabled = latency;
        options.fail_write_after = 10 * 1024 * 1024;
        SessionHarness h(loop, options);
        RecordingObserver observer;

        std::shared_ptr<FlowController> controller;
        auto outcome = RunManual(h, loop, observer, &controller);

        EXPECT_FALSE(outcome.stats.has_value());
        ASSERT_TRUE(outcome.error.has_value());
        EXPECT_EQ(outcome.errors, 1);
        EXPECT_EQ(outcome.error->code, ErrorCode::SinkWriteError);
        EXPECT_EQ(outcome.error->stage, "sink");
        EXPECT_EQ(controller->GetState(), FlowController::State::Errored);

        EXPECT_EQ(h.counted_source->abort_calls, 1);
        EXPECT_EQ(h.reader_tally->close_calls, 1);
        EXPECT_TRUE(h.source->IsAborted());
        EXPECT_EQ(h.counted_sink->accepts_after_terminal, 0u);
        EXPECT_EQ(h.writer_tally->bytes, 10 * 1024 * 1024u);
        EXPECT_EQ(h.writer_tally->close_calls, 1);

        ASSERT_EQ(observer.errors.size(), 1u);
        EXPECT_TRUE(observer.completed.empty());
    }
}

TEST(FlowControllerTest, SourceReadFailureAbortsSink) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 1024 * 1024;
    options.fail_read_at = 300 * 1024;
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto outcome = RunManual(h, loop, observer);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::SourceReadError);
    EXPECT_EQ(outcome.error->stage, "source");
    EXPECT_TRUE(h.sink->IsAborted());
    EXPECT_EQ(h.counted_sink->abort_calls, 1);
    EXPECT_EQ(h.writer_tally->close_calls, 1);
    EXPECT_EQ(h.reader_tally->close_calls, 1);
    EXPECT_FALSE(h.sink->IsFinished());
}

TEST(FlowControllerTest, SinkCloseFailureFailsSession) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 1000;
    options.fail_close = true;
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto outcome = RunManual(h, loop, observer);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::SinkWriteError);
    EXPECT_EQ(outcome.completions, 0);
}

TEST(FlowControllerTest, AbortStopsTransfer) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 100 * 1024 * 1024;
    options.config = TransferConfig::SlowConsumer();
    SessionHarness h(loop, options);
    RecordingObserver observer;

    auto controller = FlowController::Create(loop, h.counted_source, h.counted_sink,
                                             observer, h.stage);
    std::vector<Error> errors;
    controller->OnError([&errors](const Error& e) { errors.push_back(e); });
    ASSERT_TRUE(controller->Start().has_value());

    loop.AdvanceBy(std::chrono::milliseconds(100));
    controller->Abort(Error{ErrorCode::PipelineAbort, "interrupted"});
    controller->Abort(Error{ErrorCode::PipelineAbort, "again"});
    loop.RunUntilIdle();

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::PipelineAbort);
    EXPECT_EQ(h.counted_source->abort_calls, 1);
    EXPECT_TRUE(h.stage->IsAborted());
    EXPECT_EQ(loop.PendingTimerCount(), 0u);
    EXPECT_LT(h.writer_tally->bytes, 100 * 1024 * 1024u);
    EXPECT_EQ(h.reader_tally->close_calls, 1);
    EXPECT_EQ(h.writer_tally->close_calls, 1);
}

TEST(FlowControllerTest, AbortAfterFinishIsNoOp) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 100;
    SessionHarness h(loop, options);
    RecordingObserver observer;

    std::shared_ptr<FlowController> controller;
    RunManual(h, loop, observer, &controller);
    ASSERT_EQ(controller->GetState(), FlowController::State::Finished);

    controller->Abort(Error{ErrorCode::PipelineAbort, "late"});
    EXPECT_EQ(controller->GetState(), FlowController::State::Finished);
    EXPECT_TRUE(observer.errors.empty());
    EXPECT_EQ(h.counted_source->abort_calls, 0);
}

TEST(FlowControllerTest, StageTimerFailureIsStageError) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 1024 * 1024;
    options.config = TransferConfig::SlowConsumer();
    SessionHarness h(loop, options);
    RecordingObserver observer;
    loop.FailSchedule(true);

    auto outcome = RunManual(h, loop, observer);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::StageError);
    EXPECT_EQ(outcome.error->stage, "latency");
    EXPECT_TRUE(h.sink->IsAborted());
    EXPECT_EQ(h.counted_source->abort_calls, 1);
}

TEST(FlowControllerTest, DestroyWhileActiveAbortsEveryStage) {
    for (bool latency : {false, true}) {
        SCOPED_TRACE(testing::Message() << "latency=" << latency);
        VirtualEventLoop loop;
        HarnessOptions options;
        options.input_size = 4 * 1024 * 1024;
        options.config.latency_enabled = latency;
        SessionHarness h(loop, options);
        RecordingObserver observer;

        int handler_calls = 0;
        auto controller = FlowController::Create(loop, h.counted_source, h.counted_sink,
                                                 observer, h.stage);
        controller->OnComplete([&handler_calls](const SessionStats&) { ++handler_calls; });
        controller->OnError([&handler_calls](const Error&) { ++handler_calls; });
        ASSERT_TRUE(controller->Start().has_value());

        ASSERT_TRUE(loop.RunUntil([&h]() { return h.writer_tally->bytes >= 128 * 1024; }));
        controller.reset();
        loop.RunUntilIdle();

        EXPECT_EQ(h.counted_source->abort_calls, 1);
        EXPECT_EQ(h.counted_sink->abort_calls, 1);
        EXPECT_TRUE(h.source->IsAborted());
        EXPECT_TRUE(h.sink->IsTerminated());
        if (h.stage) EXPECT_TRUE(h.stage->IsAborted());
        EXPECT_EQ(h.reader_tally->close_calls, 1);
        EXPECT_EQ(h.writer_tally->close_calls, 1);
        EXPECT_LT(h.reader_tally->bytes, 4 * 1024 * 1024u);
        EXPECT_EQ(loop.PendingTimerCount(), 0u);
        EXPECT_EQ(handler_calls, 0);
        EXPECT_TRUE(observer.errors.empty());
        EXPECT_TRUE(observer.completed.empty());
    }
}

TEST(FlowControllerTest, DestroyAfterFinishLeavesStagesAlone) {
    VirtualEventLoop loop;
    HarnessOptions options;
    options.input_size = 1000;
    SessionHarness h(loop, options);
    NullObserver observer;

    std::shared_ptr<FlowController> controller;
    RunManual(h, loop, observer, &controller);
    ASSERT_EQ(controller->GetState(), FlowController::State::Finished);
    controller.reset();

    EXPECT_EQ(h.counted_source->abort_calls, 0);
    EXPECT_EQ(h.counted_sink->abort_calls, 0);
    EXPECT_EQ(h.writer_tally->close_calls, 1);
}
