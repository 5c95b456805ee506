// SPDX-License-Identifier: MIT

// src/latency_stage.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/stage.hpp"

namespace chunk_pipe {

// LatencyStage - forwards every chunk after a fixed delay.
//
// Simulates a slow consumer so backpressure builds up deterministically.
// Chunks leave in arrival order, one at a time: the delay of chunk N+1
// starts when chunk N has been emitted. Queued bytes (including the chunk
// inside the delay) count against the stage's own high-water mark.
//
// When suspended by its downstream edge, a chunk whose delay elapsed is held
// and emitted on the loop turn after Resume(). End of stream waits the same way.
class LatencyStage : public ChunkTransform,
                     public std::enable_shared_from_this<LatencyStage> {
public:
    struct PrivateTag {};

    static std::shared_ptr<LatencyStage> Create(
        IEventLoop& loop,
        std::chrono::milliseconds latency,
        std::size_t high_water_mark,
        std::size_t low_water_mark,
        std::string name = "latency");

    LatencyStage(PrivateTag, IEventLoop& loop, std::chrono::milliseconds latency,
                 std::size_t high_water_mark, std::size_t low_water_mark,
                 std::string name);

    LatencyStage(const LatencyStage&) = delete;
    LatencyStage& operator=(const LatencyStage&) = delete;

    // Stage
    std::string_view Name() const override { return name_; }
    void Abort(const Error& reason) override;
    bool IsTerminated() const override { return ended_ || failed_ || aborted_; }

    // ChunkReadable: emission is driven by Accept(), nothing to start.
    void Start() override {}

    // ChunkWritable
    AcceptResult Accept(Chunk chunk) override;
    void Finish() override;
    bool IsSaturated() const override { return saturated_; }
    std::size_t BufferedBytes() const override { return buffered_; }

    // Suspendable
    void Suspend() override { suspended_ = true; }
    void Resume() override;
    bool IsSuspended() const override { return suspended_; }

    /// @return true while a chunk is inside its delay.
    bool IsDelaying() const { return delay_.IsArmed(); }

    /// @return true while an elapsed chunk waits for Resume().
    bool IsHolding() const { return holding_; }

    bool IsEnded() const { return ended_; }
    bool IsAborted() const { return aborted_; }

private:
    void StartDelay();
    void OnDelayElapsed();
    void EmitFront();
    void MaybeEnd();
    void ScheduleEmit();

    IEventLoop& loop_;
    Timer delay_;
    std::chrono::milliseconds latency_;
    std::size_t high_water_mark_;
    std::size_t low_water_mark_;
    std::string name_;

    std::deque<Chunk> queue_;
    std::size_t buffered_ = 0;

    bool saturated_ = false;
    bool suspended_ = false;
    bool holding_ = false;
    bool emit_scheduled_ = false;
    bool finishing_ = false;
    bool end_scheduled_ = false;
    bool ended_ = false;
    bool failed_ = false;
    bool aborted_ = false;
};

}  // namespace chunk_pipe
