// SPDX-License-Identifier: MIT

// src/flow_controller.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/pipe.hpp"
#include "src/session.hpp"
#include "src/stage.hpp"

namespace chunk_pipe {

// FlowController - manual-mode bridge between a source and a sink.
//
// Drives the source-to-target edge by hand: every chunk is offered to the
// target (the latency stage if one is interposed, else the sink), a
// saturated result suspends the source and counts a backpressure event, and
// the target's drain resumes it. An interposed stage is piped into the sink.
//
// State machine:
//   Idle -> Active <-> Saturated
//             |            |
//             +------------+--> Finished (sink finished after end of stream)
//             +------------+--> Errored  (any stage error, violation or Abort)
//
// Completion and failure go to separate handlers. There is no cancellation
// handle: a caller that wants to stop calls Abort() with its own error.
class FlowController : public std::enable_shared_from_this<FlowController> {
public:
    struct PrivateTag {};

    enum class State { Idle, Active, Saturated, Finished, Errored };

    using CompleteHandler = std::function<void(const SessionStats&)>;
    using ErrorHandler = std::function<void(const Error&)>;

    /// @param stage  Optional latency stage between source and sink
    static std::shared_ptr<FlowController> Create(
        IEventLoop& loop,
        std::shared_ptr<ChunkReadable> source,
        std::shared_ptr<ChunkWritable> sink,
        SessionObserver& observer,
        std::shared_ptr<ChunkTransform> stage = nullptr);

    FlowController(PrivateTag, IEventLoop& loop,
                   std::shared_ptr<ChunkReadable> source,
                   std::shared_ptr<ChunkWritable> sink,
                   SessionObserver& observer,
                   std::shared_ptr<ChunkTransform> stage);

    /// Aborts every stage when dropped while Active or Saturated. No
    /// handler fires.
    ~FlowController();

    FlowController(const FlowController&) = delete;
    FlowController& operator=(const FlowController&) = delete;

    void OnComplete(CompleteHandler h) { complete_handler_ = std::move(h); }
    void OnError(ErrorHandler h) { error_handler_ = std::move(h); }

    /// Start the source. InvalidState unless Idle.
    std::expected<void, Error> Start();

    /// Abort every stage and report @p error through the error handler.
    /// No-op once Finished or Errored.
    void Abort(const Error& error);

    State GetState() const { return state_; }
    const SessionStats& Stats() const { return counters_.stats(); }

private:
    void Wire();
    void HandleChunk(Chunk chunk);
    void HandleDrain();
    void HandleSourceEnd();
    void HandleSinkFinish();
    void Fail(const Error& error);
    bool IsResolved() const { return state_ == State::Finished || state_ == State::Errored; }
    void RequireLoopThread(const char* func) const;

    ChunkWritable& target() const {
        return stage_ ? static_cast<ChunkWritable&>(*stage_) : *sink_;
    }

    IEventLoop& loop_;
    std::shared_ptr<ChunkReadable> source_;
    std::shared_ptr<ChunkWritable> sink_;
    std::shared_ptr<ChunkTransform> stage_;
    std::shared_ptr<Pipe> stage_pipe_;
    SessionObserver& observer_;

    State state_ = State::Idle;
    SessionCounters counters_;
    std::uint64_t delivered_ = 0;

    CompleteHandler complete_handler_;
    ErrorHandler error_handler_;
};

}  // namespace chunk_pipe
