// SPDX-License-Identifier: MIT

// src/pipeline_orchestrator.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/result_sink.hpp"
#include "src/pipe.hpp"
#include "src/session.hpp"
#include "src/stage.hpp"

namespace chunk_pipe {

// PipelineOrchestrator - automatic-mode bridge.
//
// Connects source -> stages... -> sink with one Pipe per edge, so
// backpressure is handled inside the chain. Delivers exactly one terminal
// result: SessionStats once every stage reached terminal success, or the
// first error after every stage has been aborted.
//
// State machine:
//   Created -> Running -> Completed
//                 |
//                 +-----> Failed     (stage error or contract violation)
//                 +-----> Cancelled  (Cancel())
//   Created -----------> Cancelled  (Cancel() before Run())
//
// Thread safety:
// - All public methods must be called from the event loop thread (enforced
//   via RequireLoopThread)
//
// Ownership:
// - The orchestrator owns every stage and edge. Destroying it while Running
//   drops the pending result and aborts the chain.
class PipelineOrchestrator : public std::enable_shared_from_this<PipelineOrchestrator> {
public:
    struct PrivateTag {};

    enum class State { Created, Running, Completed, Failed, Cancelled };

    using Result = std::expected<SessionStats, Error>;
    using ResultHandler = ResultSink<SessionStats>::Handler;

    /// @param stages  Interposed stages, in data-flow order (may be empty)
    static std::shared_ptr<PipelineOrchestrator> Create(
        IEventLoop& loop,
        std::shared_ptr<ChunkReadable> source,
        std::shared_ptr<ChunkWritable> sink,
        SessionObserver& observer,
        std::vector<std::shared_ptr<ChunkTransform>> stages = {});

    PipelineOrchestrator(PrivateTag, IEventLoop& loop,
                         std::shared_ptr<ChunkReadable> source,
                         std::shared_ptr<ChunkWritable> sink,
                         SessionObserver& observer,
                         std::vector<std::shared_ptr<ChunkTransform>> stages);

    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /// Start the transfer. @p handler receives exactly one result.
    /// A second Run() gets InvalidState on its own handler and leaves the
    /// running session alone.
    void Run(ResultHandler handler);

    /// Abort every stage, upstream first, then deliver PipelineAbort.
    /// No-op once the session resolved.
    void Cancel();

    State GetState() const { return state_; }
    const SessionStats& Stats() const { return counters_.stats(); }

    /// Number of edges (stages + 1).
    std::size_t EdgeCount() const { return pipes_.size(); }

private:
    void Wire();
    void HandleSourceEnd();
    void HandleWritableFinish(std::size_t index);
    void CheckComplete();
    void Fail(const Error& error, State terminal);
    void AbortAll(const Error& reason);
    void RequireLoopThread(const char* func) const;

    IEventLoop& loop_;
    // Data-flow order: source, stages..., sink
    std::vector<std::shared_ptr<Stage>> chain_;
    std::shared_ptr<ChunkReadable> source_;
    std::shared_ptr<ChunkWritable> sink_;
    std::vector<std::shared_ptr<ChunkTransform>> stages_;
    std::vector<std::shared_ptr<Pipe>> pipes_;
    SessionObserver& observer_;

    State state_ = State::Created;
    SessionCounters counters_;
    ResultSink<SessionStats> result_;

    bool source_ended_ = false;
    // One flag per writable (stages..., sink)
    std::vector<bool> finished_;
};

}  // namespace chunk_pipe
