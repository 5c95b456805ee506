// SPDX-License-Identifier: MIT

// src/stage.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/suspendable.hpp"
#include "src/chunk.hpp"

namespace chunk_pipe {

/// Outcome of ChunkWritable::Accept().
struct AcceptResult {
    bool accepted = false;   ///< The chunk was taken (ownership moved in)
    bool saturated = false;  ///< Buffered bytes reached the high-water mark
};

// Stage - capability shared by every component of a transfer session.
//
// A stage reports failures through the error handler and never reaches into
// a sibling. The owning bridge (FlowController or PipelineOrchestrator)
// decides who gets aborted.
//
// Handlers must be installed before the session starts and are not replaced
// afterwards. All calls happen on the event-loop thread.
class Stage {
public:
    using ErrorHandler = std::function<void(const Error&)>;

    virtual ~Stage() = default;

    /// Short name used in error reports ("source", "latency", "sink").
    virtual std::string_view Name() const = 0;

    /// Stop immediately, release owned resources and discard buffered data.
    /// Idempotent; a no-op once the stage is terminal. Emits nothing.
    virtual void Abort(const Error& reason) = 0;

    /// @return true after terminal success, failure or abort.
    virtual bool IsTerminated() const = 0;

    void OnError(ErrorHandler handler) { error_handler_ = std::move(handler); }

protected:
    // Report a failure to the owning bridge, tagged with this stage's name.
    void EmitError(Error e) {
        if (e.stage.empty()) e.stage = std::string(Name());
        if (error_handler_) error_handler_(e);
    }

private:
    ErrorHandler error_handler_;
};

// ChunkReadable - producer side of an edge.
//
// Emits chunks in offset order, then exactly one of end-of-stream or error.
// Nothing is emitted while suspended.
class ChunkReadable : public virtual Stage, public Suspendable {
public:
    using ChunkHandler = std::function<void(Chunk)>;
    using EndHandler = std::function<void()>;

    /// Begin producing. Calling Start() twice is a no-op.
    virtual void Start() = 0;

    void OnChunk(ChunkHandler handler) { chunk_handler_ = std::move(handler); }
    void OnEnd(EndHandler handler) { end_handler_ = std::move(handler); }

protected:
    void EmitChunk(Chunk chunk) {
        if (chunk_handler_) chunk_handler_(std::move(chunk));
    }

    void EmitEnd() {
        if (end_handler_) end_handler_();
    }

private:
    ChunkHandler chunk_handler_;
    EndHandler end_handler_;
};

// ChunkWritable - consumer side of an edge.
//
// Accept() is write-then-signal: a chunk offered while not saturated is
// always taken, and the result says whether the producer must now stop.
// After a saturated result, exactly one drain notification follows once
// enough bytes have moved on.
class ChunkWritable : public virtual Stage {
public:
    using DrainHandler = std::function<void()>;
    using FinishHandler = std::function<void()>;

    /// Offer a chunk. Returns accepted = false when saturated or terminal;
    /// the chunk is dropped in that case.
    virtual AcceptResult Accept(Chunk chunk) = 0;

    /// No more chunks will be offered. The finish notification fires once
    /// everything buffered has been handed on. Idempotent.
    virtual void Finish() = 0;

    virtual bool IsSaturated() const = 0;
    virtual std::size_t BufferedBytes() const = 0;

    void OnDrain(DrainHandler handler) { drain_handler_ = std::move(handler); }
    void OnFinish(FinishHandler handler) { finish_handler_ = std::move(handler); }

protected:
    void EmitDrain() {
        if (drain_handler_) drain_handler_();
    }

    void EmitFinish() {
        if (finish_handler_) finish_handler_();
    }

private:
    DrainHandler drain_handler_;
    FinishHandler finish_handler_;
};

// ChunkTransform - a stage interposed between a readable and a writable.
class ChunkTransform : public ChunkReadable, public ChunkWritable {};

}  // namespace chunk_pipe
