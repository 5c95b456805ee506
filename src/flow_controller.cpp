// SPDX-License-Identifier: MIT

// src/flow_controller.cpp
#include "src/flow_controller.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

namespace chunk_pipe {

std::shared_ptr<FlowController> FlowController::Create(
    IEventLoop& loop,
    std::shared_ptr<ChunkReadable> source,
    std::shared_ptr<ChunkWritable> sink,
    SessionObserver& observer,
    std::shared_ptr<ChunkTransform> stage) {
    auto controller = std::make_shared<FlowController>(
        PrivateTag{}, loop, std::move(source), std::move(sink), observer,
        std::move(stage));
    controller->Wire();
    return controller;
}

FlowController::FlowController(PrivateTag, IEventLoop& loop,
                               std::shared_ptr<ChunkReadable> source,
                               std::shared_ptr<ChunkWritable> sink,
                               SessionObserver& observer,
                               std::shared_ptr<ChunkTransform> stage)
    : loop_(loop),
      source_(std::move(source)),
      sink_(std::move(sink)),
      stage_(std::move(stage)),
      observer_(observer) {}

FlowController::~FlowController() {
    if (state_ != State::Active && state_ != State::Saturated) return;
    state_ = State::Errored;
    if (stage_pipe_) stage_pipe_->Close();

    // Handlers hold weak references, so nothing reaches the caller
    Error error{ErrorCode::PipelineAbort, "flow controller destroyed while active"};
    source_->Abort(error);
    if (stage_) stage_->Abort(error);
    sink_->Abort(error);
}

void FlowController::Wire() {
    std::weak_ptr<FlowController> weak_self = shared_from_this();
    auto on_error = [weak_self](const Error& e) {
        if (auto self = weak_self.lock()) self->Fail(e);
    };

    source_->OnChunk([weak_self](Chunk chunk) {
        if (auto self = weak_self.lock()) self->HandleChunk(std::move(chunk));
    });
    source_->OnEnd([weak_self]() {
        if (auto self = weak_self.lock()) self->HandleSourceEnd();
    });
    source_->OnError(on_error);

    target().OnDrain([weak_self]() {
        if (auto self = weak_self.lock()) self->HandleDrain();
    });

    sink_->OnFinish([weak_self]() {
        if (auto self = weak_self.lock()) self->HandleSinkFinish();
    });
    sink_->OnError(on_error);

    if (stage_) {
        stage_->OnError(on_error);

        // The stage feeds the sink the way any automatic edge does
        stage_pipe_ = Pipe::Create(stage_, sink_);
        stage_pipe_->OnForward([weak_self](std::size_t, std::size_t buffered) {
            if (auto self = weak_self.lock()) self->counters_.SampleBuffered(buffered);
        });
        stage_pipe_->OnViolation(on_error);
    }
}

std::expected<void, Error> FlowController::Start() {
    RequireLoopThread(__func__);
    if (state_ != State::Idle) {
        return std::unexpected(Error{ErrorCode::InvalidState,
                                     "FlowController::Start called twice"});
    }
    state_ = State::Active;
    counters_.Start();
    source_->Start();
    if (stage_) stage_->Start();
    return {};
}

void FlowController::Abort(const Error& error) {
    RequireLoopThread(__func__);
    Fail(error);
}

void FlowController::HandleChunk(Chunk chunk) {
    if (IsResolved()) return;
    if (state_ != State::Active) {
        Fail(Error{ErrorCode::ProtocolViolation,
                   "chunk emitted while suspended", 0,
                   std::string(source_->Name())});
        return;
    }

    std::size_t size = chunk.Size();
    if (counters_.AddProduced(size)) {
        observer_.OnProgress(counters_.stats().bytes_produced);
    }

    AcceptResult result = target().Accept(std::move(chunk));
    if (IsResolved()) return;
    if (!result.accepted) {
        Fail(Error{ErrorCode::ProtocolViolation,
                   "chunk refused at offset " + std::to_string(delivered_), 0,
                   std::string(target().Name())});
        return;
    }
    delivered_ += size;
    counters_.SampleBuffered(target().BufferedBytes());

    if (result.saturated) {
        state_ = State::Saturated;
        source_->Suspend();
        observer_.OnBackpressure(counters_.RecordBackpressure(delivered_));
    }
}

void FlowController::HandleDrain() {
    if (IsResolved()) return;
    if (state_ != State::Saturated) {
        Fail(Error{ErrorCode::ProtocolViolation, "drain while not saturated", 0,
                   std::string(target().Name())});
        return;
    }
    state_ = State::Active;
    source_->Resume();
    observer_.OnResume(counters_.stats().backpressure_events);
}

void FlowController::HandleSourceEnd() {
    if (IsResolved()) return;
    target().Finish();
}

void FlowController::HandleSinkFinish() {
    if (IsResolved()) return;
    state_ = State::Finished;
    counters_.SetConsumed(stage_pipe_ ? stage_pipe_->BytesForwarded() : delivered_);

    SessionStats stats = counters_.Snapshot();
    observer_.OnSessionComplete(stats);
    if (complete_handler_) complete_handler_(stats);
}

void FlowController::Fail(const Error& error) {
    if (IsResolved()) return;
    state_ = State::Errored;

    source_->Abort(error);
    if (stage_) stage_->Abort(error);
    sink_->Abort(error);
    if (stage_pipe_) stage_pipe_->Close();

    observer_.OnSessionError(error);
    if (error_handler_) error_handler_(error);
}

void FlowController::RequireLoopThread(const char* func) const {
    if (loop_.IsInEventLoopThread()) return;
    std::fprintf(stderr, "FlowController::%s called off event loop thread\n", func);
    std::terminate();
}

}  // namespace chunk_pipe
