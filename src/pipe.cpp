// SPDX-License-Identifier: MIT

// src/pipe.cpp
#include "src/pipe.hpp"

#include <string>
#include <utility>

namespace chunk_pipe {

std::shared_ptr<Pipe> Pipe::Create(std::shared_ptr<ChunkReadable> from,
                                   std::shared_ptr<ChunkWritable> to) {
    auto pipe = std::make_shared<Pipe>(PrivateTag{}, std::move(from), std::move(to));
    pipe->Wire();
    return pipe;
}

Pipe::Pipe(PrivateTag, std::shared_ptr<ChunkReadable> from,
           std::shared_ptr<ChunkWritable> to)
    : from_(std::move(from)), to_(std::move(to)) {}

// Called by Create() once shared_from_this() is usable.
void Pipe::Wire() {
    std::weak_ptr<Pipe> weak_self = shared_from_this();

    from_->OnChunk([weak_self](Chunk chunk) {
        if (auto self = weak_self.lock()) self->HandleChunk(std::move(chunk));
    });
    from_->OnEnd([weak_self]() {
        if (auto self = weak_self.lock()) self->HandleEnd();
    });
    to_->OnDrain([weak_self]() {
        if (auto self = weak_self.lock()) self->HandleDrain();
    });
}

void Pipe::HandleChunk(Chunk chunk) {
    if (state_ == State::Closed) return;
    if (state_ != State::Flowing) {
        Violation(from_->Name(), std::string(from_->Name()) + " emitted a chunk while " +
                  (state_ == State::Saturated ? "suspended" : "ended"));
        return;
    }

    std::size_t size = chunk.Size();
    AcceptResult result = to_->Accept(std::move(chunk));
    if (!result.accepted) {
        Violation(to_->Name(), std::string(to_->Name()) + " refused a chunk at offset " +
                  std::to_string(forwarded_));
        return;
    }
    forwarded_ += size;
    if (forward_handler_) forward_handler_(size, to_->BufferedBytes());
    if (state_ == State::Closed) return;

    if (result.saturated) {
        state_ = State::Saturated;
        from_->Suspend();
        if (backpressure_handler_) backpressure_handler_(forwarded_);
    }
}

void Pipe::HandleDrain() {
    if (state_ == State::Closed) return;
    if (state_ != State::Saturated) {
        Violation(to_->Name(), std::string(to_->Name()) + " drained while not saturated");
        return;
    }
    state_ = State::Flowing;
    from_->Resume();
    if (resume_handler_) resume_handler_();
}

void Pipe::HandleEnd() {
    if (state_ == State::Closed) return;
    state_ = State::Ended;
    to_->Finish();
    if (end_handler_) end_handler_();
}

void Pipe::Violation(std::string_view stage, std::string message) {
    state_ = State::Closed;
    if (violation_handler_) {
        violation_handler_(Error{ErrorCode::ProtocolViolation, std::move(message), 0,
                                 std::string(stage)});
    }
}

}  // namespace chunk_pipe
