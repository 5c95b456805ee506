// SPDX-License-Identifier: MIT

// src/pipeline_orchestrator.cpp
#include "src/pipeline_orchestrator.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

namespace chunk_pipe {

std::shared_ptr<PipelineOrchestrator> PipelineOrchestrator::Create(
    IEventLoop& loop,
    std::shared_ptr<ChunkReadable> source,
    std::shared_ptr<ChunkWritable> sink,
    SessionObserver& observer,
    std::vector<std::shared_ptr<ChunkTransform>> stages) {
    auto orchestrator = std::make_shared<PipelineOrchestrator>(
        PrivateTag{}, loop, std::move(source), std::move(sink), observer,
        std::move(stages));
    orchestrator->Wire();
    return orchestrator;
}

PipelineOrchestrator::PipelineOrchestrator(
    PrivateTag, IEventLoop& loop,
    std::shared_ptr<ChunkReadable> source,
    std::shared_ptr<ChunkWritable> sink,
    SessionObserver& observer,
    std::vector<std::shared_ptr<ChunkTransform>> stages)
    : loop_(loop),
      source_(std::move(source)),
      sink_(std::move(sink)),
      stages_(std::move(stages)),
      observer_(observer) {}

PipelineOrchestrator::~PipelineOrchestrator() {
    // Order matters: drop the pending result first, then unwind the chain
    result_.Invalidate();
    if (state_ != State::Running) return;
    state_ = State::Cancelled;
    for (auto& pipe : pipes_) pipe->Close();
    AbortAll(Error{ErrorCode::PipelineAbort, "orchestrator destroyed while running"});
}

void PipelineOrchestrator::Wire() {
    std::vector<std::shared_ptr<ChunkReadable>> readables{source_};
    std::vector<std::shared_ptr<ChunkWritable>> writables;
    chain_.push_back(source_);
    for (auto& stage : stages_) {
        readables.push_back(stage);
        writables.push_back(stage);
        chain_.push_back(stage);
    }
    writables.push_back(sink_);
    chain_.push_back(sink_);
    finished_.assign(writables.size(), false);

    std::weak_ptr<PipelineOrchestrator> weak_self = shared_from_this();
    auto on_error = [weak_self](const Error& e) {
        if (auto self = weak_self.lock()) self->Fail(e, State::Failed);
    };

    for (auto& stage : chain_) {
        stage->OnError(on_error);
    }

    for (std::size_t i = 0; i < writables.size(); ++i) {
        auto pipe = Pipe::Create(readables[i], writables[i]);
        bool first_edge = (i == 0);

        pipe->OnForward([weak_self, first_edge](std::size_t bytes, std::size_t buffered) {
            auto self = weak_self.lock();
            if (!self || self->state_ != State::Running) return;
            if (first_edge && self->counters_.AddProduced(bytes)) {
                self->observer_.OnProgress(self->counters_.stats().bytes_produced);
            }
            self->counters_.SampleBuffered(buffered);
        });
        pipe->OnBackpressure([weak_self](std::uint64_t offset) {
            auto self = weak_self.lock();
            if (!self || self->state_ != State::Running) return;
            self->observer_.OnBackpressure(self->counters_.RecordBackpressure(offset));
        });
        pipe->OnResume([weak_self]() {
            auto self = weak_self.lock();
            if (!self || self->state_ != State::Running) return;
            self->observer_.OnResume(self->counters_.stats().backpressure_events);
        });
        if (first_edge) {
            pipe->OnEnd([weak_self]() {
                if (auto self = weak_self.lock()) self->HandleSourceEnd();
            });
        }
        pipe->OnViolation(on_error);

        writables[i]->OnFinish([weak_self, i]() {
            if (auto self = weak_self.lock()) self->HandleWritableFinish(i);
        });

        pipes_.push_back(std::move(pipe));
    }
}

void PipelineOrchestrator::Run(ResultHandler handler) {
    RequireLoopThread(__func__);
    if (state_ != State::Created) {
        if (handler) {
            handler(std::unexpected(Error{ErrorCode::InvalidState,
                                          "PipelineOrchestrator::Run called twice"}));
        }
        return;
    }

    result_.SetHandler(std::move(handler));
    state_ = State::Running;
    counters_.Start();

    // Downstream first so every edge is ready before data moves
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        (*it)->Start();
    }
    source_->Start();
}

void PipelineOrchestrator::Cancel() {
    RequireLoopThread(__func__);
    Error error{ErrorCode::PipelineAbort, "transfer cancelled"};
    if (state_ == State::Created) {
        state_ = State::Cancelled;
        for (auto& pipe : pipes_) pipe->Close();
        AbortAll(error);
        return;
    }
    Fail(error, State::Cancelled);
}

void PipelineOrchestrator::HandleSourceEnd() {
    if (state_ != State::Running) return;
    source_ended_ = true;
    CheckComplete();
}

void PipelineOrchestrator::HandleWritableFinish(std::size_t index) {
    if (state_ != State::Running) return;
    finished_[index] = true;
    CheckComplete();
}

void PipelineOrchestrator::CheckComplete() {
    if (!source_ended_) return;
    if (!std::all_of(finished_.begin(), finished_.end(), [](bool f) { return f; })) return;

    state_ = State::Completed;
    counters_.SetConsumed(pipes_.back()->BytesForwarded());

    SessionStats stats = counters_.Snapshot();
    observer_.OnSessionComplete(stats);
    result_.OnResult(std::move(stats));
}

void PipelineOrchestrator::Fail(const Error& error, State terminal) {
    if (state_ != State::Running) return;
    state_ = terminal;

    for (auto& pipe : pipes_) pipe->Close();
    AbortAll(error);

    observer_.OnSessionError(error);
    result_.OnError(error);
}

void PipelineOrchestrator::AbortAll(const Error& reason) {
    // Upstream first: no sink is torn down while its producer still runs
    for (auto& stage : chain_) {
        stage->Abort(reason);
    }
}

// Fail-fast thread check - works in release builds
void PipelineOrchestrator::RequireLoopThread(const char* func) const {
    if (loop_.IsInEventLoopThread()) return;
    std::fprintf(stderr, "PipelineOrchestrator::%s called off event loop thread\n", func);
    std::terminate();
}

}  // namespace chunk_pipe
