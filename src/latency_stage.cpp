// SPDX-License-Identifier: MIT

// src/latency_stage.cpp
#include "src/latency_stage.hpp"

#include <exception>
#include <utility>

namespace chunk_pipe {

std::shared_ptr<LatencyStage> LatencyStage::Create(
    IEventLoop& loop,
    std::chrono::milliseconds latency,
    std::size_t high_water_mark,
    std::size_t low_water_mark,
    std::string name) {
    return std::make_shared<LatencyStage>(PrivateTag{}, loop, latency,
                                          high_water_mark, low_water_mark,
                                          std::move(name));
}

LatencyStage::LatencyStage(PrivateTag, IEventLoop& loop,
                           std::chrono::milliseconds latency,
                           std::size_t high_water_mark,
                           std::size_t low_water_mark, std::string name)
    : loop_(loop),
      delay_(loop),
      latency_(latency),
      high_water_mark_(high_water_mark),
      low_water_mark_(low_water_mark),
      name_(std::move(name)) {
    delay_.OnTimer([this]() { OnDelayElapsed(); });
}

AcceptResult LatencyStage::Accept(Chunk chunk) {
    if (IsTerminated() || finishing_ || saturated_) {
        return AcceptResult{false, saturated_};
    }

    buffered_ += chunk.Size();
    queue_.push_back(std::move(chunk));
    if (buffered_ >= high_water_mark_) {
        saturated_ = true;
    }

    if (!delay_.IsArmed() && !holding_) {
        StartDelay();
    }
    return AcceptResult{true, saturated_};
}

void LatencyStage::Finish() {
    if (IsTerminated() || finishing_) return;
    finishing_ = true;
    MaybeEnd();
}

void LatencyStage::Resume() {
    if (!suspended_) return;
    suspended_ = false;
    if (holding_) {
        ScheduleEmit();
    } else {
        MaybeEnd();
    }
}

void LatencyStage::Abort(const Error& /*reason*/) {
    if (IsTerminated()) return;
    aborted_ = true;
    delay_.Stop();
    queue_.clear();
    buffered_ = 0;
    saturated_ = false;
    holding_ = false;
}

void LatencyStage::StartDelay() {
    if (queue_.empty()) return;
    try {
        delay_.Start(static_cast<int>(latency_.count()));
    } catch (const std::exception& ex) {
        delay_.Stop();
        failed_ = true;
        queue_.clear();
        buffered_ = 0;
        saturated_ = false;
        EmitError(Error{ErrorCode::StageError,
                        std::string("cannot arm delay timer: ") + ex.what()});
    }
}

void LatencyStage::OnDelayElapsed() {
    if (IsTerminated()) return;
    if (suspended_) {
        holding_ = true;
        return;
    }
    EmitFront();
}

void LatencyStage::EmitFront() {
    auto self = shared_from_this();

    holding_ = false;
    Chunk chunk = std::move(queue_.front());
    queue_.pop_front();
    buffered_ -= chunk.Size();

    EmitChunk(std::move(chunk));
    if (IsTerminated()) return;

    if (saturated_ && buffered_ <= low_water_mark_ && buffered_ < high_water_mark_) {
        saturated_ = false;
        EmitDrain();
        if (IsTerminated()) return;
    }

    if (!queue_.empty()) {
        if (!delay_.IsArmed()) StartDelay();
    } else {
        MaybeEnd();
    }
}

void LatencyStage::ScheduleEmit() {
    if (emit_scheduled_) return;
    emit_scheduled_ = true;

    std::weak_ptr<LatencyStage> weak_self = shared_from_this();
    loop_.Defer([weak_self]() {
        auto self = weak_self.lock();
        if (!self) return;
        self->emit_scheduled_ = false;
        if (self->IsTerminated() || self->suspended_ || !self->holding_) return;
        self->EmitFront();
    });
}

void LatencyStage::MaybeEnd() {
    if (!finishing_ || !queue_.empty() || end_scheduled_) return;
    end_scheduled_ = true;

    std::weak_ptr<LatencyStage> weak_self = shared_from_this();
    loop_.Defer([weak_self]() {
        auto self = weak_self.lock();
        if (!self || self->IsTerminated()) return;
        // End is held like a chunk; Resume() schedules it again
        if (self->suspended_) {
            self->end_scheduled_ = false;
            return;
        }
        self->ended_ = true;
        self->EmitFinish();
        self->EmitEnd();
    });
}

}  // namespace chunk_pipe
