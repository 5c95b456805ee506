// SPDX-License-Identifier: MIT

// src/chunk_sink.cpp
#include "src/chunk_sink.hpp"

#include <utility>

namespace chunk_pipe {

std::shared_ptr<ChunkSink> ChunkSink::Create(
    IEventLoop& loop,
    std::unique_ptr<WritableResource> resource,
    std::size_t high_water_mark,
    std::size_t low_water_mark,
    std::string name) {
    return std::make_shared<ChunkSink>(PrivateTag{}, loop, std::move(resource),
                                       high_water_mark, low_water_mark,
                                       std::move(name));
}

ChunkSink::ChunkSink(PrivateTag, IEventLoop& loop,
                     std::unique_ptr<WritableResource> resource,
                     std::size_t high_water_mark, std::size_t low_water_mark,
                     std::string name)
    : loop_(loop),
      resource_(std::move(resource)),
      high_water_mark_(high_water_mark),
      low_water_mark_(low_water_mark),
      name_(std::move(name)) {}

ChunkSink::~ChunkSink() {
    // Unfinished sinks still release the resource; nobody is left to hear
    // about a close failure at this point.
    if (resource_ && !resource_->IsClosed()) {
        auto closed = resource_->Close();
        static_cast<void>(closed);
    }
}

AcceptResult ChunkSink::Accept(Chunk chunk) {
    if (IsTerminated() || finishing_ || saturated_) {
        return AcceptResult{false, saturated_};
    }

    buffered_ += chunk.Size();
    pending_.push_back(std::move(chunk));
    if (buffered_ >= high_water_mark_) {
        saturated_ = true;
    }
    ScheduleFlush();
    return AcceptResult{true, saturated_};
}

void ChunkSink::Finish() {
    if (IsTerminated() || finishing_) return;
    finishing_ = true;
    ScheduleFlush();
}

void ChunkSink::Abort(const Error& /*reason*/) {
    if (IsTerminated()) return;
    aborted_ = true;
    DiscardBuffered();

    auto closed = resource_->Close();
    if (!closed) {
        EmitError(closed.error());
    }
}

void ChunkSink::ScheduleFlush() {
    if (flush_scheduled_) return;
    flush_scheduled_ = true;

    std::weak_ptr<ChunkSink> weak_self = shared_from_this();
    loop_.Defer([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->FlushOne();
        }
    });
}

void ChunkSink::FlushOne() {
    flush_scheduled_ = false;
    if (IsTerminated()) return;

    auto self = shared_from_this();

    if (pending_.empty()) {
        if (finishing_) CompleteFinish();
        return;
    }

    Chunk chunk = std::move(pending_.front());
    pending_.pop_front();

    auto written = resource_->Write(chunk.Bytes());
    if (!written) {
        buffered_ -= chunk.Size();
        Fail(written.error());
        return;
    }

    buffered_ -= chunk.Size();
    bytes_written_ += chunk.Size();

    if (saturated_ && buffered_ <= low_water_mark_ && buffered_ < high_water_mark_) {
        saturated_ = false;
        EmitDrain();
        if (IsTerminated()) return;
    }

    if (!pending_.empty() || finishing_) {
        ScheduleFlush();
    }
}

void ChunkSink::CompleteFinish() {
    auto closed = resource_->Close();
    if (!closed) {
        Fail(closed.error());
        return;
    }
    finished_ = true;
    EmitFinish();
}

void ChunkSink::Fail(const Error& e) {
    if (IsTerminated()) return;
    failed_ = true;
    DiscardBuffered();

    Error err = e;
    err.code = ErrorCode::SinkWriteError;

    // The first failure is primary; a failing close is appended to it
    if (!resource_->IsClosed()) {
        auto closed = resource_->Close();
        if (!closed) {
            err.message += "; " + closed.error().message;
        }
    }
    EmitError(std::move(err));
}

void ChunkSink::DiscardBuffered() {
    pending_.clear();
    buffered_ = 0;
    saturated_ = false;
}

}  // namespace chunk_pipe
