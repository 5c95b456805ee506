// SPDX-License-Identifier: MIT

// src/chunk_sink.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/event_loop.hpp"
#include "src/resource.hpp"
#include "src/stage.hpp"

namespace chunk_pipe {

// ChunkSink - buffers accepted chunks and writes them to a WritableResource,
// one chunk per loop turn.
//
// Saturated while buffered bytes >= high_water_mark. Once saturated, a single
// drain notification fires when buffered bytes fall to low_water_mark or
// below (and under the high-water mark).
//
// Lifecycle:
//   Open -> Finish() -> Finishing -> Finished
//   Open/Finishing -> {Failed (write or close error) | Aborted}
class ChunkSink : public ChunkWritable,
                  public std::enable_shared_from_this<ChunkSink> {
public:
    struct PrivateTag {};

    static std::shared_ptr<ChunkSink> Create(
        IEventLoop& loop,
        std::unique_ptr<WritableResource> resource,
        std::size_t high_water_mark,
        std::size_t low_water_mark,
        std::string name = "sink");

    ChunkSink(PrivateTag, IEventLoop& loop,
              std::unique_ptr<WritableResource> resource,
              std::size_t high_water_mark, std::size_t low_water_mark,
              std::string name);

    ~ChunkSink() override;

    ChunkSink(const ChunkSink&) = delete;
    ChunkSink& operator=(const ChunkSink&) = delete;

    // Stage
    std::string_view Name() const override { return name_; }
    void Abort(const Error& reason) override;
    bool IsTerminated() const override { return finished_ || failed_ || aborted_; }

    // ChunkWritable
    AcceptResult Accept(Chunk chunk) override;
    void Finish() override;
    bool IsSaturated() const override { return saturated_; }
    std::size_t BufferedBytes() const override { return buffered_; }

    /// Bytes committed to the resource.
    std::uint64_t BytesWritten() const { return bytes_written_; }

    bool IsFinished() const { return finished_; }
    bool IsAborted() const { return aborted_; }

private:
    void ScheduleFlush();
    void FlushOne();
    void CompleteFinish();
    void Fail(const Error& e);
    void DiscardBuffered();

    IEventLoop& loop_;
    std::unique_ptr<WritableResource> resource_;
    std::size_t high_water_mark_;
    std::size_t low_water_mark_;
    std::string name_;

    std::deque<Chunk> pending_;
    std::size_t buffered_ = 0;
    std::uint64_t bytes_written_ = 0;

    bool saturated_ = false;
    bool flush_scheduled_ = false;
    bool finishing_ = false;
    bool finished_ = false;
    bool failed_ = false;
    bool aborted_ = false;
};

}  // namespace chunk_pipe
