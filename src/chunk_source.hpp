// SPDX-License-Identifier: MIT

// src/chunk_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/event_loop.hpp"
#include "src/resource.hpp"
#include "src/stage.hpp"

namespace chunk_pipe {

// ChunkSource - reads a ReadableResource into chunks, one per loop turn.
//
// Lifecycle:
//   Created -> Start() -> Reading <-> Suspended -> {Ended | Failed | Aborted}
//
// The resource is closed before EndOfStream or an error is emitted, and
// on Abort(). Abort() from inside the chunk handler is safe: the in-flight
// read finishes, nothing more is emitted.
class ChunkSource : public ChunkReadable,
                    public std::enable_shared_from_this<ChunkSource> {
public:
    struct PrivateTag {};

    static std::shared_ptr<ChunkSource> Create(
        IEventLoop& loop,
        std::unique_ptr<ReadableResource> resource,
        std::size_t chunk_size,
        std::string name = "source");

    ChunkSource(PrivateTag, IEventLoop& loop,
                std::unique_ptr<ReadableResource> resource,
                std::size_t chunk_size, std::string name);

    ~ChunkSource() override;

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    // Stage
    std::string_view Name() const override { return name_; }
    void Abort(const Error& reason) override;
    bool IsTerminated() const override { return ended_ || failed_ || aborted_; }

    // ChunkReadable
    void Start() override;

    // Suspendable
    void Suspend() override { suspended_ = true; }
    void Resume() override;
    bool IsSuspended() const override { return suspended_; }

    /// Bytes emitted so far (offset of the next chunk).
    std::uint64_t BytesProduced() const { return offset_; }

    bool IsEnded() const { return ended_; }
    bool IsAborted() const { return aborted_; }

private:
    void ScheduleRead();
    void ReadOnce();
    void CloseResource();

    IEventLoop& loop_;
    std::unique_ptr<ReadableResource> resource_;
    std::size_t chunk_size_;
    std::string name_;

    std::uint64_t offset_ = 0;
    bool started_ = false;
    bool suspended_ = false;
    bool read_scheduled_ = false;
    bool ended_ = false;
    bool failed_ = false;
    bool aborted_ = false;
};

}  // namespace chunk_pipe
