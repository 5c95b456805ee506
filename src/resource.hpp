// SPDX-License-Identifier: MIT

// src/resource.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <span>

#include "lib/stream/error.hpp"

namespace chunk_pipe {

/// Byte resource a ChunkSource reads from (file, synthetic generator, ...).
///
/// Read() is called at most once per event-loop turn and must not block for
/// long; regular files qualify. Close() releases the underlying handle and is
/// idempotent.
class ReadableResource {
public:
    virtual ~ReadableResource() = default;

    /// Read up to buf.size() bytes.
    /// @return bytes read, 0 at end of stream, or SourceReadError
    virtual std::expected<std::size_t, Error> Read(std::span<std::byte> buf) = 0;

    virtual void Close() = 0;
    virtual bool IsClosed() const = 0;
};

/// Byte resource a ChunkSink writes to.
///
/// Write() either commits all of @p data or fails; callers rely on this to
/// keep chunk boundaries write-atomic.
class WritableResource {
public:
    virtual ~WritableResource() = default;

    /// Write all of @p data.
    /// @return SinkWriteError if any byte could not be written
    virtual std::expected<void, Error> Write(std::span<const std::byte> data) = 0;

    /// Release the underlying handle. Idempotent; only the first call can fail.
    virtual std::expected<void, Error> Close() = 0;

    virtual bool IsClosed() const = 0;
};

}  // namespace chunk_pipe
