// SPDX-License-Identifier: MIT

// src/chunk.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace chunk_pipe {

/// Immutable, move-only unit of transferred bytes.
///
/// A chunk owns its bytes and records the offset at which it starts in the
/// transfer, so consumers can check ordering without extra bookkeeping.
/// Chunks cross component boundaries by move only; there is no shared
/// mutable access to the underlying buffer.
class Chunk {
public:
    Chunk() = default;

    Chunk(std::vector<std::byte> bytes, std::uint64_t offset)
        : bytes_(std::move(bytes)), offset_(offset) {}

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;
    Chunk(Chunk&&) noexcept = default;
    Chunk& operator=(Chunk&&) noexcept = default;

    std::span<const std::byte> Bytes() const noexcept { return bytes_; }
    std::size_t Size() const noexcept { return bytes_.size(); }
    bool Empty() const noexcept { return bytes_.empty(); }

    /// Offset of the first byte within the transfer.
    std::uint64_t Offset() const noexcept { return offset_; }

    /// Offset one past the last byte.
    std::uint64_t End() const noexcept { return offset_ + bytes_.size(); }

private:
    std::vector<std::byte> bytes_;
    std::uint64_t offset_ = 0;
};

}  // namespace chunk_pipe
