// SPDX-License-Identifier: MIT

// src/buffer_resource.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "src/resource.hpp"

namespace chunk_pipe {

/// Synthetic readable resource producing @p total_size bytes without touching
/// disk. Byte i has the value PatternByte(i), so a consumer can verify order
/// and completeness without holding the whole stream.
class PatternReader : public ReadableResource {
public:
    explicit PatternReader(std::uint64_t total_size) : total_size_(total_size) {}

    static constexpr std::byte PatternByte(std::uint64_t offset) noexcept {
        return static_cast<std::byte>((offset * 31 + 7) % 251);
    }

    std::expected<std::size_t, Error> Read(std::span<std::byte> buf) override {
        if (closed_) {
            return std::unexpected(Error{ErrorCode::SourceReadError, "read after close"});
        }
        std::uint64_t remaining = total_size_ - position_;
        std::size_t n = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining, buf.size()));
        for (std::size_t i = 0; i < n; ++i) {
            buf[i] = PatternByte(position_ + i);
        }
        position_ += n;
        return n;
    }

    void Close() override { closed_ = true; }
    bool IsClosed() const override { return closed_; }

private:
    std::uint64_t total_size_;
    std::uint64_t position_ = 0;
    bool closed_ = false;
};

/// Readable resource over an in-memory byte vector.
class BufferReader : public ReadableResource {
public:
    explicit BufferReader(std::vector<std::byte> data) : data_(std::move(data)) {}

    std::expected<std::size_t, Error> Read(std::span<std::byte> buf) override {
        if (closed_) {
            return std::unexpected(Error{ErrorCode::SourceReadError, "read after close"});
        }
        std::size_t n = std::min(buf.size(), data_.size() - position_);
        if (n > 0) {
            std::memcpy(buf.data(), data_.data() + position_, n);
        }
        position_ += n;
        return n;
    }

    void Close() override { closed_ = true; }
    bool IsClosed() const override { return closed_; }

private:
    std::vector<std::byte> data_;
    std::size_t position_ = 0;
    bool closed_ = false;
};

/// Writable resource appending into a vector shared with the caller, so the
/// output stays inspectable after the owning sink is gone.
class BufferWriter : public WritableResource {
public:
    using Storage = std::shared_ptr<std::vector<std::byte>>;

    explicit BufferWriter(Storage out = std::make_shared<std::vector<std::byte>>())
        : out_(std::move(out)) {}

    std::expected<void, Error> Write(std::span<const std::byte> data) override {
        if (closed_) {
            return std::unexpected(Error{ErrorCode::SinkWriteError, "write after close"});
        }
        out_->insert(out_->end(), data.begin(), data.end());
        return {};
    }

    std::expected<void, Error> Close() override {
        closed_ = true;
        return {};
    }

    bool IsClosed() const override { return closed_; }

    const Storage& storage() const { return out_; }

private:
    Storage out_;
    bool closed_ = false;
};

}  // namespace chunk_pipe
