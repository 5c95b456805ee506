// SPDX-License-Identifier: MIT

// src/file_resource.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>

#include "lib/stream/error.hpp"
#include "src/resource.hpp"

namespace chunk_pipe {

// UniqueFd - owns a POSIX file descriptor, closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset();
            fd_ = other.Release();
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Give up ownership without closing.
    int Release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    // Close now. Returns the close(2) errno, 0 on success or if already closed.
    int Reset();

private:
    int fd_ = -1;
};

// FileReader - reads a regular file sequentially.
class FileReader : public ReadableResource {
public:
    // Open @p path read-only. Failure is a SourceReadError.
    static std::expected<std::unique_ptr<FileReader>, Error> Open(const std::string& path);

    explicit FileReader(UniqueFd fd) : fd_(std::move(fd)) {}

    std::expected<std::size_t, Error> Read(std::span<std::byte> buf) override;
    void Close() override { fd_.Reset(); }
    bool IsClosed() const override { return !fd_.valid(); }

private:
    UniqueFd fd_;
};

// FileWriter - creates or truncates a file and appends every write.
class FileWriter : public WritableResource {
public:
    // Open @p path for writing (O_CREAT | O_TRUNC). Failure is a SinkWriteError.
    static std::expected<std::unique_ptr<FileWriter>, Error> Open(const std::string& path);

    explicit FileWriter(UniqueFd fd) : fd_(std::move(fd)) {}

    std::expected<void, Error> Write(std::span<const std::byte> data) override;
    std::expected<void, Error> Close() override;
    bool IsClosed() const override { return !fd_.valid(); }

private:
    UniqueFd fd_;
};

}  // namespace chunk_pipe
