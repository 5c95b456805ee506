// SPDX-License-Identifier: MIT

// src/file_resource.cpp
#include "src/file_resource.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace chunk_pipe {

int UniqueFd::Reset() {
    if (fd_ < 0) return 0;
    int fd = fd_;
    fd_ = -1;
    // Linux releases the descriptor even when close() reports EINTR
    if (::close(fd) < 0) {
        return errno;
    }
    return 0;
}

std::expected<std::unique_ptr<FileReader>, Error> FileReader::Open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::SourceReadError,
            "open(" + path + ") failed: " + std::strerror(err), err});
    }
    return std::make_unique<FileReader>(UniqueFd{fd});
}

std::expected<std::size_t, Error> FileReader::Read(std::span<std::byte> buf) {
    if (!fd_.valid()) {
        return std::unexpected(Error{ErrorCode::SourceReadError,
                                     "read from closed file", EBADF});
    }
    while (true) {
        ssize_t n = ::read(fd_.get(), buf.data(), buf.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) continue;
        int err = errno;
        return std::unexpected(Error{ErrorCode::SourceReadError,
            std::string("read() failed: ") + std::strerror(err), err});
    }
}

std::expected<std::unique_ptr<FileWriter>, Error> FileWriter::Open(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::SinkWriteError,
            "open(" + path + ") failed: " + std::strerror(err), err});
    }
    return std::make_unique<FileWriter>(UniqueFd{fd});
}

std::expected<void, Error> FileWriter::Write(std::span<const std::byte> data) {
    if (!fd_.valid()) {
        return std::unexpected(Error{ErrorCode::SinkWriteError,
                                     "write to closed file", EBADF});
    }
    // Loop over short writes; a chunk that fails halfway is cut back off
    // the file so only whole chunks are ever left behind.
    off_t start = ::lseek(fd_.get(), 0, SEEK_CUR);
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_.get(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            if (written > 0 && start >= 0 && ::ftruncate(fd_.get(), start) == 0) {
                ::lseek(fd_.get(), start, SEEK_SET);
            }
            return std::unexpected(Error{ErrorCode::SinkWriteError,
                std::string("write() failed: ") + std::strerror(err), err});
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::expected<void, Error> FileWriter::Close() {
    int err = fd_.Reset();
    if (err != 0) {
        return std::unexpected(Error{ErrorCode::SinkWriteError,
            std::string("close() failed: ") + std::strerror(err), err});
    }
    return {};
}

}  // namespace chunk_pipe
