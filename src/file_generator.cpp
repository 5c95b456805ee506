// SPDX-License-Identifier: MIT

// src/file_generator.cpp
#include "src/file_generator.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "src/file_resource.hpp"

namespace chunk_pipe {

std::expected<std::uint64_t, Error> GenerateFile(
    WritableResource& out,
    const GenerateOptions& options,
    const GenerateProgress& progress) {
    if (options.chunk_size == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     "chunk_size must be positive"});
    }

    const std::vector<std::byte> block(options.chunk_size, options.fill);
    std::uint64_t written = 0;
    std::uint64_t chunks = 0;

    while (written < options.size) {
        std::size_t n = static_cast<std::size_t>(
            std::min<std::uint64_t>(options.chunk_size, options.size - written));
        auto ok = out.Write(std::span<const std::byte>(block.data(), n));
        if (!ok) {
            return std::unexpected(ok.error());
        }
        written += n;

        // Only full chunks count towards progress
        if (n != options.chunk_size) continue;
        ++chunks;
        if (progress && options.progress_every != 0 &&
            chunks % options.progress_every == 0) {
            progress(written);
        }
    }

    auto closed = out.Close();
    if (!closed) {
        return std::unexpected(closed.error());
    }
    return written;
}

std::expected<std::uint64_t, Error> GenerateFile(
    const std::string& path,
    const GenerateOptions& options,
    const GenerateProgress& progress) {
    auto writer = FileWriter::Open(path);
    if (!writer) {
        return std::unexpected(writer.error());
    }
    return GenerateFile(**writer, options, progress);
}

}  // namespace chunk_pipe
