// SPDX-License-Identifier: MIT

// src/file_generator.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>

#include "lib/stream/error.hpp"
#include "src/resource.hpp"
#include "src/transfer_config.hpp"

namespace chunk_pipe {

struct GenerateOptions {
    std::uint64_t size = 100 * kMiB;
    std::size_t chunk_size = kMiB;
    std::byte fill = std::byte{'a'};
    std::size_t progress_every = 10;   // chunks between progress callbacks
};

/// Called with the number of bytes written so far.
using GenerateProgress = std::function<void(std::uint64_t written)>;

/// Write options.size bytes of options.fill to @p out in chunk_size pieces
/// (the last one shorter), then close it. Progress is reported after every
/// progress_every full chunks.
/// @return bytes written, or the first write/close error
std::expected<std::uint64_t, Error> GenerateFile(
    WritableResource& out,
    const GenerateOptions& options,
    const GenerateProgress& progress = {});

/// Convenience overload creating (or truncating) @p path.
std::expected<std::uint64_t, Error> GenerateFile(
    const std::string& path,
    const GenerateOptions& options,
    const GenerateProgress& progress = {});

}  // namespace chunk_pipe
