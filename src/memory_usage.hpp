// SPDX-License-Identifier: MIT

// src/memory_usage.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunk_pipe {

// MemoryUsage - process memory figures from /proc/self/status.
struct MemoryUsage {
    std::uint64_t rss_bytes = 0;        // VmRSS
    std::uint64_t peak_rss_bytes = 0;   // VmHWM
    std::uint64_t data_bytes = 0;       // VmData (heap and anonymous mappings)

    /// Sample the current process. nullopt when /proc is unavailable.
    static std::optional<MemoryUsage> Sample(
        const std::string& status_path = "/proc/self/status");

    /// Parse the text of a /proc/<pid>/status file. Values are in kB there.
    /// nullopt if VmRSS is missing.
    static std::optional<MemoryUsage> Parse(std::string_view status);
};

}  // namespace chunk_pipe
