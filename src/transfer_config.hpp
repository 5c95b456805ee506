// SPDX-License-Identifier: MIT

// src/transfer_config.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <limits>
#include <optional>
#include <string>

#include "lib/stream/error.hpp"

namespace chunk_pipe {

inline constexpr std::size_t kKiB = 1024;
inline constexpr std::size_t kMiB = 1024 * kKiB;

/// Configuration consumed by sources, sinks and the latency stage.
struct TransferConfig {
    std::size_t chunk_size = 64 * kKiB;                  ///< Source read size per chunk
    std::size_t high_water_mark = 64 * kKiB;             ///< Buffered bytes that report saturation
    std::optional<std::size_t> low_water_mark = {};      ///< Drain threshold (defaults to high_water_mark)
    std::chrono::milliseconds latency{10};               ///< Per-chunk delay of the latency stage
    bool latency_enabled = false;                        ///< Interpose a LatencyStage before the sink

    /// Preset matching a plain file-to-file copy.
    static TransferConfig Defaults() { return TransferConfig{}; }

    /// Preset for a consumer slowed down by a latency stage.
    static TransferConfig SlowConsumer() {
        return TransferConfig{
            .chunk_size = 64 * kKiB,
            .high_water_mark = 64 * kKiB,
            .low_water_mark = std::nullopt,
            .latency = std::chrono::milliseconds{10},
            .latency_enabled = true,
        };
    }

    /// Effective drain threshold.
    std::size_t LowWaterMark() const {
        return low_water_mark.value_or(high_water_mark);
    }

    /// Reject configurations that cannot bound memory.
    std::expected<void, Error> Validate() const {
        if (chunk_size == 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                                         "chunk_size must be positive"});
        }
        if (high_water_mark == 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                                         "high_water_mark must be positive"});
        }
        if (low_water_mark && *low_water_mark > high_water_mark) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                "low_water_mark (" + std::to_string(*low_water_mark) +
                ") exceeds high_water_mark (" + std::to_string(high_water_mark) + ")"});
        }
        if (latency.count() < 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                                         "latency must not be negative"});
        }
        // The delay timer takes an int millisecond count
        if (latency.count() > std::numeric_limits<int>::max()) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                "latency (" + std::to_string(latency.count()) + " ms) exceeds " +
                std::to_string(std::numeric_limits<int>::max()) + " ms"});
        }
        return {};
    }
};

}  // namespace chunk_pipe
