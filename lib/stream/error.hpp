// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace chunk_pipe {

/// Error codes for all transfer and pipeline operations.
enum class ErrorCode {
    // Endpoints
    SourceReadError,      ///< Underlying readable resource failed or is corrupted
    SinkWriteError,       ///< Underlying writable resource failed (disk full, EBADF, ...)

    // Stages
    StageError,           ///< Interposed stage failed (delay timer could not be armed)

    // Session
    PipelineAbort,        ///< Caller-initiated cancellation
    ProtocolViolation,    ///< Contract breach between components (drain while not saturated, ...)
    InvalidState,         ///< Method called in wrong session state

    // Configuration
    InvalidConfig,        ///< TransferConfig rejected by Validate()
};

/// Error payload delivered to error callbacks and terminal results.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
    std::string stage = {};        ///< Name of the stage that failed ("source", "sink", ...)
};

/// Return a short category string for an error code (e.g. "io", "session").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceReadError:
        case ErrorCode::SinkWriteError:
            return "io";
        case ErrorCode::StageError:
            return "stage";
        case ErrorCode::PipelineAbort:
            return "cancelled";
        case ErrorCode::ProtocolViolation:
        case ErrorCode::InvalidState:
            return "protocol";
        case ErrorCode::InvalidConfig:
            return "config";
    }
    return "unknown";
}

/// Return the enumerator name for an error code (e.g. "SinkWriteError").
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceReadError: return "SourceReadError";
        case ErrorCode::SinkWriteError: return "SinkWriteError";
        case ErrorCode::StageError: return "StageError";
        case ErrorCode::PipelineAbort: return "PipelineAbort";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

}  // namespace chunk_pipe
