// SPDX-License-Identifier: MIT

// lib/stream/suspendable.hpp
#pragma once

namespace chunk_pipe {

/// Interface for producers that support backpressure.
///
/// Uses binary suspend semantics:
/// - Suspend() while already suspended is a no-op.
/// - Resume() while not suspended is a no-op.
/// - A suspended producer emits nothing downstream until Resume().
///
/// Thread safety:
/// - Suspend() and Resume() must be called from the event-loop thread.
class Suspendable {
public:
    virtual ~Suspendable() = default;

    /// Stop emitting downstream. Idempotent.
    virtual void Suspend() = 0;

    /// Continue emitting downstream and pick up any held work. Idempotent.
    virtual void Resume() = 0;

    /// @return true if the producer is currently suspended.
    virtual bool IsSuspended() const = 0;
};

}  // namespace chunk_pipe
