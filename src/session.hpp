// SPDX-License-Identifier: MIT

// src/session.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "lib/stream/error.hpp"

namespace chunk_pipe {

/// Bytes produced between two SessionObserver::OnProgress() ticks.
inline constexpr std::uint64_t kProgressInterval = 10 * 1024 * 1024;

/// One observed saturation: the bridge suspended the producer of an edge.
struct BackpressureEvent {
    std::uint64_t offset = 0;   ///< Bytes delivered on the edge when saturation was seen
    std::uint64_t count = 0;    ///< 1-based running count within the session
};

/// Cumulative counters of one transfer session.
struct SessionStats {
    std::uint64_t bytes_produced = 0;        ///< Bytes emitted by the source
    std::uint64_t bytes_consumed = 0;        ///< Bytes committed by the terminal sink
    std::uint64_t backpressure_events = 0;   ///< Saturations observed by the bridge
    std::size_t peak_buffered_bytes = 0;     ///< Largest buffered count of any single stage
    std::chrono::steady_clock::duration elapsed{};
};

/// Reporting collaborator injected per session.
///
/// The core emits structured events only; rendering is entirely up to the
/// implementation. All methods run on the session's event-loop thread and
/// must not call back into the session.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void OnBackpressure(const BackpressureEvent& event) = 0;

    /// The saturated consumer drained and the producer was resumed.
    virtual void OnResume(std::uint64_t /*backpressure_count*/) {}

    /// Progress tick, emitted every kProgressInterval bytes produced.
    virtual void OnProgress(std::uint64_t /*bytes_produced*/) {}

    virtual void OnSessionComplete(const SessionStats& stats) = 0;
    virtual void OnSessionError(const Error& error) = 0;
};

/// Observer that discards every event.
class NullObserver final : public SessionObserver {
public:
    void OnBackpressure(const BackpressureEvent&) override {}
    void OnSessionComplete(const SessionStats&) override {}
    void OnSessionError(const Error&) override {}
};

/// Mutable per-session counters shared by a bridge and its edges.
class SessionCounters {
public:
    void Start() { started_ = std::chrono::steady_clock::now(); }

    /// @return true when the running total crossed a multiple of kProgressInterval.
    bool AddProduced(std::uint64_t n) {
        std::uint64_t before = stats_.bytes_produced / kProgressInterval;
        stats_.bytes_produced += n;
        return stats_.bytes_produced / kProgressInterval > before;
    }
    void SetConsumed(std::uint64_t n) { stats_.bytes_consumed = n; }

    /// Record a saturation. @return the event to report.
    BackpressureEvent RecordBackpressure(std::uint64_t offset) {
        return BackpressureEvent{offset, ++stats_.backpressure_events};
    }

    void SampleBuffered(std::size_t buffered) {
        stats_.peak_buffered_bytes = std::max(stats_.peak_buffered_bytes, buffered);
    }

    /// Freeze elapsed time and hand out a copy of the counters.
    SessionStats Snapshot() const {
        SessionStats out = stats_;
        out.elapsed = std::chrono::steady_clock::now() - started_;
        return out;
    }

    const SessionStats& stats() const { return stats_; }

private:
    SessionStats stats_;
    std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
};

}  // namespace chunk_pipe
