// SPDX-License-Identifier: MIT

// src/pipe.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "src/stage.hpp"

namespace chunk_pipe {

// Pipe - automatic edge from one ChunkReadable to one ChunkWritable.
//
// Forwards every chunk with Accept(), suspends the readable when the
// writable saturates and resumes it on drain. End of the readable finishes
// the writable. Errors are not handled here; each stage reports its own
// failures to the owning bridge. Contract breaches between the two ends
// are reported through OnViolation().
//
// State machine:
//   Flowing <-> Saturated -> Ended
//      |            |
//      +------------+-----> Closed (Close() by the bridge on teardown)
class Pipe : public std::enable_shared_from_this<Pipe> {
public:
    struct PrivateTag {};

    enum class State { Flowing, Saturated, Ended, Closed };

    using BackpressureHandler = std::function<void(std::uint64_t offset)>;
    using ResumeHandler = std::function<void()>;
    using ForwardHandler = std::function<void(std::size_t bytes, std::size_t buffered)>;
    using EndHandler = std::function<void()>;
    using ViolationHandler = std::function<void(const Error&)>;

    /// Connect @p from to @p to. Installs the chunk and end handlers of
    /// @p from and the drain handler of @p to.
    static std::shared_ptr<Pipe> Create(std::shared_ptr<ChunkReadable> from,
                                        std::shared_ptr<ChunkWritable> to);

    Pipe(PrivateTag, std::shared_ptr<ChunkReadable> from,
         std::shared_ptr<ChunkWritable> to);

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    /// The writable saturated and the readable was suspended.
    void OnBackpressure(BackpressureHandler h) { backpressure_handler_ = std::move(h); }
    /// The writable drained and the readable was resumed.
    void OnResume(ResumeHandler h) { resume_handler_ = std::move(h); }
    /// A chunk was accepted; reports its size and the writable's buffered bytes.
    void OnForward(ForwardHandler h) { forward_handler_ = std::move(h); }
    /// The readable ended and the writable was asked to finish.
    void OnEnd(EndHandler h) { end_handler_ = std::move(h); }
    void OnViolation(ViolationHandler h) { violation_handler_ = std::move(h); }

    /// Detach: every later event from either end is ignored.
    void Close() { state_ = State::Closed; }

    State GetState() const { return state_; }

    /// Bytes accepted by the writable so far.
    std::uint64_t BytesForwarded() const { return forwarded_; }

    ChunkReadable& from() const { return *from_; }
    ChunkWritable& to() const { return *to_; }

private:
    void Wire();
    void HandleChunk(Chunk chunk);
    void HandleDrain();
    void HandleEnd();
    void Violation(std::string_view stage, std::string message);

    std::shared_ptr<ChunkReadable> from_;
    std::shared_ptr<ChunkWritable> to_;
    State state_ = State::Flowing;
    std::uint64_t forwarded_ = 0;

    BackpressureHandler backpressure_handler_;
    ResumeHandler resume_handler_;
    ForwardHandler forward_handler_;
    EndHandler end_handler_;
    ViolationHandler violation_handler_;
};

}  // namespace chunk_pipe
