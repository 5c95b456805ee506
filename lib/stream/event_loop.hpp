// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace chunk_pipe {

/// Handle for a registered file descriptor, returned by IEventLoop::Register().
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    /// Return the monitored file descriptor.
    virtual int fd() const = 0;
};

/// Event loop interface for I/O multiplexing and timers.
///
/// Every transfer session runs on exactly one IEventLoop. Sources, sinks and
/// stages never block; they hand work back to the loop through Defer() and
/// Schedule(). The built-in EventLoop class wraps an epoll implementation
/// behind this interface; tests substitute a virtual-time loop.
///
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using ReadCallback = std::function<void()>;
    using ErrorCallback = std::function<void(int error_code)>;
    using TimerCallback = std::function<void()>;

    /// Identifies a scheduled timer for Cancel(). Never 0.
    using TimerId = std::uint64_t;

    virtual ~IEventLoop() = default;

    /// Watch a file descriptor for readability (edge-triggered).
    ///
    /// @param fd        File descriptor to monitor
    /// @param on_read   Called when fd is readable
    /// @param on_error  Called on EPOLLERR/EPOLLHUP with SO_ERROR value
    /// @return Handle that unregisters the fd on destruction
    virtual std::unique_ptr<IEventHandle> Register(
        int fd,
        ReadCallback on_read,
        ErrorCallback on_error) = 0;

    /// Schedule a callback for the next event loop iteration.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Schedule a one-shot callback after a delay.
    /// @param delay  Minimum time before callback fires
    /// @param fn     Callback to invoke
    /// @return Id that can be passed to Cancel()
    virtual TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    /// Cancel a scheduled timer and release its resources. The callback is
    /// never invoked after Cancel() returns.
    /// @return false if the timer already fired or was already cancelled
    virtual bool Cancel(TimerId id) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

/// Type-erased event loop using epoll internally.
///
/// Provides implicit conversion to IEventLoop& so it can be passed
/// directly to component factories:
/// @code
/// EventLoop loop;
/// auto source = ChunkSource::Create(loop, std::move(reader), config);
/// loop.Run();
/// @endcode
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// Dispatch one round of events.
    /// @param timeout_ms  Max wait when no deferred work is pending (-1 = infinite)
    void Poll(int timeout_ms = -1);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Poll until @p done returns true. Unlike Run(), may be called repeatedly,
    /// so one loop can drive several sessions back to back.
    void RunUntil(const std::function<bool()>& done, int timeout_ms = 100);

    /// Signal the event loop to stop after the current iteration.
    void Stop();

    /// Implicit conversion to IEventLoop&.
    operator IEventLoop&();
    /// @copydoc operator IEventLoop&()
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunk_pipe
