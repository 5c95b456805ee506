// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace chunk_pipe {

class EpollEventLoop;

/// Handle for a registered file descriptor in the epoll event loop.
///
/// Returned by EpollEventLoop::Register().  Destroying the handle
/// automatically removes the fd from the epoll set.
class EpollEventHandle : public IEventHandle {
public:
    /// Construct a handle and register @p fd with the epoll instance.
    EpollEventHandle(EpollEventLoop& loop, int fd,
                     IEventLoop::ReadCallback on_read,
                     IEventLoop::ErrorCallback on_error);

    ~EpollEventHandle() override;

    EpollEventHandle(const EpollEventHandle&) = delete;
    EpollEventHandle& operator=(const EpollEventHandle&) = delete;
    EpollEventHandle(EpollEventHandle&&) = delete;
    EpollEventHandle& operator=(EpollEventHandle&&) = delete;

    /// @return The monitored file descriptor.
    int fd() const override { return fd_; }

    /// Dispatch callbacks for the given epoll event mask (called internally).
    void HandleEvents(uint32_t events);

private:
    EpollEventLoop& loop_;
    int fd_;
    IEventLoop::ReadCallback on_read_;
    IEventLoop::ErrorCallback on_error_;
};

/// Internal timer entry for scheduled callbacks.
struct TimerEntry {
    IEventLoop::TimerId id = 0;            ///< Id handed out by Schedule().
    int fd = -1;                           ///< timerfd file descriptor.
    std::function<void()> callback;        ///< User callback to invoke on expiry.
    std::unique_ptr<IEventHandle> handle;  ///< Epoll registration for the timerfd.
};

/// Epoll-based event loop for non-blocking I/O and timer scheduling.
///
/// Wraps Linux epoll to multiplex readable fds and timers on a single
/// thread.  Every Schedule() call owns one timerfd until it fires or is
/// cancelled, so PendingTimerCount() doubles as a leak check.
///
/// Thread safety: the loop itself runs on a single thread.  Defer() and
/// Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create an epoll instance and an internal eventfd for cross-thread wakeups.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    std::unique_ptr<IEventHandle> Register(
        int fd,
        ReadCallback on_read,
        ErrorCallback on_error) override;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    /// Arm a one-shot timerfd that fires after @p delay.
    TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// Disarm and close the timerfd behind @p id.
    bool Cancel(TimerId id) override;

    /// @return True if the calling thread is the event-loop thread.
    bool IsInEventLoopThread() const override;

    /// Run deferred work, then wait for events. The wait is skipped when
    /// deferred work is still queued, otherwise it lasts up to @p timeout_ms.
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Poll until @p done returns true.
    void RunUntil(const std::function<bool()>& done, int timeout_ms = 100);

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// @return Number of timers scheduled but neither fired nor cancelled.
    std::size_t PendingTimerCount() const;

    /// @return The underlying epoll file descriptor (used internally by EpollEventHandle).
    int epoll_fd() const { return epoll_fd_; }

private:
    void ProcessDeferredCallbacks();
    bool HasDeferredCallbacks() const;
    void HandleTimerExpired(TimerId id);
    void ReleaseRetiredTimers();
    static void ReleaseTimer(std::unique_ptr<TimerEntry> entry);

    enum class State { Idle, Running, Stopped };

    int epoll_fd_;
    int wake_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    mutable std::mutex deferred_mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    // Active timers (protected by deferred_mutex_)
    std::vector<std::unique_ptr<TimerEntry>> timers_;
    // Fired or cancelled timers awaiting release at the end of the batch
    std::vector<std::unique_ptr<TimerEntry>> retired_timers_;
    TimerId next_timer_id_ = 1;

    static constexpr int kMaxEvents = 64;
};

}  // namespace chunk_pipe
