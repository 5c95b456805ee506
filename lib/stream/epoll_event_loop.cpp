// SPDX-License-Identifier: MIT

#include "lib/stream/epoll_event_loop.hpp"

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunk_pipe {

// EpollEventHandle implementation

EpollEventHandle::EpollEventHandle(EpollEventLoop& loop, int fd,
                                   IEventLoop::ReadCallback on_read,
                                   IEventLoop::ErrorCallback on_error)
    : loop_(loop),
      fd_(fd),
      on_read_(std::move(on_read)),
      on_error_(std::move(on_error)) {
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLET;
    ev.data.ptr = this;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_ADD, fd_, &ev) < 0) {
        throw std::runtime_error(std::string("epoll_ctl ADD failed: ") +
                                 std::strerror(errno));
    }
}

EpollEventHandle::~EpollEventHandle() {
    // Remove from epoll - ignore errors (fd might already be closed)
    epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_DEL, fd_, nullptr);
}

void EpollEventHandle::HandleEvents(uint32_t events) {
    if ((events & (EPOLLERR | EPOLLHUP)) != 0) {
        int error_code = 0;
        socklen_t len = sizeof(error_code);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error_code, &len) < 0) {
            error_code = errno;
        }
        if (on_error_) {
            on_error_(error_code);
        }
        return;  // Don't process reads after error
    }

    if ((events & EPOLLIN) != 0 && on_read_) {
        on_read_();
    }
}

// EpollEventLoop implementation

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::runtime_error(std::string("epoll_create1 failed: ") +
                                 std::strerror(errno));
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        close(epoll_fd_);
        throw std::runtime_error(std::string("eventfd failed: ") +
                                 std::strerror(errno));
    }

    // data.ptr = nullptr distinguishes the wake fd from registered handles
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.ptr = nullptr;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        close(wake_fd_);
        close(epoll_fd_);
        throw std::runtime_error(std::string("epoll_ctl ADD wake_fd failed: ") +
                                 std::strerror(errno));
    }
}

EpollEventLoop::~EpollEventLoop() {
    for (auto& entry : timers_) {
        ReleaseTimer(std::move(entry));
    }
    timers_.clear();
    for (auto& entry : retired_timers_) {
        ReleaseTimer(std::move(entry));
    }
    retired_timers_.clear();

    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }

    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

std::unique_ptr<IEventHandle> EpollEventLoop::Register(
    int fd,
    ReadCallback on_read,
    ErrorCallback on_error) {
    return std::make_unique<EpollEventHandle>(
        *this, fd, std::move(on_read), std::move(on_error));
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

IEventLoop::TimerId EpollEventLoop::Schedule(std::chrono::milliseconds delay,
                                             TimerCallback fn) {
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        throw std::runtime_error(std::string("timerfd_create failed: ") +
                                 std::strerror(errno));
    }

    // A zero it_value disarms a timerfd, so a zero delay becomes 1ns.
    itimerspec ts{};
    ts.it_value.tv_sec = delay.count() / 1000;
    ts.it_value.tv_nsec = (delay.count() % 1000) * 1000000;
    if (ts.it_value.tv_sec == 0 && ts.it_value.tv_nsec == 0) {
        ts.it_value.tv_nsec = 1;
    }

    if (timerfd_settime(tfd, 0, &ts, nullptr) < 0) {
        int err = errno;
        close(tfd);
        throw std::runtime_error(std::string("timerfd_settime failed: ") +
                                 std::strerror(err));
    }

    auto entry = std::make_unique<TimerEntry>();
    entry->fd = tfd;
    entry->callback = std::move(fn);

    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        id = next_timer_id_++;
    }
    entry->id = id;

    try {
        entry->handle = Register(
            tfd,
            [this, id]() { HandleTimerExpired(id); },
            nullptr);
    } catch (...) {
        close(tfd);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        timers_.push_back(std::move(entry));
    }
    return id;
}

bool EpollEventLoop::Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    auto it = std::find_if(timers_.begin(), timers_.end(),
        [id](const auto& e) { return e->id == id; });
    if (it == timers_.end()) return false;

    // Disarm now; the epoll registration may still be referenced by the
    // batch being dispatched, so the entry is released after the batch.
    itimerspec disarm{};
    timerfd_settime((*it)->fd, 0, &disarm, nullptr);
    (*it)->callback = nullptr;
    retired_timers_.push_back(std::move(*it));
    timers_.erase(it);
    return true;
}

std::size_t EpollEventLoop::PendingTimerCount() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return timers_.size();
}

void EpollEventLoop::ReleaseTimer(std::unique_ptr<TimerEntry> entry) {
    if (!entry) return;
    // Unregister before closing so EPOLL_CTL_DEL sees a live fd
    entry->handle.reset();
    if (entry->fd >= 0) {
        close(entry->fd);
        entry->fd = -1;
    }
}

void EpollEventLoop::HandleTimerExpired(TimerId id) {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        auto it = std::find_if(timers_.begin(), timers_.end(),
            [id](const auto& e) { return e->id == id; });
        if (it == timers_.end()) return;  // Cancelled earlier in this batch

        uint64_t expirations = 0;
        [[maybe_unused]] ssize_t n = read((*it)->fd, &expirations, sizeof(expirations));

        // The handle dispatching this callback is still on the stack
        callback = std::move((*it)->callback);
        retired_timers_.push_back(std::move(*it));
        timers_.erase(it);
    }

    if (callback) {
        callback();
    }
}

void EpollEventLoop::ReleaseRetiredTimers() {
    std::vector<std::unique_ptr<TimerEntry>> retired;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        retired.swap(retired_timers_);
    }
    for (auto& entry : retired) {
        ReleaseTimer(std::move(entry));
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

bool EpollEventLoop::HasDeferredCallbacks() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return !deferred_callbacks_.empty();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    // Work deferred by the callbacks above must not sit behind a blocking wait
    int wait_ms = HasDeferredCallbacks() ? 0 : timeout_ms;

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, wait_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::runtime_error(std::string("epoll_wait failed: ") +
                                 std::strerror(errno));
    }

    for (int i = 0; i < nfds; ++i) {
        auto* handle = static_cast<EpollEventHandle*>(events[i].data.ptr);
        if (handle != nullptr) {
            handle->HandleEvents(events[i].events);
        } else {
            // wake_fd_ event - read and discard to clear the eventfd
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
        }
    }
    ReleaseRetiredTimers();

    ProcessDeferredCallbacks();
    ReleaseRetiredTimers();
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;  // Already running or stopped
    }
    while (state_.load() == State::Running) {
        Poll(100);  // 100ms timeout to check state_ periodically
    }
}

void EpollEventLoop::RunUntil(const std::function<bool()>& done, int timeout_ms) {
    while (!done()) {
        Poll(timeout_ms);
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();  // Interrupt epoll_wait so Run() exits immediately
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

}  // namespace chunk_pipe
