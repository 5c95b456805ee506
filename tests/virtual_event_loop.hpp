// SPDX-License-Identifier: MIT

// tests/virtual_event_loop.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace chunk_pipe::test {

// VirtualEventLoop - single-threaded IEventLoop with a simulated clock.
//
// Deferred callbacks run FIFO, one batch per turn. When no deferred work is
// left, the clock jumps to the earliest timer. Timers due at the same
// instant fire in scheduling order. A 100 MiB transfer with 10 ms per chunk
// runs in well under a second of real time.
class VirtualEventLoop : public IEventLoop {
public:
    using Clock = std::chrono::milliseconds;

    std::unique_ptr<IEventHandle> Register(int, ReadCallback, ErrorCallback) override {
        throw std::logic_error("VirtualEventLoop does not watch file descriptors");
    }

    void Defer(std::function<void()> fn) override {
        deferred_.push_back(std::move(fn));
    }

    TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) override {
        if (fail_schedule_) {
            throw std::runtime_error("timerfd_create failed: Too many open files");
        }
        TimerId id = next_id_++;
        timers_.emplace(Key{now_ + delay, id}, std::move(fn));
        ++scheduled_;
        return id;
    }

    bool Cancel(TimerId id) override {
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->first.id == id) {
                timers_.erase(it);
                ++cancelled_;
                return true;
            }
        }
        return false;
    }

    bool IsInEventLoopThread() const override { return true; }

    /// Run one batch of deferred callbacks. @return false if there were none.
    bool RunDeferred() {
        if (deferred_.empty()) return false;
        std::vector<std::function<void()>> batch;
        batch.swap(deferred_);
        for (auto& fn : batch) fn();
        return true;
    }

    /// Fire the earliest timer, advancing the clock. @return false if none.
    bool FireNextTimer() {
        if (timers_.empty()) return false;
        auto it = timers_.begin();
        now_ = std::max(now_, it->first.due);
        TimerCallback fn = std::move(it->second);
        timers_.erase(it);
        fn();
        return true;
    }

    /// Run until no deferred work and no timers remain.
    void RunUntilIdle() {
        while (RunDeferred() || FireNextTimer()) {}
    }

    /// Run until @p done returns true or the loop goes idle.
    /// @return the final value of done()
    bool RunUntil(const std::function<bool()>& done) {
        while (!done()) {
            if (!RunDeferred() && !FireNextTimer()) break;
        }
        return done();
    }

    /// Run deferred work only, without moving the clock.
    void Drain() {
        while (RunDeferred()) {}
    }

    /// Advance the clock by @p delta, firing every timer due on the way.
    void AdvanceBy(std::chrono::milliseconds delta) {
        Clock target = now_ + delta;
        Drain();
        while (!timers_.empty() && timers_.begin()->first.due <= target) {
            FireNextTimer();
            Drain();
        }
        now_ = target;
    }

    Clock Now() const { return now_; }
    std::size_t PendingTimerCount() const { return timers_.size(); }
    std::size_t DeferredCount() const { return deferred_.size(); }
    std::uint64_t ScheduledCount() const { return scheduled_; }
    std::uint64_t CancelledCount() const { return cancelled_; }

    /// Make every later Schedule() throw, as a timerfd failure would.
    void FailSchedule(bool fail) { fail_schedule_ = fail; }

private:
    struct Key {
        Clock due;
        TimerId id;
        bool operator<(const Key& other) const {
            if (due != other.due) return due < other.due;
            return id < other.id;
        }
    };

    std::vector<std::function<void()>> deferred_;
    std::map<Key, TimerCallback> timers_;
    Clock now_{0};
    TimerId next_id_ = 1;
    std::uint64_t scheduled_ = 0;
    std::uint64_t cancelled_ = 0;
    bool fail_schedule_ = false;
};

}  // namespace chunk_pipe::test
