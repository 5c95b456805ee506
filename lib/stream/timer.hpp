// SPDX-License-Identifier: MIT

// lib/stream/timer.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace chunk_pipe {

/// One-shot timer built on IEventLoop::Schedule().
///
/// Works with any IEventLoop implementation (epoll, virtual-time test loop).
/// Stop() cancels the underlying loop timer, so the timer resource is
/// released immediately and the callback never runs. Safe to destroy while
/// armed.
///
/// @code
/// Timer delay(loop);
/// delay.OnTimer([] { emit_next(); });
/// delay.Start(10);  // fire once after 10ms
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    /// @param loop  Event loop that drives this timer
    explicit Timer(IEventLoop& loop)
        : loop_(loop), alive_(std::make_shared<bool>(true)) {}

    ~Timer() {
        *alive_ = false;
        Stop();
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked when the timer fires.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm the timer. Re-arming an armed timer cancels the pending tick.
    /// The callback may call Start() again.
    void Start(int delay_ms) {
        CancelPending();
        armed_ = true;
        Schedule(delay_ms);
    }

    /// Disarm the timer. The callback will not fire.
    void Stop() {
        armed_ = false;
        CancelPending();
    }

    /// Return true if the timer is armed.
    bool IsArmed() const { return armed_; }

private:
    void Schedule(int delay_ms) {
        // Capture shared_ptr by value - outlives Timer if needed
        std::shared_ptr<bool> alive = alive_;
        Timer* self = this;
        pending_id_ = loop_.Schedule(std::chrono::milliseconds(delay_ms), [alive, self]() {
            if (*alive) {
                self->pending_id_ = 0;
                self->Fire();
            }
        });
    }

    void CancelPending() {
        if (pending_id_ != 0) {
            loop_.Cancel(pending_id_);
            pending_id_ = 0;
        }
    }

    void Fire() {
        if (!armed_) return;
        armed_ = false;
        if (callback_) {
            callback_();
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    bool armed_ = false;
    IEventLoop::TimerId pending_id_ = 0;
    std::shared_ptr<bool> alive_;
};

}  // namespace chunk_pipe
