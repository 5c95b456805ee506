// SPDX-License-Identifier: MIT

// lib/stream/result_sink.hpp
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <utility>

#include "lib/stream/error.hpp"

namespace chunk_pipe {

/// Concept for the minimal terminal-result lifecycle: error and invalidation.
template<typename S>
concept BasicResultSink = requires(S& s, const Error& e) {
    { s.OnError(e) } -> std::same_as<void>;
    { s.Invalidate() } -> std::same_as<void>;
};

/// Single-result sink - receives one result (success or error via expected).
template<typename S>
concept SingleResultSink = BasicResultSink<S> && requires(S& s) {
    typename S::ResultType;
    { s.OnResult(std::declval<typename S::ResultType>()) } -> std::same_as<void>;
    { s.IsDelivered() } -> std::same_as<bool>;
};

/// Delivers the terminal outcome of a session exactly once.
///
/// Whichever of OnResult() / OnError() arrives first wins; later calls are
/// dropped. Invalidate() drops everything, for owners being torn down before
/// the session resolved. Single-threaded: all calls on the event-loop thread.
template<typename Result>
class ResultSink {
public:
    using ResultType = Result;
    using Handler = std::function<void(std::expected<Result, Error>)>;

    ResultSink() = default;

    explicit ResultSink(Handler on_result)
        : on_result_(std::move(on_result)) {}

    /// Replace the handler. Only valid before delivery.
    void SetHandler(Handler on_result) { on_result_ = std::move(on_result); }

    void OnResult(Result&& result) {
        if (!valid_ || delivered_) return;
        delivered_ = true;
        if (on_result_) on_result_(std::move(result));
    }

    void OnError(const Error& e) {
        if (!valid_ || delivered_) return;
        delivered_ = true;
        if (on_result_) on_result_(std::unexpected(e));
    }

    /// @return true once a result or error has been delivered.
    bool IsDelivered() const { return delivered_; }

    void Invalidate() { valid_ = false; }

private:
    Handler on_result_;
    bool valid_ = true;
    bool delivered_ = false;
};

}  // namespace chunk_pipe
