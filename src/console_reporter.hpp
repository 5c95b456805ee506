// SPDX-License-Identifier: MIT

// src/console_reporter.hpp
#pragma once

#include <cstdint>
#include <cstdio>
#include <string_view>

#include "src/memory_usage.hpp"
#include "src/session.hpp"

namespace chunk_pipe {

// ConsoleReporter - renders session events as human-readable lines.
//
// Backpressure is sampled: the first event and every 100th are printed,
// resume notices only for the first hundred and every 100th after that.
class ConsoleReporter : public SessionObserver {
public:
    static constexpr std::uint64_t kLogEvery = 100;

    explicit ConsoleReporter(std::FILE* out = stdout) : out_(out) {}

    /// Section header printed before a transfer.
    void Banner(std::string_view title, std::string_view input,
                std::string_view output, bool slow);

    void ReportMemory(std::string_view label, const MemoryUsage& usage);

    // SessionObserver
    void OnBackpressure(const BackpressureEvent& event) override;
    void OnResume(std::uint64_t backpressure_count) override;
    void OnProgress(std::uint64_t bytes_produced) override;
    void OnSessionComplete(const SessionStats& stats) override;
    void OnSessionError(const Error& error) override;

private:
    std::FILE* out_;
};

}  // namespace chunk_pipe
