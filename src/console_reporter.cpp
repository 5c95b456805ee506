// SPDX-License-Identifier: MIT

// src/console_reporter.cpp
#include "src/console_reporter.hpp"

#include <chrono>

#include <fmt/format.h>

namespace chunk_pipe {

namespace {

double ToMiB(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace

void ConsoleReporter::Banner(std::string_view title, std::string_view input,
                             std::string_view output, bool slow) {
    fmt::print(out_, "\n{}\n", title);
    fmt::print(out_, "=====================================\n");
    fmt::print(out_, "Input file:  {}\n", input);
    fmt::print(out_, "Output file: {}\n", output);
    fmt::print(out_, "Slow mode:   {}\n", slow ? "yes" : "no");
}

void ConsoleReporter::ReportMemory(std::string_view label, const MemoryUsage& usage) {
    fmt::print(out_, "\n{}:\n", label);
    fmt::print(out_, "   RSS:      {:.2f} MB\n", ToMiB(usage.rss_bytes));
    fmt::print(out_, "   Peak RSS: {:.2f} MB\n", ToMiB(usage.peak_rss_bytes));
    fmt::print(out_, "   Data:     {:.2f} MB\n", ToMiB(usage.data_bytes));
}

void ConsoleReporter::OnBackpressure(const BackpressureEvent& event) {
    if (event.count != 1 && event.count % kLogEvery != 0) return;
    fmt::print(out_, "Backpressure detected, write buffer full (event #{}, at {:.2f} MB)\n",
               event.count, ToMiB(event.offset));
    fmt::print(out_, "   Reading paused, waiting for the buffer to drain...\n");
}

void ConsoleReporter::OnResume(std::uint64_t backpressure_count) {
    if (backpressure_count >= kLogEvery && backpressure_count % kLogEvery != 0) return;
    fmt::print(out_, "Write buffer drained, resuming reads\n");
}

void ConsoleReporter::OnProgress(std::uint64_t bytes_produced) {
    fmt::print(out_, "   Processed: {:.2f} MB\n", ToMiB(bytes_produced));
}

void ConsoleReporter::OnSessionComplete(const SessionStats& stats) {
    auto seconds = std::chrono::duration<double>(stats.elapsed).count();
    fmt::print(out_, "\nTransfer complete: {:.2f} MB read, {:.2f} MB written\n",
               ToMiB(stats.bytes_produced), ToMiB(stats.bytes_consumed));
    fmt::print(out_, "Elapsed: {:.2f}s\n", seconds);
    fmt::print(out_, "Backpressure events: {}\n", stats.backpressure_events);
    fmt::print(out_, "Peak buffered: {} KiB\n", stats.peak_buffered_bytes / 1024);
}

void ConsoleReporter::OnSessionError(const Error& error) {
    fmt::print(out_, "\nTransfer failed [{}] {}: {}\n",
               error_code_name(error.code),
               error.stage.empty() ? "session" : error.stage,
               error.message);
}

}  // namespace chunk_pipe
