// SPDX-License-Identifier: MIT

// example/transfer/main.cpp
//
// chunk_pipe_transfer - copy a large file through a bounded-memory pipeline.
//
//   chunk_pipe_transfer generate --size 100MiB
//   chunk_pipe_transfer transfer --mode all --slow

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include "lib/stream/event_loop.hpp"
#include "src/console_reporter.hpp"
#include "src/file_generator.hpp"
#include "src/file_resource.hpp"
#include "src/memory_usage.hpp"
#include "src/session_parts.hpp"
#include "src/transfer_config.hpp"

using namespace chunk_pipe;

namespace {

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> g_interrupted{false};

void OnSignal(int) {
    g_interrupted.store(true);
}

enum class Mode { Manual, Pipeline, Pipe };

struct GenerateParams {
    std::string output = "large.txt";
    std::uint64_t size = 100 * kMiB;
    std::uint64_t chunk_size = kMiB;
};

struct TransferParams {
    std::string mode = "manual";
    std::string input = "large.txt";
    std::string output1 = "output1.txt";
    std::string output2 = "output2.txt";
    bool slow = false;
    std::uint64_t chunk_size = 64 * kKiB;
    std::uint64_t high_water_mark = 64 * kKiB;
    std::optional<std::uint64_t> low_water_mark;
    int latency_ms = 10;
};

double ToMiB(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

void ReportMemory(ConsoleReporter& reporter, const char* label) {
    if (auto usage = MemoryUsage::Sample()) {
        reporter.ReportMemory(label, *usage);
    }
}

int RunGenerate(const GenerateParams& params) {
    fmt::print("Generating test file...\n");
    fmt::print("   Size: {:.2f} MB\n", ToMiB(params.size));
    fmt::print("   Path: {}\n", params.output);

    auto start = std::chrono::steady_clock::now();
    GenerateOptions options{
        .size = params.size,
        .chunk_size = static_cast<std::size_t>(params.chunk_size),
    };
    auto written = GenerateFile(params.output, options, [](std::uint64_t bytes) {
        fmt::print("   Written: {:.2f} MB\n", ToMiB(bytes));
    });
    if (!written) {
        fmt::print(stderr, "Error while generating file: {}\n", written.error().message);
        return EXIT_FAILURE;
    }

    auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    fmt::print("\nFile generated in {:.2f}s\n", seconds.count());
    fmt::print("Actual size: {:.2f} MB\n", ToMiB(*written));
    return EXIT_SUCCESS;
}

// Run one session to completion on @p loop. Ctrl+C aborts it: the manual
// bridge is aborted by hand, the orchestrator is cancelled. Pipe mode has no
// bridge, so this function does the bookkeeping and the teardown itself.
std::expected<SessionStats, Error> RunSession(EventLoop& loop, Mode mode,
                                              const TransferConfig& config,
                                              std::unique_ptr<ReadableResource> input,
                                              std::unique_ptr<WritableResource> output,
                                              ConsoleReporter& reporter) {
    auto parts = BuildSessionParts(loop, std::move(input), std::move(output), config);
    std::optional<std::expected<SessionStats, Error>> outcome;
    bool started = false;
    const Error interrupted{ErrorCode::PipelineAbort, "interrupted"};
    IEventLoop& event_loop = loop;

    if (mode == Mode::Manual) {
        auto controller = parts.MakeFlowController(loop, reporter);
        controller->OnComplete([&](const SessionStats& stats) { outcome = stats; });
        controller->OnError([&](const Error& e) { outcome = std::unexpected(e); });
        event_loop.Defer([&]() {
            started = true;
            if (auto ok = controller->Start(); !ok) outcome = std::unexpected(ok.error());
        });
        loop.RunUntil([&]() {
            if (started && !outcome && g_interrupted.load()) controller->Abort(interrupted);
            return outcome.has_value();
        });
    } else if (mode == Mode::Pipe) {
        auto pipes = parts.MakePipes();
        SessionCounters counters;

        // Pipes do not unwind the chain; every error must abort all parts here
        auto fail = [&](const Error& e) {
            if (outcome) return;
            for (auto& pipe : pipes) pipe->Close();
            parts.AbortAll(e);
            reporter.OnSessionError(e);
            outcome = std::unexpected(e);
        };
        parts.source->OnError(fail);
        if (parts.stage) parts.stage->OnError(fail);
        parts.sink->OnError(fail);

        for (auto& pipe : pipes) {
            pipe->OnViolation(fail);
            pipe->OnBackpressure([&](std::uint64_t offset) {
                reporter.OnBackpressure(counters.RecordBackpressure(offset));
            });
            pipe->OnResume([&]() { reporter.OnResume(counters.stats().backpressure_events); });
            pipe->OnForward([&](std::size_t, std::size_t buffered) {
                counters.SampleBuffered(buffered);
            });
        }
        pipes.front()->OnForward([&](std::size_t bytes, std::size_t buffered) {
            counters.SampleBuffered(buffered);
            if (counters.AddProduced(bytes)) reporter.OnProgress(counters.stats().bytes_produced);
        });
        parts.sink->OnFinish([&]() {
            if (outcome) return;
            counters.SetConsumed(pipes.back()->BytesForwarded());
            SessionStats stats = counters.Snapshot();
            reporter.OnSessionComplete(stats);
            outcome = stats;
        });

        event_loop.Defer([&]() {
            started = true;
            counters.Start();
            parts.Start();
        });
        loop.RunUntil([&]() {
            if (started && !outcome && g_interrupted.load()) fail(interrupted);
            return outcome.has_value();
        });
    } else {
        auto orchestrator = parts.MakeOrchestrator(loop, reporter);
        event_loop.Defer([&]() {
            started = true;
            orchestrator->Run([&](PipelineOrchestrator::Result result) {
                outcome = std::move(result);
            });
        });
        loop.RunUntil([&]() {
            if (started && !outcome && g_interrupted.load()) orchestrator->Cancel();
            return outcome.has_value();
        });
    }
    return std::move(*outcome);
}

int RunTransfer(const TransferParams& params) {
    bool run_manual = params.mode == "manual" || params.mode == "all";
    bool run_pipeline = params.mode == "pipeline" || params.mode == "all";
    bool run_pipe = params.mode == "pipe";
    if (!run_manual && !run_pipeline && !run_pipe) {
        fmt::print(stderr, "Unknown mode: {}\n", params.mode);
        fmt::print("Available modes: manual, pipeline, pipe, all\n");
        return EXIT_FAILURE;
    }

    if (!std::filesystem::exists(params.input)) {
        fmt::print(stderr, "Test file {} does not exist!\n", params.input);
        fmt::print("Run first: chunk_pipe_transfer generate --output {}\n", params.input);
        return EXIT_FAILURE;
    }

    TransferConfig config = params.slow ? TransferConfig::SlowConsumer()
                                        : TransferConfig::Defaults();
    config.chunk_size = static_cast<std::size_t>(params.chunk_size);
    config.high_water_mark = static_cast<std::size_t>(params.high_water_mark);
    if (params.low_water_mark) {
        config.low_water_mark = static_cast<std::size_t>(*params.low_water_mark);
    }
    config.latency = std::chrono::milliseconds{params.latency_ms};
    if (auto valid = config.Validate(); !valid) {
        fmt::print(stderr, "Invalid configuration: {}\n", valid.error().message);
        return EXIT_FAILURE;
    }

    EventLoop loop;
    ConsoleReporter reporter;

    auto run = [&](Mode mode, const char* title, const std::string& output) -> bool {
        reporter.Banner(title, params.input, output, params.slow);
        ReportMemory(reporter, "Memory before start");

        auto reader = FileReader::Open(params.input);
        if (!reader) {
            fmt::print(stderr, "\nError: {}\n", reader.error().message);
            return false;
        }
        auto writer = FileWriter::Open(output);
        if (!writer) {
            fmt::print(stderr, "\nError: {}\n", writer.error().message);
            return false;
        }

        // Session errors are printed by the reporter
        auto result = RunSession(loop, mode, config, std::move(*reader),
                                 std::move(*writer), reporter);
        if (!result) return false;
        ReportMemory(reporter, "Memory after completion");
        return true;
    };

    if (run_manual && !run(Mode::Manual, "Manual flow control (pause/resume)", params.output1)) {
        return EXIT_FAILURE;
    }
    if (run_pipeline && !run(Mode::Pipeline, "Automatic pipeline", params.output2)) {
        return EXIT_FAILURE;
    }
    if (run_pipe && !run(Mode::Pipe, "Bare pipes (caller tears down on error)", params.output2)) {
        return EXIT_FAILURE;
    }

    fmt::print("\nAll operations completed successfully!\n");
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"chunk_pipe_transfer - bounded-memory file transfer with backpressure"};
    app.require_subcommand(1);

    GenerateParams gen;
    auto* generate = app.add_subcommand("generate", "Write a large test file of 'a' bytes");
    generate->add_option("-o,--output", gen.output, "File to create")->default_val(gen.output);
    generate->add_option("--size", gen.size, "Total size (e.g. 100MiB)")
        ->transform(CLI::AsSizeValue(false))->default_str("100MiB");
    generate->add_option("--chunk-size", gen.chunk_size, "Write size per call")
        ->transform(CLI::AsSizeValue(false))->default_str("1MiB");

    TransferParams tp;
    auto* transfer = app.add_subcommand("transfer", "Copy the test file through a transfer session");
    transfer->add_option("-m,--mode", tp.mode, "manual | pipeline | pipe | all")->default_val(tp.mode);
    transfer->add_flag("--slow", tp.slow, "Interpose a latency stage before the sink");
    transfer->add_option("-i,--input", tp.input, "File to read")->default_val(tp.input);
    transfer->add_option("--output1", tp.output1, "Output of the manual mode")->default_val(tp.output1);
    transfer->add_option("--output2", tp.output2, "Output of the pipeline and pipe modes")->default_val(tp.output2);
    transfer->add_option("--chunk-size", tp.chunk_size, "Bytes per chunk")
        ->transform(CLI::AsSizeValue(false))->default_str("64KiB");
    transfer->add_option("--high-water-mark", tp.high_water_mark, "Buffered bytes that pause the producer")
        ->transform(CLI::AsSizeValue(false))->default_str("64KiB");
    transfer->add_option("--low-water-mark", tp.low_water_mark, "Drain threshold (default: high-water mark)")
        ->transform(CLI::AsSizeValue(false));
    transfer->add_option("--latency-ms", tp.latency_ms, "Per-chunk delay in slow mode")
        ->check(CLI::NonNegativeNumber)->default_val(tp.latency_ms);
    app.footer("Press Ctrl+C to abort a running transfer.");

    CLI11_PARSE(app, argc, argv);

    std::signal(SIGINT, OnSignal);

    if (generate->parsed()) return RunGenerate(gen);
    return RunTransfer(tp);
}
