// SPDX-License-Identifier: MIT

// src/session_parts.hpp
#pragma once

#include <memory>
#include <vector>

#include "lib/stream/event_loop.hpp"
#include "src/chunk_sink.hpp"
#include "src/chunk_source.hpp"
#include "src/flow_controller.hpp"
#include "src/latency_stage.hpp"
#include "src/pipe.hpp"
#include "src/pipeline_orchestrator.hpp"
#include "src/resource.hpp"
#include "src/session.hpp"
#include "src/transfer_config.hpp"

namespace chunk_pipe {

// SessionParts - the stages of one transfer, built from a TransferConfig.
//
// The latency stage is present only when config.latency_enabled; it shares
// the sink's water marks.
struct SessionParts {
    std::shared_ptr<ChunkSource> source;
    std::shared_ptr<LatencyStage> stage;
    std::shared_ptr<ChunkSink> sink;

    /// Wire the parts under a manual-mode bridge.
    std::shared_ptr<FlowController> MakeFlowController(IEventLoop& loop,
                                                       SessionObserver& observer) const;

    /// Wire the parts under an automatic-mode bridge.
    std::shared_ptr<PipelineOrchestrator> MakeOrchestrator(IEventLoop& loop,
                                                           SessionObserver& observer) const;

    /// Connect the parts with bare pipes, upstream edge first. Pipes move
    /// chunks and backpressure only. Starting the parts, noticing the sink's
    /// finish and tearing everything down on an error stay with the caller.
    std::vector<std::shared_ptr<Pipe>> MakePipes() const;

    /// Start the latency stage, if any, then the source.
    void Start() const;

    /// Abort every part. Parts already terminated ignore it.
    void AbortAll(const Error& error) const;
};

/// Build the stages for @p config. The config must already be validated.
SessionParts BuildSessionParts(IEventLoop& loop,
                               std::unique_ptr<ReadableResource> input,
                               std::unique_ptr<WritableResource> output,
                               const TransferConfig& config);

}  // namespace chunk_pipe
