// SPDX-License-Identifier: MIT

// src/session_parts.cpp
#include "src/session_parts.hpp"

#include <utility>
#include <vector>

namespace chunk_pipe {

SessionParts BuildSessionParts(IEventLoop& loop,
                               std::unique_ptr<ReadableResource> input,
                               std::unique_ptr<WritableResource> output,
                               const TransferConfig& config) {
    SessionParts parts;
    parts.source = ChunkSource::Create(loop, std::move(input), config.chunk_size);
    if (config.latency_enabled) {
        parts.stage = LatencyStage::Create(loop, config.latency, config.high_water_mark,
                                           config.LowWaterMark());
    }
    parts.sink = ChunkSink::Create(loop, std::move(output), config.high_water_mark,
                                   config.LowWaterMark());
    return parts;
}

std::shared_ptr<FlowController> SessionParts::MakeFlowController(
    IEventLoop& loop, SessionObserver& observer) const {
    return FlowController::Create(loop, source, sink, observer, stage);
}

std::shared_ptr<PipelineOrchestrator> SessionParts::MakeOrchestrator(
    IEventLoop& loop, SessionObserver& observer) const {
    std::vector<std::shared_ptr<ChunkTransform>> stages;
    if (stage) stages.push_back(stage);
    return PipelineOrchestrator::Create(loop, source, sink, observer, std::move(stages));
}

std::vector<std::shared_ptr<Pipe>> SessionParts::MakePipes() const {
    if (!stage) return {Pipe::Create(source, sink)};
    return {Pipe::Create(source, stage), Pipe::Create(stage, sink)};
}

void SessionParts::Start() const {
    if (stage) stage->Start();
    source->Start();
}

void SessionParts::AbortAll(const Error& error) const {
    source->Abort(error);
    if (stage) stage->Abort(error);
    sink->Abort(error);
}

}  // namespace chunk_pipe
