// SPDX-License-Identifier: MIT

// src/chunk_source.cpp
#include "src/chunk_source.hpp"

#include <utility>
#include <vector>

namespace chunk_pipe {

std::shared_ptr<ChunkSource> ChunkSource::Create(
    IEventLoop& loop,
    std::unique_ptr<ReadableResource> resource,
    std::size_t chunk_size,
    std::string name) {
    return std::make_shared<ChunkSource>(PrivateTag{}, loop, std::move(resource),
                                         chunk_size, std::move(name));
}

ChunkSource::ChunkSource(PrivateTag, IEventLoop& loop,
                         std::unique_ptr<ReadableResource> resource,
                         std::size_t chunk_size, std::string name)
    : loop_(loop),
      resource_(std::move(resource)),
      chunk_size_(chunk_size),
      name_(std::move(name)) {}

ChunkSource::~ChunkSource() {
    CloseResource();
}

void ChunkSource::Start() {
    if (started_ || IsTerminated()) return;
    started_ = true;
    ScheduleRead();
}

void ChunkSource::Resume() {
    if (!suspended_) return;
    suspended_ = false;
    if (started_) ScheduleRead();
}

void ChunkSource::Abort(const Error& /*reason*/) {
    if (IsTerminated()) return;
    aborted_ = true;
    CloseResource();
}

void ChunkSource::ScheduleRead() {
    if (read_scheduled_ || suspended_ || IsTerminated()) return;
    read_scheduled_ = true;

    std::weak_ptr<ChunkSource> weak_self = shared_from_this();
    loop_.Defer([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->ReadOnce();
        }
    });
}

void ChunkSource::ReadOnce() {
    read_scheduled_ = false;
    if (suspended_ || IsTerminated()) return;

    // Handlers may drop the last external reference
    auto self = shared_from_this();

    std::vector<std::byte> buf(chunk_size_);
    auto n = resource_->Read(buf);
    if (!n) {
        failed_ = true;
        CloseResource();
        EmitError(n.error());
        return;
    }

    if (*n == 0) {
        ended_ = true;
        CloseResource();
        EmitEnd();
        return;
    }

    buf.resize(*n);
    Chunk chunk(std::move(buf), offset_);
    offset_ += *n;
    EmitChunk(std::move(chunk));

    // The handler may have suspended or aborted us
    ScheduleRead();
}

void ChunkSource::CloseResource() {
    if (resource_ && !resource_->IsClosed()) {
        resource_->Close();
    }
}

}  // namespace chunk_pipe
