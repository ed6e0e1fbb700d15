// SPDX-License-Identifier: MIT

// src/partition_enqueuer.cpp
#include "src/partition_enqueuer.hpp"

#include <exception>

#include <fmt/format.h>

namespace stream_sync {

void PartitionEnqueuer::GeneratePartitions(const std::shared_ptr<Stream>& stream,
                                           std::stop_token stop) const noexcept {
    try {
        auto emit = [this, &stop](std::shared_ptr<Partition> partition) {
            if (stop.stop_requested()) return false;
            return queue_->Push(PartitionDiscovered{std::move(partition)});
        };

        auto result = stream->GeneratePartitions(emit, stop);
        if (!result) {
            Fail(*stream, result.error().message);
            return;
        }
        if (stop.stop_requested()) return;
        queue_->Push(GenerationCompleted{stream->name()});
    } catch (const std::exception& e) {
        Fail(*stream, e.what());
    } catch (...) {
        Fail(*stream, "unknown exception");
    }
}

void PartitionEnqueuer::Fail(const Stream& stream, std::string_view cause) const noexcept {
    try {
        queue_->Push(TaskFailed{Error{ErrorCode::DiscoveryFailed,
            fmt::format("partition generation for stream {} failed: {}", stream.name(), cause)}});
    } catch (const std::exception&) {
        // The failure cannot be reported; closing the queue still ends the run.
        queue_->Close();
    }
}

}  // namespace stream_sync
