// SPDX-License-Identifier: MIT

// src/partition_enqueuer.hpp
#pragma once

#include <memory>
#include <stop_token>
#include <string_view>

#include "src/queue_item.hpp"
#include "src/stream.hpp"

namespace stream_sync {

/// Partition generation task body.
///
/// Pushes one PartitionDiscovered per partition, then exactly one
/// GenerationCompleted. On failure a TaskFailed is pushed instead of the
/// sentinel, or the queue is closed when even that cannot be pushed. When a
/// stop is requested the task returns without a sentinel. Never throws.
class PartitionEnqueuer {
public:
    explicit PartitionEnqueuer(std::shared_ptr<ItemQueue> queue)
        : queue_(std::move(queue)) {}

    void GeneratePartitions(const std::shared_ptr<Stream>& stream,
                            std::stop_token stop) const noexcept;

private:
    void Fail(const Stream& stream, std::string_view cause) const noexcept;

    std::shared_ptr<ItemQueue> queue_;
};

}  // namespace stream_sync
