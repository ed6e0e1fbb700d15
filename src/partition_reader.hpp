// SPDX-License-Identifier: MIT

// src/partition_reader.hpp
#pragma once

#include <memory>
#include <stop_token>
#include <string_view>

#include "src/queue_item.hpp"

namespace stream_sync {

/// Partition reading task body.
///
/// Pushes one Record per payload the partition produces, then exactly one
/// PartitionCompleted carrying the driver-assigned id. On failure a
/// TaskFailed is pushed instead of the sentinel, or the queue is closed when
/// even that cannot be pushed. When a stop is requested the task returns
/// without a sentinel. Never throws.
class PartitionReader {
public:
    explicit PartitionReader(std::shared_ptr<ItemQueue> queue)
        : queue_(std::move(queue)) {}

    void ProcessPartition(PartitionId id,
                          const std::shared_ptr<Partition>& partition,
                          std::stop_token stop) const noexcept;

private:
    void Fail(const Partition& partition, std::string_view cause) const noexcept;

    std::shared_ptr<ItemQueue> queue_;
};

}  // namespace stream_sync
