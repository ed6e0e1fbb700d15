// SPDX-License-Identifier: MIT

// src/queue_item.hpp
#pragma once

#include <memory>
#include <string>
#include <variant>

#include "lib/stream/blocking_queue.hpp"
#include "lib/stream/error.hpp"
#include "src/partition.hpp"
#include "src/record.hpp"

namespace stream_sync {

/// A generation task discovered a partition.
struct PartitionDiscovered {
    std::shared_ptr<Partition> partition;
};

/// Sentinel: a reading task produced every record of a partition.
struct PartitionCompleted {
    PartitionId id;
    std::string stream_name;
};

/// Sentinel: a generation task discovered every partition of a stream.
struct GenerationCompleted {
    std::string stream_name;
};

/// A task failed; the driver aborts the run.
struct TaskFailed {
    Error error;
};

/// Closed set of items flowing from worker tasks to the driver.
using QueueItem = std::variant<Record,
                               PartitionDiscovered,
                               PartitionCompleted,
                               GenerationCompleted,
                               TaskFailed>;

using ItemQueue = BlockingQueue<QueueItem>;

}  // namespace stream_sync
