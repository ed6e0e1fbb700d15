// SPDX-License-Identifier: MIT

// src/partition_tracker.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <unordered_map>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/partition.hpp"

namespace stream_sync {

/// Driver-owned arena of partition completion state, keyed by stream.
///
/// A stream is done only when its generation finished and every partition
/// registered under it was marked done. Not thread-safe: owned and used by
/// the driver thread alone.
class PartitionTracker {
public:
    /// Start tracking a stream. Adding an existing stream is a no-op.
    void AddStream(const std::string& stream);

    /// Register a newly discovered partition as not done.
    /// @return the partition's arena id, or InvalidState for an unknown stream
    std::expected<PartitionId, Error> RegisterPartition(const std::string& stream);

    /// Mark a partition done.
    /// @return false when the id is unknown or was already done
    bool MarkPartitionDone(PartitionId id);

    void MarkGenerationDone(const std::string& stream);

    bool IsGenerationDone(const std::string& stream) const;

    /// True when generation finished and every partition is done.
    bool IsStreamDone(const std::string& stream) const;

    /// True when every registered partition of every stream is done.
    bool AllPartitionsDone() const;

    /// Owning stream of a registered partition, or nullptr for unknown ids.
    const std::string* StreamOf(PartitionId id) const;

    std::size_t PartitionCount(const std::string& stream) const;
    std::size_t OpenPartitionCount(const std::string& stream) const;

private:
    struct StreamPartitions {
        std::unordered_map<PartitionId, bool> done;
        std::size_t open = 0;
        bool generation_done = false;
    };

    std::unordered_map<std::string, StreamPartitions> streams_;
    std::vector<std::string> owners_;   // indexed by PartitionId
    std::size_t open_total_ = 0;
};

}  // namespace stream_sync
