// SPDX-License-Identifier: MIT

// src/partition.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>

#include "lib/stream/error.hpp"

namespace stream_sync {

/// Arena index the driver assigns to every discovered partition.
using PartitionId = std::size_t;

/// A discovered unit of work belonging to exactly one stream.
///
/// Partitions are created by a stream's partition generation and consumed
/// by exactly one reading task. Read() runs on a worker thread; every other
/// method must be safe to call from any thread once the partition has been
/// handed to the scheduler.
class Partition {
public:
    /// Receives one record payload. Returns false when the run is stopping;
    /// the partition should then return from Read() promptly.
    using RecordEmitter = std::function<bool(std::string data)>;

    virtual ~Partition() = default;

    /// Name of the owning stream.
    virtual const std::string& stream_name() const = 0;

    /// Stable identity within the owning stream. Equal partitions have equal keys.
    virtual std::string Key() const = 0;

    /// Slice description as JSON object text (used for slice log messages).
    virtual std::string ToSlice() const { return "{}"; }

    /// Human-readable representation for logs.
    virtual std::string ToString() const { return stream_name() + ":" + Key(); }

    /// Produce every record of this partition through @p emit.
    ///
    /// Implementations may also throw; the reading task converts both
    /// failure paths into a ReadFailed error.
    virtual std::expected<void, Error> Read(const RecordEmitter& emit,
                                            std::stop_token stop) = 0;
};

/// Partitions compare equal when they belong to the same stream and share a key.
inline bool operator==(const Partition& a, const Partition& b) {
    return a.stream_name() == b.stream_name() && a.Key() == b.Key();
}

/// Hash consistent with operator==(const Partition&, const Partition&).
struct PartitionHash {
    std::size_t operator()(const Partition& p) const {
        std::size_t h = std::hash<std::string>{}(p.stream_name());
        return h ^ (std::hash<std::string>{}(p.Key()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

}  // namespace stream_sync
