// SPDX-License-Identifier: MIT

// src/stream.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "lib/stream/error.hpp"
#include "src/cursor.hpp"
#include "src/partition.hpp"

namespace stream_sync {

/// Result of a stream's availability check.
struct StreamAvailability {
    bool available = true;
    std::string reason;   ///< Why the stream is unavailable (empty when available)

    static StreamAvailability Available() { return {}; }
    static StreamAvailability Unavailable(std::string reason) {
        return StreamAvailability{false, std::move(reason)};
    }
};

/// A named, namespaced unit of synchronization.
///
/// Streams are created before a run and outlive it. GeneratePartitions()
/// runs on a worker thread; cursor() is only touched by the driver thread.
class Stream {
public:
    /// Receives one discovered partition. Returns false when the run is
    /// stopping; generation should then return promptly.
    using PartitionEmitter = std::function<bool(std::shared_ptr<Partition>)>;

    virtual ~Stream() = default;

    virtual const std::string& name() const = 0;
    virtual const std::optional<std::string>& stream_namespace() const = 0;

    /// Decide whether the stream can be read at all.
    virtual StreamAvailability CheckAvailability() { return StreamAvailability::Available(); }

    /// Discover every partition of the stream through @p emit.
    ///
    /// Implementations may also throw; the generation task converts both
    /// failure paths into a DiscoveryFailed error.
    virtual std::expected<void, Error> GeneratePartitions(const PartitionEmitter& emit,
                                                          std::stop_token stop) = 0;

    virtual Cursor& cursor() = 0;
};

}  // namespace stream_sync
