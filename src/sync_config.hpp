// SPDX-License-Identifier: MIT

// src/sync_config.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <thread>

#include "lib/stream/error.hpp"

namespace stream_sync {

/// Scheduling knobs for one concurrent sync.
struct SyncConfig {
    /// Worker pool size (generation and reading tasks combined).
    std::size_t max_workers = std::max(1u, std::thread::hardware_concurrency());

    /// Streams allowed in partition discovery at once. Discovery is serialized
    /// by default while reading runs on the whole pool.
    std::size_t max_concurrent_partition_generators = 1;

    /// Maximum gap between two queue items before the run is declared stalled.
    /// Reset on every item; it is not a deadline for the whole run.
    std::chrono::milliseconds queue_timeout{std::chrono::seconds(900)};

    /// Bound on the shared queue (0 = unbounded). Producers block when full.
    std::size_t queue_capacity = 0;

    /// Fail the run when a configured stream is missing instead of skipping it.
    bool raise_exception_on_missing_stream = true;

    /// Emit slice log messages for every discovered partition.
    bool log_slices = false;
};

/// Reject configurations the scheduler cannot run with.
std::expected<void, Error> ValidateSyncConfig(const SyncConfig& config);

/// Parse a JSON config object. Unknown keys are ignored; absent keys keep
/// their defaults. The result is validated.
///
/// Keys: max_workers, max_concurrent_partition_generators, timeout_seconds,
/// queue_capacity, raise_exception_on_missing_stream, log_slices.
std::expected<SyncConfig, Error> ParseSyncConfig(std::string_view json);

/// Load a whole file into memory.
std::expected<std::string, Error> ReadTextFile(const std::string& path);

}  // namespace stream_sync
