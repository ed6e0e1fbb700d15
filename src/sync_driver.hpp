// SPDX-License-Identifier: MIT

// src/sync_driver.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <spdlog/logger.h>

#include "lib/stream/error.hpp"
#include "lib/stream/worker_pool.hpp"
#include "src/event_timer.hpp"
#include "src/message.hpp"
#include "src/message_repository.hpp"
#include "src/message_sink.hpp"
#include "src/partition_enqueuer.hpp"
#include "src/partition_reader.hpp"
#include "src/partition_tracker.hpp"
#include "src/queue_item.hpp"
#include "src/slice_logger.hpp"
#include "src/stream.hpp"
#include "src/sync_config.hpp"

namespace stream_sync {

/// Outcome of a successful run.
struct SyncSummary {
    std::map<std::string, uint64_t> record_counts;      ///< Records read per stream
    std::map<std::string, StreamStatus> final_status;   ///< Terminal status per stream
    uint64_t total_records = 0;
    std::string timing_report;                          ///< EventTimer::Report() text
};

/// Single-threaded coordinator of one concurrent sync.
///
/// The driver owns every piece of scheduling state. Worker tasks only push
/// items onto the shared queue; the driver consumes them serially, submits
/// follow-up work, tracks completion and writes the ordered output to the
/// sink.
///
/// Stream lifecycle, each transition emitted at most once:
///   STARTED -> RUNNING -> { COMPLETE | INCOMPLETE }
///
/// - STARTED when the stream's generation task is submitted. At most
///   max_concurrent_partition_generators streams are in discovery at once.
/// - RUNNING on the stream's first record.
/// - COMPLETE once generation finished and every discovered partition was
///   read.
/// - INCOMPLETE for every started, unfinished stream when the run aborts.
///
/// The first TaskFailed item, a cursor exception or a queue stall aborts the
/// run: pending tasks are dropped, running ones are asked to stop, INCOMPLETE
/// is emitted, the timing summary is logged and the error is returned.
///
/// Abort never waits for running tasks: a task that ignores its stop token
/// keeps its worker thread until it returns, but Run() and the destructor
/// return without it.
///
/// A driver runs once. Create a new one per sync.
class SyncDriver {
public:
    /// @param streams  Eligible streams in the order discovery should start
    SyncDriver(SyncConfig config,
               std::vector<std::shared_ptr<Stream>> streams,
               MessageRepository& repository,
               std::shared_ptr<spdlog::logger> logger,
               std::string name = "stream_sync");

    ~SyncDriver();

    SyncDriver(const SyncDriver&) = delete;
    SyncDriver& operator=(const SyncDriver&) = delete;
    SyncDriver(SyncDriver&&) = delete;
    SyncDriver& operator=(SyncDriver&&) = delete;

    /// Run the sync to completion, delivering output to @p sink.
    /// @return the run summary, or the error that aborted the run
    std::expected<SyncSummary, Error> Run(MessageSink& sink);

private:
    using Status = std::expected<void, Error>;

    Status Loop(MessageSink& sink);
    Status Dispatch(QueueItem&& item, MessageSink& sink);

    Status OnRecord(Record&& record, MessageSink& sink);
    Status OnPartitionDiscovered(PartitionDiscovered&& item);
    Status OnPartitionCompleted(const PartitionCompleted& item, MessageSink& sink);
    Status OnGenerationCompleted(const GenerationCompleted& item, MessageSink& sink);

    Status StartPendingGenerators(MessageSink& sink);
    void FinalizeStream(const std::string& stream, MessageSink& sink);
    Error Abort(Error error, MessageSink& sink);
    SyncSummary Finish();

    void Emit(MessageSink& sink, const std::string& stream, StreamStatus status);
    void DrainRepository(MessageSink& sink);
    bool IsInProgress(const std::string& stream) const;
    void WaitForOutstandingTasks();

    // Configuration and collaborators
    const SyncConfig config_;
    const std::string name_;
    std::vector<std::shared_ptr<Stream>> streams_;
    std::unordered_map<std::string, std::shared_ptr<Stream>> stream_by_name_;
    MessageRepository& repository_;
    std::shared_ptr<spdlog::logger> logger_;
    SliceLogger slice_logger_;

    // Per-run coordination
    std::shared_ptr<ItemQueue> queue_;
    PartitionEnqueuer enqueuer_;
    PartitionReader reader_;
    std::unique_ptr<WorkerPool> pool_;
    std::vector<TaskHandle> outstanding_tasks_;

    // Per-run state, driver thread only
    PartitionTracker tracker_;
    std::vector<std::shared_ptr<Partition>> partitions_;   // indexed by PartitionId
    std::deque<std::shared_ptr<Stream>> pending_generators_;
    std::unordered_set<std::string> running_generators_;
    std::vector<std::string> streams_in_progress_;          // in STARTED order
    std::map<std::string, uint64_t> record_counts_;
    std::map<std::string, StreamStatus> statuses_;
    uint64_t total_records_ = 0;
    EventTimer timer_;
    bool ran_ = false;
};

}  // namespace stream_sync
