// SPDX-License-Identifier: MIT

// src/sync_driver.cpp
#include "src/sync_driver.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lib/stream/overloaded.hpp"

namespace stream_sync {

namespace {

// Run a cursor callback on the driver thread, converting exceptions.
template <typename F>
std::expected<void, Error> GuardCursor(std::string_view operation,
                                       const std::string& stream, F&& fn) {
    try {
        std::forward<F>(fn)();
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(Error{ErrorCode::CursorFailed,
            fmt::format("cursor {} for stream {} failed: {}", operation, stream, e.what())});
    } catch (...) {
        return std::unexpected(Error{ErrorCode::CursorFailed,
            fmt::format("cursor {} for stream {} failed: unknown exception", operation, stream)});
    }
}

}  // namespace

SyncDriver::SyncDriver(SyncConfig config,
                       std::vector<std::shared_ptr<Stream>> streams,
                       MessageRepository& repository,
                       std::shared_ptr<spdlog::logger> logger,
                       std::string name)
    : config_(std::move(config)),
      name_(std::move(name)),
      streams_(std::move(streams)),
      repository_(repository),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      slice_logger_(config_.log_slices),
      queue_(std::make_shared<ItemQueue>(config_.queue_capacity)),
      enqueuer_(queue_),
      reader_(queue_),
      timer_(name_) {
    for (const auto& stream : streams_) {
        const std::string& stream_name = stream->name();
        if (!stream_by_name_.emplace(stream_name, stream).second) {
            logger_->warn("Stream {} is listed more than once; reading it once", stream_name);
            continue;
        }
        tracker_.AddStream(stream_name);
        record_counts_.emplace(stream_name, 0);
        pending_generators_.push_back(stream);
    }
}

SyncDriver::~SyncDriver() {
    if (pool_) pool_->CancelPendingAndStop();
    queue_->Close();
    pool_.reset();  // detaches workers still inside a task; they own what they touch
}

std::expected<SyncSummary, Error> SyncDriver::Run(MessageSink& sink) {
    if (ran_) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            "sync driver " + name_ + " already ran"});
    }
    ran_ = true;

    if (auto valid = ValidateSyncConfig(config_); !valid) {
        return std::unexpected(valid.error());
    }
    pool_ = std::make_unique<WorkerPool>(config_.max_workers, "workerpool");

    if (auto looped = Loop(sink); !looped) {
        return std::unexpected(Abort(std::move(looped.error()), sink));
    }

    WaitForOutstandingTasks();
    return Finish();
}

SyncDriver::Status SyncDriver::Loop(MessageSink& sink) {
    if (auto started = StartPendingGenerators(sink); !started) {
        return started;
    }

    while (!streams_in_progress_.empty() || !pending_generators_.empty()) {
        std::optional<QueueItem> item = queue_->PopFor(config_.queue_timeout);
        if (!item && queue_->IsClosed()) {
            return std::unexpected(Error{ErrorCode::Stalled,
                "task queue closed by a task that could not report its failure"});
        }
        if (!item) {
            return std::unexpected(Error{ErrorCode::Stalled, fmt::format(
                "no queue item received within {} ms; producers stopped without "
                "reporting completion", config_.queue_timeout.count())});
        }
        if (auto handled = Dispatch(std::move(*item), sink); !handled) {
            return handled;
        }
    }
    return {};
}

SyncDriver::Status SyncDriver::Dispatch(QueueItem&& item, MessageSink& sink) {
    return std::visit(Overloaded{
        [&](Record& record) -> Status {
            return OnRecord(std::move(record), sink);
        },
        [&](PartitionDiscovered& discovered) -> Status {
            return OnPartitionDiscovered(std::move(discovered));
        },
        [&](PartitionCompleted& completed) -> Status {
            return OnPartitionCompleted(completed, sink);
        },
        [&](GenerationCompleted& completed) -> Status {
            return OnGenerationCompleted(completed, sink);
        },
        [&](TaskFailed& failed) -> Status {
            return std::unexpected(std::move(failed.error));
        },
    }, item);
}

SyncDriver::Status SyncDriver::OnRecord(Record&& record, MessageSink& sink) {
    auto it = stream_by_name_.find(record.stream_name);
    if (it == stream_by_name_.end()) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            "record received for unknown stream " + record.stream_name});
    }
    const std::shared_ptr<Stream>& stream = it->second;
    const std::string& stream_name = stream->name();

    uint64_t& count = record_counts_[stream_name];
    if (count == 0) {
        logger_->info("Marking stream {} as RUNNING", stream_name);
        statuses_[stream_name] = StreamStatus::Running;
        Emit(sink, stream_name, StreamStatus::Running);
    }
    ++count;
    ++total_records_;

    sink.OnMessage(ToRecordMessage(stream_name, stream->stream_namespace(), record.data));

    auto observed = GuardCursor("observe", stream_name,
                                [&] { stream->cursor().Observe(record); });
    if (!observed) return observed;

    DrainRepository(sink);
    return {};
}

SyncDriver::Status SyncDriver::OnPartitionDiscovered(PartitionDiscovered&& item) {
    std::shared_ptr<Partition> partition = std::move(item.partition);
    if (!partition) {
        return std::unexpected(Error{ErrorCode::InvalidState, "null partition discovered"});
    }

    auto id = tracker_.RegisterPartition(partition->stream_name());
    if (!id) return std::unexpected(id.error());
    partitions_.push_back(partition);

    if (slice_logger_.ShouldLogSliceMessage(*logger_)) {
        repository_.Emit(slice_logger_.CreateSliceLogMessage(*partition));
    }

    auto handle = pool_->Submit(
        [reader = reader_, id = *id, partition](std::stop_token stop) {
            reader.ProcessPartition(id, partition, stop);
        });
    if (!handle) return std::unexpected(handle.error());
    outstanding_tasks_.push_back(std::move(*handle));
    return {};
}

SyncDriver::Status SyncDriver::OnPartitionCompleted(const PartitionCompleted& item,
                                                    MessageSink& sink) {
    if (!tracker_.MarkPartitionDone(item.id)) {
        logger_->warn("Ignoring duplicate completion of partition {} for stream {}",
                      item.id, item.stream_name);
        return {};
    }

    const std::shared_ptr<Partition>& partition = partitions_[item.id];
    const std::string& stream_name = *tracker_.StreamOf(item.id);
    const std::shared_ptr<Stream>& stream = stream_by_name_.at(stream_name);

    auto closed = GuardCursor("close_partition", stream_name,
                              [&] { stream->cursor().ClosePartition(*partition); });
    if (!closed) return closed;
    DrainRepository(sink);  // checkpoints precede the stream's COMPLETE

    if (tracker_.IsStreamDone(stream_name) && IsInProgress(stream_name)) {
        FinalizeStream(stream_name, sink);
    }
    return {};
}

SyncDriver::Status SyncDriver::OnGenerationCompleted(const GenerationCompleted& item,
                                                     MessageSink& sink) {
    const std::string& stream_name = item.stream_name;
    if (running_generators_.erase(stream_name) == 0) {
        logger_->warn("Ignoring duplicate generation completion for stream {}", stream_name);
        return {};
    }
    tracker_.MarkGenerationDone(stream_name);

    // Covers streams without partitions and streams whose partitions were
    // all read before discovery finished.
    if (tracker_.IsStreamDone(stream_name) && IsInProgress(stream_name)) {
        FinalizeStream(stream_name, sink);
    }
    return StartPendingGenerators(sink);
}

SyncDriver::Status SyncDriver::StartPendingGenerators(MessageSink& sink) {
    while (running_generators_.size() < config_.max_concurrent_partition_generators &&
           !pending_generators_.empty()) {
        std::shared_ptr<Stream> stream = std::move(pending_generators_.front());
        pending_generators_.pop_front();

        auto handle = pool_->Submit(
            [enqueuer = enqueuer_, stream](std::stop_token stop) {
                enqueuer.GeneratePartitions(stream, stop);
            });
        if (!handle) return std::unexpected(handle.error());
        outstanding_tasks_.push_back(std::move(*handle));

        const std::string& stream_name = stream->name();
        running_generators_.insert(stream_name);
        streams_in_progress_.push_back(stream_name);
        statuses_[stream_name] = StreamStatus::Started;
        timer_.StartEvent(stream_name);

        logger_->info("Marking stream {} as STARTED", stream_name);
        logger_->info("Syncing stream: {}", stream_name);
        Emit(sink, stream_name, StreamStatus::Started);
    }
    return {};
}

void SyncDriver::FinalizeStream(const std::string& stream, MessageSink& sink) {
    std::string stream_name = stream;
    std::erase(streams_in_progress_, stream_name);
    statuses_[stream_name] = StreamStatus::Complete;
    timer_.FinishEvent(stream_name);

    logger_->info("Read {} records from {} stream", record_counts_[stream_name], stream_name);
    logger_->info("Marking stream {} as STOPPED", stream_name);
    logger_->info("Finished syncing {}", stream_name);

    Emit(sink, stream_name, StreamStatus::Complete);
    DrainRepository(sink);
}

Error SyncDriver::Abort(Error error, MessageSink& sink) {
    logger_->error("Sync {} aborted ({}): {}", name_, error_code_name(error.code), error.message);

    if (pool_) pool_->CancelPendingAndStop();
    queue_->Close();

    std::vector<std::string> unfinished;
    unfinished.swap(streams_in_progress_);
    for (const std::string& stream_name : unfinished) {
        statuses_[stream_name] = StreamStatus::Incomplete;
        timer_.FinishEvent(stream_name);
        logger_->info("Marking stream {} as STOPPED", stream_name);
        logger_->info("Finished syncing {}", stream_name);
        Emit(sink, stream_name, StreamStatus::Incomplete);
    }
    DrainRepository(sink);

    logger_->info("{}", timer_.Report());
    return error;
}

SyncSummary SyncDriver::Finish() {
    pool_->Shutdown();

    SyncSummary summary{
        .record_counts = record_counts_,
        .final_status = statuses_,
        .total_records = total_records_,
        .timing_report = timer_.Report(),
    };
    logger_->info("{}", summary.timing_report);
    return summary;
}

void SyncDriver::Emit(MessageSink& sink, const std::string& stream, StreamStatus status) {
    sink.OnMessage(ToStatusMessage(stream, stream_by_name_.at(stream)->stream_namespace(), status));
}

void SyncDriver::DrainRepository(MessageSink& sink) {
    for (OutputMessage& message : repository_.ConsumeQueue()) {
        sink.OnMessage(std::move(message));
    }
}

bool SyncDriver::IsInProgress(const std::string& stream) const {
    return std::find(streams_in_progress_.begin(), streams_in_progress_.end(), stream) !=
           streams_in_progress_.end();
}

void SyncDriver::WaitForOutstandingTasks() {
    // Every task already pushed its final sentinel; this only waits for the
    // worker to return from it.
    for (const TaskHandle& handle : outstanding_tasks_) {
        handle.Wait();
    }
    outstanding_tasks_.clear();
}

}  // namespace stream_sync
