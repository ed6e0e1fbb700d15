// SPDX-License-Identifier: MIT

// src/partition_reader.cpp
#include "src/partition_reader.hpp"

#include <exception>

#include <fmt/format.h>

namespace stream_sync {

void PartitionReader::ProcessPartition(PartitionId id,
                                       const std::shared_ptr<Partition>& partition,
                                       std::stop_token stop) const noexcept {
    try {
        const std::string& stream_name = partition->stream_name();
        const std::string key = partition->Key();

        auto emit = [&](std::string data) {
            if (stop.stop_requested()) return false;
            return queue_->Push(Record{stream_name, key, std::move(data)});
        };

        auto result = partition->Read(emit, stop);
        if (!result) {
            Fail(*partition, result.error().message);
            return;
        }
        if (stop.stop_requested()) return;
        queue_->Push(PartitionCompleted{id, stream_name});
    } catch (const std::exception& e) {
        Fail(*partition, e.what());
    } catch (...) {
        Fail(*partition, "unknown exception");
    }
}

void PartitionReader::Fail(const Partition& partition, std::string_view cause) const noexcept {
    try {
        queue_->Push(TaskFailed{Error{ErrorCode::ReadFailed,
            fmt::format("reading partition {} failed: {}", partition.ToString(), cause)}});
    } catch (const std::exception&) {
        // The failure cannot be reported; closing the queue still ends the run.
        queue_->Close();
    }
}

}  // namespace stream_sync
