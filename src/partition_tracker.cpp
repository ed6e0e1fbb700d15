// SPDX-License-Identifier: MIT

// src/partition_tracker.cpp
#include "src/partition_tracker.hpp"

namespace stream_sync {

void PartitionTracker::AddStream(const std::string& stream) {
    streams_.try_emplace(stream);
}

std::expected<PartitionId, Error> PartitionTracker::RegisterPartition(const std::string& stream) {
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            "partition discovered for untracked stream " + stream});
    }
    PartitionId id = owners_.size();
    owners_.push_back(stream);
    it->second.done.emplace(id, false);
    ++it->second.open;
    ++open_total_;
    return id;
}

bool PartitionTracker::MarkPartitionDone(PartitionId id) {
    if (id >= owners_.size()) return false;
    auto& partitions = streams_.at(owners_[id]);
    auto it = partitions.done.find(id);
    if (it == partitions.done.end() || it->second) return false;
    it->second = true;
    --partitions.open;
    --open_total_;
    return true;
}

void PartitionTracker::MarkGenerationDone(const std::string& stream) {
    auto it = streams_.find(stream);
    if (it != streams_.end()) it->second.generation_done = true;
}

bool PartitionTracker::IsGenerationDone(const std::string& stream) const {
    auto it = streams_.find(stream);
    return it != streams_.end() && it->second.generation_done;
}

bool PartitionTracker::IsStreamDone(const std::string& stream) const {
    auto it = streams_.find(stream);
    return it != streams_.end() && it->second.generation_done && it->second.open == 0;
}

bool PartitionTracker::AllPartitionsDone() const {
    return open_total_ == 0;
}

const std::string* PartitionTracker::StreamOf(PartitionId id) const {
    if (id >= owners_.size()) return nullptr;
    return &owners_[id];
}

std::size_t PartitionTracker::PartitionCount(const std::string& stream) const {
    auto it = streams_.find(stream);
    return it == streams_.end() ? 0 : it->second.done.size();
}

std::size_t PartitionTracker::OpenPartitionCount(const std::string& stream) const {
    auto it = streams_.find(stream);
    return it == streams_.end() ? 0 : it->second.open;
}

}  // namespace stream_sync
