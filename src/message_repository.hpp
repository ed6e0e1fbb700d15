// SPDX-License-Identifier: MIT

// src/message_repository.hpp
#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "src/message.hpp"

namespace stream_sync {

/// FIFO side channel for ancillary messages (slice logs, state checkpoints).
///
/// The driver drains it every time it yields output so buffered messages
/// are delivered right after the record or status that caused them.
class MessageRepository {
public:
    virtual ~MessageRepository() = default;

    /// Buffer a message for later delivery.
    virtual void Emit(OutputMessage message) = 0;

    /// Remove and return every buffered message in emission order.
    virtual std::vector<OutputMessage> ConsumeQueue() = 0;
};

/// Thread-safe in-memory repository. Emit() may be called from worker threads.
class InMemoryMessageRepository : public MessageRepository {
public:
    void Emit(OutputMessage message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::move(message));
    }

    std::vector<OutputMessage> ConsumeQueue() override {
        std::deque<OutputMessage> drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drained.swap(messages_);
        }
        return {std::make_move_iterator(drained.begin()),
                std::make_move_iterator(drained.end())};
    }

private:
    std::mutex mutex_;
    std::deque<OutputMessage> messages_;
};

}  // namespace stream_sync
