// SPDX-License-Identifier: MIT

// src/message_sink.hpp
#pragma once

#include <atomic>
#include <functional>
#include <vector>

#include "src/message.hpp"

namespace stream_sync {

/// Destination of the driver's ordered output.
///
/// OnMessage() is only ever called from the thread running the sync.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    /// Receive the next output message.
    virtual void OnMessage(OutputMessage&& message) = 0;
};

/// Sink that forwards every message to a user callback.
///
/// Guarded by an atomic validity flag: once Invalidate() is called,
/// subsequent messages are silently dropped.
class CallbackMessageSink : public MessageSink {
public:
    explicit CallbackMessageSink(std::function<void(OutputMessage&&)> on_message)
        : on_message_(std::move(on_message)) {}

    void OnMessage(OutputMessage&& message) override {
        if (valid_.load(std::memory_order_acquire)) on_message_(std::move(message));
    }

    /// Atomically disable all future dispatches.
    void Invalidate() { valid_.store(false, std::memory_order_release); }

private:
    std::function<void(OutputMessage&&)> on_message_;
    std::atomic<bool> valid_{true};
};

/// Sink that keeps every message in arrival order.
class CollectingMessageSink : public MessageSink {
public:
    void OnMessage(OutputMessage&& message) override {
        messages_.push_back(std::move(message));
    }

    const std::vector<OutputMessage>& messages() const { return messages_; }

private:
    std::vector<OutputMessage> messages_;
};

}  // namespace stream_sync
