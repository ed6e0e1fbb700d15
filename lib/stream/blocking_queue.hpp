// SPDX-License-Identifier: MIT

// lib/stream/blocking_queue.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace stream_sync {

/// Multi-producer, single-consumer queue with a timed blocking pop.
///
/// Capacity 0 means unbounded. With a bound, Push() blocks while the queue
/// is full. Close() wakes every blocked producer and consumer; items pushed
/// after Close() are dropped and Push() returns false.
///
/// Items pushed by the same producer thread are popped in push order.
template <typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /// Append an item, waiting for room when bounded.
    /// @return false if the queue was closed and the item was dropped
    bool Push(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || HasRoom(); });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Pop the oldest item, waiting at most @p timeout for one to arrive.
    /// @return std::nullopt on timeout or when closed and empty
    std::optional<T> PopFor(std::chrono::milliseconds timeout) {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout,
                                     [this] { return closed_ || !items_.empty(); })) {
                return std::nullopt;
            }
            if (items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /// Pop without waiting.
    std::optional<T> TryPop() {
        std::optional<T> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /// Reject further pushes and release every waiter.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    bool HasRoom() const { return capacity_ == 0 || items_.size() < capacity_; }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace stream_sync
