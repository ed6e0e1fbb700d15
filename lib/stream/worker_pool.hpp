// SPDX-License-Identifier: MIT

// lib/stream/worker_pool.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "lib/stream/error.hpp"

namespace stream_sync {

/// Lifecycle of a submitted task.
enum class TaskState {
    Pending,    ///< Accepted, waiting for a free worker
    Running,    ///< Executing on a worker thread
    Finished,   ///< Returned normally
    Cancelled,  ///< Dropped before it started
};

/// Shared view of a submitted task, returned by WorkerPool::Submit().
///
/// Copies refer to the same task. A default-constructed handle refers to
/// nothing and reports itself done.
class TaskHandle {
public:
    TaskHandle() = default;

    TaskState state() const;

    /// Return true once the task finished or was cancelled.
    bool IsDone() const;

    /// Block until IsDone().
    void Wait() const;

private:
    friend class WorkerPool;

    struct Control {
        mutable std::mutex mutex;
        std::condition_variable cv;
        TaskState state = TaskState::Pending;
    };

    explicit TaskHandle(std::shared_ptr<Control> control)
        : control_(std::move(control)) {}

    static void Transition(Control& control, TaskState state);

    std::shared_ptr<Control> control_;
};

/// Fixed-size pool of worker threads executing submitted tasks in FIFO order.
///
/// At most max_workers() tasks run at any instant. Submit() never blocks on
/// task execution. CancelPendingAndStop() is advisory for work that has not
/// started (it is dropped and its handle reports Cancelled) and cooperative
/// for work that has: running tasks observe the stop request through the
/// std::stop_token they receive and are never interrupted.
///
/// Workers own the pool's shared state, so a pool may be destroyed while a
/// task is still running. Only Shutdown() waits for the workers; the
/// destructor detaches any that are still busy. Tasks must therefore own
/// (not borrow) whatever they touch after a stop request.
///
/// Tasks must not throw; callers wrap fallible work and report failures
/// through their own channel.
///
/// Thread safety: every public method may be called from any thread.
class WorkerPool {
public:
    using Task = std::function<void(std::stop_token)>;

    /// Start @p max_workers threads named "<name>_<index>".
    explicit WorkerPool(std::size_t max_workers, std::string name = "workerpool");

    /// Cancels pending work and detaches workers that were not joined by
    /// Shutdown(). Never blocks on a running task.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// Enqueue a task.
    /// @return InvalidState once the pool stopped accepting work
    std::expected<TaskHandle, Error> Submit(Task task);

    /// Stop accepting work, drop pending tasks and request stop on running
    /// ones. Returns without waiting for running tasks.
    void CancelPendingAndStop();

    /// Stop accepting work, let pending tasks run, then join the workers.
    void Shutdown();

    /// Return true until CancelPendingAndStop() or Shutdown() is called.
    bool IsAccepting() const;

    /// Number of tasks currently executing.
    std::size_t ActiveCount() const;

    /// Number of accepted tasks not yet started.
    std::size_t PendingCount() const;

    std::size_t max_workers() const { return max_workers_; }
    const std::string& name() const { return name_; }

private:
    struct Entry {
        Task task;
        std::shared_ptr<TaskHandle::Control> control;
    };

    // State shared between the pool object and its worker threads.
    struct Shared {
        mutable std::mutex mutex;
        std::condition_variable work_available;
        std::deque<Entry> pending;
        std::size_t active = 0;
        bool accepting = true;
        bool stopping = false;
        std::stop_source stop_source;
    };

    static void WorkerLoop(const std::shared_ptr<Shared>& shared);
    void JoinWorkers();
    void DetachWorkers();

    const std::size_t max_workers_;
    const std::string name_;

    std::shared_ptr<Shared> shared_;
    std::mutex join_mutex_;
    std::vector<std::thread> workers_;
};

}  // namespace stream_sync
