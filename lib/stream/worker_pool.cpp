// SPDX-License-Identifier: MIT

// lib/stream/worker_pool.cpp
#include "lib/stream/worker_pool.hpp"

#include <pthread.h>

#include <algorithm>

namespace stream_sync {

namespace {

// Linux limits thread names to 15 characters plus the terminator.
constexpr std::size_t kMaxThreadNameLength = 15;

void SetCurrentThreadName(const std::string& name) {
    std::string truncated = name.substr(0, kMaxThreadNameLength);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

}  // namespace

// TaskHandle implementation

TaskState TaskHandle::state() const {
    if (!control_) return TaskState::Finished;
    std::lock_guard<std::mutex> lock(control_->mutex);
    return control_->state;
}

bool TaskHandle::IsDone() const {
    TaskState s = state();
    return s == TaskState::Finished || s == TaskState::Cancelled;
}

void TaskHandle::Wait() const {
    if (!control_) return;
    std::unique_lock<std::mutex> lock(control_->mutex);
    control_->cv.wait(lock, [this] {
        return control_->state == TaskState::Finished ||
               control_->state == TaskState::Cancelled;
    });
}

void TaskHandle::Transition(Control& control, TaskState state) {
    {
        std::lock_guard<std::mutex> lock(control.mutex);
        control.state = state;
    }
    control.cv.notify_all();
}

// WorkerPool implementation

WorkerPool::WorkerPool(std::size_t max_workers, std::string name)
    : max_workers_(std::max<std::size_t>(1, max_workers)),
      name_(std::move(name)),
      shared_(std::make_shared<Shared>()) {
    workers_.reserve(max_workers_);
    for (std::size_t i = 0; i < max_workers_; ++i) {
        std::string thread_name = name_ + "_" + std::to_string(i);
        workers_.emplace_back([shared = shared_, thread_name]() {
            SetCurrentThreadName(thread_name);
            WorkerLoop(shared);
        });
    }
}

WorkerPool::~WorkerPool() {
    CancelPendingAndStop();
    DetachWorkers();
}

std::expected<TaskHandle, Error> WorkerPool::Submit(Task task) {
    auto control = std::make_shared<TaskHandle::Control>();
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->accepting) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                "worker pool " + name_ + " is not accepting new tasks"});
        }
        shared_->pending.push_back(Entry{std::move(task), control});
    }
    shared_->work_available.notify_one();
    return TaskHandle(std::move(control));
}

void WorkerPool::CancelPendingAndStop() {
    std::deque<Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->accepting = false;
        shared_->stopping = true;
        dropped.swap(shared_->pending);
    }
    shared_->stop_source.request_stop();
    shared_->work_available.notify_all();

    for (auto& entry : dropped) {
        TaskHandle::Transition(*entry.control, TaskState::Cancelled);
    }
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->accepting = false;
        shared_->stopping = true;
    }
    shared_->work_available.notify_all();
    JoinWorkers();
}

bool WorkerPool::IsAccepting() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->accepting;
}

std::size_t WorkerPool::ActiveCount() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->active;
}

std::size_t WorkerPool::PendingCount() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->pending.size();
}

void WorkerPool::WorkerLoop(const std::shared_ptr<Shared>& shared) {
    std::stop_token token = shared->stop_source.get_token();
    for (;;) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(shared->mutex);
            shared->work_available.wait(lock, [&shared] {
                return shared->stopping || !shared->pending.empty();
            });
            if (shared->pending.empty()) {
                return;  // stopping and nothing left to run
            }
            entry = std::move(shared->pending.front());
            shared->pending.pop_front();
            ++shared->active;
        }

        TaskHandle::Transition(*entry.control, TaskState::Running);
        entry.task(token);

        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            --shared->active;
        }
        TaskHandle::Transition(*entry.control, TaskState::Finished);
    }
}

void WorkerPool::JoinWorkers() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void WorkerPool::DetachWorkers() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.detach();
    }
}

}  // namespace stream_sync
