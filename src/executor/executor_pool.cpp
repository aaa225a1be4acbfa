//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// executor/executor_pool.cpp
//
// Executor thread pool implementation
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace sandbox_server {

ExecutorPool::ExecutorPool(size_t thread_count)
    : thread_count_(thread_count)
    , running_(false)
    , stop_requested_(false) {
    if (thread_count_ == 0) {
        thread_count_ = std::max<size_t>(4, std::thread::hardware_concurrency());
    }
}

ExecutorPool::~ExecutorPool() {
    Stop();
}

void ExecutorPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    stop_requested_ = false;
    workers_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(&ExecutorPool::RunTasks, this);
    }

    DLOG_DEBUG("executor_pool", "Started {} threads", thread_count_);
}

void ExecutorPool::Stop() {
    if (!running_) {
        return;
    }

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
        dropped = tasks_.size();
        tasks_ = std::queue<Task>();
    }
    dropped_tasks_ += dropped;
    condition_.notify_all();

    // Running tasks finish first; session calls return once their worker is killed
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
    running_ = false;

    DLOG_INFO("executor_pool", "Stopped after {} tasks, {} dropped unstarted",
              completed_tasks_.load(), dropped);
}

bool ExecutorPool::Submit(Task task) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_requested_ || !running_) {
        return false;
    }
    tasks_.push(std::move(task));
    lock.unlock();

    condition_.notify_one();
    return true;
}

size_t ExecutorPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void ExecutorPool::RunTasks() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        condition_.wait(lock, [this]() {
            return stop_requested_ || !tasks_.empty();
        });
        if (stop_requested_) {
            return;
        }

        Task task = std::move(tasks_.front());
        tasks_.pop();
        lock.unlock();

        active_tasks_++;
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("executor_pool", std::string("Task failed: ") + e.what());
        }
        active_tasks_--;
        completed_tasks_++;

        lock.lock();
    }
}

} // namespace sandbox_server
