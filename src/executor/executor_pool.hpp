//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// executor/executor_pool.hpp
//
// Thread pool for blocking session calls
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <condition_variable>
#include <queue>
#include <thread>

namespace sandbox_server {

// Threads for calls that block on a worker: execute, inspection, files.
// Every thread can sit in a worker round-trip for a full timeout, so the
// pool is sized to the session limit and calls past it wait in FIFO order.
class ExecutorPool {
public:
    using Task = std::function<void()>;

    // 0 picks max(4, hardware threads)
    explicit ExecutorPool(size_t thread_count = 0);
    ~ExecutorPool();

    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    void Start();

    // Drop calls that have not started, then join the threads. Running calls
    // are not interrupted here; killing their workers is what ends them.
    void Stop();

    // False unless the pool is running. A task that throws is logged and
    // its thread carries on.
    bool Submit(Task task);

    size_t Size() const { return thread_count_; }
    bool IsRunning() const { return running_; }

    size_t PendingTasks() const;
    size_t ActiveTasks() const { return active_tasks_.load(); }
    uint64_t CompletedTasks() const { return completed_tasks_.load(); }
    uint64_t DroppedTasks() const { return dropped_tasks_.load(); }

private:
    void RunTasks();

private:
    size_t thread_count_;
    std::vector<std::thread> workers_;

    // Guarded by queue_mutex_
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;

    std::atomic<size_t> active_tasks_{0};
    std::atomic<uint64_t> completed_tasks_{0};
    std::atomic<uint64_t> dropped_tasks_{0};
};

} // namespace sandbox_server
