//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// network/io_context_pool.hpp
//
// IO threads for client connections, one io_context each
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>
#include <thread>

namespace sandbox_server {

// Connections are placed on the io_context with the fewest active connections.
// A connection keeps its context alive through its Lease, so a socket is
// always destroyed before the io_context it belongs to.
class IoContextPool {
private:
    struct Shard {
        asio::io_context io_context;
        std::atomic<size_t> connections{0};
        std::thread thread;
    };

public:
    class Lease {
    public:
        Lease() = default;
        explicit Lease(std::shared_ptr<Shard> shard_p);
        ~Lease();

        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        asio::io_context& GetIoContext() { return shard->io_context; }

        // Count the connection against its context. A lease held by a
        // pending accept is not counted.
        void Activate();

    private:
        std::shared_ptr<Shard> shard;
        bool active = false;
    };

    explicit IoContextPool(size_t pool_size = 0);
    ~IoContextPool();

    // Non-copyable
    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Run one thread per context. Start after Stop restarts the contexts.
    void Start();

    // Stop every context and join the threads
    void Stop();

    // Claim the least loaded context for a new connection
    Lease Acquire();

    // Open connections per context, in pool order
    std::vector<size_t> GetLoads() const;

    size_t Size() const { return shards_.size(); }
    bool IsRunning() const { return running_; }

private:
    std::vector<std::shared_ptr<Shard>> shards_;
    std::vector<asio::executor_work_guard<asio::io_context::executor_type>> work_guards_;
    std::atomic<bool> running_{false};
};

} // namespace sandbox_server
