//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// network/io_context_pool.cpp
//
// IO threads for client connections, one io_context each
//===----------------------------------------------------------------------===//

#include "network/io_context_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace sandbox_server {

IoContextPool::Lease::Lease(std::shared_ptr<Shard> shard_p)
    : shard(std::move(shard_p)) {
}

IoContextPool::Lease::~Lease() {
    if (shard && active) {
        shard->connections--;
    }
}

IoContextPool::Lease& IoContextPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (shard && active) {
            shard->connections--;
        }
        shard = std::move(other.shard);
        active = other.active;
        other.active = false;
    }
    return *this;
}

void IoContextPool::Lease::Activate() {
    if (shard && !active) {
        active = true;
        shard->connections++;
    }
}

IoContextPool::IoContextPool(size_t pool_size) {
    if (pool_size == 0) {
        pool_size = std::max<size_t>(2, std::thread::hardware_concurrency());
    }
    for (size_t i = 0; i < pool_size; i++) {
        shards_.push_back(std::make_shared<Shard>());
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

void IoContextPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    for (auto& shard : shards_) {
        shard->io_context.restart();
        work_guards_.push_back(asio::make_work_guard(shard->io_context));
        shard->thread = std::thread([shard]() {
            shard->io_context.run();
        });
    }

    LOG_DEBUG("io_pool", "Started " + std::to_string(shards_.size()) + " IO threads");
}

void IoContextPool::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    work_guards_.clear();
    for (auto& shard : shards_) {
        shard->io_context.stop();
    }
    for (auto& shard : shards_) {
        if (shard->thread.joinable()) {
            shard->thread.join();
        }
    }

    // Run the completions of aborted operations so connections drop their leases
    for (auto& shard : shards_) {
        shard->io_context.restart();
        shard->io_context.poll();
    }

    LOG_DEBUG("io_pool", "IO threads stopped");
}

IoContextPool::Lease IoContextPool::Acquire() {
    // Loads change concurrently; an approximate minimum is good enough
    size_t best = 0;
    for (size_t i = 1; i < shards_.size(); i++) {
        if (shards_[i]->connections.load() < shards_[best]->connections.load()) {
            best = i;
        }
    }
    return Lease(shards_[best]);
}

std::vector<size_t> IoContextPool::GetLoads() const {
    std::vector<size_t> loads;
    loads.reserve(shards_.size());
    for (const auto& shard : shards_) {
        loads.push_back(shard->connections.load());
    }
    return loads;
}

} // namespace sandbox_server
