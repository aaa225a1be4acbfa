//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// network/tcp_server.hpp
//
// TCP server for the framed sandbox protocol
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include "network/tcp_connection.hpp"
#include <asio.hpp>
#include <parallel_hashmap/phmap.h>

namespace sandbox_server {

class ProtocolHandler;

// Accepts on a dedicated thread and spreads connections over the IO pool.
// Blocking session calls never run on either; the protocol handler moves
// them to the executor pool, and destroys to a small control pool of its own.
class TcpServer {
public:
    TcpServer(const ServerConfig& config,
              std::shared_ptr<ExecutionService> service,
              std::shared_ptr<ExecutorPool> executor_pool);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Bind and start accepting. Throws asio::system_error if the bind fails.
    void Start();

    // Close the listener and every connection, then join the IO threads
    void Stop();

    bool IsRunning() const { return running_; }

    // Bound port; differs from the configured one when that was 0
    uint16_t GetPort() const { return bound_port_; }

    std::shared_ptr<ExecutionService> GetExecutionService() { return service_; }
    std::shared_ptr<ExecutorPool> GetExecutorPool() { return executor_pool_; }
    const ServerConfig& GetConfig() const { return config_; }

    // Called by a connection as it closes
    void RemoveConnection(uint64_t connection_id);
    size_t GetConnectionCount() const;

    // Open connections per IO thread
    std::vector<size_t> GetIoLoads() const { return io_pool_.GetLoads(); }

    uint64_t GetTotalConnections() const { return total_connections_; }
    uint64_t GetRejectedConnections() const { return rejected_connections_; }
    uint64_t GetTotalBytesReceived() const { return total_bytes_received_; }
    uint64_t GetTotalBytesSent() const { return total_bytes_sent_; }

    void AddBytesReceived(uint64_t bytes) { total_bytes_received_ += bytes; }
    void AddBytesSent(uint64_t bytes) { total_bytes_sent_ += bytes; }

private:
    void OpenAcceptor();
    void DoAccept();
    void OnAccept(const TcpConnection::Ptr& conn, const asio::error_code& ec);

    // Take the connection if under the limit; false when it must be refused
    bool Admit(const TcpConnection::Ptr& conn);

    void CloseConnections();

private:
    const ServerConfig& config_;

    IoContextPool io_pool_;

    // The acceptor has its own context and thread
    asio::io_context acceptor_io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread acceptor_thread_;
    uint16_t bound_port_ = 0;

    std::shared_ptr<ExecutionService> service_;
    std::shared_ptr<ExecutorPool> executor_pool_;

    // Session destroys; runs only while the server does
    std::shared_ptr<ExecutorPool> control_pool_;

    // One handler serves every connection
    std::shared_ptr<ProtocolHandler> handler_;

    phmap::flat_hash_map<uint64_t, TcpConnection::Ptr> connections_;
    mutable std::mutex connections_mutex_;

    std::atomic<bool> running_{false};

    std::atomic<uint64_t> total_connections_{0};
    std::atomic<uint64_t> rejected_connections_{0};
    std::atomic<uint64_t> total_bytes_received_{0};
    std::atomic<uint64_t> total_bytes_sent_{0};
};

} // namespace sandbox_server
