//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// network/tcp_server.cpp
//
// TCP server for the framed sandbox protocol
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "config/server_config.hpp"
#include "protocol/protocol_handler.hpp"
#include "executor/execution_service.hpp"
#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"

namespace sandbox_server {

TcpServer::TcpServer(const ServerConfig& config,
                     std::shared_ptr<ExecutionService> service,
                     std::shared_ptr<ExecutorPool> executor_pool)
    : config_(config)
    , io_pool_(config.GetIoThreadCount())
    , acceptor_(acceptor_io_context_)
    , service_(std::move(service))
    , executor_pool_(std::move(executor_pool))
    , control_pool_(std::make_shared<ExecutorPool>(SESSION_CONTROL_THREADS))
    , handler_(std::make_shared<ProtocolHandler>(service_, executor_pool_, control_pool_)) {
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::OpenAcceptor() {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();
}

void TcpServer::Start() {
    if (running_) {
        return;
    }

    OpenAcceptor();
    running_ = true;

    control_pool_->Start();
    io_pool_.Start();

    DoAccept();
    acceptor_thread_ = std::thread([this]() { acceptor_io_context_.run(); });

    DLOG_INFO("server", "Listening on {}:{} with {} IO threads", config_.host, bound_port_,
              io_pool_.Size());
}

void TcpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    acceptor_.close(ec);
    acceptor_io_context_.stop();
    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }

    CloseConnections();
    io_pool_.Stop();

    // Destroys already running finish; queued ones are dropped
    control_pool_->Stop();

    DLOG_INFO("server", "Stopped after {} connections ({} refused)",
              total_connections_.load(), rejected_connections_.load());
}

void TcpServer::CloseConnections() {
    std::vector<TcpConnection::Ptr> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.reserve(connections_.size());
        for (auto& entry : connections_) {
            open.push_back(entry.second);
        }
    }
    // Close re-enters RemoveConnection, so the lock is not held here
    for (auto& conn : open) {
        conn->Close();
    }
}

void TcpServer::RemoveConnection(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
}

size_t TcpServer::GetConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::DoAccept() {
    auto conn = std::make_shared<TcpConnection>(io_pool_.Acquire(), *this, handler_,
                                                config_.max_message_bytes);
    acceptor_.async_accept(conn->GetSocket(), [this, conn](const asio::error_code& ec) {
        OnAccept(conn, ec);
    });
}

void TcpServer::OnAccept(const TcpConnection::Ptr& conn, const asio::error_code& ec) {
    if (!running_) {
        return;
    }

    if (ec) {
        LOG_WARN("server", "Accept failed: " + ec.message());
    } else if (Admit(conn)) {
        conn->Start();
    } else {
        LOG_WARN("server", "Refusing " + conn->GetPeer() + ": " +
                 std::to_string(config_.max_connections) + " connections open");
        conn->Reject(ErrorCode::MAX_CONNECTIONS, "Maximum connections reached");
    }

    DoAccept();
}

bool TcpServer::Admit(const TcpConnection::Ptr& conn) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (connections_.size() >= config_.max_connections) {
        rejected_connections_++;
        return false;
    }
    connections_.emplace(conn->GetConnectionId(), conn);
    total_connections_++;
    return true;
}

} // namespace sandbox_server
