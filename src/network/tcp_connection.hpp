//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// network/tcp_connection.hpp
//
// One client connection: framed reads, ordered replies
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include "protocol/message.hpp"
#include <asio.hpp>
#include <array>
#include <deque>

namespace sandbox_server {

class TcpServer;
class ProtocolHandler;

class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    using Ptr = std::shared_ptr<TcpConnection>;

    TcpConnection(IoContextPool::Lease lease,
                  TcpServer& server,
                  std::shared_ptr<ProtocolHandler> handler,
                  size_t max_message_bytes);
    ~TcpConnection();

    // Non-copyable
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    asio::ip::tcp::socket& GetSocket() { return socket_; }

    // Begin reading requests
    void Start();

    // Send one ERROR frame with request id 0, then close
    void Reject(ErrorCode code, const std::string& message);

    void Close();

    // Queue a reply. Safe from any thread; replies go out in queue order
    // and are dropped once the connection is closed.
    void Send(Message message);

    // "address:port" of the client
    std::string GetPeer() const;

    uint64_t GetConnectionId() const { return connection_id_; }
    bool IsConnected() const { return connected_; }

private:
    void ReadHeader();
    void ReadPayload();

    // Check the header just read; false when the connection is being failed
    bool AcceptHeader();

    // Hand the complete request to the protocol handler and read the next
    void Deliver();

    // Write the front of the outbox; runs on the socket's executor
    void WriteNext();

    // Reply with an ERROR and close once it is written
    void Fail(ErrorCode code, const std::string& message);

    // Read errors other than a clean close are logged
    void OnReadError(const char* stage, const asio::error_code& ec);

private:
    // Declared before the socket so the io_context outlives it
    IoContextPool::Lease lease_;
    asio::ip::tcp::socket socket_;

    TcpServer& server_;
    std::shared_ptr<ProtocolHandler> handler_;
    uint64_t connection_id_;
    size_t max_message_bytes_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> close_when_drained_{false};

    // Request being read
    Message inbound_;

    // Replies not yet written. While writing_ is set the front entry is on
    // the wire and stays in place; the outbox only grows at the back.
    std::mutex outbox_mutex_;
    std::deque<Message> outbox_;
    bool writing_ = false;

    std::atomic<uint64_t> requests_received_{0};
    std::atomic<uint64_t> replies_sent_{0};

    static std::atomic<uint64_t> next_connection_id_;
};

} // namespace sandbox_server
