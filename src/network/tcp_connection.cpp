//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// network/tcp_connection.cpp
//
// One client connection: framed reads, ordered replies
//===----------------------------------------------------------------------===//

#include "network/tcp_connection.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"

namespace sandbox_server {

std::atomic<uint64_t> TcpConnection::next_connection_id_{1};

TcpConnection::TcpConnection(IoContextPool::Lease lease,
                             TcpServer& server,
                             std::shared_ptr<ProtocolHandler> handler,
                             size_t max_message_bytes)
    : lease_(std::move(lease))
    , socket_(lease_.GetIoContext())
    , server_(server)
    , handler_(std::move(handler))
    , connection_id_(next_connection_id_++)
    , max_message_bytes_(max_message_bytes) {
}

TcpConnection::~TcpConnection() {
    asio::error_code ec;
    socket_.close(ec);
}

void TcpConnection::Start() {
    connected_ = true;
    lease_.Activate();
    DLOG_DEBUG("connection", "Connection {} from {}", connection_id_, GetPeer());
    ReadHeader();
}

void TcpConnection::Reject(ErrorCode code, const std::string& message) {
    connected_ = true;
    Fail(code, message);
}

void TcpConnection::Close() {
    if (!connected_.exchange(false)) {
        return;
    }

    DLOG_DEBUG("connection", "Connection {} closed after {} requests, {} replies",
               connection_id_, requests_received_.load(), replies_sent_.load());

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    server_.RemoveConnection(connection_id_);
}

void TcpConnection::Send(Message message) {
    bool start_writing = false;
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        if (!connected_) {
            return;
        }
        outbox_.push_back(std::move(message));
        if (!writing_) {
            writing_ = true;
            start_writing = true;
        }
    }

    if (start_writing) {
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [self]() {
            self->WriteNext();
        });
    }
}

std::string TcpConnection::GetPeer() const {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

//===----------------------------------------------------------------------===//
// Reading
//===----------------------------------------------------------------------===//

void TcpConnection::ReadHeader() {
    if (!connected_) {
        return;
    }

    inbound_ = Message();
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(&inbound_.GetHeader(), MessageHeader::SIZE),
        [self](const asio::error_code& ec, size_t bytes) {
            if (ec) {
                self->OnReadError("header", ec);
                return;
            }
            self->server_.AddBytesReceived(bytes);
            if (!self->AcceptHeader()) {
                return;
            }
            if (self->inbound_.GetPayloadLength() == 0) {
                self->Deliver();
            } else {
                self->ReadPayload();
            }
        });
}

bool TcpConnection::AcceptHeader() {
    const auto& header = inbound_.GetHeader();

    if (header.magic != PROTOCOL_MAGIC) {
        LOG_WARN("connection", "Connection " + std::to_string(connection_id_) +
                 " sent a frame with a bad magic number");
        Fail(ErrorCode::PROTOCOL_ERROR, "Invalid message header");
        return false;
    }
    if (header.version != PROTOCOL_VERSION) {
        Fail(ErrorCode::VERSION_MISMATCH, "Protocol version mismatch. Server version: " +
             std::to_string(PROTOCOL_VERSION));
        return false;
    }
    if (header.length > max_message_bytes_) {
        Fail(ErrorCode::PROTOCOL_ERROR, "Message of " + std::to_string(header.length) +
             " bytes exceeds limit of " + std::to_string(max_message_bytes_));
        return false;
    }
    return true;
}

void TcpConnection::ReadPayload() {
    auto& payload = inbound_.GetPayload();
    payload.resize(inbound_.GetPayloadLength());

    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(payload),
        [self](const asio::error_code& ec, size_t bytes) {
            if (ec) {
                self->OnReadError("payload", ec);
                return;
            }
            self->server_.AddBytesReceived(bytes);
            self->Deliver();
        });
}

void TcpConnection::Deliver() {
    requests_received_++;
    DLOG_TRACE("connection", "Connection {} request {} ({})", connection_id_,
               inbound_.GetRequestId(), MessageTypeToString(inbound_.GetType()));

    handler_->HandleMessage(inbound_, shared_from_this());
    ReadHeader();
}

void TcpConnection::OnReadError(const char* stage, const asio::error_code& ec) {
    if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_WARN("connection", "Connection " + std::to_string(connection_id_) + " failed reading " +
                 stage + ": " + ec.message());
    }
    Close();
}

//===----------------------------------------------------------------------===//
// Writing
//===----------------------------------------------------------------------===//

void TcpConnection::WriteNext() {
    Message* front = nullptr;
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        if (outbox_.empty() || !connected_) {
            outbox_.clear();
            writing_ = false;
        } else {
            front = &outbox_.front();
        }
    }

    if (!front) {
        if (close_when_drained_) {
            Close();
        }
        return;
    }

    // Header and payload go out as one gathered write, without a copy
    std::array<asio::const_buffer, 2> buffers = {
        asio::buffer(&front->GetHeader(), MessageHeader::SIZE),
        asio::buffer(front->GetPayload())
    };

    auto self = shared_from_this();
    asio::async_write(socket_, buffers,
        [self](const asio::error_code& ec, size_t bytes) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    LOG_WARN("connection", "Connection " + std::to_string(self->connection_id_) +
                             " failed writing: " + ec.message());
                }
                {
                    std::lock_guard<std::mutex> lock(self->outbox_mutex_);
                    self->outbox_.clear();
                    self->writing_ = false;
                }
                self->Close();
                return;
            }

            self->server_.AddBytesSent(bytes);
            self->replies_sent_++;
            {
                std::lock_guard<std::mutex> lock(self->outbox_mutex_);
                self->outbox_.pop_front();
            }
            self->WriteNext();
        });
}

void TcpConnection::Fail(ErrorCode code, const std::string& message) {
    close_when_drained_ = true;
    Send(Message(MessageType::ERROR, ErrorPayload(code, message).Serialize()));
}

} // namespace sandbox_server
