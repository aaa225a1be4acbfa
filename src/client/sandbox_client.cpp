//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// client/sandbox_client.cpp
//
// Blocking client implementation using ASIO
//===----------------------------------------------------------------------===//

#include "client/sandbox_client.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

#include <asio.hpp>

namespace sandbox_server {

using asio::ip::tcp;

//===----------------------------------------------------------------------===//
// Socket Implementation (PIMPL)
//===----------------------------------------------------------------------===//

class SandboxClient::SocketImpl {
public:
    asio::io_context io_context;
    tcp::socket socket;

    SocketImpl() : socket(io_context) {}
};

//===----------------------------------------------------------------------===//
// SandboxClient Implementation
//===----------------------------------------------------------------------===//

SandboxClient::SandboxClient(const Options& options)
    : socket_impl_(std::make_unique<SocketImpl>())
    , options_(options) {
    if (options_.max_attempts == 0) {
        options_.max_attempts = 1;
    }
}

SandboxClient::~SandboxClient() {
    CloseSocket();
}

void SandboxClient::Connect() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    if (!connected_) {
        OpenSocket();
    }
}

void SandboxClient::OpenSocket() {
    try {
        tcp::resolver resolver(socket_impl_->io_context);
        auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port));
        asio::connect(socket_impl_->socket, endpoints);
        socket_impl_->socket.set_option(tcp::no_delay(true));
        connected_ = true;
    } catch (const asio::system_error& e) {
        CloseSocket();
        throw TransportFailure("Connection to " + options_.host + ":" +
                               std::to_string(options_.port) + " failed: " + e.what());
    }
}

void SandboxClient::Disconnect() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    CloseSocket();
}

bool SandboxClient::IsConnected() const {
    return connected_;
}

void SandboxClient::CloseSocket() {
    asio::error_code ec;
    if (socket_impl_->socket.is_open()) {
        socket_impl_->socket.shutdown(tcp::socket::shutdown_both, ec);
        socket_impl_->socket.close(ec);
    }
    connected_ = false;
}

//===----------------------------------------------------------------------===//
// Operations
//===----------------------------------------------------------------------===//

std::string SandboxClient::CreateSession(const std::string& requested_id) {
    SessionPayload request;
    request.session_id = requested_id;
    // A resent create would start a second session
    auto reply = Call(MessageType::CREATE_SESSION, request.Serialize(),
                      MessageType::SESSION_CREATED, false);
    return SessionPayload::Deserialize(reply.GetPayload()).session_id;
}

void SandboxClient::DestroySession(const std::string& session_id) {
    SessionPayload request;
    request.session_id = session_id;
    Call(MessageType::DESTROY_SESSION, request.Serialize(), MessageType::SESSION_DESTROYED, false);
}

ExecutionResult SandboxClient::Execute(const std::string& session_id, const std::string& code,
                                       uint32_t timeout_ms) {
    ExecutePayload request;
    request.session_id = session_id;
    request.timeout_ms = timeout_ms;
    request.code = code;
    // A fragment that reached the server may already have run
    auto reply = Call(MessageType::EXECUTE, request.Serialize(), MessageType::EXECUTE_RESULT,
                      false);
    return ExecutionResult::Deserialize(reply.GetPayload());
}

VariableValuePayload SandboxClient::GetVariable(const std::string& session_id,
                                                const std::string& name, uint32_t timeout_ms) {
    GetVariablePayload request;
    request.session_id = session_id;
    request.name = name;
    request.timeout_ms = timeout_ms;
    auto reply = Call(MessageType::GET_VARIABLE, request.Serialize(), MessageType::VARIABLE_VALUE);
    return VariableValuePayload::Deserialize(reply.GetPayload());
}

std::vector<BindingInfo> SandboxClient::ListVariables(const std::string& session_id,
                                                      uint32_t timeout_ms) {
    SessionPayload request;
    request.session_id = session_id;
    request.timeout_ms = timeout_ms;
    auto reply = Call(MessageType::LIST_VARIABLES, request.Serialize(), MessageType::VARIABLE_LIST);
    return VariableListPayload::Deserialize(reply.GetPayload()).bindings;
}

FileEntry SandboxClient::PutFile(const std::string& session_id, const std::string& path,
                                 const std::vector<uint8_t>& data) {
    FilePayload request;
    request.session_id = session_id;
    request.path = path;
    request.data = data;
    auto reply = Call(MessageType::PUT_FILE, request.Serialize(), MessageType::FILE_STORED);

    auto stored = FileListPayload::Deserialize(reply.GetPayload());
    if (stored.files.size() != 1) {
        throw TransportFailure("FILE_STORED reply carries " +
                               std::to_string(stored.files.size()) + " entries");
    }
    return stored.files.front();
}

std::vector<uint8_t> SandboxClient::GetFile(const std::string& session_id,
                                            const std::string& path) {
    FilePayload request;
    request.session_id = session_id;
    request.path = path;
    auto reply = Call(MessageType::GET_FILE, request.Serialize(), MessageType::FILE_CONTENT);
    return FilePayload::Deserialize(reply.GetPayload()).data;
}

std::vector<FileEntry> SandboxClient::ListFiles(const std::string& session_id) {
    SessionPayload request;
    request.session_id = session_id;
    auto reply = Call(MessageType::LIST_FILES, request.Serialize(), MessageType::FILE_LIST);
    return FileListPayload::Deserialize(reply.GetPayload()).files;
}

StatusResponsePayload SandboxClient::Status(const std::string& session_id) {
    StatusRequestPayload request;
    request.session_id = session_id;
    auto reply = Call(MessageType::STATUS, request.Serialize(), MessageType::STATUS_RESPONSE);
    return StatusResponsePayload::Deserialize(reply.GetPayload());
}

void SandboxClient::Ping() {
    Call(MessageType::PING, {}, MessageType::PONG);
}

//===----------------------------------------------------------------------===//
// Request / Reply
//===----------------------------------------------------------------------===//

Message SandboxClient::Call(MessageType type, std::vector<uint8_t> payload, MessageType expected,
                            bool retry_after_write) {
    std::lock_guard<std::mutex> lock(call_mutex_);

    Message request(type, std::move(payload));
    uint32_t backoff_ms = options_.retry_backoff_ms;
    last_attempts_ = 0;

    for (uint32_t attempt = 1;; ++attempt) {
        last_attempts_ = attempt;
        request.SetRequestId(++next_request_id_);

        bool written = false;
        try {
            Message reply = RoundTrip(request, written);

            if (reply.GetType() == MessageType::ERROR) {
                auto error = ErrorPayload::Deserialize(reply.GetPayload());
                if (reply.GetRequestId() == 0) {
                    // Connection-level refusal; the server closes its end
                    CloseSocket();
                }
                throw SandboxError(error.code, error.message);
            }
            if (reply.GetType() != expected) {
                CloseSocket();
                throw TransportFailure(std::string("Unexpected reply ") +
                                       MessageTypeToString(reply.GetType()) + " to " +
                                       MessageTypeToString(type));
            }
            return reply;
        } catch (const ProtocolException& e) {
            // Malformed payload from the server counts as a transport failure
            CloseSocket();
            if (attempt >= options_.max_attempts || (written && !retry_after_write)) {
                throw TransportFailure(std::string("Malformed reply: ") + e.what());
            }
            DLOG_WARN("client", "{} attempt {}/{} got a malformed reply: {}",
                      MessageTypeToString(type), attempt, options_.max_attempts, e.what());
        } catch (const TransportFailure& e) {
            CloseSocket();
            if (attempt >= options_.max_attempts || (written && !retry_after_write)) {
                throw;
            }
            DLOG_WARN("client", "{} attempt {}/{} failed: {}",
                      MessageTypeToString(type), attempt, options_.max_attempts, e.what());
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        backoff_ms *= 2;
    }
}

Message SandboxClient::RoundTrip(const Message& request, bool& written) {
    if (!connected_) {
        OpenSocket();
    }

    SendMessage(request);
    written = true;

    Message reply = ReceiveMessage();
    bool refusal = reply.GetType() == MessageType::ERROR && reply.GetRequestId() == 0;
    if (reply.GetRequestId() != request.GetRequestId() && !refusal) {
        throw TransportFailure("Reply request id " + std::to_string(reply.GetRequestId()) +
                               " does not match " + std::to_string(request.GetRequestId()));
    }
    return reply;
}

void SandboxClient::SendMessage(const Message& message) {
    auto buffer = message.Serialize();
    asio::error_code ec;
    asio::write(socket_impl_->socket, asio::buffer(buffer), ec);
    if (ec) {
        throw TransportFailure("Write failed: " + ec.message());
    }
}

Message SandboxClient::ReceiveMessage() {
    asio::error_code ec;
    Message message;
    MessageHeader& header = message.GetHeader();

    asio::read(socket_impl_->socket, asio::buffer(&header, MessageHeader::SIZE), ec);
    if (ec) {
        throw TransportFailure(ec == asio::error::eof ? std::string("Connection closed by server")
                                                      : "Read failed: " + ec.message());
    }
    if (header.magic != PROTOCOL_MAGIC) {
        throw TransportFailure("Invalid magic in reply header");
    }
    if (header.version != PROTOCOL_VERSION) {
        throw TransportFailure("Unsupported protocol version " + std::to_string(header.version));
    }
    if (header.length > options_.max_message_bytes) {
        throw TransportFailure("Reply too large: " + std::to_string(header.length) + " bytes");
    }

    std::vector<uint8_t> payload(header.length);
    if (header.length > 0) {
        asio::read(socket_impl_->socket, asio::buffer(payload), ec);
        if (ec) {
            throw TransportFailure("Read failed: " + ec.message());
        }
    }
    message.SetPayload(std::move(payload));
    return message;
}

} // namespace sandbox_server
