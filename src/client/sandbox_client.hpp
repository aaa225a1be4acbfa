//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// client/sandbox_client.hpp
//
// Blocking client for the SandboxD protocol
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace sandbox_server {

//===----------------------------------------------------------------------===//
// Sandbox Client
//
// One request in flight at a time. Transport failures are retried with
// exponential backoff, reconnecting before each attempt; server ERROR replies
// are thrown as SandboxError and never retried.
//===----------------------------------------------------------------------===//
class SandboxClient {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 7421;
        uint32_t max_attempts = 3;
        uint32_t retry_backoff_ms = 200;
        size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
    };

    explicit SandboxClient(const Options& options);
    ~SandboxClient();

    // Non-copyable
    SandboxClient(const SandboxClient&) = delete;
    SandboxClient& operator=(const SandboxClient&) = delete;

    // Connection management. Calls connect lazily; Connect() only surfaces
    // errors early. Throws TransportFailure.
    void Connect();
    void Disconnect();
    bool IsConnected() const;

    // Session lifecycle
    std::string CreateSession(const std::string& requested_id = "");
    void DestroySession(const std::string& session_id);

    // Session problems come back in ExecutionResult::status
    ExecutionResult Execute(const std::string& session_id, const std::string& code,
                            uint32_t timeout_ms = 0);

    // Inspection
    VariableValuePayload GetVariable(const std::string& session_id, const std::string& name,
                                     uint32_t timeout_ms = 0);
    std::vector<BindingInfo> ListVariables(const std::string& session_id, uint32_t timeout_ms = 0);

    // Working directory files
    FileEntry PutFile(const std::string& session_id, const std::string& path,
                      const std::vector<uint8_t>& data);
    std::vector<uint8_t> GetFile(const std::string& session_id, const std::string& path);
    std::vector<FileEntry> ListFiles(const std::string& session_id);

    StatusResponsePayload Status(const std::string& session_id = "");
    void Ping();

    const Options& GetOptions() const { return options_; }

    // Attempts made by the last call (1 when it succeeded first time)
    uint32_t GetLastAttempts() const { return last_attempts_; }

private:
    // Send the request and wait for its reply, retrying transport failures.
    // When retry_after_write is false, a failure after the request reached
    // the socket is thrown at once.
    Message Call(MessageType type, std::vector<uint8_t> payload, MessageType expected,
                 bool retry_after_write = true);

    // One attempt; sets written once the whole request is on the wire
    Message RoundTrip(const Message& request, bool& written);

    void OpenSocket();
    void SendMessage(const Message& message);
    Message ReceiveMessage();
    void CloseSocket();

private:
    // Socket management (using pimpl to hide asio details)
    class SocketImpl;
    std::unique_ptr<SocketImpl> socket_impl_;

    Options options_;
    bool connected_ = false;
    uint32_t next_request_id_ = 0;
    uint32_t last_attempts_ = 0;
    std::mutex call_mutex_;
};

} // namespace sandbox_server
