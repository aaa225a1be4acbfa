//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// protocol/protocol_handler.hpp
//
// Protocol message handling
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace sandbox_server {

class TcpConnection;

class ProtocolHandler : public std::enable_shared_from_this<ProtocolHandler> {
public:
    // Destroys go to control_pool so queued executes never hold them up
    ProtocolHandler(std::shared_ptr<ExecutionService> service,
                    std::shared_ptr<ExecutorPool> executor_pool,
                    std::shared_ptr<ExecutorPool> control_pool);
    ~ProtocolHandler() = default;

    // Handle incoming message. Replies carry the request's request_id and
    // may arrive out of order when several requests are in flight.
    void HandleMessage(const Message& message,
                       std::shared_ptr<TcpConnection> connection);

    // Build the reply for one request; blocks for the length of the call.
    // Every failure becomes an ERROR reply.
    Message Process(const Message& message);

private:
    // Message handlers
    Message HandleCreateSession(const Message& message);
    Message HandleDestroySession(const Message& message);
    Message HandleStatus(const Message& message);
    Message HandleExecute(const Message& message);
    Message HandleGetVariable(const Message& message);
    Message HandleListVariables(const Message& message);
    Message HandlePutFile(const Message& message);
    Message HandleGetFile(const Message& message);
    Message HandleListFiles(const Message& message);

    // Run on pool and send the reply when done
    void Dispatch(const Message& message, std::shared_ptr<TcpConnection> connection,
                  ExecutorPool& pool);

    static Message MakeError(ErrorCode code, const std::string& message);

private:
    std::shared_ptr<ExecutionService> service_;
    std::shared_ptr<ExecutorPool> executor_pool_;
    std::shared_ptr<ExecutorPool> control_pool_;
};

} // namespace sandbox_server
