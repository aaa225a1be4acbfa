//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// protocol/protocol_handler.cpp
//
// Protocol message handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/protocol_handler.hpp"
#include "network/tcp_connection.hpp"
#include "executor/execution_service.hpp"
#include "executor/executor_pool.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace sandbox_server {

ProtocolHandler::ProtocolHandler(std::shared_ptr<ExecutionService> service,
                                 std::shared_ptr<ExecutorPool> executor_pool,
                                 std::shared_ptr<ExecutorPool> control_pool)
    : service_(service)
    , executor_pool_(executor_pool)
    , control_pool_(control_pool) {
}

void ProtocolHandler::HandleMessage(const Message& message,
                                    std::shared_ptr<TcpConnection> connection) {
    switch (message.GetType()) {
        case MessageType::PING:
        case MessageType::STATUS: {
            // Non-blocking, answered on the IO thread
            Message reply = Process(message);
            reply.SetRequestId(message.GetRequestId());
            connection->Send(std::move(reply));
            break;
        }
        case MessageType::DESTROY_SESSION:
            Dispatch(message, connection, *control_pool_);
            break;
        case MessageType::CREATE_SESSION:
        case MessageType::EXECUTE:
        case MessageType::GET_VARIABLE:
        case MessageType::LIST_VARIABLES:
        case MessageType::PUT_FILE:
        case MessageType::GET_FILE:
        case MessageType::LIST_FILES:
            Dispatch(message, connection, *executor_pool_);
            break;
        default: {
            LOG_WARN("protocol", "Unknown message type: " +
                     std::to_string(static_cast<int>(message.GetType())));
            Message reply = MakeError(ErrorCode::PROTOCOL_ERROR, "Unknown message type");
            reply.SetRequestId(message.GetRequestId());
            connection->Send(std::move(reply));
            break;
        }
    }
}

void ProtocolHandler::Dispatch(const Message& message, std::shared_ptr<TcpConnection> connection,
                               ExecutorPool& pool) {
    auto self = shared_from_this();
    bool submitted = pool.Submit([self, message, connection]() {
        Message reply = self->Process(message);
        reply.SetRequestId(message.GetRequestId());
        if (connection->IsConnected()) {
            connection->Send(std::move(reply));
        }
    });

    if (!submitted) {
        Message reply = MakeError(ErrorCode::SHUTTING_DOWN, "Server is shutting down");
        reply.SetRequestId(message.GetRequestId());
        connection->Send(std::move(reply));
    }
}

Message ProtocolHandler::Process(const Message& message) {
    try {
        switch (message.GetType()) {
            case MessageType::PING:
                return Message(MessageType::PONG);
            case MessageType::STATUS:
                return HandleStatus(message);
            case MessageType::CREATE_SESSION:
                return HandleCreateSession(message);
            case MessageType::DESTROY_SESSION:
                return HandleDestroySession(message);
            case MessageType::EXECUTE:
                return HandleExecute(message);
            case MessageType::GET_VARIABLE:
                return HandleGetVariable(message);
            case MessageType::LIST_VARIABLES:
                return HandleListVariables(message);
            case MessageType::PUT_FILE:
                return HandlePutFile(message);
            case MessageType::GET_FILE:
                return HandleGetFile(message);
            case MessageType::LIST_FILES:
                return HandleListFiles(message);
            default:
                return MakeError(ErrorCode::PROTOCOL_ERROR, "Unknown message type");
        }
    } catch (const SandboxError& e) {
        LOG_DEBUG("protocol", std::string(MessageTypeToString(message.GetType())) + " failed: " +
                  ErrorCodeToString(e.GetCode()) + ": " + e.what());
        return MakeError(e.GetCode(), e.what());
    } catch (const ProtocolException& e) {
        LOG_WARN("protocol", std::string("Malformed ") + MessageTypeToString(message.GetType()) +
                 ": " + e.what());
        return MakeError(ErrorCode::PROTOCOL_ERROR, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("protocol", std::string("Error handling ") + MessageTypeToString(message.GetType()) +
                  ": " + e.what());
        return MakeError(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

Message ProtocolHandler::HandleCreateSession(const Message& message) {
    auto request = SessionPayload::Deserialize(message.GetPayload());

    SessionPayload response;
    response.session_id = service_->CreateSession(request.session_id);
    return Message(MessageType::SESSION_CREATED, response.Serialize());
}

Message ProtocolHandler::HandleDestroySession(const Message& message) {
    auto request = SessionPayload::Deserialize(message.GetPayload());
    service_->DestroySession(request.session_id);

    SessionPayload response;
    response.session_id = request.session_id;
    return Message(MessageType::SESSION_DESTROYED, response.Serialize());
}

Message ProtocolHandler::HandleStatus(const Message& message) {
    auto request = StatusRequestPayload::Deserialize(message.GetPayload());
    auto response = service_->Status(request.session_id);
    return Message(MessageType::STATUS_RESPONSE, response.Serialize());
}

Message ProtocolHandler::HandleExecute(const Message& message) {
    auto request = ExecutePayload::Deserialize(message.GetPayload());

    LOG_DEBUG("protocol", "EXECUTE (session=" + request.session_id + "): " +
              request.code.substr(0, 100) + (request.code.size() > 100 ? "..." : ""));

    auto result = service_->Execute(request.session_id, request.code, request.timeout_ms);
    return Message(MessageType::EXECUTE_RESULT, result.Serialize());
}

Message ProtocolHandler::HandleGetVariable(const Message& message) {
    auto request = GetVariablePayload::Deserialize(message.GetPayload());
    auto value = service_->GetVariable(request.session_id, request.name, request.timeout_ms);
    return Message(MessageType::VARIABLE_VALUE, value.Serialize());
}

Message ProtocolHandler::HandleListVariables(const Message& message) {
    auto request = SessionPayload::Deserialize(message.GetPayload());
    auto list = service_->ListVariables(request.session_id, request.timeout_ms);
    return Message(MessageType::VARIABLE_LIST, list.Serialize());
}

Message ProtocolHandler::HandlePutFile(const Message& message) {
    auto request = FilePayload::Deserialize(message.GetPayload());
    service_->PutFile(request.session_id, request.path, request.data);

    FileEntry entry;
    entry.path = request.path;
    entry.size = request.data.size();
    FileListPayload response;
    response.files.push_back(entry);
    return Message(MessageType::FILE_STORED, response.Serialize());
}

Message ProtocolHandler::HandleGetFile(const Message& message) {
    auto request = FilePayload::Deserialize(message.GetPayload());

    FilePayload response;
    response.session_id = request.session_id;
    response.path = request.path;
    response.data = service_->GetFile(request.session_id, request.path);
    return Message(MessageType::FILE_CONTENT, response.Serialize());
}

Message ProtocolHandler::HandleListFiles(const Message& message) {
    auto request = SessionPayload::Deserialize(message.GetPayload());
    auto response = service_->ListFiles(request.session_id);
    return Message(MessageType::FILE_LIST, response.Serialize());
}

Message ProtocolHandler::MakeError(ErrorCode code, const std::string& message) {
    ErrorPayload payload(code, message);
    return Message(MessageType::ERROR, payload.Serialize());
}

} // namespace sandbox_server
