//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// sandbox/worker_service.cpp
//
// Worker request loop implementation
//===----------------------------------------------------------------------===//

#include "sandbox/worker_service.hpp"
#include "logging/logger.hpp"
#include <unistd.h>

namespace sandbox_server {

WorkerService::WorkerService(ScriptEngine& engine_p, FrameChannel& channel_p)
    : engine(engine_p)
    , channel(channel_p) {
}

int WorkerService::Run() {
    WorkerReadyPayload ready;
    ready.pid = static_cast<uint32_t>(getpid());
    ready.engine_version = ScriptEngine::EngineVersion();

    std::string error;
    if (channel.Send(Message(MessageType::WORKER_READY, ready.Serialize()), error) !=
        FrameChannel::Status::OK) {
        LOG_ERROR("worker", "Cannot announce readiness: " + error);
        return 1;
    }

    while (!stop_requested) {
        Message request;
        auto status = channel.Receive(request, TimePoint::max(), error);
        if (status == FrameChannel::Status::CLOSED) {
            LOG_DEBUG("worker", "Server closed the channel");
            return 0;
        }
        if (status != FrameChannel::Status::OK) {
            LOG_ERROR("worker", "Channel failure: " + error);
            return 1;
        }

        Message reply = Handle(request);
        if (stop_requested) {
            break;
        }

        reply.SetRequestId(request.GetRequestId());
        if (channel.Send(reply, error) != FrameChannel::Status::OK) {
            LOG_ERROR("worker", "Cannot send reply: " + error);
            return 1;
        }
        requests_handled++;
    }

    LOG_DEBUG("worker", "Shutting down after " + std::to_string(requests_handled) + " requests");
    return 0;
}

Message WorkerService::Handle(const Message& request) {
    try {
        switch (request.GetType()) {
            case MessageType::PING:
                return Message(MessageType::PONG, request.GetRequestId());
            case MessageType::EXECUTE:
                return HandleExecute(request);
            case MessageType::GET_VARIABLE:
                return HandleGetVariable(request);
            case MessageType::LIST_VARIABLES:
                return HandleListVariables(request);
            case MessageType::SHUTDOWN:
                stop_requested = true;
                return Message(MessageType::SHUTDOWN, request.GetRequestId());
            default:
                return MakeError(ErrorCode::INVALID_REQUEST,
                                 std::string("Unsupported worker request: ") +
                                 MessageTypeToString(request.GetType()),
                                 request.GetRequestId());
        }
    } catch (const ProtocolException& e) {
        return MakeError(ErrorCode::PROTOCOL_ERROR, e.what(), request.GetRequestId());
    } catch (const std::exception& e) {
        LOG_ERROR("worker", std::string("Request failed: ") + e.what());
        return MakeError(ErrorCode::ENGINE_FAILURE, e.what(), request.GetRequestId());
    }
}

Message WorkerService::HandleExecute(const Message& request) {
    auto payload = ExecutePayload::Deserialize(request.GetPayload());
    auto result = engine.Execute(payload.code);

    if (result.status == ExecutionStatus::FAULTED) {
        LOG_DEBUG("worker", "Fragment faulted: " + result.fault.kind + ": " + result.fault.message);
    }
    return Message(MessageType::EXECUTE_RESULT, result.Serialize(), request.GetRequestId());
}

Message WorkerService::HandleGetVariable(const Message& request) {
    auto payload = GetVariablePayload::Deserialize(request.GetPayload());
    auto value = engine.GetVariable(payload.name);
    return Message(MessageType::VARIABLE_VALUE, value.Serialize(), request.GetRequestId());
}

Message WorkerService::HandleListVariables(const Message& request) {
    auto list = engine.ListVariables();
    return Message(MessageType::VARIABLE_LIST, list.Serialize(), request.GetRequestId());
}

Message WorkerService::MakeError(ErrorCode code, const std::string& message, uint32_t request_id) {
    ErrorPayload payload(code, message);
    return Message(MessageType::ERROR, payload.Serialize(), request_id);
}

} // namespace sandbox_server
