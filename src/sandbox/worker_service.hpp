//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// sandbox/worker_service.hpp
//
// Request loop run inside sandboxd-worker
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/script_engine.hpp"
#include "sandbox/frame_channel.hpp"

namespace sandbox_server {

class WorkerService {
public:
    WorkerService(ScriptEngine& engine_p, FrameChannel& channel_p);

    // Send WORKER_READY and serve requests until SHUTDOWN or the server
    // closes the channel. Returns the process exit code.
    int Run();

    // Produce the reply for one request
    Message Handle(const Message& request);

private:
    Message HandleExecute(const Message& request);
    Message HandleGetVariable(const Message& request);
    Message HandleListVariables(const Message& request);

    static Message MakeError(ErrorCode code, const std::string& message, uint32_t request_id);

private:
    ScriptEngine& engine;
    FrameChannel& channel;
    bool stop_requested = false;
    uint64_t requests_handled = 0;
};

} // namespace sandbox_server
