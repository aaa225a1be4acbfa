//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// executor/execution_service.cpp
//
// Execution service implementation
//===----------------------------------------------------------------------===//

#include "executor/execution_service.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace sandbox_server {

namespace {

// Short operations that do not take a caller timeout
constexpr uint32_t FILE_OPERATION_TIMEOUT_MS = 30000;

// A queued call that gets the session with less than this left is not sent
constexpr uint32_t MIN_EXECUTE_BUDGET_MS = 50;

ExecutionResult Rejected(ExecutionStatus status, const std::string& kind, const std::string& message) {
    auto result = ExecutionResult::WithStatus(status);
    result.fault.kind = kind;
    result.fault.message = message;
    return result;
}

} // anonymous namespace

ExecutionService::Config ExecutionService::Config::FromServerConfig(const ServerConfig& server_config) {
    Config config;
    config.default_timeout_ms = server_config.default_timeout_ms;
    config.max_timeout_ms = server_config.max_timeout_ms;
    config.busy_policy = server_config.busy_policy;
    config.cleanup_on_timeout = server_config.cleanup_on_timeout;
    return config;
}

ExecutionService::ExecutionService(SessionManager& manager_p, const Config& config_p)
    : manager(manager_p)
    , config(config_p) {
}

uint32_t ExecutionService::EffectiveTimeoutMs(uint32_t requested_ms) const {
    if (requested_ms == 0) {
        return config.default_timeout_ms;
    }
    return std::min(requested_ms, config.max_timeout_ms);
}

std::string ExecutionService::CreateSession(const std::string& requested_id) {
    return manager.CreateSession(requested_id)->GetSessionId();
}

void ExecutionService::DestroySession(const std::string& session_id) {
    manager.DestroySession(session_id);
}

bool ExecutionService::AcquireSession(SessionLock& lock, TimePoint deadline) {
    if (config.busy_policy == BusyPolicy::QUEUE) {
        return lock.try_lock_until(deadline);
    }
    return lock.try_lock();
}

ExecutionResult ExecutionService::Execute(const std::string& session_id, const std::string& code,
                                          uint32_t timeout_ms) {
    auto start_time = Clock::now();
    uint32_t effective_ms = EffectiveTimeoutMs(timeout_ms);
    auto deadline = start_time + std::chrono::milliseconds(effective_ms);
    total_executions++;

    auto session = manager.GetSession(session_id);
    if (!session) {
        total_not_found++;
        return Rejected(ExecutionStatus::SESSION_NOT_FOUND, "SessionNotFound",
                        "Session not found: " + session_id);
    }

    SessionLock lock(session->GetExecMutex(), std::defer_lock);
    if (!AcquireSession(lock, deadline) || !HasBudget(deadline, effective_ms)) {
        total_busy++;
        return Rejected(ExecutionStatus::SESSION_BUSY, "SessionBusy",
                        "Another call is running in session " + session_id);
    }

    // Destroyed, evicted or expired while waiting for the lock
    if (!session->IsActive()) {
        manager.FinishDestroyed(session);
        total_not_found++;
        return Rejected(ExecutionStatus::SESSION_NOT_FOUND, "SessionNotFound",
                        "Session not found: " + session_id);
    }

    session->Touch();

    ExecutePayload payload;
    payload.session_id = session_id;
    payload.timeout_ms = effective_ms;
    payload.code = code;

    Message reply;
    std::string error;
    auto status = session->GetWorker()->Call(Message(MessageType::EXECUTE, payload.Serialize()),
                                             reply, deadline, error);

    ExecutionResult result;
    switch (status) {
        case WorkerProcess::CallStatus::OK:
            try {
                result = DecodeExecuteReply(reply);
            } catch (const ProtocolException& e) {
                // The channel is out of step; the worker cannot be trusted again
                total_crashes++;
                manager.ExpireSession(session, std::string("malformed worker reply: ") + e.what(),
                                      config.cleanup_on_timeout);
                result = Rejected(ExecutionStatus::FAULTED, "EngineCrashed",
                                  std::string("The interpreter sent a malformed reply: ") + e.what() +
                                  "; the session must be recreated");
            }
            break;

        case WorkerProcess::CallStatus::TIMEOUT:
            total_timeouts++;
            manager.ExpireSession(session, "execution exceeded " + std::to_string(effective_ms) + "ms",
                                  config.cleanup_on_timeout);
            result = Rejected(ExecutionStatus::TIMED_OUT, "TimedOut",
                              "Execution exceeded the " + std::to_string(effective_ms) +
                              "ms deadline; the session must be recreated");
            break;

        case WorkerProcess::CallStatus::CRASHED:
            if (!session->IsActive()) {
                // Destroyed while running; the interrupt is what broke the channel
                manager.FinishDestroyed(session);
                total_not_found++;
                return Rejected(ExecutionStatus::SESSION_NOT_FOUND, "SessionNotFound",
                                "Session was destroyed during execution: " + session_id);
            }
            total_crashes++;
            manager.ExpireSession(session, "worker crashed: " + error, config.cleanup_on_timeout);
            result = Rejected(ExecutionStatus::FAULTED, "EngineCrashed",
                              "The interpreter process died: " + error +
                              "; the session must be recreated");
            break;
    }

    session->Touch();
    session->CountExecution();

    if (!session->IsActive()) {
        manager.FinishDestroyed(session);
    }

    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - start_time).count();
    result.elapsed_us = static_cast<uint64_t>(elapsed_us);
    total_execute_us += result.elapsed_us;

    if (result.status == ExecutionStatus::OK) {
        total_ok++;
    } else if (result.status == ExecutionStatus::FAULTED) {
        total_faulted++;
    }

    LOG_DEBUG("execution", "Session " + session_id + " execute " +
              ExecutionStatusToString(result.status) + " in " +
              std::to_string(elapsed_us) + "us");

    return result;
}

bool ExecutionService::HasBudget(TimePoint deadline, uint32_t total_ms) const {
    auto floor = std::chrono::milliseconds(std::min(MIN_EXECUTE_BUDGET_MS, total_ms / 2));
    return deadline - Clock::now() >= floor;
}

ExecutionResult ExecutionService::DecodeExecuteReply(const Message& reply) {
    if (reply.GetType() == MessageType::EXECUTE_RESULT) {
        return ExecutionResult::Deserialize(reply.GetPayload());
    }
    if (reply.GetType() == MessageType::ERROR) {
        auto worker_error = ErrorPayload::Deserialize(reply.GetPayload());
        return Rejected(ExecutionStatus::FAULTED, ErrorCodeToString(worker_error.code),
                        worker_error.message);
    }
    throw ProtocolException(std::string("unexpected worker reply ") +
                            MessageTypeToString(reply.GetType()));
}

SessionPtr ExecutionService::LockSession(const std::string& session_id, SessionLock& lock,
                                         TimePoint deadline, uint32_t total_ms) {
    auto session = manager.GetSession(session_id);
    if (!session) {
        throw SandboxError(ErrorCode::SESSION_NOT_FOUND, "Session not found: " + session_id);
    }

    lock = SessionLock(session->GetExecMutex(), std::defer_lock);
    if (!AcquireSession(lock, deadline) || !HasBudget(deadline, total_ms)) {
        throw SandboxError(ErrorCode::SESSION_BUSY, "Another call is running in session " + session_id);
    }

    if (!session->IsActive()) {
        manager.FinishDestroyed(session);
        throw SandboxError(ErrorCode::SESSION_NOT_FOUND, "Session not found: " + session_id);
    }

    session->Touch();
    return session;
}

Message ExecutionService::CallWorker(const SessionPtr& session, Message request,
                                     MessageType expected, TimePoint deadline) {
    Message reply;
    std::string error;
    auto status = session->GetWorker()->Call(std::move(request), reply, deadline, error);

    if (status == WorkerProcess::CallStatus::TIMEOUT) {
        total_timeouts++;
        manager.ExpireSession(session, "worker call timed out", config.cleanup_on_timeout);
        throw SandboxError(ErrorCode::TIMED_OUT,
                           "Worker did not answer in time; session " + session->GetSessionId() +
                           " must be recreated");
    }
    if (status == WorkerProcess::CallStatus::CRASHED) {
        if (!session->IsActive()) {
            manager.FinishDestroyed(session);
            throw SandboxError(ErrorCode::SESSION_NOT_FOUND,
                               "Session was destroyed: " + session->GetSessionId());
        }
        total_crashes++;
        manager.ExpireSession(session, "worker crashed: " + error, config.cleanup_on_timeout);
        throw SandboxError(ErrorCode::ENGINE_FAILURE, "The interpreter process died: " + error);
    }

    if (reply.GetType() == MessageType::ERROR) {
        ErrorPayload payload;
        try {
            payload = ErrorPayload::Deserialize(reply.GetPayload());
        } catch (const ProtocolException& e) {
            ExpireMisbehaving(session, e.what());
        }
        throw SandboxError(payload.code, payload.message);
    }
    if (reply.GetType() != expected) {
        ExpireMisbehaving(session, std::string("unexpected worker reply ") +
                          MessageTypeToString(reply.GetType()));
    }
    return reply;
}

void ExecutionService::ExpireMisbehaving(const SessionPtr& session, const std::string& reason) {
    total_crashes++;
    manager.ExpireSession(session, "malformed worker reply: " + reason, config.cleanup_on_timeout);
    throw SandboxError(ErrorCode::ENGINE_FAILURE, "The interpreter sent a malformed reply: " + reason +
                       "; session " + session->GetSessionId() + " must be recreated");
}

VariableValuePayload ExecutionService::GetVariable(const std::string& session_id,
                                                   const std::string& name,
                                                   uint32_t timeout_ms) {
    uint32_t effective_ms = EffectiveTimeoutMs(timeout_ms);
    auto deadline = Clock::now() + std::chrono::milliseconds(effective_ms);
    SessionLock lock;
    auto session = LockSession(session_id, lock, deadline, effective_ms);

    GetVariablePayload payload;
    payload.session_id = session_id;
    payload.name = name;
    auto reply = CallWorker(session, Message(MessageType::GET_VARIABLE, payload.Serialize()),
                            MessageType::VARIABLE_VALUE, deadline);
    session->Touch();
    try {
        return VariableValuePayload::Deserialize(reply.GetPayload());
    } catch (const ProtocolException& e) {
        ExpireMisbehaving(session, e.what());
    }
}

VariableListPayload ExecutionService::ListVariables(const std::string& session_id, uint32_t timeout_ms) {
    uint32_t effective_ms = EffectiveTimeoutMs(timeout_ms);
    auto deadline = Clock::now() + std::chrono::milliseconds(effective_ms);
    SessionLock lock;
    auto session = LockSession(session_id, lock, deadline, effective_ms);

    SessionPayload payload;
    payload.session_id = session_id;
    auto reply = CallWorker(session, Message(MessageType::LIST_VARIABLES, payload.Serialize()),
                            MessageType::VARIABLE_LIST, deadline);
    session->Touch();
    try {
        return VariableListPayload::Deserialize(reply.GetPayload());
    } catch (const ProtocolException& e) {
        ExpireMisbehaving(session, e.what());
    }
}

void ExecutionService::PutFile(const std::string& session_id, const std::string& path,
                               const std::vector<uint8_t>& data) {
    auto deadline = Clock::now() + std::chrono::milliseconds(FILE_OPERATION_TIMEOUT_MS);
    SessionLock lock;
    auto session = LockSession(session_id, lock, deadline, FILE_OPERATION_TIMEOUT_MS);
    session->GetFiles().Write(path, data);
    session->Touch();

    LOG_DEBUG("execution", "Session " + session_id + " stored " + path + " (" +
              std::to_string(data.size()) + " bytes)");
}

std::vector<uint8_t> ExecutionService::GetFile(const std::string& session_id, const std::string& path) {
    auto deadline = Clock::now() + std::chrono::milliseconds(FILE_OPERATION_TIMEOUT_MS);
    SessionLock lock;
    auto session = LockSession(session_id, lock, deadline, FILE_OPERATION_TIMEOUT_MS);
    auto data = session->GetFiles().Read(path);
    session->Touch();
    return data;
}

FileListPayload ExecutionService::ListFiles(const std::string& session_id) {
    auto deadline = Clock::now() + std::chrono::milliseconds(FILE_OPERATION_TIMEOUT_MS);
    SessionLock lock;
    auto session = LockSession(session_id, lock, deadline, FILE_OPERATION_TIMEOUT_MS);

    FileListPayload payload;
    payload.files = session->GetFiles().List();
    session->Touch();
    return payload;
}

StatusResponsePayload ExecutionService::Status(const std::string& session_id) {
    auto stats = manager.GetStats();

    StatusResponsePayload status;
    status.accepting = manager.HasCapacity();
    status.active_sessions = static_cast<uint32_t>(stats.active_sessions);
    status.max_sessions = static_cast<uint32_t>(stats.max_sessions);
    status.total_sessions_created = stats.total_sessions_created;
    status.total_executions = total_executions.load();
    status.total_timeouts = total_timeouts.load();
    status.total_evictions = stats.total_evictions;

    if (!session_id.empty()) {
        auto session = manager.FindSession(session_id);
        if (session) {
            status.session_state = session->GetState();
            status.session_idle_ms = session->GetIdleMs();
        } else {
            status.session_state = SessionState::NOT_FOUND;
        }
    }
    return status;
}

ExecutionService::Metrics ExecutionService::GetMetrics() const {
    Metrics metrics;
    metrics.total_executions = total_executions.load();
    metrics.total_ok = total_ok.load();
    metrics.total_faulted = total_faulted.load();
    metrics.total_timeouts = total_timeouts.load();
    metrics.total_busy = total_busy.load();
    metrics.total_not_found = total_not_found.load();
    metrics.total_crashes = total_crashes.load();
    metrics.total_execute_us = total_execute_us.load();
    return metrics;
}

} // namespace sandbox_server
