//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// executor/execution_service.hpp
//
// Session operations with deadlines, per-session serialization and
// error mapping. Calls block; the protocol handler runs them on the pool.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/server_config.hpp"
#include "protocol/message.hpp"
#include "session/session_manager.hpp"

namespace sandbox_server {

class ExecutionService {
public:
    struct Config {
        uint32_t default_timeout_ms = DEFAULT_EXECUTE_TIMEOUT_MS;
        uint32_t max_timeout_ms = DEFAULT_MAX_EXECUTE_TIMEOUT_MS;
        BusyPolicy busy_policy = BusyPolicy::REJECT;
        bool cleanup_on_timeout = true;

        static Config FromServerConfig(const ServerConfig& server_config);
    };

    struct Metrics {
        uint64_t total_executions = 0;
        uint64_t total_ok = 0;
        uint64_t total_faulted = 0;
        uint64_t total_timeouts = 0;
        uint64_t total_busy = 0;
        uint64_t total_not_found = 0;
        uint64_t total_crashes = 0;
        uint64_t total_execute_us = 0;
    };

    ExecutionService(SessionManager& manager_p, const Config& config_p);

    // Non-copyable
    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    // Returns the session id. Throws SandboxError.
    std::string CreateSession(const std::string& requested_id);

    // Throws SandboxError(SESSION_NOT_FOUND)
    void DestroySession(const std::string& session_id);

    // Run a fragment. Session problems are reported in the result status,
    // never thrown.
    ExecutionResult Execute(const std::string& session_id, const std::string& code,
                            uint32_t timeout_ms = 0);

    // Throw SandboxError
    VariableValuePayload GetVariable(const std::string& session_id, const std::string& name,
                                     uint32_t timeout_ms = 0);
    VariableListPayload ListVariables(const std::string& session_id, uint32_t timeout_ms = 0);

    void PutFile(const std::string& session_id, const std::string& path,
                 const std::vector<uint8_t>& data);
    std::vector<uint8_t> GetFile(const std::string& session_id, const std::string& path);
    FileListPayload ListFiles(const std::string& session_id);

    // Server-wide counters, plus one session's state when session_id is set
    StatusResponsePayload Status(const std::string& session_id);

    Metrics GetMetrics() const;
    SessionManager& GetSessionManager() { return manager; }
    const Config& GetConfig() const { return config; }

    uint32_t EffectiveTimeoutMs(uint32_t requested_ms) const;

    // A worker's answer to EXECUTE: the result, or a worker ERROR as a
    // FAULTED result. Throws ProtocolException for anything else.
    static ExecutionResult DecodeExecuteReply(const Message& reply);

private:
    using SessionLock = std::unique_lock<std::timed_mutex>;

    // Take the exec lock according to the busy policy
    bool AcquireSession(SessionLock& lock, TimePoint deadline);

    // Enough of a total_ms budget left at deadline to be worth sending
    bool HasBudget(TimePoint deadline, uint32_t total_ms) const;

    // Active session with its exec lock held, or SandboxError
    SessionPtr LockSession(const std::string& session_id, SessionLock& lock, TimePoint deadline,
                           uint32_t total_ms);

    // One request/reply with the session's worker. Timeouts and crashes
    // expire the session and throw SandboxError.
    Message CallWorker(const SessionPtr& session, Message request, MessageType expected,
                       TimePoint deadline);


    // A worker that sent an undecodable reply is expired; throws ENGINE_FAILURE
    [[noreturn]] void ExpireMisbehaving(const SessionPtr& session, const std::string& reason);

private:
    SessionManager& manager;
    Config config;

    std::atomic<uint64_t> total_executions{0};
    std::atomic<uint64_t> total_ok{0};
    std::atomic<uint64_t> total_faulted{0};
    std::atomic<uint64_t> total_timeouts{0};
    std::atomic<uint64_t> total_busy{0};
    std::atomic<uint64_t> total_not_found{0};
    std::atomic<uint64_t> total_crashes{0};
    std::atomic<uint64_t> total_execute_us{0};
};

} // namespace sandbox_server
