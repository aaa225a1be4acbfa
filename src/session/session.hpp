//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// session/session.hpp
//
// One sandbox session: a worker process, its workdir and its exclusion lock
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message_types.hpp"
#include "sandbox/worker_process.hpp"
#include "session/session_files.hpp"

namespace sandbox_server {

class Session {
public:
    using Ptr = std::shared_ptr<Session>;

    Session(std::string session_id_p, std::unique_ptr<WorkerProcess> worker_p,
            SessionFiles files_p);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Getters
    const std::string& GetSessionId() const { return session_id; }
    TimePoint GetCreatedAt() const { return created_at; }
    TimePoint GetLastActive() const { return TimePoint(Duration(last_active.load())); }

    // Held for the whole of any call that touches the worker or the files.
    // Idle eviction takes it with try_lock so a busy session is never evicted.
    std::timed_mutex& GetExecMutex() { return exec_mutex; }

    // Worker and files; the caller must hold the exec mutex
    WorkerProcess* GetWorker() { return worker.get(); }
    SessionFiles& GetFiles() { return files; }

    // State
    SessionState GetState() const { return state.load(std::memory_order_acquire); }
    bool IsActive() const { return GetState() == SessionState::ACTIVE; }

    // Atomic state change; false if the session was not in `from`
    bool Transition(SessionState from, SessionState to);

    // Set when a timeout left the interpreter state untrustworthy
    bool IsUnreliable() const { return unreliable.load(); }
    void MarkUnreliable() { unreliable = true; }

    // Stop the worker and optionally delete the workdir; caller holds the exec
    // mutex. force skips the graceful shutdown request.
    void Release(bool remove_files, bool force = false);

    // Kill the worker's process group without touching its channel. Used when
    // another thread owns the exec mutex and has to be unblocked.
    void InterruptWorker();

    // Update activity timestamp
    void Touch() { last_active = Clock::now().time_since_epoch().count(); }

    // No activity for longer than timeout
    bool IsIdle(std::chrono::milliseconds timeout) const;
    uint64_t GetIdleMs() const;

    // Counters
    uint64_t GetExecutionCount() const { return executions.load(); }
    void CountExecution() { executions++; }

private:
    std::string session_id;

    // Timestamps
    TimePoint created_at;
    std::atomic<Duration::rep> last_active;

    std::atomic<SessionState> state{SessionState::ACTIVE};
    std::atomic<bool> unreliable{false};

    std::timed_mutex exec_mutex;

    // Guards the worker pointer against InterruptWorker from another thread
    std::mutex worker_mutex;
    std::unique_ptr<WorkerProcess> worker;
    SessionFiles files;

    std::atomic<uint64_t> executions{0};
};

} // namespace sandbox_server
