//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// session/session_manager.hpp
//
// Session store: creation, lookup, destruction and idle eviction
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/session.hpp"
#include "sandbox/worker_process.hpp"
#include <parallel_hashmap/phmap.h>
#include <filesystem>

namespace sandbox_server {

class SessionManager {
public:
    struct Config {
        size_t max_sessions;
        std::chrono::milliseconds idle_timeout;
        std::chrono::milliseconds sweep_interval;
        std::string work_root;
        uint64_t max_file_bytes;

        // Template for every worker; workdir and session id are filled in
        WorkerProcess::Options worker;

        Config()
            : max_sessions(DEFAULT_MAX_SESSIONS)
            , idle_timeout(DEFAULT_IDLE_TIMEOUT_MS)
            , sweep_interval(DEFAULT_SWEEP_INTERVAL_MS)
            , work_root("/tmp/sandboxd")
            , max_file_bytes(DEFAULT_MAX_FILE_BYTES) {}
    };

    struct Stats {
        size_t active_sessions = 0;
        size_t max_sessions = 0;
        uint64_t total_sessions_created = 0;
        uint64_t total_sessions_destroyed = 0;
        uint64_t total_evictions = 0;
        uint64_t total_expired = 0;
    };

    explicit SessionManager(const Config& config_p = Config{});
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Create a session with a fresh worker. An empty id asks for a generated one.
    // Throws SandboxError: CAPACITY_EXCEEDED, SESSION_EXISTS, INVALID_REQUEST,
    // ENGINE_START_FAILED, SHUTTING_DOWN.
    SessionPtr CreateSession(const std::string& requested_id = "");

    // Active session or nullptr; expired and unknown ids look the same
    SessionPtr GetSession(const std::string& session_id);

    // Any entry including expired ones, for status reporting
    SessionPtr FindSession(const std::string& session_id);

    // Destroy a session. Throws SandboxError(SESSION_NOT_FOUND) for unknown ids
    // and on the second destroy of the same session.
    void DestroySession(const std::string& session_id);

    // Move an active session to Expired after a forced termination.
    // The entry stays until destroyed or swept. Caller holds the exec mutex.
    void ExpireSession(const SessionPtr& session, const std::string& reason, bool remove_files);

    // Called by the thread that held the exec mutex while a destroy happened
    void FinishDestroyed(const SessionPtr& session);

    // Evict idle sessions and drop expired entries; returns how many went away
    size_t SweepIdleSessions();

    // Stop accepting new sessions and tear down all existing ones
    void Shutdown();
    bool IsAccepting() const { return accepting.load(); }

    // Not shutting down and a slot is free, so a create would not hit capacity
    bool HasCapacity() const {
        return accepting.load() && active_sessions.load() < config.max_sessions;
    }

    // Statistics
    size_t GetActiveSessionCount() const { return active_sessions.load(); }
    size_t GetMaxSessions() const { return config.max_sessions; }
    Stats GetStats() const;

    const Config& GetConfig() const { return config; }

    // Session ids: 1-64 characters from [A-Za-z0-9_.-]
    static bool IsValidSessionId(const std::string& session_id);

private:
    std::string NextSessionId();

    // Workdir of one incarnation of an id: "<id>~<n>". '~' never occurs in
    // an id, and a recreated id never shares a directory with its tombstone.
    std::filesystem::path NextWorkdir(const std::string& session_id);

    // Claim a capacity slot; false when full
    bool ReserveSlot();
    void ReleaseSlot();

    // Remove the map entry only if it still refers to this session
    bool EraseEntry(const SessionPtr& session);

    void StartSweepTimer();

private:
    Config config;

    // Sessions - using parallel_flat_hash_map for high-concurrency access
    phmap::parallel_flat_hash_map<
        std::string,
        SessionPtr,
        phmap::priv::hash_default_hash<std::string>,
        phmap::priv::hash_default_eq<std::string>,
        phmap::priv::Allocator<phmap::priv::Pair<const std::string, SessionPtr>>,
        4,  // 2^4 = 16 submaps
        std::mutex
    > sessions;

    // Ids with a create in progress
    std::mutex pending_mutex;
    phmap::flat_hash_set<std::string> pending_ids;

    std::atomic<uint64_t> workdir_generation{0};

    std::atomic<size_t> active_sessions{0};
    std::atomic<bool> accepting{true};

    // Statistics
    std::atomic<uint64_t> total_sessions_created{0};
    std::atomic<uint64_t> total_sessions_destroyed{0};
    std::atomic<uint64_t> total_evictions{0};
    std::atomic<uint64_t> total_expired{0};

    // Sweep timer
    std::atomic<bool> sweep_running{false};
    std::thread sweep_thread;
    std::mutex sweep_mutex;
    std::condition_variable sweep_cv;
};

} // namespace sandbox_server
