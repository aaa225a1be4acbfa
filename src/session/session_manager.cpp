//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// session/session_manager.cpp
//
// Session store implementation
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <random>

namespace sandbox_server {

SessionManager::SessionManager(const Config& config_p)
    : config(config_p) {
    std::error_code ec;
    std::filesystem::create_directories(config.work_root, ec);
    if (ec) {
        LOG_WARN("session_manager", "Cannot create work root " + config.work_root + ": " + ec.message());
    }

    // Start sweep thread
    StartSweepTimer();

    LOG_INFO("session_manager", "Session manager initialized (max_sessions=" +
             std::to_string(config.max_sessions) + ", idle_timeout=" +
             std::to_string(config.idle_timeout.count()) + "ms)");
}

SessionManager::~SessionManager() {
    Shutdown();
    LOG_INFO("session_manager", "Session manager shutdown");
}

bool SessionManager::IsValidSessionId(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > MAX_SESSION_ID_LENGTH) {
        return false;
    }
    for (char c : session_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return session_id != "." && session_id != "..";
}

SessionPtr SessionManager::CreateSession(const std::string& requested_id) {
    if (!accepting) {
        throw SandboxError(ErrorCode::SHUTTING_DOWN, "Server is shutting down");
    }

    std::string session_id = requested_id;
    if (session_id.empty()) {
        session_id = NextSessionId();
    } else if (!IsValidSessionId(session_id)) {
        throw SandboxError(ErrorCode::INVALID_REQUEST, "Invalid session id: " + session_id);
    }

    // Creates of the same id are serialized by the pending set
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        auto existing = FindSession(session_id);
        if (pending_ids.count(session_id) > 0 || (existing && existing->IsActive())) {
            throw SandboxError(ErrorCode::SESSION_EXISTS, "Session already exists: " + session_id);
        }
        pending_ids.insert(session_id);
    }
    struct PendingGuard {
        SessionManager& manager;
        const std::string& id;
        ~PendingGuard() {
            std::lock_guard<std::mutex> lock(manager.pending_mutex);
            manager.pending_ids.erase(id);
        }
    } pending_guard{*this, session_id};

    if (!ReserveSlot()) {
        LOG_WARN("session_manager", "Maximum sessions reached: " + std::to_string(config.max_sessions));
        throw SandboxError(ErrorCode::CAPACITY_EXCEEDED,
                           "Maximum sessions reached (" + std::to_string(config.max_sessions) + ")");
    }

    SessionFiles files(NextWorkdir(session_id), config.max_file_bytes);
    std::unique_ptr<WorkerProcess> worker;
    try {
        files.Create();
        auto options = config.worker;
        options.workdir = files.GetRoot().string();
        options.session_id = session_id;
        worker = WorkerProcess::Spawn(options);
    } catch (const SandboxError& e) {
        ReleaseSlot();
        files.Remove();
        LOG_ERROR("session_manager", "Cannot create session " + session_id + ": " + e.what());
        throw;
    }

    auto session = std::make_shared<Session>(session_id, std::move(worker), std::move(files));

    // Replaces an expired entry with the same id
    sessions.insert_or_assign(session_id, session);
    total_sessions_created++;

    LOG_INFO("session_manager", "Created session " + session_id + " (worker pid " +
             std::to_string(session->GetWorker()->GetPid()) + ", active: " +
             std::to_string(active_sessions.load()) + ")");

    return session;
}

SessionPtr SessionManager::GetSession(const std::string& session_id) {
    auto session = FindSession(session_id);
    if (session && !session->IsActive()) {
        return nullptr;
    }
    return session;
}

SessionPtr SessionManager::FindSession(const std::string& session_id) {
    SessionPtr result = nullptr;

    // Thread-safe lookup using if_contains
    sessions.if_contains(session_id, [&result](const auto& item) {
        result = item.second;
    });

    return result;
}

void SessionManager::DestroySession(const std::string& session_id) {
    auto session = FindSession(session_id);
    if (!session) {
        throw SandboxError(ErrorCode::SESSION_NOT_FOUND, "Session not found: " + session_id);
    }

    if (session->Transition(SessionState::EXPIRED, SessionState::DESTROYED)) {
        // Nothing runs on an expired session, so the lock is only held briefly
        EraseEntry(session);
        std::lock_guard<std::timed_mutex> lock(session->GetExecMutex());
        session->Release(true);
        total_sessions_destroyed++;
        LOG_INFO("session_manager", "Destroyed expired session " + session_id);
        return;
    }

    if (!session->Transition(SessionState::ACTIVE, SessionState::DESTROYED)) {
        throw SandboxError(ErrorCode::SESSION_NOT_FOUND, "Session not found: " + session_id);
    }

    EraseEntry(session);
    ReleaseSlot();
    total_sessions_destroyed++;

    std::unique_lock<std::timed_mutex> lock(session->GetExecMutex(), std::try_to_lock);
    if (lock.owns_lock()) {
        session->Release(true);
    } else {
        // The call in flight sees DESTROYED and finishes the teardown
        session->InterruptWorker();
    }

    LOG_INFO("session_manager", "Destroyed session " + session_id + " (active: " +
             std::to_string(active_sessions.load()) + ")");
}

void SessionManager::ExpireSession(const SessionPtr& session, const std::string& reason,
                                   bool remove_files) {
    if (!session->Transition(SessionState::ACTIVE, SessionState::EXPIRED)) {
        FinishDestroyed(session);
        return;
    }

    session->MarkUnreliable();
    session->Release(remove_files, true);
    ReleaseSlot();
    total_expired++;

    LOG_WARN("session_manager", "Session " + session->GetSessionId() + " expired: " + reason);
    if (!remove_files) {
        LOG_INFO("session_manager", "Keeping files of " + session->GetSessionId() + " in " +
                 session->GetFiles().GetRoot().string());
    }
}

void SessionManager::FinishDestroyed(const SessionPtr& session) {
    if (session->GetState() == SessionState::DESTROYED) {
        session->Release(true, true);
    }
}

size_t SessionManager::SweepIdleSessions() {
    std::vector<SessionPtr> candidates;

    // First pass: collect idle sessions and expired entries
    sessions.for_each([this, &candidates](const auto& item) {
        const auto& session = item.second;
        if (session->GetState() == SessionState::EXPIRED || session->IsIdle(config.idle_timeout)) {
            candidates.push_back(session);
        }
    });

    // Second pass: evict under the exec lock, skipping busy sessions
    size_t removed = 0;
    for (auto& session : candidates) {
        std::unique_lock<std::timed_mutex> lock(session->GetExecMutex(), std::try_to_lock);
        if (!lock.owns_lock()) {
            LOG_DEBUG("session_manager", "Skipping busy session " + session->GetSessionId());
            continue;
        }
        bool evicted = false;
        if (session->Transition(SessionState::EXPIRED, SessionState::DESTROYED)) {
            // Tombstone of a timed-out session
        } else if (session->IsIdle(config.idle_timeout) &&
                   session->Transition(SessionState::ACTIVE, SessionState::DESTROYED)) {
            ReleaseSlot();
            total_evictions++;
            evicted = true;
        } else {
            continue;
        }

        EraseEntry(session);
        session->Release(true);
        total_sessions_destroyed++;
        removed++;

        if (evicted) {
            LOG_INFO("session_manager", "Evicted idle session " + session->GetSessionId() +
                     " (idle " + std::to_string(session->GetIdleMs()) + "ms)");
        } else {
            LOG_DEBUG("session_manager", "Dropped expired session " + session->GetSessionId());
        }
    }

    return removed;
}

void SessionManager::Shutdown() {
    accepting = false;

    sweep_running = false;
    sweep_cv.notify_all();
    if (sweep_thread.joinable()) {
        sweep_thread.join();
    }

    std::vector<SessionPtr> all;
    sessions.for_each([&all](const auto& item) {
        all.push_back(item.second);
    });

    for (auto& session : all) {
        if (session->Transition(SessionState::ACTIVE, SessionState::DESTROYED)) {
            ReleaseSlot();
        } else {
            session->Transition(SessionState::EXPIRED, SessionState::DESTROYED);
        }

        std::unique_lock<std::timed_mutex> lock(session->GetExecMutex(), std::try_to_lock);
        if (!lock.owns_lock()) {
            session->InterruptWorker();
            lock.lock();
        }
        session->Release(true);
        EraseEntry(session);
    }

    if (!all.empty()) {
        LOG_INFO("session_manager", "Closed " + std::to_string(all.size()) + " sessions");
    }
}

SessionManager::Stats SessionManager::GetStats() const {
    Stats stats;
    stats.active_sessions = active_sessions.load();
    stats.max_sessions = config.max_sessions;
    stats.total_sessions_created = total_sessions_created.load();
    stats.total_sessions_destroyed = total_sessions_destroyed.load();
    stats.total_evictions = total_evictions.load();
    stats.total_expired = total_expired.load();
    return stats;
}

std::string SessionManager::NextSessionId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("s-{:016x}", rng());
}

std::filesystem::path SessionManager::NextWorkdir(const std::string& session_id) {
    return std::filesystem::path(config.work_root) /
           fmt::format("{}~{}", session_id, ++workdir_generation);
}

bool SessionManager::ReserveSlot() {
    size_t current = active_sessions.load();
    do {
        if (current >= config.max_sessions) {
            return false;
        }
    } while (!active_sessions.compare_exchange_weak(current, current + 1));
    return true;
}

void SessionManager::ReleaseSlot() {
    active_sessions--;
}

bool SessionManager::EraseEntry(const SessionPtr& session) {
    return sessions.erase_if(session->GetSessionId(), [&session](const auto& item) {
        return item.second == session;
    });
}

void SessionManager::StartSweepTimer() {
    sweep_running = true;

    sweep_thread = std::thread([this]() {
        while (sweep_running) {
            // Wait one interval, wake immediately on shutdown
            {
                std::unique_lock<std::mutex> lock(sweep_mutex);
                sweep_cv.wait_for(lock, config.sweep_interval,
                                  [this] { return !sweep_running.load(); });
            }

            if (!sweep_running) break;

            size_t removed = SweepIdleSessions();
            if (removed > 0) {
                LOG_INFO("session_manager", "Sweep removed " + std::to_string(removed) + " sessions");
            }
        }
    });
}

} // namespace sandbox_server
