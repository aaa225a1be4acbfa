//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// session/session.cpp
//
// Session implementation
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "logging/logger.hpp"

namespace sandbox_server {

Session::Session(std::string session_id_p, std::unique_ptr<WorkerProcess> worker_p,
                 SessionFiles files_p)
    : session_id(std::move(session_id_p))
    , created_at(Clock::now())
    , last_active(Clock::now().time_since_epoch().count())
    , worker(std::move(worker_p))
    , files(std::move(files_p)) {
}

Session::~Session() {
    LOG_DEBUG("session", "Session " + session_id + " destructor");
    // WorkerProcess destructor stops the child if Release() was never called
    if (GetState() == SessionState::DESTROYED) {
        files.Remove();
    }
}

bool Session::Transition(SessionState from, SessionState to) {
    return state.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

void Session::Release(bool remove_files, bool force) {
    std::unique_ptr<WorkerProcess> released;
    {
        std::lock_guard<std::mutex> lock(worker_mutex);
        released = std::move(worker);
    }
    if (released) {
        if (force) {
            released->Kill();
        } else {
            released->Shutdown(std::chrono::milliseconds(200));
        }
    }
    if (remove_files) {
        files.Remove();
    }
}

void Session::InterruptWorker() {
    std::lock_guard<std::mutex> lock(worker_mutex);
    if (worker) {
        LOG_DEBUG("session", "Interrupting worker " + std::to_string(worker->GetPid()) +
                  " of session " + session_id);
        worker->Interrupt();
    }
}

bool Session::IsIdle(std::chrono::milliseconds timeout) const {
    return Clock::now() - GetLastActive() > timeout;
}

uint64_t Session::GetIdleMs() const {
    auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - GetLastActive());
    return idle.count() > 0 ? static_cast<uint64_t>(idle.count()) : 0;
}

} // namespace sandbox_server
