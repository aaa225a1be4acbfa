//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// sandbox/worker_process.hpp
//
// Handle to an isolated sandboxd-worker child process
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include "sandbox/frame_channel.hpp"
#include <mutex>
#include <sys/types.h>

namespace sandbox_server {

class WorkerProcess {
public:
    struct Options {
        std::string worker_path;
        std::string workdir;
        std::string session_id;
        std::string log_level = "warn";
        uint32_t spawn_timeout_ms = DEFAULT_SPAWN_TIMEOUT_MS;

        // Resource limits applied in the child before exec (0 = unchanged)
        uint64_t max_memory = 0;
        uint32_t max_cpu_seconds = 0;
        uint32_t max_open_files = 0;
        uint64_t max_file_size = 0;

        // Engine settings forwarded on the command line
        uint32_t threads = 1;
        uint64_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
        uint32_t max_rows_rendered = DEFAULT_MAX_ROWS_RENDERED;
        uint64_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
    };

    enum class CallStatus {
        OK,
        TIMEOUT,   // deadline passed with no reply; the worker is still running
        CRASHED    // channel broke or the worker exited
    };

    // Fork and exec the worker, then wait for its ready handshake.
    // Throws SandboxError(ENGINE_START_FAILED) on failure.
    static std::unique_ptr<WorkerProcess> Spawn(const Options& options);

    // Asks the worker to exit, then kills it if it does not
    ~WorkerProcess();

    // Non-copyable
    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    // Send one request and wait for its reply until deadline
    CallStatus Call(Message request, Message& reply, TimePoint deadline, std::string& error);

    // SIGKILL the worker's process group and reap it
    void Kill();

    // SIGKILL without reaping or touching the channel. Safe from another
    // thread while Call runs; does nothing once the worker has been reaped.
    void Interrupt();

    // Graceful stop: SHUTDOWN, wait up to grace, then Kill
    void Shutdown(std::chrono::milliseconds grace);

    bool IsAlive();

    pid_t GetPid() const { return pid_; }
    const std::string& GetEngineVersion() const { return engine_version_; }

private:
    WorkerProcess(pid_t pid, int fd, size_t max_message_bytes);

    // Non-blocking reap; true once the child is gone
    bool TryReap();

    pid_t pid_;
    FrameChannel channel_;

    // Reaping and Interrupt() are serialized so a signal never reaches a
    // recycled pid
    std::mutex reap_mutex_;
    bool reaped_ = false;
    int exit_status_ = 0;
    uint32_t next_request_id_ = 1;
    std::string engine_version_;
};

} // namespace sandbox_server
