//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// sandbox/worker_process.cpp
//
// Worker process lifecycle: fork/exec, handshake, calls, kill
//===----------------------------------------------------------------------===//

#include "sandbox/worker_process.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandbox_server {

namespace {

// fd number the worker expects its channel on
constexpr int WORKER_CHANNEL_FD = 3;

void SetLimit(int resource, uint64_t value) {
    if (value == 0) {
        return;
    }
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    setrlimit(resource, &rl);
}

// Drop every descriptor above the channel: listeners, client sockets and
// log files of the server must not reach session code
void CloseInheritedFds() {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, WORKER_CHANNEL_FD + 1, ~0U, 0) == 0) {
        return;
    }
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) {
        max_fd = 65536;
    }
    for (int fd = WORKER_CHANNEL_FD + 1; fd < max_fd; fd++) {
        close(fd);
    }
}

std::vector<std::string> BuildArguments(const WorkerProcess::Options& options) {
    return {
        options.worker_path,
        "--channel-fd", std::to_string(WORKER_CHANNEL_FD),
        "--workdir", options.workdir,
        "--session", options.session_id,
        "--threads", std::to_string(options.threads),
        "--max-memory", std::to_string(options.max_memory),
        "--max-output-bytes", std::to_string(options.max_output_bytes),
        "--max-rows", std::to_string(options.max_rows_rendered),
        "--max-message-bytes", std::to_string(options.max_message_bytes),
        "--log-level", options.log_level,
    };
}

// Runs in the forked child; only async-signal-safe calls from here on
[[noreturn]] void ExecWorker(const WorkerProcess::Options& options, int channel_fd,
                             char* const* argv) {
    setpgid(0, 0);

    // The server blocks its shutdown signals in every thread; the worker
    // starts with a clean mask
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    signal(SIGPIPE, SIG_DFL);

    if (channel_fd == WORKER_CHANNEL_FD) {
        fcntl(channel_fd, F_SETFD, 0);
    } else if (dup2(channel_fd, WORKER_CHANNEL_FD) < 0) {
        _exit(127);
    }

    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDOUT_FILENO);
        if (devnull > WORKER_CHANNEL_FD) {
            close(devnull);
        }
    }

    CloseInheritedFds();

    SetLimit(RLIMIT_AS, options.max_memory);
    SetLimit(RLIMIT_CPU, options.max_cpu_seconds);
    SetLimit(RLIMIT_NOFILE, options.max_open_files);
    SetLimit(RLIMIT_FSIZE, options.max_file_size);

    execv(argv[0], argv);
    _exit(127);
}

} // anonymous namespace

WorkerProcess::WorkerProcess(pid_t pid, int fd, size_t max_message_bytes)
    : pid_(pid)
    , channel_(fd, max_message_bytes) {
}

WorkerProcess::~WorkerProcess() {
    if (!reaped_) {
        Shutdown(std::chrono::milliseconds(200));
    }
}

std::unique_ptr<WorkerProcess> WorkerProcess::Spawn(const Options& options) {
    if (access(options.worker_path.c_str(), X_OK) != 0) {
        throw SandboxError(ErrorCode::ENGINE_START_FAILED,
                           "Worker executable not usable: " + options.worker_path +
                           " (" + strerror(errno) + ")");
    }

    // Prepare argv before fork
    auto args = BuildArguments(options);
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        throw SandboxError(ErrorCode::ENGINE_START_FAILED,
                           std::string("socketpair failed: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw SandboxError(ErrorCode::ENGINE_START_FAILED,
                           std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        ExecWorker(options, fds[1], argv.data());
    }

    // Parent: set the group too so a kill right after fork cannot miss
    setpgid(pid, pid);
    close(fds[1]);

    std::unique_ptr<WorkerProcess> worker(new WorkerProcess(pid, fds[0], options.max_message_bytes));

    auto deadline = Clock::now() + std::chrono::milliseconds(options.spawn_timeout_ms);
    Message ready;
    std::string error;
    auto status = worker->channel_.Receive(ready, deadline, error);
    if (status != FrameChannel::Status::OK || ready.GetType() != MessageType::WORKER_READY) {
        worker->Kill();
        if (status == FrameChannel::Status::OK) {
            error = std::string("unexpected ") + MessageTypeToString(ready.GetType()) +
                    " during handshake";
        }
        throw SandboxError(ErrorCode::ENGINE_START_FAILED,
                           "Worker for session " + options.session_id + " did not start: " + error);
    }

    try {
        auto payload = WorkerReadyPayload::Deserialize(ready.GetPayload());
        worker->engine_version_ = payload.engine_version;
    } catch (const ProtocolException& e) {
        worker->Kill();
        throw SandboxError(ErrorCode::ENGINE_START_FAILED, e.what());
    }

    LOG_DEBUG("worker", "Worker " + std::to_string(pid) + " ready for session " +
              options.session_id + " (" + worker->engine_version_ + ")");
    return worker;
}

WorkerProcess::CallStatus WorkerProcess::Call(Message request, Message& reply,
                                              TimePoint deadline, std::string& error) {
    if (reaped_) {
        error = "worker has exited";
        return CallStatus::CRASHED;
    }

    uint32_t request_id = next_request_id_++;
    request.SetRequestId(request_id);

    auto status = channel_.Send(request, error);
    if (status != FrameChannel::Status::OK) {
        return CallStatus::CRASHED;
    }

    while (true) {
        status = channel_.Receive(reply, deadline, error);
        if (status == FrameChannel::Status::TIMEOUT) {
            return CallStatus::TIMEOUT;
        }
        if (status != FrameChannel::Status::OK) {
            if (TryReap() && WIFSIGNALED(exit_status_)) {
                error += std::string(" (worker killed by signal ") +
                         strsignal(WTERMSIG(exit_status_)) + ")";
            }
            return CallStatus::CRASHED;
        }
        // A reply left over from an earlier abandoned call is skipped
        if (reply.GetRequestId() == request_id) {
            return CallStatus::OK;
        }
        LOG_WARN("worker", "Discarding stale reply " + std::to_string(reply.GetRequestId()) +
                 " from worker " + std::to_string(pid_));
    }
}

void WorkerProcess::Kill() {
    channel_.Close();
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) {
        return;
    }

    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);

    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    reaped_ = true;
    exit_status_ = status;

    LOG_DEBUG("worker", "Worker " + std::to_string(pid_) + " killed");
}

void WorkerProcess::Interrupt() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!reaped_) {
        kill(-pid_, SIGKILL);
    }
}

void WorkerProcess::Shutdown(std::chrono::milliseconds grace) {
    if (reaped_) {
        channel_.Close();
        return;
    }

    std::string error;
    if (channel_.Send(Message(MessageType::SHUTDOWN), error) == FrameChannel::Status::OK) {
        auto deadline = Clock::now() + grace;
        while (Clock::now() < deadline) {
            if (TryReap()) {
                channel_.Close();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    Kill();
}

bool WorkerProcess::IsAlive() {
    return !TryReap();
}

bool WorkerProcess::TryReap() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
        exit_status_ = status;
        // Take down anything the worker left behind in its group
        kill(-pid_, SIGKILL);
        return true;
    }
    return false;
}

} // namespace sandbox_server
