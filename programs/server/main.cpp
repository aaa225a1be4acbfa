//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// programs/server/main.cpp
//
// Server main entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/server_config.hpp"
#include "network/tcp_server.hpp"
#include "session/session_manager.hpp"
#include "executor/executor_pool.hpp"
#include "executor/execution_service.hpp"
#include "http/http_server.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <climits>
#include <csignal>
#include <cstring>
#include <iostream>
#include <fstream>
#include <unistd.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <execinfo.h>

#ifdef SANDBOXD_WITH_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

using namespace sandbox_server;

namespace {

//===----------------------------------------------------------------------===//
// Process Setup
//===----------------------------------------------------------------------===//

// Path of the pid file, kept in a plain buffer so the crash handler can unlink it
char g_pid_path[PATH_MAX] = {0};

void PrintVersion() {
    std::cout << "SandboxD Server " << SANDBOXD_VERSION << "\n"
              << "Git commit: " << SANDBOXD_GIT_COMMIT << "\n"
              << "Build type: " << SANDBOXD_BUILD_TYPE << "\n"
              << "Build time: " << SANDBOXD_BUILD_TIME << "\n";
}

// Fork, let the parent exit, continue in the child
bool ContinueInChild(const char* stage) {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork (" << stage << "): " << strerror(errno) << std::endl;
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }
    return true;
}

bool Daemonize() {
    if (!ContinueInChild("detach")) {
        return false;
    }
    if (setsid() < 0) {
        std::cerr << "Failed to create new session: " << strerror(errno) << std::endl;
        return false;
    }
    // The second fork gives up session leadership so no terminal is reacquired
    if (!ContinueInChild("session")) {
        return false;
    }

    umask(027);
    if (chdir("/") < 0) {
        std::cerr << "Failed to enter /: " << strerror(errno) << std::endl;
        return false;
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) {
        return false;
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        dup2(null_fd, fd);
    }
    if (null_fd > STDERR_FILENO) {
        close(null_fd);
    }
    return true;
}

bool WritePidFile(const std::string& path) {
    if (path.empty()) {
        return true;
    }
    if (path.size() >= sizeof(g_pid_path)) {
        std::cerr << "PID file path too long: " << path << std::endl;
        return false;
    }
    std::ofstream file(path, std::ios::trunc);
    if (!(file << getpid() << "\n")) {
        std::cerr << "Failed to write PID file: " << path << std::endl;
        return false;
    }
    std::strncpy(g_pid_path, path.c_str(), sizeof(g_pid_path) - 1);
    return true;
}

void RemovePidFile() {
    if (g_pid_path[0] != '\0') {
        unlink(g_pid_path);
        g_pid_path[0] = '\0';
    }
}

// Fatal signals: dump the raw stack to stderr, drop the pid file, die with
// the original signal
void CrashHandler(int signal) {
    const char* banner = "\n!!! SandboxD Server crashed, stack follows !!!\n";
    ssize_t ignored = write(STDERR_FILENO, banner, strlen(banner));
    (void)ignored;

    void* frames[64];
    int depth = backtrace(frames, 64);
    backtrace_symbols_fd(frames, depth, STDERR_FILENO);

    if (g_pid_path[0] != '\0') {
        unlink(g_pid_path);
    }

    std::signal(signal, SIG_DFL);
    raise(signal);
}

void InstallCrashHandlers() {
    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS}) {
        std::signal(sig, CrashHandler);
    }
}

void NotifySystemd(const char* state) {
#ifdef SANDBOXD_WITH_SYSTEMD
    sd_notify(0, state);
#else
    (void)state;
#endif
}

//===----------------------------------------------------------------------===//
// Server Runtime
//===----------------------------------------------------------------------===//

SessionManager::Config MakeSessionConfig(const ServerConfig& config) {
    SessionManager::Config result;
    result.max_sessions = config.max_sessions;
    result.idle_timeout = std::chrono::milliseconds(config.idle_timeout_ms);
    result.sweep_interval = std::chrono::milliseconds(config.sweep_interval_ms);
    result.work_root = config.work_root;
    result.max_file_bytes = config.max_file_bytes;

    auto& worker = result.worker;
    worker.worker_path = config.worker_path;
    // Workers stay quiet unless the server itself is being debugged
    worker.log_level = config.log_level == "trace" || config.log_level == "debug"
                           ? config.log_level : "warn";
    worker.spawn_timeout_ms = config.spawn_timeout_ms;
    worker.max_memory = config.worker_max_memory;
    worker.max_cpu_seconds = config.worker_max_cpu_seconds;
    worker.max_open_files = config.worker_max_open_files;
    worker.max_file_size = config.worker_max_file_size;
    worker.threads = config.worker_threads;
    worker.max_output_bytes = config.max_output_bytes;
    worker.max_rows_rendered = config.max_rows_rendered;
    worker.max_message_bytes = config.max_message_bytes;
    return result;
}

void LogStartup(const ServerConfig& config) {
    DLOG_INFO("main", "Starting SandboxD Server {} on {}:{}", SANDBOXD_VERSION, config.host, config.port);
    DLOG_INFO("main", "  worker {} under {}", config.worker_path, config.work_root);
    DLOG_INFO("main", "  threads: io={} executor={}", config.GetIoThreadCount(),
              config.GetExecutorThreadCount());
    DLOG_INFO("main", "  limits: sessions={} connections={}", config.max_sessions,
              config.max_connections);
    DLOG_INFO("main", "  timeouts: default={}ms max={}ms idle={}ms",
              config.default_timeout_ms, config.max_timeout_ms, config.idle_timeout_ms);
    DLOG_INFO("main", "  busy policy {}, cleanup on timeout {}",
              BusyPolicyToString(config.busy_policy), config.cleanup_on_timeout);
    if (config.http_port > 0) {
        DLOG_INFO("main", "  http on port {}", config.http_port);
    }
}

// Owns every long-lived component. Stop runs in dependency order: no new
// requests, then no workers, then no threads.
struct ServerRuntime {
    explicit ServerRuntime(const ServerConfig& config_p) : config(config_p) {}
    ~ServerRuntime() { Stop(); }

    void Start() {
        sessions = std::make_unique<SessionManager>(MakeSessionConfig(config));
        service = std::make_shared<ExecutionService>(
            *sessions, ExecutionService::Config::FromServerConfig(config));

        executors = std::make_shared<ExecutorPool>(config.GetExecutorThreadCount());
        executors->Start();

        server = std::make_unique<TcpServer>(config, service, executors);
        server->Start();

        if (config.http_port > 0) {
            http = std::make_unique<HttpServer>(config.host, config.http_port, server.get());
            http->Start();
        }
    }

    void Stop() {
        if (http) {
            http->Stop();
            http.reset();
        }
        if (server) {
            server->Stop();
        }
        // Killing the workers first makes in-flight calls return at once
        if (sessions) {
            sessions->Shutdown();
        }
        if (executors) {
            executors->Stop();
        }
        // Handler tasks may still reference the server until the pools are joined
        server.reset();
    }

    // SIGHUP: only the log level applies without a restart
    void Reload() {
        if (config.config_file.empty()) {
            LOG_WARN("main", "No config file specified, cannot reload");
            return;
        }

        ServerConfig fresh;
        std::string error;
        if (!fresh.LoadFromFile(config.config_file, error)) {
            LOG_ERROR("main", "Failed to reload " + config.config_file + ": " + error);
            return;
        }
        if (fresh.log_level == config.log_level) {
            LOG_INFO("main", "Configuration reloaded, nothing to apply");
            return;
        }
        if (!sandboxd::Logger::SetLevel(fresh.log_level)) {
            LOG_ERROR("main", "Reload ignored unknown log level " + fresh.log_level);
            return;
        }
        config.log_level = fresh.log_level;
        LOG_INFO("main", "Log level changed to " + fresh.log_level);
    }

    ServerConfig config;
    std::unique_ptr<SessionManager> sessions;
    std::shared_ptr<ExecutionService> service;
    std::shared_ptr<ExecutorPool> executors;
    std::unique_ptr<TcpServer> server;
    std::unique_ptr<HttpServer> http;
};

// Block until SIGINT or SIGTERM, reloading on SIGHUP
void WaitForShutdown(ServerRuntime& runtime, const sigset_t& signals) {
    int sig = 0;
    while (sigwait(&signals, &sig) == 0) {
        if (sig != SIGHUP) {
            DLOG_INFO("main", "Received {}, shutting down", strsignal(sig));
            return;
        }
        runtime.Reload();
    }
}

int Run(const ServerConfig& config) {
    if (config.daemon && !Daemonize()) {
        return 1;
    }

    sandboxd::LogOptions log_options;
    log_options.file = config.log_file;
    log_options.level = config.log_level;
    sandboxd::Logger::Initialize(log_options);

    if (!WritePidFile(config.pid_file)) {
        return 1;
    }

    // Shutdown signals are taken synchronously by sigwait on this thread.
    // Threads started later inherit the mask and never see them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
    InstallCrashHandlers();

    LogStartup(config);

    if (access(config.worker_path.c_str(), X_OK) != 0) {
        LOG_ERROR("main", "Worker executable not usable: " + config.worker_path + ": " +
                  strerror(errno));
        RemovePidFile();
        return 1;
    }

    {
        ServerRuntime runtime(config);
        runtime.Start();

        LOG_INFO("main", "SandboxD Server is ready to accept connections");
        NotifySystemd("READY=1");

        WaitForShutdown(runtime, signals);

        NotifySystemd("STOPPING=1");
        runtime.Stop();
    }

    RemovePidFile();
    LOG_INFO("main", "SandboxD Server stopped");
    sandboxd::Logger::Shutdown();
    return 0;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        bool show_version = false;
        ServerConfig config = ParseCommandLine(argc, argv, show_version);
        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        return Run(config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        RemovePidFile();
        return 1;
    }
}
