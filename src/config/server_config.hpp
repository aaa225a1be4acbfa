//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// config/server_config.hpp
//
// Server configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include "logging/logger.hpp"
#include <string>
#include <thread>
#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>
#include <unistd.h>
#include <climits>
#include <limits>

namespace sandbox_server {

// How a second execute on a busy session is handled
enum class BusyPolicy {
    REJECT,  // fail immediately with SESSION_BUSY
    QUEUE    // wait for the running call, bounded by the caller's deadline
};

inline const char* BusyPolicyToString(BusyPolicy policy) {
    return policy == BusyPolicy::QUEUE ? "queue" : "reject";
}

inline bool ParseBusyPolicy(const std::string& value, BusyPolicy& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "reject") {
        out = BusyPolicy::REJECT;
        return true;
    }
    if (lower == "queue") {
        out = BusyPolicy::QUEUE;
        return true;
    }
    return false;
}

struct ServerConfig {
    // Network
    std::string host = "127.0.0.1";
    uint16_t port = 7421;
    uint16_t http_port = 0;  // 0 = disabled, for health/metrics

    // Logging
    std::string log_file;
    std::string log_level = "info";

    // Process
    std::string pid_file;
    std::string config_file;
    bool daemon = false;

    // Threading
    uint32_t io_threads = 0;  // 0 = auto
    uint32_t executor_threads = 0;  // 0 = auto

    // Sessions
    uint32_t max_sessions = DEFAULT_MAX_SESSIONS;
    uint32_t idle_timeout_ms = DEFAULT_IDLE_TIMEOUT_MS;
    uint32_t sweep_interval_ms = DEFAULT_SWEEP_INTERVAL_MS;
    BusyPolicy busy_policy = BusyPolicy::REJECT;

    // Execution
    uint32_t default_timeout_ms = DEFAULT_EXECUTE_TIMEOUT_MS;
    uint32_t max_timeout_ms = DEFAULT_MAX_EXECUTE_TIMEOUT_MS;
    bool cleanup_on_timeout = true;
    uint64_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
    uint32_t max_rows_rendered = DEFAULT_MAX_ROWS_RENDERED;

    // Worker processes
    std::string worker_path;  // empty = sandboxd-worker next to the server binary
    std::string work_root = "/tmp/sandboxd";
    uint32_t spawn_timeout_ms = DEFAULT_SPAWN_TIMEOUT_MS;
    uint64_t worker_max_memory = 0;  // 0 = unlimited (bytes)
    uint32_t worker_max_cpu_seconds = 0;  // 0 = unlimited
    uint32_t worker_max_open_files = 0;  // 0 = inherit
    uint64_t worker_max_file_size = 0;  // 0 = unlimited (bytes)
    uint32_t worker_threads = 1;  // DuckDB threads per worker

    // Files and limits
    uint64_t max_file_bytes = DEFAULT_MAX_FILE_BYTES;
    uint64_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
    uint32_t max_connections = DEFAULT_MAX_CONNECTIONS;

    uint32_t GetIoThreadCount() const {
        if (io_threads == 0) {
            return std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        return io_threads;
    }

    // Execute calls block an executor thread for their whole duration, so
    // the pool needs room for every session plus the short operations.
    uint32_t GetExecutorThreadCount() const {
        if (executor_threads == 0) {
            return std::max(max_sessions + 2, std::thread::hardware_concurrency());
        }
        return executor_threads;
    }

    bool Validate(std::string& error) const {
        if (port == 0) {
            error = "Invalid port number";
            return false;
        }
        if (max_sessions == 0) {
            error = "Max sessions must be greater than 0";
            return false;
        }
        if (max_connections == 0) {
            error = "Max connections must be greater than 0";
            return false;
        }
        if (default_timeout_ms == 0) {
            error = "Default execute timeout must be greater than 0";
            return false;
        }
        if (default_timeout_ms > max_timeout_ms) {
            error = "Default execute timeout exceeds the maximum timeout";
            return false;
        }
        if (sweep_interval_ms == 0) {
            error = "Sweep interval must be greater than 0";
            return false;
        }
        if (idle_timeout_ms == 0) {
            error = "Idle timeout must be greater than 0";
            return false;
        }
        if (work_root.empty()) {
            error = "Work root must not be empty";
            return false;
        }
        spdlog::level::level_enum level;
        if (!sandboxd::Logger::ParseLevel(log_level, level)) {
            error = "Unknown log level: " + log_level;
            return false;
        }
        return true;
    }

    // Load from config file (auto-detects format by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        bool yaml = (ext == ".yaml" || ext == ".yml");
        ConfigValues values;
        bool loaded = yaml ? LoadYamlFile(path, values, error) : LoadIniFile(path, values, error);
        if (!loaded) {
            return false;
        }
        return Apply(values, yaml, error);
    }

    // Copy every key present in the file into the config
    bool Apply(const ConfigValues& values, bool yaml, std::string& error) {
        for (const auto& binding : Bindings()) {
            const std::string& key = yaml ? binding.yaml_path : binding.ini_key;
            if (values.Has(key) && !binding.apply(*this, values, key)) {
                error = "Invalid value for '" + key + "': " + values.GetString(key);
                return false;
            }
        }
        return true;
    }

private:
    struct Binding {
        std::string ini_key;
        std::string yaml_path;
        std::function<bool(ServerConfig&, const ConfigValues&, const std::string&)> apply;
    };

    template<typename T>
    static Binding Number(const std::string& ini, const std::string& yaml, T ServerConfig::*field) {
        return {ini, yaml, [field](ServerConfig& c, const ConfigValues& s, const std::string& k) {
            int64_t v = 0;
            if (!s.GetInt64(k, v) || v < 0 ||
                static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                return false;
            }
            c.*field = static_cast<T>(v);
            return true;
        }};
    }

    static Binding String(const std::string& ini, const std::string& yaml, std::string ServerConfig::*field) {
        return {ini, yaml, [field](ServerConfig& c, const ConfigValues& s, const std::string& k) {
            c.*field = s.GetString(k);
            return true;
        }};
    }

    static Binding Flag(const std::string& ini, const std::string& yaml, bool ServerConfig::*field) {
        return {ini, yaml, [field](ServerConfig& c, const ConfigValues& s, const std::string& k) {
            return s.GetBool(k, c.*field);
        }};
    }

    static const std::vector<Binding>& Bindings() {
        static const std::vector<Binding> bindings = {
            String("host", "server.host", &ServerConfig::host),
            Number("port", "server.port", &ServerConfig::port),
            Number("http_port", "server.http_port", &ServerConfig::http_port),
            String("log_file", "logging.file", &ServerConfig::log_file),
            String("log_level", "logging.level", &ServerConfig::log_level),
            String("pid_file", "process.pid_file", &ServerConfig::pid_file),
            Flag("daemon", "process.daemon", &ServerConfig::daemon),
            Number("io_threads", "threads.io", &ServerConfig::io_threads),
            Number("executor_threads", "threads.executor", &ServerConfig::executor_threads),
            Number("max_sessions", "sessions.max", &ServerConfig::max_sessions),
            Number("idle_timeout_ms", "sessions.idle_timeout_ms", &ServerConfig::idle_timeout_ms),
            Number("sweep_interval_ms", "sessions.sweep_interval_ms", &ServerConfig::sweep_interval_ms),
            {"busy_policy", "sessions.busy_policy",
             [](ServerConfig& c, const ConfigValues& s, const std::string& k) {
                 return ParseBusyPolicy(s.GetString(k), c.busy_policy);
             }},
            Number("default_timeout_ms", "execution.default_timeout_ms", &ServerConfig::default_timeout_ms),
            Number("max_timeout_ms", "execution.max_timeout_ms", &ServerConfig::max_timeout_ms),
            Flag("cleanup_on_timeout", "execution.cleanup_on_timeout", &ServerConfig::cleanup_on_timeout),
            Number("max_output_bytes", "execution.max_output_bytes", &ServerConfig::max_output_bytes),
            Number("max_rows_rendered", "execution.max_rows_rendered", &ServerConfig::max_rows_rendered),
            String("worker_path", "worker.path", &ServerConfig::worker_path),
            String("work_root", "worker.work_root", &ServerConfig::work_root),
            Number("spawn_timeout_ms", "worker.spawn_timeout_ms", &ServerConfig::spawn_timeout_ms),
            Number("worker_max_memory", "worker.max_memory", &ServerConfig::worker_max_memory),
            Number("worker_max_cpu_seconds", "worker.max_cpu_seconds", &ServerConfig::worker_max_cpu_seconds),
            Number("worker_max_open_files", "worker.max_open_files", &ServerConfig::worker_max_open_files),
            Number("worker_max_file_size", "worker.max_file_size", &ServerConfig::worker_max_file_size),
            Number("worker_threads", "worker.threads", &ServerConfig::worker_threads),
            Number("max_file_bytes", "files.max_bytes", &ServerConfig::max_file_bytes),
            Number("max_message_bytes", "limits.max_message_bytes", &ServerConfig::max_message_bytes),
            Number("max_connections", "limits.max_connections", &ServerConfig::max_connections),
        };
        return bindings;
    }
};

// Directory of the running executable, used to locate sandboxd-worker
inline std::string ExecutableDirectory() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return ".";
    }
    std::string path(buf, static_cast<size_t>(len));
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "." : path.substr(0, slash);
}

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>        Config file path (.conf/.ini or .yaml)\n"
              << "  -h, --host <host>          Host to bind (default: 127.0.0.1)\n"
              << "  -p, --port <port>          Port to bind (default: 7421)\n"
              << "  --http-port <port>         HTTP port for health/metrics (default: disabled)\n"
              << "  --daemon                   Run as daemon (background)\n"
              << "  --pid-file <path>          PID file path\n"
              << "  --log-file <path>          Log file path\n"
              << "  --log-level <level>        Log level (trace, debug, info, warn, error)\n"
              << "  --io-threads <n>           IO thread count (default: auto)\n"
              << "  --executor-threads <n>     Executor thread count (default: auto)\n"
              << "  --max-sessions <n>         Max concurrent sessions (default: 16)\n"
              << "  --max-connections <n>      Max client connections (default: 64)\n"
              << "  --idle-timeout <ms>        Evict sessions idle longer than this (default: 3600000)\n"
              << "  --sweep-interval <ms>      Idle sweep interval (default: 5000)\n"
              << "  --busy-policy <p>          reject | queue (default: reject)\n"
              << "  --timeout <ms>             Default execute timeout (default: 60000)\n"
              << "  --max-timeout <ms>         Upper bound for per-call timeouts (default: 600000)\n"
              << "  --keep-on-timeout          Keep a timed-out session's files until it is destroyed\n"
              << "  --worker <path>            sandboxd-worker executable\n"
              << "  --work-root <dir>          Parent directory of session workdirs (default: /tmp/sandboxd)\n"
              << "  --worker-max-memory <b>    Worker address space limit in bytes (default: unlimited)\n"
              << "  --worker-max-cpu <s>       Worker CPU time limit in seconds (default: unlimited)\n"
              << "  --worker-threads <n>       DuckDB threads per worker (default: 1)\n"
              << "  --version                  Show version info\n"
              << "  --help                     Show this help\n";
}

inline ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    ServerConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // Already processed
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--http-port" && i + 1 < argc) {
            config.http_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--daemon") {
            config.daemon = true;
        } else if (arg == "--pid-file" && i + 1 < argc) {
            config.pid_file = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--io-threads" && i + 1 < argc) {
            config.io_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--executor-threads" && i + 1 < argc) {
            config.executor_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-sessions" && i + 1 < argc) {
            config.max_sessions = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-connections" && i + 1 < argc) {
            config.max_connections = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--idle-timeout" && i + 1 < argc) {
            config.idle_timeout_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--sweep-interval" && i + 1 < argc) {
            config.sweep_interval_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--busy-policy" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!ParseBusyPolicy(value, config.busy_policy)) {
                std::cerr << "Unknown busy policy: " << value << std::endl;
                std::exit(1);
            }
        } else if (arg == "--timeout" && i + 1 < argc) {
            config.default_timeout_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--max-timeout" && i + 1 < argc) {
            config.max_timeout_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--keep-on-timeout") {
            config.cleanup_on_timeout = false;
        } else if (arg == "--worker" && i + 1 < argc) {
            config.worker_path = argv[++i];
        } else if (arg == "--work-root" && i + 1 < argc) {
            config.work_root = argv[++i];
        } else if (arg == "--worker-max-memory" && i + 1 < argc) {
            config.worker_max_memory = static_cast<uint64_t>(std::stoull(argv[++i]));
        } else if (arg == "--worker-max-cpu" && i + 1 < argc) {
            config.worker_max_cpu_seconds = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--worker-threads" && i + 1 < argc) {
            config.worker_threads = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            std::exit(1);
        }
    }

    if (config.worker_path.empty()) {
        config.worker_path = ExecutableDirectory() + "/sandboxd-worker";
    }

    return config;
}

} // namespace sandbox_server
