//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// logging/logger.hpp
//
// Logging utilities based on spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sandboxd {

// Where console output goes. Workers log to stderr so that their stdout
// stays free for captured script output.
enum class ConsoleTarget {
    STDOUT,
    STDERR
};

struct LogOptions {
    // Rotating log file; empty logs to the console only
    std::string file;
    std::string level = "info";
    // Logger name printed with every line
    std::string name = "sandboxd";
    ConsoleTarget console = ConsoleTarget::STDOUT;
    size_t max_file_bytes = 100 * 1024 * 1024;
    size_t max_files = 3;
};

class Logger {
public:
    // Set up the process logger. A second call is ignored until Shutdown.
    // An unknown level logs at info.
    static void Initialize(const LogOptions& options = LogOptions());

    // Flush and drop all sinks
    static void Shutdown();

    // The process logger; initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    // Change the level at runtime. Returns false and keeps the current
    // level when the name is unknown.
    static bool SetLevel(const std::string& level);

    static void Flush();

    // Accepts trace, debug, info, warn/warning, error, fatal/critical, any case
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& level);

    static bool IsInitialized() { return initialized_; }

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace sandboxd

// Every line is prefixed with its component: "[session] created s-1".
// The string argument is only built when the level is enabled.
#define SANDBOXD_LOG(level, component, message) \
    do { \
        auto& sandboxd_logger_ = sandboxd::Logger::Get(); \
        if (sandboxd_logger_->should_log(level)) { \
            sandboxd_logger_->log(level, "[{}] {}", component, message); \
        } \
    } while (0)

#define LOG_TRACE(component, message) SANDBOXD_LOG(spdlog::level::trace, component, message)
#define LOG_DEBUG(component, message) SANDBOXD_LOG(spdlog::level::debug, component, message)
#define LOG_INFO(component, message)  SANDBOXD_LOG(spdlog::level::info, component, message)
#define LOG_WARN(component, message)  SANDBOXD_LOG(spdlog::level::warn, component, message)
#define LOG_ERROR(component, message) SANDBOXD_LOG(spdlog::level::err, component, message)
#define LOG_FATAL(component, message) SANDBOXD_LOG(spdlog::level::critical, component, message)

// fmt-style: DLOG_INFO("executor", "session {} took {}ms", id, ms)
#define SANDBOXD_DLOG(level, component, fmt, ...) \
    sandboxd::Logger::Get()->log(level, "[{}] " fmt, component, ##__VA_ARGS__)

#define DLOG_TRACE(component, fmt, ...) SANDBOXD_DLOG(spdlog::level::trace, component, fmt, ##__VA_ARGS__)
#define DLOG_DEBUG(component, fmt, ...) SANDBOXD_DLOG(spdlog::level::debug, component, fmt, ##__VA_ARGS__)
#define DLOG_INFO(component, fmt, ...)  SANDBOXD_DLOG(spdlog::level::info, component, fmt, ##__VA_ARGS__)
#define DLOG_WARN(component, fmt, ...)  SANDBOXD_DLOG(spdlog::level::warn, component, fmt, ##__VA_ARGS__)
#define DLOG_ERROR(component, fmt, ...) SANDBOXD_DLOG(spdlog::level::err, component, fmt, ##__VA_ARGS__)
#define DLOG_FATAL(component, fmt, ...) SANDBOXD_DLOG(spdlog::level::critical, component, fmt, ##__VA_ARGS__)
