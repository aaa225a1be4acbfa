//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// common.hpp
//
// Clock types, forward declarations and shared limits
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <unordered_map>

namespace sandbox_server {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

class TcpServer;
class Session;
class SessionManager;
class ExecutorPool;
class ExecutionService;
class WorkerProcess;
struct ServerConfig;

using SessionPtr = std::shared_ptr<Session>;

//===--------------------------------------------------------------------===//
// Limits and defaults shared by the server, the worker and the client
//===--------------------------------------------------------------------===//

// Sessions and connections
constexpr size_t DEFAULT_MAX_SESSIONS = 16;
constexpr size_t DEFAULT_MAX_CONNECTIONS = 64;
constexpr size_t MAX_SESSION_ID_LENGTH = 64;
constexpr uint32_t DEFAULT_IDLE_TIMEOUT_MS = 60 * 60 * 1000;
constexpr uint32_t DEFAULT_SWEEP_INTERVAL_MS = 5000;

// Destroy requests run here, never behind queued executes
constexpr size_t SESSION_CONTROL_THREADS = 2;

// Execute deadlines
constexpr uint32_t DEFAULT_EXECUTE_TIMEOUT_MS = 60 * 1000;
constexpr uint32_t DEFAULT_MAX_EXECUTE_TIMEOUT_MS = 10 * 60 * 1000;

// Worker startup and output
constexpr uint32_t DEFAULT_SPAWN_TIMEOUT_MS = 10000;
constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 1 << 20;  // per stream
constexpr size_t DEFAULT_MAX_ROWS_RENDERED = 40;

// Sizes on the wire and on disk
constexpr size_t DEFAULT_MAX_FILE_BYTES = 64 << 20;
constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 128 << 20;

} // namespace sandbox_server
