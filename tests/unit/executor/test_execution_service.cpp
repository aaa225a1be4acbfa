//===----------------------------------------------------------------------===//
//                         SandboxD Server - Unit Tests
//
// tests/unit/executor/test_execution_service.cpp
//
// Unit tests for ExecutionService with real worker processes
//===----------------------------------------------------------------------===//

#include "executor/execution_service.hpp"
#include "errors.hpp"
#include <cassert>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace sandbox_server;
namespace fs = std::filesystem;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static const char* RUNAWAY_QUERY =
    "WITH RECURSIVE r(n) AS (SELECT 1::BIGINT UNION ALL SELECT n + 1 FROM r) "
    "SELECT count(*) FROM r;";

static SessionManager::Config MakeManagerConfig(const std::string& name) {
    SessionManager::Config config;
    config.max_sessions = 4;
    config.sweep_interval = std::chrono::hours(1);
    config.work_root = (fs::temp_directory_path() /
                        ("sandboxd_test_exec_" + std::to_string(getpid()) + "_" + name)).string();
    config.worker.worker_path = SANDBOXD_WORKER_PATH;
    config.worker.spawn_timeout_ms = 10000;
    return config;
}

static ExecutionService::Config MakeServiceConfig() {
    ExecutionService::Config config;
    config.default_timeout_ms = 10000;
    config.max_timeout_ms = 20000;
    return config;
}

static ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SandboxError& e) {
        return e.GetCode();
    }
    return ErrorCode::OK;
}

static std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

//===----------------------------------------------------------------------===//
// Execution Tests
//===----------------------------------------------------------------------===//

void TestStatePersistsAcrossExecutes() {
    std::cout << "  Testing state persists across executes..." << std::endl;

    SessionManager manager(MakeManagerConfig("persist"));
    ExecutionService service(manager, MakeServiceConfig());

    auto id = service.CreateSession("study");
    assert(id == "study");

    auto result = service.Execute(id,
        "CREATE TABLE trial AS SELECT range AS id, range % 2 = 0 AS treated, "
        "CASE WHEN range % 2 = 0 THEN 3.0 ELSE 1.0 END AS outcome FROM range(10);");
    assert(result.IsOk());

    result = service.Execute(id,
        "SELECT avg(outcome) FILTER (WHERE treated) - avg(outcome) FILTER (WHERE NOT treated) "
        "FROM trial;");
    assert(result.IsOk());
    assert(result.display_value == "2.0");
    assert(result.elapsed_us > 0);

    assert(service.Execute(id, "SET VARIABLE ate = 0.5;").IsOk());
    auto value = service.GetVariable(id, "ate");
    assert(value.found);
    assert(value.value == "0.5");

    auto list = service.ListVariables(id);
    bool saw_table = false;
    for (const auto& binding : list.bindings) {
        if (binding.kind == "table" && binding.name == "trial") {
            saw_table = true;
        }
    }
    assert(saw_table);

    auto metrics = service.GetMetrics();
    assert(metrics.total_executions == 3);
    assert(metrics.total_ok == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestFaultDoesNotEndSession() {
    std::cout << "  Testing a fault leaves the session usable..." << std::endl;

    SessionManager manager(MakeManagerConfig("fault"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("");

    assert(service.Execute(id, "SET VARIABLE keep = 5;").IsOk());

    auto result = service.Execute(id, "SELECT 'abc'::INTEGER;");
    assert(result.status == ExecutionStatus::FAULTED);
    assert(result.fault.kind == "Conversion");

    result = service.Execute(id, "SELECT getvariable('keep');");
    assert(result.IsOk());
    assert(result.display_value == "5");
    assert(service.GetMetrics().total_faulted == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestUnknownSession() {
    std::cout << "  Testing unknown session..." << std::endl;

    SessionManager manager(MakeManagerConfig("unknown"));
    ExecutionService service(manager, MakeServiceConfig());

    auto result = service.Execute("missing", "SELECT 1;");
    assert(result.status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(CodeOf([&] { service.GetVariable("missing", "x"); }) == ErrorCode::SESSION_NOT_FOUND);
    assert(CodeOf([&] { service.ListFiles("missing"); }) == ErrorCode::SESSION_NOT_FOUND);
    assert(CodeOf([&] { service.DestroySession("missing"); }) == ErrorCode::SESSION_NOT_FOUND);

    std::cout << "    PASSED" << std::endl;
}

void TestDestroyThenExecute() {
    std::cout << "  Testing execute after destroy..." << std::endl;

    SessionManager manager(MakeManagerConfig("destroy"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("short-lived");

    assert(service.Execute(id, "SELECT 1;").IsOk());
    service.DestroySession(id);

    auto result = service.Execute(id, "SELECT 1;");
    assert(result.status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(CodeOf([&] { service.DestroySession(id); }) == ErrorCode::SESSION_NOT_FOUND);

    std::cout << "    PASSED" << std::endl;
}

void TestDestroyDuringExecute() {
    std::cout << "  Testing destroy interrupts a running execute..." << std::endl;

    SessionManager manager(MakeManagerConfig("destroy_running"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("interrupted");

    ExecutionResult result;
    std::thread runner([&]() {
        result = service.Execute(id, RUNAWAY_QUERY, 15000);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    auto start = std::chrono::steady_clock::now();
    service.DestroySession(id);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    runner.join();

    assert(result.status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(manager.GetActiveSessionCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Busy Tests
//===----------------------------------------------------------------------===//

void TestBusyRejected() {
    std::cout << "  Testing concurrent execute is rejected..." << std::endl;

    SessionManager manager(MakeManagerConfig("busy"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("busy");

    ExecutionResult first;
    std::thread runner([&]() {
        first = service.Execute(id, RUNAWAY_QUERY, 1500);
    });

    // Let the first call take the session
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto second = service.Execute(id, "SELECT 1;");
    assert(second.status == ExecutionStatus::SESSION_BUSY);
    assert(CodeOf([&] { service.ListFiles(id); }) == ErrorCode::SESSION_BUSY);

    runner.join();
    assert(first.status == ExecutionStatus::TIMED_OUT);
    assert(service.GetMetrics().total_busy == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestBusyQueued() {
    std::cout << "  Testing queue policy waits for the session..." << std::endl;

    SessionManager manager(MakeManagerConfig("queue"));
    auto config = MakeServiceConfig();
    config.busy_policy = BusyPolicy::QUEUE;
    ExecutionService service(manager, config);
    auto id = service.CreateSession("queued");
    auto session = manager.GetSession(id);

    // Another thread stands in for a running call
    auto hold_for = [&session](std::chrono::milliseconds duration, std::promise<void>& locked) {
        return std::thread([&session, duration, &locked]() {
            std::lock_guard<std::timed_mutex> lock(session->GetExecMutex());
            locked.set_value();
            std::this_thread::sleep_for(duration);
        });
    };

    std::promise<void> first_locked;
    auto holder = hold_for(std::chrono::milliseconds(300), first_locked);
    first_locked.get_future().wait();

    auto result = service.Execute(id, "SELECT 'after wait';");
    holder.join();
    assert(result.IsOk());
    assert(result.display_value == "after wait");
    assert(result.elapsed_us >= 200000);

    // Still held at the deadline: reported busy
    std::promise<void> second_locked;
    holder = hold_for(std::chrono::milliseconds(1000), second_locked);
    second_locked.get_future().wait();
    result = service.Execute(id, "SELECT 1;", 200);
    assert(result.status == ExecutionStatus::SESSION_BUSY);
    holder.join();

    // Freed with almost nothing left of the deadline: not sent, session kept
    std::promise<void> third_locked;
    holder = hold_for(std::chrono::milliseconds(280), third_locked);
    third_locked.get_future().wait();
    result = service.Execute(id, "SELECT 1;", 300);
    holder.join();
    assert(result.status == ExecutionStatus::SESSION_BUSY);
    assert(session->IsActive());
    assert(service.GetMetrics().total_timeouts == 0);
    assert(service.Execute(id, "SELECT 'still here';").display_value == "still here");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Timeout Tests
//===----------------------------------------------------------------------===//

void TestTimeoutExpiresSession() {
    std::cout << "  Testing timeout expires the session..." << std::endl;

    SessionManager manager(MakeManagerConfig("timeout"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("slow");
    assert(service.Execute(id, "SET VARIABLE before = 1;").IsOk());

    auto start = std::chrono::steady_clock::now();
    auto result = service.Execute(id, RUNAWAY_QUERY, 2000);
    auto waited = std::chrono::steady_clock::now() - start;

    assert(result.status == ExecutionStatus::TIMED_OUT);
    assert(result.fault.kind == "TimedOut");
    assert(waited >= std::chrono::milliseconds(2000));
    assert(waited <= std::chrono::milliseconds(2500));

    // The session is gone for every later call
    auto after = service.Execute(id, "SELECT getvariable('before');");
    assert(after.status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(CodeOf([&] { service.GetVariable(id, "before"); }) == ErrorCode::SESSION_NOT_FOUND);

    auto status = service.Status(id);
    assert(status.session_state == SessionState::EXPIRED);
    assert(status.total_timeouts == 1);
    assert(status.active_sessions == 0);

    // Capacity came back; the id can be created again with fresh state
    auto again = service.CreateSession(id);
    auto fresh = service.Execute(again, "SELECT getvariable('before') IS NULL;");
    assert(fresh.IsOk());
    assert(fresh.display_value == "true");

    std::cout << "    PASSED" << std::endl;
}

void TestTimeoutClamped() {
    std::cout << "  Testing timeout defaults and clamping..." << std::endl;

    SessionManager manager(MakeManagerConfig("clamp"));
    auto config = MakeServiceConfig();
    config.default_timeout_ms = 1000;
    config.max_timeout_ms = 5000;
    ExecutionService service(manager, config);

    assert(service.EffectiveTimeoutMs(0) == 1000);
    assert(service.EffectiveTimeoutMs(300) == 300);
    assert(service.EffectiveTimeoutMs(60000) == 5000);

    std::cout << "    PASSED" << std::endl;
}

void TestKeepFilesOnTimeout() {
    std::cout << "  Testing files kept after timeout when configured..." << std::endl;

    auto manager_config = MakeManagerConfig("keep");
    SessionManager manager(manager_config);
    auto config = MakeServiceConfig();
    config.cleanup_on_timeout = false;
    ExecutionService service(manager, config);

    auto id = service.CreateSession("kept");
    auto workdir = manager.FindSession(id)->GetFiles().GetRoot();
    service.PutFile(id, "input.csv", Bytes("a\n1\n"));
    auto result = service.Execute(id, RUNAWAY_QUERY, 500);
    assert(result.status == ExecutionStatus::TIMED_OUT);
    assert(fs::exists(workdir / "input.csv"));

    // Destroy clears the tombstone and its files
    service.DestroySession(id);
    assert(!fs::exists(workdir));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Crash Tests
//===----------------------------------------------------------------------===//

void TestWorkerCrash() {
    std::cout << "  Testing a crashed worker expires the session..." << std::endl;

    SessionManager manager(MakeManagerConfig("crash"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("fragile");
    pid_t pid = manager.GetSession(id)->GetWorker()->GetPid();

    std::thread killer([pid]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        kill(pid, SIGKILL);
    });
    auto result = service.Execute(id, RUNAWAY_QUERY, 15000);
    killer.join();

    assert(result.status == ExecutionStatus::FAULTED);
    assert(result.fault.kind == "EngineCrashed");
    assert(service.Execute(id, "SELECT 1;").status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(service.GetMetrics().total_crashes == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestInspectionFailures() {
    std::cout << "  Testing variable calls on a stuck or dead worker..." << std::endl;

    SessionManager manager(MakeManagerConfig("inspect_fail"));
    ExecutionService service(manager, MakeServiceConfig());

    // A stopped worker never answers
    auto stuck = service.CreateSession("stuck");
    pid_t stuck_pid = manager.GetSession(stuck)->GetWorker()->GetPid();
    kill(stuck_pid, SIGSTOP);
    auto start = std::chrono::steady_clock::now();
    assert(CodeOf([&] { service.GetVariable(stuck, "x", 300); }) == ErrorCode::TIMED_OUT);
    assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1500));
    assert(service.Status(stuck).session_state == SessionState::EXPIRED);
    assert(service.GetMetrics().total_timeouts == 1);

    // A killed worker
    auto dead = service.CreateSession("dead");
    pid_t dead_pid = manager.GetSession(dead)->GetWorker()->GetPid();
    kill(dead_pid, SIGKILL);
    assert(CodeOf([&] { service.ListVariables(dead); }) == ErrorCode::ENGINE_FAILURE);
    assert(service.Status(dead).session_state == SessionState::EXPIRED);
    assert(CodeOf([&] { service.ListVariables(dead); }) == ErrorCode::SESSION_NOT_FOUND);
    assert(service.GetMetrics().total_crashes == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestDecodeExecuteReply() {
    std::cout << "  Testing worker replies to EXECUTE are decoded strictly..." << std::endl;

    // An ERROR from the worker is the fragment's fault, not the channel's
    Message worker_error(MessageType::ERROR,
                         ErrorPayload(ErrorCode::ENGINE_FAILURE, "out of memory").Serialize());
    auto faulted = ExecutionService::DecodeExecuteReply(worker_error);
    assert(faulted.status == ExecutionStatus::FAULTED);
    assert(faulted.fault.kind == "EngineFailure");
    assert(faulted.fault.message == "out of memory");

    auto throws = [](const Message& reply) {
        try {
            ExecutionService::DecodeExecuteReply(reply);
        } catch (const ProtocolException&) {
            return true;
        }
        return false;
    };

    // Truncated result payload
    assert(throws(Message(MessageType::EXECUTE_RESULT, std::vector<uint8_t>{0x01, 0x02})));
    // A reply meant for another request
    assert(throws(Message(MessageType::PONG)));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// File Tests
//===----------------------------------------------------------------------===//

void TestFileOperations() {
    std::cout << "  Testing file operations..." << std::endl;

    SessionManager manager(MakeManagerConfig("files"));
    ExecutionService service(manager, MakeServiceConfig());
    auto id = service.CreateSession("files");

    service.PutFile(id, "data/visits.csv", Bytes("patient,visits\n1,3\n2,5\n"));

    // The engine sees uploads relative to its working directory
    auto result = service.Execute(id, "SELECT sum(visits) FROM read_csv('data/visits.csv');");
    assert(result.IsOk());
    assert(result.display_value == "8");

    // And its outputs can be fetched
    result = service.Execute(id, "COPY (SELECT 42 AS answer) TO 'out/answer.csv' (HEADER);");
    assert(result.IsOk());
    auto data = service.GetFile(id, "out/answer.csv");
    assert(std::string(data.begin(), data.end()) == "answer\n42\n");

    auto list = service.ListFiles(id);
    assert(list.files.size() == 2);
    assert(list.files[0].path == "data/visits.csv");
    assert(list.files[1].path == "out/answer.csv");

    assert(CodeOf([&] { service.GetFile(id, "nope.csv"); }) == ErrorCode::FILE_ERROR);
    assert(CodeOf([&] { service.PutFile(id, "../escape", Bytes("x")); }) ==
           ErrorCode::INVALID_REQUEST);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Status Tests
//===----------------------------------------------------------------------===//

void TestStatus() {
    std::cout << "  Testing Status..." << std::endl;

    SessionManager manager(MakeManagerConfig("status"));
    ExecutionService service(manager, MakeServiceConfig());

    auto id = service.CreateSession("watched");
    assert(service.Execute(id, "SELECT 1;").IsOk());

    auto status = service.Status("");
    assert(status.accepting);
    assert(status.active_sessions == 1);
    assert(status.max_sessions == 4);
    assert(status.total_sessions_created == 1);
    assert(status.total_executions == 1);

    status = service.Status(id);
    assert(status.session_state == SessionState::ACTIVE);

    status = service.Status("never-created");
    assert(status.session_state == SessionState::NOT_FOUND);

    // At capacity the server is up but not accepting new sessions
    for (int i = 0; i < 3; i++) {
        service.CreateSession();
    }
    status = service.Status("");
    assert(status.active_sessions == 4);
    assert(!status.accepting);
    assert(CodeOf([&] { service.CreateSession(); }) == ErrorCode::CAPACITY_EXCEEDED);

    service.DestroySession(id);
    assert(service.Status("").accepting);

    manager.Shutdown();
    assert(!service.Status("").accepting);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ExecutionService Unit Tests ===" << std::endl;

    std::cout << "\n1. Execution:" << std::endl;
    TestStatePersistsAcrossExecutes();
    TestFaultDoesNotEndSession();
    TestUnknownSession();
    TestDestroyThenExecute();
    TestDestroyDuringExecute();

    std::cout << "\n2. Busy Sessions:" << std::endl;
    TestBusyRejected();
    TestBusyQueued();

    std::cout << "\n3. Timeouts:" << std::endl;
    TestTimeoutExpiresSession();
    TestTimeoutClamped();
    TestKeepFilesOnTimeout();

    std::cout << "\n4. Crashes:" << std::endl;
    TestWorkerCrash();
    TestInspectionFailures();
    TestDecodeExecuteReply();

    std::cout << "\n5. Files:" << std::endl;
    TestFileOperations();

    std::cout << "\n6. Status:" << std::endl;
    TestStatus();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
