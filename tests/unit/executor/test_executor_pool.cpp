//===----------------------------------------------------------------------===//
//                         SandboxD Server - Unit Tests
//
// tests/unit/executor/test_executor_pool.cpp
//
// Unit tests for ExecutorPool under blocking, session-style tasks
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include <cassert>
#include <iostream>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <thread>
#include <vector>
#include <mutex>
#include <stdexcept>

using namespace sandbox_server;

// Stands in for a worker call: blocks until released or its deadline passes
class Gate {
public:
    // True when released, false on timeout
    bool Wait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        waiting_++;
        bool released = cv_.wait_for(lock, timeout, [this]() { return open_; });
        waiting_--;
        return released;
    }

    void Open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    size_t Waiting() {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    size_t waiting_ = 0;
};

template <typename Pred>
static bool WaitUntil(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    auto deadline = Clock::now() + limit;
    while (!pred()) {
        if (Clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

//===----------------------------------------------------------------------===//
// Lifecycle Tests
//===----------------------------------------------------------------------===//

void TestSizing() {
    std::cout << "  Testing thread count..." << std::endl;

    ExecutorPool automatic;
    assert(automatic.Size() >= 4);
    assert(!automatic.IsRunning());

    ExecutorPool fixed(3);
    assert(fixed.Size() == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestSubmitOnlyWhileRunning() {
    std::cout << "  Testing Submit outside Start/Stop is refused..." << std::endl;

    ExecutorPool pool(2);
    std::atomic<int> ran{0};

    assert(!pool.Submit([&ran]() { ran++; }));

    pool.Start();
    assert(pool.Submit([&ran]() { ran++; }));
    assert(WaitUntil([&]() { return pool.CompletedTasks() == 1; }));

    pool.Stop();
    assert(!pool.Submit([&ran]() { ran++; }));

    // A restarted pool serves again
    pool.Start();
    assert(pool.Submit([&ran]() { ran++; }));
    assert(WaitUntil([&]() { return ran.load() == 2; }));
    pool.Stop();

    assert(ran.load() == 2);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Blocking Task Tests
//===----------------------------------------------------------------------===//

void TestBlockedThreadsQueueTheRest() {
    std::cout << "  Testing blocked threads leave later calls queued..." << std::endl;

    ExecutorPool pool(3);
    pool.Start();

    Gate gate;
    std::atomic<int> finished{0};
    for (int i = 0; i < 5; i++) {
        assert(pool.Submit([&]() {
            gate.Wait(std::chrono::milliseconds(10000));
            finished++;
        }));
    }

    // Every thread sits in a call; the other two wait their turn
    assert(WaitUntil([&]() { return gate.Waiting() == 3; }));
    assert(pool.ActiveTasks() == 3);
    assert(pool.PendingTasks() == 2);
    assert(finished.load() == 0);

    gate.Open();
    assert(WaitUntil([&]() { return finished.load() == 5; }));
    assert(WaitUntil([&]() { return pool.CompletedTasks() == 5; }));
    assert(pool.ActiveTasks() == 0);
    assert(pool.PendingTasks() == 0);

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestShortCallsRunBesideLongOnes() {
    std::cout << "  Testing short calls are not stuck behind a long one..." << std::endl;

    ExecutorPool pool(2);
    pool.Start();

    Gate long_call;
    assert(pool.Submit([&]() { long_call.Wait(std::chrono::milliseconds(10000)); }));
    assert(WaitUntil([&]() { return long_call.Waiting() == 1; }));

    std::atomic<int> short_calls{0};
    auto start = Clock::now();
    for (int i = 0; i < 20; i++) {
        assert(pool.Submit([&short_calls]() { short_calls++; }));
    }
    assert(WaitUntil([&]() { return short_calls.load() == 20; }));
    assert(Clock::now() - start < std::chrono::seconds(2));

    long_call.Open();
    pool.Stop();
    assert(pool.DroppedTasks() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestFailingTaskKeepsThread() {
    std::cout << "  Testing a throwing task does not lose its thread..." << std::endl;

    ExecutorPool pool(1);
    pool.Start();

    assert(pool.Submit([]() { throw std::runtime_error("worker channel closed"); }));
    std::atomic<bool> after{false};
    assert(pool.Submit([&after]() { after = true; }));

    assert(WaitUntil([&]() { return after.load(); }));
    assert(WaitUntil([&]() { return pool.CompletedTasks() == 2; }));

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Shutdown Tests
//===----------------------------------------------------------------------===//

void TestStopDropsQueuedCalls() {
    std::cout << "  Testing Stop drops calls that never started..." << std::endl;

    ExecutorPool pool(1);
    pool.Start();

    Gate gate;
    assert(pool.Submit([&]() { gate.Wait(std::chrono::milliseconds(10000)); }));
    assert(WaitUntil([&]() { return gate.Waiting() == 1; }));

    std::atomic<int> queued_ran{0};
    for (int i = 0; i < 3; i++) {
        assert(pool.Submit([&queued_ran]() { queued_ran++; }));
    }
    assert(pool.PendingTasks() == 3);

    std::thread stopper([&pool]() { pool.Stop(); });

    // Stop empties the queue at once, then waits for the running call
    assert(WaitUntil([&]() { return pool.PendingTasks() == 0; }));
    assert(!pool.Submit([&queued_ran]() { queued_ran++; }));

    gate.Open();
    stopper.join();

    assert(queued_ran.load() == 0);
    assert(pool.DroppedTasks() == 3);
    assert(pool.CompletedTasks() == 1);
    assert(!pool.IsRunning());

    std::cout << "    PASSED" << std::endl;
}

void TestStopWaitsForInterruptedCalls() {
    std::cout << "  Testing Stop returns once running calls are interrupted..." << std::endl;

    ExecutorPool pool(4);
    pool.Start();

    // Calls with long deadlines, as if a slow statement were running in each
    Gate sessions;
    std::atomic<int> interrupted{0};
    for (int i = 0; i < 4; i++) {
        assert(pool.Submit([&]() {
            if (sessions.Wait(std::chrono::milliseconds(30000))) {
                interrupted++;
            }
        }));
    }
    assert(WaitUntil([&]() { return sessions.Waiting() == 4; }));

    std::atomic<bool> stopped{false};
    std::thread stopper([&]() {
        pool.Stop();
        stopped = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!stopped.load());

    // Killing the workers is what ends the calls
    auto start = Clock::now();
    sessions.Open();
    stopper.join();
    assert(Clock::now() - start < std::chrono::seconds(2));
    assert(interrupted.load() == 4);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Concurrency Tests
//===----------------------------------------------------------------------===//

void TestConcurrentSubmitters() {
    std::cout << "  Testing Submit from many connection threads..." << std::endl;

    ExecutorPool pool(4);
    pool.Start();

    std::atomic<int> total{0};
    std::vector<std::thread> submitters;
    for (int t = 0; t < 8; t++) {
        submitters.emplace_back([&]() {
            for (int i = 0; i < 250; i++) {
                bool accepted = pool.Submit([&total]() { total++; });
                assert(accepted);
                (void)accepted;
            }
        });
    }
    for (auto& submitter : submitters) {
        submitter.join();
    }

    assert(WaitUntil([&]() { return total.load() == 2000; }));
    pool.Stop();
    assert(pool.CompletedTasks() == 2000);
    assert(pool.DroppedTasks() == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ExecutorPool Unit Tests ===" << std::endl;

    std::cout << "\n1. Lifecycle:" << std::endl;
    TestSizing();
    TestSubmitOnlyWhileRunning();

    std::cout << "\n2. Blocking Tasks:" << std::endl;
    TestBlockedThreadsQueueTheRest();
    TestShortCallsRunBesideLongOnes();
    TestFailingTaskKeepsThread();

    std::cout << "\n3. Shutdown:" << std::endl;
    TestStopDropsQueuedCalls();
    TestStopWaitsForInterruptedCalls();

    std::cout << "\n4. Concurrency:" << std::endl;
    TestConcurrentSubmitters();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
