//===----------------------------------------------------------------------===//
//                         SandboxD Server - Integration Tests
//
// tests/integration/test_server_integration.cpp
//
// End-to-end tests: SandboxClient against a live TcpServer with real workers
//===----------------------------------------------------------------------===//

#include "client/sandbox_client.hpp"
#include "network/tcp_server.hpp"
#include "executor/execution_service.hpp"
#include "executor/executor_pool.hpp"
#include "errors.hpp"
#include <asio.hpp>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace sandbox_server;
namespace fs = std::filesystem;

//===----------------------------------------------------------------------===//
// Test Fixture
//===----------------------------------------------------------------------===//

class SandboxServerTest {
public:
    explicit SandboxServerTest(const std::function<void(ServerConfig&)>& customize = nullptr) {
        config_.host = "127.0.0.1";
        config_.port = 0;
        config_.io_threads = 2;
        config_.max_sessions = 3;
        config_.default_timeout_ms = 10000;
        config_.work_root = (fs::temp_directory_path() /
                             ("sandboxd_test_integration_" + std::to_string(getpid()))).string();
        config_.worker_path = SANDBOXD_WORKER_PATH;
        if (customize) {
            customize(config_);
        }

        SessionManager::Config sm_cfg;
        sm_cfg.max_sessions = config_.max_sessions;
        sm_cfg.idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);
        sm_cfg.sweep_interval = std::chrono::milliseconds(config_.sweep_interval_ms);
        sm_cfg.work_root = config_.work_root;
        sm_cfg.worker.worker_path = config_.worker_path;
        session_manager_ = std::make_unique<SessionManager>(sm_cfg);

        service_ = std::make_shared<ExecutionService>(
            *session_manager_, ExecutionService::Config::FromServerConfig(config_));

        executor_pool_ = std::make_shared<ExecutorPool>(config_.max_sessions + 2);
        executor_pool_->Start();

        server_ = std::make_unique<TcpServer>(config_, service_, executor_pool_);
        server_->Start();
    }

    ~SandboxServerTest() {
        server_->Stop();
        session_manager_->Shutdown();
        executor_pool_->Stop();
    }

    SandboxClient::Options ClientOptions() const {
        SandboxClient::Options options;
        options.host = "127.0.0.1";
        options.port = server_->GetPort();
        options.retry_backoff_ms = 50;
        return options;
    }

    TcpServer& Server() { return *server_; }
    ExecutorPool& Pool() { return *executor_pool_; }
    ExecutionService& Service() { return *service_; }

private:
    ServerConfig config_;
    std::unique_ptr<SessionManager> session_manager_;
    std::shared_ptr<ExecutionService> service_;
    std::shared_ptr<ExecutorPool> executor_pool_;
    std::unique_ptr<TcpServer> server_;
};

// Reads one request per connection and hangs up without replying
class HangUpServer {
public:
    HangUpServer()
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        Accept();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~HangUpServer() {
        io_.stop();
        thread_.join();
    }

    uint16_t GetPort() const { return acceptor_.local_endpoint().port(); }
    int GetRequests() const { return requests_.load(); }

private:
    void Accept() {
        acceptor_.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            auto conn = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
            auto header = std::make_shared<MessageHeader>();
            asio::async_read(*conn, asio::buffer(header.get(), MessageHeader::SIZE),
                [this, conn, header](asio::error_code ec, size_t) {
                    if (ec) {
                        return;
                    }
                    auto body = std::make_shared<std::vector<uint8_t>>(header->length);
                    asio::async_read(*conn, asio::buffer(*body),
                        [this, conn, body](asio::error_code ec, size_t) {
                            if (!ec) {
                                requests_++;
                            }
                            asio::error_code ignored;
                            conn->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                            conn->close(ignored);
                        });
                });
            Accept();
        });
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<int> requests_{0};
};

static std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

static ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SandboxError& e) {
        return e.GetCode();
    }
    return ErrorCode::OK;
}

//===----------------------------------------------------------------------===//
// Session Lifecycle Tests
//===----------------------------------------------------------------------===//

void TestPingAndStatus() {
    std::cout << "  Testing ping and status..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient client(fixture.ClientOptions());

    client.Connect();
    assert(client.IsConnected());
    client.Ping();

    auto status = client.Status();
    assert(status.accepting);
    assert(status.active_sessions == 0);
    assert(status.max_sessions == 3);

    client.Disconnect();
    assert(!client.IsConnected());

    // Calls reconnect lazily
    client.Ping();
    assert(client.IsConnected());

    std::cout << "    PASSED" << std::endl;
}

void TestSessionLifecycle() {
    std::cout << "  Testing create, execute and destroy..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient client(fixture.ClientOptions());

    auto id = client.CreateSession();
    assert(!id.empty());
    assert(client.CreateSession("named") == "named");
    assert(CodeOf([&] { client.CreateSession("named"); }) == ErrorCode::SESSION_EXISTS);

    auto result = client.Execute(id, "CREATE TABLE t AS SELECT * FROM range(4) r(x);");
    assert(result.IsOk());
    result = client.Execute(id, "SELECT sum(x) FROM t;");
    assert(result.IsOk());
    assert(result.display_value == "6");
    assert(result.stdout_text.find("6") != std::string::npos);

    // Sessions do not see each other
    result = client.Execute("named", "SELECT sum(x) FROM t;");
    assert(result.status == ExecutionStatus::FAULTED);
    assert(result.fault.kind == "Catalog");

    assert(client.Status(id).session_state == SessionState::ACTIVE);

    client.DestroySession(id);
    assert(client.Execute(id, "SELECT 1;").status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(CodeOf([&] { client.DestroySession(id); }) == ErrorCode::SESSION_NOT_FOUND);
    assert(client.Status(id).session_state == SessionState::NOT_FOUND);

    std::cout << "    PASSED" << std::endl;
}

void TestCapacity() {
    std::cout << "  Testing capacity limit over the wire..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient client(fixture.ClientOptions());

    client.CreateSession("a");
    client.CreateSession("b");
    client.CreateSession("c");
    assert(CodeOf([&] { client.CreateSession("d"); }) == ErrorCode::CAPACITY_EXCEEDED);
    // Server errors are not retried
    assert(client.GetLastAttempts() == 1);

    client.DestroySession("a");
    assert(client.CreateSession("d") == "d");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Inspection and File Tests
//===----------------------------------------------------------------------===//

void TestInspection() {
    std::cout << "  Testing variable inspection..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient client(fixture.ClientOptions());
    auto id = client.CreateSession();

    assert(client.Execute(id, "SET VARIABLE threshold = 42;").IsOk());
    assert(client.Execute(id, "CREATE VIEW v AS SELECT 1 AS one;").IsOk());

    auto value = client.GetVariable(id, "threshold");
    assert(value.found);
    assert(value.value == "42");
    assert(!client.GetVariable(id, "absent").found);

    auto bindings = client.ListVariables(id);
    bool saw_variable = false, saw_view = false;
    for (const auto& binding : bindings) {
        saw_variable |= binding.kind == "variable" && binding.name == "threshold";
        saw_view |= binding.kind == "view" && binding.name == "v";
    }
    assert(saw_variable && saw_view);

    std::cout << "    PASSED" << std::endl;
}

void TestFiles() {
    std::cout << "  Testing file transfer..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient client(fixture.ClientOptions());
    auto id = client.CreateSession();

    std::string csv = "region,sales\nnorth,10\nsouth,32\n";
    auto stored = client.PutFile(id, "sales.csv", Bytes(csv));
    assert(stored.path == "sales.csv");
    assert(stored.size == csv.size());

    auto result = client.Execute(id,
        "COPY (SELECT sum(sales) AS total FROM read_csv('sales.csv')) TO 'total.csv' (HEADER);");
    assert(result.IsOk());

    auto data = client.GetFile(id, "total.csv");
    assert(std::string(data.begin(), data.end()) == "total\n42\n");

    auto files = client.ListFiles(id);
    assert(files.size() == 2);
    assert(files[0].path == "sales.csv");
    assert(files[1].path == "total.csv");

    assert(CodeOf([&] { client.GetFile(id, "../../etc/passwd"); }) == ErrorCode::INVALID_REQUEST);
    assert(CodeOf([&] { client.GetFile(id, "missing.csv"); }) == ErrorCode::FILE_ERROR);

    // Large binary payload
    std::vector<uint8_t> blob(2 * 1024 * 1024);
    for (size_t i = 0; i < blob.size(); i++) {
        blob[i] = static_cast<uint8_t>(i * 31);
    }
    client.PutFile(id, "blob.bin", blob);
    assert(client.GetFile(id, "blob.bin") == blob);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Timeout and Busy Tests
//===----------------------------------------------------------------------===//

void TestTimeoutOverTheWire() {
    std::cout << "  Testing timeout over the wire..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient client(fixture.ClientOptions());
    auto id = client.CreateSession();

    auto start = std::chrono::steady_clock::now();
    auto result = client.Execute(id,
        "WITH RECURSIVE r(n) AS (SELECT 1::BIGINT UNION ALL SELECT n + 1 FROM r) "
        "SELECT count(*) FROM r;", 1000);
    auto waited = std::chrono::steady_clock::now() - start;

    assert(result.status == ExecutionStatus::TIMED_OUT);
    assert(waited < std::chrono::milliseconds(1800));

    assert(client.Execute(id, "SELECT 1;").status == ExecutionStatus::SESSION_NOT_FOUND);
    assert(client.Status(id).session_state == SessionState::EXPIRED);
    assert(client.Status().total_timeouts == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestBusyOverTheWire() {
    std::cout << "  Testing busy session over two connections..." << std::endl;

    SandboxServerTest fixture;
    SandboxClient first(fixture.ClientOptions());
    SandboxClient second(fixture.ClientOptions());
    auto id = first.CreateSession();

    ExecutionResult long_result;
    std::thread runner([&]() {
        long_result = first.Execute(id,
            "WITH RECURSIVE r(n) AS (SELECT 1::BIGINT UNION ALL SELECT n + 1 FROM r) "
            "SELECT count(*) FROM r;", 1500);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    auto busy = second.Execute(id, "SELECT 1;");
    assert(busy.status == ExecutionStatus::SESSION_BUSY);

    // Other sessions are unaffected
    auto other = second.CreateSession();
    assert(second.Execute(other, "SELECT 1;").IsOk());

    runner.join();
    assert(long_result.status == ExecutionStatus::TIMED_OUT);

    std::cout << "    PASSED" << std::endl;
}

void TestDestroyWithSaturatedExecutors() {
    std::cout << "  Testing destroy while every executor thread waits on a session..." << std::endl;

    SandboxServerTest fixture([](ServerConfig& config) {
        config.busy_policy = BusyPolicy::QUEUE;
        config.max_timeout_ms = 20000;
    });
    SandboxClient owner(fixture.ClientOptions());
    auto id = owner.CreateSession("crowded");
    auto other = owner.CreateSession("bystander");

    // One long call plus queued callers fill the executor pool
    size_t callers = fixture.Pool().Size();
    std::vector<std::thread> threads;
    std::vector<ExecutionStatus> outcomes(callers);
    for (size_t i = 0; i < callers; i++) {
        threads.emplace_back([&fixture, &outcomes, &id, i]() {
            SandboxClient client(fixture.ClientOptions());
            outcomes[i] = client.Execute(id,
                "WITH RECURSIVE r(n) AS (SELECT 1::BIGINT UNION ALL SELECT n + 1 FROM r) "
                "SELECT count(*) FROM r;", 15000).status;
        });
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fixture.Pool().ActiveTasks() < callers && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(fixture.Pool().ActiveTasks() == callers);

    // Neither destroy waits for an executor thread
    auto start = std::chrono::steady_clock::now();
    owner.DestroySession(other);
    owner.DestroySession(id);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));

    for (auto& thread : threads) {
        thread.join();
    }
    for (auto status : outcomes) {
        assert(status == ExecutionStatus::SESSION_NOT_FOUND);
    }

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Transport Tests
//===----------------------------------------------------------------------===//

void TestRetryOnConnectionRefused() {
    std::cout << "  Testing retries when nothing listens..." << std::endl;

    uint16_t port;
    {
        SandboxServerTest fixture;
        port = fixture.Server().GetPort();
    }

    SandboxClient::Options options;
    options.port = port;
    options.max_attempts = 3;
    options.retry_backoff_ms = 20;
    SandboxClient client(options);

    bool threw = false;
    auto start = std::chrono::steady_clock::now();
    try {
        client.Ping();
    } catch (const TransportFailure&) {
        threw = true;
    }
    assert(threw);
    assert(client.GetLastAttempts() == 3);
    // Backoff doubles: 20ms + 40ms
    assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(60));

    std::cout << "    PASSED" << std::endl;
}

void TestNoResendAfterWrite() {
    std::cout << "  Testing create and destroy are not resent after the write..." << std::endl;

    HangUpServer server;
    SandboxClient::Options options;
    options.port = server.GetPort();
    options.max_attempts = 3;
    options.retry_backoff_ms = 10;
    SandboxClient client(options);

    auto fails = [](const std::function<void()>& fn) {
        try {
            fn();
        } catch (const TransportFailure&) {
            return true;
        }
        return false;
    };

    assert(fails([&] { client.CreateSession("once"); }));
    assert(client.GetLastAttempts() == 1);
    assert(fails([&] { client.DestroySession("once"); }));
    assert(client.GetLastAttempts() == 1);
    assert(fails([&] { client.Execute("once", "SELECT 1;"); }));
    assert(client.GetLastAttempts() == 1);

    // Read-only calls are resent
    assert(fails([&] { client.Status(""); }));
    assert(client.GetLastAttempts() == 3);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (server.GetRequests() < 6 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(server.GetRequests() == 6);

    std::cout << "    PASSED" << std::endl;
}

void TestConnectionLimit() {
    std::cout << "  Testing connection limit..." << std::endl;

    SandboxServerTest fixture([](ServerConfig& config) { config.max_connections = 1; });

    SandboxClient first(fixture.ClientOptions());
    first.Ping();

    auto options = fixture.ClientOptions();
    options.max_attempts = 1;
    SandboxClient second(options);

    bool refused = false;
    try {
        second.Ping();
    } catch (const SandboxError& e) {
        refused = e.GetCode() == ErrorCode::MAX_CONNECTIONS;
    } catch (const TransportFailure&) {
        // The close can win the race against the error frame
        refused = true;
    }
    assert(refused);
    assert(fixture.Server().GetRejectedConnections() == 1);

    // The first connection is unaffected
    first.Ping();

    std::cout << "    PASSED" << std::endl;
}

// Raw frame exchange on a plain socket
static asio::ip::tcp::socket Connect(asio::io_context& io, uint16_t port) {
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    return socket;
}

static Message ReadFrame(asio::ip::tcp::socket& socket) {
    Message message;
    asio::read(socket, asio::buffer(&message.GetHeader(), MessageHeader::SIZE));
    message.GetPayload().resize(message.GetPayloadLength());
    if (message.GetPayloadLength() > 0) {
        asio::read(socket, asio::buffer(message.GetPayload()));
    }
    return message;
}

static bool ClosedByPeer(asio::ip::tcp::socket& socket) {
    char byte;
    asio::error_code ec;
    socket.read_some(asio::buffer(&byte, 1), ec);
    return ec == asio::error::eof || ec == asio::error::connection_reset;
}

void TestFramingErrors() {
    std::cout << "  Testing malformed frames close the connection..." << std::endl;

    SandboxServerTest fixture([](ServerConfig& config) { config.max_message_bytes = 1024; });
    asio::io_context io;

    // Several requests written at once come back in order on one connection
    {
        auto socket = Connect(io, fixture.Server().GetPort());
        std::vector<uint8_t> burst;
        for (uint32_t id = 1; id <= 3; id++) {
            auto frame = Message(MessageType::PING, id).Serialize();
            burst.insert(burst.end(), frame.begin(), frame.end());
        }
        asio::write(socket, asio::buffer(burst));
        for (uint32_t id = 1; id <= 3; id++) {
            Message reply = ReadFrame(socket);
            assert(reply.GetType() == MessageType::PONG);
            assert(reply.GetRequestId() == id);
        }
    }

    // Bad magic
    {
        auto socket = Connect(io, fixture.Server().GetPort());
        MessageHeader header(MessageType::PING, 0, 7);
        header.magic = 0x12345678;
        asio::write(socket, asio::buffer(&header, MessageHeader::SIZE));

        Message reply = ReadFrame(socket);
        assert(reply.GetType() == MessageType::ERROR);
        assert(reply.GetRequestId() == 0);
        assert(ErrorPayload::Deserialize(reply.GetPayload()).code == ErrorCode::PROTOCOL_ERROR);
        assert(ClosedByPeer(socket));
    }

    // Unsupported version
    {
        auto socket = Connect(io, fixture.Server().GetPort());
        MessageHeader header(MessageType::PING, 0, 8);
        header.version = PROTOCOL_VERSION + 1;
        asio::write(socket, asio::buffer(&header, MessageHeader::SIZE));

        Message reply = ReadFrame(socket);
        assert(ErrorPayload::Deserialize(reply.GetPayload()).code == ErrorCode::VERSION_MISMATCH);
        assert(ClosedByPeer(socket));
    }

    // Declared payload over the limit; the body is never read
    {
        auto socket = Connect(io, fixture.Server().GetPort());
        MessageHeader header(MessageType::EXECUTE, 4096, 9);
        asio::write(socket, asio::buffer(&header, MessageHeader::SIZE));

        Message reply = ReadFrame(socket);
        auto error = ErrorPayload::Deserialize(reply.GetPayload());
        assert(error.code == ErrorCode::PROTOCOL_ERROR);
        assert(error.message.find("exceeds limit of 1024") != std::string::npos);
        assert(ClosedByPeer(socket));
    }

    // The server keeps serving well-formed clients
    SandboxClient client(fixture.ClientOptions());
    client.Ping();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== SandboxD Server Integration Tests ===" << std::endl;

    std::cout << "\n1. Session Lifecycle:" << std::endl;
    TestPingAndStatus();
    TestSessionLifecycle();
    TestCapacity();

    std::cout << "\n2. Inspection and Files:" << std::endl;
    TestInspection();
    TestFiles();

    std::cout << "\n3. Timeouts and Busy Sessions:" << std::endl;
    TestTimeoutOverTheWire();
    TestBusyOverTheWire();
    TestDestroyWithSaturatedExecutors();

    std::cout << "\n4. Transport:" << std::endl;
    TestRetryOnConnectionRefused();
    TestNoResendAfterWrite();
    TestConnectionLimit();
    TestFramingErrors();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
