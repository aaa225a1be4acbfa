//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// http/http_server.cpp
//
// Health, readiness and Prometheus metrics over plain HTTP
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "network/tcp_server.hpp"
#include "executor/execution_service.hpp"
#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include <sstream>

namespace sandbox_server {

namespace {

// Requests larger than this are cut off; only the request line matters
constexpr size_t MAX_REQUEST_BYTES = 8192;

const char* ReasonPhrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 503: return "Service Unavailable";
        default:  return "Internal Server Error";
    }
}

// Prometheus text exposition, one family at a time
class MetricsWriter {
public:
    template <typename T>
    void Counter(const std::string& name, const std::string& help, T value) {
        Family(name, help, "counter");
        out_ << name << " " << value << "\n";
    }

    template <typename T>
    void Gauge(const std::string& name, const std::string& help, T value) {
        Family(name, help, "gauge");
        out_ << name << " " << value << "\n";
    }

    // Start a family whose samples carry labels
    void Family(const std::string& name, const std::string& help, const char* type) {
        if (out_.tellp() > 0) {
            out_ << "\n";
        }
        out_ << "# HELP " << name << " " << help << "\n"
             << "# TYPE " << name << " " << type << "\n";
    }

    template <typename T>
    void Sample(const std::string& name, const std::string& label, const std::string& label_value,
                T value) {
        out_ << name << "{" << label << "=\"" << label_value << "\"} " << value << "\n";
    }

    std::string Str() const { return out_.str(); }

private:
    std::ostringstream out_;
};

} // anonymous namespace

HttpServer::HttpServer(const std::string& host, uint16_t port, TcpServer* server)
    : port_(port)
    , server_(server)
    , acceptor_(io_context_) {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_.exchange(true)) {
        return;
    }

    DoAccept();
    thread_ = std::thread([this]() { io_context_.run(); });

    DLOG_INFO("http", "Health and metrics on port {}", port_);
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_DEBUG("http", "HTTP endpoint stopped");
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (!running_) {
            return;
        }
        if (!ec) {
            Serve(std::make_shared<asio::ip::tcp::socket>(std::move(socket)));
        }
        DoAccept();
    });
}

void HttpServer::Serve(std::shared_ptr<asio::ip::tcp::socket> socket) {
    // Read up to the blank line ending the headers, answer, close
    auto request = std::make_shared<asio::streambuf>(MAX_REQUEST_BYTES);
    asio::async_read_until(*socket, *request, "\r\n\r\n",
        [this, socket, request](const asio::error_code& ec, size_t) {
            if (ec && ec != asio::error::not_found) {
                return;
            }
            std::string text(asio::buffers_begin(request->data()), asio::buffers_end(request->data()));
            auto response = std::make_shared<std::string>(HandleRequest(text));

            asio::async_write(*socket, asio::buffer(*response),
                [socket, response](const asio::error_code&, size_t) {
                    asio::error_code ignored;
                    socket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                    socket->close(ignored);
                });
        });
}

std::string HttpServer::HandleRequest(const std::string& request) {
    std::istringstream line(request.substr(0, request.find("\r\n")));
    std::string method;
    std::string target;
    line >> method >> target;

    // Query strings do not select anything
    std::string path = target.substr(0, target.find('?'));
    return Render(Route(method, path));
}

HttpServer::Response HttpServer::Route(const std::string& method, const std::string& path) {
    if (method != "GET") {
        return Response{405, "text/plain", "Method Not Allowed"};
    }
    if (path == "/health" || path == "/healthz") {
        return Health(false);
    }
    if (path == "/ready") {
        return Health(true);
    }
    if (path == "/metrics") {
        return Metrics();
    }
    if (path == "/") {
        return Response{200, "text/plain", "SandboxD Server"};
    }
    return Response{404, "text/plain", "Not Found"};
}

std::string HttpServer::Render(const Response& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.code << " " << ReasonPhrase(response.code) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return out.str();
}

HttpServer::Response HttpServer::Health(bool readiness) {
    bool running = false;
    bool accepting = false;
    size_t sessions = 0;
    size_t max_sessions = 0;
    if (server_ && server_->GetExecutionService()) {
        auto& manager = server_->GetExecutionService()->GetSessionManager();
        running = manager.IsAccepting() && server_->IsRunning();
        accepting = running && manager.HasCapacity();
        sessions = manager.GetActiveSessionCount();
        max_sessions = manager.GetMaxSessions();
    }

    // A full server is alive but not ready for another session
    const char* state = !running ? "draining" : (accepting ? "healthy" : "full");

    std::ostringstream json;
    json << "{\n"
         << "  \"status\": \"" << state << "\",\n"
         << "  \"accepting\": " << (accepting ? "true" : "false") << ",\n"
         << "  \"sessions\": " << sessions << ",\n"
         << "  \"max_sessions\": " << max_sessions << "\n"
         << "}";

    bool ok = readiness ? accepting : running;
    return Response{ok ? 200 : 503, "application/json", json.str()};
}

HttpServer::Response HttpServer::Metrics() {
    MetricsWriter writer;

    if (server_) {
        writer.Counter("sandboxd_connections_total", "Total number of connections",
                       server_->GetTotalConnections());
        writer.Gauge("sandboxd_connections_active", "Current active connections",
                     server_->GetConnectionCount());
        writer.Counter("sandboxd_connections_rejected_total", "Connections refused at the limit",
                       server_->GetRejectedConnections());
        writer.Counter("sandboxd_bytes_received_total", "Total bytes received",
                       server_->GetTotalBytesReceived());
        writer.Counter("sandboxd_bytes_sent_total", "Total bytes sent",
                       server_->GetTotalBytesSent());

        writer.Family("sandboxd_io_thread_connections", "Open connections per IO thread", "gauge");
        auto loads = server_->GetIoLoads();
        for (size_t i = 0; i < loads.size(); i++) {
            writer.Sample("sandboxd_io_thread_connections", "thread", std::to_string(i), loads[i]);
        }

        auto service = server_->GetExecutionService();
        if (service) {
            auto stats = service->GetSessionManager().GetStats();
            auto exec = service->GetMetrics();

            writer.Gauge("sandboxd_sessions_active", "Sessions with a live worker",
                         stats.active_sessions);
            writer.Counter("sandboxd_sessions_created_total", "Sessions created",
                           stats.total_sessions_created);
            writer.Counter("sandboxd_sessions_evicted_total", "Sessions evicted for idleness",
                           stats.total_evictions);

            const std::string executions = "sandboxd_executions_total";
            writer.Family(executions, "Execute calls by outcome", "counter");
            writer.Sample(executions, "status", "ok", exec.total_ok);
            writer.Sample(executions, "status", "faulted", exec.total_faulted);
            writer.Sample(executions, "status", "timed_out", exec.total_timeouts);
            writer.Sample(executions, "status", "busy", exec.total_busy);
            writer.Sample(executions, "status", "not_found", exec.total_not_found);

            writer.Counter("sandboxd_worker_crashes_total", "Workers that died during a call",
                           exec.total_crashes);
            writer.Counter("sandboxd_execute_seconds_total", "Time spent in execute calls",
                           exec.total_execute_us / 1e6);
        }

        auto pool = server_->GetExecutorPool();
        if (pool) {
            writer.Gauge("sandboxd_executor_busy_threads", "Executor threads running a call",
                         pool->ActiveTasks());
            writer.Gauge("sandboxd_executor_queue_depth", "Calls waiting for an executor thread",
                         pool->PendingTasks());
        }
    }

    std::string body = writer.Str();
    if (metrics_callback_) {
        body += metrics_callback_();
    }
    return Response{200, "text/plain; version=0.0.4", body};
}

} // namespace sandbox_server
