//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// http/http_server.hpp
//
// Health, readiness and Prometheus metrics over plain HTTP
//===----------------------------------------------------------------------===//

#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace sandbox_server {

class TcpServer;

class HttpServer {
public:
    using MetricsCallback = std::function<std::string()>;

    struct Response {
        int code = 200;
        std::string content_type = "text/plain";
        std::string body;
    };

    // Binds at once; throws asio::system_error if the port is taken
    HttpServer(const std::string& host, uint16_t port, TcpServer* server);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void Start();
    void Stop();

    // Bound port; differs from the requested one when that was 0
    uint16_t GetPort() const { return port_; }

    // Extra exposition text appended to /metrics
    void SetMetricsCallback(MetricsCallback callback) { metrics_callback_ = std::move(callback); }

    // Full HTTP/1.1 response text for one raw request
    std::string HandleRequest(const std::string& request);

private:
    void DoAccept();
    void Serve(std::shared_ptr<asio::ip::tcp::socket> socket);

    Response Route(const std::string& method, const std::string& path);

    // /health fails only while draining; /ready also fails when full
    Response Health(bool readiness);
    Response Metrics();

    static std::string Render(const Response& response);

private:
    uint16_t port_;
    TcpServer* server_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    MetricsCallback metrics_callback_;
};

} // namespace sandbox_server
