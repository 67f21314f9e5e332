//===----------------------------------------------------------------------===//
//                         runnerd
//
// http/http_server.hpp
//
// Minimal HTTP endpoint for health checks and metrics
//===----------------------------------------------------------------------===//

#pragma once

#include <asio.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace runnerd {

class TcpServer;

class HttpServer {
public:
    HttpServer(const std::string& host, uint16_t port, TcpServer* server);
    ~HttpServer();

    void Start();
    void Stop();

    // Actual bound port (useful with port 0)
    uint16_t GetPort() const;

    // Full HTTP response for one request
    std::string HandleRequest(const std::string& request);

private:
    void DoAccept();
    void HandleConnection(asio::ip::tcp::socket socket);
    static std::string BuildResponse(int status_code, const std::string& status_text,
                                     const std::string& content_type, const std::string& body);

    std::string GetHealthResponse();
    std::string GetMetricsResponse();

private:
    uint16_t port_;
    TcpServer* server_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace runnerd
