//===----------------------------------------------------------------------===//
//                         runnerd
//
// http/http_server.cpp
//
// Health and Prometheus metrics endpoint
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "network/tcp_server.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"
#include <sstream>

namespace runnerd {

namespace {

void WriteMetric(std::ostringstream& out, const char* name, const char* type,
                 const char* help, uint64_t value) {
    out << "# HELP " << name << " " << help << "\n"
        << "# TYPE " << name << " " << type << "\n"
        << name << " " << value << "\n";
}

} // anonymous namespace

HttpServer::HttpServer(const std::string& host, uint16_t port, TcpServer* server)
    : port_(port)
    , server_(server)
    , acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address(host), port)) {
}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_.exchange(true)) return;

    DoAccept();

    thread_ = std::thread([this]() {
        io_context_.run();
    });

    LOG_INFO("http", "HTTP server started on port " + std::to_string(port_));
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) return;

    asio::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_INFO("http", "HTTP server stopped");
}

uint16_t HttpServer::GetPort() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        if (!ec && running_) {
            HandleConnection(std::move(socket));
        }
        if (running_ && acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void HttpServer::HandleConnection(asio::ip::tcp::socket socket) {
    auto sock = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
    auto buf = std::make_shared<std::array<char, 4096>>();

    sock->async_read_some(asio::buffer(*buf),
        [this, sock, buf](std::error_code ec, size_t bytes_read) {
            if (ec) return;

            auto resp = std::make_shared<std::string>(
                HandleRequest(std::string(buf->data(), bytes_read)));

            asio::async_write(*sock, asio::buffer(*resp),
                [sock, resp](std::error_code, size_t) {
                    asio::error_code shutdown_ec;
                    sock->shutdown(asio::ip::tcp::socket::shutdown_both, shutdown_ec);
                    sock->close(shutdown_ec);
                });
        });
}

std::string HttpServer::HandleRequest(const std::string& request) {
    std::istringstream iss(request);
    std::string method, path, version;
    iss >> method >> path >> version;

    if (method != "GET") {
        return BuildResponse(405, "Method Not Allowed", "text/plain", "Method Not Allowed");
    }

    if (path == "/health" || path == "/healthz") {
        return GetHealthResponse();
    } else if (path == "/metrics") {
        return GetMetricsResponse();
    } else if (path == "/") {
        return BuildResponse(200, "OK", "text/plain", "runnerd");
    }

    return BuildResponse(404, "Not Found", "text/plain", "Not Found");
}

std::string HttpServer::BuildResponse(int status_code, const std::string& status_text,
                                      const std::string& content_type, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code << " " << status_text << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

std::string HttpServer::GetHealthResponse() {
    size_t connections = 0;
    size_t sessions = 0;
    if (server_) {
        connections = server_->GetConnectionCount();
        if (auto manager = server_->GetSessionManager()) {
            sessions = manager->GetActiveSessionCount();
        }
    }

    std::ostringstream json;
    json << "{\n"
         << "  \"status\": \"healthy\",\n"
         << "  \"connections\": " << connections << ",\n"
         << "  \"sessions\": " << sessions << "\n"
         << "}";
    return BuildResponse(200, "OK", "application/json", json.str());
}

std::string HttpServer::GetMetricsResponse() {
    std::ostringstream metrics;

    if (server_) {
        WriteMetric(metrics, "runnerd_connections_total", "counter",
                    "Total number of connections", server_->GetTotalConnections());
        WriteMetric(metrics, "runnerd_connections_active", "gauge",
                    "Current active connections", server_->GetConnectionCount());
        WriteMetric(metrics, "runnerd_bytes_received_total", "counter",
                    "Total bytes received", server_->GetTotalBytesReceived());
        WriteMetric(metrics, "runnerd_bytes_sent_total", "counter",
                    "Total bytes sent", server_->GetTotalBytesSent());

        if (auto manager = server_->GetSessionManager()) {
            auto stats = manager->GetStats();
            WriteMetric(metrics, "runnerd_sessions_active", "gauge",
                        "Sessions with a live program", stats.active_sessions);
            WriteMetric(metrics, "runnerd_sessions_started_total", "counter",
                        "Programs started", stats.sessions_started);
            WriteMetric(metrics, "runnerd_sessions_closed_total", "counter",
                        "Sessions torn down", stats.sessions_closed);
            WriteMetric(metrics, "runnerd_session_start_failures_total", "counter",
                        "Start requests rejected or failed", stats.start_failures);
            WriteMetric(metrics, "runnerd_artifacts_sent_total", "counter",
                        "Image artifacts delivered", stats.artifacts_sent);
            WriteMetric(metrics, "runnerd_output_bytes_total", "counter",
                        "Program output forwarded to clients", stats.output_bytes);
            WriteMetric(metrics, "runnerd_output_read_errors_total", "counter",
                        "Sessions whose terminal could not be read", stats.output_read_errors);
            WriteMetric(metrics, "runnerd_stalled_sessions_total", "counter",
                        "Sessions closed because the client fell behind", stats.stalled_sessions);
        }
    }

    return BuildResponse(200, "OK", "text/plain; version=0.0.4", metrics.str());
}

} // namespace runnerd
