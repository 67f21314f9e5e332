//===----------------------------------------------------------------------===//
//                         runnerd
//
// network/tcp_server.hpp
//
// Accepts clients and spreads their connections over the client threads
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/tcp_connection.hpp"
#include <asio.hpp>
#include <map>

namespace runnerd {

class ProtocolHandler;

class TcpServer {
public:
    // Client threads come from config.GetIoThreadCount()
    TcpServer(const ServerConfig& config,
              std::shared_ptr<SessionManager> session_manager);
    ~TcpServer();

    // Non-copyable
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Binds and starts accepting. Throws std::system_error if the address
    // cannot be bound.
    void Start();

    // Stops accepting, closes every connection (and with it every session),
    // then joins the client threads
    void Stop();

    bool IsRunning() const { return running_; }

    // Actual bound port (useful with port 0)
    uint16_t GetPort() const;

    std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
    const ServerConfig& GetConfig() const { return config_; }

    // Called by a connection once it is closed
    void RemoveConnection(const TcpConnectionPtr& conn);
    size_t GetConnectionCount() const;
    size_t GetClientThreadCount() const { return client_contexts_.size(); }

    // Statistics
    uint64_t GetTotalConnections() const { return total_connections_; }
    uint64_t GetTotalBytesReceived() const { return total_bytes_received_; }
    uint64_t GetTotalBytesSent() const { return total_bytes_sent_; }

    void AddBytesReceived(uint64_t bytes) { total_bytes_received_ += bytes; }
    void AddBytesSent(uint64_t bytes) { total_bytes_sent_ += bytes; }

private:
    // A connection stays on the context it was accepted onto, so its
    // handlers never run concurrently
    struct ClientContext {
        asio::io_context io_context{1};
        size_t connections = 0;  // guarded by connections_mutex_
        std::thread thread;
    };

    void DoAccept();

    // The client context serving the fewest connections
    size_t PickClientContext();

    static void RunContext(asio::io_context& io_context, const std::string& role);

private:
    const ServerConfig& config_;

    // Accepting runs apart from client traffic
    asio::io_context acceptor_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread acceptor_thread_;

    std::vector<std::unique_ptr<ClientContext>> client_contexts_;
    std::vector<asio::executor_work_guard<asio::io_context::executor_type>> client_guards_;

    std::shared_ptr<SessionManager> session_manager_;
    std::shared_ptr<ProtocolHandler> handler_;

    // Open connections and the client context each one lives on
    std::map<TcpConnectionPtr, size_t> connections_;
    mutable std::mutex connections_mutex_;

    std::atomic<bool> running_;

    // Statistics
    std::atomic<uint64_t> total_connections_;
    std::atomic<uint64_t> total_bytes_received_;
    std::atomic<uint64_t> total_bytes_sent_;
};

} // namespace runnerd
