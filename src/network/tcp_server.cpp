//===----------------------------------------------------------------------===//
//                         runnerd
//
// network/tcp_server.cpp
//
// TCP server implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "config/server_config.hpp"
#include "protocol/protocol_handler.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"

namespace runnerd {

TcpServer::TcpServer(const ServerConfig& config,
                     std::shared_ptr<SessionManager> session_manager)
    : config_(config)
    , acceptor_(acceptor_context_)
    , session_manager_(std::move(session_manager))
    , handler_(std::make_shared<ProtocolHandler>(session_manager_))
    , running_(false)
    , total_connections_(0)
    , total_bytes_received_(0)
    , total_bytes_sent_(0) {

    size_t threads = config.GetIoThreadCount();
    for (size_t i = 0; i < threads; i++) {
        client_contexts_.push_back(std::make_unique<ClientContext>());
    }
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::RunContext(asio::io_context& io_context, const std::string& role) {
    // A throwing handler must not take the other connections down with it
    for (;;) {
        try {
            io_context.run();
            return;
        } catch (const std::exception& e) {
            LOG_ERROR("server", role + " handler threw: " + e.what());
        }
    }
}

void TcpServer::Start() {
    if (running_) {
        return;
    }

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);
    try {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
    } catch (const std::system_error& e) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        LOG_ERROR("server", "Cannot listen on " + config_.host + ":" +
                  std::to_string(config_.port) + ": " + e.what());
        throw;
    }

    running_ = true;

    for (size_t i = 0; i < client_contexts_.size(); i++) {
        ClientContext& client = *client_contexts_[i];
        client.io_context.restart();
        client_guards_.push_back(asio::make_work_guard(client.io_context));
        std::string role = "client thread " + std::to_string(i);
        client.thread = std::thread([&client, role]() { RunContext(client.io_context, role); });
    }

    DoAccept();
    acceptor_thread_ = std::thread([this]() { RunContext(acceptor_context_, "acceptor"); });

    LOG_INFO("server", "Accepting clients on " + config_.host + ":" + std::to_string(GetPort()) +
             " with " + std::to_string(client_contexts_.size()) + " client threads");
}

void TcpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // No new clients first; the acceptor is only touched once its thread is gone
    acceptor_context_.stop();
    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }
    asio::error_code ignored;
    acceptor_.close(ignored);

    // Close() calls back into RemoveConnection, so work on a copy
    std::map<TcpConnectionPtr, size_t> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.swap(connections_);
        for (auto& client : client_contexts_) {
            client->connections = 0;
        }
    }
    for (auto& entry : open) {
        entry.first->Close();
    }

    client_guards_.clear();
    for (auto& client : client_contexts_) {
        client->io_context.stop();
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }

    LOG_INFO("server", "Closed " + std::to_string(open.size()) + " connections, " +
             std::to_string(total_connections_.load()) + " served in total");
}

uint16_t TcpServer::GetPort() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? config_.port : endpoint.port();
}

size_t TcpServer::PickClientContext() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t best = 0;
    for (size_t i = 1; i < client_contexts_.size(); i++) {
        if (client_contexts_[i]->connections < client_contexts_[best]->connections) {
            best = i;
        }
    }
    return best;
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(conn);
    if (it == connections_.end()) {
        return;
    }
    client_contexts_[it->second]->connections--;
    connections_.erase(it);
}

size_t TcpServer::GetConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::DoAccept() {
    if (!running_) {
        return;
    }

    size_t index = PickClientContext();
    acceptor_.async_accept(client_contexts_[index]->io_context,
        [this, index](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (!running_) {
                return;
            }
            if (ec) {
                LOG_WARN("server", "Accept failed: " + ec.message());
            } else {
                auto conn = std::make_shared<TcpConnection>(std::move(socket), *this, handler_);
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    connections_.emplace(conn, index);
                    client_contexts_[index]->connections++;
                }
                total_connections_++;
                conn->Start();
                LOG_DEBUG("server", "Client " + std::to_string(conn->GetConnectionId()) +
                          " on client thread " + std::to_string(index));
            }
            DoAccept();
        });
}

} // namespace runnerd
