//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/protocol_handler.hpp
//
// Protocol message handling
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace runnerd {

class TcpConnection;

class ProtocolHandler : public std::enable_shared_from_this<ProtocolHandler> {
public:
    explicit ProtocolHandler(std::shared_ptr<SessionManager> session_manager);
    ~ProtocolHandler() = default;

    // Handle incoming message
    void HandleMessage(const Message& message,
                       std::shared_ptr<TcpConnection> connection);

    // The connection went away: its session is torn down
    void HandleConnectionClosed(uint64_t connection_id);

private:
    // Message handlers
    void HandlePing(std::shared_ptr<TcpConnection> connection);
    void HandleClose(std::shared_ptr<TcpConnection> connection);
    void HandleStart(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandleInput(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandleDisconnect(std::shared_ptr<TcpConnection> connection);

    // Send error response
    void SendError(const std::string& message,
                   std::shared_ptr<TcpConnection> connection);

private:
    std::shared_ptr<SessionManager> session_manager_;
};

} // namespace runnerd
