//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/protocol_handler.cpp
//
// Protocol message handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/protocol_handler.hpp"
#include "network/tcp_connection.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"

namespace runnerd {

ProtocolHandler::ProtocolHandler(std::shared_ptr<SessionManager> session_manager)
    : session_manager_(std::move(session_manager)) {
}

void ProtocolHandler::HandleMessage(const Message& message,
                                    std::shared_ptr<TcpConnection> connection) {
    switch (message.GetType()) {
        case MessageType::PING:
            HandlePing(connection);
            break;
        case MessageType::CLOSE:
            HandleClose(connection);
            break;
        case MessageType::START:
            HandleStart(message, connection);
            break;
        case MessageType::INPUT:
            HandleInput(message, connection);
            break;
        case MessageType::DISCONNECT:
            HandleDisconnect(connection);
            break;
        default:
            LOG_WARN("protocol", "Unknown message type: " +
                     std::to_string(static_cast<int>(message.GetType())));
            SendError("Unknown message type", connection);
            break;
    }
}

void ProtocolHandler::HandleConnectionClosed(uint64_t connection_id) {
    if (session_manager_->CloseSession(connection_id)) {
        LOG_INFO("protocol", "Session " + std::to_string(connection_id) +
                 " closed with its connection");
    }
}

void ProtocolHandler::HandlePing(std::shared_ptr<TcpConnection> connection) {
    connection->Send(Message(MessageType::PONG));
}

void ProtocolHandler::HandleClose(std::shared_ptr<TcpConnection> connection) {
    // Close() reports back through HandleConnectionClosed
    connection->Close();
}

void ProtocolHandler::HandleStart(const Message& message,
                                  std::shared_ptr<TcpConnection> connection) {
    try {
        StartPayload start = StartPayload::Deserialize(message.GetPayload());

        LOG_DEBUG("protocol", "START " + start.language + " (" +
                  std::to_string(start.code.size()) + " bytes) on connection " +
                  std::to_string(connection->GetConnectionId()));

        session_manager_->StartSession(connection->GetConnectionId(),
                                       start.language,
                                       start.code,
                                       connection->GetEventSink());
    } catch (const std::exception& e) {
        LOG_ERROR("protocol", "Error handling START: " + std::string(e.what()));
        SendError(e.what(), connection);
    }
}

void ProtocolHandler::HandleInput(const Message& message,
                                  std::shared_ptr<TcpConnection> connection) {
    try {
        TextPayload input = TextPayload::Deserialize(message.GetPayload());

        auto result = session_manager_->SendInput(connection->GetConnectionId(),
                                                  input.text,
                                                  connection->GetEventSink());
        LOG_TRACE("protocol", "INPUT on connection " + std::to_string(connection->GetConnectionId()) +
                  ": " + InputResultToString(result));
    } catch (const std::exception& e) {
        LOG_ERROR("protocol", "Error handling INPUT: " + std::string(e.what()));
        SendError(e.what(), connection);
    }
}

void ProtocolHandler::HandleDisconnect(std::shared_ptr<TcpConnection> connection) {
    try {
        session_manager_->Disconnect(connection->GetConnectionId(), connection->GetEventSink());
    } catch (const std::exception& e) {
        LOG_ERROR("protocol", "Error handling DISCONNECT: " + std::string(e.what()));
        SendError(e.what(), connection);
    }
}

void ProtocolHandler::SendError(const std::string& message,
                                std::shared_ptr<TcpConnection> connection) {
    SessionErrorPayload error;
    error.error_code = static_cast<uint32_t>(SessionErrorCode::PROTOCOL_ERROR);
    error.message = message;
    connection->Send(Message(MessageType::SESSION_ERROR, error.Serialize()));
}

} // namespace runnerd
