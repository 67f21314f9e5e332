//===----------------------------------------------------------------------===//
//                         runnerd
//
// network/tcp_connection.hpp
//
// TCP connection handling. The connection id doubles as the session id.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include "session/session_event.hpp"
#include <asio.hpp>
#include <array>
#include <vector>

namespace runnerd {

class TcpServer;
class ProtocolHandler;

class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    using Ptr = std::shared_ptr<TcpConnection>;

    // `socket` is already connected and bound to one of the server's client contexts
    TcpConnection(asio::ip::tcp::socket socket,
                  TcpServer& server,
                  std::shared_ptr<ProtocolHandler> handler);
    ~TcpConnection();

    // Non-copyable
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    // Starts reading on the socket's own io_context
    void Start();

    // Close connection. Safe from any thread; tears down the session.
    void Close();

    // Queue a frame. Safe from any thread. Returns false once closed, and
    // refuses OUTPUT and ARTIFACT frames while the client is more than
    // max_pending_bytes behind.
    bool Send(const Message& message);

    std::string GetRemoteAddress() const;

    uint64_t GetConnectionId() const { return connection_id_; }
    bool IsConnected() const { return connected_; }

    // Where this client's session events go
    const EventSinkPtr& GetEventSink() const { return sink_; }

private:
    void BeginReading();

    // Header, then payload, then Dispatch(), then the next header
    void DoReadHeader();
    void Dispatch();

    // Logs and closes on a read error. Returns true if `ec` is an error.
    bool ReadFailed(const char* stage, const asio::error_code& ec);

    // Runs on the connection's io_context
    void FlushPending();

private:
    asio::ip::tcp::socket socket_;
    TcpServer& server_;
    std::shared_ptr<ProtocolHandler> handler_;

    uint64_t connection_id_;
    std::atomic<bool> connected_;

    EventSinkPtr sink_;

    // Read state
    std::array<uint8_t, MessageHeader::SIZE> header_buffer_;
    Message current_message_;

    // Frames waiting for the next write, and the ones being written now
    std::vector<std::vector<uint8_t>> pending_;
    std::vector<std::vector<uint8_t>> in_flight_;
    std::mutex write_mutex_;
    bool writing_ = false;

    // Bytes in pending_ and in_flight_
    size_t pending_bytes_ = 0;
    const size_t max_pending_bytes_;

    static std::atomic<uint64_t> next_connection_id_;
};

using TcpConnectionPtr = TcpConnection::Ptr;

} // namespace runnerd
