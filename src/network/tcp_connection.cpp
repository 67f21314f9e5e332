//===----------------------------------------------------------------------===//
//                         runnerd
//
// network/tcp_connection.cpp
//
// TCP connection implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_connection.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "protocol/connection_event_sink.hpp"
#include "config/server_config.hpp"
#include "logging/logger.hpp"

#include <algorithm>

namespace runnerd {

namespace {

// Program output and images; everything else is a few bytes
bool IsBulk(MessageType type) {
    return type == MessageType::OUTPUT || type == MessageType::ARTIFACT;
}

} // anonymous namespace

std::atomic<uint64_t> TcpConnection::next_connection_id_{1};

TcpConnection::TcpConnection(asio::ip::tcp::socket socket,
                             TcpServer& server,
                             std::shared_ptr<ProtocolHandler> handler)
    : socket_(std::move(socket))
    , server_(server)
    , handler_(std::move(handler))
    , connection_id_(next_connection_id_.fetch_add(1))
    , connected_(false)
    , max_pending_bytes_(server.GetConfig().max_pending_bytes) {
}

TcpConnection::~TcpConnection() {
    asio::error_code ec;
    socket_.close(ec);
}

void TcpConnection::Start() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self]() { self->BeginReading(); });
}

void TcpConnection::BeginReading() {
    sink_ = std::make_shared<ConnectionEventSink>(weak_from_this());
    connected_ = true;

    // Prompts are a few bytes; do not let Nagle hold them back
    asio::error_code ec;
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);

    LOG_DEBUG("connection", "Client " + std::to_string(connection_id_) +
              " connected from " + GetRemoteAddress());

    DoReadHeader();
}

void TcpConnection::Close() {
    if (!connected_.exchange(false)) {
        return;
    }

    LOG_DEBUG("connection", "Client " + std::to_string(connection_id_) + " closing");

    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self]() {
        asio::error_code ec;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        self->socket_.close(ec);
    });

    // The session goes with the connection
    if (handler_) {
        handler_->HandleConnectionClosed(connection_id_);
    }

    server_.RemoveConnection(self);
}

bool TcpConnection::Send(const Message& message) {
    if (!connected_) {
        return false;
    }

    std::vector<uint8_t> frame = message.Serialize();
    const size_t size = frame.size();
    size_t behind;
    bool refused = false;
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        behind = pending_bytes_;
        // A single oversized frame still goes out when nothing is queued
        if (IsBulk(message.GetType()) && behind > 0 && behind + size > max_pending_bytes_) {
            refused = true;
        } else {
            pending_.push_back(std::move(frame));
            pending_bytes_ += size;
            idle = !writing_;
            writing_ = true;
        }
    }

    if (refused) {
        LOG_WARN("connection", "Client " + std::to_string(connection_id_) + " is " +
                 std::to_string(behind) + " bytes behind, refusing " +
                 MessageTypeToString(message.GetType()));
        return false;
    }

    if (idle) {
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [self]() { self->FlushPending(); });
    }
    return true;
}

std::string TcpConnection::GetRemoteAddress() const {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

bool TcpConnection::ReadFailed(const char* stage, const asio::error_code& ec) {
    if (!ec) {
        return false;
    }
    // eof is the client hanging up; aborted is our own Close()
    if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_WARN("connection", "Client " + std::to_string(connection_id_) + " " + stage +
                 " failed: " + ec.message());
    }
    Close();
    return true;
}

void TcpConnection::DoReadHeader() {
    if (!connected_) {
        return;
    }

    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_buffer_),
        [this, self](const asio::error_code& ec, size_t n) {
            if (ReadFailed("header read", ec)) {
                return;
            }
            server_.AddBytesReceived(n);

            MessageHeader& header = current_message_.GetHeader();
            std::memcpy(&header, header_buffer_.data(), MessageHeader::SIZE);
            if (!header.IsValid()) {
                LOG_WARN("connection", "Client " + std::to_string(connection_id_) +
                         " sent an invalid frame header, dropping");
                Close();
                return;
            }

            if (header.length == 0) {
                Dispatch();
                return;
            }
            current_message_.GetPayload().resize(header.length);
            asio::async_read(socket_, asio::buffer(current_message_.GetPayload()),
                [this, self](const asio::error_code& ec, size_t n) {
                    if (ReadFailed("payload read", ec)) {
                        return;
                    }
                    server_.AddBytesReceived(n);
                    Dispatch();
                });
        });
}

void TcpConnection::Dispatch() {
    LOG_TRACE("connection", std::string(MessageTypeToString(current_message_.GetType())) +
              " from client " + std::to_string(connection_id_));

    Message message = std::move(current_message_);
    current_message_ = Message();
    if (handler_) {
        handler_->HandleMessage(message, shared_from_this());
    }
    DoReadHeader();
}

void TcpConnection::FlushPending() {
    // Everything queued since the last write goes out as one gathered write
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (pending_.empty() || !socket_.is_open()) {
            pending_.clear();
            pending_bytes_ = 0;
            writing_ = false;
            return;
        }
        in_flight_.swap(pending_);
    }

    std::vector<asio::const_buffer> buffers;
    buffers.reserve(in_flight_.size());
    for (const auto& frame : in_flight_) {
        buffers.push_back(asio::buffer(frame));
    }

    auto self = shared_from_this();
    asio::async_write(socket_, buffers,
        [this, self](const asio::error_code& ec, size_t n) {
            in_flight_.clear();
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    LOG_WARN("connection", "Client " + std::to_string(connection_id_) +
                             " write failed: " + ec.message());
                }
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    pending_.clear();
                    pending_bytes_ = 0;
                    writing_ = false;
                }
                Close();
                return;
            }
            server_.AddBytesSent(n);
            {
                std::lock_guard<std::mutex> lock(write_mutex_);
                pending_bytes_ -= std::min(n, pending_bytes_);
            }
            FlushPending();
        });
}

} // namespace runnerd
