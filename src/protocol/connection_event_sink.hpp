//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/connection_event_sink.hpp
//
// Delivers session events to a TCP connection as protocol frames
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include "session/session_event.hpp"

namespace runnerd {

class TcpConnection;

// Frame carrying `event`
Message EncodeEvent(const SessionEvent& event);

class ConnectionEventSink : public EventSink {
public:
    explicit ConnectionEventSink(std::weak_ptr<TcpConnection> connection_p);

    // False once the connection is gone
    bool Emit(const SessionEvent& event) override;

    uint64_t GetEventsSent() const { return events_sent.load(); }

private:
    std::weak_ptr<TcpConnection> connection;
    std::atomic<uint64_t> events_sent{0};
};

} // namespace runnerd
