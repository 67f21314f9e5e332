//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/connection_event_sink.cpp
//
// Connection event sink implementation
//===----------------------------------------------------------------------===//

#include "protocol/connection_event_sink.hpp"
#include "network/tcp_connection.hpp"

namespace runnerd {

Message EncodeEvent(const SessionEvent& event) {
    switch (event.type) {
        case SessionEventType::SESSION_STARTED:
            return Message(MessageType::SESSION_STARTED);

        case SessionEventType::OUTPUT: {
            TextPayload payload;
            payload.text = event.data;
            return Message(MessageType::OUTPUT, payload.Serialize());
        }

        case SessionEventType::ARTIFACT: {
            ArtifactPayload payload;
            payload.filename = event.filename;
            payload.image_base64 = event.data;
            return Message(MessageType::ARTIFACT, payload.Serialize());
        }

        case SessionEventType::PROCESS_ENDED:
            return Message(MessageType::PROCESS_ENDED);

        case SessionEventType::SESSION_ERROR:
        default: {
            SessionErrorPayload payload;
            payload.error_code = static_cast<uint32_t>(event.error_code);
            payload.message = event.data;
            return Message(MessageType::SESSION_ERROR, payload.Serialize());
        }
    }
}

ConnectionEventSink::ConnectionEventSink(std::weak_ptr<TcpConnection> connection_p)
    : connection(std::move(connection_p)) {
}

bool ConnectionEventSink::Emit(const SessionEvent& event) {
    auto conn = connection.lock();
    if (!conn || !conn->Send(EncodeEvent(event))) {
        return false;
    }
    events_sent++;
    return true;
}

} // namespace runnerd
