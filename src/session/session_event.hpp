//===----------------------------------------------------------------------===//
//                         runnerd
//
// session/session_event.hpp
//
// Session lifecycle events, error taxonomy and the event sink interface
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace runnerd {

//===----------------------------------------------------------------------===//
// Error Codes
//===----------------------------------------------------------------------===//
enum class SessionErrorCode : uint32_t {
    // ===== 0x0001xxxx: Request validation =====
    UNSUPPORTED_LANGUAGE        = 0x00010001,
    EMPTY_CODE                  = 0x00010002,
    SESSION_LIMIT               = 0x00010003,

    // ===== 0x0002xxxx: Process =====
    SPAWN_FAILURE               = 0x00020001,
    IO_FAILURE                  = 0x00020002,

    // ===== 0x0003xxxx: Artifacts =====
    MISSING_ARTIFACT            = 0x00030001,
    ARTIFACT_PROCESSING_FAILURE = 0x00030002,

    // ===== 0x0004xxxx: Transport =====
    PROTOCOL_ERROR              = 0x00040001,
};

inline const char* SessionErrorCodeToString(SessionErrorCode code) {
    switch (code) {
        case SessionErrorCode::UNSUPPORTED_LANGUAGE:        return "UNSUPPORTED_LANGUAGE";
        case SessionErrorCode::EMPTY_CODE:                  return "EMPTY_CODE";
        case SessionErrorCode::SESSION_LIMIT:               return "SESSION_LIMIT";
        case SessionErrorCode::SPAWN_FAILURE:               return "SPAWN_FAILURE";
        case SessionErrorCode::IO_FAILURE:                  return "IO_FAILURE";
        case SessionErrorCode::MISSING_ARTIFACT:            return "MISSING_ARTIFACT";
        case SessionErrorCode::ARTIFACT_PROCESSING_FAILURE: return "ARTIFACT_PROCESSING_FAILURE";
        case SessionErrorCode::PROTOCOL_ERROR:              return "PROTOCOL_ERROR";
        default:                                            return "UNKNOWN_ERROR";
    }
}

//===----------------------------------------------------------------------===//
// Events
//===----------------------------------------------------------------------===//
enum class SessionEventType : uint8_t {
    SESSION_STARTED,
    OUTPUT,
    ARTIFACT,
    PROCESS_ENDED,
    SESSION_ERROR
};

inline const char* SessionEventTypeToString(SessionEventType type) {
    switch (type) {
        case SessionEventType::SESSION_STARTED: return "session_started";
        case SessionEventType::OUTPUT:          return "output";
        case SessionEventType::ARTIFACT:        return "artifact";
        case SessionEventType::PROCESS_ENDED:   return "process_ended";
        case SessionEventType::SESSION_ERROR:   return "session_error";
        default:                                return "unknown";
    }
}

struct SessionEvent {
    SessionEventType type = SessionEventType::OUTPUT;

    // OUTPUT: raw chunk; ARTIFACT: base64 payload; SESSION_ERROR: message
    std::string data;

    // ARTIFACT only
    std::string filename;

    // SESSION_ERROR only
    SessionErrorCode error_code = SessionErrorCode::IO_FAILURE;

    static SessionEvent Started() {
        SessionEvent event;
        event.type = SessionEventType::SESSION_STARTED;
        return event;
    }

    static SessionEvent Output(std::string chunk) {
        SessionEvent event;
        event.type = SessionEventType::OUTPUT;
        event.data = std::move(chunk);
        return event;
    }

    static SessionEvent Artifact(std::string name, std::string image_base64) {
        SessionEvent event;
        event.type = SessionEventType::ARTIFACT;
        event.filename = std::move(name);
        event.data = std::move(image_base64);
        return event;
    }

    static SessionEvent ProcessEnded() {
        SessionEvent event;
        event.type = SessionEventType::PROCESS_ENDED;
        return event;
    }

    static SessionEvent Error(SessionErrorCode code, std::string message) {
        SessionEvent event;
        event.type = SessionEventType::SESSION_ERROR;
        event.error_code = code;
        event.data = std::move(message);
        return event;
    }
};

// Receives the events of one client's sessions. Implemented by the transport.
class EventSink {
public:
    virtual ~EventSink() = default;

    // Returns false if the event could not be handed to the client
    virtual bool Emit(const SessionEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

} // namespace runnerd
