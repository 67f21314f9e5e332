//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/message_types.hpp
//
// Protocol message type definitions
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace runnerd {

//===----------------------------------------------------------------------===//
// Message Types
//===----------------------------------------------------------------------===//
enum class MessageType : uint8_t {
    // ===== Connection Management (0x01-0x0F) =====
    PING            = 0x03,  // Heartbeat request
    PONG            = 0x04,  // Heartbeat response
    CLOSE           = 0x05,  // Close connection

    // ===== Client Requests (0x10-0x1F) =====
    START           = 0x10,  // Run code: language, code
    INPUT           = 0x11,  // One line for the running program
    DISCONNECT      = 0x12,  // Kill the running program

    // ===== Session Events (0x20-0x2F) =====
    SESSION_STARTED = 0x20,  // Program spawned
    OUTPUT          = 0x21,  // Terminal output chunk
    ARTIFACT        = 0x22,  // Image file: filename, base64 data
    PROCESS_ENDED   = 0x23,  // Program finished or was killed
    SESSION_ERROR   = 0x24,  // Error code and message

    // ===== Unknown =====
    UNKNOWN         = 0xFF
};

//===----------------------------------------------------------------------===//
// Message Flags
//===----------------------------------------------------------------------===//
namespace MessageFlags {
    constexpr uint8_t NONE              = 0x00;
    // bits 0-7: reserved
}

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//
inline const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::PING:            return "PING";
        case MessageType::PONG:            return "PONG";
        case MessageType::CLOSE:           return "CLOSE";
        case MessageType::START:           return "START";
        case MessageType::INPUT:           return "INPUT";
        case MessageType::DISCONNECT:      return "DISCONNECT";
        case MessageType::SESSION_STARTED: return "SESSION_STARTED";
        case MessageType::OUTPUT:          return "OUTPUT";
        case MessageType::ARTIFACT:        return "ARTIFACT";
        case MessageType::PROCESS_ENDED:   return "PROCESS_ENDED";
        case MessageType::SESSION_ERROR:   return "SESSION_ERROR";
        default:                           return "UNKNOWN";
    }
}

} // namespace runnerd
