//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/message.hpp
//
// Protocol message definitions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message_types.hpp"
#include <cstring>

namespace runnerd {

//===----------------------------------------------------------------------===//
// Message Header
//===----------------------------------------------------------------------===//
#pragma pack(push, 1)
struct MessageHeader {
    uint32_t magic;      // Protocol magic: "RUND" = 0x444E5552
    uint8_t  version;    // Protocol version
    uint8_t  type;       // Message type
    uint8_t  flags;      // Reserved flags
    uint8_t  reserved;   // Reserved for future use
    uint32_t length;     // Payload length

    static constexpr size_t SIZE = 12;

    MessageHeader()
        : magic(PROTOCOL_MAGIC)
        , version(PROTOCOL_VERSION)
        , type(static_cast<uint8_t>(MessageType::UNKNOWN))
        , flags(MessageFlags::NONE)
        , reserved(0)
        , length(0) {}

    MessageHeader(MessageType msg_type, uint32_t payload_length)
        : magic(PROTOCOL_MAGIC)
        , version(PROTOCOL_VERSION)
        , type(static_cast<uint8_t>(msg_type))
        , flags(MessageFlags::NONE)
        , reserved(0)
        , length(payload_length) {}

    bool IsValid() const {
        return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION &&
               length <= MAX_PAYLOAD_SIZE;
    }

    MessageType GetType() const {
        return static_cast<MessageType>(type);
    }
};
#pragma pack(pop)

static_assert(sizeof(MessageHeader) == MessageHeader::SIZE, "MessageHeader size mismatch");

//===----------------------------------------------------------------------===//
// Message Class
//===----------------------------------------------------------------------===//
class Message {
public:
    Message() = default;

    explicit Message(MessageType type)
        : header_(type, 0) {}

    Message(MessageType type, std::vector<uint8_t> payload)
        : header_(type, static_cast<uint32_t>(payload.size()))
        , payload_(std::move(payload)) {}

    // Getters
    const MessageHeader& GetHeader() const { return header_; }
    MessageHeader& GetHeader() { return header_; }
    MessageType GetType() const { return header_.GetType(); }
    uint32_t GetPayloadLength() const { return header_.length; }
    const std::vector<uint8_t>& GetPayload() const { return payload_; }
    std::vector<uint8_t>& GetPayload() { return payload_; }

    bool IsValid() const { return header_.IsValid(); }

    // Header followed by payload
    std::vector<uint8_t> Serialize() const {
        std::vector<uint8_t> buffer(MessageHeader::SIZE + payload_.size());
        std::memcpy(buffer.data(), &header_, MessageHeader::SIZE);
        if (!payload_.empty()) {
            std::memcpy(buffer.data() + MessageHeader::SIZE, payload_.data(), payload_.size());
        }
        return buffer;
    }

    size_t TotalSize() const {
        return MessageHeader::SIZE + payload_.size();
    }

private:
    MessageHeader header_;
    std::vector<uint8_t> payload_;
};

//===----------------------------------------------------------------------===//
// Start Payload (client -> server)
//===----------------------------------------------------------------------===//
struct StartPayload {
    std::string language;
    std::string code;

    std::vector<uint8_t> Serialize() const;
    static StartPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Text Payload: INPUT line / OUTPUT data
//===----------------------------------------------------------------------===//
struct TextPayload {
    std::string text;

    std::vector<uint8_t> Serialize() const;
    static TextPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Artifact Payload (server -> client)
//===----------------------------------------------------------------------===//
struct ArtifactPayload {
    std::string filename;
    std::string image_base64;

    std::vector<uint8_t> Serialize() const;
    static ArtifactPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Session Error Payload (server -> client)
//===----------------------------------------------------------------------===//
struct SessionErrorPayload {
    uint32_t error_code = 0;
    std::string message;

    std::vector<uint8_t> Serialize() const;
    static SessionErrorPayload Deserialize(const std::vector<uint8_t>& data);
};

} // namespace runnerd
