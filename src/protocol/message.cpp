//===----------------------------------------------------------------------===//
//                         runnerd
//
// protocol/message.cpp
//
// Protocol payload encoding. All integers are little-endian; strings are
// a u32 length followed by the bytes.
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include <stdexcept>

namespace runnerd {

namespace {

void WriteU32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(value & 0xFF);
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back((value >> 16) & 0xFF);
    buffer.push_back((value >> 24) & 0xFF);
}

void WriteString(std::vector<uint8_t>& buffer, const std::string& value) {
    WriteU32(buffer, static_cast<uint32_t>(value.size()));
    buffer.insert(buffer.end(), value.begin(), value.end());
}

uint32_t ReadU32(const std::vector<uint8_t>& data, size_t& offset, const char* what) {
    if (offset + 4 > data.size()) {
        throw std::runtime_error(std::string(what) + " truncated");
    }
    uint32_t value = static_cast<uint32_t>(data[offset]) |
                     (static_cast<uint32_t>(data[offset + 1]) << 8) |
                     (static_cast<uint32_t>(data[offset + 2]) << 16) |
                     (static_cast<uint32_t>(data[offset + 3]) << 24);
    offset += 4;
    return value;
}

std::string ReadString(const std::vector<uint8_t>& data, size_t& offset, const char* what) {
    uint32_t len = ReadU32(data, offset, what);
    if (len > data.size() - offset) {
        throw std::runtime_error(std::string(what) + " truncated");
    }
    std::string value(data.begin() + offset, data.begin() + offset + len);
    offset += len;
    return value;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// StartPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> StartPayload::Serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(8 + language.size() + code.size());
    WriteString(buffer, language);
    WriteString(buffer, code);
    return buffer;
}

StartPayload StartPayload::Deserialize(const std::vector<uint8_t>& data) {
    StartPayload payload;
    size_t offset = 0;
    payload.language = ReadString(data, offset, "StartPayload language");
    payload.code = ReadString(data, offset, "StartPayload code");
    return payload;
}

//===----------------------------------------------------------------------===//
// TextPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> TextPayload::Serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(4 + text.size());
    WriteString(buffer, text);
    return buffer;
}

TextPayload TextPayload::Deserialize(const std::vector<uint8_t>& data) {
    TextPayload payload;
    size_t offset = 0;
    payload.text = ReadString(data, offset, "TextPayload");
    return payload;
}

//===----------------------------------------------------------------------===//
// ArtifactPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ArtifactPayload::Serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(8 + filename.size() + image_base64.size());
    WriteString(buffer, filename);
    WriteString(buffer, image_base64);
    return buffer;
}

ArtifactPayload ArtifactPayload::Deserialize(const std::vector<uint8_t>& data) {
    ArtifactPayload payload;
    size_t offset = 0;
    payload.filename = ReadString(data, offset, "ArtifactPayload filename");
    payload.image_base64 = ReadString(data, offset, "ArtifactPayload image");
    return payload;
}

//===----------------------------------------------------------------------===//
// SessionErrorPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> SessionErrorPayload::Serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(8 + message.size());
    WriteU32(buffer, error_code);
    WriteString(buffer, message);
    return buffer;
}

SessionErrorPayload SessionErrorPayload::Deserialize(const std::vector<uint8_t>& data) {
    SessionErrorPayload payload;
    size_t offset = 0;
    payload.error_code = ReadU32(data, offset, "SessionErrorPayload code");
    payload.message = ReadString(data, offset, "SessionErrorPayload message");
    return payload;
}

} // namespace runnerd
