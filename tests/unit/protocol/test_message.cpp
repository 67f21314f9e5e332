//===----------------------------------------------------------------------===//
//                         runnerd - Unit Tests
//
// tests/unit/protocol/test_message.cpp
//
// Unit tests for the frame header and payload codecs
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace runnerd;

static bool ThrowsRuntimeError(void (*fn)()) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Header Tests
//===----------------------------------------------------------------------===//

void TestHeaderWireLayout() {
    std::cout << "  Testing header wire layout..." << std::endl;

    Message message(MessageType::OUTPUT, std::vector<uint8_t>{0xAA, 0xBB, 0xCC});
    auto bytes = message.Serialize();

    assert(bytes.size() == MessageHeader::SIZE + 3);
    assert(message.TotalSize() == bytes.size());

    // "RUND" on the wire
    assert(bytes[0] == 'R' && bytes[1] == 'U' && bytes[2] == 'N' && bytes[3] == 'D');
    assert(bytes[4] == PROTOCOL_VERSION);
    assert(bytes[5] == 0x21);
    assert(bytes[6] == 0);  // flags
    assert(bytes[7] == 0);  // reserved
    assert(bytes[8] == 3 && bytes[9] == 0 && bytes[10] == 0 && bytes[11] == 0);
    assert(bytes[12] == 0xAA && bytes[14] == 0xCC);

    std::cout << "    PASSED" << std::endl;
}

void TestHeaderValidation() {
    std::cout << "  Testing header validation..." << std::endl;

    MessageHeader header(MessageType::PING, 0);
    assert(header.IsValid());
    assert(header.GetType() == MessageType::PING);

    MessageHeader bad_magic = header;
    bad_magic.magic = 0x12345678;
    assert(!bad_magic.IsValid());

    MessageHeader bad_version = header;
    bad_version.version = 2;
    assert(!bad_version.IsValid());

    MessageHeader too_large = header;
    too_large.length = MAX_PAYLOAD_SIZE + 1;
    assert(!too_large.IsValid());

    too_large.length = MAX_PAYLOAD_SIZE;
    assert(too_large.IsValid());

    // Default-constructed frames carry UNKNOWN
    Message empty;
    assert(empty.GetType() == MessageType::UNKNOWN);
    assert(std::string(MessageTypeToString(empty.GetType())) == "UNKNOWN");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Payload Tests
//===----------------------------------------------------------------------===//

void TestStartPayload() {
    std::cout << "  Testing StartPayload..." << std::endl;

    StartPayload start;
    start.language = "python";
    start.code = "name = input('Name: ')\nprint('hi', name)\n";

    auto bytes = start.Serialize();
    // u32 length prefix, little-endian
    assert(bytes[0] == 6 && bytes[1] == 0 && bytes[2] == 0 && bytes[3] == 0);
    assert(bytes.size() == 4 + 6 + 4 + start.code.size());

    auto decoded = StartPayload::Deserialize(bytes);
    assert(decoded.language == "python");
    assert(decoded.code == start.code);

    std::cout << "    PASSED" << std::endl;
}

void TestTextPayloadBinarySafe() {
    std::cout << "  Testing TextPayload with raw terminal bytes..." << std::endl;

    TextPayload text;
    text.text = std::string("\x1b[31mred\x1b[0m\r\n\0tail", 19);

    auto decoded = TextPayload::Deserialize(text.Serialize());
    assert(decoded.text.size() == 19);
    assert(decoded.text == text.text);

    // Empty input line is a valid frame
    TextPayload empty;
    assert(TextPayload::Deserialize(empty.Serialize()).text.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestSessionErrorPayload() {
    std::cout << "  Testing SessionErrorPayload..." << std::endl;

    SessionErrorPayload error;
    error.error_code = 0x00010001;
    error.message = "Unsupported language 'cobol'";

    auto bytes = error.Serialize();
    assert(bytes[0] == 0x01 && bytes[1] == 0x00 && bytes[2] == 0x01 && bytes[3] == 0x00);

    auto decoded = SessionErrorPayload::Deserialize(bytes);
    assert(decoded.error_code == 0x00010001);
    assert(decoded.message == "Unsupported language 'cobol'");

    std::cout << "    PASSED" << std::endl;
}

void TestTruncatedPayloads() {
    std::cout << "  Testing truncated payloads..." << std::endl;

    // No length prefix
    assert(ThrowsRuntimeError([]() {
        TextPayload::Deserialize(std::vector<uint8_t>{0x01, 0x00});
    }));

    // Length prefix larger than the remaining bytes
    assert(ThrowsRuntimeError([]() {
        TextPayload::Deserialize(std::vector<uint8_t>{0x05, 0x00, 0x00, 0x00, 'a', 'b'});
    }));

    // Second field missing
    assert(ThrowsRuntimeError([]() {
        StartPayload::Deserialize(std::vector<uint8_t>{0x02, 0x00, 0x00, 0x00, 'j', 's'});
    }));

    assert(ThrowsRuntimeError([]() {
        ArtifactPayload::Deserialize(std::vector<uint8_t>{});
    }));

    try {
        StartPayload::Deserialize(std::vector<uint8_t>{0x02, 0x00, 0x00, 0x00, 'j', 's'});
        assert(false);
    } catch (const std::runtime_error& e) {
        assert(std::string(e.what()) == "StartPayload code truncated");
    }

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Message Unit Tests ===" << std::endl;

    std::cout << "\n1. Header:" << std::endl;
    TestHeaderWireLayout();
    TestHeaderValidation();

    std::cout << "\n2. Payloads:" << std::endl;
    TestStartPayload();
    TestTextPayloadBinarySafe();
    TestSessionErrorPayload();
    TestTruncatedPayloads();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
