//===----------------------------------------------------------------------===//
//                         runnerd
//
// utils/base64.cpp
//
// Base64 codec
//===----------------------------------------------------------------------===//

#include "utils/base64.hpp"
#include <cstdint>
#include <stdexcept>

namespace runnerd {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int DecodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string Base64Encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= bytes.size()) {
        uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16) |
                         (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                         static_cast<uint8_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
        i += 3;
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t chunk = static_cast<uint8_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16) |
                         (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::string Base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64 length is not a multiple of 4");
    }

    std::string out;
    out.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        int values[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=') {
                // Padding only in the last two positions of the last quantum
                if (i + 4 != text.size() || j < 2) {
                    throw std::invalid_argument("misplaced base64 padding");
                }
                values[j] = 0;
                padding++;
            } else {
                if (padding > 0) {
                    throw std::invalid_argument("misplaced base64 padding");
                }
                values[j] = DecodeChar(c);
                if (values[j] < 0) {
                    throw std::invalid_argument("invalid base64 character");
                }
            }
        }

        uint32_t chunk = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        out.push_back(static_cast<char>((chunk >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<char>((chunk >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<char>(chunk & 0xFF));
    }

    return out;
}

} // namespace runnerd
